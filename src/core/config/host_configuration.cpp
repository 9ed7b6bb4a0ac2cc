#include "pairwire/core/config/host_configuration.hpp"
#include "pairwire/core/util/error_types.hpp"
#include "pairwire/core/util/logger.hpp"
#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace pairwire {

    namespace {

        struct DeviceTypeName {
            DeviceType  type;
            const char* name;
        };

        constexpr DeviceTypeName kDeviceTypes[] = {
            { DeviceType::Unknown, "unknown" },
            { DeviceType::Desktop, "desktop" },
            { DeviceType::Laptop,  "laptop"  },
            { DeviceType::Phone,   "phone"   },
            { DeviceType::Tablet,  "tablet"  },
            { DeviceType::Tv,      "tv"      },
        };

        std::string requireString(const nlohmann::json& doc, const char* key) {
            auto it = doc.find(key);
            if (it == doc.end())
                throw ConfigError(std::string("host configuration: missing '") + key + "'");
            if (!it->is_string() || it->get_ref<const std::string&>().empty())
                throw ConfigError(std::string("host configuration: '") + key + "' must be a non-empty string");
            return it->get<std::string>();
        }

        CapabilitySet readCapabilities(const nlohmann::json& doc, const char* key) {
            CapabilitySet caps;
            auto it = doc.find(key);
            if (it == doc.end()) return caps;
            if (!it->is_array())
                throw ConfigError(std::string("host configuration: '") + key + "' must be an array");
            for (const auto& c : *it) {
                if (!c.is_string())
                    throw ConfigError(std::string("host configuration: '") + key + "' must contain only strings");
                caps.insert(c.get<Capability>());
            }
            return caps;
        }

    }

    /*──────────── device type vocabulary ───────────*/
    const char* toString(DeviceType t) {
        for (const auto& dt : kDeviceTypes)
            if (dt.type == t) return dt.name;
        return "unknown";
    }

    std::optional<DeviceType> deviceTypeFromString(std::string_view name) {
        for (const auto& dt : kDeviceTypes)
            if (name == dt.name) return dt.type;
        return std::nullopt;
    }

    /*──────────── StaticHostConfiguration ───────────*/
    StaticHostConfiguration::StaticHostConfiguration(HostInfo info)
        : info_(std::move(info)) {}

    std::string StaticHostConfiguration::deviceId() const { return info_.deviceId; }
    std::string StaticHostConfiguration::deviceName() const { return info_.deviceName; }
    DeviceType StaticHostConfiguration::deviceType() const { return info_.deviceType; }
    CapabilitySet StaticHostConfiguration::outgoingCapabilities() const { return info_.outgoingCapabilities; }
    CapabilitySet StaticHostConfiguration::incomingCapabilities() const { return info_.incomingCapabilities; }

    /*──────────── loader ───────────*/
    HostInfo loadHostInfo(std::string_view jsonText) {
        nlohmann::json doc = nlohmann::json::parse(jsonText.data(), jsonText.data() + jsonText.size(), nullptr, false);
        if (doc.is_discarded())
            throw ConfigError("host configuration: not valid JSON");
        if (!doc.is_object())
            throw ConfigError("host configuration: top-level value must be an object");

        HostInfo info;
        info.deviceId = requireString(doc, "deviceId");
        info.deviceName = requireString(doc, "deviceName");

        std::string typeName = requireString(doc, "deviceType");
        auto type = deviceTypeFromString(typeName);
        if (!type)
            throw ConfigError("host configuration: unknown deviceType '" + typeName + "'");
        info.deviceType = *type;

        info.incomingCapabilities = readCapabilities(doc, "incomingCapabilities");
        info.outgoingCapabilities = readCapabilities(doc, "outgoingCapabilities");

        if (auto it = doc.find("logLevel"); it != doc.end()) {
            if (!it->is_string())
                throw ConfigError("host configuration: 'logLevel' must be a string");
            auto lvl = logLevelFromString(it->get_ref<const std::string&>());
            if (!lvl)
                throw ConfigError("host configuration: unknown logLevel '" + it->get<std::string>() + "'");
            info.logLevel = *lvl;
        }

        PAIRWIRE_LOG_DEBUG("[loadHostInfo] device '" + info.deviceName + "' (" + info.deviceId + "), "
            + std::to_string(info.incomingCapabilities.size()) + " incoming / "
            + std::to_string(info.outgoingCapabilities.size()) + " outgoing capabilities");
        return info;
    }

    HostInfo loadHostInfoFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw ConfigError("host configuration: cannot open '" + path + "'");
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            throw ConfigError("host configuration: error reading '" + path + "'");
        return loadHostInfo(ss.str());
    }

}
