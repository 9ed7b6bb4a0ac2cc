/**
 * @file host_configuration.hpp
 * @brief In-memory host configuration and its JSON loader.
 *
 * A host configuration document looks like:
 * @code
 * {
 *   "deviceId": "a1b2c3d4e5f6",
 *   "deviceName": "workstation",
 *   "deviceType": "desktop",
 *   "incomingCapabilities": ["kdeconnect.ping"],
 *   "outgoingCapabilities": ["kdeconnect.ping"],
 *   "logLevel": "info"
 * }
 * @endcode
 * Capability arrays and logLevel may be omitted.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "pairwire/core/interfaces/ihost_configuration.hpp"
#include "pairwire/core/util/logger.hpp"

namespace pairwire {

    /**
     * @struct HostInfo
     * @brief Local device identity as loaded from configuration.
     */
    struct HostInfo {
        std::string   deviceId;                          ///< Stable unique id of this host
        std::string   deviceName;                        ///< Human-readable name shown to peers
        DeviceType    deviceType{ DeviceType::Desktop }; ///< Announced device type
        CapabilitySet incomingCapabilities;              ///< Packet types accepted
        CapabilitySet outgoingCapabilities;              ///< Packet types sent
        std::optional<LogLevel> logLevel;                ///< Requested log level, if configured
    };

    /**
     * @class StaticHostConfiguration
     * @brief IHostConfiguration backed by a fixed HostInfo value.
     */
    class StaticHostConfiguration : public IHostConfiguration {
    public:
        explicit StaticHostConfiguration(HostInfo info);

        std::string deviceId() const override;
        std::string deviceName() const override;
        DeviceType deviceType() const override;
        CapabilitySet outgoingCapabilities() const override;
        CapabilitySet incomingCapabilities() const override;

        const HostInfo& info() const { return info_; }

    private:
        HostInfo info_;
    };

    /**
     * @brief Parse a host configuration document.
     * @param jsonText JSON text of the document
     * @return Parsed host information
     * @throws ConfigError if the document is malformed, a required field is missing,
     *         a field has the wrong shape, or deviceType / logLevel are not recognised
     */
    HostInfo loadHostInfo(std::string_view jsonText);

    /**
     * @brief Read and parse a host configuration file.
     * @param path Filesystem path of the document
     * @throws ConfigError if the file cannot be read or its content is invalid
     */
    HostInfo loadHostInfoFile(const std::string& path);

}
