/**
 * @file ihost_configuration.hpp
 * @brief Interface to the local device identity used when announcing this host.
 *
 * pairwire does not own the configuration store. Implement IHostConfiguration
 * over whatever the host application persists its identity in.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "pairwire/core/identity/capability.hpp"

namespace pairwire {

    /**
     * @enum DeviceType
     * @brief Closed device-type vocabulary announced in identity packets.
     */
    enum class DeviceType {
        Unknown,
        Desktop,
        Laptop,
        Phone,
        Tablet,
        Tv
    };

    /**
     * @brief Wire name of a device type ("desktop", "phone", ...).
     */
    const char* toString(DeviceType t);

    /**
     * @brief Look up a device type by its wire name.
     * @param name Wire name, case-sensitive
     * @return Matching type, or std::nullopt if the name is not in the vocabulary
     */
    std::optional<DeviceType> deviceTypeFromString(std::string_view name);

    /**
     * @class IHostConfiguration
     * @brief Source of the local device identity and capability sets.
     */
    class IHostConfiguration {
    public:
        virtual ~IHostConfiguration() = default;

        virtual std::string deviceId() const = 0;
        virtual std::string deviceName() const = 0;
        virtual DeviceType deviceType() const = 0;

        /**
         * @brief Packet types this host can send.
         */
        virtual CapabilitySet outgoingCapabilities() const = 0;

        /**
         * @brief Packet types this host accepts.
         */
        virtual CapabilitySet incomingCapabilities() const = 0;
    };

}
