/**
 * @file identity_packet.hpp
 * @brief Construction and typed field access for "kdeconnect.identity" packets.
 *
 * IdentityPacket is a non-owning view over a generic Packet. Nothing is validated
 * when the view is created: every accessor re-checks the packet type first and then
 * the field it reads, throwing IdentityError on the first problem it finds.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "pairwire/core/packet/packet.hpp"
#include "pairwire/core/identity/capability.hpp"
#include "pairwire/core/interfaces/ihost_configuration.hpp"
#include "pairwire/core/util/error_types.hpp"

namespace pairwire {

    inline constexpr const char* kIdentityPacketType = "kdeconnect.identity";
    inline constexpr std::uint32_t kProtocolVersion = 7;

    /* Body keys of an identity packet */
    namespace identity_key {
        inline constexpr const char* deviceId             = "deviceId";
        inline constexpr const char* deviceName           = "deviceName";
        inline constexpr const char* deviceType           = "deviceType";
        inline constexpr const char* protocolVersion      = "protocolVersion";
        inline constexpr const char* tcpPort              = "tcpPort";
        inline constexpr const char* incomingCapabilities = "incomingCapabilities";
        inline constexpr const char* outgoingCapabilities = "outgoingCapabilities";
    }

    /**
     * @class IdentityPacket
     * @brief Typed view over an identity packet.
     *
     * The viewed packet must outlive the view, so temporaries are refused.
     */
    class IdentityPacket {
    public:
        explicit IdentityPacket(const Packet& packet) : packet_(packet) {}
        explicit IdentityPacket(Packet&&) = delete;

        /**
         * @brief Build an identity packet announcing this host.
         *
         * The body carries deviceId, deviceName, deviceType, protocolVersion and both
         * capability sets (as sorted arrays). Entries of additionalProperties are applied
         * afterwards and replace base fields with the same key, which is how transports
         * attach fields such as tcpPort.
         *
         * @param config Local host identity
         * @param additionalProperties Optional JSON object of extra body entries
         * @return A new packet of type "kdeconnect.identity"
         * @throws std::invalid_argument if additionalProperties is not an object
         */
        static Packet build(const IHostConfiguration& config,
            const std::optional<Body>& additionalProperties = std::nullopt);

        /**
         * @brief Throw IdentityErr::WrongType unless the packet is an identity packet.
         */
        static void validateType(const Packet& packet);

        /**
         * @brief Check every mandatory field once, and tcpPort when it is present.
         * @throws IdentityError describing the first invalid field
         */
        static void validate(const Packet& packet);

        std::string   deviceId() const;
        std::string   deviceName() const;
        std::string   deviceType() const;
        std::uint32_t protocolVersion() const;

        /**
         * @brief TCP port the peer listens on. Only present in discovery broadcasts.
         * @throws IdentityError InvalidTCPPort if absent, negative, fractional or above 65535
         */
        std::uint16_t tcpPort() const;

        /**
         * @brief Whether the body carries a tcpPort entry (valid or not).
         */
        bool hasTcpPort() const;

        CapabilitySet incomingCapabilities() const;
        CapabilitySet outgoingCapabilities() const;

        const Packet& packet() const { return packet_; }

    private:
        const Packet& packet_;
    };

}
