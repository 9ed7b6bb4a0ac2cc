#include "pairwire/core/identity/identity_packet.hpp"
#include "pairwire/core/util/logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace pairwire {

    namespace {

        Body sortedArray(const CapabilitySet& caps) {
            std::vector<Capability> sorted(caps.begin(), caps.end());
            std::sort(sorted.begin(), sorted.end());
            Body arr = Body::array();
            for (const auto& c : sorted) arr.push_back(c.name);
            return arr;
        }

        const Body* field(const Packet& p, const char* key) {
            auto it = p.body().find(key);
            return it == p.body().end() ? nullptr : &*it;
        }

        std::string stringField(const Packet& p, const char* key, IdentityErr err) {
            const Body* v = field(p, key);
            if (!v || !v->is_string()) throw IdentityError(err);
            return v->get<std::string>();
        }

        /* Non-negative whole number no larger than max; 7.0 counts, 7.5 and booleans do not */
        std::uint64_t unsignedField(const Packet& p, const char* key, std::uint64_t max, IdentityErr err) {
            const Body* v = field(p, key);
            if (!v) throw IdentityError(err);
            if (v->is_number_float()) {
                double d = v->get<double>();
                if (!(d >= 0.0 && d <= static_cast<double>(max)) || std::trunc(d) != d)
                    throw IdentityError(err);
                return static_cast<std::uint64_t>(d);
            }
            if (!v->is_number_integer()) throw IdentityError(err);
            if (!v->is_number_unsigned() && v->get<std::int64_t>() < 0) throw IdentityError(err);
            auto u = v->get<std::uint64_t>();
            if (u > max) throw IdentityError(err);
            return u;
        }

        CapabilitySet capabilityField(const Packet& p, const char* key, IdentityErr err) {
            const Body* v = field(p, key);
            if (!v || !v->is_array()) throw IdentityError(err);
            CapabilitySet caps;
            for (const auto& c : *v) {
                if (!c.is_string()) throw IdentityError(err);
                caps.insert(c.get<Capability>());
            }
            return caps;
        }

    }

    /*──────────── build ───────────*/
    Packet IdentityPacket::build(const IHostConfiguration& config,
        const std::optional<Body>& additionalProperties)
    {
        if (additionalProperties && !additionalProperties->is_object())
            throw std::invalid_argument("IdentityPacket::build: additional properties must be a JSON object");

        Body body = {
            { identity_key::deviceId, config.deviceId() },
            { identity_key::deviceName, config.deviceName() },
            { identity_key::deviceType, toString(config.deviceType()) },
            { identity_key::protocolVersion, kProtocolVersion },
            { identity_key::outgoingCapabilities, sortedArray(config.outgoingCapabilities()) },
            { identity_key::incomingCapabilities, sortedArray(config.incomingCapabilities()) }
        };

        if (additionalProperties) {
            for (const auto& el : additionalProperties->items())
                body[el.key()] = el.value();
        }

        Packet packet(kIdentityPacketType, std::move(body));
        if (Logger::inst().level() <= LogLevel::Trace)
            PAIRWIRE_LOG_TRACE("[IdentityPacket::build] " + packet.toString());
        return packet;
    }

    /*──────────── validation ───────────*/
    void IdentityPacket::validateType(const Packet& packet) {
        if (packet.type() != kIdentityPacketType)
            throw IdentityError(IdentityErr::WrongType);
    }

    void IdentityPacket::validate(const Packet& packet) {
        IdentityPacket view(packet);
        view.deviceId();
        view.deviceName();
        view.deviceType();
        view.protocolVersion();
        view.incomingCapabilities();
        view.outgoingCapabilities();
        if (view.hasTcpPort()) view.tcpPort();
    }

    /*──────────── accessors ───────────*/
    std::string IdentityPacket::deviceId() const {
        validateType(packet_);
        return stringField(packet_, identity_key::deviceId, IdentityErr::InvalidDeviceId);
    }

    std::string IdentityPacket::deviceName() const {
        validateType(packet_);
        return stringField(packet_, identity_key::deviceName, IdentityErr::InvalidDeviceName);
    }

    std::string IdentityPacket::deviceType() const {
        validateType(packet_);
        return stringField(packet_, identity_key::deviceType, IdentityErr::InvalidDeviceType);
    }

    std::uint32_t IdentityPacket::protocolVersion() const {
        validateType(packet_);
        return static_cast<std::uint32_t>(unsignedField(packet_, identity_key::protocolVersion,
            std::numeric_limits<std::uint32_t>::max(), IdentityErr::InvalidProtocolVersion));
    }

    std::uint16_t IdentityPacket::tcpPort() const {
        validateType(packet_);
        return static_cast<std::uint16_t>(unsignedField(packet_, identity_key::tcpPort,
            std::numeric_limits<std::uint16_t>::max(), IdentityErr::InvalidTCPPort));
    }

    bool IdentityPacket::hasTcpPort() const {
        validateType(packet_);
        return packet_.body().contains(identity_key::tcpPort);
    }

    CapabilitySet IdentityPacket::incomingCapabilities() const {
        validateType(packet_);
        return capabilityField(packet_, identity_key::incomingCapabilities, IdentityErr::InvalidIncomingCapabilities);
    }

    CapabilitySet IdentityPacket::outgoingCapabilities() const {
        validateType(packet_);
        return capabilityField(packet_, identity_key::outgoingCapabilities, IdentityErr::InvalidOutgoingCapabilities);
    }

}
