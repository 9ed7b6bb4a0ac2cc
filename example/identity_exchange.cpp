/**
 * @file identity_exchange.cpp
 * @brief Walks two hosts through an identity exchange without a network.
 *
 * Usage: identity_exchange [host-config.json]
 *
 * The local identity comes from the given config file, or a built-in default.
 * Its identity packet is serialized, pushed through a PacketFramer in small
 * chunks as a TCP reader would see it, then read back field by field.
 */
#include "pairwire/pairwire.hpp"
#include <algorithm>
#include <iostream>
#include <string>

using namespace pairwire;

static HostInfo defaultHost() {
    HostInfo info;
    info.deviceId = "d3adb33f_example";
    info.deviceName = "example-desktop";
    info.deviceType = DeviceType::Desktop;
    info.incomingCapabilities = { "kdeconnect.ping", "kdeconnect.share.request" };
    info.outgoingCapabilities = { "kdeconnect.ping", "kdeconnect.battery" };
    return info;
}

int main(int argc, char** argv) {
    HostInfo info;
    try {
        info = argc > 1 ? loadHostInfoFile(argv[1]) : defaultHost();
    }
    catch (const ConfigError& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
    if (info.logLevel) Logger::inst().setLevel(*info.logLevel);

    StaticHostConfiguration config(info);

    /*──────── outbound ────────*/
    Packet hello = IdentityPacket::build(config, Body{ { identity_key::tcpPort, 1716 } });
    PAIRWIRE_LOG_INFO("sending identity:\n" + hello.toString());

    Bytes wire;
    try {
        wire = hello.serialize();
    }
    catch (const EncodingError& ex) {
        PAIRWIRE_LOG_ERROR(std::string("cannot encode identity: ") + ex.what());
        return 1;
    }

    // a malformed line ahead of the identity must not stall the stream
    std::string garbage = "{not json}\n";
    wire.insert(wire.begin(), garbage.begin(), garbage.end());

    /*──────── inbound ────────*/
    PacketFramer framer;
    std::vector<Packet> received;
    constexpr std::size_t chunk = 7;
    for (std::size_t off = 0; off < wire.size(); off += chunk) {
        std::size_t n = std::min(chunk, wire.size() - off);
        for (auto& p : framer.feed(wire.data() + off, n))
            received.push_back(std::move(p));
    }
    PAIRWIRE_LOG_INFO("framer produced " + std::to_string(received.size()) + " packet(s), dropped "
        + std::to_string(framer.droppedCount()));

    SchemaRegistry registry = SchemaRegistry::withDefaults();
    for (const auto& p : received) {
        if (!registry.validate(p)) continue;
        if (p.type() != kIdentityPacketType) continue;

        try {
            IdentityPacket peer(p);
            std::cout << "peer " << peer.deviceName() << " (" << peer.deviceId() << ")\n"
                      << "  type:     " << peer.deviceType() << '\n'
                      << "  protocol: " << peer.protocolVersion() << '\n';
            if (peer.hasTcpPort())
                std::cout << "  tcpPort:  " << peer.tcpPort() << '\n';
            std::cout << "  incoming: " << peer.incomingCapabilities().size() << " capabilities\n"
                      << "  outgoing: " << peer.outgoingCapabilities().size() << " capabilities\n";
        }
        catch (const IdentityError& ex) {
            PAIRWIRE_LOG_WARN(std::string("handshake aborted: ") + ex.what());
        }
    }
    return 0;
}
