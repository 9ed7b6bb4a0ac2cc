#include <catch2/catch.hpp>
#include <functional>
#include <type_traits>
#include <vector>
#include "pairwire/core/identity/identity_packet.hpp"
#include "pairwire/core/config/host_configuration.hpp"

using namespace pairwire;

// Helper: a laptop that can ping and share
static StaticHostConfiguration makeHost() {
    HostInfo info;
    info.deviceId = "0123456789abcdef";
    info.deviceName = "Test Laptop";
    info.deviceType = DeviceType::Laptop;
    info.incomingCapabilities = { "kdeconnect.ping", "kdeconnect.share.request" };
    info.outgoingCapabilities = { "kdeconnect.ping", "kdeconnect.battery", "kdeconnect.mpris" };
    return StaticHostConfiguration(info);
}

static Packet identityWith(Body body) {
    return Packet(kIdentityPacketType, std::move(body));
}

static Body validBody() {
    return {
        { "deviceId", "peer-1" },
        { "deviceName", "Phone" },
        { "deviceType", "phone" },
        { "protocolVersion", 7 },
        { "incomingCapabilities", { "kdeconnect.ping" } },
        { "outgoingCapabilities", { "kdeconnect.ping", "kdeconnect.battery" } }
    };
}

static IdentityErr errorOf(const std::function<void()>& fn) {
    try {
        fn();
    }
    catch (const IdentityError& ex) {
        return ex.code();
    }
    FAIL("expected IdentityError");
    return IdentityErr::WrongType;
}

// ------------------------------------------------------------------
// build()
// ------------------------------------------------------------------
TEST_CASE("IdentityPacket: build copies the host identity", "[identity]") {
    auto host = makeHost();
    Packet p = IdentityPacket::build(host);
    IdentityPacket id(p);

    REQUIRE(p.type() == "kdeconnect.identity");
    REQUIRE(id.deviceId() == "0123456789abcdef");
    REQUIRE(id.deviceName() == "Test Laptop");
    REQUIRE(id.deviceType() == "laptop");
    REQUIRE(id.protocolVersion() == 7);
    REQUIRE(id.incomingCapabilities() == host.incomingCapabilities());
    REQUIRE(id.outgoingCapabilities() == host.outgoingCapabilities());
    REQUIRE_FALSE(id.hasTcpPort());
}

TEST_CASE("IdentityPacket: capabilities are sent as sorted arrays", "[identity]") {
    Packet p = IdentityPacket::build(makeHost());
    REQUIRE(p.body()["outgoingCapabilities"]
        == Body{ "kdeconnect.battery", "kdeconnect.mpris", "kdeconnect.ping" });
}

TEST_CASE("IdentityPacket: additional properties add and override", "[identity]") {
    Packet p = IdentityPacket::build(makeHost(),
        Body{ { "tcpPort", 1716 }, { "deviceName", "Renamed" }, { "protocolVersion", 8 } });
    IdentityPacket id(p);

    REQUIRE(id.hasTcpPort());
    REQUIRE(id.tcpPort() == 1716);
    REQUIRE(id.deviceName() == "Renamed");
    REQUIRE(id.protocolVersion() == 8);
    REQUIRE(id.deviceId() == "0123456789abcdef");
}

TEST_CASE("IdentityPacket: additional properties must be an object", "[identity]") {
    REQUIRE_THROWS_AS(IdentityPacket::build(makeHost(), Body::array()), std::invalid_argument);
}

TEST_CASE("IdentityPacket: built packet survives the wire", "[identity][wire]") {
    Packet out = IdentityPacket::build(makeHost(), Body{ { "tcpPort", 1739 } });
    auto in = Packet::parse(out.serialize());
    REQUIRE(in);

    IdentityPacket id(*in);
    REQUIRE_NOTHROW(IdentityPacket::validate(*in));
    REQUIRE(id.deviceId() == "0123456789abcdef");
    REQUIRE(id.tcpPort() == 1739);
    REQUIRE(id.incomingCapabilities().size() == 2);
}

// ------------------------------------------------------------------
// WrongType comes first
// ------------------------------------------------------------------
TEST_CASE("IdentityPacket: every accessor rejects a non-identity packet", "[identity][errors]") {
    // body would be a valid identity; only the type is wrong
    Packet p("kdeconnect.ping", validBody());
    IdentityPacket id(p);

    REQUIRE(errorOf([&] { id.deviceId(); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { id.deviceName(); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { id.deviceType(); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { id.protocolVersion(); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { id.tcpPort(); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { id.hasTcpPort(); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { id.incomingCapabilities(); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { id.outgoingCapabilities(); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { IdentityPacket::validate(p); }) == IdentityErr::WrongType);
    REQUIRE(errorOf([&] { IdentityPacket::validateType(p); }) == IdentityErr::WrongType);
}

TEST_CASE("IdentityPacket: WrongType wins over an empty body", "[identity][errors]") {
    Packet p("kdeconnect.battery");
    IdentityPacket id(p);
    REQUIRE(errorOf([&] { id.deviceId(); }) == IdentityErr::WrongType);
}

// ------------------------------------------------------------------
// Field validation
// ------------------------------------------------------------------
TEST_CASE("IdentityPacket: missing fields map to field-specific errors", "[identity][errors]") {
    Packet empty = identityWith(Body::object());
    IdentityPacket id(empty);

    REQUIRE(errorOf([&] { id.deviceId(); }) == IdentityErr::InvalidDeviceId);
    REQUIRE(errorOf([&] { id.deviceName(); }) == IdentityErr::InvalidDeviceName);
    REQUIRE(errorOf([&] { id.deviceType(); }) == IdentityErr::InvalidDeviceType);
    REQUIRE(errorOf([&] { id.protocolVersion(); }) == IdentityErr::InvalidProtocolVersion);
    REQUIRE(errorOf([&] { id.tcpPort(); }) == IdentityErr::InvalidTCPPort);
    REQUIRE(errorOf([&] { id.incomingCapabilities(); }) == IdentityErr::InvalidIncomingCapabilities);
    REQUIRE(errorOf([&] { id.outgoingCapabilities(); }) == IdentityErr::InvalidOutgoingCapabilities);
}

TEST_CASE("IdentityPacket: wrongly shaped fields are rejected", "[identity][errors]") {
    struct Case { const char* key; Body value; IdentityErr expected; };
    std::vector<Case> cases = {
        { "deviceId", 42, IdentityErr::InvalidDeviceId },
        { "deviceName", nullptr, IdentityErr::InvalidDeviceName },
        { "deviceType", Body::array(), IdentityErr::InvalidDeviceType },
        { "protocolVersion", "7", IdentityErr::InvalidProtocolVersion },
        { "protocolVersion", -1, IdentityErr::InvalidProtocolVersion },
        { "protocolVersion", 7.5, IdentityErr::InvalidProtocolVersion },
        { "protocolVersion", true, IdentityErr::InvalidProtocolVersion },
        { "tcpPort", 65536, IdentityErr::InvalidTCPPort },
        { "tcpPort", -5, IdentityErr::InvalidTCPPort },
        { "tcpPort", 1716.5, IdentityErr::InvalidTCPPort },
        { "tcpPort", 65536.0, IdentityErr::InvalidTCPPort },
        { "tcpPort", "1716", IdentityErr::InvalidTCPPort },
        { "incomingCapabilities", "kdeconnect.ping", IdentityErr::InvalidIncomingCapabilities },
        { "incomingCapabilities", Body{ "kdeconnect.ping", 3 }, IdentityErr::InvalidIncomingCapabilities },
        { "outgoingCapabilities", Body::object(), IdentityErr::InvalidOutgoingCapabilities },
    };

    for (const auto& c : cases) {
        DYNAMIC_SECTION(c.key << " = " << c.value.dump()) {
            Body body = validBody();
            body[c.key] = c.value;
            Packet p = identityWith(body);
            REQUIRE(errorOf([&] { IdentityPacket::validate(p); }) == c.expected);
        }
    }
}

TEST_CASE("IdentityPacket: port bounds", "[identity]") {
    Body body = validBody();
    body["tcpPort"] = 0;
    Packet low = identityWith(body);
    REQUIRE(IdentityPacket(low).tcpPort() == 0);

    body["tcpPort"] = 65535;
    Packet high = identityWith(body);
    REQUIRE(IdentityPacket(high).tcpPort() == 65535);
}

TEST_CASE("IdentityPacket: whole-number floats are read as integers", "[identity]") {
    Body body = validBody();
    body["protocolVersion"] = 7.0;
    body["tcpPort"] = 1716.0;
    Packet p = identityWith(body);

    REQUIRE_NOTHROW(IdentityPacket::validate(p));
    IdentityPacket id(p);
    REQUIRE(id.protocolVersion() == 7);
    REQUIRE(id.tcpPort() == 1716);
}

TEST_CASE("IdentityPacket: views cannot be made over temporaries", "[identity]") {
    STATIC_REQUIRE(std::is_constructible_v<IdentityPacket, const Packet&>);
    STATIC_REQUIRE_FALSE(std::is_constructible_v<IdentityPacket, Packet&&>);

    // keep the parsed packet alive for the view
    auto parsed = Packet::parse(IdentityPacket::build(makeHost()).serialize());
    REQUIRE(parsed);
    IdentityPacket id(*parsed);
    REQUIRE(id.deviceId() == "0123456789abcdef");
}

TEST_CASE("IdentityPacket: duplicate capabilities collapse", "[identity]") {
    Body body = validBody();
    body["incomingCapabilities"] = { "a", "a", "b" };
    body["outgoingCapabilities"] = Body::array();
    Packet p = identityWith(body);
    IdentityPacket id(p);

    auto caps = id.incomingCapabilities();
    REQUIRE(caps.size() == 2);
    REQUIRE(caps.count(Capability("a")) == 1);
    REQUIRE(caps.count(Capability("b")) == 1);
    REQUIRE(id.outgoingCapabilities().empty());
}

TEST_CASE("IdentityPacket: unknown device types are not rejected here", "[identity]") {
    Body body = validBody();
    body["deviceType"] = "toaster";
    Packet p = identityWith(body);

    REQUIRE_NOTHROW(IdentityPacket::validate(p));
    REQUIRE(IdentityPacket(p).deviceType() == "toaster");
}

TEST_CASE("IdentityPacket: error message names the field", "[identity][errors]") {
    IdentityError err(IdentityErr::InvalidTCPPort);
    REQUIRE(std::string(err.what()).find("tcpPort") != std::string::npos);
}
