#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include "pairwire/core/config/host_configuration.hpp"
#include "pairwire/core/util/error_types.hpp"

using namespace pairwire;

TEST_CASE("DeviceType names round-trip through the vocabulary", "[config]") {
    for (auto t : { DeviceType::Unknown, DeviceType::Desktop, DeviceType::Laptop,
                    DeviceType::Phone, DeviceType::Tablet, DeviceType::Tv }) {
        auto back = deviceTypeFromString(toString(t));
        REQUIRE(back);
        REQUIRE(*back == t);
    }
    REQUIRE(std::string(toString(DeviceType::Tv)) == "tv");
    REQUIRE_FALSE(deviceTypeFromString("toaster"));
    REQUIRE_FALSE(deviceTypeFromString("Desktop"));
}

TEST_CASE("loadHostInfo reads a complete document", "[config]") {
    auto info = loadHostInfo(R"({
        "deviceId": "abc123",
        "deviceName": "workstation",
        "deviceType": "desktop",
        "incomingCapabilities": ["kdeconnect.ping", "kdeconnect.ping", "kdeconnect.share.request"],
        "outgoingCapabilities": ["kdeconnect.ping"],
        "logLevel": "debug"
    })");

    REQUIRE(info.deviceId == "abc123");
    REQUIRE(info.deviceName == "workstation");
    REQUIRE(info.deviceType == DeviceType::Desktop);
    REQUIRE(info.incomingCapabilities.size() == 2);
    REQUIRE(info.outgoingCapabilities.count(Capability("kdeconnect.ping")) == 1);
    REQUIRE(info.logLevel);
    REQUIRE(*info.logLevel == LogLevel::Debug);

    StaticHostConfiguration cfg(info);
    REQUIRE(cfg.deviceId() == "abc123");
    REQUIRE(cfg.deviceType() == DeviceType::Desktop);
    REQUIRE(cfg.incomingCapabilities() == info.incomingCapabilities);
}

TEST_CASE("loadHostInfo: capabilities and logLevel are optional", "[config]") {
    auto info = loadHostInfo(R"({"deviceId":"x","deviceName":"y","deviceType":"phone"})");
    REQUIRE(info.deviceType == DeviceType::Phone);
    REQUIRE(info.incomingCapabilities.empty());
    REQUIRE(info.outgoingCapabilities.empty());
    REQUIRE_FALSE(info.logLevel);
}

TEST_CASE("loadHostInfo rejects invalid documents", "[config]") {
    REQUIRE_THROWS_AS(loadHostInfo(""), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo("{"), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo("[]"), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo(R"({"deviceName":"y","deviceType":"phone"})"), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo(R"({"deviceId":"","deviceName":"y","deviceType":"phone"})"), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo(R"({"deviceId":"x","deviceName":5,"deviceType":"phone"})"), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo(R"({"deviceId":"x","deviceName":"y","deviceType":"toaster"})"), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo(R"({"deviceId":"x","deviceName":"y","deviceType":"tv","incomingCapabilities":"ping"})"), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo(R"({"deviceId":"x","deviceName":"y","deviceType":"tv","outgoingCapabilities":[1]})"), ConfigError);
    REQUIRE_THROWS_AS(loadHostInfo(R"({"deviceId":"x","deviceName":"y","deviceType":"tv","logLevel":"loud"})"), ConfigError);
}

TEST_CASE("loadHostInfoFile reads from disk", "[config]") {
    const std::string path = "pairwire_host_config.test.json";
    {
        std::ofstream out(path);
        out << R"({"deviceId":"file-id","deviceName":"from file","deviceType":"tablet"})";
    }

    auto info = loadHostInfoFile(path);
    std::remove(path.c_str());

    REQUIRE(info.deviceId == "file-id");
    REQUIRE(info.deviceType == DeviceType::Tablet);
}

TEST_CASE("loadHostInfoFile reports a missing file", "[config]") {
    REQUIRE_THROWS_AS(loadHostInfoFile("/nonexistent/pairwire/host.json"), ConfigError);
}
