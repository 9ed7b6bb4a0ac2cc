#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace pairwire {

    class Packet; // Forward-declaration

    /* Packet body and payload descriptor: always JSON objects */
    using Body = nlohmann::json;
    using PayloadInfo = nlohmann::json;

    using Bytes = std::vector<uint8_t>;
    using PacketValidator = std::function<void(const Packet&)>;

    enum class Formatting {
        Compact,
        Pretty
    };

}
