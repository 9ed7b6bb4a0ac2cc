#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>

namespace pairwire {

    /**
     * @brief Plugin capability identifier, e.g. "kdeconnect.ping".
     *
     * Carried on the wire as a plain JSON string. The set of known capabilities
     * belongs to the plugin registry; pairwire treats them as opaque names.
     */
    struct Capability {
        std::string name;

        Capability() = default;
        Capability(std::string n) : name(std::move(n)) {}
        Capability(const char* n) : name(n) {}

        const std::string& str() const noexcept { return name; }

        [[nodiscard]] bool operator==(const Capability& o) const noexcept { return name == o.name; }
        [[nodiscard]] bool operator!=(const Capability& o) const noexcept { return name != o.name; }
        [[nodiscard]] bool operator<(const Capability& o) const noexcept { return name < o.name; }
    };

    inline void to_json(nlohmann::json& j, const Capability& c) { j = c.name; }
    inline void from_json(const nlohmann::json& j, Capability& c) { c.name = j.get<std::string>(); }

}

/* ---------- std::hash specialization ---------- */
template<>
struct std::hash<pairwire::Capability> {
    std::size_t operator()(const pairwire::Capability& c) const noexcept {
        return std::hash<std::string>{}(c.name);
    }
};

namespace pairwire {
    using CapabilitySet = std::unordered_set<Capability>;
}
