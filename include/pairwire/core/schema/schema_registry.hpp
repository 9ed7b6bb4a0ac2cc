/**
 * @file schema_registry.hpp
 * @brief Per-type packet validators keyed by the packet type string.
 *
 * New packet kinds plug their own body checks in here instead of growing the
 * Packet type. A validator signals an invalid packet by throwing.
 */
#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include "pairwire/core/packet/packet.hpp"
#include "pairwire/core/types.hpp"

namespace pairwire {

    /**
     * @class SchemaRegistry
     * @brief Thread-safe map from packet type to body validator.
     */
    class SchemaRegistry {
    public:
        /**
         * @brief Registry pre-loaded with the "kdeconnect.identity" validator.
         */
        static SchemaRegistry withDefaults();

        SchemaRegistry() = default;
        SchemaRegistry(const SchemaRegistry& o);
        SchemaRegistry& operator=(const SchemaRegistry& o);

        /**
         * @brief Register or replace the validator for a packet type.
         * @param type Packet type string
         * @param validator Callable that throws when a packet is invalid
         */
        void add(const std::string& type, PacketValidator validator);

        bool contains(const std::string& type) const;

        /**
         * @brief Run the validator registered for the packet's type.
         *
         * Packets of an unregistered type are accepted.
         * @param packet Packet to check
         * @return False if the validator threw, true otherwise
         */
        bool validate(const Packet& packet) const;

    private:
        std::unordered_map<std::string, PacketValidator> validators_;
        mutable std::mutex mutex_;
    };

}
