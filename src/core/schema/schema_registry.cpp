#include "pairwire/core/schema/schema_registry.hpp"
#include "pairwire/core/identity/identity_packet.hpp"
#include "pairwire/core/util/logger.hpp"

namespace pairwire {

    SchemaRegistry SchemaRegistry::withDefaults() {
        SchemaRegistry reg;
        reg.add(kIdentityPacketType, &IdentityPacket::validate);
        return reg;
    }

    SchemaRegistry::SchemaRegistry(const SchemaRegistry& o) {
        std::lock_guard<std::mutex> lock(o.mutex_);
        validators_ = o.validators_;
    }

    SchemaRegistry& SchemaRegistry::operator=(const SchemaRegistry& o) {
        if (this != &o) {
            std::scoped_lock lock(mutex_, o.mutex_);
            validators_ = o.validators_;
        }
        return *this;
    }

    void SchemaRegistry::add(const std::string& type, PacketValidator validator) {
        std::lock_guard<std::mutex> lock(mutex_);
        validators_[type] = std::move(validator);
    }

    bool SchemaRegistry::contains(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return validators_.count(type) != 0;
    }

    bool SchemaRegistry::validate(const Packet& packet) const {
        PacketValidator validator;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = validators_.find(packet.type());
            if (it == validators_.end()) return true;
            validator = it->second;
        }

        try {
            validator(packet);
        }
        catch (const std::exception& ex) {
            PAIRWIRE_LOG_WARN("[SchemaRegistry] rejected '" + packet.type() + "' packet: " + ex.what());
            return false;
        }
        return true;
    }

}
