#include "pairwire/core/packet/packet.hpp"
#include "pairwire/core/util/logger.hpp"
#include "pairwire/core/util/time.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pairwire {

    namespace {

        using value_t = Body::value_t;

        //------------------------------------------------------------------------------
        // Walk the body and reject anything dump() would either throw on or silently
        // rewrite (NaN/inf become null, binary becomes an object). dump() recurses per
        // level, so nesting is capped here as well.
        void ensureEncodable(const Body& body) {
            struct Frame { const Body* value; std::size_t depth; };
            std::vector<Frame> stack{ { &body, 2 } };   // envelope is level 1

            while (!stack.empty()) {
                Frame f = stack.back();
                stack.pop_back();
                const Body& v = *f.value;
                switch (v.type()) {
                    case value_t::number_float:
                        if (!std::isfinite(v.get<double>()))
                            throw EncodingError("Packet::serialize: non-finite number in body");
                        break;
                    case value_t::binary:
                        throw EncodingError("Packet::serialize: binary value in body");
                    case value_t::discarded:
                        throw EncodingError("Packet::serialize: discarded value in body");
                    case value_t::object:
                    case value_t::array:
                        if (f.depth > kMaxNestingDepth)
                            throw EncodingError("Packet::serialize: body nests deeper than "
                                + std::to_string(kMaxNestingDepth) + " levels");
                        for (const auto& el : v)
                            stack.push_back({ &el, f.depth + 1 });
                        break;
                    default:
                        break;
                }
            }
        }

        bool readId(const Body& v, std::int64_t& out) {
            if (v.is_number_unsigned()) {
                auto u = v.get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return false;
                out = static_cast<std::int64_t>(u);
                return true;
            }
            if (v.is_number_integer()) {
                out = v.get<std::int64_t>();
                return true;
            }
            if (v.is_number_float()) {
                // 2^63 is exactly representable as a double; anything at or above it overflows
                constexpr double limit = 9223372036854775808.0;
                double d = v.get<double>();
                if (!(d >= -limit && d < limit)) return false;
                out = static_cast<std::int64_t>(d);
                return true;
            }
            return false;
        }

    }

    Packet::Packet(std::string type, Body body)
        : Packet(epochMillis(), std::move(type), std::move(body)) {}

    Packet::Packet(std::int64_t id, std::string type, Body body)
        : id_(id), type_(std::move(type)), body_(std::move(body))
    {
        if (type_.empty())
            throw std::invalid_argument("Packet: type must not be empty");
        if (body_.is_null())
            body_ = Body::object();
        else if (!body_.is_object())
            throw std::invalid_argument("Packet: body of '" + type_ + "' must be a JSON object");
    }

    /*──────────── parse ───────────*/
    std::optional<Packet> Packet::parse(const Bytes& data) {
        return parse(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
    }

    std::optional<Packet> Packet::parse(std::string_view text) {
        ParseFailure why{};
        return parse(text, why);
    }

    std::optional<Packet> Packet::parse(std::string_view text, ParseFailure& why) {
        if (!text.empty() && text.back() == '\n') {
            text.remove_suffix(1);
            if (!text.empty() && text.back() == '\r') text.remove_suffix(1);
        }

        auto reject = [&why](ParseFailure f) -> std::optional<Packet> {
            why = f;
            PAIRWIRE_LOG_DEBUG(std::string("[Packet::parse] rejected: ") + ::pairwire::toString(f));
            return std::nullopt;
        };

        if (text.empty()) return reject(ParseFailure::Empty);

        // the callback sees every container before it is built; depth 0 is the envelope
        bool tooDeep = false;
        Body::parser_callback_t limitDepth = [&tooDeep](int depth, Body::parse_event_t ev, Body&) {
            if (tooDeep) return false;
            if ((ev == Body::parse_event_t::object_start || ev == Body::parse_event_t::array_start)
                && static_cast<std::size_t>(depth) >= kMaxNestingDepth) {
                tooDeep = true;
                return false;
            }
            return true;
        };

        Body doc = Body::parse(text.data(), text.data() + text.size(), limitDepth, false);
        if (tooDeep)            return reject(ParseFailure::TooDeep);
        if (doc.is_discarded()) return reject(ParseFailure::MalformedJson);
        if (!doc.is_object())   return reject(ParseFailure::NotAnObject);

        std::int64_t id = 0;
        auto idIt = doc.find("id");
        if (idIt == doc.end() || !readId(*idIt, id)) return reject(ParseFailure::InvalidId);

        auto typeIt = doc.find("type");
        if (typeIt == doc.end() || !typeIt->is_string() || typeIt->get_ref<const std::string&>().empty())
            return reject(ParseFailure::InvalidType);

        auto bodyIt = doc.find("body");
        if (bodyIt == doc.end() || !bodyIt->is_object()) return reject(ParseFailure::InvalidBody);

        return Packet(id, typeIt->get<std::string>(), std::move(*bodyIt));
    }

    /*──────────── serialize ───────────*/
    Bytes Packet::serialize(Formatting fmt) const {
        ensureEncodable(body_);

        Body envelope = Body::object();
        envelope["id"] = id_;
        envelope["type"] = type_;
        envelope["body"] = body_;

        std::string text;
        try {
            text = fmt == Formatting::Pretty ? envelope.dump(4) : envelope.dump();
        }
        catch (const Body::type_error& ex) {
            // strict UTF-8 checking is the only way dump() throws
            throw EncodingError(std::string("Packet::serialize: ") + ex.what());
        }

        Bytes out(text.begin(), text.end());
        out.push_back(static_cast<uint8_t>('\n'));
        return out;
    }

    std::string Packet::toString() const {
        try {
            Bytes b = serialize(Formatting::Pretty);
            return std::string(b.begin(), b.end() - 1);
        }
        catch (const EncodingError& ex) {
            return std::string("Could not serialize packet: ") + ex.what();
        }
    }

    /*──────────── payload ───────────*/
    void Packet::setPayload(std::shared_ptr<std::istream> stream, std::int64_t size) {
        if (size < 0)
            throw std::invalid_argument("Packet::setPayload: negative payload size");
        payload_ = std::move(stream);
        payloadSize_ = size;
    }

    void Packet::setPayloadInfo(PayloadInfo info) {
        if (!info.is_object())
            throw std::invalid_argument("Packet::setPayloadInfo: payload info must be a JSON object");
        payloadInfo_ = std::move(info);
    }

    void Packet::clearPayload() {
        payload_.reset();
        payloadSize_.reset();
        payloadInfo_.reset();
    }

    std::ostream& operator<<(std::ostream& os, const Packet& p) {
        return os << p.toString();
    }

}
