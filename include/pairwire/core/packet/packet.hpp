/**
 * @file packet.hpp
 * @brief Packet value type and its newline-framed JSON wire encoding.
 *
 * A packet is one protocol message: an id, a type tag and a JSON object body.
 * Binary transfers ride alongside as an out-of-band payload stream whose size
 * and transport descriptor are carried on the packet but never written to the wire.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "pairwire/core/types.hpp"
#include "pairwire/core/util/error_types.hpp"

namespace pairwire {

    /**
     * Deepest container nesting a packet may carry, counting the envelope object as
     * level 1 and the body as level 2. Parsing rejects deeper input and serialize()
     * refuses to encode it.
     */
    inline constexpr std::size_t kMaxNestingDepth = 64;

    /**
     * @class Packet
     * @brief One protocol message.
     *
     * id, type and body are fixed at construction. Only the payload metadata can be
     * attached later, by transport code that has negotiated a side channel.
     */
    class Packet {
    public:
        /**
         * @brief Construct a packet stamped with the current epoch time in milliseconds.
         * @param type Packet type tag, e.g. "kdeconnect.ping"
         * @param body JSON object body (null is treated as {})
         * @throws std::invalid_argument if type is empty or body is not an object
         */
        explicit Packet(std::string type, Body body = Body::object());

        /**
         * @brief Construct a packet with an explicit id.
         * @throws std::invalid_argument if type is empty or body is not an object
         */
        Packet(std::int64_t id, std::string type, Body body);

        /**
         * @brief Parse one wire packet.
         *
         * Accepts a JSON object with a numeric "id", a non-empty string "type"
         * and an object "body". Any other keys are ignored, payload fields included.
         * A single trailing line terminator is tolerated. Input nested deeper than
         * kMaxNestingDepth is rejected without building the document.
         *
         * @param data Raw bytes of one line
         * @return The packet, or std::nullopt if the bytes do not describe one
         */
        static std::optional<Packet> parse(const Bytes& data);
        static std::optional<Packet> parse(std::string_view text);

        /**
         * @brief Parse one wire packet and report why it was rejected.
         * @param text Raw text of one line
         * @param why Set to the failure reason when std::nullopt is returned
         * @return The packet, or std::nullopt
         */
        static std::optional<Packet> parse(std::string_view text, ParseFailure& why);

        /**
         * @brief Serialize to the wire representation.
         *
         * Produces {"body":...,"id":...,"type":...} followed by a single '\n'.
         * Payload metadata is never included.
         *
         * @param fmt Compact for the wire, Pretty for human-readable logs
         * @return Encoded bytes including the trailing newline
         * @throws EncodingError if the body holds a value JSON cannot represent,
         *         or nests deeper than kMaxNestingDepth
         */
        Bytes serialize(Formatting fmt = Formatting::Compact) const;

        /**
         * @brief Pretty-printed form for logging. Never throws on encoding problems.
         */
        std::string toString() const;

        std::int64_t id() const { return id_; }
        const std::string& type() const { return type_; }
        const Body& body() const { return body_; }

        /*──────── payload (out-of-band) ────────*/

        /**
         * @brief Attach an externally owned payload stream.
         *
         * The packet keeps a reference only; it never reads from or closes the stream.
         * @param stream Readable stream supplied by the transport
         * @param size Declared number of bytes the stream will deliver
         * @throws std::invalid_argument if size is negative
         */
        void setPayload(std::shared_ptr<std::istream> stream, std::int64_t size);

        /**
         * @brief Attach the transport-specific payload descriptor, e.g. {"port": 1739}.
         * @throws std::invalid_argument if info is not an object
         */
        void setPayloadInfo(PayloadInfo info);

        void clearPayload();

        bool hasPayload() const { return payload_ != nullptr; }
        const std::shared_ptr<std::istream>& payload() const { return payload_; }
        std::optional<std::int64_t> payloadSize() const { return payloadSize_; }
        const std::optional<PayloadInfo>& payloadInfo() const { return payloadInfo_; }

    private:
        std::int64_t id_;
        std::string  type_;
        Body         body_;

        std::shared_ptr<std::istream> payload_;
        std::optional<std::int64_t>   payloadSize_;
        std::optional<PayloadInfo>    payloadInfo_;
    };

    std::ostream& operator<<(std::ostream& os, const Packet& p);

}
