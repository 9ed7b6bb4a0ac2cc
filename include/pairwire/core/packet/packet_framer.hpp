/**
 * @file packet_framer.hpp
 * @brief Splits a byte stream into newline-terminated packets.
 *
 * Transports hand every chunk they read to PacketFramer::feed() and get back the
 * complete packets it contained. Malformed lines are logged and dropped so one bad
 * message never stalls the stream.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "pairwire/core/packet/packet.hpp"

namespace pairwire {

    /**
     * @struct FramerOptions
     * @brief Limits applied while reassembling lines.
     */
    struct FramerOptions {
        std::size_t maxLineBytes{ 1024 * 1024 }; ///< Longest accepted line, terminator excluded
    };

    /**
     * @class PacketFramer
     * @brief Incremental line framer for a single stream. Not thread-safe.
     */
    class PacketFramer {
    public:
        explicit PacketFramer(FramerOptions opts = {});

        /**
         * @brief Consume a chunk of stream bytes.
         *
         * Lines may be split across any number of calls. Blank lines are skipped;
         * malformed and oversized lines are dropped and counted.
         *
         * @param data Pointer to the chunk
         * @param len Chunk length in bytes
         * @return Packets completed by this chunk, in stream order
         */
        std::vector<Packet> feed(const std::uint8_t* data, std::size_t len);
        std::vector<Packet> feed(const Bytes& data);
        std::vector<Packet> feed(std::string_view text);

        /// Bytes buffered for the line currently being assembled.
        std::size_t pending() const { return buf_.size(); }

        /// Lines dropped so far because they were malformed or too long.
        std::size_t droppedCount() const { return dropped_; }

        void reset();

    private:
        void finishLine(std::vector<Packet>& out);

        FramerOptions opts_;
        std::string   buf_;
        bool          discarding_ = false; ///< Skipping the rest of an oversized line
        std::size_t   dropped_ = 0;
    };

}
