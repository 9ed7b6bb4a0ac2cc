#include "pairwire/core/packet/packet_framer.hpp"
#include "pairwire/core/util/logger.hpp"
#include <cstring>

namespace pairwire {

    PacketFramer::PacketFramer(FramerOptions opts)
        : opts_(opts) {}

    std::vector<Packet> PacketFramer::feed(const Bytes& data) {
        return feed(data.data(), data.size());
    }

    std::vector<Packet> PacketFramer::feed(std::string_view text) {
        return feed(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }

    std::vector<Packet> PacketFramer::feed(const std::uint8_t* data, std::size_t len) {
        std::vector<Packet> out;
        std::size_t pos = 0;

        while (pos < len) {
            const void* nl = std::memchr(data + pos, '\n', len - pos);
            const std::size_t end = nl ? static_cast<std::size_t>(static_cast<const std::uint8_t*>(nl) - data) : len;

            /* ---- tail of an oversized line ---- */
            if (discarding_) {
                if (nl) discarding_ = false;
                pos = nl ? end + 1 : len;
                continue;
            }

            buf_.append(reinterpret_cast<const char*>(data + pos), end - pos);

            if (buf_.size() > opts_.maxLineBytes) {
                ++dropped_;
                PAIRWIRE_LOG_WARN("[PacketFramer] dropped line longer than "
                    + std::to_string(opts_.maxLineBytes) + " bytes");
                buf_.clear();
                discarding_ = (nl == nullptr);
                pos = nl ? end + 1 : len;
                continue;
            }

            if (!nl) break;   // incomplete line, wait for more bytes
            pos = end + 1;
            finishLine(out);
        }
        return out;
    }

    void PacketFramer::finishLine(std::vector<Packet>& out) {
        std::string line;
        line.swap(buf_);

        if (line.find_first_not_of(" \t\r") == std::string::npos) return;

        ParseFailure why{};
        if (auto packet = Packet::parse(line, why)) {
            out.push_back(std::move(*packet));
        }
        else {
            ++dropped_;
            PAIRWIRE_LOG_WARN(std::string("[PacketFramer] dropped malformed packet: ") + toString(why));
        }
    }

    void PacketFramer::reset() {
        buf_.clear();
        discarding_ = false;
        dropped_ = 0;
    }

}
