/**
 * @file error_types.hpp
 * @brief Error type definitions for pairwire.
 *
 * Provides the error codes and exception types raised by packet parsing,
 * serialization, identity field access and configuration loading.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace pairwire {

    /**
     * @enum ParseFailure
     * @brief Coarse reason why a byte buffer did not yield a packet.
     *
     * - Empty: Input had no bytes (or only a line terminator)
     * - MalformedJson: Input is not a JSON document
     * - NotAnObject: Top-level value is not a JSON object
     * - InvalidId: "id" missing, not a number, or outside the int64 range
     * - InvalidType: "type" missing, not a string, or empty
     * - InvalidBody: "body" missing or not an object
     * - TooDeep: Containers nested deeper than kMaxNestingDepth
     */
    enum class ParseFailure : int {
        Empty = 1,       ///< No bytes to parse
        MalformedJson,   ///< Not valid JSON
        NotAnObject,     ///< Top-level value is not an object
        InvalidId,       ///< Missing or mis-shaped "id"
        InvalidType,     ///< Missing, empty or mis-shaped "type"
        InvalidBody,     ///< Missing or mis-shaped "body"
        TooDeep          ///< Nesting exceeds kMaxNestingDepth
    };

    /**
     * @brief Get a short human-readable name for a parse failure.
     * @param f Failure code
     * @return Name such as "malformed json"
     */
    inline const char* toString(ParseFailure f) {
        switch (f) {
            case ParseFailure::Empty:         return "empty input";
            case ParseFailure::MalformedJson: return "malformed json";
            case ParseFailure::NotAnObject:   return "top-level value is not an object";
            case ParseFailure::InvalidId:     return "missing or invalid id";
            case ParseFailure::InvalidType:   return "missing or invalid type";
            case ParseFailure::InvalidBody:   return "missing or invalid body";
            case ParseFailure::TooDeep:       return "nesting too deep";
        }
        return "unknown";
    }

    /**
     * @enum IdentityErr
     * @brief Error codes for identity packet field access.
     *
     * WrongType is checked before any body field is inspected.
     */
    enum class IdentityErr : int {
        WrongType = 1,                 ///< Packet type is not "kdeconnect.identity"
        InvalidDeviceId,               ///< deviceId missing or not a string
        InvalidDeviceName,             ///< deviceName missing or not a string
        InvalidDeviceType,             ///< deviceType missing or not a string
        InvalidProtocolVersion,        ///< protocolVersion missing or not an unsigned integer
        InvalidTCPPort,                ///< tcpPort missing or not a 16-bit unsigned integer
        InvalidIncomingCapabilities,   ///< incomingCapabilities missing or not an array of strings
        InvalidOutgoingCapabilities    ///< outgoingCapabilities missing or not an array of strings
    };

    inline const char* toString(IdentityErr e) {
        switch (e) {
            case IdentityErr::WrongType:                   return "wrong packet type";
            case IdentityErr::InvalidDeviceId:             return "invalid deviceId";
            case IdentityErr::InvalidDeviceName:           return "invalid deviceName";
            case IdentityErr::InvalidDeviceType:           return "invalid deviceType";
            case IdentityErr::InvalidProtocolVersion:      return "invalid protocolVersion";
            case IdentityErr::InvalidTCPPort:              return "invalid tcpPort";
            case IdentityErr::InvalidIncomingCapabilities: return "invalid incomingCapabilities";
            case IdentityErr::InvalidOutgoingCapabilities: return "invalid outgoingCapabilities";
        }
        return "unknown identity error";
    }

    /**
     * @class IdentityError
     * @brief Raised by identity accessors when a packet or one of its fields is invalid.
     */
    class IdentityError : public std::runtime_error {
    public:
        explicit IdentityError(IdentityErr code)
            : std::runtime_error(std::string("identity packet: ") + toString(code)), code_(code) {}

        IdentityErr code() const noexcept { return code_; }

    private:
        IdentityErr code_;
    };

    /**
     * @class EncodingError
     * @brief Raised when a packet body holds a value that has no JSON representation.
     */
    class EncodingError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class ConfigError
     * @brief Raised when a host configuration document is unreadable or invalid.
     */
    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

}
