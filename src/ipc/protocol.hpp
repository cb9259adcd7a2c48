/**
 * RoyaOS Wire Protocol
 *
 * Framing for agent <-> kernel traffic over the Unix socket.
 * Header: 12 bytes (magic + payload_size), followed by a JSON payload.
 * Inbound payload: {"session_id": "...", "request": {...}}.
 * Outbound payload: the serialized Response envelope.
 */
#pragma once
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"

namespace royaos::ipc {

// Magic bytes for protocol validation
constexpr uint32_t MAGIC_BYTES = 0x524F5941; // "ROYA" in hex
constexpr size_t HEADER_SIZE = 12;
constexpr size_t MAX_PAYLOAD_SIZE = 1024 * 1024; // 1MB max

// Wire protocol header (12 bytes, packed)
struct __attribute__((packed)) MessageHeader {
    uint32_t magic;         // Must be MAGIC_BYTES
    uint64_t payload_size;  // Bytes following this header
};

static_assert(sizeof(MessageHeader) == HEADER_SIZE, "Header size mismatch");

// One framed message
struct Message {
    std::vector<uint8_t> payload;

    Message() = default;

    explicit Message(const std::string& data)
        : payload(data.begin(), data.end()) {}

    // Get payload as string
    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }

    // Serialize message to wire format
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buffer(HEADER_SIZE + payload.size());

        MessageHeader header;
        header.magic = MAGIC_BYTES;
        header.payload_size = payload.size();

        std::memcpy(buffer.data(), &header, HEADER_SIZE);
        if (!payload.empty()) {
            std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
        }

        return buffer;
    }

    // Deserialize message from wire format
    static std::optional<Message> deserialize(const uint8_t* data, size_t len) {
        auto size = get_message_size(data, len);
        if (!size || len < *size) {
            return std::nullopt;
        }

        Message msg;
        size_t payload_size = *size - HEADER_SIZE;
        if (payload_size > 0) {
            msg.payload.resize(payload_size);
            std::memcpy(msg.payload.data(), data + HEADER_SIZE, payload_size);
        }
        return msg;
    }

    // Helper to get total message size from header
    static std::optional<size_t> get_message_size(const uint8_t* data, size_t len) {
        if (len < HEADER_SIZE) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        if (header.magic != MAGIC_BYTES) {
            return std::nullopt;
        }

        if (header.payload_size > MAX_PAYLOAD_SIZE) {
            return std::nullopt;
        }

        return HEADER_SIZE + header.payload_size;
    }
};

// Request envelope
struct Request {
    std::string id;
    std::string type;                   // e.g. "memory_allocate" or "memory/allocate"
    nlohmann::json parameters = nlohmann::json::object();
    uint64_t timestamp = 0;             // Unix millis, as sent by the client

    nlohmann::json to_json() const;

    // Throws KernelError(INVALID_ARGUMENT) for a malformed envelope
    static Request from_json(const nlohmann::json& j);
};

// Response envelope
struct Response {
    std::string id;                     // Matches the request id
    bool success = false;
    nlohmann::json data;                // Payload on success
    std::optional<kernel::ErrorKind> error_kind;
    std::string error;                  // Human-readable message on failure
    uint64_t timestamp = 0;             // Unix millis

    static Response ok(const std::string& id, nlohmann::json data);
    static Response failure(const std::string& id, kernel::ErrorKind kind, const std::string& message);

    nlohmann::json to_json() const;
};

} // namespace royaos::ipc
