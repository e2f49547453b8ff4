/**
 * caserun Wire Protocol
 *
 * Binary framing between caserund and its API-layer clients.
 * Header: 17 bytes (magic + client_id + opcode + payload_size), followed by
 * a JSON payload. Replies reuse the request opcode; STREAM_EVENT frames are
 * pushed unsolicited to connections attached to an execution.
 */
#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <optional>

namespace caserun::ipc {

constexpr uint32_t MAGIC_BYTES = 0x4E555243; // "CRUN" little-endian
constexpr size_t HEADER_SIZE = 17;
constexpr size_t MAX_PAYLOAD_SIZE = 1024 * 1024; // 1MB max

enum class Opcode : uint8_t {
    NOOP = 0x00,  // Echo
    // Sessions
    SESSION_CREATE      = 0x10,
    SESSION_GET         = 0x11,
    SESSION_PAUSE       = 0x12,
    SESSION_RESUME      = 0x13,
    SESSION_EXTEND      = 0x14,
    SESSION_TERMINATE   = 0x15,
    SESSION_FILES       = 0x16,  // Original and modified slots
    SESSION_UPDATE_FILE = 0x17,
    SESSION_RESET_FILES = 0x18,
    // Executions
    EXEC_START  = 0x20,  // Returns the execution id at once
    EXEC_GET    = 0x21,  // Poll
    EXEC_CANCEL = 0x22,
    EXEC_LIST   = 0x23,  // History of one session
    EXEC_ATTACH = 0x24,  // Subscribe this connection to the stream
    STREAM_EVENT = 0x25, // Server push
    EXEC_DETACH = 0x26,
    // Observability
    POOL_STATS = 0x30,
    AUDIT_LOG  = 0x40,
    EXIT = 0xFF  // Close this connection
};

// Wire protocol header (17 bytes, packed)
struct __attribute__((packed)) MessageHeader {
    uint32_t magic;         // Must be MAGIC_BYTES
    uint32_t client_id;     // Assigned by the server per connection
    Opcode opcode;
    uint64_t payload_size;  // Bytes following this header
};

static_assert(sizeof(MessageHeader) == HEADER_SIZE, "Header size mismatch");

struct Message {
    uint32_t client_id;
    Opcode opcode;
    std::vector<uint8_t> payload;

    Message() : client_id(0), opcode(Opcode::NOOP) {}

    Message(uint32_t id, Opcode op, const std::vector<uint8_t>& data = {})
        : client_id(id), opcode(op), payload(data) {}

    Message(uint32_t id, Opcode op, const std::string& data)
        : client_id(id), opcode(op), payload(data.begin(), data.end()) {}

    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }

    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buffer(HEADER_SIZE + payload.size());

        MessageHeader header;
        header.magic = MAGIC_BYTES;
        header.client_id = client_id;
        header.opcode = opcode;
        header.payload_size = payload.size();

        std::memcpy(buffer.data(), &header, HEADER_SIZE);
        if (!payload.empty()) {
            std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
        }
        return buffer;
    }

    // nullopt on short input, bad magic or oversized payload
    static std::optional<Message> deserialize(const uint8_t* data, size_t len) {
        auto total = get_message_size(data, len);
        if (!total || len < *total) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        Message msg;
        msg.client_id = header.client_id;
        msg.opcode = header.opcode;
        if (header.payload_size > 0) {
            msg.payload.resize(header.payload_size);
            std::memcpy(msg.payload.data(), data + HEADER_SIZE, header.payload_size);
        }
        return msg;
    }

    // Total frame size once a header is available
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

    // A full header is present but can never become a valid frame
    static bool header_invalid(const uint8_t* data, size_t len) {
        return len >= HEADER_SIZE && !get_message_size(data, len);
    }
};

inline const char* opcode_to_string(Opcode op) {
    switch (op) {
        case Opcode::NOOP:                return "NOOP";
        case Opcode::SESSION_CREATE:      return "SESSION_CREATE";
        case Opcode::SESSION_GET:         return "SESSION_GET";
        case Opcode::SESSION_PAUSE:       return "SESSION_PAUSE";
        case Opcode::SESSION_RESUME:      return "SESSION_RESUME";
        case Opcode::SESSION_EXTEND:      return "SESSION_EXTEND";
        case Opcode::SESSION_TERMINATE:   return "SESSION_TERMINATE";
        case Opcode::SESSION_FILES:       return "SESSION_FILES";
        case Opcode::SESSION_UPDATE_FILE: return "SESSION_UPDATE_FILE";
        case Opcode::SESSION_RESET_FILES: return "SESSION_RESET_FILES";
        case Opcode::EXEC_START:          return "EXEC_START";
        case Opcode::EXEC_GET:            return "EXEC_GET";
        case Opcode::EXEC_CANCEL:         return "EXEC_CANCEL";
        case Opcode::EXEC_LIST:           return "EXEC_LIST";
        case Opcode::EXEC_ATTACH:         return "EXEC_ATTACH";
        case Opcode::STREAM_EVENT:        return "STREAM_EVENT";
        case Opcode::EXEC_DETACH:         return "EXEC_DETACH";
        case Opcode::POOL_STATS:          return "POOL_STATS";
        case Opcode::AUDIT_LOG:           return "AUDIT_LOG";
        case Opcode::EXIT:                return "EXIT";
        default: return "UNKNOWN";
    }
}

} // namespace caserun::ipc
