#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "value.hpp"

namespace xplorer::ipc
{

// ─── Message types ───────────────────────────────────────────────────────────
enum class MessageType : uint16_t
{
    // Request channel
    REQUEST  = 0x0010,
    RESPONSE = 0x0011,

    // Event channel
    EVENT       = 0x0020,
    SUBSCRIBE   = 0x0030,
    UNSUBSCRIBE = 0x0031,
};

// ─── Message envelope ────────────────────────────────────────────────────────
// Wire format: [Header (fixed 16 bytes)] [payload (variable)]
//
// Header layout:
//   bytes 0-1:   magic (0x58, 0x50 = "XP")
//   bytes 2-3:   message type (uint16_t LE)
//   bytes 4-7:   payload length (uint32_t LE)
//   bytes 8-15:  sequence number (uint64_t LE)

static constexpr uint8_t MAGIC_0          = 0x58;   // 'X'
static constexpr uint8_t MAGIC_1          = 0x50;   // 'P'
static constexpr size_t  HEADER_SIZE      = 16;
static constexpr size_t  MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;   // 16 MiB

struct MessageHeader
{
    MessageType type        = MessageType::REQUEST;
    uint32_t    payload_len = 0;
    uint64_t    seq         = 0;
};

struct Message
{
    MessageHeader        header;
    std::vector<uint8_t> payload;
};

// ─── Request channel payloads ────────────────────────────────────────────────

struct Request
{
    std::string id;
    std::string action;   // e.g. "fs.list", "cancel"
    Value       params;
};

struct ResponseError
{
    std::string code;   // e.g. "PATH_NOT_FOUND"
    std::string message;
    Value       details;
};

struct Response
{
    std::string   id;
    bool          success = false;
    Value         data;
    ResponseError error;
};

// ─── Event channel payloads ──────────────────────────────────────────────────

struct Event
{
    std::string type;   // e.g. "fs.changed"
    std::string path;   // entry that changed; matched against subscribed topics
    Value       data;
    int64_t     timestamp = 0;
};

// ─── Backend error codes ─────────────────────────────────────────────────────

namespace error_code
{
inline constexpr const char* PATH_NOT_FOUND      = "PATH_NOT_FOUND";
inline constexpr const char* ACCESS_DENIED       = "ACCESS_DENIED";
inline constexpr const char* FILE_EXISTS         = "FILE_EXISTS";
inline constexpr const char* DIRECTORY_NOT_EMPTY = "DIRECTORY_NOT_EMPTY";
inline constexpr const char* INVALID_PATH        = "INVALID_PATH";
inline constexpr const char* DISK_FULL           = "DISK_FULL";
inline constexpr const char* OPERATION_CANCELLED = "OPERATION_CANCELLED";
inline constexpr const char* OPERATION_FAILED    = "OPERATION_FAILED";
inline constexpr const char* CONNECTION_FAILED   = "CONNECTION_FAILED";
inline constexpr const char* TIMEOUT             = "TIMEOUT";
inline constexpr const char* INVALID_REQUEST     = "INVALID_REQUEST";
inline constexpr const char* UNKNOWN             = "UNKNOWN";
}   // namespace error_code

// ─── Shell-side failure classification ───────────────────────────────────────

enum class ErrorKind : uint8_t
{
    None = 0,
    RequestTimeout,     // no response within the deadline
    ConnectionClosed,   // bridge disconnected before the response arrived
    BackendError,       // response arrived with success = false
    InvalidTransfer,    // rejected locally before any request was issued
};

const char* error_kind_name(ErrorKind kind);

// Outcome handed to request callbacks. Exactly one is delivered per request.
struct RequestResult
{
    ErrorKind   kind = ErrorKind::None;
    Response    response;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    // Backend error code when kind == BackendError, empty otherwise.
    const std::string& backend_code() const { return response.error.code; }
};

}   // namespace xplorer::ipc
