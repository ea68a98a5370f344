#pragma once

#include "message.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace xplorer::ipc
{

// ─── Header serialization ────────────────────────────────────────────────────

// Encode header into exactly HEADER_SIZE bytes (appended to `out`).
void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out);

// Returns std::nullopt if magic bytes are wrong or buffer too small.
std::optional<MessageHeader> decode_header(std::span<const uint8_t> data);

// ─── Full message serialization ──────────────────────────────────────────────

std::vector<uint8_t>   encode_message(const Message& msg);
std::optional<Message> decode_message(std::span<const uint8_t> data);

// ─── Payload serialization (TLV) ─────────────────────────────────────────────
// Format for each field: [tag: uint8_t] [len: uint32_t LE] [data: len bytes]

class PayloadEncoder
{
   public:
    void put_bool(uint8_t tag, bool val);
    void put_u64(uint8_t tag, uint64_t val);
    void put_string(uint8_t tag, const std::string& val);
    void put_blob(uint8_t tag, const std::vector<uint8_t>& val);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    std::vector<uint8_t> buf_;
};

class PayloadDecoder
{
   public:
    explicit PayloadDecoder(std::span<const uint8_t> data);

    // Advance to the next field. Returns false when no more fields.
    bool next();

    // True when next() stopped because a field overran the buffer.
    bool truncated() const { return truncated_; }

    uint8_t  tag() const { return tag_; }
    uint32_t field_len() const { return len_; }

    bool                     as_bool() const;
    uint64_t                 as_u64() const;
    std::string              as_string() const;
    std::span<const uint8_t> as_bytes() const;

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_        = 0;
    uint8_t                  tag_        = 0;
    uint32_t                 len_        = 0;
    size_t                   val_offset_ = 0;
    bool                     truncated_  = false;
};

// ─── Value serialization ─────────────────────────────────────────────────────
// [type u8] followed by a type-specific body; containers carry a u32 count.

static constexpr size_t MAX_VALUE_DEPTH = 64;

void                 encode_value(const Value& v, std::vector<uint8_t>& out);
std::vector<uint8_t> encode_value(const Value& v);

// Returns std::nullopt on truncation, unknown type bytes, trailing garbage
// or nesting deeper than MAX_VALUE_DEPTH.
std::optional<Value> decode_value(std::span<const uint8_t> data);

// ─── Field tags ──────────────────────────────────────────────────────────────

static constexpr uint8_t TAG_ID            = 0x01;
static constexpr uint8_t TAG_ACTION        = 0x02;
static constexpr uint8_t TAG_PARAMS        = 0x03;
static constexpr uint8_t TAG_SUCCESS       = 0x10;
static constexpr uint8_t TAG_DATA          = 0x11;
static constexpr uint8_t TAG_ERROR_CODE    = 0x12;
static constexpr uint8_t TAG_ERROR_MESSAGE = 0x13;
static constexpr uint8_t TAG_ERROR_DETAILS = 0x14;
static constexpr uint8_t TAG_EVENT_TYPE    = 0x20;
static constexpr uint8_t TAG_EVENT_PATH    = 0x21;
static constexpr uint8_t TAG_EVENT_DATA    = 0x22;
static constexpr uint8_t TAG_TIMESTAMP     = 0x23;
static constexpr uint8_t TAG_TOPIC         = 0x30;

// ─── Channel payloads ────────────────────────────────────────────────────────

std::vector<uint8_t>   encode_request(const Request& r);
std::optional<Request> decode_request(std::span<const uint8_t> data);

std::vector<uint8_t>    encode_response(const Response& r);
std::optional<Response> decode_response(std::span<const uint8_t> data);

std::vector<uint8_t> encode_event(const Event& e);
std::optional<Event> decode_event(std::span<const uint8_t> data);

std::vector<uint8_t>       encode_topic(const std::string& topic);
std::optional<std::string> decode_topic(std::span<const uint8_t> data);

// Frames a payload into a Message of the given type.
Message make_message(MessageType type, std::vector<uint8_t> payload);

}   // namespace xplorer::ipc
