#include "codec.hpp"

#include <cstring>

namespace xplorer::ipc
{

// ─── Little-endian helpers ───────────────────────────────────────────────────

static void write_u16_le(std::vector<uint8_t>& buf, uint16_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void write_u32_le(std::vector<uint8_t>& buf, uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static void write_u64_le(std::vector<uint8_t>& buf, uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static uint16_t read_u16_le(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0]) | static_cast<uint16_t>(p[1] << 8);
}

static uint32_t read_u32_le(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
           | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64_le(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    return v;
}

// ─── Header encode/decode ────────────────────────────────────────────────────

void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out)
{
    out.reserve(out.size() + HEADER_SIZE);
    out.push_back(MAGIC_0);
    out.push_back(MAGIC_1);
    write_u16_le(out, static_cast<uint16_t>(hdr.type));
    write_u32_le(out, hdr.payload_len);
    write_u64_le(out, hdr.seq);
}

std::optional<MessageHeader> decode_header(std::span<const uint8_t> data)
{
    if (data.size() < HEADER_SIZE)
        return std::nullopt;
    if (data[0] != MAGIC_0 || data[1] != MAGIC_1)
        return std::nullopt;

    MessageHeader hdr;
    hdr.type        = static_cast<MessageType>(read_u16_le(&data[2]));
    hdr.payload_len = read_u32_le(&data[4]);
    hdr.seq         = read_u64_le(&data[8]);
    return hdr;
}

// ─── Full message encode/decode ──────────────────────────────────────────────

std::vector<uint8_t> encode_message(const Message& msg)
{
    std::vector<uint8_t> out;
    MessageHeader        hdr = msg.header;
    hdr.payload_len          = static_cast<uint32_t>(msg.payload.size());
    encode_header(hdr, out);
    out.insert(out.end(), msg.payload.begin(), msg.payload.end());
    return out;
}

std::optional<Message> decode_message(std::span<const uint8_t> data)
{
    auto hdr_opt = decode_header(data);
    if (!hdr_opt)
        return std::nullopt;

    auto& hdr = *hdr_opt;
    if (hdr.payload_len > MAX_PAYLOAD_SIZE)
        return std::nullopt;
    if (data.size() < HEADER_SIZE + hdr.payload_len)
        return std::nullopt;

    Message msg;
    msg.header = hdr;
    msg.payload.assign(data.begin() + HEADER_SIZE, data.begin() + HEADER_SIZE + hdr.payload_len);
    return msg;
}

Message make_message(MessageType type, std::vector<uint8_t> payload)
{
    Message msg;
    msg.header.type        = type;
    msg.header.payload_len = static_cast<uint32_t>(payload.size());
    msg.payload            = std::move(payload);
    return msg;
}

// ─── PayloadEncoder ──────────────────────────────────────────────────────────

void PayloadEncoder::put_bool(uint8_t tag, bool val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 1);
    buf_.push_back(val ? 1 : 0);
}

void PayloadEncoder::put_u64(uint8_t tag, uint64_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 8);
    write_u64_le(buf_, val);
}

void PayloadEncoder::put_string(uint8_t tag, const std::string& val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

void PayloadEncoder::put_blob(uint8_t tag, const std::vector<uint8_t>& val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

// ─── PayloadDecoder ──────────────────────────────────────────────────────────

PayloadDecoder::PayloadDecoder(std::span<const uint8_t> data) : data_(data) {}

bool PayloadDecoder::next()
{
    if (pos_ == data_.size())
        return false;

    // Need at least 1 (tag) + 4 (len) bytes
    if (pos_ + 5 > data_.size())
    {
        truncated_ = true;
        return false;
    }

    tag_        = data_[pos_];
    len_        = read_u32_le(&data_[pos_ + 1]);
    val_offset_ = pos_ + 5;

    if (val_offset_ + len_ > data_.size())
    {
        truncated_ = true;
        return false;
    }

    pos_ = val_offset_ + len_;
    return true;
}

bool PayloadDecoder::as_bool() const
{
    return len_ >= 1 && data_[val_offset_] != 0;
}

uint64_t PayloadDecoder::as_u64() const
{
    if (len_ < 8)
        return 0;
    return read_u64_le(&data_[val_offset_]);
}

std::string PayloadDecoder::as_string() const
{
    return std::string(reinterpret_cast<const char*>(data_.data() + val_offset_), len_);
}

std::span<const uint8_t> PayloadDecoder::as_bytes() const
{
    return data_.subspan(val_offset_, len_);
}

// ─── Value encode/decode ─────────────────────────────────────────────────────

void encode_value(const Value& v, std::vector<uint8_t>& out)
{
    out.push_back(static_cast<uint8_t>(v.type()));
    switch (v.type())
    {
        case Value::Type::Null:
            break;
        case Value::Type::Bool:
            out.push_back(v.as_bool() ? 1 : 0);
            break;
        case Value::Type::Int:
            write_u64_le(out, static_cast<uint64_t>(v.as_int()));
            break;
        case Value::Type::Double:
        {
            double   d    = v.as_double();
            uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof(bits));
            write_u64_le(out, bits);
            break;
        }
        case Value::Type::String:
        {
            const auto& s = v.as_string();
            write_u32_le(out, static_cast<uint32_t>(s.size()));
            out.insert(out.end(), s.begin(), s.end());
            break;
        }
        case Value::Type::Array:
            write_u32_le(out, static_cast<uint32_t>(v.items().size()));
            for (const auto& item : v.items())
                encode_value(item, out);
            break;
        case Value::Type::Object:
            write_u32_le(out, static_cast<uint32_t>(v.members().size()));
            for (const auto& [key, member] : v.members())
            {
                write_u32_le(out, static_cast<uint32_t>(key.size()));
                out.insert(out.end(), key.begin(), key.end());
                encode_value(member, out);
            }
            break;
    }
}

std::vector<uint8_t> encode_value(const Value& v)
{
    std::vector<uint8_t> out;
    encode_value(v, out);
    return out;
}

namespace
{

class ValueReader
{
   public:
    explicit ValueReader(std::span<const uint8_t> data) : data_(data) {}

    bool at_end() const { return pos_ == data_.size(); }

    bool read(Value& out, size_t depth)
    {
        if (depth > MAX_VALUE_DEPTH)
            return false;

        uint8_t type_byte = 0;
        if (!read_u8(type_byte))
            return false;

        switch (static_cast<Value::Type>(type_byte))
        {
            case Value::Type::Null:
                out = Value();
                return true;
            case Value::Type::Bool:
            {
                uint8_t b = 0;
                if (!read_u8(b))
                    return false;
                out = Value(b != 0);
                return true;
            }
            case Value::Type::Int:
            {
                uint64_t raw = 0;
                if (!read_u64(raw))
                    return false;
                out = Value(static_cast<int64_t>(raw));
                return true;
            }
            case Value::Type::Double:
            {
                uint64_t raw = 0;
                if (!read_u64(raw))
                    return false;
                double d = 0.0;
                std::memcpy(&d, &raw, sizeof(d));
                out = Value(d);
                return true;
            }
            case Value::Type::String:
            {
                std::string s;
                if (!read_string(s))
                    return false;
                out = Value(std::move(s));
                return true;
            }
            case Value::Type::Array:
            {
                uint32_t count = 0;
                if (!read_u32(count))
                    return false;
                // Every element needs at least its type byte
                if (count > data_.size() - pos_)
                    return false;
                Value::Array items;
                items.reserve(count);
                for (uint32_t i = 0; i < count; ++i)
                {
                    Value item;
                    if (!read(item, depth + 1))
                        return false;
                    items.push_back(std::move(item));
                }
                out = Value::array(std::move(items));
                return true;
            }
            case Value::Type::Object:
            {
                uint32_t count = 0;
                if (!read_u32(count))
                    return false;
                if (count > data_.size() - pos_)
                    return false;
                Value::Object members;
                members.reserve(count);
                for (uint32_t i = 0; i < count; ++i)
                {
                    std::string key;
                    Value       member;
                    if (!read_string(key) || !read(member, depth + 1))
                        return false;
                    members.emplace_back(std::move(key), std::move(member));
                }
                out = Value::object(std::move(members));
                return true;
            }
        }
        return false;
    }

   private:
    bool read_u8(uint8_t& v)
    {
        if (pos_ + 1 > data_.size())
            return false;
        v = data_[pos_++];
        return true;
    }

    bool read_u32(uint32_t& v)
    {
        if (pos_ + 4 > data_.size())
            return false;
        v = read_u32_le(&data_[pos_]);
        pos_ += 4;
        return true;
    }

    bool read_u64(uint64_t& v)
    {
        if (pos_ + 8 > data_.size())
            return false;
        v = read_u64_le(&data_[pos_]);
        pos_ += 8;
        return true;
    }

    bool read_string(std::string& s)
    {
        uint32_t len = 0;
        if (!read_u32(len) || len > data_.size() - pos_)
            return false;
        s.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

}   // namespace

std::optional<Value> decode_value(std::span<const uint8_t> data)
{
    ValueReader reader(data);
    Value       v;
    if (!reader.read(v, 0) || !reader.at_end())
        return std::nullopt;
    return v;
}

// ─── Channel payload encode/decode ───────────────────────────────────────────

std::vector<uint8_t> encode_request(const Request& r)
{
    PayloadEncoder enc;
    enc.put_string(TAG_ID, r.id);
    enc.put_string(TAG_ACTION, r.action);
    enc.put_blob(TAG_PARAMS, encode_value(r.params));
    return enc.take();
}

std::optional<Request> decode_request(std::span<const uint8_t> data)
{
    Request        r;
    bool           has_id = false;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_ID:
                r.id   = dec.as_string();
                has_id = true;
                break;
            case TAG_ACTION:
                r.action = dec.as_string();
                break;
            case TAG_PARAMS:
            {
                auto v = decode_value(dec.as_bytes());
                if (!v)
                    return std::nullopt;
                r.params = std::move(*v);
                break;
            }
            default:
                break;   // skip unknown tags (forward compat)
        }
    }
    if (dec.truncated() || !has_id || r.action.empty())
        return std::nullopt;
    return r;
}

std::vector<uint8_t> encode_response(const Response& r)
{
    PayloadEncoder enc;
    enc.put_string(TAG_ID, r.id);
    enc.put_bool(TAG_SUCCESS, r.success);
    if (r.success)
    {
        enc.put_blob(TAG_DATA, encode_value(r.data));
    }
    else
    {
        enc.put_string(TAG_ERROR_CODE, r.error.code);
        enc.put_string(TAG_ERROR_MESSAGE, r.error.message);
        if (!r.error.details.is_null())
            enc.put_blob(TAG_ERROR_DETAILS, encode_value(r.error.details));
    }
    return enc.take();
}

std::optional<Response> decode_response(std::span<const uint8_t> data)
{
    Response       r;
    bool           has_id = false;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_ID:
                r.id   = dec.as_string();
                has_id = true;
                break;
            case TAG_SUCCESS:
                r.success = dec.as_bool();
                break;
            case TAG_DATA:
            case TAG_ERROR_DETAILS:
            {
                auto v = decode_value(dec.as_bytes());
                if (!v)
                    return std::nullopt;
                if (dec.tag() == TAG_DATA)
                    r.data = std::move(*v);
                else
                    r.error.details = std::move(*v);
                break;
            }
            case TAG_ERROR_CODE:
                r.error.code = dec.as_string();
                break;
            case TAG_ERROR_MESSAGE:
                r.error.message = dec.as_string();
                break;
            default:
                break;
        }
    }
    if (dec.truncated() || !has_id)
        return std::nullopt;
    return r;
}

std::vector<uint8_t> encode_event(const Event& e)
{
    PayloadEncoder enc;
    enc.put_string(TAG_EVENT_TYPE, e.type);
    enc.put_string(TAG_EVENT_PATH, e.path);
    enc.put_blob(TAG_EVENT_DATA, encode_value(e.data));
    enc.put_u64(TAG_TIMESTAMP, static_cast<uint64_t>(e.timestamp));
    return enc.take();
}

std::optional<Event> decode_event(std::span<const uint8_t> data)
{
    Event          e;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_EVENT_TYPE:
                e.type = dec.as_string();
                break;
            case TAG_EVENT_PATH:
                e.path = dec.as_string();
                break;
            case TAG_EVENT_DATA:
            {
                auto v = decode_value(dec.as_bytes());
                if (!v)
                    return std::nullopt;
                e.data = std::move(*v);
                break;
            }
            case TAG_TIMESTAMP:
                e.timestamp = static_cast<int64_t>(dec.as_u64());
                break;
            default:
                break;
        }
    }
    if (dec.truncated() || e.type.empty())
        return std::nullopt;
    return e;
}

std::vector<uint8_t> encode_topic(const std::string& topic)
{
    PayloadEncoder enc;
    enc.put_string(TAG_TOPIC, topic);
    return enc.take();
}

std::optional<std::string> decode_topic(std::span<const uint8_t> data)
{
    std::optional<std::string> topic;
    PayloadDecoder             dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_TOPIC)
            topic = dec.as_string();
    }
    if (dec.truncated())
        return std::nullopt;
    return topic;
}

// ─── Error kinds ─────────────────────────────────────────────────────────────

const char* error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::None:
            return "None";
        case ErrorKind::RequestTimeout:
            return "RequestTimeout";
        case ErrorKind::ConnectionClosed:
            return "ConnectionClosed";
        case ErrorKind::BackendError:
            return "BackendError";
        case ErrorKind::InvalidTransfer:
            return "InvalidTransfer";
    }
    return "Unknown";
}

}   // namespace xplorer::ipc
