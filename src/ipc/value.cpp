#include "value.hpp"

#include <sstream>

namespace xplorer::ipc
{

Value Value::array(Array items)
{
    Value v;
    v.type_  = Type::Array;
    v.array_ = std::move(items);
    return v;
}

Value Value::object(Object members)
{
    Value v;
    v.type_   = Type::Object;
    v.object_ = std::move(members);
    return v;
}

bool Value::as_bool(bool fallback) const
{
    return type_ == Type::Bool ? bool_ : fallback;
}

int64_t Value::as_int(int64_t fallback) const
{
    if (type_ == Type::Int)
        return int_;
    if (type_ == Type::Double)
        return static_cast<int64_t>(double_);
    return fallback;
}

double Value::as_double(double fallback) const
{
    if (type_ == Type::Double)
        return double_;
    if (type_ == Type::Int)
        return static_cast<double>(int_);
    return fallback;
}

const std::string& Value::as_string() const
{
    static const std::string empty;
    return type_ == Type::String ? string_ : empty;
}

const Value* Value::find(const std::string& key) const
{
    if (type_ != Type::Object)
        return nullptr;
    for (const auto& [k, v] : object_)
    {
        if (k == key)
            return &v;
    }
    return nullptr;
}

Value* Value::find(const std::string& key)
{
    if (type_ != Type::Object)
        return nullptr;
    for (auto& [k, v] : object_)
    {
        if (k == key)
            return &v;
    }
    return nullptr;
}

Value& Value::set(const std::string& key, Value v)
{
    if (type_ == Type::Null)
        type_ = Type::Object;
    if (Value* existing = find(key))
    {
        *existing = std::move(v);
        return *existing;
    }
    object_.emplace_back(key, std::move(v));
    return object_.back().second;
}

bool Value::erase(const std::string& key)
{
    if (type_ != Type::Object)
        return false;
    return std::erase_if(object_, [&](const Member& m) { return m.first == key; }) > 0;
}

const Value& Value::operator[](const std::string& key) const
{
    static const Value null_value;
    const Value*       v = find(key);
    return v ? *v : null_value;
}

std::string Value::get_string(const std::string& key, const std::string& fallback) const
{
    const Value* v = find(key);
    return (v && v->is_string()) ? v->string_ : fallback;
}

int64_t Value::get_int(const std::string& key, int64_t fallback) const
{
    const Value* v = find(key);
    return v ? v->as_int(fallback) : fallback;
}

bool Value::get_bool(const std::string& key, bool fallback) const
{
    const Value* v = find(key);
    return v ? v->as_bool(fallback) : fallback;
}

void Value::push_back(Value v)
{
    if (type_ == Type::Null)
        type_ = Type::Array;
    array_.push_back(std::move(v));
}

size_t Value::size() const
{
    if (type_ == Type::Array)
        return array_.size();
    if (type_ == Type::Object)
        return object_.size();
    return 0;
}

bool Value::operator==(const Value& other) const
{
    if (type_ != other.type_)
        return false;
    switch (type_)
    {
        case Type::Null:
            return true;
        case Type::Bool:
            return bool_ == other.bool_;
        case Type::Int:
            return int_ == other.int_;
        case Type::Double:
            return double_ == other.double_;
        case Type::String:
            return string_ == other.string_;
        case Type::Array:
            return array_ == other.array_;
        case Type::Object:
            return object_ == other.object_;
    }
    return false;
}

namespace
{

void render(std::ostringstream& os, const Value& v)
{
    switch (v.type())
    {
        case Value::Type::Null:
            os << "null";
            break;
        case Value::Type::Bool:
            os << (v.as_bool() ? "true" : "false");
            break;
        case Value::Type::Int:
            os << v.as_int();
            break;
        case Value::Type::Double:
            os << v.as_double();
            break;
        case Value::Type::String:
            os << '"' << v.as_string() << '"';
            break;
        case Value::Type::Array:
        {
            os << '[';
            bool first = true;
            for (const auto& item : v.items())
            {
                if (!first)
                    os << ',';
                first = false;
                render(os, item);
            }
            os << ']';
            break;
        }
        case Value::Type::Object:
        {
            os << '{';
            bool first = true;
            for (const auto& [key, member] : v.members())
            {
                if (!first)
                    os << ',';
                first = false;
                os << '"' << key << "\":";
                render(os, member);
            }
            os << '}';
            break;
        }
    }
}

}   // namespace

std::string Value::to_debug_string() const
{
    std::ostringstream os;
    render(os, *this);
    return os.str();
}

}   // namespace xplorer::ipc
