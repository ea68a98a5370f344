#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace xplorer::ipc
{

// Dynamic value carried in request params, response data and event data.
// Objects keep insertion order so encoded payloads are deterministic.
class Value
{
   public:
    enum class Type : uint8_t
    {
        Null   = 0,
        Bool   = 1,
        Int    = 2,
        Double = 3,
        String = 4,
        Array  = 5,
        Object = 6,
    };

    using Array  = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : type_(Type::Bool), bool_(v) {}
    Value(int v) : type_(Type::Int), int_(v) {}
    Value(int64_t v) : type_(Type::Int), int_(v) {}
    Value(uint32_t v) : type_(Type::Int), int_(v) {}
    Value(uint64_t v) : type_(Type::Int), int_(static_cast<int64_t>(v)) {}
    Value(double v) : type_(Type::Double), double_(v) {}
    Value(const char* v) : type_(Type::String), string_(v ? v : "") {}
    Value(std::string v) : type_(Type::String), string_(std::move(v)) {}

    static Value array(Array items = {});
    static Value object(Object members = {});

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_int() const { return type_ == Type::Int; }
    bool is_double() const { return type_ == Type::Double; }
    bool is_number() const { return is_int() || is_double(); }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    // Lenient accessors: a type mismatch returns the fallback.
    bool               as_bool(bool fallback = false) const;
    int64_t            as_int(int64_t fallback = 0) const;
    double             as_double(double fallback = 0.0) const;
    const std::string& as_string() const;

    const Array&  items() const { return array_; }
    Array&        items() { return array_; }
    const Object& members() const { return object_; }

    // Object access. find() returns nullptr when the key is absent or this
    // is not an object.
    const Value* find(const std::string& key) const;
    Value*       find(const std::string& key);
    bool         contains(const std::string& key) const { return find(key) != nullptr; }

    // Inserts or replaces. Converts a null value into an empty object first.
    Value& set(const std::string& key, Value v);
    bool   erase(const std::string& key);

    // Returns a shared null for missing keys.
    const Value& operator[](const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& fallback = {}) const;
    int64_t     get_int(const std::string& key, int64_t fallback = 0) const;
    bool        get_bool(const std::string& key, bool fallback = false) const;

    void push_back(Value v);
    size_t size() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // Compact JSON-like rendering for logs.
    std::string to_debug_string() const;

   private:
    Type        type_   = Type::Null;
    bool        bool_   = false;
    int64_t     int_    = 0;
    double      double_ = 0.0;
    std::string string_;
    Array       array_;
    Object      object_;
};

}   // namespace xplorer::ipc
