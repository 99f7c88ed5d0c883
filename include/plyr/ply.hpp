#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace plyr {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    InvalidInput,
    InvalidHeader,
    DuplicateElement,
    DuplicateProperty,
    PropertyBeforeElement,
    MissingFormat,
    MalformedRecord,
    UnexpectedEof,
    ZlibError,
    NotFound,
};

std::string to_string(ErrorKind k);

class PlyError : public std::runtime_error {
public:
    PlyError(ErrorKind k, const std::string& cause);
    PlyError(ErrorKind k, const std::string& cause, std::optional<std::size_t> line, std::string text);

    ErrorKind kind() const noexcept;
    // 1-based line number of the offending header or ASCII record line, when known.
    std::optional<std::size_t> line() const noexcept;
    const std::string& text() const noexcept;
    const std::string& cause() const noexcept;

private:
    ErrorKind kind_;
    std::optional<std::size_t> line_;
    std::string text_;
    std::string cause_;
};

// ------------------------------
// Type model
// ------------------------------

struct Version {
    std::uint32_t major{1};
    std::uint32_t minor{0};

    bool operator==(const Version&) const = default;
};

enum class Encoding {
    Ascii,
    BinaryBigEndian,
    BinaryLittleEndian,
};

std::string to_string(Encoding e);

enum class ScalarType {
    Char,
    UChar,
    Short,
    UShort,
    Int,
    UInt,
    Float,
    Double,
};

struct ScalarTypeInfo {
    ScalarType type;
    std::string_view name;  // canonical header token
    std::string_view alias; // sized spelling, also accepted by the grammar
    std::size_t width;      // bytes in a binary payload
};

inline constexpr std::array<ScalarTypeInfo, 8> kScalarTypes = {{
    {ScalarType::Char,   "char",   "int8",    1},
    {ScalarType::UChar,  "uchar",  "uint8",   1},
    {ScalarType::Short,  "short",  "int16",   2},
    {ScalarType::UShort, "ushort", "uint16",  2},
    {ScalarType::Int,    "int",    "int32",   4},
    {ScalarType::UInt,   "uint",   "uint32",  4},
    {ScalarType::Float,  "float",  "float32", 4},
    {ScalarType::Double, "double", "float64", 8},
}};

const ScalarTypeInfo& scalar_type_info(ScalarType t);
std::string to_string(ScalarType t);
std::size_t byte_width(ScalarType t);
std::optional<ScalarType> scalar_type_from_string(std::string_view s);

struct ListType {
    ScalarType index_type{ScalarType::UChar};
    ScalarType value_type{ScalarType::Int};

    bool operator==(const ListType&) const = default;
};

using PropertyType = std::variant<ScalarType, ListType>;

std::string to_string(const PropertyType& t);

struct PropertyDef {
    std::string name{};
    PropertyType type{ScalarType::Float};

    bool operator==(const PropertyDef&) const = default;
};

// String-keyed container that keeps insertion order and refuses duplicate keys.
template <typename T>
class OrderedMap {
public:
    using value_type = std::pair<std::string, T>;
    using const_iterator = typename std::vector<value_type>::const_iterator;
    using iterator = typename std::vector<value_type>::iterator;

    // Returns false (and leaves the map untouched) when the key already exists.
    bool insert(std::string key, T value) {
        if (index_.count(key) != 0) return false;
        index_.emplace(key, entries_.size());
        entries_.emplace_back(std::move(key), std::move(value));
        return true;
    }

    bool contains(const std::string& key) const { return index_.count(key) != 0; }

    T* find(const std::string& key) {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    const T* find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    const T& at(const std::string& key) const {
        const T* v = find(key);
        if (!v) throw PlyError(ErrorKind::NotFound, "key not found: '" + key + "'");
        return *v;
    }

    T& value_at(std::size_t i) { return entries_.at(i).second; }
    const T& value_at(std::size_t i) const { return entries_.at(i).second; }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const OrderedMap& o) const { return entries_ == o.entries_; }

private:
    std::vector<value_type> entries_{};
    std::map<std::string, std::size_t> index_{};
};

struct ElementDef {
    std::string name{};
    std::uint64_t count{0};
    OrderedMap<PropertyDef> properties{};

    bool operator==(const ElementDef&) const = default;
};

struct Header {
    Encoding encoding{Encoding::Ascii};
    Version version{};
    std::vector<std::string> obj_infos{};
    std::vector<std::string> comments{};
    OrderedMap<ElementDef> elements{};

    bool operator==(const Header&) const = default;
};

// ------------------------------
// Decoded values
// ------------------------------

using ScalarValue = std::variant<
    std::int8_t,
    std::uint8_t,
    std::int16_t,
    std::uint16_t,
    std::int32_t,
    std::uint32_t,
    float,
    double
>;

using ListValue = std::variant<
    std::vector<std::int8_t>,
    std::vector<std::uint8_t>,
    std::vector<std::int16_t>,
    std::vector<std::uint16_t>,
    std::vector<std::int32_t>,
    std::vector<std::uint32_t>,
    std::vector<float>,
    std::vector<double>
>;

using Property = std::variant<ScalarValue, ListValue>;

/// Capability an element representation implements so the decoders can fill it
/// without knowing its shape. Values arrive in declared property order.
class PropertyAccess {
public:
    virtual ~PropertyAccess() = default;

    virtual void set_scalar(const std::string& name, ScalarValue value) = 0;
    virtual void set_list(const std::string& name, ListValue value) = 0;
};

/// Schema-agnostic representation: property name -> decoded value.
class DefaultElement : public PropertyAccess {
public:
    using Map = std::map<std::string, Property>;

    void set_scalar(const std::string& name, ScalarValue value) override;
    void set_list(const std::string& name, ListValue value) override;

    bool contains(const std::string& name) const;
    const ScalarValue& scalar(const std::string& name) const;
    const ListValue& list(const std::string& name) const;
    const Map& properties() const noexcept;

    bool operator==(const DefaultElement& o) const { return props_ == o.props_; }

private:
    Map props_{};
};

template <typename E>
using Payload = OrderedMap<std::vector<E>>;

template <typename E>
struct Ply {
    Header header{};
    Payload<E> payload{};
};

// ------------------------------
// Options
// ------------------------------

enum class TrailingTokens {
    Tolerate,
    Reject,
};

struct ReadOptions {
    TrailingTokens trailing_tokens{TrailingTokens::Tolerate};
    bool decompress{true}; // inflate gzip files opened by path
};

// ------------------------------
// API
// ------------------------------

/// Read and validate the header of a file without touching the payload.
Header read_header_only(
    const std::filesystem::path& file,
    const ReadOptions& opts = ReadOptions{}
);

/// Emit the canonical header text for `h`, `end_header` line included.
void write_header(std::ostream& os, const Header& h);
std::string to_string(const Header& h);

} // namespace plyr
