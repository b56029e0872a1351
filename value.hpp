/**
 * @file value.hpp
 * @brief The raw map domain that typed instances are projected onto
 *
 * Everything in here is immutable and structurally shared. Collections are
 * immer containers of boxed values, so copying a Value, a Map or any nested
 * collection is a reference count bump and never a deep copy.
 *
 * The supported shapes are the ones the EDN codec can read and write:
 *   - nil, booleans, 64-bit integers, doubles, strings
 *   - keywords (":name") and instants ("#inst")
 *   - vectors, sets and maps of values
 *   - tagged literals the codec does not know about
 *
 * A Map additionally carries a metadata map. Metadata is a side channel: it
 * never takes part in equality or hashing and is replaced, not merged, on write.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/set.hpp>
#include <immer/vector.hpp>

namespace dynobj
{
struct Value;

/// Hashes the boxed value (not the box address) so equal values collide
struct BoxHash
{
    std::size_t operator()(immer::box<Value> const& boxed) const;
};

using ValueBox    = immer::box<Value>;
using ValueMap    = immer::map<ValueBox, ValueBox, BoxHash>;
using ValueVector = immer::vector<ValueBox>;
using ValueSet    = immer::set<ValueBox, BoxHash>;

/// Millisecond precision, which is what "#inst" literals carry
using Instant = std::chrono::sys_time<std::chrono::milliseconds>;

/// Metadata key under which a map remembers the schema it was built for
inline constexpr std::string_view kTypeMetaKey = "type";

struct Keyword
{
    std::string name;

    friend bool operator==(Keyword const&, Keyword const&) = default;
    friend auto operator<=>(Keyword const&, Keyword const&) = default;
};

/// "name"_kw creates the keyword :name
inline Keyword operator""_kw(char const* str, std::size_t len) { return Keyword { std::string(str, len) }; }

/**
 * @brief Immutable key/value map with an independent metadata map
 *
 * Every operation that "modifies" the map returns a new Map and leaves the
 * receiver untouched. Lookups of absent keys yield nil.
 */
class Map
{
public:
    Map() = default;
    explicit Map(ValueMap items_, ValueMap meta_ = {});

    ValueMap const& entries() const noexcept { return items; }
    ValueMap const& metadata() const noexcept { return metaItems; }

    std::size_t size() const noexcept { return items.size(); }
    bool empty() const noexcept { return items.empty(); }

    bool contains(Value const& key) const;

    /// Returns nullptr if the key is absent
    Value const* find(Value const& key) const;

    /// Returns nil if the key is absent
    Value get(Value const& key) const;

    /// Insert-or-replace; the metadata is carried over unchanged
    Map assoc(Value const& key, Value const& value) const;

    Map dissoc(Value const& key) const;

    /// Returns nil if the metadata key is absent
    Value meta(Value const& key) const;

    Map withMeta(Value const& key, Value const& value) const;

    /// The schema type key stored under the ":type" metadata key, if any
    std::optional<std::string> typeKey() const;
    Map withTypeKey(std::string const& key) const;

    friend bool operator==(Map const& a, Map const& b);

private:
    ValueMap items;
    ValueMap metaItems;
};

/// A tagged literal the codec has no reader for, e.g. #uuid "..."
struct Tagged
{
    std::string tag;
    ValueBox value;

    friend bool operator==(Tagged const& a, Tagged const& b);
};

/**
 * @brief A single raw value of the map domain
 *
 * Value is a thin wrapper around a std::variant. The implicit constructors
 * exist so that literals can be used wherever a Value is expected:
 *
 * @code
 * auto m = Map().assoc("name"_kw, "Alice").assoc("age"_kw, 42);
 * @endcode
 */
struct Value
{
    using Data = std::variant<std::monostate,
                              bool,
                              std::int64_t,
                              double,
                              std::string,
                              Keyword,
                              Instant,
                              ValueVector,
                              ValueSet,
                              Map,
                              Tagged>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data(b) {}
    Value(int i) : data(static_cast<std::int64_t>(i)) {}
    Value(std::int64_t i) : data(i) {}
    Value(double d) : data(d) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(char const* s) : data(std::string(s)) {}
    Value(Keyword k) : data(std::move(k)) {}
    Value(Instant t) : data(t) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueSet s) : data(std::move(s)) {}
    Value(Map m) : data(std::move(m)) {}
    Value(Tagged t) : data(std::move(t)) {}

    bool isNil() const noexcept { return std::holds_alternative<std::monostate>(data); }

    template <typename T>
    bool is() const noexcept { return std::holds_alternative<T>(data); }

    template <typename T>
    T const* getIf() const noexcept { return std::get_if<T>(&data); }

    /// Human readable name of the runtime shape ("integer", "map", ...)
    std::string_view shape() const noexcept;

    friend bool operator==(Value const& a, Value const& b);

    Data data;
};

std::size_t hashValue(Value const& value);

//=============================================================================
// Persistent map primitives
//=============================================================================

/**
 * @brief Three-way decomposition of two maps
 *
 * onlyA holds the entries of a that are absent from b or carry a different
 * value there, onlyB the same the other way round, and shared the entries
 * that are equal in both. None of the three carries metadata.
 */
struct MapDiff
{
    Map onlyA;
    Map onlyB;
    Map shared;
};

MapDiff diff(Map const& a, Map const& b);

/**
 * @brief Folds b into a
 *
 * Keys present only in b are inserted as-is, keys present in both are
 * replaced by fn(valueInA, valueInB). The result keeps a's metadata.
 */
Map mergeWith(std::function<Value(Value const&, Value const&)> const& fn, Map const& a, Map const& b);

//=============================================================================
// Instants
//=============================================================================

/**
 * @brief Parses RFC 3339 timestamps as used by #inst, e.g. "1985-04-12T23:20:50.52Z".
 *
 * Years outside 0000-9999 use the expanded form with a sign and up to five
 * digits, e.g. "+10000-01-01T00:00:00Z" or "-0001-12-31".
 */
std::optional<Instant> parseInstant(std::string_view text);

/// Canonical form "1985-04-12T23:20:50.520-00:00". Throws std::out_of_range
/// for instants beyond the years -32767 to 32767.
std::string formatInstant(Instant instant);
} // namespace dynobj

template <>
struct std::hash<dynobj::Value>
{
    std::size_t operator()(dynobj::Value const& v) const { return dynobj::hashValue(v); }
};
