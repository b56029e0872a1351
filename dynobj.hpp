/**
 * @file dynobj.hpp
 * @brief Typed, immutable views over EDN-style maps
 *
 * A schema is an aggregate struct whose members are accessor declarations.
 * Each member wraps the declared C++ type and the key it is stored under:
 *
 *   struct Person {
 *       Required<std::string, "name"> name;     // getter that must resolve to a value
 *       Field<std::int32_t, "age">    age;      // getter returning std::optional<int32_t>
 *       Meta<std::string, "source">   source;   // metadata getter
 *
 *       std::string greeting() const { return "Hi " + name(); }  // default-bodied
 *   };
 *
 * An Instance<Person> is backed by an immutable dynobj::Map. Reading a field
 * converts the raw map entry to the declared type and caches the result;
 * "modifying" an instance returns a new one:
 *
 *   auto alice = Instance<Person>().with("name"_fld, "Alice");
 *   auto older = alice.with("age"_fld, 31);
 *   older->age();          // std::optional<int32_t>(31)
 *   alice("age"_fld)();    // std::nullopt, alice itself is unchanged
 *
 * Every operation is also reachable dynamically through Object::invoke() with
 * a method name and type-erased arguments.
 */

#pragma once

#include <any>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <format>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>
#include <fixed_string.hpp>
#include <CxxUtilities.hpp>
#include "value.hpp"
#include "edn.hpp"
#include "dynobj_detail.hpp"

namespace dynobj
{
/**
 * @brief Compile-time string wrapper for use with the "_fld" literal
 *
 * @tparam S The compile-time fixed string representing the field name
 *
 * @see operator""_fld
 */
template <fixstr::fixed_string S>
struct CompileTimeString { static constexpr auto value = S; };

/// Whether a null resolution of a field getter is an error
enum class Presence { optional, required };

/// Which map of the instance an accessor reads and writes
enum class Channel { data, metadata };

// Forward declarations
class Object;
class SchemaDescriptor;
class TypeDescriptor;
class ValueCache;

namespace detail { struct State; }

/**
 * @brief Describes a single accessor of a schema
 *
 * The TypeDescriptor is obtained lazily through a function pointer, so
 * schemas may refer to each other (or to themselves) through nested
 * Instance<> members without static initialization order issues.
 */
struct FieldDescriptor
{
    std::string_view name;
    Presence presence;
    Channel channel;
    TypeDescriptor const& (*type)();

    /// Position of the accessor within the schema, also its ValueCache slot
    std::size_t slot;

    bool isRequired() const noexcept { return presence == Presence::required; }
    bool isMetadata() const noexcept { return channel == Channel::metadata; }

    /// The map key the field is stored under (":name" for data, "name" for metadata)
    Value key() const;
};

//=============================================================================
// Errors
//=============================================================================

/// A required field getter resolved to nothing
class RequiredFieldMissing : public std::runtime_error
{
public:
    explicit RequiredFieldMissing(std::string fieldname);

    std::string const& field() const noexcept { return fieldName; }

private:
    std::string fieldName;
};

/// One field (or element of a field) whose value is not of the declared type
struct Mismatch
{
    /// Field name, with an index path for elements: "ints[1]", "ages[:bob]"
    std::string field;
    std::string actual;
    std::string expected;

    /// Non-empty if a nested instance failed its own validation
    std::string reason;
};

/// Faults collected while validating; becomes a ValidationFailed if non-empty
struct ValidationFaults
{
    std::vector<std::string> missing;
    std::vector<Mismatch> mismatched;

    bool empty() const noexcept { return missing.empty() && mismatched.empty(); }
};

class ValidationFailed : public std::runtime_error
{
public:
    explicit ValidationFailed(ValidationFaults faults_);

    std::vector<std::string> const& missing() const noexcept { return faults.missing; }
    std::vector<Mismatch> const& mismatched() const noexcept { return faults.mismatched; }

    /// Returns nullptr if field was not reported as mismatched
    Mismatch const* mismatchFor(std::string_view field) const;

private:
    ValidationFaults faults;
};

/// A typed accessor found a value it cannot present as the declared type
class ShapeMismatch : public std::runtime_error
{
public:
    ShapeMismatch(std::string fieldname, std::string actual, std::string expected);

    std::string const& field() const noexcept { return fieldName; }

private:
    std::string fieldName;
};

//=============================================================================
// Value conversion
//=============================================================================

/**
 * @brief Conversion between a raw Value and a declared C++ type
 *
 * Every specialization provides
 *   - static std::optional<T> fromRaw(Value const&)  (nullopt if not coercible)
 *   - static Value toRaw(T const&)
 *   - static std::string name()
 *
 * Specializations exist for bool, integers, floating point types,
 * std::string, Keyword, Instant, Value, Map, std::optional, std::vector,
 * std::set, std::map and Instance<>.
 */
template <typename T>
struct Convert;

/**
 * @brief Runtime description of a declared field type
 *
 * This is the type-erased face of Convert<T>: the dispatcher and the
 * validator only ever see TypeDescriptors. Obtain one with typeOf<T>().
 */
class TypeDescriptor
{
public:
    enum class Kind { scalar, optional, schema, sequence, set, map };

    virtual ~TypeDescriptor() = default;

    virtual std::type_info const& typeInfo() const = 0;
    virtual Kind kind() const = 0;

    /// Human readable name of the declared type, e.g. "vector<int32>"
    virtual std::string name() const = 0;

    /// Element type of optional, sequence and set types, value type of maps
    virtual TypeDescriptor const* elementType() const { return nullptr; }

    /// Key type of map types
    virtual TypeDescriptor const* keyType() const { return nullptr; }

    /// Schema of nested Instance<> types
    virtual SchemaDescriptor const* schema() const { return nullptr; }

    /**
     * @brief Converts a raw value to the declared type
     *
     * Returns an empty std::any if raw is nil and the type is not an optional.
     * If raw cannot be coerced the std::any holds raw itself (a dynobj::Value),
     * to be reported by validation. Never throws on shape mismatch.
     */
    virtual std::any fromRaw(Value const& raw) const = 0;

    /**
     * @brief Converts a declared-type value (or a raw Value) back to map form
     *
     * @throws std::invalid_argument if converted holds an unrelated type
     */
    virtual Value toRaw(std::any const& converted) const = 0;

    /// True if raw converts to this type
    virtual bool accepts(Value const& raw) const = 0;

    /// Records every violation found in a resolved value under path
    void check(std::any const& resolved, std::string const& path, ValidationFaults& faults) const;

    /// Same as check() for a value that failed conversion as a whole
    void checkRaw(Value const& raw, std::string const& path, ValidationFaults& faults) const;

protected:
    virtual void checkConverted(std::any const& converted, std::string const& path, ValidationFaults& faults) const = 0;
};

/**
 * @brief Get the TypeDescriptor singleton for a declared type T
 */
template <typename T>
TypeDescriptor const& typeOf();

//=============================================================================
// Schema introspection
//=============================================================================

/// Operations every instance supports regardless of its schema
enum class Structural { getMap, getType, toString, hashCode, prettyPrint, toFormattedString,
                        merge, intersect, subtract, validate, equals };

/// What an invocation by (name, arity) means for a given schema
namespace shape
{
struct FieldGetter  { FieldDescriptor const* field; };
struct FieldBuilder { FieldDescriptor const* field; };
struct MetaGetter   { FieldDescriptor const* field; };
struct MetaBuilder  { FieldDescriptor const* field; };
struct StructuralOp { Structural op; };

/// Matches nothing declared: raw map access under key
struct Fallback
{
    std::string key;
    std::size_t arity;
};
} // namespace shape

using MethodShape = std::variant<shape::FieldGetter, shape::FieldBuilder, shape::MetaGetter,
                                 shape::MetaBuilder, shape::StructuralOp, shape::Fallback>;

/**
 * @brief Classification of a schema's accessors
 *
 * Built once per schema type by schemaOf<T>() and never modified afterwards,
 * so it may be shared freely between threads.
 */
class SchemaDescriptor
{
public:
    SchemaDescriptor(std::type_info const& typeInfo_, std::vector<FieldDescriptor> members_);

    SchemaDescriptor(SchemaDescriptor const&) = delete;
    SchemaDescriptor& operator=(SchemaDescriptor const&) = delete;

    std::type_info const& typeInfo() const noexcept { return info; }

    /// Demangled name of the schema struct
    std::string const& name() const noexcept { return displayName; }

    /// Stable identifier stored in an instance's metadata
    std::string const& typeKey() const noexcept { return key; }

    /// All accessors in declaration order; members()[i].slot == i
    std::span<FieldDescriptor const> members() const noexcept { return accessors; }

    std::span<FieldDescriptor const* const> fieldGetters() const noexcept { return getters; }
    std::span<FieldDescriptor const* const> requiredFields() const noexcept { return required; }
    std::span<FieldDescriptor const* const> metadataAccessors() const noexcept { return metas; }

    /// Data-channel accessor called name (a leading ':' is ignored), or nullptr
    FieldDescriptor const* field(std::string_view name) const;

    /// Metadata accessor called name, or nullptr
    FieldDescriptor const* metadata(std::string_view name) const;

    MethodShape classify(std::string_view method, std::size_t arity) const;

    /// Strips the keyword sigil: ":name" -> "name"
    static std::string_view keyFor(std::string_view method) noexcept;

private:
    struct MethodEntry
    {
        std::string_view name;
        std::size_t arity;
        MethodShape shape;
    };

    std::type_info const& info;
    std::string displayName;
    std::string key;
    std::vector<FieldDescriptor> accessors;
    std::vector<FieldDescriptor const*> getters;
    std::vector<FieldDescriptor const*> required;
    std::vector<FieldDescriptor const*> metas;
    std::vector<MethodEntry> methods;
};

/**
 * @brief Get the SchemaDescriptor singleton for schema struct T
 *
 * Thread safe. Classification runs on first use.
 */
template <typename T>
SchemaDescriptor const& schemaOf();

//=============================================================================
// Value cache
//=============================================================================

/**
 * @brief Per-instance memo of resolved field values
 *
 * Each slot starts Unresolved and is resolved at most once in the sense that
 * the first installed result wins: concurrent resolvers may all compute, but
 * every one of them returns the same installed entry. No locks are taken.
 */
class ValueCache
{
public:
    struct Unresolved {};
    struct ResolvedNull {};
    struct ResolvedValue { std::any value; };

    using Entry = std::variant<Unresolved, ResolvedNull, ResolvedValue>;
    using EntryPtr = std::shared_ptr<Entry const>;

    explicit ValueCache(std::size_t numSlots_);

    ValueCache(ValueCache const&) = delete;
    ValueCache& operator=(ValueCache const&) = delete;

    std::size_t size() const noexcept { return numSlots; }

    /// Current entry of slot without resolving it
    EntryPtr peek(std::size_t slot) const;

    /**
     * @brief Returns the resolved entry of slot, computing it if necessary
     *
     * @param compute Called without arguments, returns ResolvedNull or ResolvedValue
     */
    template <typename Fn>
    EntryPtr get(std::size_t slot, Fn&& compute) const;

private:
    std::unique_ptr<std::atomic<EntryPtr>[]> slots;
    std::size_t numSlots;
};

namespace detail
{
/// Everything an instance handle shares with its copies
struct State
{
    State(Map map_, SchemaDescriptor const& schema_);

    Map map;
    SchemaDescriptor const& schema;
    ValueCache cache;
};

/// Resolves field through the cache of state
ValueCache::EntryPtr resolve(State const& state, FieldDescriptor const& field);

/// True unless map's type key names a schema other than schema
bool holdsSchema(Map const& map, SchemaDescriptor const& schema);
} // namespace detail

//=============================================================================
// Accessor declarations
//=============================================================================

/**
 * @brief A field accessor of a schema
 *
 * Declares a getter and a builder for the map key ":Name". Calling the member
 * reads the field of the instance it belongs to:
 *   - Field<std::string, "x">                returns std::optional<std::string>
 *   - Field<std::optional<std::string>, "x"> returns std::optional<std::string>
 *   - Required<std::string, "x">             returns std::string or throws RequiredFieldMissing
 *
 * A value present in the map but not convertible to T throws ShapeMismatch
 * here; Object::validate() reports the same condition without throwing.
 *
 * Accessors are bound once by the Instance owning them and cannot be
 * copied, so a schema facade is only reachable through its Instance.
 */
template <typename T, fixstr::fixed_string Name, Presence P = Presence::optional>
class Field
{
public:
    using value_type = T;
    static constexpr auto kName = Name;
    static constexpr auto kChannel = Channel::data;
    static constexpr auto kIsRequired = (P == Presence::required);

    using Result = std::conditional_t<kIsRequired || detail::is_optional<T>::value, T, std::optional<T>>;

    Field() = default;
    Field(Field const&) = delete;
    Field& operator=(Field const&) = delete;

    static constexpr std::string_view name() { return std::string_view(kName); }

    Result operator()() const;

    static FieldDescriptor describe(std::size_t slot);

private:
    template <typename> friend class Instance;

    detail::State const* owner = nullptr;
    FieldDescriptor const* descriptor = nullptr;
};

template <typename T, fixstr::fixed_string Name>
using Required = Field<T, Name, Presence::required>;

/**
 * @brief A metadata accessor of a schema
 *
 * Reads and writes the key "Name" of the instance's metadata map. Metadata
 * never takes part in equality, hashing or validation.
 */
template <typename T, fixstr::fixed_string Name>
class Meta
{
public:
    using value_type = T;
    static constexpr auto kName = Name;
    static constexpr auto kChannel = Channel::metadata;
    static constexpr auto kIsRequired = false;

    using Result = std::conditional_t<detail::is_optional<T>::value, T, std::optional<T>>;

    Meta() = default;
    Meta(Meta const&) = delete;
    Meta& operator=(Meta const&) = delete;

    static constexpr std::string_view name() { return std::string_view(kName); }

    Result operator()() const;

    static FieldDescriptor describe(std::size_t slot);

private:
    template <typename> friend class Instance;

    detail::State const* owner = nullptr;
    FieldDescriptor const* descriptor = nullptr;
};

//=============================================================================
// Instances
//=============================================================================

/// An argument of a dynamic invocation
using Argument = std::variant<Value, Object, std::any>;

/**
 * @brief The result of a dynamic invocation
 *
 *   - field getters yield std::any (empty if the field resolved to nothing)
 *   - metadata getters, getMap and fallback getters yield a Value
 *   - builders, merge, intersect, subtract and validate yield an Object
 *   - toString and toFormattedString yield a std::string
 *   - hashCode yields a std::size_t, equals a bool
 *   - getType yields the SchemaDescriptor
 *   - prettyPrint yields nothing
 */
using Dispatched = std::variant<std::monostate, Value, std::any, Object, std::string, std::size_t, bool,
                                std::reference_wrapper<SchemaDescriptor const>>;

/**
 * @brief Type-erased handle to an instance of some schema
 *
 * Handles are cheap to copy. Copies share the backing map and the value cache.
 */
class Object
{
public:
    /// Wraps map as an instance of schema, recording the schema in map's metadata.
    /// Throws std::invalid_argument if map already records a different schema.
    Object(Map map, SchemaDescriptor const& schema);

    Object(Object const&) = default;
    Object& operator=(Object const&) = default;

    Map const& getMap() const noexcept;
    SchemaDescriptor const& getType() const noexcept;

    /// Compact EDN form
    std::string toString() const;

    std::size_t hashCode() const;

    void prettyPrint(std::ostream& out = std::cout) const;
    std::string toFormattedString() const;

    /// Field-wise combine, preferring other's values unless they are nil
    Object merge(Object const& other) const;

    /// Entries equal in both
    Object intersect(Object const& other) const;

    /// Entries absent from or different in other
    Object subtract(Object const& other) const;

    /**
     * @brief Checks every field getter against the schema
     *
     * @return *this, for chaining
     * @throws ValidationFailed naming every missing and every mismatched field
     */
    Object const& validate() const;

    /// True if other is an instance of the same schema over an equal map
    bool equals(Object const& other) const;

    /**
     * @brief Reads a field through the value cache
     *
     * @throws std::invalid_argument if the schema declares no such field
     */
    ValueCache::EntryPtr resolve(std::string_view field) const;

    /// Metadata value stored under key, or nil
    Value metadata(std::string_view key) const;

    /**
     * @brief Dynamic invocation by name
     *
     * Builders (one argument naming a declared accessor) take precedence over
     * structural operations, which take precedence over getters. Names that
     * match nothing read (no argument) or write (one argument) the raw map.
     *
     * @throws RequiredFieldMissing if a required getter resolves to nothing
     * @throws std::invalid_argument for arguments or arities that fit no shape
     */
    Dispatched invoke(std::string_view method, std::span<Argument const> args = {}) const;
    Dispatched invoke(std::string_view method, Argument const& arg) const;

    friend bool operator==(Object const& a, Object const& b) { return a.equals(b); }

protected:
    Object assoc(FieldDescriptor const& field, Value raw) const;
    Object assocMeta(FieldDescriptor const& field, Value raw) const;
    Object withMap(Map map) const;

    std::shared_ptr<detail::State const> state;

private:
    Dispatched invokeStructural(Structural op, std::span<Argument const> args) const;
    std::any get(FieldDescriptor const& field) const;
    Object objectArgument(Argument const& arg) const;
};

/**
 * @brief A typed handle to an instance of schema T
 *
 * Owns a facade T whose accessor members are bound to this handle, so
 * instance->field() reads through the cache and default-bodied member
 * functions of T can call the other accessors directly.
 */
template <typename T>
class Instance : public Object
{
public:
    /// An instance over the empty map
    Instance();

    explicit Instance(Map map);

    Instance(Instance const& o);
    Instance& operator=(Instance const& o);

    T const* operator->() const noexcept { return &facade; }
    T const& operator*() const noexcept { return facade; }

    /// The accessor member called FieldName
    template <fixstr::fixed_string FieldName>
    auto const& operator()(CompileTimeString<FieldName>) const;

    /// A new instance with the field replaced
    template <fixstr::fixed_string FieldName>
    Instance with(CompileTimeString<FieldName>, typename detail::member_named<T, FieldName>::value_type value) const;

    /// A new instance with the metadata entry replaced
    template <fixstr::fixed_string FieldName>
    Instance withMeta(CompileTimeString<FieldName>, typename detail::member_named<T, FieldName>::value_type value) const;

    Instance merge(Instance const& other) const;
    Instance intersect(Instance const& other) const;
    Instance subtract(Instance const& other) const;
    Instance const& validate() const;

    static SchemaDescriptor const& schema() { return schemaOf<T>(); }

private:
    template <typename U> friend std::optional<Instance<U>> instanceOf(Object const&);

    explicit Instance(Object base);

    void init();

    T facade;
};

//=============================================================================
// Codec entry points
//=============================================================================

/**
 * @brief Reads an instance of T from EDN text
 *
 * @throws edn::ParseError if text is not valid EDN
 * @throws std::invalid_argument if the top level form is not a map
 */
template <typename T>
Instance<T> deserialize(std::string_view text);

/// Compact EDN form of the instance's map, tagged if its schema is registered
std::string serialize(Object const& object);

/// Reads and writes instances of T as #tag{...}
template <typename T>
void registerTag(std::string tag);

/// Returns false if T had no tag
template <typename T>
bool deregisterTag();

/// The typed view of object, if it is an instance of T
template <typename T>
std::optional<Instance<T>> instanceOf(Object const& object);

/// Wraps a map decoded from a registered tagged literal as an instance of its schema
std::optional<Object> fromTagged(Value const& raw);

//=============================================================================
// Field name literal
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld();
#pragma GCC diagnostic pop

std::ostream& operator<<(std::ostream& o, Object const& x);
} // namespace dynobj

template <>
struct std::formatter<dynobj::Object> : std::formatter<std::string>
{
    auto format(dynobj::Object const& v, format_context& ctx) const;
};

template <typename T>
struct std::formatter<dynobj::Instance<T>> : std::formatter<dynobj::Object> {};

template <>
struct std::hash<dynobj::Object>
{
    std::size_t operator()(dynobj::Object const& o) const { return o.hashCode(); }
};

template <typename T>
struct std::hash<dynobj::Instance<T>> : std::hash<dynobj::Object> {};

// Include template implementations
#include "dynobj.tpp"
