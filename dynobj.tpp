#pragma once

#include <cmath>
#include <limits>
#include <boost/core/demangle.hpp>

namespace dynobj
{

//=============================================================================
// Convert specializations
//=============================================================================
template <>
struct Convert<bool>
{
    static std::optional<bool> fromRaw(Value const& raw)
    {
        if (auto const* b = raw.getIf<bool>())
            return *b;

        return std::nullopt;
    }

    static Value toRaw(bool b) { return b; }
    static std::string name() { return "boolean"; }
};

// unsigned 64-bit integers have no lossless raw form
template <std::integral T>
    requires (! std::is_same_v<T, bool>) && (std::is_signed_v<T> || sizeof(T) < sizeof(std::int64_t))
struct Convert<T>
{
    static std::optional<T> fromRaw(Value const& raw)
    {
        if (auto const* i = raw.getIf<std::int64_t>(); i != nullptr && std::in_range<T>(*i))
            return static_cast<T>(*i);

        return std::nullopt;
    }

    static Value toRaw(T v) { return static_cast<std::int64_t>(v); }
    static std::string name() { return std::format("{}int{}", std::is_signed_v<T> ? "" : "u", sizeof(T) * 8); }
};

template <std::floating_point T>
struct Convert<T>
{
    static std::optional<T> fromRaw(Value const& raw)
    {
        if (auto const* d = raw.getIf<double>())
        {
            auto const narrowed = static_cast<T>(*d);
            if (std::isnan(*d) || static_cast<double>(narrowed) == *d)
                return narrowed;

            return std::nullopt;
        }

        if (auto const* i = raw.getIf<std::int64_t>())
        {
            static constexpr auto kTwoToThe63 = static_cast<T>(std::numeric_limits<std::int64_t>::max());

            auto const converted = static_cast<T>(*i);
            if (converted < kTwoToThe63 && static_cast<std::int64_t>(converted) == *i)
                return converted;
        }

        return std::nullopt;
    }

    static Value toRaw(T v) { return static_cast<double>(v); }
    static std::string name() { return std::is_same_v<T, float> ? "float" : "double"; }
};

template <>
struct Convert<std::string>
{
    static std::optional<std::string> fromRaw(Value const& raw)
    {
        if (auto const* s = raw.getIf<std::string>())
            return *s;

        return std::nullopt;
    }

    static Value toRaw(std::string const& s) { return s; }
    static std::string name() { return "string"; }
};

template <>
struct Convert<Keyword>
{
    static std::optional<Keyword> fromRaw(Value const& raw)
    {
        if (auto const* k = raw.getIf<Keyword>())
            return *k;

        return std::nullopt;
    }

    static Value toRaw(Keyword const& k) { return k; }
    static std::string name() { return "keyword"; }
};

template <>
struct Convert<Instant>
{
    static std::optional<Instant> fromRaw(Value const& raw)
    {
        if (auto const* t = raw.getIf<Instant>())
            return *t;

        if (auto const* s = raw.getIf<std::string>())
            return parseInstant(*s);

        return std::nullopt;
    }

    static Value toRaw(Instant t) { return t; }
    static std::string name() { return "instant"; }
};

template <>
struct Convert<Value>
{
    static std::optional<Value> fromRaw(Value const& raw) { return raw; }
    static Value toRaw(Value const& v) { return v; }
    static std::string name() { return "any"; }
};

template <>
struct Convert<Map>
{
    static std::optional<Map> fromRaw(Value const& raw)
    {
        if (auto const* m = raw.getIf<Map>())
            return *m;

        return std::nullopt;
    }

    static Value toRaw(Map const& m) { return m; }
    static std::string name() { return "map"; }
};

template <typename U>
struct Convert<std::optional<U>>
{
    static std::optional<std::optional<U>> fromRaw(Value const& raw)
    {
        if (raw.isNil())
            return std::optional<std::optional<U>>(std::in_place);

        if (auto converted = Convert<U>::fromRaw(raw))
            return std::optional<std::optional<U>>(std::in_place, std::move(*converted));

        return std::nullopt;
    }

    static Value toRaw(std::optional<U> const& v) { return v ? Convert<U>::toRaw(*v) : Value(); }
    static std::string name() { return "optional<" + Convert<U>::name() + ">"; }
};

template <typename U>
struct Convert<std::vector<U>>
{
    static std::optional<std::vector<U>> fromRaw(Value const& raw)
    {
        auto const* elements = raw.getIf<ValueVector>();
        if (elements == nullptr)
            return std::nullopt;

        std::vector<U> result;
        result.reserve(elements->size());

        for (auto const& element : *elements)
        {
            auto converted = Convert<U>::fromRaw(*element);
            if (! converted)
                return std::nullopt;

            result.push_back(std::move(*converted));
        }

        return result;
    }

    static Value toRaw(std::vector<U> const& v)
    {
        auto result = ValueVector().transient();
        for (auto const& element : v)
            result.push_back(ValueBox(Convert<U>::toRaw(element)));

        return result.persistent();
    }

    static std::string name() { return "vector<" + Convert<U>::name() + ">"; }
};

template <typename U>
struct Convert<std::set<U>>
{
    static std::optional<std::set<U>> fromRaw(Value const& raw)
    {
        std::set<U> result;

        auto const insertAll = [&result] (auto const& elements)
        {
            for (auto const& element : elements)
            {
                auto converted = Convert<U>::fromRaw(*element);
                if (! converted)
                    return false;

                result.insert(std::move(*converted));
            }

            return true;
        };

        if (auto const* s = raw.getIf<ValueSet>())
            return insertAll(*s) ? std::optional(std::move(result)) : std::nullopt;

        if (auto const* v = raw.getIf<ValueVector>())
            return insertAll(*v) ? std::optional(std::move(result)) : std::nullopt;

        return std::nullopt;
    }

    static Value toRaw(std::set<U> const& s)
    {
        auto result = ValueSet();
        for (auto const& element : s)
            result = std::move(result).insert(ValueBox(Convert<U>::toRaw(element)));

        return result;
    }

    static std::string name() { return "set<" + Convert<U>::name() + ">"; }
};

template <typename K, typename V>
struct Convert<std::map<K, V>>
{
    static std::optional<std::map<K, V>> fromRaw(Value const& raw)
    {
        auto const* m = raw.getIf<Map>();
        if (m == nullptr)
            return std::nullopt;

        std::map<K, V> result;

        for (auto const& [key, value] : m->entries())
        {
            auto convertedKey = Convert<K>::fromRaw(*key);
            auto convertedValue = Convert<V>::fromRaw(*value);

            if (! (convertedKey && convertedValue))
                return std::nullopt;

            result.emplace(std::move(*convertedKey), std::move(*convertedValue));
        }

        return result;
    }

    static Value toRaw(std::map<K, V> const& m)
    {
        auto result = Map();
        for (auto const& [key, value] : m)
            result = result.assoc(Convert<K>::toRaw(key), Convert<V>::toRaw(value));

        return result;
    }

    static std::string name() { return "map<" + Convert<K>::name() + ", " + Convert<V>::name() + ">"; }
};

template <typename S>
struct Convert<Instance<S>>
{
    static std::optional<Instance<S>> fromRaw(Value const& raw)
    {
        if (auto const* m = raw.getIf<Map>(); m != nullptr && detail::holdsSchema(*m, schemaOf<S>()))
            return Instance<S>(*m);

        return std::nullopt;
    }

    static Value toRaw(Instance<S> const& v) { return v.getMap(); }
    static std::string name() { return schemaOf<S>().name(); }
};

//=============================================================================
// TypeDescriptor implementations
//=============================================================================
namespace detail
{
template <typename T> struct TypeTraits
{
    static constexpr auto kKind = TypeDescriptor::Kind::scalar;
};

template <typename U> struct TypeTraits<std::optional<U>>
{
    static constexpr auto kKind = TypeDescriptor::Kind::optional;
    using Element = U;
};

template <typename U> struct TypeTraits<std::vector<U>>
{
    static constexpr auto kKind = TypeDescriptor::Kind::sequence;
    using Element = U;
};

template <typename U> struct TypeTraits<std::set<U>>
{
    static constexpr auto kKind = TypeDescriptor::Kind::set;
    using Element = U;
};

template <typename K, typename V> struct TypeTraits<std::map<K, V>>
{
    static constexpr auto kKind = TypeDescriptor::Kind::map;
    using Key = K;
    using Element = V;
};

template <typename S> struct TypeTraits<Instance<S>>
{
    static constexpr auto kKind = TypeDescriptor::Kind::schema;
    using Schema = S;
};

ShapeMismatch shapeMismatch(std::string_view field, std::any const& actual, TypeDescriptor const& expected);

/// Path of a container element: "ints[1]", "tags{:a}", "ages[:bob]"
template <typename T>
std::string elementPath(std::string const& path, T const& element, bool braces = false)
{
    auto const text = edn::write(Convert<T>::toRaw(element));
    return braces ? std::format("{}{{{}}}", path, text) : std::format("{}[{}]", path, text);
}

/**
 * @brief Reports violations inside an already converted value
 *
 * A value that converted is of the declared type on every level, so the only
 * thing left to check is the validity of nested instances.
 */
template <typename T>
void checkElements(T const& value, std::string const& path, ValidationFaults& faults)
{
    using Kind = TypeDescriptor::Kind;
    using Traits = TypeTraits<T>;

    if constexpr (Traits::kKind == Kind::optional)
    {
        if (value)
            checkElements(*value, path, faults);
    }
    else if constexpr (Traits::kKind == Kind::sequence)
    {
        for (std::size_t i = 0; i < value.size(); ++i)
            checkElements<typename Traits::Element>(value[i], std::format("{}[{}]", path, i), faults);
    }
    else if constexpr (Traits::kKind == Kind::set)
    {
        for (auto const& element : value)
            checkElements(element, elementPath(path, element, true), faults);
    }
    else if constexpr (Traits::kKind == Kind::map)
    {
        for (auto const& [key, element] : value)
            checkElements(element, elementPath(path, key), faults);
    }
    else if constexpr (Traits::kKind == Kind::schema)
    {
        try
        {
            value.validate();
        }
        catch (ValidationFailed const& e)
        {
            faults.mismatched.push_back({ path, "invalid " + Convert<T>::name(), Convert<T>::name(), e.what() });
        }
    }
}

template <typename T>
class TypeDescriptorFor final : public TypeDescriptor
{
public:
    using Traits = TypeTraits<T>;

    std::type_info const& typeInfo() const override { return typeid(T); }
    Kind kind() const override { return Traits::kKind; }
    std::string name() const override { return Convert<T>::name(); }

    TypeDescriptor const* elementType() const override
    {
        if constexpr (requires { typename Traits::Element; })
            return &typeOf<typename Traits::Element>();
        else
            return nullptr;
    }

    TypeDescriptor const* keyType() const override
    {
        if constexpr (requires { typename Traits::Key; })
            return &typeOf<typename Traits::Key>();
        else
            return nullptr;
    }

    SchemaDescriptor const* schema() const override
    {
        if constexpr (requires { typename Traits::Schema; })
            return &schemaOf<typename Traits::Schema>();
        else
            return nullptr;
    }

    std::any fromRaw(Value const& raw) const override
    {
        if (raw.isNil() && Traits::kKind != Kind::optional)
            return {};

        if (auto converted = Convert<T>::fromRaw(raw))
            return std::any(std::move(*converted));

        return std::any(raw);
    }

    Value toRaw(std::any const& converted) const override
    {
        if (auto const* typed = std::any_cast<T>(&converted))
            return Convert<T>::toRaw(*typed);

        if (auto const* raw = std::any_cast<Value>(&converted))
            return *raw;

        if (! converted.has_value())
            return {};

        throw std::invalid_argument(std::format("cannot store a {} as {}",
                                                boost::core::demangle(converted.type().name()), name()));
    }

    bool accepts(Value const& raw) const override { return Convert<T>::fromRaw(raw).has_value(); }

protected:
    void checkConverted(std::any const& converted, std::string const& path, ValidationFaults& faults) const override
    {
        if (auto const* typed = std::any_cast<T>(&converted))
            checkElements(*typed, path, faults);
    }
};

template <typename T>
SchemaDescriptor classify()
{
    std::vector<FieldDescriptor> members;

    [&members] <std::size_t... Is> (std::index_sequence<Is...>)
    {
        (members.push_back(std::tuple_element_t<Is, members_of<T>>::describe(Is)), ...);
    }(std::make_index_sequence<num_members<T>()>());

    return SchemaDescriptor(typeid(T), std::move(members));
}
} // namespace detail

template <typename T>
TypeDescriptor const& typeOf()
{
    static detail::TypeDescriptorFor<T> const descriptor;
    return descriptor;
}

template <typename T>
SchemaDescriptor const& schemaOf()
{
    static_assert(std::is_aggregate_v<T>, "A schema must be an aggregate struct");
    static_assert(detail::has_unique_names<T>(), "Accessor names must be unique within a schema");

    static SchemaDescriptor const descriptor = detail::classify<T>();
    return descriptor;
}

//=============================================================================
// ValueCache implementations
//=============================================================================
template <typename Fn>
ValueCache::EntryPtr ValueCache::get(std::size_t slot, Fn&& compute) const
{
    assert(slot < numSlots);

    auto& cell = slots[slot];
    auto current = cell.load(std::memory_order_acquire);

    if (! std::holds_alternative<Unresolved>(*current))
        return current;

    auto resolved = std::make_shared<Entry const>(std::invoke(std::forward<Fn>(compute)));

    // on failure current is updated to the entry another thread installed first
    if (cell.compare_exchange_strong(current, resolved, std::memory_order_acq_rel, std::memory_order_acquire))
        return resolved;

    return current;
}

//=============================================================================
// Field and Meta implementations
//=============================================================================
template <typename T, fixstr::fixed_string Name, Presence P>
auto Field<T, Name, P>::operator()() const -> Result
{
    assert(owner != nullptr && descriptor != nullptr);

    auto const entry = detail::resolve(*owner, *descriptor);

    return std::visit(cxxutils::multilambda(
        [] (ValueCache::Unresolved const&) -> Result
        {
            throw std::logic_error("value cache returned an unresolved entry");
        },
        [] (ValueCache::ResolvedNull const&) -> Result
        {
            if constexpr (kIsRequired)
                throw RequiredFieldMissing(std::string(name()));
            else
                return Result();
        },
        [] (ValueCache::ResolvedValue const& resolved) -> Result
        {
            if (auto const* typed = std::any_cast<T>(&resolved.value))
                return *typed;

            throw detail::shapeMismatch(name(), resolved.value, typeOf<T>());
        }
    ), *entry);
}

template <typename T, fixstr::fixed_string Name, Presence P>
FieldDescriptor Field<T, Name, P>::describe(std::size_t slot)
{
    return { name(), P, kChannel, &typeOf<T>, slot };
}

template <typename T, fixstr::fixed_string Name>
auto Meta<T, Name>::operator()() const -> Result
{
    assert(owner != nullptr && descriptor != nullptr);

    auto const raw = owner->map.meta(descriptor->key());
    if (raw.isNil())
        return Result();

    if (auto converted = Convert<T>::fromRaw(raw))
        return std::move(*converted);

    throw detail::shapeMismatch(name(), std::any(raw), typeOf<T>());
}

template <typename T, fixstr::fixed_string Name>
FieldDescriptor Meta<T, Name>::describe(std::size_t slot)
{
    return { name(), Presence::optional, kChannel, &typeOf<T>, slot };
}

//=============================================================================
// Instance implementations
//=============================================================================
template <typename T>
Instance<T>::Instance() : Object(Map(), schemaOf<T>())
{
    init();
}

template <typename T>
Instance<T>::Instance(Map map) : Object(std::move(map), schemaOf<T>())
{
    init();
}

template <typename T>
Instance<T>::Instance(Instance const& o) : Object(o), facade()
{
    // the facade is rebound, not copied
    init();
}

template <typename T>
Instance<T>& Instance<T>::operator=(Instance const& o)
{
    Object::operator=(o);
    init();
    return *this;
}

template <typename T>
Instance<T>::Instance(Object base) : Object(std::move(base))
{
    assert(&getType() == &schemaOf<T>());
    init();
}

template <typename T>
void Instance<T>::init()
{
    auto const* bound = state.get();
    auto const accessors = schemaOf<T>().members();
    std::size_t slot = 0;

    std::apply([bound, &accessors, &slot] (auto&... members)
    {
        ((members.owner = bound, members.descriptor = &accessors[slot++]), ...);
    }, detail::members_tie(facade));
}

template <typename T>
template <fixstr::fixed_string FieldName>
auto const& Instance<T>::operator()(CompileTimeString<FieldName>) const
{
    static_assert(detail::member_index<T, FieldName>() < detail::num_members<T>(), "No accessor with this name");
    return std::get<detail::member_index<T, FieldName>()>(detail::members_tie(facade));
}

template <typename T>
template <fixstr::fixed_string FieldName>
Instance<T> Instance<T>::with(CompileTimeString<FieldName>, typename detail::member_named<T, FieldName>::value_type value) const
{
    using Member = detail::member_named<T, FieldName>;
    static_assert(Member::kChannel == Channel::data, "Use withMeta() for metadata accessors");

    auto const& field = schemaOf<T>().members()[detail::member_index<T, FieldName>()];
    return Instance(assoc(field, Convert<typename Member::value_type>::toRaw(value)));
}

template <typename T>
template <fixstr::fixed_string FieldName>
Instance<T> Instance<T>::withMeta(CompileTimeString<FieldName>, typename detail::member_named<T, FieldName>::value_type value) const
{
    using Member = detail::member_named<T, FieldName>;
    static_assert(Member::kChannel == Channel::metadata, "Use with() for field accessors");

    auto const& field = schemaOf<T>().members()[detail::member_index<T, FieldName>()];
    return Instance(assocMeta(field, Convert<typename Member::value_type>::toRaw(value)));
}

template <typename T>
Instance<T> Instance<T>::merge(Instance const& other) const
{
    return Instance(Object::merge(other));
}

template <typename T>
Instance<T> Instance<T>::intersect(Instance const& other) const
{
    return Instance(Object::intersect(other));
}

template <typename T>
Instance<T> Instance<T>::subtract(Instance const& other) const
{
    return Instance(Object::subtract(other));
}

template <typename T>
Instance<T> const& Instance<T>::validate() const
{
    Object::validate();
    return *this;
}

//=============================================================================
// Codec entry points
//=============================================================================
template <typename T>
Instance<T> deserialize(std::string_view text)
{
    auto const raw = edn::read(text);

    if (auto const* map = raw.getIf<Map>())
        return Instance<T>(*map);

    throw std::invalid_argument(std::format("expected a map but read a {}", raw.shape()));
}

template <typename T>
void registerTag(std::string tag)
{
    auto const& schema = schemaOf<T>();
    edn::TagRegistry::instance().add(std::move(tag), schema.typeKey(), &schema);
}

template <typename T>
bool deregisterTag()
{
    return edn::TagRegistry::instance().remove(schemaOf<T>().typeKey());
}

template <typename T>
std::optional<Instance<T>> instanceOf(Object const& object)
{
    if (&object.getType() != &schemaOf<T>())
        return std::nullopt;

    return Instance<T>(object);
}

//=============================================================================
// operator""_fld implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld()
{
    return { };
}
#pragma GCC diagnostic pop
} // namespace dynobj

inline auto std::formatter<dynobj::Object>::format(dynobj::Object const& v, format_context& ctx) const
{
    return std::formatter<std::string>::format(v.toString(), ctx);
}
