#include "dynobj.hpp"

#include <algorithm>

namespace dynobj
{
//=============================================================================
// FieldDescriptor implementations
//=============================================================================
Value FieldDescriptor::key() const
{
    if (isMetadata())
        return std::string(name);

    return Keyword { std::string(name) };
}

//=============================================================================
// Error implementations
//=============================================================================
namespace
{
std::string describe(ValidationFaults const& faults)
{
    std::string message = "Validation failed.";

    if (! faults.missing.empty())
    {
        message += " The following required fields were missing:";
        for (auto const& field : faults.missing)
            message += "\n\t" + field;
    }

    if (! faults.mismatched.empty())
    {
        message += faults.missing.empty() ? " " : "\n";
        message += "The following fields had the wrong type:";
        for (auto const& m : faults.mismatched)
        {
            message += std::format("\n\t{} (expected {}, got {})", m.field, m.expected, m.actual);
            if (! m.reason.empty())
                message += ": " + m.reason;
        }
    }

    return message;
}
} // namespace

RequiredFieldMissing::RequiredFieldMissing(std::string fieldname)
    : std::runtime_error(std::format("Required field '{}' is missing", fieldname)), fieldName(std::move(fieldname))
{}

ValidationFailed::ValidationFailed(ValidationFaults faults_)
    : std::runtime_error(describe(faults_)), faults(std::move(faults_))
{}

Mismatch const* ValidationFailed::mismatchFor(std::string_view field) const
{
    auto it = std::ranges::find(faults.mismatched, field, &Mismatch::field);
    return it != faults.mismatched.end() ? &*it : nullptr;
}

ShapeMismatch::ShapeMismatch(std::string fieldname, std::string actual, std::string expected)
    : std::runtime_error(std::format("Field '{}' holds a {} where {} was declared", fieldname, actual, expected)),
      fieldName(std::move(fieldname))
{}

//=============================================================================
// TypeDescriptor implementations
//=============================================================================
bool detail::holdsSchema(Map const& map, SchemaDescriptor const& schema)
{
    auto const key = map.typeKey();
    return ! key || *key == schema.typeKey();
}

void TypeDescriptor::check(std::any const& resolved, std::string const& path, ValidationFaults& faults) const
{
    if (resolved.type() == typeInfo())
        checkConverted(resolved, path, faults);
    else if (auto const* raw = std::any_cast<Value>(&resolved))
        checkRaw(*raw, path, faults);
}

void TypeDescriptor::checkRaw(Value const& raw, std::string const& path, ValidationFaults& faults) const
{
    auto const mismatch = [this, &raw, &path, &faults]
    {
        faults.mismatched.push_back({ path, std::string(raw.shape()), name(), {} });
    };

    switch (kind())
    {
    case Kind::optional:
        if (! raw.isNil())
            elementType()->checkRaw(raw, path, faults);

        return;

    case Kind::schema:
        if (auto const* map = raw.getIf<Map>(); map != nullptr && ! detail::holdsSchema(*map, *schema()))
        {
            // a map tagged with another schema is never re-tagged
            faults.mismatched.push_back({ path, boost::core::demangle(map->typeKey()->c_str()), name(), {} });
        }
        else if (map != nullptr)
        {
            try
            {
                Object(*map, *schema()).validate();
            }
            catch (ValidationFailed const& e)
            {
                faults.mismatched.push_back({ path, "invalid " + name(), name(), e.what() });
            }
        }
        else
        {
            mismatch();
        }

        return;

    case Kind::sequence:
        if (auto const* elements = raw.getIf<ValueVector>())
        {
            for (std::size_t i = 0; i < elements->size(); ++i)
                elementType()->checkRaw(*(*elements)[i], std::format("{}[{}]", path, i), faults);
        }
        else
        {
            mismatch();
        }

        return;

    case Kind::set:
        if (auto const* elements = raw.getIf<ValueSet>())
        {
            for (auto const& element : *elements)
                elementType()->checkRaw(*element, std::format("{}{{{}}}", path, edn::write(*element)), faults);
        }
        else if (auto const* sequence = raw.getIf<ValueVector>())
        {
            for (std::size_t i = 0; i < sequence->size(); ++i)
                elementType()->checkRaw(*(*sequence)[i], std::format("{}[{}]", path, i), faults);
        }
        else
        {
            mismatch();
        }

        return;

    case Kind::map:
        if (auto const* entries = raw.getIf<Map>())
        {
            // keys are reported in braces, values in brackets: "ages{:bob}", "ages[:bob]"
            for (auto const& [key, value] : entries->entries())
            {
                auto const keyText = edn::write(*key);
                keyType()->checkRaw(*key, std::format("{}{{{}}}", path, keyText), faults);
                elementType()->checkRaw(*value, std::format("{}[{}]", path, keyText), faults);
            }
        }
        else
        {
            mismatch();
        }

        return;

    case Kind::scalar:
        if (! accepts(raw))
            mismatch();

        return;
    }
}

//=============================================================================
// SchemaDescriptor implementations
//=============================================================================
namespace
{
struct StructuralEntry
{
    std::string_view name;
    Structural op;
    std::size_t arity;
};

constexpr StructuralEntry kStructural[] = {
    { "getMap",            Structural::getMap,            0 },
    { "getType",           Structural::getType,           0 },
    { "toString",          Structural::toString,          0 },
    { "hashCode",          Structural::hashCode,          0 },
    { "prettyPrint",       Structural::prettyPrint,       0 },
    { "toFormattedString", Structural::toFormattedString, 0 },
    { "merge",             Structural::merge,             1 },
    { "intersect",         Structural::intersect,         1 },
    { "subtract",          Structural::subtract,          1 },
    { "validate",          Structural::validate,          0 },
    { "equals",            Structural::equals,            1 },
};
} // namespace

SchemaDescriptor::SchemaDescriptor(std::type_info const& typeInfo_, std::vector<FieldDescriptor> members_)
    : info(typeInfo_),
      displayName(boost::core::demangle(typeInfo_.name())),
      key(typeInfo_.name()),
      accessors(std::move(members_))
{
    for (auto const& accessor : accessors)
    {
        if (accessor.isMetadata())
        {
            metas.push_back(&accessor);
            continue;
        }

        getters.push_back(&accessor);
        if (accessor.isRequired())
            required.push_back(&accessor);
    }

    auto const add = [this] (std::string_view name, std::size_t arity, MethodShape shape)
    {
        auto const exists = std::ranges::any_of(methods, [name, arity] (MethodEntry const& e)
        {
            return e.name == name && e.arity == arity;
        });

        if (! exists)
            methods.push_back({ name, arity, std::move(shape) });
    };

    // an earlier entry shadows a later one with the same name and arity
    for (auto const* field : getters)
        add(field->name, 1, shape::FieldBuilder { field });

    for (auto const* meta : metas)
        add(meta->name, 1, shape::MetaBuilder { meta });

    for (auto const& entry : kStructural)
        add(entry.name, entry.arity, shape::StructuralOp { entry.op });

    for (auto const* meta : metas)
        add(meta->name, 0, shape::MetaGetter { meta });

    for (auto const* field : getters)
        add(field->name, 0, shape::FieldGetter { field });
}

FieldDescriptor const* SchemaDescriptor::field(std::string_view name) const
{
    auto const stripped = keyFor(name);
    auto it = std::ranges::find(getters, stripped, &FieldDescriptor::name);
    return it != getters.end() ? *it : nullptr;
}

FieldDescriptor const* SchemaDescriptor::metadata(std::string_view name) const
{
    auto it = std::ranges::find(metas, name, &FieldDescriptor::name);
    return it != metas.end() ? *it : nullptr;
}

MethodShape SchemaDescriptor::classify(std::string_view method, std::size_t arity) const
{
    auto const name = keyFor(method);

    auto it = std::ranges::find_if(methods, [name, arity] (MethodEntry const& e)
    {
        return e.name == name && e.arity == arity;
    });

    if (it != methods.end())
        return it->shape;

    return shape::Fallback { std::string(name), arity };
}

std::string_view SchemaDescriptor::keyFor(std::string_view method) noexcept
{
    if (method.starts_with(':'))
        method.remove_prefix(1);

    return method;
}

//=============================================================================
// ValueCache implementations
//=============================================================================
namespace
{
ValueCache::EntryPtr const& unresolvedEntry()
{
    static auto const entry = std::make_shared<ValueCache::Entry const>(ValueCache::Unresolved {});
    return entry;
}
} // namespace

ValueCache::ValueCache(std::size_t numSlots_)
    : slots(std::make_unique<std::atomic<EntryPtr>[]>(numSlots_)), numSlots(numSlots_)
{
    for (std::size_t i = 0; i < numSlots; ++i)
        slots[i].store(unresolvedEntry(), std::memory_order_relaxed);
}

ValueCache::EntryPtr ValueCache::peek(std::size_t slot) const
{
    assert(slot < numSlots);
    return slots[slot].load(std::memory_order_acquire);
}

namespace detail
{
State::State(Map map_, SchemaDescriptor const& schema_)
    : map(std::move(map_)), schema(schema_), cache(schema_.members().size())
{}

ValueCache::EntryPtr resolve(State const& state, FieldDescriptor const& field)
{
    return state.cache.get(field.slot, [&state, &field] () -> ValueCache::Entry
    {
        auto converted = field.type().fromRaw(state.map.get(field.key()));

        if (! converted.has_value())
            return ValueCache::ResolvedNull {};

        return ValueCache::ResolvedValue { std::move(converted) };
    });
}

ShapeMismatch shapeMismatch(std::string_view field, std::any const& actual, TypeDescriptor const& expected)
{
    auto const* raw = std::any_cast<Value>(&actual);
    auto actualName = raw != nullptr ? std::string(raw->shape()) : boost::core::demangle(actual.type().name());

    return ShapeMismatch(std::string(field), std::move(actualName), expected.name());
}
} // namespace detail

//=============================================================================
// Object implementations
//=============================================================================
namespace
{
Value rawArgument(Argument const& arg, TypeDescriptor const* declared)
{
    return std::visit(cxxutils::multilambda(
        [] (Value const& v) -> Value { return v; },
        [] (Object const& o) -> Value { return o.getMap(); },
        [declared] (std::any const& a) -> Value
        {
            if (declared != nullptr)
                return declared->toRaw(a);

            if (auto const* v = std::any_cast<Value>(&a))
                return *v;

            throw std::invalid_argument(std::format("cannot store a {} without a declared type",
                                                    boost::core::demangle(a.type().name())));
        }
    ), arg);
}
} // namespace

namespace
{
Map tagAs(Map map, SchemaDescriptor const& schema)
{
    if (! detail::holdsSchema(map, schema))
        throw std::invalid_argument(std::format("cannot wrap a map of {} as {}",
                                                boost::core::demangle(map.typeKey()->c_str()), schema.name()));

    return map.withTypeKey(schema.typeKey());
}
} // namespace

Object::Object(Map map, SchemaDescriptor const& schema)
    : state(std::make_shared<detail::State const>(tagAs(std::move(map), schema), schema))
{}

Map const& Object::getMap() const noexcept
{
    return state->map;
}

SchemaDescriptor const& Object::getType() const noexcept
{
    return state->schema;
}

std::string Object::toString() const
{
    return edn::write(state->map);
}

std::size_t Object::hashCode() const
{
    return hashValue(state->map);
}

void Object::prettyPrint(std::ostream& out) const
{
    edn::writePretty(out, state->map);
    out << '\n';
}

std::string Object::toFormattedString() const
{
    return edn::writePretty(state->map);
}

Object Object::merge(Object const& other) const
{
    return withMap(mergeWith([] (Value const& a, Value const& b) { return b.isNil() ? a : b; },
                             state->map, other.getMap()));
}

Object Object::intersect(Object const& other) const
{
    return withMap(diff(state->map, other.getMap()).shared);
}

Object Object::subtract(Object const& other) const
{
    return withMap(diff(state->map, other.getMap()).onlyA);
}

Object const& Object::validate() const
{
    ValidationFaults faults;

    for (auto const* field : state->schema.fieldGetters())
    {
        auto const entry = detail::resolve(*state, *field);

        std::visit(cxxutils::multilambda(
            [] (ValueCache::Unresolved const&) {},
            [&faults, field] (ValueCache::ResolvedNull const&)
            {
                if (field->isRequired())
                    faults.missing.emplace_back(field->name);
            },
            [&faults, field] (ValueCache::ResolvedValue const& resolved)
            {
                field->type().check(resolved.value, std::string(field->name), faults);
            }
        ), *entry);
    }

    if (! faults.empty())
        throw ValidationFailed(std::move(faults));

    return *this;
}

bool Object::equals(Object const& other) const
{
    return &state->schema == &other.state->schema && state->map == other.state->map;
}

ValueCache::EntryPtr Object::resolve(std::string_view field) const
{
    auto const* descriptor = state->schema.field(field);
    if (descriptor == nullptr)
        throw std::invalid_argument(std::format("{} has no field {}", state->schema.name(), field));

    return detail::resolve(*state, *descriptor);
}

Value Object::metadata(std::string_view key) const
{
    return state->map.meta(std::string(key));
}

Dispatched Object::invoke(std::string_view method, std::span<Argument const> args) const
{
    return std::visit(cxxutils::multilambda(
        [this, args] (shape::FieldBuilder const& s)
        {
            return Dispatched(std::in_place_type<Object>, assoc(*s.field, rawArgument(args[0], &s.field->type())));
        },
        [this, args] (shape::MetaBuilder const& s)
        {
            return Dispatched(std::in_place_type<Object>, assocMeta(*s.field, rawArgument(args[0], &s.field->type())));
        },
        [this, args] (shape::StructuralOp const& s)
        {
            return invokeStructural(s.op, args);
        },
        [this] (shape::MetaGetter const& s)
        {
            return Dispatched(std::in_place_type<Value>, state->map.meta(s.field->key()));
        },
        [this] (shape::FieldGetter const& s)
        {
            return Dispatched(std::in_place_type<std::any>, get(*s.field));
        },
        [this, args] (shape::Fallback const& s)
        {
            auto const key = Value(Keyword { s.key });

            if (s.arity == 0)
                return Dispatched(std::in_place_type<Value>, state->map.get(key));

            if (s.arity == 1)
                return Dispatched(std::in_place_type<Object>,
                                  Object(state->map.assoc(key, rawArgument(args[0], nullptr)), state->schema));

            throw std::invalid_argument(std::format("{} has no method {} taking {} arguments",
                                                    state->schema.name(), s.key, s.arity));
        }
    ), state->schema.classify(method, args.size()));
}

Dispatched Object::invoke(std::string_view method, Argument const& arg) const
{
    return invoke(method, std::span<Argument const>(&arg, 1));
}

Dispatched Object::invokeStructural(Structural op, std::span<Argument const> args) const
{
    switch (op)
    {
    case Structural::getMap:
        return Dispatched(std::in_place_type<Value>, state->map);
    case Structural::getType:
        return Dispatched(std::in_place_type<std::reference_wrapper<SchemaDescriptor const>>, state->schema);
    case Structural::toString:
        return Dispatched(std::in_place_type<std::string>, toString());
    case Structural::hashCode:
        return Dispatched(std::in_place_type<std::size_t>, hashCode());
    case Structural::prettyPrint:
        prettyPrint();
        return {};
    case Structural::toFormattedString:
        return Dispatched(std::in_place_type<std::string>, toFormattedString());
    case Structural::merge:
        return Dispatched(std::in_place_type<Object>, merge(objectArgument(args[0])));
    case Structural::intersect:
        return Dispatched(std::in_place_type<Object>, intersect(objectArgument(args[0])));
    case Structural::subtract:
        return Dispatched(std::in_place_type<Object>, subtract(objectArgument(args[0])));
    case Structural::validate:
        return Dispatched(std::in_place_type<Object>, validate());
    case Structural::equals:
    {
        auto const* other = std::get_if<Object>(&args[0]);
        return Dispatched(std::in_place_type<bool>, other != nullptr && equals(*other));
    }
    }

    throw std::logic_error("unknown structural operation");
}

std::any Object::get(FieldDescriptor const& field) const
{
    auto const entry = detail::resolve(*state, field);

    return std::visit(cxxutils::multilambda(
        [] (ValueCache::Unresolved const&) -> std::any
        {
            throw std::logic_error("value cache returned an unresolved entry");
        },
        [&field] (ValueCache::ResolvedNull const&) -> std::any
        {
            if (field.isRequired())
                throw RequiredFieldMissing(std::string(field.name));

            return {};
        },
        [] (ValueCache::ResolvedValue const& resolved) -> std::any
        {
            return resolved.value;
        }
    ), *entry);
}

Object Object::objectArgument(Argument const& arg) const
{
    if (auto const* object = std::get_if<Object>(&arg))
        return *object;

    if (auto const* raw = std::get_if<Value>(&arg))
        if (auto const* map = raw->getIf<Map>())
            return Object(*map, state->schema);

    throw std::invalid_argument("expected an instance or a map");
}

Object Object::assoc(FieldDescriptor const& field, Value raw) const
{
    return Object(state->map.assoc(field.key(), raw), state->schema);
}

Object Object::assocMeta(FieldDescriptor const& field, Value raw) const
{
    return Object(state->map.withMeta(field.key(), raw), state->schema);
}

Object Object::withMap(Map map) const
{
    return Object(std::move(map), state->schema);
}

//=============================================================================
// Codec entry points
//=============================================================================
std::string serialize(Object const& object)
{
    return object.toString();
}

std::optional<Object> fromTagged(Value const& raw)
{
    auto const* map = raw.getIf<Map>();
    if (map == nullptr)
        return std::nullopt;

    auto const key = map->typeKey();
    if (! key)
        return std::nullopt;

    auto const entry = edn::TagRegistry::instance().byType(*key);
    if (! entry || entry->schema == nullptr)
        return std::nullopt;

    return Object(*map, *entry->schema);
}

std::ostream& operator<<(std::ostream& o, Object const& x)
{
    return o << x.toString();
}
} // namespace dynobj
