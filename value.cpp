#include "value.hpp"

#include <charconv>
#include <format>
#include <stdexcept>
#include <CxxUtilities.hpp>

namespace dynobj
{
namespace
{
std::size_t combine(std::size_t seed, std::size_t h)
{
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

std::size_t hashEntries(ValueMap const& entries)
{
    // order independent: immer iterates in hash order, not insertion order
    std::size_t sum = 0;
    for (auto const& [key, value] : entries)
        sum += combine(hashValue(*key), hashValue(*value));

    return sum;
}

Value typeMetaKey() { return Keyword { std::string(kTypeMetaKey) }; }
} // namespace

std::size_t BoxHash::operator()(immer::box<Value> const& boxed) const
{
    return hashValue(*boxed);
}

//=============================================================================
// Map implementations
//=============================================================================
Map::Map(ValueMap items_, ValueMap meta_)
    : items(std::move(items_)), metaItems(std::move(meta_))
{}

bool Map::contains(Value const& key) const
{
    return items.count(ValueBox(key)) != 0;
}

Value const* Map::find(Value const& key) const
{
    if (auto const* found = items.find(ValueBox(key)); found != nullptr)
        return &found->get();

    return nullptr;
}

Value Map::get(Value const& key) const
{
    if (auto const* found = find(key); found != nullptr)
        return *found;

    return {};
}

Map Map::assoc(Value const& key, Value const& value) const
{
    return Map(items.set(ValueBox(key), ValueBox(value)), metaItems);
}

Map Map::dissoc(Value const& key) const
{
    return Map(items.erase(ValueBox(key)), metaItems);
}

Value Map::meta(Value const& key) const
{
    if (auto const* found = metaItems.find(ValueBox(key)); found != nullptr)
        return found->get();

    return {};
}

Map Map::withMeta(Value const& key, Value const& value) const
{
    return Map(items, metaItems.set(ValueBox(key), ValueBox(value)));
}

std::optional<std::string> Map::typeKey() const
{
    if (auto const tag = meta(typeMetaKey()); auto const* str = tag.getIf<std::string>())
        return *str;

    return std::nullopt;
}

Map Map::withTypeKey(std::string const& key) const
{
    return withMeta(typeMetaKey(), key);
}

bool operator==(Map const& a, Map const& b)
{
    return a.items == b.items;
}

bool operator==(Tagged const& a, Tagged const& b)
{
    return a.tag == b.tag && *a.value == *b.value;
}

//=============================================================================
// Value implementations
//=============================================================================
std::string_view Value::shape() const noexcept
{
    static constexpr std::string_view kNames[] = {
        "nil", "boolean", "integer", "floating-point", "string", "keyword",
        "instant", "vector", "set", "map", "tagged literal"
    };
    static_assert(std::size(kNames) == std::variant_size_v<Data>);

    return kNames[data.index()];
}

bool operator==(Value const& a, Value const& b)
{
    return a.data == b.data;
}

std::size_t hashValue(Value const& value)
{
    auto const h = std::visit(cxxutils::multilambda(
        [] (std::monostate const&)      -> std::size_t { return 0; },
        [] (bool const& b)              -> std::size_t { return std::hash<bool>()(b); },
        [] (std::int64_t const& i)      -> std::size_t { return std::hash<std::int64_t>()(i); },
        [] (double const& d)            -> std::size_t { return std::hash<double>()(d); },
        [] (std::string const& s)       -> std::size_t { return std::hash<std::string>()(s); },
        [] (Keyword const& k)           -> std::size_t { return combine(0x6b77, std::hash<std::string>()(k.name)); },
        [] (Instant const& t)           -> std::size_t { return std::hash<std::int64_t>()(t.time_since_epoch().count()); },
        [] (ValueVector const& v)       -> std::size_t
        {
            std::size_t seed = v.size();
            for (auto const& element : v)
                seed = combine(seed, hashValue(*element));

            return seed;
        },
        [] (ValueSet const& s)          -> std::size_t
        {
            std::size_t sum = 0;
            for (auto const& element : s)
                sum += hashValue(*element);

            return sum;
        },
        [] (Map const& m)               -> std::size_t { return hashEntries(m.entries()); },
        [] (Tagged const& t)            -> std::size_t { return combine(std::hash<std::string>()(t.tag), hashValue(*t.value)); }
    ), value.data);

    return combine(value.data.index(), h);
}

//=============================================================================
// Persistent map primitives
//=============================================================================
MapDiff diff(Map const& a, Map const& b)
{
    auto onlyA  = ValueMap();
    auto onlyB  = ValueMap();
    auto shared = ValueMap();

    for (auto const& [key, value] : a.entries())
    {
        auto const* other = b.entries().find(key);

        if (other != nullptr && other->get() == *value)
            shared = std::move(shared).set(key, value);
        else
            onlyA = std::move(onlyA).set(key, value);
    }

    for (auto const& [key, value] : b.entries())
    {
        auto const* other = a.entries().find(key);

        if (other == nullptr || ! (other->get() == *value))
            onlyB = std::move(onlyB).set(key, value);
    }

    return { Map(std::move(onlyA)), Map(std::move(onlyB)), Map(std::move(shared)) };
}

Map mergeWith(std::function<Value(Value const&, Value const&)> const& fn, Map const& a, Map const& b)
{
    auto entries = a.entries();

    for (auto const& [key, value] : b.entries())
    {
        if (auto const* existing = entries.find(key); existing != nullptr)
            entries = std::move(entries).set(key, ValueBox(fn(**existing, *value)));
        else
            entries = std::move(entries).set(key, value);
    }

    return Map(std::move(entries), a.metadata());
}

//=============================================================================
// Instants
//=============================================================================
namespace
{
bool parseDigits(std::string_view text, std::size_t pos, std::size_t count, int& result)
{
    if (pos + count > text.size())
        return false;

    for (auto i = pos; i < pos + count; ++i)
        if (text[i] < '0' || text[i] > '9')
            return false;

    auto const* first = text.data() + pos;
    return std::from_chars(first, first + count, result).ec == std::errc();
}

bool expect(std::string_view text, std::size_t pos, char c)
{
    return pos < text.size() && text[pos] == c;
}
} // namespace

std::optional<Instant> parseInstant(std::string_view text)
{
    using namespace std::chrono;

    // years outside 0000-9999 carry a sign and up to five digits
    auto p = std::size_t(0);
    auto yearSign = 1;

    if (expect(text, 0, '+') || expect(text, 0, '-'))
    {
        yearSign = text[0] == '-' ? -1 : 1;
        p = 1;
    }

    auto yearDigits = std::size_t(0);
    while (p + yearDigits < text.size() && text[p + yearDigits] >= '0' && text[p + yearDigits] <= '9')
        ++yearDigits;

    if (yearDigits < 4 || yearDigits > (p == 0 ? 4 : 5))
        return std::nullopt;

    int year = 0, month = 0, day = 0;
    if (! parseDigits(text, p, yearDigits, year))
        return std::nullopt;

    year *= yearSign;
    p += yearDigits;

    if (year < static_cast<int>(std::chrono::year::min()) || year > static_cast<int>(std::chrono::year::max()))
        return std::nullopt;

    if (! (expect(text, p, '-')
           && parseDigits(text, p + 1, 2, month) && expect(text, p + 3, '-')
           && parseDigits(text, p + 4, 2, day)))
        return std::nullopt;

    auto const date = year_month_day(std::chrono::year(year), std::chrono::month(static_cast<unsigned>(month)),
                                     std::chrono::day(static_cast<unsigned>(day)));
    if (! date.ok())
        return std::nullopt;

    if (text.size() == p + 6)
        return Instant(sys_days(date));

    int hour = 0, minute = 0, second = 0;
    if (! ((expect(text, p + 6, 'T') || expect(text, p + 6, 't'))
           && parseDigits(text, p + 7, 2, hour) && expect(text, p + 9, ':')
           && parseDigits(text, p + 10, 2, minute) && expect(text, p + 12, ':')
           && parseDigits(text, p + 13, 2, second)))
        return std::nullopt;

    if (hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    auto pos = p + 15;
    auto millis = 0;

    if (expect(text, pos, '.'))
    {
        ++pos;
        auto digits = 0;
        for (; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos, ++digits)
            if (digits < 3)
                millis = millis * 10 + (text[pos] - '0');

        if (digits == 0)
            return std::nullopt;

        for (; digits < 3; ++digits)
            millis *= 10;
    }

    auto offset = minutes(0);

    if (expect(text, pos, 'Z') || expect(text, pos, 'z'))
    {
        ++pos;
    }
    else if (expect(text, pos, '+') || expect(text, pos, '-'))
    {
        auto const sign = text[pos] == '-' ? -1 : 1;
        int offHours = 0, offMinutes = 0;

        if (! (parseDigits(text, pos + 1, 2, offHours) && expect(text, pos + 3, ':')
               && parseDigits(text, pos + 4, 2, offMinutes)))
            return std::nullopt;

        offset = minutes(sign * (offHours * 60 + offMinutes));
        pos += 6;
    }

    if (pos != text.size())
        return std::nullopt;

    auto const local = sys_days(date) + hours(hour) + minutes(minute) + seconds(second) + milliseconds(millis);
    return Instant(local - offset);
}

std::string formatInstant(Instant instant)
{
    using namespace std::chrono;

    auto const first = sys_days(year::min() / January / 1);
    auto const last  = sys_days(year::max() / December / 31) + days(1);

    if (instant < first || instant >= last)
        throw std::out_of_range(std::format("instant of {}ms lies outside the representable years",
                                            instant.time_since_epoch().count()));

    auto const dayPoint = floor<days>(instant);
    auto const date = year_month_day(dayPoint);
    auto const time = hh_mm_ss<milliseconds>(instant - dayPoint);
    auto const y = static_cast<int>(date.year());

    auto const yearText = y < 0    ? std::format("-{:04}", -y)
                        : y > 9999 ? std::format("+{}", y)
                                   : std::format("{:04}", y);

    return std::format("{}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}-00:00",
                       yearText, static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()),
                       time.hours().count(), time.minutes().count(), time.seconds().count(), time.subseconds().count());
}
} // namespace dynobj
