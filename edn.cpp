#include "edn.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <utility>
#include <CxxUtilities.hpp>

namespace dynobj::edn
{
ParseError::ParseError(std::string const& message, std::size_t offset_)
    : std::runtime_error(std::format("{} at offset {}", message, offset_)), position(offset_)
{}

//=============================================================================
// Reader
//=============================================================================
namespace
{
bool isDelimiter(char c)
{
    switch (c)
    {
    case ' ': case '\t': case '\n': case '\r': case '\f': case ',':
    case '(': case ')': case '[': case ']': case '{': case '}':
    case '"': case ';':
        return true;
    default:
        return false;
    }
}

class Reader
{
public:
    explicit Reader(std::string_view text_) : text(text_) {}

    Value readTopLevel()
    {
        skipIgnorable();
        if (atEnd())
            fail("expected a form but reached the end of input");

        auto result = readForm();
        skipIgnorable();

        if (! atEnd())
            fail("unexpected trailing characters");

        return result;
    }

private:
    [[noreturn]] void fail(std::string const& message) const { throw ParseError(message, pos); }

    bool atEnd() const { return pos >= text.size(); }
    char peek() const { return text[pos]; }

    void skipIgnorable()
    {
        while (! atEnd())
        {
            auto const c = peek();

            if (c == ';')
            {
                while (! atEnd() && peek() != '\n')
                    ++pos;
            }
            else if (c == '#' && pos + 1 < text.size() && text[pos + 1] == '_')
            {
                pos += 2;
                skipIgnorable();
                if (atEnd())
                    fail("discard macro without a form");

                readForm();
            }
            else if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == ',')
            {
                ++pos;
            }
            else
            {
                return;
            }
        }
    }

    std::string_view readToken()
    {
        auto const start = pos;
        while (! atEnd() && ! isDelimiter(peek()))
            ++pos;

        return text.substr(start, pos - start);
    }

    Value readForm()
    {
        auto const c = peek();

        switch (c)
        {
        case '(':  ++pos; return readSequence(')');
        case '[':  ++pos; return readSequence(']');
        case '{':  ++pos; return readMap();
        case '"':  ++pos; return readString();
        case ':':  ++pos; return readKeyword();
        case '\\': ++pos; return readCharacter();
        case '#':  ++pos; return readDispatch();
        case ')': case ']': case '}':
            fail(std::format("unmatched delimiter '{}'", c));
        default:
            break;
        }

        if (std::isdigit(static_cast<unsigned char>(c))
            || ((c == '-' || c == '+') && pos + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[pos + 1]))))
            return readNumber();

        return readSymbol();
    }

    std::vector<Value> readUntil(char closing)
    {
        std::vector<Value> forms;

        for (;;)
        {
            skipIgnorable();
            if (atEnd())
                fail(std::format("expected '{}' but reached the end of input", closing));

            if (peek() == closing)
            {
                ++pos;
                return forms;
            }

            forms.emplace_back(readForm());
        }
    }

    Value readSequence(char closing)
    {
        auto vec = ValueVector();
        for (auto& form : readUntil(closing))
            vec = std::move(vec).push_back(ValueBox(std::move(form)));

        return vec;
    }

    Value readMap()
    {
        auto const start = pos;
        auto forms = readUntil('}');

        if (forms.size() % 2 != 0)
            throw ParseError("map literal must contain an even number of forms", start);

        auto entries = ValueMap();
        for (std::size_t i = 0; i < forms.size(); i += 2)
        {
            auto key = ValueBox(std::move(forms[i]));
            if (entries.count(key) != 0)
                throw ParseError(std::format("duplicate map key {}", write(*key)), start);

            entries = std::move(entries).set(std::move(key), ValueBox(std::move(forms[i + 1])));
        }

        return Map(std::move(entries));
    }

    Value readSet()
    {
        auto const start = pos;
        auto set = ValueSet();

        for (auto& form : readUntil('}'))
        {
            auto element = ValueBox(std::move(form));
            if (set.count(element) != 0)
                throw ParseError(std::format("duplicate set element {}", write(*element)), start);

            set = std::move(set).insert(std::move(element));
        }

        return set;
    }

    Value readString()
    {
        std::string result;

        while (! atEnd())
        {
            auto const c = text[pos++];

            if (c == '"')
                return result;

            if (c != '\\')
            {
                result += c;
                continue;
            }

            if (atEnd())
                break;

            switch (auto const escaped = text[pos++])
            {
            case 'n':  result += '\n'; break;
            case 't':  result += '\t'; break;
            case 'r':  result += '\r'; break;
            case 'f':  result += '\f'; break;
            case 'b':  result += '\b'; break;
            case '"':  result += '"';  break;
            case '\\': result += '\\'; break;
            case 'u':
                result += readUnicodeEscape();
                break;
            default:
                fail(std::format("unsupported escape sequence '\\{}'", escaped));
            }
        }

        fail("unterminated string");
    }

    unsigned readHexQuad()
    {
        if (pos + 4 > text.size())
            fail("truncated unicode escape");

        unsigned value = 0;
        if (std::from_chars(text.data() + pos, text.data() + pos + 4, value, 16).ptr != text.data() + pos + 4)
            fail("malformed unicode escape");

        pos += 4;
        return value;
    }

    static bool isHighSurrogate(unsigned u) { return u >= 0xd800 && u <= 0xdbff; }
    static bool isLowSurrogate(unsigned u)  { return u >= 0xdc00 && u <= 0xdfff; }

    std::string readUnicodeEscape()
    {
        auto const start = pos - 2;
        auto codepoint = readHexQuad();

        if (isLowSurrogate(codepoint))
            throw ParseError("unpaired low surrogate in unicode escape", start);

        if (isHighSurrogate(codepoint))
        {
            if (text.substr(pos, 2) != "\\u")
                throw ParseError("unpaired high surrogate in unicode escape", start);

            pos += 2;
            auto const low = readHexQuad();

            if (! isLowSurrogate(low))
                throw ParseError("unpaired high surrogate in unicode escape", start);

            codepoint = 0x10000 + ((codepoint - 0xd800) << 10) + (low - 0xdc00);
        }

        return encodeUtf8(codepoint);
    }

    static std::string encodeUtf8(unsigned codepoint)
    {
        std::string out;

        if (codepoint < 0x80)
        {
            out += static_cast<char>(codepoint);
        }
        else if (codepoint < 0x800)
        {
            out += static_cast<char>(0xc0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3f));
        }
        else if (codepoint < 0x10000)
        {
            out += static_cast<char>(0xe0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3f));
            out += static_cast<char>(0x80 | (codepoint & 0x3f));
        }
        else
        {
            out += static_cast<char>(0xf0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3f));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3f));
            out += static_cast<char>(0x80 | (codepoint & 0x3f));
        }

        return out;
    }

    Value readCharacter()
    {
        auto const start = pos;

        // the first character is always part of the literal, even a delimiter
        if (atEnd())
            fail("character literal without a character");

        ++pos;
        while (! atEnd() && ! isDelimiter(peek()))
            ++pos;

        auto const token = text.substr(start, pos - start);

        if (token.size() == 1)       return std::string(token);
        if (token == "newline")      return std::string("\n");
        if (token == "space")        return std::string(" ");
        if (token == "tab")          return std::string("\t");
        if (token == "return")       return std::string("\r");
        if (token.size() == 5 && token[0] == 'u')
        {
            unsigned codepoint = 0;
            if (std::from_chars(token.data() + 1, token.data() + 5, codepoint, 16).ptr == token.data() + 5
                && ! isHighSurrogate(codepoint) && ! isLowSurrogate(codepoint))
                return encodeUtf8(codepoint);
        }

        throw ParseError(std::format("unsupported character literal \\{}", token), start);
    }

    Value readKeyword()
    {
        auto const token = readToken();
        if (token.empty())
            fail("keyword without a name");

        return Keyword { std::string(token) };
    }

    Value readNumber()
    {
        auto const start = pos;
        auto token = readToken();

        auto const isFloat = token.find_first_of(".eE") != std::string_view::npos || token.ends_with('M');
        if (token.ends_with('M') || token.ends_with('N'))
            token.remove_suffix(1);

        if (token.starts_with('+'))
            token.remove_prefix(1);

        auto const* first = token.data();
        auto const* last = token.data() + token.size();

        if (isFloat)
        {
            double d = 0.0;
            if (auto const [ptr, ec] = std::from_chars(first, last, d); ec == std::errc() && ptr == last)
                return d;
        }
        else
        {
            std::int64_t i = 0;
            auto const [ptr, ec] = std::from_chars(first, last, i);

            if (ec == std::errc::result_out_of_range)
                throw ParseError(std::format("integer {} does not fit into 64 bits", token), start);

            if (ec == std::errc() && ptr == last)
                return i;
        }

        throw ParseError(std::format("malformed number {}", token), start);
    }

    Value readSymbol()
    {
        auto const start = pos;
        auto const token = readToken();

        if (token == "nil")   return {};
        if (token == "true")  return true;
        if (token == "false") return false;

        if (token.empty())
            throw ParseError(std::format("unexpected character '{}'", peek()), start);

        throw ParseError(std::format("unsupported symbol {}", token), start);
    }

    Value readDispatch()
    {
        auto const start = pos - 1;

        if (atEnd())
            fail("dispatch macro without a form");

        if (peek() == '{')
        {
            ++pos;
            return readSet();
        }

        if (peek() == '#')
        {
            ++pos;
            auto const token = readToken();

            if (token == "Inf")  return std::numeric_limits<double>::infinity();
            if (token == "-Inf") return -std::numeric_limits<double>::infinity();
            if (token == "NaN")  return std::numeric_limits<double>::quiet_NaN();

            throw ParseError(std::format("unsupported symbolic value ##{}", token), start);
        }

        auto const tag = std::string(readToken());
        if (tag.empty())
            throw ParseError("tagged literal without a tag", start);

        skipIgnorable();
        if (atEnd())
            throw ParseError(std::format("tag #{} without a form", tag), start);

        auto form = readForm();

        if (tag == "inst")
        {
            auto const* str = form.getIf<std::string>();
            if (str == nullptr)
                throw ParseError("#inst expects a string", start);

            if (auto instant = parseInstant(*str))
                return *instant;

            throw ParseError(std::format("malformed timestamp \"{}\"", *str), start);
        }

        if (auto const entry = TagRegistry::instance().byTag(tag))
        {
            if (auto const* map = form.getIf<Map>())
                return map->withTypeKey(entry->typeKey);

            throw ParseError(std::format("#{} expects a map but got a {}", tag, form.shape()), start);
        }

        return Tagged { tag, ValueBox(std::move(form)) };
    }

    std::string_view text;
    std::size_t pos = 0;
};
} // namespace

Value read(std::string_view text)
{
    return Reader(text).readTopLevel();
}

//=============================================================================
// Writer
//=============================================================================
namespace
{
void writeString(std::string& out, std::string const& str)
{
    out += '"';

    for (auto const c : str)
    {
        switch (c)
        {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\t': out += "\\t";  break;
        case '\r': out += "\\r";  break;
        default:   out += c;      break;
        }
    }

    out += '"';
}

std::string writeDouble(double d)
{
    if (std::isnan(d))
        return "##NaN";

    if (std::isinf(d))
        return d > 0 ? "##Inf" : "##-Inf";

    auto result = std::format("{}", d);
    if (result.find_first_of(".e") == std::string::npos)
        result += ".0";

    return result;
}

/// Tag to emit in front of a map, if its schema has one
std::optional<std::string> tagFor(Map const& map)
{
    if (auto const key = map.typeKey())
        if (auto const entry = TagRegistry::instance().byType(*key))
            return entry->tag;

    return std::nullopt;
}

using SortedEntries = std::vector<std::pair<std::string, Value const*>>;

SortedEntries sortedKeys(Map const& map)
{
    SortedEntries result;
    for (auto const& [key, value] : map.entries())
        result.emplace_back(write(*key), &value.get());

    std::ranges::sort(result, {}, &SortedEntries::value_type::first);
    return result;
}

std::vector<std::string> sortedElements(ValueSet const& set)
{
    std::vector<std::string> result;
    for (auto const& element : set)
        result.emplace_back(write(*element));

    std::ranges::sort(result);
    return result;
}

void writeCompact(std::string& out, Value const& value)
{
    std::visit(cxxutils::multilambda(
        [&out] (std::monostate const&) { out += "nil"; },
        [&out] (bool const& b)         { out += b ? "true" : "false"; },
        [&out] (std::int64_t const& i) { out += std::to_string(i); },
        [&out] (double const& d)       { out += writeDouble(d); },
        [&out] (std::string const& s)  { writeString(out, s); },
        [&out] (Keyword const& k)      { out += ':'; out += k.name; },
        [&out] (Instant const& t)      { out += "#inst "; writeString(out, formatInstant(t)); },
        [&out] (ValueVector const& v)
        {
            out += '[';
            for (std::size_t i = 0; i < v.size(); ++i)
            {
                if (i != 0)
                    out += ' ';

                writeCompact(out, *v[i]);
            }
            out += ']';
        },
        [&out] (ValueSet const& s)
        {
            out += "#{";
            auto first = true;
            for (auto const& element : sortedElements(s))
            {
                if (! std::exchange(first, false))
                    out += ' ';

                out += element;
            }
            out += '}';
        },
        [&out] (Map const& m)
        {
            if (auto const tag = tagFor(m))
                out += '#' + *tag;

            out += '{';
            auto first = true;
            for (auto const& [key, val] : sortedKeys(m))
            {
                if (! std::exchange(first, false))
                    out += ", ";

                out += key;
                out += ' ';
                writeCompact(out, *val);
            }
            out += '}';
        },
        [&out] (Tagged const& t)
        {
            out += '#' + t.tag + ' ';
            writeCompact(out, *t.value);
        }
    ), value.data);
}

void writeIndented(std::string& out, Value const& value, std::size_t column, WriterOptions const& options)
{
    auto compact = write(value);
    if (column + compact.size() <= options.width)
    {
        out += compact;
        return;
    }

    auto const breakLine = [&out] (std::size_t col) { out += '\n'; out.append(col, ' '); };
    auto const childColumn = [&options] (std::size_t bracketColumn) { return bracketColumn + options.indent; };

    std::visit(cxxutils::multilambda(
        [&] (ValueVector const& v)
        {
            out += '[';
            for (std::size_t i = 0; i < v.size(); ++i)
            {
                if (i != 0)
                    breakLine(childColumn(column));

                writeIndented(out, *v[i], childColumn(column), options);
            }
            out += ']';
        },
        [&] (ValueSet const& s)
        {
            out += "#{";
            auto first = true;
            for (auto const& element : sortedElements(s))
            {
                if (! std::exchange(first, false))
                    breakLine(childColumn(column + 1));

                out += element;
            }
            out += '}';
        },
        [&] (Map const& m)
        {
            auto bracket = column;
            if (auto const tag = tagFor(m))
            {
                out += '#' + *tag;
                bracket += tag->size() + 1;
            }

            out += '{';
            auto first = true;
            for (auto const& [key, val] : sortedKeys(m))
            {
                if (! std::exchange(first, false))
                {
                    out += ',';
                    breakLine(childColumn(bracket));
                }

                out += key;
                out += ' ';
                writeIndented(out, *val, childColumn(bracket) + key.size() + 1, options);
            }
            out += '}';
        },
        [&] (Tagged const& t)
        {
            out += '#' + t.tag + ' ';
            writeIndented(out, *t.value, column + t.tag.size() + 2, options);
        },
        [&] (auto const&)
        {
            out += compact;
        }
    ), value.data);
}
} // namespace

std::string write(Value const& value)
{
    std::string out;
    writeCompact(out, value);
    return out;
}

std::string writePretty(Value const& value, WriterOptions const& options)
{
    std::string out;
    writeIndented(out, value, 0, options);
    return out;
}

void writePretty(std::ostream& out, Value const& value, WriterOptions const& options)
{
    out << writePretty(value, options);
}

//=============================================================================
// TagRegistry
//=============================================================================
TagRegistry& TagRegistry::instance()
{
    static TagRegistry registry;
    return registry;
}

void TagRegistry::add(std::string tag, std::string typeKey, SchemaDescriptor const* schema)
{
    std::lock_guard guard(lock);

    std::erase_if(entries, [&tag, &typeKey] (Entry const& e) { return e.tag == tag || e.typeKey == typeKey; });
    entries.push_back(Entry { std::move(tag), std::move(typeKey), schema });
}

bool TagRegistry::remove(std::string_view typeKey)
{
    std::lock_guard guard(lock);
    return std::erase_if(entries, [typeKey] (Entry const& e) { return e.typeKey == typeKey; }) != 0;
}

std::optional<TagRegistry::Entry> TagRegistry::byTag(std::string_view tag) const
{
    std::lock_guard guard(lock);

    if (auto it = std::ranges::find(entries, tag, &Entry::tag); it != entries.end())
        return *it;

    return std::nullopt;
}

std::optional<TagRegistry::Entry> TagRegistry::byType(std::string_view typeKey) const
{
    std::lock_guard guard(lock);

    if (auto it = std::ranges::find(entries, typeKey, &Entry::typeKey); it != entries.end())
        return *it;

    return std::nullopt;
}
} // namespace dynobj::edn

namespace dynobj
{
std::ostream& operator<<(std::ostream& o, Value const& x)
{
    return o << edn::write(x);
}

std::ostream& operator<<(std::ostream& o, Map const& x)
{
    return o << edn::write(x);
}
} // namespace dynobj
