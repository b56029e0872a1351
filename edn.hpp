/**
 * @file edn.hpp
 * @brief Reader and writer for EDN text
 *
 * Reads and writes the subset of EDN that maps onto dynobj::Value: nil,
 * booleans, integers, floating point numbers, strings, characters (read as
 * one-character strings), keywords, vectors, lists (read as vectors), sets,
 * maps, #inst timestamps and tagged literals.
 *
 * Symbols have no dynobj::Value counterpart: a bare symbol such as foo,
 * my/name or + is rejected with a ParseError, wherever it appears. Lists
 * and characters are accepted on input only, so they are written back as
 * vectors and strings.
 *
 * Tagged literals whose tag is registered with the TagRegistry are decoded to
 * a map carrying the registered schema's type key in its metadata. Writing
 * such a map emits the tag again. All other tagged literals are preserved as
 * dynobj::Tagged.
 *
 * The writer is deterministic: map entries and set elements are emitted in the
 * order of their encoded text.
 */

#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <format>

#include "value.hpp"

namespace dynobj
{
class SchemaDescriptor;

namespace edn
{
class ParseError : public std::runtime_error
{
public:
    ParseError(std::string const& message, std::size_t offset_);

    /// Byte offset into the input at which reading failed
    std::size_t offset() const noexcept { return position; }

private:
    std::size_t position;
};

/// Layout of the pretty printer
struct WriterOptions
{
    /// Collections whose compact form fits into this many columns stay on one line
    std::size_t width = 80;

    /// Extra indentation of continuation lines relative to the opening bracket
    std::size_t indent = 1;
};

/**
 * @brief Reads exactly one form from text
 *
 * Leading and trailing whitespace, commas and comments are ignored. Anything
 * else after the first form is an error.
 *
 * @throws ParseError
 */
Value read(std::string_view text);

/// Compact single-line form
std::string write(Value const& value);

/// Multi-line form, breaking collections that exceed options.width
std::string writePretty(Value const& value, WriterOptions const& options = {});
void writePretty(std::ostream& out, Value const& value, WriterOptions const& options = {});

/**
 * @brief Process wide, bidirectional mapping between tags and schema types
 *
 * A tag and a type key are bound to each other at most once: adding a binding
 * removes any earlier binding of either side. Every call is one atomic change.
 */
class TagRegistry
{
public:
    struct Entry
    {
        std::string tag;
        std::string typeKey;
        SchemaDescriptor const* schema = nullptr;
    };

    static TagRegistry& instance();

    void add(std::string tag, std::string typeKey, SchemaDescriptor const* schema);

    /// Returns false if nothing was registered for typeKey
    bool remove(std::string_view typeKey);

    std::optional<Entry> byTag(std::string_view tag) const;
    std::optional<Entry> byType(std::string_view typeKey) const;

private:
    TagRegistry() = default;

    mutable std::mutex lock;
    std::vector<Entry> entries;
};
} // namespace edn

std::ostream& operator<<(std::ostream& o, Value const& x);
std::ostream& operator<<(std::ostream& o, Map const& x);
} // namespace dynobj

template <>
struct std::formatter<dynobj::Value> : std::formatter<std::string>
{
    auto format(dynobj::Value const& v, format_context& ctx) const
    {
        return std::formatter<std::string>::format(dynobj::edn::write(v), ctx);
    }
};

template <>
struct std::formatter<dynobj::Map> : std::formatter<dynobj::Value> {};
