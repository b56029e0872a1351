#pragma once

#include <type_traits>
#include <tuple>
#include <utility>
#include <concepts>
#include <optional>
#include <string_view>
#include <boost/pfr.hpp>
#include <fixed_string.hpp>

namespace dynobj
{

// Forward declarations needed by detail namespace
enum class Presence;
template <typename T, fixstr::fixed_string Name, Presence P> class Field;
template <typename T, fixstr::fixed_string Name> class Meta;
template <typename T> class Instance;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/**
 * @brief Filters a tuple, keeping only elements that satisfy the Predicate
 *
 * @tparam Predicate A template that provides a ::value bool for each type
 * @param tp The tuple to filter
 * @return A new tuple containing only elements where Predicate<T>::value is true
 */
template <template<typename> class Predicate, typename Tuple>
auto filter_tuple(Tuple&& tp)
{
    return std::apply([]<typename... Ts>(Ts&&... args) {
        auto maybe_keep = []<typename T>(T&& arg) {
            if constexpr (Predicate<T>::value)
                return std::tuple<T>(std::forward<T>(arg));
            else
                return std::tuple<>();
        };
        return std::tuple_cat(maybe_keep(std::forward<Ts>(args))...);
    }, std::forward<Tuple>(tp));
}

//-----------------------------------------------------------------------------
// Accessor member detection
//-----------------------------------------------------------------------------

template <typename T> struct is_member_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name, Presence P> struct is_member_helper<Field<T, Name, P>> : std::true_type {};
template <typename T, fixstr::fixed_string Name> struct is_member_helper<Meta<T, Name>> : std::true_type {};

/// Predicate that is true for Field<> and Meta<> members of a schema
template <typename T> struct is_member { static constexpr auto value = is_member_helper<std::decay_t<T>>::value; };

/// Helper to decay all types in a tuple
template <typename T> struct decay_tuple;
template <typename... Types> struct decay_tuple<std::tuple<Types...>>
{
    using type = std::tuple<std::decay_t<Types>...>;
};

/// References to all accessor members of a schema facade, in declaration order
template <typename T>
auto members_tie(T& facade)
{
    return filter_tuple<is_member>(boost::pfr::structure_tie(facade));
}

/// The decayed accessor member types of schema T
template <typename T>
using members_of = typename decay_tuple<decltype(members_tie(std::declval<T&>()))>::type;

template <typename T>
constexpr std::size_t num_members() { return std::tuple_size_v<members_of<T>>; }

//-----------------------------------------------------------------------------
// Compile-time member lookup by name
//-----------------------------------------------------------------------------

/// Index of the member called Name, or num_members<T>() if there is none
template <typename T, fixstr::fixed_string Name>
consteval std::size_t member_index()
{
    return [] <std::size_t... Is> (std::index_sequence<Is...>)
    {
        auto result = sizeof...(Is);
        ([&result]
        {
            if (result == sizeof...(Is)
                && std::string_view(std::tuple_element_t<Is, members_of<T>>::kName) == std::string_view(Name))
                result = Is;
        }(), ...);
        return result;
    }(std::make_index_sequence<num_members<T>()>());
}

template <typename T, fixstr::fixed_string Name>
using member_named = std::tuple_element_t<member_index<T, Name>(), members_of<T>>;

/// True if no two accessor members of T share a name
template <typename T>
consteval bool has_unique_names()
{
    return [] <std::size_t... Is> (std::index_sequence<Is...>)
    {
        std::string_view names[] = { std::string_view(std::tuple_element_t<Is, members_of<T>>::kName)..., {} };

        for (std::size_t i = 0; i < sizeof...(Is); ++i)
            for (std::size_t j = i + 1; j < sizeof...(Is); ++j)
                if (names[i] == names[j])
                    return false;

        return true;
    }(std::make_index_sequence<num_members<T>()>());
}

//-----------------------------------------------------------------------------
// Declared type shapes
//-----------------------------------------------------------------------------

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail

} // namespace dynobj
