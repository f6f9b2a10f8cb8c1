#pragma once

#include <durl/util/buf.hpp>
#include <durl/util/concepts.hpp>
#include <string>
#include <string_view>


namespace durl{


using string         = std::string;
using string_view    = std::string_view;
using u16string      = std::u16string;
using u16string_view = std::u16string_view;

inline constexpr size_t npos = string_view::npos;


// a str is a buf of char like elements, or a null terminated char pointer.

template<_buf_ S>
constexpr auto* str_data(S& s) noexcept requires(_char_<buf_value_t<S>>) { return buf_data(s); }

template<_buf_ S>
constexpr size_t str_size(S& s) noexcept requires(_char_<buf_value_t<S>>) { return buf_size(s); }

constexpr char const* str_data(char const* s) noexcept { return s; }
constexpr size_t      str_size(char const* s) noexcept { return std::char_traits<char>::length(s); }


template<class S>
concept _str_ = requires(S s){ str_data(s); str_size(s); };

template<_str_ S>
using str_value_t = std::remove_cvref_t<decltype(*str_data(std::declval<S&>()))>;

template<class S>
concept _byte_str_ = _str_<S> && _byte_<str_value_t<S>>;


// null terminated copy, for C apis.
inline string as_cstr(string_view s)
{
    return string{s};
}

// view bytes of any byte str as chars.
_DURL_MSVC_WORKAROUND_TEMPL_FUN_ABBR
string_view as_char_view(_byte_str_ auto const& s) noexcept
{
    return {reinterpret_cast<char const*>(str_data(s)), str_size(s)};
}


} // namespace durl
