#pragma once

#include <durl/config.hpp>
#include <durl/util/str.hpp>
#include <array>


namespace durl{


// locale independent, anything >= 0x80 is neither alnum nor space.

enum ascii_class : unsigned char
{
    ascii_alnum = 0x01,
    ascii_space = 0x02,
};

inline constexpr auto g_ascii_class_lut = []()
{
    std::array<unsigned char, 256> t{};

    for(int c = '0'; c <= '9'; ++c) t[c] |= ascii_alnum;
    for(int c = 'A'; c <= 'Z'; ++c) t[c] |= ascii_alnum;
    for(int c = 'a'; c <= 'z'; ++c) t[c] |= ascii_alnum;

    for(unsigned char c : {' ', '\t', '\n', '\v', '\f', '\r'})
        t[c] |= ascii_space;

    return t;
}();


constexpr bool ascii_isalnum(char c) noexcept
{
    return g_ascii_class_lut[static_cast<unsigned char>(c)] & ascii_alnum;
}

constexpr bool ascii_isspace(char c) noexcept
{
    return g_ascii_class_lut[static_cast<unsigned char>(c)] & ascii_space;
}

constexpr char ascii_tolower(char c) noexcept
{
    return ('A' <= c && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}


constexpr string_view ascii_trimed_view(string_view s) noexcept
{
    while(! s.empty() && ascii_isspace(s.front()))
        s.remove_prefix(1);
    while(! s.empty() && ascii_isspace(s.back()))
        s.remove_suffix(1);
    return s;
}

constexpr bool ascii_iequal(string_view l, string_view r) noexcept
{
    if(l.size() != r.size())
        return false;

    for(size_t i = 0; i < l.size(); ++i)
    {
        if(ascii_tolower(l[i]) != ascii_tolower(r[i]))
            return false;
    }
    return true;
}

constexpr bool ascii_istarts_with(string_view s, string_view prefix) noexcept
{
    return s.size() >= prefix.size() && ascii_iequal(s.substr(0, prefix.size()), prefix);
}


} // namespace durl
