#pragma once

#include <cstddef>
#include <boost/config.hpp>
#include <boost/assert.hpp>


// text encoding used when caller doesn't name one,
// any name accepted by ucnv_open() works.
#ifndef DURL_DEFAULT_CHARSET
#   define DURL_DEFAULT_CHARSET "UTF-8"
#endif


// msvc fails on some abbreviated function templates unless they are spelled as templates
#ifdef BOOST_MSVC
#   define _DURL_MSVC_WORKAROUND_TEMPL_FUN_ABBR template<int = 0>
#else
#   define _DURL_MSVC_WORKAROUND_TEMPL_FUN_ABBR
#endif


namespace durl{


using size_t = std::size_t;


_DURL_MSVC_WORKAROUND_TEMPL_FUN_ABBR
constexpr bool is_oneof(auto const& v, auto const&... es) noexcept
{
    return (... || (v == es));
}


} // namespace durl
