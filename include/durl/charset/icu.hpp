#pragma once

#include <durl/config.hpp>
#include <durl/error.hpp>
#include <durl/result.hpp>
#include <durl/util/str.hpp>
#include <durl/util/handle.hpp>
#include <algorithm>
#include <cstdint>
#include <unicode/utypes.h>
#include <unicode/ucnv.h>


namespace durl{


class icu_err_category : public aerror_category
{
public:
    char const* name() const noexcept override { return "icu"; }

    std::string message(int rc) const override
    {
        return u_errorName(static_cast<UErrorCode>(rc));
    }
};

inline constexpr icu_err_category g_icu_err_cat;
inline auto const& icu_err_cat() noexcept { return g_icu_err_cat; }


} // namespace durl


namespace boost::system{

template<> struct is_error_code_enum<UErrorCode> : public std::true_type {};

} // namespace boost::system

// UErrorCode lives in the global namespace, so must its make_error_code
inline durl::aerror_code make_error_code(UErrorCode e) noexcept { return {static_cast<int>(e), durl::icu_err_cat()}; }


namespace durl{


// ignores case and '-', '_', ' ', so "utf-8" equals "UTF8"
inline bool icu_equal_name(string_view n1, string_view n2)
{
    return ucnv_compareNames(as_cstr(n1).c_str(), as_cstr(n2).c_str()) == 0;
}


// ICU counts in int32_t, longer inputs are refused instead of truncated
inline aresult<int32_t> icu_length(size_t n)
{
    if(n > static_cast<size_t>(INT32_MAX))
        return U_INDEX_OUTOFBOUNDS_ERROR;
    return static_cast<int32_t>(n);
}


// one charset <=> utf-16.
// unmappable characters are substituted, never reported as errors.
class icu_charset
{
    unique_handle<UConverter, ucnv_close> _h;

    explicit icu_charset(UConverter* h) noexcept : _h{h} {}

    // runs f(dst, capacity, &err) once, and again with the reported size on overflow
    template<class Buf>
    static aresult<> fill(Buf& d, int32_t guess, auto&& f)
    {
        d.resize(static_cast<size_t>(guess));

        UErrorCode e = U_ZERO_ERROR;
        int32_t n = f(d.data(), static_cast<int32_t>(d.size()), &e);

        if(e == U_BUFFER_OVERFLOW_ERROR)
        {
            d.resize(static_cast<size_t>(n));
            e = U_ZERO_ERROR;
            n = f(d.data(), static_cast<int32_t>(d.size()), &e);
        }

        if(U_FAILURE(e))
            return e;

        d.resize(static_cast<size_t>(n));
        return no_err;
    }

public:
    icu_charset() = default;

    static aresult<icu_charset> open(string_view name)
    {
        UErrorCode e = U_ZERO_ERROR;
        UConverter* h = ucnv_open(as_cstr(name).c_str(), &e);

        // e may only carry a warning when h is valid, e.g. U_AMBIGUOUS_ALIAS_WARNING
        if(h && U_SUCCESS(e))
            return icu_charset{h};
        if(h)
            ucnv_close(h);
        return U_FAILURE(e) ? e : U_ILLEGAL_ARGUMENT_ERROR;
    }

    aresult<> from_u16(u16string_view s, string& d)
    {
        auto const sd = reinterpret_cast<UChar const*>(s.data());
        DURL_TRY(int32_t const sn, icu_length(s.size()));

        // the worst case may not fit, the overflow retry then asks for the real size
        int64_t const guess = (static_cast<int64_t>(sn) + 10) * ucnv_getMaxCharSize(_h.get());

        return fill(d, static_cast<int32_t>(std::min<int64_t>(guess, INT32_MAX)),
            [&](char* p, int32_t cap, UErrorCode* e){ return ucnv_fromUChars(_h.get(), p, cap, sd, sn, e); });
    }

    aresult<> to_u16(string_view s, u16string& d)
    {
        DURL_TRY(int32_t const sn, icu_length(s.size()));

        return fill(d, sn < INT32_MAX ? sn + 1 : sn,
            [&](char16_t* p, int32_t cap, UErrorCode* e){
                return ucnv_toUChars(_h.get(), reinterpret_cast<UChar*>(p), cap, s.data(), sn, e);
            });
    }
};


// converts between two charsets through utf-16
class icu_charset_cvt
{
public:
    icu_charset src;
    icu_charset dst;

    static aresult<icu_charset_cvt> open(string_view srcName, string_view dstName)
    {
        icu_charset_cvt cvt;
        DURL_TRY(cvt.src, icu_charset::open(srcName));
        DURL_TRY(cvt.dst, icu_charset::open(dstName));
        return cvt;
    }

    static aresult<string> to_dst(string_view srcName, _byte_str_ auto const& s, string_view dstName)
    {
        DURL_TRY(auto cvt, open(srcName, dstName));
        string d;
        DURL_TRY(cvt.forward(as_char_view(s), d));
        return d;
    }

    aresult<> forward(string_view s, string& d)
    {
        u16string t;
        DURL_TRY(src.to_u16(s, t));
        return dst.from_u16(t, d);
    }

    aresult<> inverse(string_view s, string& d)
    {
        u16string t;
        DURL_TRY(dst.to_u16(s, t));
        return src.from_u16(t, d);
    }
};


// utf-8 text => bytes in charset
inline aresult<string> encode_text(string_view text, string_view charset)
{
    return icu_charset_cvt::to_dst("UTF-8", text, charset);
}

// bytes in charset => utf-8 text
inline aresult<string> decode_text(_byte_str_ auto const& bytes, string_view charset)
{
    return icu_charset_cvt::to_dst(charset, bytes, "UTF-8");
}


} // namespace durl
