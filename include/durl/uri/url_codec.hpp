#pragma once

#include <durl/config.hpp>
#include <durl/error.hpp>
#include <durl/result.hpp>
#include <durl/util/buf.hpp>
#include <durl/util/str.hpp>
#include <durl/charset/ascii.hpp>


namespace durl{


enum class url_codec_err
{
    invalid_escape = 1
};

class url_codec_err_category : public aerror_category
{
public:
    char const* name() const noexcept override { return "url_codec"; }

    std::string message(int condition) const override
    {
        if(condition == static_cast<int>(url_codec_err::invalid_escape))
            return "'%' not followed by two hex digits";
        return "undefined";
    }
};

inline constexpr url_codec_err_category g_url_codec_err_cat;
inline auto const& url_codec_err_cat() noexcept { return g_url_codec_err_cat; }

inline aerror_code make_error_code(url_codec_err e) noexcept { return {static_cast<int>(e), url_codec_err_cat()}; }


} // namespace durl


namespace boost::system{

template<> struct is_error_code_enum<durl::url_codec_err> : public std::true_type {};

} // namespace boost::system


namespace durl{


// application/x-www-form-urlencoded style, as used for data url parameters:
//   [A-Za-z0-9] and "-_.!*()"  as is
//   ' '                        '+'
//   anything else              "%XX", upper case hex
// decoding reverses it, '+' always becomes ' '.
namespace url_codec{


constexpr bool is_unreserved(char c) noexcept
{
    return ascii_isalnum(c) || is_oneof(c, '-', '_', '.', '!', '*', '(', ')');
}

// -1 if not a hex digit
constexpr int hex_value(char c) noexcept
{
    if('0' <= c && c <= '9') return c - '0';
    if('A' <= c && c <= 'F') return c - 'A' + 10;
    if('a' <= c && c <= 'f') return c - 'a' + 10;
    return -1;
}

constexpr char* encode(char* d, string_view s) noexcept
{
    constexpr char const* hex = "0123456789ABCDEF";

    for(char c : s)
    {
        if(c == ' ')
        {
            *d++ = '+';
        }
        else if(is_unreserved(c))
        {
            *d++ = c;
        }
        else
        {
            auto const u = static_cast<unsigned char>(c);
            *d++ = '%';
            *d++ = hex[u >> 4];
            *d++ = hex[u & 0xf];
        }
    }

    return d;
}

// byte value of the escape "%XX" starting at s[i], -1 if it isn't one
constexpr int escaped_value(string_view s, size_t i) noexcept
{
    if(i + 2 >= s.size())
        return -1;

    int const hi = hex_value(s[i + 1]);
    int const lo = hex_value(s[i + 2]);
    if(hi < 0 || lo < 0)
        return -1;
    return (hi << 4) | lo;
}

// d must hold at least s.size() chars, returns end of written chars.
inline aresult<char*> decode(char* d, string_view s)
{
    for(size_t i = 0; i < s.size(); ++i)
    {
        char const c = s[i];

        if(c == '+')
        {
            *d++ = ' ';
        }
        else if(c == '%')
        {
            int const v = escaped_value(s, i);
            if(v < 0)
                return url_codec_err::invalid_escape;

            *d++ = static_cast<char>(v);
            i += 2;
        }
        else
        {
            *d++ = c;
        }
    }

    return d;
}

// same as decode(), but a malformed escape is kept as is.
constexpr char* decode_lenient(char* d, string_view s) noexcept
{
    for(size_t i = 0; i < s.size(); ++i)
    {
        char const c = s[i];
        int  const v = c == '%' ? escaped_value(s, i) : -1;

        if(c == '+')
        {
            *d++ = ' ';
        }
        else if(v >= 0)
        {
            *d++ = static_cast<char>(v);
            i += 2;
        }
        else
        {
            *d++ = c;
        }
    }

    return d;
}


} // namespace url_codec


void url_encode_append(_resizable_char_buf_ auto& encoded, string_view s)
{
    size_t const off = buf_size(encoded);
    char* const d = buy_buf(encoded, s.size() * 3);
    resize_buf(encoded, off + (url_codec::encode(d, s) - d));
}

template<_resizable_char_buf_ B = string>
B url_encode_ret(string_view s)
{
    B encoded;
    url_encode_append(encoded, s);
    return encoded;
}


// on error decoded is left unchanged
aresult<> url_decode_append(_resizable_char_buf_ auto& decoded, string_view s)
{
    size_t const off = buf_size(decoded);
    char* const d = buy_buf(decoded, s.size());

    auto r = url_codec::decode(d, s);
    if(r.has_error())
    {
        resize_buf(decoded, off);
        return r.error();
    }

    resize_buf(decoded, off + (r.value() - d));
    return no_err;
}

template<_resizable_char_buf_ B = string>
aresult<B> url_decode_ret(string_view s)
{
    B decoded;
    DURL_TRY(url_decode_append(decoded, s));
    return decoded;
}


// never fails, see url_codec::decode_lenient()
void url_decode_lenient_append(_resizable_char_buf_ auto& decoded, string_view s)
{
    size_t const off = buf_size(decoded);
    char* const d = buy_buf(decoded, s.size());
    resize_buf(decoded, off + (url_codec::decode_lenient(d, s) - d));
}

template<_resizable_char_buf_ B = string>
B url_decode_lenient_ret(string_view s)
{
    B decoded;
    url_decode_lenient_append(decoded, s);
    return decoded;
}


} // namespace durl
