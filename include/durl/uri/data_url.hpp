#pragma once

#include <durl/config.hpp>
#include <durl/error.hpp>
#include <durl/result.hpp>
#include <durl/util/str.hpp>
#include <durl/util/log.hpp>
#include <durl/util/base64.hpp>
#include <durl/charset/ascii.hpp>
#include <durl/charset/icu.hpp>
#include <durl/uri/url_codec.hpp>
#include <cstring>
#include <exception>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>


namespace durl{


enum class data_url_err
{
    null_input = 1,
    not_data_url,
    no_comma
};

class data_url_err_category : public aerror_category
{
public:
    char const* name() const noexcept override { return "data_url"; }

    std::string message(int condition) const override
    {
        switch(condition)
        {
            case static_cast<int>(data_url_err::null_input) :
                return "can not handle null values";
            case static_cast<int>(data_url_err::not_data_url) :
                return "does not begin with 'data:'";
            case static_cast<int>(data_url_err::no_comma) :
                return "missing comma sign";
        }

        return "undefined";
    }
};

inline constexpr data_url_err_category g_data_url_err_cat;
inline auto const& data_url_err_cat() noexcept { return g_data_url_err_cat; }

inline aerror_code make_error_code(data_url_err e) noexcept { return {static_cast<int>(e), data_url_err_cat()}; }


} // namespace durl


namespace boost::system{

template<> struct is_error_code_enum<durl::data_url_err> : public std::true_type {};

} // namespace boost::system


namespace durl{


// ref: https://tools.ietf.org/html/rfc2397
//
// dataurl    := "data:" [ mediatype ] [ ";base64" ] "," data
// mediatype  := [ type "/" subtype ] *( ";" parameter )
// data       := *urlchar
// parameter  := attribute "=" value
//
// mediatype and data are kept verbatim. Parameters are form encoded.


// thrown by data_url(u), carries the rejected input.
class data_url_parse_error : public asystem_error
{
    string _input;

public:
    data_url_parse_error(aerror_code const& ec, string input)
        : asystem_error{ec, "dataUrl=\"" + input + "\""}, _input{std::move(input)}
    {}

    string const& input() const noexcept { return _input; }
};


using data_url_param  = std::pair<string, string>;
using data_url_params = std::vector<data_url_param>;


class data_url;

aresult<data_url> parse_data_url(string_view u);
aresult<data_url> parse_data_url(char const* u);


class data_url
{
    string          _content; // base64 text if _is_base64, otherwise raw bytes
    string          _type;
    bool            _is_base64 = false;
    data_url_params _params;

    data_url(string content, string type, bool isBase64, data_url_params params) noexcept
        : _content{std::move(content)}, _type{std::move(type)}, _is_base64{isBase64}, _params{std::move(params)}
    {}

    static data_url value_or_throw(aresult<data_url>&& r, string_view u);

    friend aresult<data_url> parse_data_url(string_view u);

public:
    // throws data_url_parse_error
    explicit data_url(string_view u);
    explicit data_url(char const* u);

    static aresult<data_url> parse(string_view u);
    static aresult<data_url> parse(char const* u);

    static data_url from_bytes(_byte_str_ auto const& bytes, string type, data_url_params params = {})
    {
        return {base64::encoded(bytes), std::move(type), true, std::move(params)};
    }

    // b64 is stored as is, it's only validated on read.
    static data_url from_base64(string_view b64, string type, data_url_params params = {})
    {
        return {string{b64}, std::move(type), true, std::move(params)};
    }

    // text is utf-8, it's stored as bytes in charset.
    static aresult<data_url> from_text(string_view text, string type, data_url_params params = {},
                                       string_view charset = DURL_DEFAULT_CHARSET);

    string          const& content  () const noexcept { return _content;   }
    string          const& type     () const noexcept { return _type;      }
    bool                   is_base64() const noexcept { return _is_base64; }
    data_url_params const& params   () const noexcept { return _params;    }

    // value of first parameter matching key case-insensitively
    std::optional<string_view> find_param(string_view key) const noexcept
    {
        for(auto const& [k, v] : _params)
        {
            if(ascii_iequal(k, key))
                return v;
        }
        return std::nullopt;
    }

    string_view charset() const noexcept
    {
        return find_param("charset").value_or(string_view{});
    }

    template<_resizable_byte_buf_ B = string>
    aresult<B> read_as_bytes() const
    {
        if(_is_base64)
            return base64::decoded<B>(_content);

        B d;
        resize_buf(d, _content.size());
        if(! _content.empty())
            std::memcpy(buf_data(d), _content.data(), _content.size());
        return d;
    }

    aresult<string> read_as_string(string_view charset = DURL_DEFAULT_CHARSET) const
    {
        DURL_TRY(auto bytes, read_as_bytes());
        return decode_text(bytes, charset);
    }

    string read_as_base64() const
    {
        if(_is_base64)
            return _content;
        return base64::encoded(_content);
    }

    string to_string() const
    {
        string d = "data:";
        d += _type;

        if(_is_base64)
            d += ";base64";

        for(auto const& [k, v] : _params)
        {
            d += ';';
            url_encode_append(d, k);
            d += '=';
            url_encode_append(d, v);
        }

        d += ',';
        d += _content;
        return d;
    }

    bool operator==(data_url const&) const = default;

    friend std::ostream& operator<<(std::ostream& os, data_url const& u)
    {
        return os << u.to_string();
    }
};


namespace detail{

inline aerror_code data_url_failed(string_view u, data_url_err e)
{
    aerror_code ec = e;
    DURL_DEBUG << "parse_data_url(): " << ec.message() << " (dataUrl=\"" << u << "\")";
    return ec;
}

} // namespace detail


inline aresult<data_url> parse_data_url(string_view u)
{
    if(! ascii_istarts_with(u, "data:"))
        return detail::data_url_failed(u, data_url_err::not_data_url);

    string_view head = u.substr(5);

    auto q = head.find(',');
    if(q == npos)
        return detail::data_url_failed(u, data_url_err::no_comma);

    string_view const data = head.substr(q + 1);
    head = head.substr(0, q);

    q = head.find(';');
    string_view const type = head.substr(0, q);

    bool isBase64 = false;
    data_url_params params;

    while(q != npos)
    {
        head.remove_prefix(q + 1);
        q = head.find(';');

        string_view const item = head.substr(0, q);
        auto const eq = item.find('=');

        string_view const key = ascii_trimed_view(item.substr(0, eq));
        string_view const val = eq == npos ? string_view{} : ascii_trimed_view(item.substr(eq + 1));

        // flag is matched before unescaping, its value is dropped.
        if(ascii_iequal(key, "base64"))
        {
            isBase64 = true;
            continue;
        }

        // malformed escapes are kept literally, they never fail the parse.
        params.emplace_back(url_decode_lenient_ret(key), url_decode_lenient_ret(val));
    }

    return data_url{string{data}, string{type}, isBase64, std::move(params)};
}

inline aresult<data_url> parse_data_url(char const* u)
{
    if(! u)
        return detail::data_url_failed("(null)", data_url_err::null_input);
    return parse_data_url(string_view{u});
}



inline data_url data_url::value_or_throw(aresult<data_url>&& r, string_view u)
{
    if(r.has_error())
        throw data_url_parse_error{r.error(), string{u}};
    return std::move(r).value();
}

inline data_url::data_url(string_view u)
    : data_url{value_or_throw(parse_data_url(u), u)}
{}

inline data_url::data_url(char const* u)
    : data_url{value_or_throw(parse_data_url(u), u ? string_view{u} : string_view{})}
{}

inline aresult<data_url> data_url::parse(string_view u) { return parse_data_url(u); }
inline aresult<data_url> data_url::parse(char const* u) { return parse_data_url(u); }

inline aresult<data_url> data_url::from_text(string_view text, string type, data_url_params params, string_view charset)
{
    DURL_TRY(auto bytes, encode_text(text, charset));
    return from_bytes(bytes, std::move(type), std::move(params));
}

// never throws, any failure yields nullopt.
_DURL_MSVC_WORKAROUND_TEMPL_FUN_ABBR
std::optional<data_url> try_parse_data_url(auto const& u) noexcept requires(requires{ parse_data_url(u); })
{
    try
    {
        if(auto r = parse_data_url(u))
            return std::move(r.value());
    }
    catch(std::exception const& e)
    {
        DURL_WARN << "try_parse_data_url(): unhandled exception: " << e.what();
    }
    catch(...)
    {
        DURL_WARN << "try_parse_data_url(): unhandled unknown exception";
    }

    return std::nullopt;
}


} // namespace durl
