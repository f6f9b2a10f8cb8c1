#pragma once

#include <durl/config.hpp>
#include <durl/error.hpp>
#include <durl/result.hpp>
#include <durl/util/buf.hpp>
#include <durl/util/log.hpp>
#include <durl/util/str.hpp>
#include <cppcodec/base64_rfc4648.hpp>


namespace durl{


enum class cppcodec_err
{
    decode_failed = 1,
};

class cppcodec_err_category : public aerror_category
{
public:
    char const* name() const noexcept override { return "cppcodec"; }

    std::string message(int condition) const override
    {
        if(condition == static_cast<int>(cppcodec_err::decode_failed))
            return "decode failed";
        return "undefined";
    }
};

inline constexpr cppcodec_err_category g_cppcodec_err_cat;
inline auto const& cppcodec_err_cat() noexcept { return g_cppcodec_err_cat; }

inline aerror_code make_error_code(cppcodec_err e) noexcept { return {static_cast<int>(e), cppcodec_err_cat()}; }


} // namespace durl


namespace boost::system{

template<> struct is_error_code_enum<durl::cppcodec_err> : public std::true_type {};

} // namespace boost::system


namespace durl{


// byte buf oriented front end for a cppcodec codec,
// parse errors are reported as cppcodec_err::decode_failed instead of thrown.
template<class Codec>
struct cppcodec_wrapper
{
    static void encode_append(_resizable_byte_buf_ auto& d, _byte_str_ auto const& s)
    {
        string_view const src = as_char_view(s);
        size_t const n = Codec::encoded_size(src.size());
        Codec::encode(reinterpret_cast<char*>(buy_buf(d, n)), n, src.data(), src.size());
    }

    template<_resizable_byte_buf_ B = string>
    static B encoded(_byte_str_ auto const& s)
    {
        B d;
        encode_append(d, s);
        return d;
    }

    // on error d is left unchanged
    static aresult<> decode_append(_resizable_byte_buf_ auto& d, _byte_str_ auto const& s)
    {
        string_view const src = as_char_view(s);
        size_t const off = buf_size(d);
        size_t n = Codec::decoded_max_size(src.size());

        try
        {
            n = Codec::decode(reinterpret_cast<char*>(buy_buf(d, n)), n, src.data(), src.size());
        }
        catch(cppcodec::parse_error const& e)
        {
            resize_buf(d, off);
            DURL_DEBUG << "base64 decode: " << e.what();
            return cppcodec_err::decode_failed;
        }

        resize_buf(d, off + n);
        return no_err;
    }

    static aresult<> decode_assign(_resizable_byte_buf_ auto& d, _byte_str_ auto const& s)
    {
        resize_buf(d, 0);
        return decode_append(d, s);
    }

    template<_resizable_byte_buf_ B = string>
    static aresult<B> decoded(_byte_str_ auto const& s)
    {
        B d;
        DURL_TRY(decode_append(d, s));
        return d;
    }
};


// standard alphabet, '=' padded.
using base64 = cppcodec_wrapper<cppcodec::base64_rfc4648>;


} // namespace durl
