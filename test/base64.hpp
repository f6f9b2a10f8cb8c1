#pragma once

#include <durl/util/log.hpp>
#include <durl/util/base64.hpp>
#include <vector>

#define DOCTEST_CONFIG_TREAT_CHAR_STAR_AS_STRING
#include <doctest/doctest.h>


TEST_SUITE("base64"){

using namespace durl;

TEST_CASE("base64 codec"){

    char const* cases[][2] = {
        {"This is Sparta", "VGhpcyBpcyBTcGFydGE="},
        {"f"             , "Zg=="                },
        {"fo"            , "Zm8="                },
        {"foo"           , "Zm9v"                },
        {"foob"          , "Zm9vYg=="            },
        {""              , ""                    },
    };

    for(auto [plain, encoded] : cases)
    {
        CHECK(base64::encoded(string_view{plain}) == encoded);
        CHECK(base64::decoded(string_view{encoded}).value() == plain);
    }

    std::vector<unsigned char> bytes = {0x00, 0xFF, 0x10};
    CHECK(base64::encoded(bytes) == "AP8Q");
    CHECK(base64::decoded<std::vector<unsigned char>>(string_view{"AP8Q"}).value() == bytes);

    string d = "x";
    base64::encode_append(d, string_view{"foo"});
    CHECK(d == "xZm9v");

    CHECK(base64::decode_assign(d, string_view{"Zm8="}).no_error());
    CHECK(d == "fo");

} // TEST_CASE("base64 codec")


TEST_CASE("base64 decode errors"){

    constexpr auto fails = [](string_view s)
    {
        auto r = base64::decoded(s);
        return r.has_error() && r.error() == make_error_code(cppcodec_err::decode_failed);
    };

    CHECK(fails("aGVsbG8gd29yb"));
    CHECK(fails("aGVs_-_-"));
    CHECK(fails("not base64!"));
    CHECK(fails("@@@@"));

    // the buffer is left as it was
    string d = "keep";
    CHECK(base64::decode_append(d, string_view{"@@@@"}).has_error());
    CHECK(d == "keep");

    CHECK(make_error_code(cppcodec_err::decode_failed).message() == "decode failed");

} // TEST_CASE("base64 decode errors")


} // TEST_SUITE("base64")
