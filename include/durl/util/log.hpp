#pragma once

#include <iostream>


namespace durl{


// writes one line per statement, the line is finished when the temporary dies:
//
//     DURL_WARN << "bad input: " << s;
//
template<class Stream>
class log_line
{
    Stream& _s;

public:
    log_line(Stream& s, char const* tag) : _s{s}
    {
        _s << "[durl] " << tag;
    }

    log_line(log_line const&) = delete;
    log_line& operator=(log_line const&) = delete;

    ~log_line()
    {
        _s << std::endl;
    }

    template<class T>
    log_line& operator<<(T const& t)
    {
        _s << t;
        return *this;
    }
};


struct null_log_line
{
    template<class T>
    null_log_line& operator<<(T const&) noexcept { return *this; }
};


} // namespace durl


// define any of these before including durl headers to route into your own logger

#ifndef DURL_WARN
#   define DURL_WARN ::durl::log_line{std::cerr, "warning: "}
#endif

#ifndef DURL_DEBUG
#   ifdef NDEBUG
#       define DURL_DEBUG ::durl::null_log_line{}
#   else
#       define DURL_DEBUG ::durl::log_line{std::clog, "debug: "}
#   endif
#endif
