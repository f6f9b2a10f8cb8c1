#pragma once

#include <durl/config.hpp>
#include <utility>


namespace durl{


// owns a C api object, Close is the api's release function:
//
//     unique_handle<UConverter, ucnv_close> h{ucnv_open(...)};
//
template<class T, auto Close>
class unique_handle
{
    T* _p = nullptr;

public:
    unique_handle() noexcept = default;
    explicit unique_handle(T* p) noexcept : _p{p} {}

    unique_handle(unique_handle&& r) noexcept : _p{std::exchange(r._p, nullptr)} {}

    unique_handle& operator=(unique_handle&& r) noexcept
    {
        std::swap(_p, r._p);
        return *this;
    }

    ~unique_handle()
    {
        if(_p)
            Close(_p);
    }

    bool valid() const noexcept { return _p != nullptr; }
    T*   get  () const noexcept { return _p; }
};


} // namespace durl
