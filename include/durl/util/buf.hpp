#pragma once

#include <durl/config.hpp>
#include <durl/util/concepts.hpp>
#include <boost/container/container_fwd.hpp>
#include <utility>


namespace durl{


// a buf is any contiguous container exposing noexcept data() and size(),
// e.g. std::string or std::vector<unsigned char>.

constexpr auto* buf_data(auto& b) noexcept requires(requires{ {b.data()} noexcept -> _pointer_; })
{
    return b.data();
}

constexpr size_t buf_size(auto const& b) noexcept requires(requires{ {b.size()} noexcept -> std::convertible_to<size_t>; })
{
    return b.size();
}

template<class B>
concept _buf_ = requires(B& b){ buf_data(b); buf_size(b); };

template<_buf_ B>
using buf_value_t = std::remove_cvref_t<decltype(*buf_data(std::declval<B&>()))>;


// grow or shrink, new elements are left uninitialized where the container allows it
constexpr void resize_buf(_buf_ auto& b, size_t n) requires(requires{ b.resize(n); })
{
    if constexpr(requires{ b.resize(n, boost::container::default_init); })
        b.resize(n, boost::container::default_init);
    else if constexpr(requires{ b.__resize_default_init(n); }) // libc++
        b.__resize_default_init(n);
    else
        b.resize(n);
}

template<class B>
concept _resizable_buf_ = _buf_<B> && requires(B& b, size_t n){ resize_buf(b, n); };

template<class B>
concept _resizable_char_buf_ = _resizable_buf_<B> && std::same_as<buf_value_t<B>, char>;

template<class B>
concept _resizable_byte_buf_ = _resizable_buf_<B> && _byte_<buf_value_t<B>>;


// appends n elements to b and returns where they start.
constexpr auto* buy_buf(_resizable_buf_ auto& b, size_t n)
{
    size_t const off = buf_size(b);
    resize_buf(b, off + n);
    return buf_data(b) + off;
}


} // namespace durl
