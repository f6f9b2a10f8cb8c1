#pragma once

#include <durl/config.hpp>
#include <durl/error.hpp>
#include <memory>
#include <new>
#include <stdexcept>
#include <utility>


namespace durl{


// aresult<V> holds either a V or an aerror_code that has an error,
// aresult<> only the code. Functions return the code or the value directly:
//
//     aresult<string> read()
//     {
//         if(bad)
//             return my_err::bad_thing;
//         return string{...};
//     }
//
// and callers propagate with DURL_TRY:
//
//     DURL_TRY(auto s, read()); // returns the error from the enclosing function, or declares s
//     DURL_TRY(s, read());      // assigns to existing s
//     DURL_TRY(check());        // only propagates

struct no_err_t {};
inline constexpr no_err_t no_err;


template<class V = void>
class [[nodiscard]] aresult;


template<>
class aresult<void>
{
    aerror_code _ec;

public:
    aresult(no_err_t) noexcept {}

    aresult(_ec_or_ecenum_ auto const& e) noexcept
        : _ec{e}
    {}

    aerror_code const& error() const noexcept { return _ec; }
    bool has_error() const noexcept { return _ec.failed(); }
    bool no_error () const noexcept { return ! _ec.failed(); }
    explicit operator bool() const noexcept { return no_error(); }

    void throw_on_error() const
    {
        if(has_error())
            throw asystem_error{_ec};
    }
};


template<class V>
class aresult : public aresult<void>
{
    using base = aresult<void>;

    union{ V _v; };

public:
    using value_type = V;

    aresult(_ec_or_ecenum_ auto const& e)
        : base{e}
    {
        if(! has_error())
            throw std::logic_error{"aresult: error code must hold an error"};
    }

    template<class U>
    aresult(U&& u) noexcept(std::is_nothrow_constructible_v<V, U&&>)
        requires(std::constructible_from<V, U&&>
                 && ! std::constructible_from<aerror_code, U&&>
                 && ! std::same_as<std::remove_cvref_t<U>, aresult>)
        : base{no_err}
    {
        ::new (std::addressof(_v)) V(std::forward<U>(u));
    }

    aresult(aresult const& r) requires(std::copy_constructible<V>)
        : base{r}
    {
        if(r.has_value())
            ::new (std::addressof(_v)) V(r._v);
    }

    aresult(aresult&& r) noexcept(std::is_nothrow_move_constructible_v<V>)
        : base{r}
    {
        if(r.has_value())
            ::new (std::addressof(_v)) V(std::move(r._v));
    }

    aresult& operator=(aresult const& r) requires(std::copy_constructible<V>)
    {
        if(this != std::addressof(r))
            assign(r.error(), r.has_value() ? std::addressof(r._v) : nullptr);
        return *this;
    }

    aresult& operator=(aresult&& r) noexcept(std::is_nothrow_move_constructible_v<V>)
    {
        if(this != std::addressof(r))
        {
            if(has_value())
                _v.~V();
            if(r.has_value())
                ::new (std::addressof(_v)) V(std::move(r._v));
            base::operator=(r);
        }
        return *this;
    }

    ~aresult()
    {
        if(has_value())
            _v.~V();
    }

    bool has_value() const noexcept { return ! has_error(); }

    V      &  value()      &  noexcept { BOOST_ASSERT(has_value()); return _v; }
    V const&  value() const&  noexcept { BOOST_ASSERT(has_value()); return _v; }
    V      && value()      && noexcept { BOOST_ASSERT(has_value()); return std::move(_v); }

    V      &  value_or_throw()      &  { throw_on_error(); return _v; }
    V const&  value_or_throw() const&  { throw_on_error(); return _v; }
    V      && value_or_throw()      && { throw_on_error(); return std::move(_v); }

    V      * operator->()       noexcept { return std::addressof(value()); }
    V const* operator->() const noexcept { return std::addressof(value()); }

private:
    // copy is made before the old value is dropped, so a throwing copy keeps *this intact.
    void assign(aerror_code const& ec, V const* v)
    {
        if(v)
        {
            if(has_value())
            {
                _v = *v;
                return;
            }
            ::new (std::addressof(_v)) V(*v);
        }
        else if(has_value())
        {
            _v.~V();
        }
        base::operator=(aresult<void>{ec});
    }
};


} // namespace durl


#define _DURL_TRY_CAT2(a, b) a##b
#define _DURL_TRY_CAT(a, b) _DURL_TRY_CAT2(a, b)
#define _DURL_TRY_TMP _DURL_TRY_CAT(_durl_try_tmp_, __LINE__)

#define _DURL_TRY_PICK(_1, _2, name, ...) name

#define _DURL_TRY1(expr)               \
    auto&& _DURL_TRY_TMP = (expr);     \
    if(_DURL_TRY_TMP.has_error())      \
        return _DURL_TRY_TMP.error()   \
/**/

#define _DURL_TRY2(v, expr)                                             \
    _DURL_TRY1(expr);                                                   \
    v = static_cast<decltype(_DURL_TRY_TMP)&&>(_DURL_TRY_TMP).value()   \
/**/

// must be used as a full statement in its own scope:
//   if(x) DURL_TRY(...);   // wrong
//   if(x){ DURL_TRY(...); } // ok
#define DURL_TRY(...) _DURL_TRY_PICK(__VA_ARGS__, _DURL_TRY2, _DURL_TRY1, ~)(__VA_ARGS__)
