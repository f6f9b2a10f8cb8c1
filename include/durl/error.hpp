#pragma once

#include <durl/config.hpp>
#include <durl/util/concepts.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>


namespace durl{


// every fallible operation reports through boost::system codes,
// each module owns an enum and a category for it.
using aerror_code      = boost::system::error_code;
using aerror_category  = boost::system::error_category;
using asystem_error    = boost::system::system_error;


template<class E>
concept _ec_or_ecenum_ = std::same_as<std::remove_cv_t<E>, aerror_code>
                      || boost::system::is_error_code_enum<std::remove_cv_t<E>>::value;


} // namespace durl
