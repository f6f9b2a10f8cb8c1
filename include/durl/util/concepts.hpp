#pragma once

#include <durl/config.hpp>
#include <concepts>
#include <type_traits>


namespace durl{


template<class T>
concept _pointer_ = std::is_pointer_v<std::remove_cvref_t<T>>;

template<class T>
concept _pod_ = std::is_trivial_v<T> && std::is_standard_layout_v<T>;

// any type text or bytes can be stored in
template<class T>
concept _char_ = std::same_as<T, char> || std::same_as<T, signed char> || std::same_as<T, unsigned char>
              || std::same_as<T, char8_t> || std::same_as<T, std::byte>;

template<class T>
concept _byte_ = (sizeof(T) == 1) && _pod_<T>;


} // namespace durl
