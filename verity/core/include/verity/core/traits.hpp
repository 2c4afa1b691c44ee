#pragma once

#include <type_traits>
#include <utility>

namespace verity {

template <typename T> class type_descriptor;

// Specialize for every validatable type:
//
//   template <> struct validation_traits<order> {
//       static const type_descriptor<order>& describe();
//   };
template <typename T> struct validation_traits {};

template <typename T, typename = void> struct is_validatable : std::false_type {};

template <typename T>
struct is_validatable<T, std::void_t<decltype(validation_traits<T>::describe())>> : std::true_type {};

template <typename T> inline constexpr bool is_validatable_v = is_validatable<T>::value;

template <typename T> const type_descriptor<T>& describe() {
    static_assert(is_validatable_v<T>, "type has no validation_traits specialization");
    return validation_traits<T>::describe();
}

} // namespace verity
