#ifndef VIDSET_TYPE_TRAITS_HPP
#define VIDSET_TYPE_TRAITS_HPP

#include "vidset/common.hpp"

#include <type_traits>
#include <utility>

namespace vidset {

template <typename T, template <typename...> class Template>
struct is_specialization_of;

/// True iff `T` is a specialization of `Template`, i.e. `T == Template<Args...>`
/// for some Args.
template <typename T, template <typename...> class Template>
struct is_specialization_of : std::false_type {};

template <template <typename...> class Template, typename... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

/// The decayed type returned by invoking `F` with arguments of type `Args`.
template<typename F, typename... Args>
using invoke_result_t = std::decay_t<decltype(std::declval<F>()(std::declval<Args>()...))>;

} // namespace vidset

#endif // VIDSET_TYPE_TRAITS_HPP
