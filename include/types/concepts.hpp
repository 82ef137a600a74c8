// File: types/concepts.hpp

#ifndef TYPES_CONCEPTS_HPP
#define TYPES_CONCEPTS_HPP

#include <concepts>
#include <functional>
#include <type_traits>

/*
 * Numeric Concepts
 */

template<typename T>
concept FloatingPoint = std::is_floating_point_v<T>;

/*
 * Callable, Function Concepts
 */

template<typename F, typename R, typename... Args>
concept CallableReturning = std::invocable<F, Args...> && std::convertible_to<std::invoke_result_t<F, Args...>, R>;

// A similarity function taking two points and returning a scalar, e.g. a kernel evaluation.
template<typename F, typename P, typename R = double>
concept PairwiseEvaluator = CallableReturning<const F &, R, const P &, const P &>;

#endif // TYPES_CONCEPTS_HPP
