#pragma once

#include <micrograd/autograd/builder.hpp>
#include <micrograd/autograd/op_type.hpp>
#include <micrograd/autograd/policy.hpp>
#include <micrograd/autograd/value.hpp>
#include <micrograd/core/macros.hpp>
#include <utility>

namespace micrograd::autograd {
namespace functions {
/**
 * @brief Add two values
 *
 * @param a First value
 * @param b Second value
 * @return a + b
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> add(BasicValue<Policy> a,
                                           BasicValue<Policy> b) {
    return BasicValue<Policy>(detail::GraphBuilder<Policy>::add(
        std::move(a).release_node(), std::move(b).release_node()));
}

/**
 * @brief Multiply two values
 *
 * @param a First value
 * @param b Second value
 * @return a * b
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> multiply(BasicValue<Policy> a,
                                                BasicValue<Policy> b) {
    return BasicValue<Policy>(detail::GraphBuilder<Policy>::multiply(
        std::move(a).release_node(), std::move(b).release_node()));
}

/**
 * @brief Negate a value
 *
 * @details Recorded as a multiplication by a -1 leaf.
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> negate(BasicValue<Policy> a) {
    using Builder = detail::GraphBuilder<Policy>;

    auto product =
        Builder::multiply(std::move(a).release_node(), Builder::leaf(-1.0f));
    return BasicValue<Policy>(
        Builder::relabel(std::move(product), OpType::Negate));
}

/**
 * @brief Subtract two values
 *
 * @details Recorded as a + (-b), so the graph holds the -1 leaf and the
 * negation as well.
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> subtract(BasicValue<Policy> a,
                                                BasicValue<Policy> b) {
    using Builder = detail::GraphBuilder<Policy>;

    auto sum = Builder::add(std::move(a).release_node(),
                            negate(std::move(b)).release_node());
    return BasicValue<Policy>(
        Builder::relabel(std::move(sum), OpType::Subtract));
}

/**
 * @brief Raise a value to a constant power
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> pow(BasicValue<Policy> base,
                                           float exponent) {
    return BasicValue<Policy>(detail::GraphBuilder<Policy>::pow(
        std::move(base).release_node(), exponent));
}

/**
 * @brief Divide two values
 *
 * @details Recorded as a * b^-1. A zero divisor yields inf or NaN.
 */
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> divide(BasicValue<Policy> a,
                                              BasicValue<Policy> b) {
    using Builder = detail::GraphBuilder<Policy>;

    auto product =
        Builder::multiply(std::move(a).release_node(),
                          Builder::pow(std::move(b).release_node(), -1.0f));
    return BasicValue<Policy>(
        Builder::relabel(std::move(product), OpType::Divide));
}
}  // namespace functions

// Operators
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator+(BasicValue<Policy> a,
                                                 BasicValue<Policy> b) {
    return functions::add(std::move(a), std::move(b));
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator-(BasicValue<Policy> a,
                                                 BasicValue<Policy> b) {
    return functions::subtract(std::move(a), std::move(b));
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator*(BasicValue<Policy> a,
                                                 BasicValue<Policy> b) {
    return functions::multiply(std::move(a), std::move(b));
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator/(BasicValue<Policy> a,
                                                 BasicValue<Policy> b) {
    return functions::divide(std::move(a), std::move(b));
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator-(BasicValue<Policy> a) {
    return functions::negate(std::move(a));
}

// Scalars on either side become fresh leaves
template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator+(BasicValue<Policy> a,
                                                 float b) {
    return std::move(a) + BasicValue<Policy>(b);
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator+(float a,
                                                 BasicValue<Policy> b) {
    return BasicValue<Policy>(a) + std::move(b);
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator-(BasicValue<Policy> a,
                                                 float b) {
    return std::move(a) - BasicValue<Policy>(b);
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator-(float a,
                                                 BasicValue<Policy> b) {
    return BasicValue<Policy>(a) - std::move(b);
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator*(BasicValue<Policy> a,
                                                 float b) {
    return std::move(a) * BasicValue<Policy>(b);
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator*(float a,
                                                 BasicValue<Policy> b) {
    return BasicValue<Policy>(a) * std::move(b);
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator/(BasicValue<Policy> a,
                                                 float b) {
    return std::move(a) / BasicValue<Policy>(b);
}

template <AccessPolicy Policy>
MICROGRAD_NODISCARD BasicValue<Policy> operator/(float a,
                                                 BasicValue<Policy> b) {
    return BasicValue<Policy>(a) / std::move(b);
}

// Compound assignment rebinds the handle to the new result
template <AccessPolicy Policy>
BasicValue<Policy>& operator+=(BasicValue<Policy>& a, BasicValue<Policy> b) {
    a = std::move(a) + std::move(b);
    return a;
}

template <AccessPolicy Policy>
BasicValue<Policy>& operator-=(BasicValue<Policy>& a, BasicValue<Policy> b) {
    a = std::move(a) - std::move(b);
    return a;
}

template <AccessPolicy Policy>
BasicValue<Policy>& operator*=(BasicValue<Policy>& a, BasicValue<Policy> b) {
    a = std::move(a) * std::move(b);
    return a;
}

template <AccessPolicy Policy>
BasicValue<Policy>& operator/=(BasicValue<Policy>& a, BasicValue<Policy> b) {
    a = std::move(a) / std::move(b);
    return a;
}

}  // namespace micrograd::autograd
