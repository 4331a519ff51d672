/**
 * @file overloaded.hpp
 * @brief Visitor helper combining lambdas for std::visit.
 */
#ifndef PRDECK_UTIL_OVERLOADED_HPP
#define PRDECK_UTIL_OVERLOADED_HPP

namespace prdeck {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace prdeck

#endif // PRDECK_UTIL_OVERLOADED_HPP
