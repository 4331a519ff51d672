/**
 * @file shell.hpp
 * @brief Helpers for building shell command lines.
 */
#ifndef PRDECK_UTIL_SHELL_HPP
#define PRDECK_UTIL_SHELL_HPP

#include <string>

namespace prdeck {

/// Quote @p arg as a single word for a POSIX shell.
std::string shell_quote(const std::string &arg);

} // namespace prdeck

#endif // PRDECK_UTIL_SHELL_HPP
