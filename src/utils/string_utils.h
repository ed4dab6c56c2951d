/**
 * @file string_utils.h
 * @brief Name normalization helpers shared by stores and matchers
 */

#pragma once

#include <string>
#include <string_view>

namespace tastemix::utils {

/**
 * @brief Trim ASCII whitespace from both ends
 */
std::string Trim(std::string_view str);

/**
 * @brief Lowercase ASCII letters
 */
std::string ToLower(std::string_view str);

/**
 * @brief Normalize an artist name or genre tag for comparison
 *
 * Trims surrounding whitespace and lowercases, so "  Radiohead" and
 * "radiohead" compare equal.
 */
inline std::string NormalizeName(std::string_view name) { return ToLower(Trim(name)); }

}  // namespace tastemix::utils
