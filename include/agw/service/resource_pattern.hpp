#pragma once

/// @file resource_pattern.hpp
/// @brief Resource pattern matching shared by rule and route lookup.
///
/// A pattern is either an exact resource (`/api/payments/charge`) or a
/// literal prefix followed by a single trailing `*` (`/api/payments/*`).
/// `*` alone matches everything.

#include <cstddef>
#include <string_view>

namespace agw::service {

/// Whether @p pattern is well-formed (non-empty, `*` only at the end).
[[nodiscard]] bool isValidPattern(std::string_view pattern);

[[nodiscard]] bool matchesPattern(std::string_view pattern, std::string_view resource);

/// Ranking used to pick the most specific of several matching patterns.
/// Exact patterns outrank every glob; longer literal prefixes outrank shorter.
[[nodiscard]] std::size_t patternSpecificity(std::string_view pattern);

}  // namespace agw::service
