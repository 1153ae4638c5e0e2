#pragma once

/// @file gateway_result.hpp
/// @brief GatewayResult<T> alias used by every gateway component.

#include "agw/core/result.hpp"
#include "agw/foundation/gateway_error.hpp"

namespace agw::foundation {

/// Result type specialized with GatewayError.
///
/// Example:
/// @code
///   GatewayResult<uint64_t> effectiveLimit(uint32_t base, double multiplier) {
///       if (multiplier < 1.0) {
///           return GatewayResult<uint64_t>::err(
///               GatewayError(ErrorCode::InvalidRule, "multiplier below 1"));
///       }
///       return GatewayResult<uint64_t>::ok(
///           static_cast<uint64_t>(base * multiplier));
///   }
/// @endcode
template <typename T>
using GatewayResult = agw::Result<T, GatewayError>;

}  // namespace agw::foundation
