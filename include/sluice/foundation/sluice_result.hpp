#pragma once

/// @file sluice_result.hpp
/// @brief SluiceResult<T> alias used by every fallible component operation.

#include "sluice/core/result.hpp"
#include "sluice/foundation/sluice_error.hpp"

namespace sluice::foundation {

/// Result type specialized with SluiceError.
///
/// Example:
/// @code
///   SluiceResult<std::size_t> parseWorkers(int n) {
///       if (n <= 0) {
///           return SluiceResult<std::size_t>::err(
///               SluiceError(ErrorCode::InvalidArgument, "workers must be positive"));
///       }
///       return SluiceResult<std::size_t>::ok(static_cast<std::size_t>(n));
///   }
/// @endcode
template <typename T>
using SluiceResult = sluice::Result<T, SluiceError>;

}  // namespace sluice::foundation
