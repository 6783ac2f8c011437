#pragma once

/// @file engine_result.hpp
/// @brief EngineResult<T> type alias for engine error handling.

#include "edext/core/result.hpp"
#include "edext/foundation/engine_error.hpp"

namespace edext::foundation {

/// Result type specialized with EngineError.
///
/// Example:
/// @code
///   EngineResult<std::string> readDefinition(const fs::path& p) {
///       if (!fs::exists(p)) {
///           return EngineResult<std::string>::err(
///               EngineError(ErrorCode::DefinitionUnreadable, p.string()));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using EngineResult = edext::Result<T, EngineError>;

} // namespace edext::foundation
