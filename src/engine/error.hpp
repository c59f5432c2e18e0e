#pragma once

#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace dwas::engine {

enum class ErrorCode {
  DuplicateStep,
  UnknownStep,
  CyclicGraph,
  InvalidDefinition,
  InvalidSelection,
  InvalidConfig,
  Execution,
  Cancelled,
  Io,
};

struct EngineError {
  ErrorCode code = ErrorCode::Execution;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, EngineError>;

inline auto make_error(std::string message) -> EngineError {
  return EngineError{ErrorCode::Execution, std::move(message)};
}

inline auto make_error(ErrorCode code, std::string message) -> EngineError {
  return EngineError{code, std::move(message)};
}

/// Definition and selection errors abort the invocation before any node runs.
inline auto is_fatal(const EngineError& error) -> bool {
  switch (error.code) {
    case ErrorCode::DuplicateStep:
    case ErrorCode::UnknownStep:
    case ErrorCode::CyclicGraph:
    case ErrorCode::InvalidDefinition:
    case ErrorCode::InvalidSelection:
    case ErrorCode::InvalidConfig:
      return true;
    case ErrorCode::Execution:
    case ErrorCode::Cancelled:
    case ErrorCode::Io:
      return false;
  }
  return false;
}

/// Process exit code used when the error escapes to main.
inline auto exit_code_for(const EngineError& error) -> int {
  return is_fatal(error) ? 2 : 1;
}

}  // namespace dwas::engine
