//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures for subprocess execution and startup configuration.
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace mcphttp {
namespace errors {

// Categorization of subprocess execution failures.
enum class ErrorCategory {
    SetupError,         // stream/argument preparation failed; the process never ran
    StartError,         // the OS could not create the process
    IOError,            // a stream read/write failed mid-exchange
    ProcessError,       // the process exited with a failure status
    CancellationError,  // deadline exceeded or caller cancelled; process was killed
    Unknown
};

// Typed error representation produced by the process executor.
struct ExecutionError {
    ErrorCategory category{ErrorCategory::Unknown};
    std::string message;
    // Captured standard error text of the child (may be truncated; empty when nothing was captured).
    std::string diagnostics;
    // Wait status as text ("exit status 1", "signal 9 (Killed)"); set once the child has been reaped.
    std::optional<std::string> exitStatus;
};

// Map an ErrorCategory to its stable name used in logs.
//
// Args:
//   category: The error category.
//
// Returns:
//   Name such as "SetupError" or "CancellationError".
inline const char* errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::SetupError: return "SetupError";
        case ErrorCategory::StartError: return "StartError";
        case ErrorCategory::IOError: return "IOError";
        case ErrorCategory::ProcessError: return "ProcessError";
        case ErrorCategory::CancellationError: return "CancellationError";
        default: return "Unknown";
    }
}

// Convenience constructor used by the executor.
inline ExecutionError makeExecutionError(ErrorCategory category, std::string message,
                                         std::string diagnostics = std::string(),
                                         std::optional<std::string> exitStatus = std::nullopt) {
    ExecutionError e;
    e.category = category;
    e.message = std::move(message);
    e.diagnostics = std::move(diagnostics);
    e.exitStatus = std::move(exitStatus);
    return e;
}

//==========================================================================================================
// ConfigError
// Purpose: Thrown while building the adapter configuration from the command line. Fatal at startup.
//==========================================================================================================
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace errors
} // namespace mcphttp
