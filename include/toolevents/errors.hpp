// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file errors.hpp
/// @brief Execution failures, model-facing errors and tool call results

#include <optional>
#include <stdexcept>
#include <string>
#include <toolevents/types.hpp>
#include <variant>

namespace toolevents
{

// =============================================================================
// Execution Errors
// =============================================================================

/// Category of an execution-layer failure
enum class ExecErrorKind
{
    SandboxTimeout,
    SandboxDenied,
    SandboxSignal,
    Spawn,
    Io,
    Internal
};

/// Short human-readable name, e.g. "sandbox timeout"
const char* exec_error_kind_name(ExecErrorKind kind);

/// Exception for failures reported by the executor
///
/// Timeouts and sandbox denials still carry the process output; the other
/// kinds carry only a detail message.
class ExecError : public std::runtime_error
{
  public:
    static ExecError sandbox_timeout(ExecToolCallOutput output);
    static ExecError sandbox_denied(ExecToolCallOutput output);
    static ExecError sandbox_signal(int signal);
    static ExecError spawn(const std::string& detail);
    static ExecError io(const std::string& detail);
    static ExecError internal(const std::string& detail);

    ExecErrorKind kind() const
    {
        return kind_;
    }

    /// Output of a run blocked by policy, nullptr for other kinds
    const ExecToolCallOutput* policy_output() const
    {
        return output_ ? &*output_ : nullptr;
    }

    /// Message surfaced to the model, "execution error: <kind>: <detail>"
    std::string diagnostic() const;

  private:
    ExecError(ExecErrorKind kind, const std::string& detail,
              std::optional<ExecToolCallOutput> output = std::nullopt);

    ExecErrorKind kind_;
    std::optional<ExecToolCallOutput> output_;
};

/// A tool call refused before anything ran (approval gate, policy)
struct ToolRejected
{
    std::string message;
};

/// Raw outcome of executing a tool, as handed to ToolEmitter::finish
using ToolExecResult = std::variant<ExecToolCallOutput, ExecError, ToolRejected>;

// =============================================================================
// Model-facing Errors
// =============================================================================

/// Exception carrying text that should be sent back to the model as a failure
class FunctionCallError : public std::runtime_error
{
  public:
    explicit FunctionCallError(const std::string& message) : std::runtime_error(message) {}
};

/// Text returned to the model for one tool call
class ToolCallResult
{
  public:
    static ToolCallResult ok(std::string content)
    {
        return ToolCallResult(std::move(content), true);
    }

    static ToolCallResult respond_to_model(std::string message)
    {
        return ToolCallResult(std::move(message), false);
    }

    bool is_ok() const
    {
        return ok_;
    }

    bool is_error() const
    {
        return !ok_;
    }

    /// Text of either branch
    const std::string& content() const
    {
        return content_;
    }

    /// Text of the ok branch
    /// @throws FunctionCallError carrying the text on the error branch
    const std::string& value() const
    {
        if (!ok_)
            throw FunctionCallError(content_);
        return content_;
    }

    FunctionCallOutput to_output() const
    {
        return FunctionCallOutput{.content = content_, .success = ok_};
    }

  private:
    ToolCallResult(std::string content, bool ok) : content_(std::move(content)), ok_(ok) {}

    std::string content_;
    bool ok_;
};

// =============================================================================
// Collaborator Errors
// =============================================================================

/// Exception thrown by a diff tracker that cannot produce a diff
class DiffError : public std::runtime_error
{
  public:
    explicit DiffError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown for invalid configuration
class ConfigError : public std::runtime_error
{
  public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace toolevents
