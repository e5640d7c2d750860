// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file emitter.hpp
/// @brief Begin/end event emission and outcome normalization for tool calls

#include <optional>
#include <string>
#include <string_view>
#include <toolevents/diff_tracker.hpp>
#include <toolevents/errors.hpp>
#include <toolevents/parse_command.hpp>
#include <toolevents/session.hpp>
#include <toolevents/types.hpp>
#include <variant>
#include <vector>

namespace toolevents
{

// =============================================================================
// Event Context
// =============================================================================

/// Borrowed collaborators of one tool invocation
///
/// Build one per invocation and pass it down; never keep it past the call it describes.
struct ToolEventCtx
{
    Session& session;
    const TurnContext& turn;
    std::string_view call_id;

    /// Diff tracker of the turn, nullptr when diffs are not tracked
    SharedTurnDiffTracker* turn_diff_tracker = nullptr;
};

// =============================================================================
// Lifecycle Stages
// =============================================================================

struct StageBegin
{
};

struct StageSuccess
{
    ExecToolCallOutput output;
};

/// Failure that still has the process output
struct FailureOutput
{
    ExecToolCallOutput output;
};

/// Failure where no process output exists
struct FailureMessage
{
    std::string message;
};

using ToolEventFailure = std::variant<FailureOutput, FailureMessage>;

struct StageFailure
{
    ToolEventFailure failure;
};

using ToolEventStage = std::variant<StageBegin, StageSuccess, StageFailure>;

// =============================================================================
// Tool Kinds
// =============================================================================

enum class ToolKind
{
    Shell,
    ApplyPatch,
    UnifiedExec
};

const char* tool_kind_name(ToolKind kind);

struct ShellTool
{
    std::vector<std::string> command;
    std::string cwd;
    ExecCommandSource source = ExecCommandSource::Agent;
    std::vector<ParsedCommand> parsed_cmd;
};

struct ApplyPatchTool
{
    FileChanges changes;
    bool auto_approved = false;
};

struct UnifiedExecTool
{
    std::vector<std::string> command;
    std::string cwd;
    ExecCommandSource source = ExecCommandSource::Agent;
    std::optional<std::string> interaction_input;
    std::vector<ParsedCommand> parsed_cmd;
};

class ToolEventScope;

// =============================================================================
// ToolEmitter
// =============================================================================

/// Static description of one in-flight tool call
///
/// Built once when the call starts; begin and end events of the same emitter
/// always report the same command, cwd and source.
///
/// Example usage:
/// @code
/// auto emitter = ToolEmitter::shell({"ls", "-la"}, "/repo", ExecCommandSource::Agent);
/// ToolEventCtx ctx{.session = *session, .turn = turn, .call_id = "call-1"};
/// emitter.begin(ctx);
/// auto result = emitter.finish(ctx, run_command(...));
/// @endcode
class ToolEmitter
{
  public:
    using Tool = std::variant<ShellTool, ApplyPatchTool, UnifiedExecTool>;

    static ToolEmitter shell(std::vector<std::string> command, std::string cwd,
                             ExecCommandSource source,
                             const CommandParser& parser = parse_command);

    static ToolEmitter apply_patch(FileChanges changes, bool auto_approved);

    static ToolEmitter unified_exec(std::vector<std::string> command, std::string cwd,
                                    ExecCommandSource source,
                                    std::optional<std::string> interaction_input,
                                    const CommandParser& parser = parse_command);

    ToolKind kind() const;

    const Tool& tool() const
    {
        return tool_;
    }

    /// Get the tool as specific kind (returns nullptr if wrong kind)
    template <typename T>
    const T* try_as() const
    {
        return std::get_if<T>(&tool_);
    }

    /// Send the event for `stage`
    ///
    /// Every tool kind handles every stage; patch stages also update the turn's
    /// diff tracker when one is attached.
    void emit(const ToolEventCtx& ctx, ToolEventStage stage) const;

    /// Send the begin event
    void begin(const ToolEventCtx& ctx) const;

    /// Classify the raw outcome, send the matching end event and return the model-facing result
    ToolCallResult finish(const ToolEventCtx& ctx, ToolExecResult result) const;

    /// Send the begin event and return a scope that guarantees an end event
    /// @note The emitter must outlive the returned scope
    ToolEventScope start(const ToolEventCtx& ctx) const;

  private:
    explicit ToolEmitter(Tool tool) : tool_(std::move(tool)) {}

    Tool tool_;
};

// =============================================================================
// ToolEventScope
// =============================================================================

/// RAII pairing of a begin event with its end event
///
/// If the scope is destroyed before finish() was called (the call was
/// abandoned or an exception unwound the caller), it sends a failure end event
/// carrying the configured cancellation message.
///
/// The scope keeps its own copy of the call id; the session and turn context
/// are still borrowed and must outlive it.
class ToolEventScope
{
  public:
    ToolEventScope(const ToolEmitter& emitter, const ToolEventCtx& ctx);
    ~ToolEventScope();

    // Move-only
    ToolEventScope(const ToolEventScope&) = delete;
    ToolEventScope& operator=(const ToolEventScope&) = delete;
    ToolEventScope& operator=(ToolEventScope&&) = delete;
    ToolEventScope(ToolEventScope&& other) noexcept;

    /// Same as ToolEmitter::finish
    /// @throws std::logic_error if the scope was already finished
    ToolCallResult finish(ToolExecResult result);

    bool finished() const
    {
        return !active_;
    }

  private:
    const ToolEmitter* emitter_;
    std::string call_id_;
    ToolEventCtx ctx_;
    bool active_ = true;
};

} // namespace toolevents
