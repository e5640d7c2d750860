// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <stdexcept>
#include <toolevents/config.hpp>
#include <toolevents/emitter.hpp>
#include <toolevents/format.hpp>
#include <toolevents/log.hpp>
#include <utility>

namespace toolevents
{

namespace
{

/// Command fields shared by the begin and end events of one call
struct ExecEventMetadata
{
    const std::vector<std::string>& command;
    const std::string& cwd;
    const std::vector<ParsedCommand>& parsed_cmd;
    ExecCommandSource source;
    std::optional<std::string> interaction_input;
};

ExecEventMetadata exec_metadata(const ShellTool& tool)
{
    return {tool.command, tool.cwd, tool.parsed_cmd, tool.source, std::nullopt};
}

ExecEventMetadata exec_metadata(const UnifiedExecTool& tool)
{
    return {tool.command, tool.cwd, tool.parsed_cmd, tool.source, tool.interaction_input};
}

const char* stage_name(const ToolEventStage& stage)
{
    return std::visit(
        detail::overloaded{
            [](const StageBegin&) { return "begin"; },
            [](const StageSuccess&) { return "success"; },
            [](const StageFailure&) { return "failure"; },
        },
        stage
    );
}

ExecCommandPayload failure_payload(const ToolEventFailure& failure, const OutputFormatOptions& format)
{
    return std::visit(
        detail::overloaded{
            [&](const FailureOutput& f) { return payload_from_output(f.output, format); },
            [](const FailureMessage& f) { return payload_from_message(f.message); },
        },
        failure
    );
}

void emit_exec_begin(const ToolEventCtx& ctx, const ExecEventMetadata& meta)
{
    ctx.session.send_event(
        ctx.turn,
        ExecCommandBeginEvent{
            .call_id = std::string(ctx.call_id),
            .turn_id = ctx.turn.sub_id,
            .command = meta.command,
            .cwd = meta.cwd,
            .parsed_cmd = meta.parsed_cmd,
            .source = meta.source,
            .interaction_input = meta.interaction_input
        }
    );
}

void emit_exec_end(const ToolEventCtx& ctx, const ExecEventMetadata& meta, ExecCommandPayload payload)
{
    ctx.session.send_event(
        ctx.turn,
        ExecCommandEndEvent{
            .call_id = std::string(ctx.call_id),
            .turn_id = ctx.turn.sub_id,
            .command = meta.command,
            .cwd = meta.cwd,
            .parsed_cmd = meta.parsed_cmd,
            .source = meta.source,
            .interaction_input = meta.interaction_input,
            .stdout_text = std::move(payload.stdout_text),
            .stderr_text = std::move(payload.stderr_text),
            .aggregated_output = std::move(payload.aggregated_output),
            .exit_code = payload.exit_code,
            .duration = payload.duration,
            .formatted_output = std::move(payload.formatted_output)
        }
    );
}

void emit_patch_begin(const ToolEventCtx& ctx, const ApplyPatchTool& tool)
{
    if (ctx.turn_diff_tracker)
    {
        try
        {
            auto guard = ctx.turn_diff_tracker->lock();
            guard->on_patch_begin(tool.changes);
        }
        catch (const std::exception& e)
        {
            // The begin event is still owed to the UI
            logger()->warn("call {}: diff tracker failed to snapshot patch: {}", ctx.call_id, e.what());
        }
    }

    ctx.session.send_event(
        ctx.turn,
        PatchApplyBeginEvent{
            .call_id = std::string(ctx.call_id),
            .auto_approved = tool.auto_approved,
            .changes = tool.changes
        }
    );
}

void emit_patch_end(const ToolEventCtx& ctx, std::string stdout_text, std::string stderr_text, bool success)
{
    ctx.session.send_event(
        ctx.turn,
        PatchApplyEndEvent{
            .call_id = std::string(ctx.call_id),
            .stdout_text = std::move(stdout_text),
            .stderr_text = std::move(stderr_text),
            .success = success
        }
    );

    if (!ctx.turn_diff_tracker)
        return;

    std::optional<std::string> unified_diff;
    try
    {
        auto guard = ctx.turn_diff_tracker->lock();
        unified_diff = guard->get_unified_diff();
    }
    catch (const std::exception& e)
    {
        logger()->warn("call {}: skipping turn diff: {}", ctx.call_id, e.what());
        return;
    }

    if (unified_diff && !unified_diff->empty())
        ctx.session.send_event(ctx.turn, TurnDiffEvent{.unified_diff = std::move(*unified_diff)});
}

void emit_patch_output(const ToolEventCtx& ctx, const ExecToolCallOutput& output)
{
    emit_patch_end(ctx, output.stdout_stream.text, output.stderr_stream.text, output.exit_code == 0);
}

} // namespace

const char* tool_kind_name(ToolKind kind)
{
    switch (kind)
    {
    case ToolKind::Shell:
        return "shell";
    case ToolKind::ApplyPatch:
        return "apply_patch";
    case ToolKind::UnifiedExec:
        return "unified_exec";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

ToolEmitter ToolEmitter::shell(std::vector<std::string> command, std::string cwd,
                               ExecCommandSource source, const CommandParser& parser)
{
    auto parsed_cmd = parser(command);
    return ToolEmitter(ShellTool{
        .command = std::move(command),
        .cwd = std::move(cwd),
        .source = source,
        .parsed_cmd = std::move(parsed_cmd)
    });
}

ToolEmitter ToolEmitter::apply_patch(FileChanges changes, bool auto_approved)
{
    return ToolEmitter(ApplyPatchTool{.changes = std::move(changes), .auto_approved = auto_approved});
}

ToolEmitter ToolEmitter::unified_exec(std::vector<std::string> command, std::string cwd,
                                      ExecCommandSource source,
                                      std::optional<std::string> interaction_input,
                                      const CommandParser& parser)
{
    auto parsed_cmd = parser(command);
    return ToolEmitter(UnifiedExecTool{
        .command = std::move(command),
        .cwd = std::move(cwd),
        .source = source,
        .interaction_input = std::move(interaction_input),
        .parsed_cmd = std::move(parsed_cmd)
    });
}

ToolKind ToolEmitter::kind() const
{
    return std::visit(
        detail::overloaded{
            [](const ShellTool&) { return ToolKind::Shell; },
            [](const ApplyPatchTool&) { return ToolKind::ApplyPatch; },
            [](const UnifiedExecTool&) { return ToolKind::UnifiedExec; },
        },
        tool_
    );
}

// =============================================================================
// Emission
// =============================================================================

void ToolEmitter::emit(const ToolEventCtx& ctx, ToolEventStage stage) const
{
    logger()->debug("call {}: {} {}", ctx.call_id, tool_kind_name(kind()), stage_name(stage));
    const auto& format = ctx.session.config().output_format;

    // One overload per (tool, stage) pair; a missing pair does not compile
    std::visit(
        detail::overloaded{
            [&](const ShellTool& tool, const StageBegin&)
            {
                emit_exec_begin(ctx, exec_metadata(tool));
            },
            [&](const ShellTool& tool, const StageSuccess& s)
            {
                emit_exec_end(ctx, exec_metadata(tool), payload_from_output(s.output, format));
            },
            [&](const ShellTool& tool, const StageFailure& f)
            {
                emit_exec_end(ctx, exec_metadata(tool), failure_payload(f.failure, format));
            },
            [&](const ApplyPatchTool& tool, const StageBegin&)
            {
                emit_patch_begin(ctx, tool);
            },
            [&](const ApplyPatchTool&, const StageSuccess& s)
            {
                emit_patch_output(ctx, s.output);
            },
            [&](const ApplyPatchTool&, const StageFailure& f)
            {
                std::visit(
                    detail::overloaded{
                        [&](const FailureOutput& out) { emit_patch_output(ctx, out.output); },
                        [&](const FailureMessage& msg) { emit_patch_end(ctx, "", msg.message, false); },
                    },
                    f.failure
                );
            },
            [&](const UnifiedExecTool& tool, const StageBegin&)
            {
                emit_exec_begin(ctx, exec_metadata(tool));
            },
            [&](const UnifiedExecTool& tool, const StageSuccess& s)
            {
                emit_exec_end(ctx, exec_metadata(tool), payload_from_output(s.output, format));
            },
            [&](const UnifiedExecTool& tool, const StageFailure& f)
            {
                emit_exec_end(ctx, exec_metadata(tool), failure_payload(f.failure, format));
            },
        },
        tool_,
        stage
    );
}

void ToolEmitter::begin(const ToolEventCtx& ctx) const
{
    emit(ctx, StageBegin{});
}

ToolCallResult ToolEmitter::finish(const ToolEventCtx& ctx, ToolExecResult result) const
{
    using Outcome = std::pair<ToolEventStage, ToolCallResult>;
    const auto& config = ctx.session.config();

    auto outcome = std::visit(
        detail::overloaded{
            [&](ExecToolCallOutput& output) -> Outcome
            {
                auto content = format_exec_output_for_model(output, config.output_format);
                // A nonzero exit is a failure for the model; the UI still gets the real output
                auto response = output.exit_code == 0 ? ToolCallResult::ok(std::move(content))
                                                      : ToolCallResult::respond_to_model(std::move(content));
                return {StageSuccess{std::move(output)}, std::move(response)};
            },
            [&](ExecError& error) -> Outcome
            {
                if (const auto* output = error.policy_output())
                {
                    auto content = format_exec_output_for_model(*output, config.output_format);
                    return {StageFailure{FailureOutput{*output}}, ToolCallResult::respond_to_model(std::move(content))};
                }
                auto message = error.diagnostic();
                return {StageFailure{FailureMessage{message}}, ToolCallResult::respond_to_model(message)};
            },
            [&](ToolRejected& rejected) -> Outcome
            {
                auto message = normalize_rejection(config, rejected.message);
                return {StageFailure{FailureMessage{message}}, ToolCallResult::respond_to_model(message)};
            },
        },
        result
    );

    emit(ctx, std::move(outcome.first));
    return std::move(outcome.second);
}

ToolEventScope ToolEmitter::start(const ToolEventCtx& ctx) const
{
    return ToolEventScope(*this, ctx);
}

// =============================================================================
// ToolEventScope
// =============================================================================

ToolEventScope::ToolEventScope(const ToolEmitter& emitter, const ToolEventCtx& ctx)
    : emitter_(&emitter),
      call_id_(ctx.call_id),
      ctx_{.session = ctx.session, .turn = ctx.turn, .call_id = call_id_, .turn_diff_tracker = ctx.turn_diff_tracker}
{
    emitter_->begin(ctx_);
}

ToolEventScope::ToolEventScope(ToolEventScope&& other) noexcept
    : emitter_(other.emitter_),
      call_id_(std::move(other.call_id_)),
      ctx_{.session = other.ctx_.session,
           .turn = other.ctx_.turn,
           .call_id = call_id_,
           .turn_diff_tracker = other.ctx_.turn_diff_tracker},
      active_(std::exchange(other.active_, false))
{
}

ToolEventScope::~ToolEventScope()
{
    if (!active_)
        return;

    const auto& message = ctx_.session.config().cancellation_message;
    try
    {
        logger()->warn("call {}: abandoned before finish, sending cancellation", ctx_.call_id);
        emitter_->emit(ctx_, StageFailure{FailureMessage{message}});
    }
    catch (const std::exception& e)
    {
        logger()->error("call {}: failed to send cancellation end event: {}", ctx_.call_id, e.what());
    }
}

ToolCallResult ToolEventScope::finish(ToolExecResult result)
{
    if (!active_)
        throw std::logic_error("tool call " + std::string(ctx_.call_id) + " already finished");
    // Stay active until the end event is out, so a throw still gets the cancellation end
    auto response = emitter_->finish(ctx_, std::move(result));
    active_ = false;
    return response;
}

} // namespace toolevents
