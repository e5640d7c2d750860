// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <toolevents/errors.hpp>

namespace toolevents
{

const char* exec_error_kind_name(ExecErrorKind kind)
{
    switch (kind)
    {
    case ExecErrorKind::SandboxTimeout:
        return "sandbox timeout";
    case ExecErrorKind::SandboxDenied:
        return "sandbox denied";
    case ExecErrorKind::SandboxSignal:
        return "sandbox signal";
    case ExecErrorKind::Spawn:
        return "spawn";
    case ExecErrorKind::Io:
        return "io";
    case ExecErrorKind::Internal:
        return "internal";
    }
    return "unknown";
}

ExecError::ExecError(ExecErrorKind kind, const std::string& detail,
                     std::optional<ExecToolCallOutput> output)
    : std::runtime_error(detail), kind_(kind), output_(std::move(output))
{
}

ExecError ExecError::sandbox_timeout(ExecToolCallOutput output)
{
    auto detail = "command timed out after " + std::to_string(output.duration.count()) + " ms";
    return ExecError(ExecErrorKind::SandboxTimeout, detail, std::move(output));
}

ExecError ExecError::sandbox_denied(ExecToolCallOutput output)
{
    auto detail = "command denied by sandbox with exit code " + std::to_string(output.exit_code);
    return ExecError(ExecErrorKind::SandboxDenied, detail, std::move(output));
}

ExecError ExecError::sandbox_signal(int signal)
{
    return ExecError(ExecErrorKind::SandboxSignal, "killed by signal " + std::to_string(signal));
}

ExecError ExecError::spawn(const std::string& detail)
{
    return ExecError(ExecErrorKind::Spawn, detail);
}

ExecError ExecError::io(const std::string& detail)
{
    return ExecError(ExecErrorKind::Io, detail);
}

ExecError ExecError::internal(const std::string& detail)
{
    return ExecError(ExecErrorKind::Internal, detail);
}

std::string ExecError::diagnostic() const
{
    return std::string("execution error: ") + exec_error_kind_name(kind_) + ": " + what();
}

} // namespace toolevents
