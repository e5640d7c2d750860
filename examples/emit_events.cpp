// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file emit_events.cpp
/// @brief Prints the events of a shell call and a patch call as JSON lines

#include <iostream>
#include <memory>
#include <string>
#include <toolevents/toolevents.hpp>

namespace
{

/// Diff tracker that renders added and updated files only
class SimpleDiffTracker : public toolevents::TurnDiffTracker
{
  public:
    void on_patch_begin(const toolevents::FileChanges& changes) override
    {
        for (const auto& [path, change] : changes)
            changes_[path] = change;
    }

    std::optional<std::string> get_unified_diff() override
    {
        std::string diff;
        for (const auto& [path, change] : changes_)
        {
            if (change.kind == toolevents::FileChangeKind::Add)
            {
                diff += "--- /dev/null\n+++ b/" + path + "\n";
                diff += "+" + change.content;
            }
            else if (change.kind == toolevents::FileChangeKind::Update)
            {
                diff += "--- a/" + path + "\n+++ b/" + change.move_path.value_or(path) + "\n";
                diff += change.unified_diff;
            }
        }
        if (diff.empty())
            return std::nullopt;
        return diff;
    }

  private:
    toolevents::FileChanges changes_;
};

} // namespace

int main()
{
    using namespace toolevents;
    using namespace std::chrono_literals;

    try
    {
        auto session = std::make_shared<Session>("example-session");
        auto subscription = session->on(
            [](const Event& event) { std::cout << dump_event(event) << "\n"; }
        );

        TurnContext turn{.sub_id = "turn-1", .cwd = "/tmp/project"};
        SharedTurnDiffTracker tracker(std::make_unique<SimpleDiffTracker>());

        // Shell command that exits non-zero
        auto shell = ToolEmitter::shell({"bash", "-lc", "rg -n TODO src"}, turn.cwd, ExecCommandSource::Agent);
        ToolEventCtx shell_ctx{.session = *session, .turn = turn, .call_id = "call-1"};
        {
            auto scope = shell.start(shell_ctx);

            ExecToolCallOutput output;
            output.exit_code = 1;
            output.duration = 37ms;
            auto result = scope.finish(output);
            std::cout << "model <- " << result.content() << "\n";
        }

        // Patch with a tracked diff
        FileChanges changes = {
            {"README.md", FileChange::add("# project\n")},
        };
        auto patch = ToolEmitter::apply_patch(changes, true);
        ToolEventCtx patch_ctx{.session = *session, .turn = turn, .call_id = "call-2", .turn_diff_tracker = &tracker};
        {
            auto scope = patch.start(patch_ctx);

            ExecToolCallOutput output;
            output.stdout_stream.text = "Success. Updated the following files:\nA README.md\n";
            auto result = scope.finish(output);
            std::cout << "model <- " << result.content() << "\n";
        }

        // Call abandoned before it finished
        auto abandoned = ToolEmitter::shell({"sleep", "60"}, turn.cwd, ExecCommandSource::UserShell);
        ToolEventCtx abandoned_ctx{.session = *session, .turn = turn, .call_id = "call-3"};
        {
            auto scope = abandoned.start(abandoned_ctx);
        }

        std::cout << "events sent: " << session->events_sent() << "\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
