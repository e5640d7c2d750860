// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file diff_tracker.hpp
/// @brief Turn-scoped diff tracking behind an exclusive lock

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <toolevents/errors.hpp>
#include <toolevents/types.hpp>

namespace toolevents
{

// =============================================================================
// Diff Tracker Interface
// =============================================================================

/// Abstract interface for accumulating file changes across a turn
///
/// Implementations snapshot pre-images when a patch begins and render every
/// change made since the first snapshot as one unified diff.
class TurnDiffTracker
{
  public:
    virtual ~TurnDiffTracker() = default;

    /// Record the files a patch is about to touch
    virtual void on_patch_begin(const FileChanges& changes) = 0;

    /// Unified diff of everything tracked so far
    /// @return nullopt when nothing changed
    /// @throws DiffError when the diff cannot be computed
    virtual std::optional<std::string> get_unified_diff() = 0;
};

// =============================================================================
// SharedTurnDiffTracker
// =============================================================================

/// A diff tracker shared by the concurrent tool calls of one turn
class SharedTurnDiffTracker
{
  public:
    /// Exclusive access to the tracker; the lock is released when the guard is destroyed
    class Guard
    {
      public:
        Guard(std::unique_lock<std::mutex> lock, TurnDiffTracker& tracker)
            : lock_(std::move(lock)), tracker_(&tracker)
        {
        }

        TurnDiffTracker* operator->() const
        {
            return tracker_;
        }

        TurnDiffTracker& operator*() const
        {
            return *tracker_;
        }

      private:
        std::unique_lock<std::mutex> lock_;
        TurnDiffTracker* tracker_;
    };

    explicit SharedTurnDiffTracker(std::unique_ptr<TurnDiffTracker> tracker)
        : tracker_(std::move(tracker))
    {
    }

    // Non-copyable, non-movable (the mutex is shared state)
    SharedTurnDiffTracker(const SharedTurnDiffTracker&) = delete;
    SharedTurnDiffTracker& operator=(const SharedTurnDiffTracker&) = delete;

    /// Block until the tracker is free and take it
    Guard lock()
    {
        return Guard(std::unique_lock<std::mutex>(mutex_), *tracker_);
    }

    /// Take the tracker only if nobody holds it
    std::optional<Guard> try_lock()
    {
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock())
            return std::nullopt;
        return Guard(std::move(lock), *tracker_);
    }

  private:
    std::mutex mutex_;
    std::unique_ptr<TurnDiffTracker> tracker_;
};

} // namespace toolevents
