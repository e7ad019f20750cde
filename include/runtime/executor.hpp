#pragma once

#include "../common/config.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace knntune {

    // How independent tasks [0, count) are fanned out.
    enum class ExecutorKind {
        Inline,     // one after another on the calling thread
        Threads,    // OpenMP team, dynamic schedule
        Processes   // fork()ed worker processes (see ProcessPool)
    };

    std::string executor_name(ExecutorKind kind);

    // "inline", "threads", "processes". Throws KnnError otherwise.
    ExecutorKind parse_executor(const std::string& name);

    // What a task hands back to the coordinator. Kept small and flat so it can
    // cross a pipe as a fixed-size message.
    struct TaskOutcome {
        bool ok = true;
        double value = 0.0;
        double elapsed_ms = 0.0;
        std::string error;
    };

    struct Completion {
        size_t task;
        TaskOutcome outcome;
    };

    // Runs inside a worker. Exceptions it throws are turned into a failed outcome.
    using Job = std::function<TaskOutcome(size_t task)>;

    // Called on the coordinating thread, once per task, in completion order.
    using OnComplete = std::function<void(const Completion&)>;

    // 0 means one worker per hardware thread (at least 1).
    size_t resolve_workers(size_t requested);

    // Runs the job, converting an escaping exception into a failed outcome.
    TaskOutcome run_guarded(const Job& job, size_t task);

    void run_inline(size_t count, const Job& job, const OnComplete& on_complete);

    // Completions are collected under a SpinLock while the team runs and
    // delivered after the parallel region ends.
    void run_threads(size_t count, size_t workers, const Job& job, const OnComplete& on_complete);

    // Dispatches to run_inline, run_threads or a scoped ProcessPool.
    void run_tasks(ExecutorKind kind, size_t workers, size_t count,
                   const Job& job, const OnComplete& on_complete, bool verbose = false);

} // namespace knntune
