#pragma once

#include "executor.hpp"

#include <signal.h>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <sys/types.h>
#include <vector>

namespace knntune {

    // Bounded pool of fork()ed worker processes.
    //
    // Workers inherit the parent's address space at fork time, so anything the
    // job reads (a SampleStore, index lists, metrics) must be built and frozen
    // before run() is called. A Shared/File store is then read through the same
    // physical pages by every worker; a Heap store is copied on write.
    //
    // Wiring: one task pipe per worker (parent -> child, task ids) and one result
    // pipe shared by all workers (child -> parent, fixed-size messages smaller
    // than PIPE_BUF, so concurrent writes never interleave).
    //
    // A worker that dies mid-task yields a failed Completion for that task and
    // is replaced by a fresh fork while work remains.
    class ProcessPool {
    public:
        ProcessPool(size_t workers, Job job, bool verbose = false);

        // Closes every task pipe, then reaps all workers.
        ~ProcessPool();

        ProcessPool(const ProcessPool&) = delete;
        ProcessPool& operator=(const ProcessPool&) = delete;

        // Runs tasks [0, count); returns once every task has completed or failed.
        void run(size_t count, const OnComplete& on_complete);

        size_t size() const { return workers_.size(); }

        // Workers forked to replace ones that died.
        size_t respawned() const { return respawned_; }

    private:
        struct Worker {
            pid_t pid = -1;
            int task_fd = -1;       // parent's write end of this worker's task pipe
            bool busy = false;
            size_t task = 0;
        };

        void spawn(size_t slot);
        [[noreturn]] void worker_main(size_t slot, int task_fd);

        bool dispatch(size_t slot, size_t task);
        void dispatch_pending();

        // Reads every complete result message currently in the pipe.
        // Waits up to timeout_ms for the first one.
        void drain(int timeout_ms);
        void reap();
        void retire(size_t slot);

        void finish(size_t task, TaskOutcome outcome);
        void shutdown();

        Job job_;
        bool verbose_;
        std::vector<Worker> workers_;
        std::deque<size_t> pending_;

        int result_read_ = -1;
        int result_write_ = -1;

        const OnComplete* on_complete_ = nullptr;
        size_t completed_ = 0;
        size_t respawned_ = 0;

        struct sigaction old_sigpipe_;
    };

} // namespace knntune
