#include "../../include/runtime/executor.hpp"
#include "../../include/runtime/process_pool.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/common/spinlock.hpp"

#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

namespace knntune {

    std::string executor_name(ExecutorKind kind) {
        switch (kind) {
            case ExecutorKind::Inline:    return "inline";
            case ExecutorKind::Threads:   return "threads";
            case ExecutorKind::Processes: return "processes";
        }
        return "?";
    }

    ExecutorKind parse_executor(const std::string& name) {
        if (name == "inline") return ExecutorKind::Inline;
        if (name == "threads") return ExecutorKind::Threads;
        if (name == "processes") return ExecutorKind::Processes;
        throw KnnError("unknown executor '" + name + "'");
    }

    size_t resolve_workers(size_t requested) {
        if (requested > 0) return requested;
        unsigned int hc = std::thread::hardware_concurrency();
        return hc == 0 ? 1 : hc;
    }

    TaskOutcome run_guarded(const Job& job, size_t task) {
        try {
            return job(task);
        } catch (const std::exception& e) {
            TaskOutcome failed;
            failed.ok = false;
            failed.error = e.what();
            return failed;
        } catch (...) {
            TaskOutcome failed;
            failed.ok = false;
            failed.error = "non-standard exception";
            return failed;
        }
    }

    void run_inline(size_t count, const Job& job, const OnComplete& on_complete) {
        for (size_t task = 0; task < count; ++task) {
            on_complete({task, run_guarded(job, task)});
        }
    }

    void run_threads(size_t count, size_t workers, const Job& job, const OnComplete& on_complete) {
        std::vector<Completion> done;
        done.reserve(count);
        SpinLock done_lock;

        // Nothing may escape an OpenMP region, hence run_guarded.
        const long n = static_cast<long>(count);
        #pragma omp parallel for schedule(dynamic, 1) num_threads((int)resolve_workers(workers))
        for (long task = 0; task < n; ++task) {
            Completion c{(size_t)task, run_guarded(job, (size_t)task)};
            std::lock_guard<SpinLock> guard(done_lock);
            done.push_back(std::move(c));
        }

        for (const Completion& c : done) {
            on_complete(c);
        }
    }

    void run_tasks(ExecutorKind kind, size_t workers, size_t count,
                   const Job& job, const OnComplete& on_complete, bool verbose) {
        if (count == 0) return;
        switch (kind) {
            case ExecutorKind::Inline:
                run_inline(count, job, on_complete);
                return;
            case ExecutorKind::Threads:
                run_threads(count, workers, job, on_complete);
                return;
            case ExecutorKind::Processes: {
                // Never start more processes than there are tasks.
                size_t n = std::min(resolve_workers(workers), count);
                ProcessPool pool(n, job, verbose);
                pool.run(count, on_complete);
                return;
            }
        }
    }

} // namespace knntune
