#include "../../include/runtime/process_pool.hpp"
#include "../../include/common/config.hpp"
#include "../../include/common/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <iostream>

#include <signal.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace knntune {

    namespace {

        // One result on the wire. Every field is fixed size so a message is
        // written with a single write() no larger than PIPE_BUF.
        struct ResultMessage {
            uint32_t slot;
            uint32_t ok;
            uint64_t task;
            double value;
            double elapsed_ms;
            char error[224];
        };

        static_assert(sizeof(ResultMessage) <= PIPE_BUF, "result messages must be atomic pipe writes");

        bool write_all(int fd, const void* buf, size_t n) {
            const char* p = static_cast<const char*>(buf);
            while (n > 0) {
                ssize_t w = write(fd, p, n);
                if (w < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                p += w;
                n -= (size_t)w;
            }
            return true;
        }

        // Returns the number of bytes read; short only on EOF or error.
        size_t read_all(int fd, void* buf, size_t n) {
            char* p = static_cast<char*>(buf);
            size_t got = 0;
            while (got < n) {
                ssize_t r = read(fd, p + got, n - got);
                if (r < 0) {
                    if (errno == EINTR) continue;
                    break;
                }
                if (r == 0) break;
                got += (size_t)r;
            }
            return got;
        }

        std::string describe_exit(int status) {
            if (WIFSIGNALED(status)) {
                return "killed by signal " + std::to_string(WTERMSIG(status))
                       + " (" + strsignal(WTERMSIG(status)) + ")";
            }
            if (WIFEXITED(status)) {
                return "exited with status " + std::to_string(WEXITSTATUS(status));
            }
            return "stopped";
        }

    } // namespace

    ProcessPool::ProcessPool(size_t workers, Job job, bool verbose)
        : job_(std::move(job)), verbose_(verbose), workers_(std::max<size_t>(workers, 1))
    {
        int fds[2];
        if (pipe(fds) != 0) {
            throw KnnError(std::string("failed to create result pipe: ") + std::strerror(errno));
        }
        result_read_ = fds[0];
        result_write_ = fds[1];

        // A worker that died leaves a task pipe with no reader. Writing to it must
        // fail with EPIPE instead of killing the coordinator.
        struct sigaction ignore;
        std::memset(&ignore, 0, sizeof(ignore));
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGPIPE, &ignore, &old_sigpipe_);
    }

    ProcessPool::~ProcessPool() {
        shutdown();
        close(result_read_);
        close(result_write_);
        sigaction(SIGPIPE, &old_sigpipe_, nullptr);
    }

    void ProcessPool::spawn(size_t slot) {
        int fds[2];
        if (pipe(fds) != 0) {
            throw KnnError(std::string("failed to create task pipe: ") + std::strerror(errno));
        }

        pid_t pid = fork();
        if (pid < 0) {
            int err = errno;
            close(fds[0]);
            close(fds[1]);
            throw KnnError(std::string("fork failed: ") + std::strerror(err));
        }

        if (pid == 0) {
            // ---------------- CHILD ----------------
            close(fds[1]);
            close(result_read_);
            for (size_t i = 0; i < workers_.size(); ++i) {
                if (workers_[i].task_fd != -1) close(workers_[i].task_fd);
            }
            signal(SIGPIPE, SIG_DFL);
            worker_main(slot, fds[0]);
        }

        // ---------------- PARENT ----------------
        close(fds[0]);
        Worker& w = workers_[slot];
        w.pid = pid;
        w.task_fd = fds[1];
        w.busy = false;

        if (verbose_) {
            std::cout << "[Pool] Worker " << slot << " started (pid " << pid << ")" << std::endl;
        }
    }

    void ProcessPool::worker_main(size_t slot, int task_fd) {
        while (true) {
            uint64_t task = 0;
            if (read_all(task_fd, &task, sizeof(task)) != sizeof(task)) {
                // Parent closed our pipe: no more work.
                _exit(0);
            }

            TaskOutcome outcome = run_guarded(job_, (size_t)task);

            ResultMessage msg;
            std::memset(&msg, 0, sizeof(msg));
            msg.slot = (uint32_t)slot;
            msg.ok = outcome.ok ? 1 : 0;
            msg.task = task;
            msg.value = outcome.value;
            msg.elapsed_ms = outcome.elapsed_ms;
            std::strncpy(msg.error, outcome.error.c_str(), sizeof(msg.error) - 1);

            if (!write_all(result_write_, &msg, sizeof(msg))) {
                _exit(1);
            }
        }
    }

    bool ProcessPool::dispatch(size_t slot, size_t task) {
        uint64_t wire = task;
        return write_all(workers_[slot].task_fd, &wire, sizeof(wire));
    }

    void ProcessPool::dispatch_pending() {
        for (size_t slot = 0; slot < workers_.size() && !pending_.empty(); ++slot) {
            Worker& w = workers_[slot];
            if (w.pid == -1 || w.busy) continue;

            size_t task = pending_.front();
            if (!dispatch(slot, task)) {
                // Its reader is gone; the next reap() replaces the worker.
                continue;
            }
            pending_.pop_front();
            w.busy = true;
            w.task = task;
        }
    }

    void ProcessPool::drain(int timeout_ms) {
        int wait = timeout_ms;
        while (true) {
            struct pollfd pfd;
            pfd.fd = result_read_;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ready = poll(&pfd, 1, wait);
            if (ready < 0) {
                if (errno == EINTR) continue;
                throw KnnError(std::string("poll on result pipe failed: ") + std::strerror(errno));
            }
            if (ready == 0 || !(pfd.revents & POLLIN)) return;

            ResultMessage msg;
            if (read_all(result_read_, &msg, sizeof(msg)) != sizeof(msg)) {
                throw KnnError("short read on result pipe");
            }
            wait = 0;

            if (msg.slot >= workers_.size()) continue;
            Worker& w = workers_[msg.slot];
            if (!w.busy || w.task != msg.task) {
                // Already accounted for (its worker was declared dead first).
                continue;
            }
            w.busy = false;

            TaskOutcome outcome;
            outcome.ok = msg.ok != 0;
            outcome.value = msg.value;
            outcome.elapsed_ms = msg.elapsed_ms;
            msg.error[sizeof(msg.error) - 1] = '\0';
            outcome.error = msg.error;
            finish((size_t)msg.task, std::move(outcome));
        }
    }

    void ProcessPool::reap() {
        for (size_t slot = 0; slot < workers_.size(); ++slot) {
            Worker& w = workers_[slot];
            if (w.pid == -1) continue;

            int status = 0;
            pid_t r = waitpid(w.pid, &status, WNOHANG);
            if (r == 0) continue;               // still running
            if (r < 0 && errno == EINTR) continue;

            // Anything it wrote before dying is already in the pipe.
            drain(0);

            std::string why = (r < 0) ? std::string("vanished: ") + std::strerror(errno)
                                      : describe_exit(status);
            std::cerr << "[Pool] Worker " << slot << " (pid " << w.pid << ") " << why << std::endl;

            w.pid = -1;
            if (w.busy) {
                w.busy = false;
                TaskOutcome failed;
                failed.ok = false;
                failed.error = "worker process " + why;
                finish(w.task, std::move(failed));
            }
            retire(slot);

            if (!pending_.empty()) {
                try {
                    spawn(slot);
                    respawned_++;
                } catch (const KnnError& e) {
                    std::cerr << "[Pool] Could not replace worker " << slot << ": " << e.what() << std::endl;
                }
            }
        }

        bool any_alive = std::any_of(workers_.begin(), workers_.end(),
                                     [](const Worker& w) { return w.pid != -1; });
        if (!any_alive) {
            while (!pending_.empty()) {
                size_t task = pending_.front();
                pending_.pop_front();
                TaskOutcome failed;
                failed.ok = false;
                failed.error = "no live worker processes";
                finish(task, std::move(failed));
            }
        }
    }

    void ProcessPool::retire(size_t slot) {
        Worker& w = workers_[slot];
        if (w.task_fd != -1) {
            close(w.task_fd);
            w.task_fd = -1;
        }
        w.busy = false;
    }

    void ProcessPool::finish(size_t task, TaskOutcome outcome) {
        completed_++;
        (*on_complete_)({task, std::move(outcome)});
    }

    void ProcessPool::run(size_t count, const OnComplete& on_complete) {
        on_complete_ = &on_complete;
        completed_ = 0;
        pending_.clear();
        for (size_t t = 0; t < count; ++t) pending_.push_back(t);

        for (size_t slot = 0; slot < workers_.size(); ++slot) {
            if (workers_[slot].pid == -1) spawn(slot);
        }
        if (verbose_) {
            std::cout << "[Pool] " << workers_.size() << " workers, " << count << " tasks" << std::endl;
        }

        // Fan-in: the coordinator only ever waits for the next completion.
        dispatch_pending();
        while (completed_ < count) {
            drain(config::POOL_POLL_MS);
            reap();
            dispatch_pending();
        }
        on_complete_ = nullptr;
    }

    void ProcessPool::shutdown() {
        for (size_t slot = 0; slot < workers_.size(); ++slot) {
            Worker& w = workers_[slot];
            if (w.pid == -1) continue;
            // Abandoned mid-task (the coordinator is unwinding): no need to wait for it.
            if (w.busy) kill(w.pid, SIGTERM);
            retire(slot);
        }
        for (Worker& w : workers_) {
            if (w.pid == -1) continue;
            int status = 0;
            while (waitpid(w.pid, &status, 0) < 0 && errno == EINTR) {
            }
            w.pid = -1;
        }
    }

} // namespace knntune
