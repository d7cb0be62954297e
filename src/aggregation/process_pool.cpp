#include "radbatch/aggregation/process_pool.hpp"
#include "radbatch/core/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <map>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace radbatch::aggregation {

namespace {

struct ActiveTask {
    size_t index = 0;
    pid_t pid = -1;
    std::string buffer;
};

void write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        off += static_cast<size_t>(n);
    }
}

// Child side: never returns.
[[noreturn]] void run_child(int fd, const json& message, const ProcessPool::Handler& handler) {
    int code = 0;
    std::string out;
    try {
        out = json{{"ok", true}, {"result", handler(message)}}.dump();
    } catch (const std::exception& e) {
        out = json{{"ok", false}, {"error", e.what()}}.dump();
        code = 1;
    }
    write_all(fd, out);
    ::close(fd);
    ::_exit(code);
}

TaskOutcome decode_reply(const std::string& buffer, int status) {
    TaskOutcome outcome;
    json reply = json::parse(buffer, nullptr, false);
    if (!reply.is_discarded() && reply.is_object()) {
        outcome.ok = reply.value("ok", false);
        if (outcome.ok) {
            outcome.payload = reply.value("result", json());
        } else {
            outcome.error = reply.value("error", std::string("worker failed"));
        }
        return outcome;
    }
    if (WIFSIGNALED(status)) {
        outcome.error = "worker terminated by signal " + std::to_string(WTERMSIG(status));
    } else if (WIFEXITED(status)) {
        outcome.error = "worker exited with code " + std::to_string(WEXITSTATUS(status)) +
                        " without a result";
    } else {
        outcome.error = "worker ended without a result";
    }
    return outcome;
}

} // namespace

ProcessPool::ProcessPool(int max_workers) : max_workers_(std::max(1, max_workers)) {}

std::vector<TaskOutcome> ProcessPool::run_inline(const std::vector<json>& messages,
                                                 const Handler& handler) {
    std::vector<TaskOutcome> outcomes(messages.size());
    for (size_t i = 0; i < messages.size(); ++i) {
        try {
            // Same serialization boundary as the forked path.
            outcomes[i].payload = json::parse(handler(json::parse(messages[i].dump())).dump());
            outcomes[i].ok = true;
        } catch (const std::exception& e) {
            outcomes[i].error = e.what();
        }
    }
    return outcomes;
}

std::vector<TaskOutcome> ProcessPool::run(const std::vector<json>& messages, const Handler& handler) {
    if (max_workers_ <= 1 || messages.size() <= 1) {
        return run_inline(messages, handler);
    }

    std::vector<TaskOutcome> outcomes(messages.size());
    std::map<int, ActiveTask> active;  // read fd -> task
    size_t next = 0;

    auto spawn = [&](size_t index) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw AggregationError(std::string("pipe: ") + std::strerror(errno));
        }
        std::cout.flush();
        std::cerr.flush();
        std::fflush(nullptr);
        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            ::close(fds[0]);
            ::close(fds[1]);
            throw AggregationError(std::string("fork: ") + std::strerror(err));
        }
        if (pid == 0) {
            ::close(fds[0]);
            run_child(fds[1], messages[index], handler);
        }
        ::close(fds[1]);
        active[fds[0]] = ActiveTask{index, pid, {}};
    };

    auto finish = [&](int fd) {
        ActiveTask task = std::move(active.at(fd));
        active.erase(fd);
        ::close(fd);
        int status = 0;
        while (::waitpid(task.pid, &status, 0) == -1 && errno == EINTR) {
        }
        outcomes[task.index] = decode_reply(task.buffer, status);
    };

    // Stops and reaps every child still running.
    auto abandon = [&]() {
        for (auto& [fd, task] : active) {
            ::close(fd);
            ::kill(task.pid, SIGTERM);
            int status = 0;
            while (::waitpid(task.pid, &status, 0) == -1 && errno == EINTR) {
            }
        }
        active.clear();
    };

    char buf[65536];
    try {
        while (next < messages.size() || !active.empty()) {
            while (next < messages.size() && static_cast<int>(active.size()) < max_workers_) {
                spawn(next++);
            }

            std::vector<pollfd> fds;
            fds.reserve(active.size());
            for (const auto& [fd, task] : active) {
                fds.push_back({fd, POLLIN, 0});
            }
            const int ready = ::poll(fds.data(), fds.size(), -1);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw AggregationError(std::string("poll: ") + std::strerror(errno));
            }

            for (const auto& p : fds) {
                if (p.revents == 0) {
                    continue;
                }
                const ssize_t n = ::read(p.fd, buf, sizeof(buf));
                if (n > 0) {
                    active.at(p.fd).buffer.append(buf, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    finish(p.fd);
                }
            }
        }
    } catch (...) {
        abandon();
        throw;
    }
    return outcomes;
}

} // namespace radbatch::aggregation
