#include "radbatch/execution/process.hpp"
#include "radbatch/core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <deque>
#include <regex>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace radbatch::execution {

namespace {

constexpr size_t kTailLines = 20;

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    int release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

class SpawnActions {
public:
    SpawnActions() { posix_spawn_file_actions_init(&actions_); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    posix_spawn_file_actions_t* get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        const std::string key = entry.substr(0, entry.find('='));
        if (overrides.count(key) == 0) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

int wait_for(pid_t pid, int& signal_out) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        signal_out = WTERMSIG(status);
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::string ExitInfo::describe() const {
    if (signal != 0) {
        return "terminated by signal " + std::to_string(signal);
    }
    return "exit code " + std::to_string(exit_code);
}

ExitInfo run_invocation(const Invocation& inv, const LineCallback& on_line) {
    if (inv.stages.empty()) {
        throw ExecutionError("empty invocation");
    }
    for (const auto& stage : inv.stages) {
        if (stage.argv.empty() || stage.argv.front().empty()) {
            throw ExecutionError("invocation stage without program");
        }
    }

    int diag_fds[2];
    if (::pipe2(diag_fds, O_CLOEXEC) != 0) {
        throw ExecutionError(std::string("pipe: ") + std::strerror(errno));
    }
    FdGuard diag_read(diag_fds[0]);
    FdGuard diag_write(diag_fds[1]);

    FdGuard out_fd;
    if (inv.stdout_path) {
        std::error_code ec;
        if (inv.stdout_path->has_parent_path()) {
            fs::create_directories(inv.stdout_path->parent_path(), ec);
        }
        out_fd.reset(::open(inv.stdout_path->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (out_fd.get() < 0) {
            throw ExecutionError("cannot open output " + inv.stdout_path->string() + ": " +
                                 std::strerror(errno));
        }
    } else if (inv.discard_stdout) {
        out_fd.reset(::open("/dev/null", O_WRONLY | O_CLOEXEC));
    }

    std::vector<std::string> env_storage = build_environment(inv.env);
    std::vector<char*> envp = to_c_array(env_storage);

    std::vector<pid_t> pids;
    std::string launch_error;
    FdGuard prev_read;

    for (size_t i = 0; i < inv.stages.size(); ++i) {
        const bool last = (i + 1 == inv.stages.size());
        FdGuard next_read;
        FdGuard next_write;
        if (!last) {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                launch_error = std::string("pipe: ") + std::strerror(errno);
                break;
            }
            next_read.reset(fds[0]);
            next_write.reset(fds[1]);
        }

        SpawnActions actions;
        if (prev_read.get() >= 0) {
            posix_spawn_file_actions_adddup2(actions.get(), prev_read.get(), STDIN_FILENO);
        } else {
            posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        }
        if (!last) {
            posix_spawn_file_actions_adddup2(actions.get(), next_write.get(), STDOUT_FILENO);
        } else if (out_fd.get() >= 0) {
            posix_spawn_file_actions_adddup2(actions.get(), out_fd.get(), STDOUT_FILENO);
        } else {
            posix_spawn_file_actions_adddup2(actions.get(), diag_write.get(), STDOUT_FILENO);
        }
        posix_spawn_file_actions_adddup2(actions.get(), diag_write.get(), STDERR_FILENO);

        std::vector<std::string> argv_storage = inv.stages[i].argv;
        std::vector<char*> argv = to_c_array(argv_storage);

        pid_t pid = 0;
        const int rc = ::posix_spawnp(&pid, argv[0], actions.get(), nullptr, argv.data(), envp.data());
        if (rc != 0) {
            launch_error = "cannot launch " + inv.stages[i].argv.front() + ": " + std::strerror(rc);
            break;
        }
        pids.push_back(pid);
        prev_read.reset(next_read.release());
    }

    // Parent keeps only the read end; children hold the write ends.
    prev_read.reset();
    diag_write.reset();
    out_fd.reset();

    ExitInfo info;
    std::deque<std::string> tail;
    std::string pending;
    char buf[4096];
    auto flush_line = [&](std::string line) {
        if (line.empty()) {
            return;
        }
        if (on_line) {
            on_line(line);
        }
        tail.push_back(std::move(line));
        if (tail.size() > kTailLines) {
            tail.pop_front();
        }
    };

    while (true) {
        const ssize_t n = ::read(diag_read.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        for (ssize_t k = 0; k < n; ++k) {
            const char c = buf[k];
            if (c == '\n' || c == '\r') {
                flush_line(std::move(pending));
                pending.clear();
            } else {
                pending += c;
            }
        }
    }
    flush_line(std::move(pending));

    info.exit_code = 0;
    for (pid_t pid : pids) {
        int sig = 0;
        const int code = wait_for(pid, sig);
        if (code != 0 && info.exit_code == 0) {
            info.exit_code = code;
            info.signal = sig;
        }
    }
    info.tail.assign(tail.begin(), tail.end());

    if (!launch_error.empty()) {
        throw ExecutionError(launch_error);
    }
    return info;
}

std::optional<float> parse_progress_percent(const std::string& line) {
    static const std::regex re(R"(([0-9]+(?:\.[0-9]+)?)\s*%)");
    std::smatch m;
    if (!std::regex_search(line, m, re)) {
        return std::nullopt;
    }
    try {
        return std::stof(m[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace radbatch::execution
