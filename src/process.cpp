#include "process.hpp"
#include <cerrno>
#include <cstdlib>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kChild = 0;
constexpr int kExecFailed = 127;

class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { close(); }

    int get() const { return fd_; }
    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace

ProcessResult run_process(const ProcessSpec& spec) {
    ProcessResult result;
    if (spec.argv.empty()) {
        result.err = "empty argv";
        return result;
    }

    int out_fds[2];
    int err_fds[2];
    if (pipe(out_fds) < 0) {
        result.err = "pipe failed";
        return result;
    }
    if (pipe(err_fds) < 0) {
        ::close(out_fds[0]);
        ::close(out_fds[1]);
        result.err = "pipe failed";
        return result;
    }
    Fd out_r(out_fds[0]);
    Fd out_w(out_fds[1]);
    Fd err_r(err_fds[0]);
    Fd err_w(err_fds[1]);

    std::vector<char*> cargv;
    cargv.reserve(spec.argv.size() + 1);
    for (const auto& a : spec.argv) {
        cargv.push_back(const_cast<char*>(a.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.err = "fork failed";
        return result;
    }

    if (pid == kChild) {
        if (dup2(out_w.get(), STDOUT_FILENO) < 0) _exit(kExecFailed);
        if (dup2(err_w.get(), STDERR_FILENO) < 0) _exit(kExecFailed);
        out_r.close();
        out_w.close();
        err_r.close();
        err_w.close();
        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) < 0) _exit(kExecFailed);
        for (const auto& [key, value] : spec.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }
        execvp(cargv[0], cargv.data());
        _exit(kExecFailed);
    }

    result.started = true;
    out_w.close();
    err_w.close();

    pollfd fds[2];
    fds[0].fd = out_r.get();
    fds[1].fd = err_r.get();
    bool out_open = true;
    bool err_open = true;
    char buf[64 * 1024];

    const int64_t deadline = spec.timeout.count() > 0 ? now_ms() + spec.timeout.count() : 0;

    while (out_open || err_open) {
        fds[0].events = out_open ? POLLIN : 0;
        fds[1].events = err_open ? POLLIN : 0;

        int wait_ms = -1;
        if (deadline > 0) {
            int64_t left = deadline - now_ms();
            if (left <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }

        int rc = poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.err = "poll failed";
            break;
        }
        if (rc == 0) continue;

        if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t r = read(out_r.get(), buf, sizeof(buf));
            if (r > 0) {
                result.out.append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                out_open = false;
                out_r.close();
                fds[0].fd = -1;  // poll skips negative fds
            }
        }

        if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t r = read(err_r.get(), buf, sizeof(buf));
            if (r > 0) {
                result.err.append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                err_open = false;
                err_r.close();
                fds[1].fd = -1;  // poll skips negative fds
            }
        }
    }

    if (out_open || err_open) {
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::warn("waitpid failed for {}", spec.argv[0]);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}
