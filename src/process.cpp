/**
 * Handfont — Child process execution implementation (POSIX)
 */

#include "process.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Per-stream capture cap; anything beyond is read and discarded so the child
// never blocks on a full pipe.
static constexpr size_t MAX_CAPTURE_BYTES = 1024 * 1024;

namespace {

struct PipePair {
    int read_fd  = -1;
    int write_fd = -1;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) return false;
        read_fd = fds[0];
        write_fd = fds[1];
        return true;
    }

    void close_read()  { if (read_fd >= 0)  { ::close(read_fd);  read_fd = -1; } }
    void close_write() { if (write_fd >= 0) { ::close(write_fd); write_fd = -1; } }

    ~PipePair() {
        close_read();
        close_write();
    }
};

// Reads whatever is available right now. Returns false once the pipe hit EOF.
bool drain_fd(int fd, string& sink) {
    array<char, 8192> buf;

    while (true) {
        ssize_t n = ::read(fd, buf.data(), buf.size());

        if (n > 0) {
            size_t room = sink.size() < MAX_CAPTURE_BYTES ? MAX_CAPTURE_BYTES - sink.size() : 0;
            sink.append(buf.data(), std::min(room, static_cast<size_t>(n)));
            continue;
        }

        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int decode_wait_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return -1;
}

void reap(pid_t pid, int& st) {
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
}

// True once the child has terminated. The zombie is left in place (WNOWAIT)
// so its pid, and therefore its process group id, cannot be recycled before
// killpg() runs.
bool child_has_exited(pid_t pid) {
    siginfo_t info {};
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) return false;
    return info.si_pid == pid;
}

} // namespace

const char* process_status_name(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Exited:      return "exited";
        case ProcessStatus::NotFound:    return "not-found";
        case ProcessStatus::TimedOut:    return "timed-out";
        case ProcessStatus::SpawnFailed: return "spawn-failed";
    }
    return "unknown";
}

ProcessResult run_process(const vector<string>& argv, std::chrono::milliseconds timeout) {
    ProcessResult result;

    if (argv.empty() || argv[0].empty()) {
        result.error = "empty command";
        return result;
    }

    PipePair out_pipe, err_pipe, exec_pipe;

    if (!out_pipe.open() || !err_pipe.open() || !exec_pipe.open()) {
        result.error = std::strerror(errno);
        return result;
    }

    // Build the C argv before forking; the child must not allocate.
    vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    pid_t pid = ::fork();

    if (pid < 0) {
        result.error = std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe.write_fd, STDOUT_FILENO);
        ::dup2(err_pipe.write_fd, STDERR_FILENO);

        ::execvp(cargs[0], cargs.data());

        int e = errno;
        ssize_t w = ::write(exec_pipe.write_fd, &e, sizeof(e));
        (void)w;
        ::_exit(127);
    }

    ::setpgid(pid, pid); // mirror the child's call, whichever runs first
    out_pipe.close_write();
    err_pipe.close_write();
    exec_pipe.close_write();

    // The exec pipe is close-on-exec: EOF means execvp succeeded, an int means it failed.
    int exec_errno = 0;
    size_t got = 0;

    while (got < sizeof(exec_errno)) {
        ssize_t n = ::read(exec_pipe.read_fd, reinterpret_cast<char*>(&exec_errno) + got, sizeof(exec_errno) - got);
        if (n > 0) { got += static_cast<size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        break;
    }

    if (got == sizeof(exec_errno)) {
        int st = 0;
        reap(pid, st);
        result.error = std::strerror(exec_errno);
        result.status = (exec_errno == ENOENT || exec_errno == ENOTDIR || exec_errno == EACCES)
            ? ProcessStatus::NotFound
            : ProcessStatus::SpawnFailed;
        return result;
    }

    set_nonblocking(out_pipe.read_fd);
    set_nonblocking(err_pipe.read_fd);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;

    while (true) {
        array<pollfd, 2> fds {};
        nfds_t nfds = 0;
        if (out_pipe.read_fd >= 0) fds[nfds++] = pollfd{out_pipe.read_fd, POLLIN, 0};
        if (err_pipe.read_fd >= 0) fds[nfds++] = pollfd{err_pipe.read_fd, POLLIN, 0};

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) { timed_out = true; break; }

        auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(remain, 50));

        int rc = ::poll(nfds ? fds.data() : nullptr, nfds, wait_ms);

        if (rc > 0) {
            for (nfds_t i = 0; i < nfds; i++) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

                if (fds[i].fd == out_pipe.read_fd) {
                    if (!drain_fd(out_pipe.read_fd, result.stdout_text)) out_pipe.close_read();
                } else if (fds[i].fd == err_pipe.read_fd) {
                    if (!drain_fd(err_pipe.read_fd, result.stderr_text)) err_pipe.close_read();
                }
            }
        }

        if (child_has_exited(pid)) break;
    }

    // Pick up anything still buffered, then take down the whole group: on
    // timeout that includes the child itself, on a normal exit it catches any
    // descendants left running.
    if (out_pipe.read_fd >= 0) drain_fd(out_pipe.read_fd, result.stdout_text);
    if (err_pipe.read_fd >= 0) drain_fd(err_pipe.read_fd, result.stderr_text);

    ::killpg(pid, SIGKILL);

    int st = 0;
    reap(pid, st);

    if (timed_out) {
        result.status = ProcessStatus::TimedOut;
        result.exit_code = -1;
    } else {
        result.status = ProcessStatus::Exited;
        result.exit_code = decode_wait_status(st);
    }

    return result;
}
