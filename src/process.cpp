#include "process.hpp"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace cerberus_dash {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ChildProcess spawn_process(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::system_error(EINVAL, std::generic_category(), "spawn: empty command");
    }

    // Build argv before forking; the child may only call async-signal-safe functions
    std::vector<char*> av;
    for (const auto& arg : argv) av.push_back(const_cast<char*>(arg.c_str()));
    av.push_back(nullptr);

    int out[2];
    if (::pipe2(out, O_CLOEXEC) < 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }

    // Close-on-exec pipe: stays silent if exec succeeds, carries errno if not
    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(out[0]);
        ::close(out[1]);
        throw std::system_error(err, std::generic_category(), "pipe");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(out[0]);
        ::close(out[1]);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::dup2(out[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(av[0], av.data());
        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(out[1]);
    ::close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        ::close(out[0]);
        reap(pid);
        throw std::system_error(exec_errno, std::generic_category(), "exec " + argv[0]);
    }

    ChildProcess child;
    child.pid = pid;
    child.stdout_fd = out[0];
    return child;
}

void terminate_process(ChildProcess& child) {
    close_fd(child.stdout_fd);
    if (child.pid > 0) {
        ::kill(child.pid, SIGTERM);
        reap(child.pid);
        child.pid = -1;
    }
}

std::optional<CommandResult> run_command(const std::vector<std::string>& argv,
                                         std::chrono::milliseconds timeout) {
    ChildProcess child;
    try {
        child = spawn_process(argv);
    } catch (const std::system_error&) {
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    CommandResult result;
    char buf[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            ::kill(child.pid, SIGKILL);
            terminate_process(child);
            return std::nullopt;
        }

        pollfd pfd{child.stdout_fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            terminate_process(child);
            return std::nullopt;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(child.stdout_fd, buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }

    close_fd(child.stdout_fd);
    result.exit_code = reap(child.pid);
    child.pid = -1;
    return result;
}

} // namespace cerberus_dash
