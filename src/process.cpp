#include "codeowners/process.hpp"

#include <cerrno>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codeowners {

namespace {

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

// Drains both pipes together so the child never blocks on a full one.
void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2] = { { out_fd, POLLIN, 0 }, { err_fd, POLLIN, 0 } };
    std::string* sinks[2] = { &out, &err };
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            throw_errno("poll");
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // namespace

std::string format_command_line(const std::string& command,
                                const std::vector<std::string>& args) {
    std::ostringstream cmd_line;
    cmd_line << command;
    for (const auto& arg : args) {
        cmd_line << " ";
        if (arg.find(' ') != std::string::npos || arg.find('\t') != std::string::npos) {
            cmd_line << "\"" << arg << "\"";
        } else {
            cmd_line << arg;
        }
    }
    return cmd_line.str();
}

ProcessResult run_process(const std::string& command,
                          const std::vector<std::string>& args,
                          const std::string& working_dir) {
    int stdout_pipe[2] = { -1, -1 };
    int stderr_pipe[2] = { -1, -1 };

    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) throw_errno("pipe");
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        int saved = errno;
        close_pipe(stdout_pipe);
        throw std::system_error(saved, std::generic_category(), "pipe");
    }

    // Build argv before forking; the child only calls async-signal-safe functions.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    const std::string chdir_failure = "cannot change directory to " + working_dir + "\n";
    const std::string exec_failure  = "cannot execute " + command + "\n";

    pid_t pid = fork();
    if (pid == -1) {
        int saved = errno;
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw std::system_error(saved, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // The parent may block signals for a watcher thread; git must still see them.
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            ssize_t ignored = write(STDERR_FILENO, chdir_failure.data(), chdir_failure.size());
            (void)ignored;
            _exit(127);
        }

        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);

        execvp(command.c_str(), argv.data());
        ssize_t ignored = write(STDERR_FILENO, exec_failure.data(), exec_failure.size());
        (void)ignored;
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    ProcessResult result;
    try {
        drain(stdout_pipe[0], stderr_pipe[0], result.output, result.error);
    } catch (...) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        waitpid(pid, nullptr, 0);
        throw;
    }
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) throw_errno("waitpid");
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace codeowners
