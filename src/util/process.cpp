#include <stash/process.hpp>
#include <stash/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stash {

static std::vector<const char*> make_argv(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    return argv;
}

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return StashError{StashError::InvalidArg, "run_command: empty args"};
    }

    auto argv = make_argv(args);

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        return StashError{StashError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return StashError{StashError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return StashError{StashError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        if (timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);
                return StashError{StashError::IO,
                    "command '" + args[0] + "' timed out after " +
                    std::to_string(timeout_seconds) + "s"};
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return Result<CommandResult>::ok(
                CommandResult{decode_status(status), std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return StashError{StashError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

Result<int> run_interactive(const std::vector<std::string>& args,
                            const std::string& working_dir,
                            int timeout_seconds) {
    if (args.empty()) {
        return StashError{StashError::InvalidArg, "run_interactive: empty args"};
    }

    auto argv = make_argv(args);
    log::debug("exec %s", args[0].c_str());

    pid_t pid = fork();
    if (pid < 0) {
        return StashError{StashError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    int status = 0;
    if (timeout_seconds <= 0) {
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return StashError{StashError::IO,
                    std::string("waitpid failed: ") + strerror(errno)};
            }
        }
        return Result<int>::ok(decode_status(status));
    }

    auto start = std::chrono::steady_clock::now();
    for (;;) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) return Result<int>::ok(decode_status(status));
        if (w < 0 && errno != EINTR) {
            return StashError{StashError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return StashError{StashError::IO,
                "command '" + args[0] + "' timed out after " +
                std::to_string(timeout_seconds) + "s"};
        }
        usleep(10000);
    }
}

} // namespace stash
