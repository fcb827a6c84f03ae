#include <kapla/process.hpp>
#include <kapla/log.hpp>

#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kapla {

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
                                  int timeout_seconds,
                                  const CancelToken* cancel,
                                  int grace_seconds) {
    if (args.empty()) {
        return KaplaError{KaplaError::InvalidArg, "run_command: empty args"};
    }

    // argv is built before fork: the child only makes async-signal-safe calls
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // O_CLOEXEC keeps sibling workers' children from inheriting our pipes
    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return KaplaError{KaplaError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return KaplaError{KaplaError::IO,
            std::string("pipe() failed: ") + strerror(saved)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return KaplaError{KaplaError::IO,
            std::string("fork() failed: ") + strerror(saved)};
    }

    if (pid == 0) {
        // The CLI blocks SIGINT/SIGTERM in its threads; the command must not
        // inherit that mask
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    auto close_pipes = [&] {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
    };

    log::trace("spawned pid %d: %s", static_cast<int>(pid), args[0].c_str());

    CommandResult result;
    auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point term_sent;
    bool killed = false;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (cancel && cancel->is_cancelled()) {
            if (!result.cancelled) {
                log::debug("cancelling pid %d", static_cast<int>(pid));
                kill(pid, SIGTERM);
                result.cancelled = true;
                term_sent = now;
            } else if (!killed &&
                       std::chrono::duration_cast<std::chrono::seconds>(
                           now - term_sent).count() >= grace_seconds) {
                log::debug("pid %d ignored SIGTERM, killing", static_cast<int>(pid));
                kill(pid, SIGKILL);
                killed = true;
            }
        }

        if (timeout_seconds > 0 &&
            std::chrono::duration_cast<std::chrono::seconds>(now - start).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            int status = 0;
            waitpid(pid, &status, 0);
            if (result.cancelled) {
                // Cancellation wins over the deadline
                drain(stdout_pipe[0], result.stdout_str);
                drain(stderr_pipe[0], result.stderr_str);
                close_pipes();
                result.exit_code = decode_status(status);
                return Result<CommandResult>::ok(std::move(result));
            }
            close_pipes();
            return KaplaError{KaplaError::Action,
                "command timed out after " + std::to_string(timeout_seconds) + "s",
                "raise [orchestrator] timeout or pass a smaller package set"};
        }

        drain(stdout_pipe[0], result.stdout_str);
        drain(stderr_pipe[0], result.stderr_str);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], result.stdout_str);
            drain(stderr_pipe[0], result.stderr_str);
            close_pipes();
            result.exit_code = decode_status(status);
            return Result<CommandResult>::ok(std::move(result));
        } else if (w < 0) {
            int saved = errno;
            close_pipes();
            return KaplaError{KaplaError::IO,
                std::string("waitpid failed: ") + strerror(saved)};
        }

        usleep(1000);
    }
}

} // namespace kapla
