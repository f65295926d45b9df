/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner on top of posix_spawn, poll and waitpid.
 */
#include "infrastructure/ProcessRunner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace whisperim::infrastructure {

namespace {

using Clock = std::chrono::steady_clock;

// A child that dies before reading all of stdin must not take us down with SIGPIPE.
void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int readEnd = -1;
    int writeEnd = -1;

    bool open(std::string& error) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            error = std::string("Failed to create pipe: ") + std::strerror(errno);
            return false;
        }
        readEnd = fds[0];
        writeEnd = fds[1];
        return true;
    }

    ~Pipe() {
        CloseFd(readEnd);
        CloseFd(writeEnd);
    }
};

bool SpawnWithActions(const std::string& program,
                      const std::vector<std::string>& args,
                      const posix_spawn_file_actions_t* actions,
                      pid_t& pid,
                      std::string& error) {
    std::string programCopy = program;
    std::vector<std::string> argCopies(args);

    std::vector<char*> argv;
    argv.push_back(programCopy.data());
    for (auto& arg : argCopies) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const int status = ::posix_spawnp(&pid, program.c_str(), actions, nullptr, argv.data(), environ);
    if (status != 0) {
        error = "Failed to spawn '" + program + "': " + std::strerror(status);
        return false;
    }
    return true;
}

// Reaps the child if it exits before the deadline. Without a deadline, blocks until it does.
bool ReapBefore(pid_t pid, bool hasDeadline, Clock::time_point deadline, int& exitCode) {
    while (true) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, hasDeadline ? WNOHANG : 0);
        if (r == pid) {
            exitCode = DecodeWaitStatus(status);
            return true;
        }
        if (r < 0) {
            if (errno == EINTR) continue;
            exitCode = -1; // Already reaped elsewhere.
            return true;
        }
        if (Clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int KillAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int exitCode = -1;
    ReapBefore(pid, false, Clock::time_point{}, exitCode);
    return exitCode;
}

} // namespace

bool ProcessRunner::Run(const std::string& program,
                        const std::vector<std::string>& args,
                        const ProcessOptions& options,
                        ProcessResult& result,
                        std::string& error) {
    IgnoreSigpipe();
    result = ProcessResult{};

    Pipe in;
    Pipe out;
    Pipe err;
    if (!in.open(error)) return false;
    if (options.captureOutput && (!out.open(error) || !err.open(error))) return false;

    posix_spawn_file_actions_t actions;
    ::posix_spawn_file_actions_init(&actions);
    ::posix_spawn_file_actions_adddup2(&actions, in.readEnd, STDIN_FILENO);
    if (options.captureOutput) {
        ::posix_spawn_file_actions_adddup2(&actions, out.writeEnd, STDOUT_FILENO);
        ::posix_spawn_file_actions_adddup2(&actions, err.writeEnd, STDERR_FILENO);
    } else {
        ::posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        ::posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    }

    pid_t pid = -1;
    const bool spawned = SpawnWithActions(program, args, &actions, pid, error);
    ::posix_spawn_file_actions_destroy(&actions);
    if (!spawned) return false;

    // Child-side ends belong to the child now.
    CloseFd(in.readEnd);
    CloseFd(out.writeEnd);
    CloseFd(err.writeEnd);

    const std::string& input = options.standardInput;
    std::size_t written = 0;
    if (input.empty()) {
        CloseFd(in.writeEnd);
    } else {
        ::fcntl(in.writeEnd, F_SETFL, O_NONBLOCK);
    }

    const bool hasDeadline = options.timeout.count() > 0;
    const Clock::time_point deadline = Clock::now() + options.timeout;

    while (in.writeEnd >= 0 || out.readEnd >= 0 || err.readEnd >= 0) {
        pollfd fds[3];
        int* owners[3];
        nfds_t count = 0;
        if (in.writeEnd >= 0) {
            fds[count] = pollfd{in.writeEnd, POLLOUT, 0};
            owners[count++] = &in.writeEnd;
        }
        if (out.readEnd >= 0) {
            fds[count] = pollfd{out.readEnd, POLLIN, 0};
            owners[count++] = &out.readEnd;
        }
        if (err.readEnd >= 0) {
            fds[count] = pollfd{err.readEnd, POLLIN, 0};
            owners[count++] = &err.readEnd;
        }

        int waitMs = -1;
        if (hasDeadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                result.timedOut = true;
                break;
            }
            waitMs = static_cast<int>(remaining.count()) + 1;
        }

        const int ready = ::poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            error = std::string("poll failed: ") + std::strerror(errno);
            result.exitCode = KillAndReap(pid);
            return false;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            int& fd = *owners[i];

            if (&fd == &in.writeEnd) {
                const ssize_t n = ::write(fd, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                    if (written == input.size()) CloseFd(fd);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    CloseFd(fd); // EPIPE: the child stopped reading.
                }
                continue;
            }

            char buffer[4096];
            const ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                std::string& target = (&fd == &out.readEnd) ? result.standardOutput : result.standardError;
                target.append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                CloseFd(fd);
            }
        }
    }

    if (!result.timedOut && !ReapBefore(pid, hasDeadline, deadline, result.exitCode)) {
        result.timedOut = true;
    }
    if (result.timedOut) {
        result.exitCode = KillAndReap(pid);
    }
    return true;
}

bool ProcessRunner::Spawn(const std::string& program,
                          const std::vector<std::string>& args,
                          pid_t& pid,
                          std::string& error) {
    IgnoreSigpipe();

    posix_spawn_file_actions_t actions;
    ::posix_spawn_file_actions_init(&actions);
    ::posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    ::posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    ::posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    const bool spawned = SpawnWithActions(program, args, &actions, pid, error);
    ::posix_spawn_file_actions_destroy(&actions);
    return spawned;
}

bool ProcessRunner::IsRunning(pid_t pid, int& exitCode) {
    if (pid <= 0) return false;
    int status = 0;
    const pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == 0) return true;
    exitCode = (r == pid) ? DecodeWaitStatus(status) : -1;
    return false;
}

int ProcessRunner::Terminate(pid_t pid, std::chrono::milliseconds gracePeriod) {
    if (pid <= 0) return -1;
    ::kill(pid, SIGTERM);

    int exitCode = -1;
    if (ReapBefore(pid, true, Clock::now() + gracePeriod, exitCode)) {
        return exitCode;
    }
    return KillAndReap(pid);
}

} // namespace whisperim::infrastructure
