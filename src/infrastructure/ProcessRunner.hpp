/**
 * @file ProcessRunner.hpp
 * @brief Spawning, feeding and reaping of external tools.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace whisperim::infrastructure {

/**
 * @struct ProcessOptions
 * @brief How a synchronous child process is run.
 */
struct ProcessOptions {
    std::string standardInput;                 ///< Written to the child's stdin, then stdin is closed.
    bool captureOutput = true;                 ///< False sends stdout/stderr to /dev/null.
    std::chrono::milliseconds timeout{0};      ///< Zero waits forever.
};

/**
 * @struct ProcessResult
 * @brief Outcome of a finished child process.
 */
struct ProcessResult {
    int exitCode = -1;       ///< Exit status, or 128 + signal number if the child was killed.
    bool timedOut = false;   ///< True if the child was killed for overrunning the timeout.
    std::string standardOutput;
    std::string standardError;
};

/**
 * @class ProcessRunner
 * @brief Thin posix_spawn wrapper. Arguments are passed as a vector, never through a shell.
 */
class ProcessRunner {
public:
    /**
     * @brief Runs a program to completion.
     * @param program Executable path (or a name looked up in $PATH).
     * @param args Arguments, without argv[0].
     * @param options Stdin payload, output capture and timeout.
     * @param result Filled once the child has been reaped.
     * @param error Populated if the child could not be spawned.
     * @return True if the child ran (whatever its exit code).
     */
    static bool Run(const std::string& program,
                    const std::vector<std::string>& args,
                    const ProcessOptions& options,
                    ProcessResult& result,
                    std::string& error);

    /**
     * @brief Starts a background child with stdin/stdout/stderr on /dev/null.
     * @param pid Receives the child's process id.
     */
    static bool Spawn(const std::string& program,
                      const std::vector<std::string>& args,
                      pid_t& pid,
                      std::string& error);

    /**
     * @brief Non-blocking liveness check. Reaps the child if it has exited.
     * @param exitCode Receives the exit status once the child is gone.
     */
    static bool IsRunning(pid_t pid, int& exitCode);

    /**
     * @brief Sends SIGTERM, waits up to gracePeriod, then SIGKILL. Always reaps.
     * @return The child's exit status.
     */
    static int Terminate(pid_t pid, std::chrono::milliseconds gracePeriod);
};

} // namespace whisperim::infrastructure
