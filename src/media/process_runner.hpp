/**
 * @file    process_runner.hpp
 * @brief   Blocking external process invocation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace wms {

/**
 * Exit status and combined stdout/stderr of a finished process
 */
struct CommandResult {
    int exit_code{-1};
    std::string output;

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

/**
 * Runs a command through /bin/sh and waits for it
 *
 * Arguments are quoted individually, so paths with spaces or quotes are
 * passed through unchanged. stdin is /dev/null, stderr is merged into the
 * captured output.
 *
 * With a non-zero timeout the command runs under coreutils `timeout`; a
 * process still running after that long is terminated and reported as
 * AppError. When the cancel flag is set by the time a command fails, the
 * failure is reported as InterruptedError instead.
 */
class ProcessRunner {
public:
    static constexpr int kTimeoutExitCode = 124;

    /**
     * @param timeout      Per-command limit, 0 = unlimited
     * @param logger       Log sink
     * @param cancel_flag  Optional, must outlive the runner
     */
    explicit ProcessRunner(std::chrono::seconds timeout = std::chrono::seconds{600},
                           std::shared_ptr<spdlog::logger> logger = spdlog::default_logger(),
                           const std::atomic<bool>* cancel_flag = nullptr);

    /**
     * @param args  Program followed by its arguments
     *
     * @throws std::invalid_argument  empty args
     * @throws AppError               process could not be started or timed out
     * @throws InterruptedError       process failed after cancellation
     */
    [[nodiscard]] CommandResult run(const std::vector<std::string>& args) const;

    [[nodiscard]] std::chrono::seconds timeout() const noexcept { return timeout_; }

    // Single-quote an argument for /bin/sh
    [[nodiscard]] static std::string quote(const std::string& arg);

    // Quoted command line, without redirections
    [[nodiscard]] static std::string command_line(const std::vector<std::string>& args);

private:
    std::chrono::seconds timeout_;
    std::shared_ptr<spdlog::logger> logger_;
    const std::atomic<bool>* cancel_flag_;
};

}  // namespace wms
