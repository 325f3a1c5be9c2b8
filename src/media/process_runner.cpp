/**
 * @file    process_runner.cpp
 * @brief   Blocking external process invocation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "media/process_runner.hpp"
#include "core/errors.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdio>
#include <stdexcept>

#include <sys/wait.h>

namespace wms {

ProcessRunner::ProcessRunner(std::chrono::seconds timeout,
                             std::shared_ptr<spdlog::logger> logger,
                             const std::atomic<bool>* cancel_flag)
    : timeout_(timeout)
    , logger_(std::move(logger))
    , cancel_flag_(cancel_flag) {}

std::string ProcessRunner::quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string ProcessRunner::command_line(const std::vector<std::string>& args) {
    std::string cmd;
    for (const auto& arg : args) {
        if (!cmd.empty()) cmd += ' ';
        cmd += quote(arg);
    }
    return cmd;
}

CommandResult ProcessRunner::run(const std::vector<std::string>& args) const {
    if (args.empty()) {
        throw std::invalid_argument("ProcessRunner::run needs a program to execute");
    }

    std::string cmd;
    if (timeout_.count() > 0) {
        cmd = fmt::format("timeout --kill-after=5 {} ", timeout_.count());
    }
    cmd += command_line(args);
    cmd += " < /dev/null 2>&1";

    logger_->debug("Running: {}", cmd);

    int status = -1;
    auto closer = [&status](FILE* f) {
        if (f) {
            status = pclose(f);
        }
    };

    CommandResult result;
    {
        std::unique_ptr<FILE, decltype(closer)> pipe(popen(cmd.c_str(), "r"), closer);
        if (!pipe) {
            logger_->error("Failed to start {}", args.front());
            throw AppError("Cannot start external tool.", cmd);
        }

        std::array<char, 4096> buffer{};
        std::size_t bytes_read = 0;
        while ((bytes_read = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
            result.output.append(buffer.data(), bytes_read);
        }
    }

    if (status == -1) {
        throw AppError("Cannot start external tool.", cmd);
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (!result.succeeded() && cancel_flag_ && cancel_flag_->load(std::memory_order_relaxed)) {
        logger_->warn("{} stopped by interrupt (exit code {})", args.front(), result.exit_code);
        throw InterruptedError(command_line(args));
    }

    if (timeout_.count() > 0 && result.exit_code == kTimeoutExitCode) {
        logger_->error("{} timed out after {} s", args.front(), timeout_.count());
        throw AppError("External tool timed out.",
                       fmt::format("{} exceeded {} s", command_line(args), timeout_.count()));
    }

    logger_->debug("{} exited with {}", args.front(), result.exit_code);
    return result;
}

}  // namespace wms
