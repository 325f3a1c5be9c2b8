/**
 * @file    errors.hpp
 * @brief   Application error types
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Invalid arguments are reported with the standard exceptions
 * (std::invalid_argument, std::out_of_range). Failures of the outside
 * world (external tools, media files, downloads) are AppError, which keeps
 * a message that is safe to show the user apart from the diagnostic detail
 * that only goes to the log.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace wms {

/**
 * Recoverable application error
 *
 * what() returns the user-facing message.
 */
class AppError : public std::runtime_error {
public:
    explicit AppError(const std::string& user_message, std::string detail = {})
        : std::runtime_error(user_message)
        , detail_(std::move(detail)) {}

    [[nodiscard]] const char* user_message() const noexcept { return what(); }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

/**
 * A step failed because the user asked to stop (SIGINT reaches external
 * tools too, so their failure is not the real cause)
 */
class InterruptedError : public AppError {
public:
    explicit InterruptedError(std::string detail = {})
        : AppError("Interrupted.", std::move(detail)) {}
};

/**
 * The recognition runtime itself could not be located or initialized.
 *
 * Not derived from AppError: retrying will not help, the installation
 * has to be fixed.
 */
class EngineUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace wms
