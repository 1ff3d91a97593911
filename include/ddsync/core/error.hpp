#pragma once

#include <string>

namespace ddsync {

/**
 * @brief Failure categories shared by every layer of the client
 *
 * Filesystem, Validation and Auth failures found before scheduling abort the
 * whole run. Network and transient Service failures are retried per chunk.
 * Integrity failures are fatal for the owning file only.
 */
enum class ErrorKind {
    Filesystem,
    Network,
    Service,
    Auth,
    Integrity,
    Validation,
    NotFound,
    Cancelled
};

const char* to_string(ErrorKind kind) noexcept;

struct Error {
    ErrorKind kind = ErrorKind::Service;
    std::string message;
    int status = 0; ///< Remote status code when the remote service reported the failure

    static Error filesystem(std::string message);
    static Error network(std::string message);
    static Error service(int status, std::string message);
    static Error auth(std::string message);
    static Error integrity(std::string message);
    static Error validation(std::string message);
    static Error not_found(std::string message);
    static Error cancelled(std::string message);

    /// "<kind>: <message>", with the status appended for remote failures
    [[nodiscard]] std::string describe() const;
};

} // namespace ddsync
