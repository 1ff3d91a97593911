#include "ddsync/core/error.hpp"

#include <utility>

namespace ddsync {
namespace {

Error make_error(ErrorKind kind, std::string message, int status = 0) {
    Error error;
    error.kind = kind;
    error.message = std::move(message);
    error.status = status;
    return error;
}

} // namespace

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Network: return "network";
        case ErrorKind::Service: return "service";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Integrity: return "integrity";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

Error Error::filesystem(std::string message) { return make_error(ErrorKind::Filesystem, std::move(message)); }
Error Error::network(std::string message) { return make_error(ErrorKind::Network, std::move(message)); }
Error Error::service(int status, std::string message) { return make_error(ErrorKind::Service, std::move(message), status); }
Error Error::auth(std::string message) { return make_error(ErrorKind::Auth, std::move(message)); }
Error Error::integrity(std::string message) { return make_error(ErrorKind::Integrity, std::move(message)); }
Error Error::validation(std::string message) { return make_error(ErrorKind::Validation, std::move(message)); }
Error Error::not_found(std::string message) { return make_error(ErrorKind::NotFound, std::move(message)); }
Error Error::cancelled(std::string message) { return make_error(ErrorKind::Cancelled, std::move(message)); }

std::string Error::describe() const {
    std::string text = std::string(to_string(kind)) + ": " + message;
    if (status != 0) {
        text += " (status " + std::to_string(status) + ")";
    }
    return text;
}

} // namespace ddsync
