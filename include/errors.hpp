#ifndef MELT_ERRORS_HPP
#define MELT_ERRORS_HPP

#include <string>

namespace melt {

/**
 * @brief Failure categories reported by the update engine.
 *
 * The kind lets callers tell a timeout or a rate limit apart from a plain
 * network failure without parsing the message text.
 */
enum class ErrorKind {
    Network,
    RateLimited,
    RevisionNotFound,
    AuthFailed,
    NotFound,
    Cache,
    Clone,
    Timeout,
    Cancelled,
    Unsupported,
    Process,
    Parse,
    FlakeNotFound
};

/** Short label used in log lines. */
const char* error_kind_name(ErrorKind kind);

/**
 * @brief Error value returned through the `Error*` out-parameter of engine calls.
 */
struct Error {
    ErrorKind kind = ErrorKind::Network;
    std::string message;

    /** @return User facing description of the failure. */
    std::string to_string() const;
};

/**
 * @brief Fill @p out (when non-null) with the given failure.
 */
inline void set_error(Error* out, ErrorKind kind, std::string message) {
    if (!out)
        return;
    out->kind = kind;
    out->message = std::move(message);
}

} // namespace melt

#endif // MELT_ERRORS_HPP
