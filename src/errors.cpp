#include "errors.hpp"

namespace melt {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Network:
        return "network";
    case ErrorKind::RateLimited:
        return "rate-limited";
    case ErrorKind::RevisionNotFound:
        return "revision-not-found";
    case ErrorKind::AuthFailed:
        return "auth";
    case ErrorKind::NotFound:
        return "not-found";
    case ErrorKind::Cache:
        return "cache";
    case ErrorKind::Clone:
        return "clone";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Unsupported:
        return "unsupported";
    case ErrorKind::Process:
        return "process";
    case ErrorKind::Parse:
        return "parse";
    case ErrorKind::FlakeNotFound:
        return "flake-not-found";
    }
    return "unknown";
}

std::string Error::to_string() const {
    switch (kind) {
    case ErrorKind::RateLimited:
        return message.empty()
                   ? "GitHub API rate limit exceeded. Set GITHUB_TOKEN for higher limits."
                   : message;
    case ErrorKind::RevisionNotFound:
        return "Revision not found: " + message;
    case ErrorKind::AuthFailed:
        return "Authentication failed: " + message;
    case ErrorKind::NotFound:
        return "Repository not found: " + message;
    case ErrorKind::Cache:
        return "Cache error: " + message;
    case ErrorKind::Clone:
        return "Clone failed: " + message;
    case ErrorKind::Timeout:
        return "Operation timed out" + (message.empty() ? std::string() : ": " + message);
    case ErrorKind::Cancelled:
        return "Operation cancelled";
    case ErrorKind::Unsupported:
        return "Unsupported: " + message;
    case ErrorKind::Process:
        return message;
    case ErrorKind::Parse:
        return "Failed to parse: " + message;
    case ErrorKind::FlakeNotFound:
        return "No flake.nix found at " + message;
    case ErrorKind::Network:
        break;
    }
    return "Network error: " + message;
}

} // namespace melt
