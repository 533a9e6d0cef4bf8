#ifndef MELT_UPDATE_STATUS_HPP
#define MELT_UPDATE_STATUS_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace melt {

/**
 * @brief Result of checking one input against its remote.
 */
struct UpdateStatus {
    enum class Kind { Unknown, Checking, UpToDate, Behind, Error };

    Kind kind = Kind::Unknown;
    std::size_t behind = 0;
    std::string error;

    static UpdateStatus unknown() { return {}; }
    static UpdateStatus checking() { return {Kind::Checking, 0, {}}; }
    static UpdateStatus up_to_date() { return {Kind::UpToDate, 0, {}}; }
    static UpdateStatus behind_by(std::size_t n) { return {Kind::Behind, n, {}}; }
    static UpdateStatus failed(std::string reason) { return {Kind::Error, 0, std::move(reason)}; }

    /** Convert an ahead count into UpToDate or Behind(n). */
    static UpdateStatus from_ahead(std::size_t n) { return n == 0 ? up_to_date() : behind_by(n); }

    bool is_terminal() const { return kind != Kind::Unknown && kind != Kind::Checking; }

    /** Compact label for the list column: `-`, `...`, `ok`, `+N` or `?`. */
    std::string display() const;

    bool operator==(const UpdateStatus& o) const {
        return kind == o.kind && behind == o.behind && error == o.error;
    }
    bool operator!=(const UpdateStatus& o) const { return !(*this == o); }
};

enum class StatusLevel { Info, Success, Warning, Error };

/**
 * @brief Transient message shown in the status bar.
 *
 * Info messages stay until replaced, the other levels expire on their own.
 */
struct StatusMessage {
    using Clock = std::chrono::steady_clock;

    std::string text;
    StatusLevel level = StatusLevel::Info;
    std::optional<Clock::time_point> expires;

    static StatusMessage info(std::string text);
    static StatusMessage success(std::string text);
    static StatusMessage warning(std::string text);
    static StatusMessage error(std::string text);

    bool is_expired(Clock::time_point now = Clock::now()) const {
        return expires && now > *expires;
    }
};

} // namespace melt

#endif // MELT_UPDATE_STATUS_HPP
