#include "update_status.hpp"

namespace melt {

std::string UpdateStatus::display() const {
    switch (kind) {
    case Kind::Unknown:
        return "-";
    case Kind::Checking:
        return "...";
    case Kind::UpToDate:
        return "ok";
    case Kind::Behind:
        return "+" + std::to_string(behind);
    case Kind::Error:
        return "?";
    }
    return "-";
}

StatusMessage StatusMessage::info(std::string text) {
    return {std::move(text), StatusLevel::Info, std::nullopt};
}

StatusMessage StatusMessage::success(std::string text) {
    return {std::move(text), StatusLevel::Success, Clock::now() + std::chrono::seconds(3)};
}

StatusMessage StatusMessage::warning(std::string text) {
    return {std::move(text), StatusLevel::Warning, Clock::now() + std::chrono::seconds(4)};
}

StatusMessage StatusMessage::error(std::string text) {
    return {std::move(text), StatusLevel::Error, Clock::now() + std::chrono::seconds(5)};
}

} // namespace melt
