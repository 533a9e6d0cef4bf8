#ifndef MELT_APP_STATE_HPP
#define MELT_APP_STATE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "commit.hpp"
#include "errors.hpp"
#include "flake.hpp"
#include "update_status.hpp"

namespace melt {

/**
 * @brief Input list view of a loaded flake.
 *
 * @c busy is set when a long running operation is dispatched from the list
 * and cleared when its result arrives.
 */
struct ListState {
    FlakeData flake;
    std::size_t cursor = 0;
    std::set<std::size_t> selected;
    std::map<std::string, UpdateStatus> statuses;
    bool busy = false;

    ListState() = default;
    explicit ListState(FlakeData data) : flake(std::move(data)) {}

    std::size_t input_count() const { return flake.inputs.size(); }
    void cursor_down();
    void cursor_up();
    void toggle_selection();
    void clear_selection() { selected.clear(); }
    bool has_selection() const { return !selected.empty(); }
    /** Names of the selected inputs in list order. */
    std::vector<std::string> selected_names() const;
    /** Status of @p name, Unknown when no check has reported yet. */
    UpdateStatus status_of(const std::string& name) const;

    /**
     * @brief Replace the snapshot after a reload.
     *
     * Clamps the cursor, drops selections past the end and forgets all
     * statuses of the previous check pass.
     */
    void update_flake(FlakeData data);
};

/**
 * @brief Commit history view of one input.
 *
 * Owns the list it was opened from until it is closed.
 */
struct ChangelogState {
    GitInput input;
    std::size_t input_idx = 0;
    ChangelogData data;
    std::size_t cursor = 0;
    std::optional<std::size_t> confirm_lock; ///< Commit index awaiting confirmation
    bool locking = false;
    ListState parent_list;

    ChangelogState(GitInput in, std::size_t idx, ChangelogData d, ListState parent);

    void cursor_down();
    void cursor_up();
    bool is_confirming() const { return confirm_lock.has_value(); }
    void show_confirm();
    void hide_confirm() {
        confirm_lock.reset();
        locking = false;
    }
};

struct LoadingState {};
struct ErrorState {
    std::string message;
};
/** The list stays visible while a changelog is fetched. */
struct LoadingChangelogState {
    ListState list;
};
struct QuittingState {};

using AppState = std::variant<LoadingState, ErrorState, ListState, LoadingChangelogState,
                              ChangelogState, QuittingState>;

/**
 * @brief List that receives status updates in the given state.
 *
 * @return The List itself, the list held while loading a changelog, the
 *         parent list of an open changelog, or `nullptr`.
 */
ListState* live_list(AppState& state);
const ListState* live_list(const AppState& state);

/** Short label of the state variant, used in log lines. */
const char* state_name(const AppState& state);

// Results posted by background jobs to the control thread.
struct FlakeLoaded {
    std::optional<FlakeData> flake;
    Error error;
};
struct UpdateComplete {
    bool ok = false;
    Error error;
};
struct ChangelogLoaded {
    GitInput input;
    std::size_t input_idx = 0;
    std::optional<ChangelogData> data;
    Error error;
};
struct LockComplete {
    bool ok = false;
    Error error;
};
/** Status of one input. @c generation identifies the check pass. */
struct InputStatus {
    std::string name;
    UpdateStatus status;
    std::uint64_t generation = 0;
};

using TaskResult =
    std::variant<FlakeLoaded, UpdateComplete, ChangelogLoaded, LockComplete, InputStatus>;

} // namespace melt

#endif // MELT_APP_STATE_HPP
