#include "app_state.hpp"

#include <utility>

namespace melt {

void ListState::cursor_down() {
    if (cursor + 1 < flake.inputs.size())
        ++cursor;
}

void ListState::cursor_up() {
    if (cursor > 0)
        --cursor;
}

void ListState::toggle_selection() {
    if (cursor >= flake.inputs.size())
        return;
    if (!selected.erase(cursor))
        selected.insert(cursor);
}

std::vector<std::string> ListState::selected_names() const {
    std::vector<std::string> names;
    for (std::size_t idx : selected) {
        if (idx < flake.inputs.size())
            names.push_back(flake.inputs[idx].name());
    }
    return names;
}

UpdateStatus ListState::status_of(const std::string& name) const {
    auto it = statuses.find(name);
    return it == statuses.end() ? UpdateStatus::unknown() : it->second;
}

void ListState::update_flake(FlakeData data) {
    flake = std::move(data);
    std::size_t n = flake.inputs.size();
    if (n == 0)
        cursor = 0;
    else if (cursor >= n)
        cursor = n - 1;
    for (auto it = selected.begin(); it != selected.end();) {
        if (*it >= n)
            it = selected.erase(it);
        else
            ++it;
    }
    statuses.clear();
    busy = false;
}

ChangelogState::ChangelogState(GitInput in, std::size_t idx, ChangelogData d, ListState parent)
    : input(std::move(in)), input_idx(idx), data(std::move(d)),
      parent_list(std::move(parent)) {
    cursor = data.locked_idx.value_or(0);
}

void ChangelogState::cursor_down() {
    if (cursor + 1 < data.commits.size())
        ++cursor;
}

void ChangelogState::cursor_up() {
    if (cursor > 0)
        --cursor;
}

void ChangelogState::show_confirm() {
    if (cursor < data.commits.size())
        confirm_lock = cursor;
}

ListState* live_list(AppState& state) {
    if (auto* l = std::get_if<ListState>(&state))
        return l;
    if (auto* lc = std::get_if<LoadingChangelogState>(&state))
        return &lc->list;
    if (auto* cs = std::get_if<ChangelogState>(&state))
        return &cs->parent_list;
    return nullptr;
}

const ListState* live_list(const AppState& state) {
    return live_list(const_cast<AppState&>(state));
}

const char* state_name(const AppState& state) {
    switch (state.index()) {
    case 0:
        return "loading";
    case 1:
        return "error";
    case 2:
        return "list";
    case 3:
        return "loading-changelog";
    case 4:
        return "changelog";
    default:
        return "quitting";
    }
}

} // namespace melt
