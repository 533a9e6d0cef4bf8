#include "key_handler.hpp"

#include "forge.hpp"

namespace melt {

namespace {

Action handle_list_key(ListState& list, const KeyEvent& key) {
    if (list.input_count() == 0)
        return key.is_quit() ? Action::of(Action::Kind::Quit) : Action::none();

    if (key.is_ctrl_c())
        return Action::of(Action::Kind::Quit);

    if (key.is_char('q') || key.code == KeyCode::Esc) {
        if (list.has_selection()) {
            list.clear_selection();
            return Action::none();
        }
        return Action::of(Action::Kind::Quit);
    }
    if (key.is_char('j') || key.code == KeyCode::Down) {
        list.cursor_down();
        return Action::none();
    }
    if (key.is_char('k') || key.code == KeyCode::Up) {
        list.cursor_up();
        return Action::none();
    }
    if (key.is_char(' ')) {
        if (!list.busy)
            list.toggle_selection();
        return Action::none();
    }
    if (key.is_char('u')) {
        if (list.busy)
            return Action::none();
        auto names = list.selected_names();
        if (names.empty())
            return Action::warning("No inputs selected");
        list.busy = true;
        Action a = Action::of(Action::Kind::UpdateSelected);
        a.names = std::move(names);
        return a;
    }
    if (key.is_char('U')) {
        if (list.busy)
            return Action::none();
        list.busy = true;
        return Action::of(Action::Kind::UpdateAll);
    }
    if (key.is_char('r')) {
        if (list.busy)
            return Action::none();
        list.busy = true;
        return Action::of(Action::Kind::Refresh);
    }
    if (key.is_char('c') || key.code == KeyCode::Enter) {
        if (list.busy)
            return Action::none();
        if (list.cursor < list.input_count() && list.flake.inputs[list.cursor].is_git()) {
            Action a = Action::of(Action::Kind::OpenChangelog);
            a.input_idx = list.cursor;
            return a;
        }
        return Action::warning("Changelog only available for git inputs");
    }
    return Action::none();
}

Action handle_confirm_key(ChangelogState& cs, const KeyEvent& key) {
    if (cs.locking)
        return Action::none();
    if (key.is_char('y')) {
        std::size_t idx = *cs.confirm_lock;
        if (idx >= cs.data.commits.size())
            return Action::none();
        std::string url = lock_url(cs.input, cs.data.commits[idx].sha);
        if (url.empty()) {
            cs.hide_confirm();
            return Action::warning("Cannot generate lock URL for this input");
        }
        cs.locking = true;
        Action a = Action::of(Action::Kind::ConfirmLock);
        a.input_name = cs.input.name;
        a.lock_url = std::move(url);
        return a;
    }
    if (key.is_char('n') || key.is_char('q') || key.code == KeyCode::Esc)
        cs.hide_confirm();
    return Action::none();
}

Action handle_changelog_key(ChangelogState& cs, const KeyEvent& key) {
    if (key.is_ctrl_c())
        return Action::of(Action::Kind::Quit);
    if (cs.is_confirming())
        return handle_confirm_key(cs, key);

    if (key.is_char('q') || key.code == KeyCode::Esc)
        return Action::of(Action::Kind::CloseChangelog);
    if (key.is_char('j') || key.code == KeyCode::Down)
        cs.cursor_down();
    else if (key.is_char('k') || key.code == KeyCode::Up)
        cs.cursor_up();
    else if (key.is_char(' '))
        cs.show_confirm();
    return Action::none();
}

} // namespace

Action handle_key(AppState& state, const KeyEvent& key) {
    if (std::holds_alternative<LoadingState>(state) ||
        std::holds_alternative<LoadingChangelogState>(state))
        return key.is_quit() ? Action::of(Action::Kind::CancelAndQuit) : Action::none();
    if (std::holds_alternative<ErrorState>(state))
        return Action::of(Action::Kind::Quit);
    if (auto* list = std::get_if<ListState>(&state))
        return handle_list_key(*list, key);
    if (auto* cs = std::get_if<ChangelogState>(&state))
        return handle_changelog_key(*cs, key);
    return Action::none();
}

} // namespace melt
