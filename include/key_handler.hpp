#ifndef MELT_KEY_HANDLER_HPP
#define MELT_KEY_HANDLER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "app_state.hpp"

namespace melt {

enum class KeyCode { None, Char, Enter, Esc, Up, Down, Left, Right, Backspace, Tab };

/**
 * @brief Decoded key press.
 *
 * Printable keys use KeyCode::Char with the character in @c ch. Control
 * combinations keep the letter in @c ch and set @c ctrl.
 */
struct KeyEvent {
    KeyCode code = KeyCode::None;
    char ch = 0;
    bool ctrl = false;

    static KeyEvent chr(char c) { return {KeyCode::Char, c, false}; }
    static KeyEvent ctrl_chr(char c) { return {KeyCode::Char, c, true}; }
    static KeyEvent key(KeyCode k) { return {k, 0, false}; }

    bool is_char(char c) const { return code == KeyCode::Char && !ctrl && ch == c; }
    bool is_ctrl_c() const { return code == KeyCode::Char && ctrl && (ch == 'c' || ch == 'C'); }
    /** `q`, `Esc` or `Ctrl-C`. */
    bool is_quit() const { return is_char('q') || code == KeyCode::Esc || is_ctrl_c(); }
};

/**
 * @brief Side effect requested by a key press.
 */
struct Action {
    enum class Kind {
        None,
        Quit,
        CancelAndQuit,
        UpdateSelected,
        UpdateAll,
        Refresh,
        OpenChangelog,
        CloseChangelog,
        ConfirmLock,
        ShowWarning
    };

    Kind kind = Kind::None;
    std::vector<std::string> names; ///< UpdateSelected
    std::size_t input_idx = 0;      ///< OpenChangelog
    std::string input_name;         ///< ConfirmLock
    std::string lock_url;           ///< ConfirmLock
    std::string message;            ///< ShowWarning

    static Action none() { return {}; }
    static Action of(Kind k) {
        Action a;
        a.kind = k;
        return a;
    }
    static Action warning(std::string msg) {
        Action a = of(Kind::ShowWarning);
        a.message = std::move(msg);
        return a;
    }
};

/**
 * @brief Apply a key press to @p state.
 *
 * Cursor movement, selection and the confirm dialog are handled in place.
 * Everything that needs background work is returned as an Action; the
 * busy flag of the list is set here for those that require it.
 */
Action handle_key(AppState& state, const KeyEvent& key);

} // namespace melt

#endif // MELT_KEY_HANDLER_HPP
