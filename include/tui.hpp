#ifndef TUI_HPP
#define TUI_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "app_state.hpp"
#include "update_status.hpp"

namespace melt {

class App;

/**
 * @brief Theme definition for TUI colors.
 *
 * Contains raw ANSI sequences for each role used by the interface. The
 * defaults use 24-bit colors of the Catppuccin Mocha palette.
 */
struct TuiTheme {
    std::string reset = "\033[0m";
    std::string bold = "\033[1m";
    std::string text = "\033[38;2;205;214;244m";
    std::string muted = "\033[38;2;166;173;200m";
    std::string dim = "\033[38;2;127;132;156m";
    std::string border = "\033[38;2;69;71;90m";
    std::string success = "\033[38;2;166;227;161m";
    std::string warning = "\033[38;2;249;226;175m";
    std::string error = "\033[38;2;243;139;168m";
    std::string info = "\033[38;2;137;180;250m";
    std::string accent = "\033[38;2;203;166;247m";
    std::string selected = "\033[38;2;166;227;161m";
    std::string cursor = "\033[38;2;245;224;220m";
    std::string highlight = "\033[48;2;49;50;68m";
    std::string dialog_bg = "\033[48;2;24;24;37m";
    std::string type_git = "\033[38;2;250;179;135m";
    std::string type_path = "\033[38;2;137;220;235m";
    std::string type_other = "\033[38;2;127;132;156m";
    std::string key_hint = "\033[38;2;180;190;254m";
    std::string sha = "\033[38;2;250;179;135m";
};

/**
 * @brief Resolved color codes for the TUI.
 *
 * Every member is empty when colors are disabled.
 */
struct TuiColors {
    std::string reset, bold, text, muted, dim, border, success, warning, error, info, accent,
        selected, cursor, highlight, dialog_bg, type_git, type_path, type_other, key_hint, sha;
};

/**
 * @brief Convert a user supplied color into an ANSI sequence.
 *
 * Accepts `#rrggbb`, the eight basic color names (optionally prefixed with
 * `bright-`) or a raw escape sequence.
 *
 * @param background Produce a background sequence instead of a foreground one.
 */
std::optional<std::string> parse_color(const std::string& value, bool background = false);

/**
 * @brief Override theme roles from a `role -> color` map.
 *
 * @return Names of entries that were not understood.
 */
std::vector<std::string> apply_theme_overrides(TuiTheme& theme,
                                               const std::map<std::string, std::string>& colors);

/**
 * @brief Create a color palette honoring user preferences.
 */
TuiColors make_tui_colors(bool no_colors, const TuiTheme& theme);

/** Terminal columns taken by @p s, ignoring escape sequences. */
std::size_t display_width(const std::string& s);

/** Cut @p s to @p width columns, ending in `...` when shortened. */
std::string truncate_text(const std::string& s, std::size_t width);

/** Truncate or pad @p s with spaces to exactly @p width columns. */
std::string fit_text(const std::string& s, std::size_t width);

/** Braille spinner frame, advancing every second tick. */
const char* spinner_frame(std::uint64_t tick);

/**
 * @brief Render the centered loading screen.
 */
std::vector<std::string> render_loading(const std::string& message, std::uint64_t tick,
                                        std::size_t width, std::size_t height,
                                        const TuiColors& c);

std::vector<std::string> render_error(const std::string& message, std::size_t width,
                                      std::size_t height, const TuiColors& c);

/**
 * @brief Render the input table with its help bar.
 *
 * @param list   List to draw.
 * @param status Optional transient message appended to the help bar.
 * @param tick   Animation counter for spinners.
 * @return Exactly @p height lines.
 */
std::vector<std::string> render_list(const ListState& list,
                                     const std::optional<StatusMessage>& status,
                                     std::uint64_t tick, std::size_t width, std::size_t height,
                                     const TuiColors& c);

/**
 * @brief Render the commit table of a changelog, with the confirm dialog
 * on top when one is open.
 */
std::vector<std::string> render_changelog(const ChangelogState& cs,
                                          const std::optional<StatusMessage>& status,
                                          std::size_t width, std::size_t height,
                                          const TuiColors& c);

/** Lines for the current state of @p app. */
std::vector<std::string> render_app(const App& app, std::size_t width, std::size_t height,
                                    const TuiColors& c);

/**
 * @brief Join rendered lines into one repaint of the screen.
 */
std::string compose_frame(const std::vector<std::string>& lines);

} // namespace melt

#endif // TUI_HPP
