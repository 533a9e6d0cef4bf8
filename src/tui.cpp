#include "tui.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <string>
#include "app.hpp"
#include "time_utils.hpp"

namespace melt {

namespace {

/** Piece of text drawn in one color. */
struct Span {
    std::string text;
    std::string color;
};

const char* const SPINNER[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};

std::string repeat(const char* s, std::size_t n) {
    std::string out;
    for (std::size_t i = 0; i < n; ++i)
        out += s;
    return out;
}

std::size_t utf8_len(unsigned char lead) {
    if (lead >= 0xF0)
        return 4;
    if (lead >= 0xE0)
        return 3;
    if (lead >= 0xC0)
        return 2;
    return 1;
}

// Length of the escape sequence starting at s[i].
std::size_t escape_len(const std::string& s, std::size_t i) {
    std::size_t j = i + 1;
    if (j < s.size() && s[j] == '[') {
        ++j;
        while (j < s.size() && !(s[j] >= 0x40 && s[j] <= 0x7E))
            ++j;
    }
    return std::min(s.size(), j + 1) - i;
}

/**
 * Copy @p s up to @p cols terminal columns, keeping escape sequences.
 */
std::string cut_columns(const std::string& s, std::size_t cols) {
    std::string out;
    std::size_t used = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '\033') {
            std::size_t n = escape_len(s, i);
            out.append(s, i, n);
            i += n;
            continue;
        }
        std::size_t n = utf8_len(static_cast<unsigned char>(s[i]));
        std::size_t w = n == 4 ? 2 : 1;
        if (used + w > cols)
            break;
        out.append(s, i, n);
        used += w;
        i += n;
    }
    if (used < cols)
        out.append(cols - used, ' ');
    return out;
}

std::string render_spans(const std::vector<Span>& spans, std::size_t width, const TuiColors& c) {
    std::string out;
    std::size_t used = 0;
    for (const auto& sp : spans) {
        if (used >= width)
            break;
        std::string text = sp.text;
        std::size_t w = display_width(text);
        if (used + w > width) {
            text = truncate_text(text, width - used);
            w = display_width(text);
        }
        out += sp.color + text + c.reset;
        used += w;
    }
    if (used < width)
        out.append(width - used, ' ');
    return out;
}

std::string box_top(const std::string& title, std::size_t width, const TuiColors& c,
                    const std::string& border) {
    if (width < 2)
        return std::string(width, ' ');
    std::size_t inner = width - 2;
    std::string t = title.empty() ? std::string() : truncate_text(title, inner > 1 ? inner - 1 : 0);
    std::size_t tw = display_width(t);
    std::string out = border + "┌";
    if (!t.empty()) {
        out += "─" + c.reset + c.text + t + c.reset + border;
        tw += 1;
    }
    out += repeat("─", inner > tw ? inner - tw : 0) + "┐" + c.reset;
    return out;
}

std::string box_bottom(std::size_t width, const TuiColors& c, const std::string& border) {
    if (width < 2)
        return std::string(width, ' ');
    return border + "└" + repeat("─", width - 2) + "┘" + c.reset;
}

std::string box_row(const std::string& content, std::size_t width, const TuiColors& c,
                    const std::string& border, const std::string& fill = std::string()) {
    if (width < 2)
        return std::string(width, ' ');
    std::size_t inner = width - 2;
    std::string body = content;
    std::size_t w = display_width(body);
    if (w > inner)
        body = cut_columns(body, inner);
    else
        body += fill + std::string(inner - w, ' ') + c.reset;
    return border + "│" + c.reset + body + border + "│" + c.reset;
}

std::vector<std::string> centered_block(const std::vector<std::vector<Span>>& block,
                                        std::size_t width, std::size_t height,
                                        const TuiColors& c) {
    std::vector<std::string> lines(height);
    std::size_t top = height * 2 / 5;
    for (std::size_t i = 0; i < block.size() && top + i < height; ++i) {
        std::size_t w = 0;
        for (const auto& sp : block[i])
            w += display_width(sp.text);
        std::size_t pad = w < width ? (width - w) / 2 : 0;
        lines[top + i] = std::string(pad, ' ') + render_spans(block[i], width - pad, c);
    }
    return lines;
}

std::vector<Span> shortcut_spans(const std::vector<std::pair<const char*, const char*>>& keys,
                                 const TuiColors& c) {
    std::vector<Span> spans;
    for (const auto& [key, desc] : keys) {
        spans.push_back({key, c.key_hint});
        spans.push_back({std::string(" ") + desc + " ", c.dim});
    }
    return spans;
}

const std::string& level_color(StatusLevel level, const TuiColors& c) {
    switch (level) {
    case StatusLevel::Success:
        return c.success;
    case StatusLevel::Warning:
        return c.warning;
    case StatusLevel::Error:
        return c.error;
    case StatusLevel::Info:
        break;
    }
    return c.info;
}

const std::string& status_color(const UpdateStatus& st, const TuiColors& c) {
    switch (st.kind) {
    case UpdateStatus::Kind::Behind:
        return c.success;
    case UpdateStatus::Kind::Error:
        return c.warning;
    default:
        return c.dim;
    }
}

const std::string& type_color(const FlakeInput& input, const TuiColors& c) {
    if (input.is_git())
        return c.type_git;
    if (std::holds_alternative<PathInput>(input.variant()))
        return c.type_path;
    return c.type_other;
}

// First visible row so that @p cursor stays on screen.
std::size_t scroll_offset(std::size_t cursor, std::size_t rows) {
    if (rows == 0 || cursor < rows)
        return 0;
    return cursor - rows + 1;
}

/** Three line bordered help bar. */
void append_help_bar(std::vector<std::string>& lines, const std::vector<Span>& spans,
                     std::size_t width, const TuiColors& c) {
    std::size_t inner = width >= 2 ? width - 2 : 0;
    lines.push_back(box_top("", width, c, c.border));
    lines.push_back(box_row(render_spans(spans, inner, c), width, c, c.border));
    lines.push_back(box_bottom(width, c, c.border));
}

std::string dialog_text(const std::string& s, std::size_t inner) {
    std::size_t w = display_width(s);
    std::size_t left = w < inner ? (inner - w) / 2 : 0;
    return std::string(left, ' ') + s;
}

void overlay_confirm(std::vector<std::string>& lines, const ChangelogState& cs,
                     std::size_t width, const TuiColors& c) {
    if (!cs.confirm_lock || *cs.confirm_lock >= cs.data.commits.size())
        return;
    const Commit& commit = cs.data.commits[*cs.confirm_lock];
    const std::size_t dw = std::min<std::size_t>(50, width);
    const std::size_t dh = 7;
    if (dw < 4 || lines.size() < dh)
        return;
    std::size_t x = (width - dw) / 2;
    std::size_t y = (lines.size() - dh) / 2;
    std::size_t inner = dw - 2;

    std::string title = "Lock " + cs.input.name + " to " + commit.short_sha() + "?";
    std::string question = cs.locking ? "Locking..." : title;
    std::string hints = "y confirm  n/q cancel";

    std::string l1 = dialog_text(truncate_text(question, inner), inner);
    std::string l3 = dialog_text(truncate_text(commit.message, 40), inner);
    std::string l5 = dialog_text(hints, inner);

    std::string styled_hints = std::string(display_width(l5) - hints.size(), ' ') + c.success +
                               "y" + c.reset + c.dialog_bg + c.dim + " confirm  " + c.reset +
                               c.dialog_bg + c.error + "n/q" + c.reset + c.dialog_bg + c.dim +
                               " cancel" + c.reset;

    std::vector<std::string> body = {
        box_top("", dw, c, c.dialog_bg + c.accent),
        box_row(c.dialog_bg + c.accent + c.bold + l1 + c.reset, dw, c, c.dialog_bg + c.accent,
                c.dialog_bg),
        box_row(c.dialog_bg, dw, c, c.dialog_bg + c.accent, c.dialog_bg),
        box_row(c.dialog_bg + c.dim + l3 + c.reset, dw, c, c.dialog_bg + c.accent, c.dialog_bg),
        box_row(c.dialog_bg, dw, c, c.dialog_bg + c.accent, c.dialog_bg),
        box_row(c.dialog_bg + styled_hints, dw, c, c.dialog_bg + c.accent, c.dialog_bg),
        box_bottom(dw, c, c.dialog_bg + c.accent)};
    for (std::size_t i = 0; i < dh; ++i)
        lines[y + i] = cut_columns(lines[y + i], x) + c.reset + body[i];
}

} // namespace

std::optional<std::string> parse_color(const std::string& value, bool background) {
    if (value.empty())
        return std::nullopt;
    if (value[0] == '\033')
        return value;
    const char* layer = background ? "48" : "38";
    if (value[0] == '#' && value.size() == 7) {
        unsigned r = 0, g = 0, b = 0;
        for (std::size_t i = 1; i < 7; ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(value[i])))
                return std::nullopt;
        }
        if (std::sscanf(value.c_str() + 1, "%02x%02x%02x", &r, &g, &b) != 3)
            return std::nullopt;
        return "\033[" + std::string(layer) + ";2;" + std::to_string(r) + ";" +
               std::to_string(g) + ";" + std::to_string(b) + "m";
    }
    static const char* const names[] = {"black", "red",     "green", "yellow",
                                        "blue",  "magenta", "cyan",  "white"};
    std::string name = value;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    bool bright = false;
    if (name.rfind("bright-", 0) == 0) {
        bright = true;
        name = name.substr(7);
    }
    for (int i = 0; i < 8; ++i) {
        if (name == names[i]) {
            int base = background ? (bright ? 100 : 40) : (bright ? 90 : 30);
            return "\033[" + std::to_string(base + i) + "m";
        }
    }
    return std::nullopt;
}

std::vector<std::string> apply_theme_overrides(TuiTheme& theme,
                                               const std::map<std::string, std::string>& colors) {
    const std::map<std::string, std::pair<std::string TuiTheme::*, bool>> roles = {
        {"text", {&TuiTheme::text, false}},
        {"muted", {&TuiTheme::muted, false}},
        {"dim", {&TuiTheme::dim, false}},
        {"border", {&TuiTheme::border, false}},
        {"success", {&TuiTheme::success, false}},
        {"warning", {&TuiTheme::warning, false}},
        {"error", {&TuiTheme::error, false}},
        {"info", {&TuiTheme::info, false}},
        {"accent", {&TuiTheme::accent, false}},
        {"selected", {&TuiTheme::selected, false}},
        {"cursor", {&TuiTheme::cursor, false}},
        {"highlight", {&TuiTheme::highlight, true}},
        {"dialog-bg", {&TuiTheme::dialog_bg, true}},
        {"type-git", {&TuiTheme::type_git, false}},
        {"type-path", {&TuiTheme::type_path, false}},
        {"type-other", {&TuiTheme::type_other, false}},
        {"key-hint", {&TuiTheme::key_hint, false}},
        {"sha", {&TuiTheme::sha, false}}};
    std::vector<std::string> rejected;
    for (const auto& [key, value] : colors) {
        std::string k = key;
        std::replace(k.begin(), k.end(), '_', '-');
        auto it = roles.find(k);
        auto seq = it == roles.end() ? std::nullopt : parse_color(value, it->second.second);
        if (!seq) {
            rejected.push_back(key);
            continue;
        }
        theme.*(it->second.first) = *seq;
    }
    return rejected;
}

TuiColors make_tui_colors(bool no_colors, const TuiTheme& theme) {
    if (no_colors)
        return {};
    return {theme.reset,     theme.bold,      theme.text,       theme.muted,    theme.dim,
            theme.border,    theme.success,   theme.warning,    theme.error,    theme.info,
            theme.accent,    theme.selected,  theme.cursor,     theme.highlight, theme.dialog_bg,
            theme.type_git,  theme.type_path, theme.type_other, theme.key_hint, theme.sha};
}

std::size_t display_width(const std::string& s) {
    std::size_t w = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '\033') {
            i += escape_len(s, i);
            continue;
        }
        std::size_t n = utf8_len(static_cast<unsigned char>(s[i]));
        w += n == 4 ? 2 : 1;
        i += n;
    }
    return w;
}

std::string truncate_text(const std::string& s, std::size_t width) {
    if (display_width(s) <= width)
        return s;
    if (width <= 3)
        return cut_columns(s, width);
    std::string cut = cut_columns(s, width - 3);
    while (!cut.empty() && cut.back() == ' ' && display_width(cut) > width - 3)
        cut.pop_back();
    return cut + "...";
}

std::string fit_text(const std::string& s, std::size_t width) {
    std::string t = truncate_text(s, width);
    std::size_t w = display_width(t);
    if (w < width)
        t.append(width - w, ' ');
    return t;
}

const char* spinner_frame(std::uint64_t tick) {
    return SPINNER[(tick / 2) % (sizeof(SPINNER) / sizeof(SPINNER[0]))];
}

std::vector<std::string> render_loading(const std::string& message, std::uint64_t tick,
                                        std::size_t width, std::size_t height,
                                        const TuiColors& c) {
    return centered_block({{{spinner_frame(tick), c.accent}, {" " + message, c.text}},
                           {},
                           {{"Press q or Ctrl+C to cancel", c.dim}}},
                          width, height, c);
}

std::vector<std::string> render_error(const std::string& message, std::size_t width,
                                      std::size_t height, const TuiColors& c) {
    return centered_block(
        {{{"Error: " + message, c.error}}, {}, {{"Press any key to exit", c.dim}}}, width,
        height, c);
}

std::vector<std::string> render_list(const ListState& list,
                                     const std::optional<StatusMessage>& status,
                                     std::uint64_t tick, std::size_t width, std::size_t height,
                                     const TuiColors& c) {
    std::vector<std::string> lines;
    const std::size_t table_h = height > 3 ? height - 3 : 0;
    const std::size_t inner = width >= 2 ? width - 2 : 0;

    // Column widths: checkbox, name, type, rev, updated, status.
    const std::size_t fixed = 5 + 12 + 10 + 14 + 6 + 5;
    const std::size_t name_w = inner > fixed + 8 ? std::min<std::size_t>(35, inner - fixed) : 8;
    const std::size_t used = 5 + name_w + 12 + 10 + 14 + 5;
    const std::size_t status_w = inner > used ? inner - used : 1;

    if (table_h >= 2) {
        lines.push_back(box_top(" " + list.flake.path.string() + " ", width, c, c.border));
        std::string header = fit_text(" ", 5) + " " + fit_text("NAME", name_w) + " " +
                             fit_text("TYPE", 12) + " " + fit_text("REV", 10) + " " +
                             fit_text("UPDATED", 14) + " " + fit_text("STATUS", status_w);
        if (table_h > 2)
            lines.push_back(box_row(c.dim + header + c.reset, width, c, c.border));

        std::size_t rows = table_h > 3 ? table_h - 3 : 0;
        std::size_t offset = scroll_offset(list.cursor, rows);
        for (std::size_t r = 0; r < rows; ++r) {
            std::size_t idx = offset + r;
            if (idx >= list.flake.inputs.size()) {
                lines.push_back(box_row("", width, c, c.border));
                continue;
            }
            const FlakeInput& input = list.flake.inputs[idx];
            bool sel = list.selected.count(idx) > 0;
            UpdateStatus st = list.status_of(input.name());
            std::string st_text =
                st.kind == UpdateStatus::Kind::Checking ? spinner_frame(tick) : st.display();
            std::string rev = input.short_rev().empty() ? "-" : input.short_rev();
            auto lm = input.last_modified();
            std::string updated = lm ? format_relative(static_cast<std::time_t>(*lm)) : "-";

            std::string cells[6] = {fit_text(sel ? "[x]" : "[ ]", 5),
                                    fit_text(input.name(), name_w),
                                    fit_text(input.type_display(), 12),
                                    fit_text(rev, 10),
                                    fit_text(updated, 14),
                                    fit_text(st_text, status_w)};
            std::string row;
            if (idx == list.cursor) {
                row = c.highlight + c.cursor + c.bold;
                for (int i = 0; i < 6; ++i)
                    row += cells[i] + (i < 5 ? " " : "");
                lines.push_back(box_row(row, width, c, c.border, c.highlight));
                continue;
            }
            row = (sel ? c.selected + c.bold : c.dim) + cells[0] + c.reset + " " + c.text +
                  cells[1] + c.reset + " " + type_color(input, c) + cells[2] + c.reset + " " +
                  c.accent + cells[3] + c.reset + " " + c.muted + cells[4] + c.reset + " " +
                  status_color(st, c) + cells[5] + c.reset;
            lines.push_back(box_row(row, width, c, c.border));
        }
        lines.push_back(box_bottom(width, c, c.border));
    }

    auto spans = shortcut_spans({{"j/k", "nav"},
                                 {"space", "select"},
                                 {"u", "update"},
                                 {"U", "all"},
                                 {"c", "changelog"},
                                 {"r", "refresh"},
                                 {"q", "quit"}},
                                c);
    if (list.has_selection())
        spans.push_back({" | " + std::to_string(list.selected.size()) + " selected", c.selected});
    if (list.cursor < list.flake.inputs.size()) {
        UpdateStatus st = list.status_of(list.flake.inputs[list.cursor].name());
        if (st.kind == UpdateStatus::Kind::Error)
            spans.push_back({" | " + truncate_text(st.error, 60), c.error});
    }
    if (status) {
        std::string spin =
            status->level == StatusLevel::Info ? std::string(spinner_frame(tick)) + " " : "";
        spans.push_back({" | " + spin + status->text, level_color(status->level, c)});
    }
    append_help_bar(lines, spans, width, c);
    lines.resize(height);
    return lines;
}

std::vector<std::string> render_changelog(const ChangelogState& cs,
                                          const std::optional<StatusMessage>& status,
                                          std::size_t width, std::size_t height,
                                          const TuiColors& c) {
    std::vector<std::string> lines;
    const std::size_t table_h = height > 3 ? height - 3 : 0;
    const std::size_t inner = width >= 2 ? width - 2 : 0;
    const std::string title = " " + cs.input.name + " (" + cs.input.url + ") ";

    if (table_h >= 2) {
        lines.push_back(box_top(title, width, c, c.border));
        std::size_t rows = table_h - 2;
        if (cs.data.commits.empty()) {
            for (std::size_t r = 0; r < rows; ++r) {
                std::string text = r == rows / 2 ? "Already up to date!" : "";
                std::size_t pad = inner > text.size() ? (inner - text.size()) / 2 : 0;
                lines.push_back(box_row(std::string(pad, ' ') + c.success + text + c.reset,
                                        width, c, c.border));
            }
        } else {
            const std::size_t msg_w = inner > 3 + 9 + 16 + 10 + 4 ? inner - (3 + 9 + 16 + 10 + 4)
                                                                  : 1;
            std::size_t offset = scroll_offset(cs.cursor, rows);
            for (std::size_t r = 0; r < rows; ++r) {
                std::size_t idx = offset + r;
                if (idx >= cs.data.commits.size()) {
                    lines.push_back(box_row("", width, c, c.border));
                    continue;
                }
                const Commit& cm = cs.data.commits[idx];
                std::string cells[5] = {fit_text(cm.is_locked ? "🔒" : "", 3),
                                        fit_text(cm.short_sha(), 9),
                                        fit_text(cm.author, 16),
                                        fit_text(format_relative_short(cm.date), 10),
                                        fit_text(cm.message, msg_w)};
                std::string row;
                if (idx == cs.cursor) {
                    row = c.highlight + c.cursor + c.bold;
                    for (int i = 0; i < 5; ++i)
                        row += cells[i] + (i < 4 ? " " : "");
                    lines.push_back(box_row(row, width, c, c.border, c.highlight));
                    continue;
                }
                row = c.warning + cells[0] + c.reset + " " + (cm.is_locked ? c.warning : c.sha) +
                      cells[1] + c.reset + " " + c.info + cells[2] + c.reset + " " + c.dim +
                      cells[3] + c.reset + " " + c.text + cells[4] + c.reset;
                lines.push_back(box_row(row, width, c, c.border));
            }
        }
        lines.push_back(box_bottom(width, c, c.border));
    }

    auto spans = shortcut_spans({{"j/k", "nav"}, {"space", "lock"}, {"q/esc", "back"}}, c);
    if (!cs.data.commits.empty()) {
        spans.push_back({" | ", c.dim});
        spans.push_back({"+" + std::to_string(cs.data.commits_ahead()) + " new", c.success});
        spans.push_back({" 🔒 ", c.warning});
        spans.push_back({std::to_string(cs.data.commits_behind()) + " older", c.muted});
    }
    if (status)
        spans.push_back({" | " + status->text, level_color(status->level, c)});
    append_help_bar(lines, spans, width, c);
    lines.resize(height);

    overlay_confirm(lines, cs, width, c);
    return lines;
}

std::vector<std::string> render_app(const App& app, std::size_t width, std::size_t height,
                                    const TuiColors& c) {
    const AppState& st = app.state();
    if (auto* e = std::get_if<ErrorState>(&st))
        return render_error(e->message, width, height, c);
    if (auto* l = std::get_if<ListState>(&st))
        return render_list(*l, app.status_message(), app.tick_count(), width, height, c);
    if (auto* lc = std::get_if<LoadingChangelogState>(&st))
        return render_list(lc->list, app.status_message(), app.tick_count(), width, height, c);
    if (auto* cs = std::get_if<ChangelogState>(&st))
        return render_changelog(*cs, app.status_message(), width, height, c);
    if (std::holds_alternative<QuittingState>(st))
        return std::vector<std::string>(height);
    return render_loading("Loading flake...", app.tick_count(), width, height, c);
}

std::string compose_frame(const std::vector<std::string>& lines) {
    std::ostringstream out;
    out << "\033[H"; // Home, then overwrite line by line
    for (std::size_t i = 0; i < lines.size(); ++i) {
        out << lines[i] << "\033[0m\033[K";
        if (i + 1 < lines.size())
            out << "\r\n";
    }
    out << "\033[J";
    return out.str();
}

} // namespace melt
