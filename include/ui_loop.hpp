#ifndef UI_LOOP_HPP
#define UI_LOOP_HPP

#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "key_handler.hpp"
#include "options.hpp"
#include "tui.hpp"

namespace melt {

class App;

/**
 * @brief Decode raw terminal input into key events.
 *
 * Understands printable characters, control letters, Enter, Tab, Backspace,
 * a lone Esc and the CSI/SS3 arrow sequences. Unknown escape sequences are
 * dropped.
 */
std::vector<KeyEvent> decode_keys(const std::string& bytes);

/**
 * @brief Non-blocking reader of keys from a terminal descriptor.
 */
class KeyReader {
    int fd_;
    std::deque<KeyEvent> pending_;

  public:
    explicit KeyReader(int fd) : fd_(fd) {}

    /** Wait up to @p timeout for one key. */
    std::optional<KeyEvent> poll(std::chrono::milliseconds timeout);
};

/**
 * @brief Drive @p app until it quits.
 *
 * Each frame polls for at most one key, applies all finished background
 * results, redraws and expires the status message.
 *
 * @param in_fd  Terminal input.
 * @param out_fd Terminal output, used for drawing and size queries.
 */
void run_tui(App& app, const TuiColors& colors, int in_fd, int out_fd);

/**
 * @brief Build the services for @p opts and run the interactive session.
 *
 * @return Process exit code.
 */
int run_event_loop(const Options& opts);

} // namespace melt

#endif // UI_LOOP_HPP
