#ifndef MELT_APP_HPP
#define MELT_APP_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "app_state.hpp"
#include "git_service.hpp"
#include "key_handler.hpp"
#include "nix_service.hpp"
#include "thread_utils.hpp"
#include "update_status.hpp"

namespace melt {

/**
 * @brief Application controller owning the state machine.
 *
 * Every method is called from the control thread. Long running work is
 * submitted to a worker pool and its outcome comes back as a TaskResult
 * through a queue drained by drain_results().
 */
class App {
  public:
    App(std::filesystem::path flake_path, std::shared_ptr<NixOperations> nix,
        std::shared_ptr<GitOperations> git, CancellationToken cancel, std::size_t workers = 4);
    ~App();
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /** Start loading the flake. */
    void start();

    void handle_key(const KeyEvent& key);
    void execute(const Action& action);
    void apply(TaskResult result);

    /** Apply every queued result. @return Number of results applied. */
    std::size_t drain_results();

    /** Advance the animation counter and drop an expired status message. */
    void tick(StatusMessage::Clock::time_point now = StatusMessage::Clock::now());

    bool quitting() const { return std::holds_alternative<QuittingState>(state_); }
    const AppState& state() const { return state_; }
    AppState& state() { return state_; }
    const std::optional<StatusMessage>& status_message() const { return status_; }
    std::uint64_t tick_count() const { return ticks_; }
    std::uint64_t check_generation() const { return generation_; }
    const std::filesystem::path& flake_path() const { return flake_path_; }

  private:
    void spawn_load_flake();
    void spawn_update(std::vector<std::string> names);
    void spawn_update_all();
    void spawn_load_changelog(GitInput input, std::size_t idx);
    void spawn_lock(std::filesystem::path dir, std::string name, std::string locator);
    void spawn_check_updates(std::vector<FlakeInput> inputs);
    void close_changelog();

    void on_result(FlakeLoaded& r);
    void on_result(UpdateComplete& r);
    void on_result(ChangelogLoaded& r);
    void on_result(LockComplete& r);
    void on_result(InputStatus& r);

    std::filesystem::path flake_path_;
    std::shared_ptr<NixOperations> nix_;
    std::shared_ptr<GitOperations> git_;
    CancellationToken cancel_;
    AppState state_;
    std::optional<StatusMessage> status_;
    std::uint64_t ticks_ = 0;
    std::uint64_t generation_ = 0;
    std::shared_ptr<TaskQueue<TaskResult>> results_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace melt

#endif // MELT_APP_HPP
