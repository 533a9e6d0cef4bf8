#include "app.hpp"

#include <exception>
#include <utility>
#include "logger.hpp"

namespace melt {

namespace {

Error exception_error(const std::exception& e) { return Error{ErrorKind::Process, e.what()}; }

} // namespace

App::App(std::filesystem::path flake_path, std::shared_ptr<NixOperations> nix,
         std::shared_ptr<GitOperations> git, CancellationToken cancel, std::size_t workers)
    : flake_path_(std::move(flake_path)), nix_(std::move(nix)), git_(std::move(git)),
      cancel_(std::move(cancel)), state_(LoadingState{}),
      results_(std::make_shared<TaskQueue<TaskResult>>()),
      pool_(std::make_unique<WorkerPool>(workers)) {}

App::~App() {
    cancel_.cancel();
    pool_.reset();
}

void App::start() {
    log_info("Starting", {{"flake", flake_path_.string()}});
    spawn_load_flake();
}

void App::handle_key(const KeyEvent& key) { execute(melt::handle_key(state_, key)); }

void App::execute(const Action& action) {
    switch (action.kind) {
    case Action::Kind::None:
        break;
    case Action::Kind::Quit:
        state_ = QuittingState{};
        break;
    case Action::Kind::CancelAndQuit:
        cancel_.cancel();
        state_ = QuittingState{};
        break;
    case Action::Kind::UpdateSelected:
        status_ = StatusMessage::info("Updating " + std::to_string(action.names.size()) +
                                      " input(s)...");
        spawn_update(action.names);
        break;
    case Action::Kind::UpdateAll:
        status_ = StatusMessage::info("Updating all inputs...");
        spawn_update_all();
        break;
    case Action::Kind::Refresh:
        status_ = StatusMessage::info("Refreshing...");
        spawn_load_flake();
        break;
    case Action::Kind::OpenChangelog: {
        auto* list = std::get_if<ListState>(&state_);
        if (!list || action.input_idx >= list->input_count())
            break;
        const GitInput* input = list->flake.inputs[action.input_idx].as_git();
        if (!input)
            break;
        GitInput copy = *input;
        ListState parent = std::move(*list);
        parent.busy = false;
        status_ = StatusMessage::info("Loading changelog...");
        state_ = LoadingChangelogState{std::move(parent)};
        spawn_load_changelog(std::move(copy), action.input_idx);
        break;
    }
    case Action::Kind::CloseChangelog:
        close_changelog();
        break;
    case Action::Kind::ConfirmLock: {
        auto* cs = std::get_if<ChangelogState>(&state_);
        if (!cs)
            break;
        std::size_t idx = cs->confirm_lock.value_or(0);
        if (idx < cs->data.commits.size())
            status_ = StatusMessage::info("Locking " + action.input_name + " to " +
                                          cs->data.commits[idx].short_sha() + "...");
        spawn_lock(cs->parent_list.flake.path, action.input_name, action.lock_url);
        break;
    }
    case Action::Kind::ShowWarning:
        status_ = StatusMessage::warning(action.message);
        break;
    }
}

void App::apply(TaskResult result) {
    std::visit([this](auto& r) { on_result(r); }, result);
}

std::size_t App::drain_results() {
    std::size_t n = 0;
    while (auto r = results_->try_pop()) {
        apply(std::move(*r));
        ++n;
    }
    return n;
}

void App::tick(StatusMessage::Clock::time_point now) {
    ++ticks_;
    if (status_ && status_->is_expired(now))
        status_.reset();
}

void App::on_result(FlakeLoaded& r) {
    if (!r.flake) {
        log_error("Failed to load flake",
                  {{"kind", error_kind_name(r.error.kind)}, {"error", r.error.to_string()}});
        state_ = ErrorState{"Failed to load flake: " + r.error.to_string()};
        return;
    }
    std::vector<FlakeInput> inputs = r.flake->inputs;
    if (auto* list = std::get_if<ListState>(&state_))
        list->update_flake(std::move(*r.flake));
    else
        state_ = ListState(std::move(*r.flake));
    if (status_ && status_->level == StatusLevel::Info)
        status_.reset();
    spawn_check_updates(std::move(inputs));
}

void App::on_result(UpdateComplete& r) {
    auto* list = std::get_if<ListState>(&state_);
    if (r.ok) {
        status_ = StatusMessage::success("Update complete");
        if (list)
            list->clear_selection();
        spawn_load_flake();
        return;
    }
    log_warning("Update failed", {{"error", r.error.to_string()}});
    status_ = StatusMessage::error("Update failed: " + r.error.to_string());
    if (list)
        list->busy = false;
}

void App::on_result(ChangelogLoaded& r) {
    auto* loading = std::get_if<LoadingChangelogState>(&state_);
    if (!loading) {
        log_debug("Dropping changelog result",
                  {{"input", r.input.name}, {"state", state_name(state_)}});
        return;
    }
    if (!r.data) {
        log_warning("Failed to load changelog",
                    {{"input", r.input.name}, {"error", r.error.to_string()}});
        status_ = StatusMessage::error("Failed to load changelog: " + r.error.to_string());
        ListState list = std::move(loading->list);
        state_ = std::move(list);
        return;
    }
    ListState list = std::move(loading->list);
    state_ = ChangelogState(std::move(r.input), r.input_idx, std::move(*r.data), std::move(list));
    status_.reset();
}

void App::on_result(LockComplete& r) {
    if (r.ok) {
        status_ = StatusMessage::success("Locked successfully");
        if (auto* cs = std::get_if<ChangelogState>(&state_)) {
            ListState list = std::move(cs->parent_list);
            list.busy = true;
            state_ = std::move(list);
        }
        spawn_load_flake();
        return;
    }
    log_warning("Lock failed", {{"error", r.error.to_string()}});
    status_ = StatusMessage::error("Lock failed: " + r.error.to_string());
    if (auto* cs = std::get_if<ChangelogState>(&state_))
        cs->hide_confirm();
}

void App::on_result(InputStatus& r) {
    if (r.generation != generation_)
        return;
    if (ListState* list = live_list(state_))
        list->statuses[r.name] = r.status;
}

void App::close_changelog() {
    if (auto* cs = std::get_if<ChangelogState>(&state_)) {
        ListState list = std::move(cs->parent_list);
        state_ = std::move(list);
    }
}

void App::spawn_load_flake() {
    auto nix = nix_;
    auto results = results_;
    auto path = flake_path_;
    pool_->submit([nix, results, path] {
        FlakeLoaded r;
        try {
            r.flake = nix->load_metadata(path, &r.error);
        } catch (const std::exception& e) {
            r.error = exception_error(e);
        }
        results->push(std::move(r));
    });
}

void App::spawn_update(std::vector<std::string> names) {
    const ListState* list = live_list(state_);
    if (!list)
        return;
    auto nix = nix_;
    auto results = results_;
    auto dir = list->flake.path;
    pool_->submit([nix, results, dir, names = std::move(names)] {
        UpdateComplete r;
        try {
            r.ok = nix->update_inputs(dir, names, &r.error);
        } catch (const std::exception& e) {
            r.error = exception_error(e);
        }
        results->push(std::move(r));
    });
}

void App::spawn_update_all() {
    const ListState* list = live_list(state_);
    if (!list)
        return;
    auto nix = nix_;
    auto results = results_;
    auto dir = list->flake.path;
    pool_->submit([nix, results, dir] {
        UpdateComplete r;
        try {
            r.ok = nix->update_all(dir, &r.error);
        } catch (const std::exception& e) {
            r.error = exception_error(e);
        }
        results->push(std::move(r));
    });
}

void App::spawn_load_changelog(GitInput input, std::size_t idx) {
    auto git = git_;
    auto results = results_;
    pool_->submit([git, results, input = std::move(input), idx] {
        ChangelogLoaded r;
        r.input = input;
        r.input_idx = idx;
        try {
            r.data = git->get_changelog(input, &r.error);
        } catch (const std::exception& e) {
            r.error = Error{ErrorKind::Network, e.what()};
        }
        results->push(std::move(r));
    });
}

void App::spawn_lock(std::filesystem::path dir, std::string name, std::string locator) {
    auto nix = nix_;
    auto results = results_;
    pool_->submit([nix, results, dir = std::move(dir), name = std::move(name),
                   locator = std::move(locator)] {
        LockComplete r;
        try {
            r.ok = nix->lock_input(dir, name, locator, &r.error);
        } catch (const std::exception& e) {
            r.error = exception_error(e);
        }
        results->push(std::move(r));
    });
}

void App::spawn_check_updates(std::vector<FlakeInput> inputs) {
    std::uint64_t gen = ++generation_;
    auto git = git_;
    auto results = results_;
    pool_->submit([git, results, gen, inputs = std::move(inputs)] {
        try {
            git->check_updates(inputs, [&](const std::string& name, const UpdateStatus& st) {
                results->push(InputStatus{name, st, gen});
            });
        } catch (const std::exception& e) {
            log_error("Update check aborted", {{"error", e.what()}});
        }
    });
}

} // namespace melt
