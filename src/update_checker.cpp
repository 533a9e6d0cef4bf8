#include "update_checker.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include "logger.hpp"
#include "thread_compat.hpp"

namespace melt {

UpdateChecker::UpdateChecker(AheadFn ahead, std::shared_ptr<Semaphore> permits,
                             CancellationToken cancel, std::size_t workers)
    : ahead_(std::move(ahead)), permits_(std::move(permits)), cancel_(std::move(cancel)),
      workers_(std::max<std::size_t>(1, workers)) {}

void UpdateChecker::check(const std::vector<FlakeInput>& inputs,
                          const StatusCallback& on_status) const {
    std::vector<const GitInput*> git_inputs;
    for (const auto& in : inputs) {
        if (const auto* g = in.as_git())
            git_inputs.push_back(g);
    }
    log_debug("Checking for updates", {{"total", std::to_string(inputs.size())},
                                       {"git_inputs", std::to_string(git_inputs.size())}});
    std::mutex emit_mtx;
    for (const auto* g : git_inputs)
        on_status(g->name, UpdateStatus::checking());
    if (git_inputs.empty())
        return;

    std::atomic<std::size_t> next_index{0};
    auto worker = [&]() {
        while (true) {
            std::size_t idx = next_index.fetch_add(1);
            if (idx >= git_inputs.size() || cancel_.is_cancelled())
                return;
            auto permit = permits_->acquire(cancel_);
            if (!permit)
                return;
            const GitInput& input = *git_inputs[idx];
            Error err;
            std::optional<std::size_t> ahead;
            try {
                ahead = ahead_(input, &err);
            } catch (const std::exception& e) {
                err = Error{ErrorKind::Network, e.what()};
            }
            if (cancel_.is_cancelled() || (!ahead && err.kind == ErrorKind::Cancelled))
                return;
            UpdateStatus status;
            if (ahead) {
                status = UpdateStatus::from_ahead(*ahead);
                if (*ahead > 0)
                    log_debug("Updates available",
                              {{"input", input.name}, {"behind", std::to_string(*ahead)}});
            } else {
                log_warning("Failed to check input",
                            {{"input", input.name},
                             {"kind", error_kind_name(err.kind)},
                             {"error", err.to_string()}});
                status = UpdateStatus::failed(err.to_string());
            }
            std::lock_guard<std::mutex> lk(emit_mtx);
            on_status(input.name, status);
        }
    };

    std::size_t count = std::min(workers_, git_inputs.size());
    std::vector<th_compat::jthread> threads;
    threads.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        threads.emplace_back(worker);
    th_compat::join_all(threads);
}

} // namespace melt
