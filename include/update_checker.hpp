#ifndef MELT_UPDATE_CHECKER_HPP
#define MELT_UPDATE_CHECKER_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "flake.hpp"
#include "thread_utils.hpp"
#include "update_status.hpp"

namespace melt {

/**
 * @brief Checks every git input of a flake against its remote.
 *
 * `Checking` is reported for all git inputs before the first remote call.
 * Inputs are then processed by a small set of threads, each holding a permit
 * of the shared semaphore while it works. Cancellation is checked before
 * every permit acquisition and stops the pass without further reports.
 */
class UpdateChecker {
  public:
    using AheadFn = std::function<std::optional<std::size_t>(const GitInput&, Error*)>;
    using StatusCallback = std::function<void(const std::string&, const UpdateStatus&)>;

    /**
     * @param ahead   Returns the number of commits the remote is ahead.
     * @param permits Semaphore shared with every other remote operation.
     * @param cancel  Shared cancellation flag.
     * @param workers Upper bound on threads used for one pass.
     */
    UpdateChecker(AheadFn ahead, std::shared_ptr<Semaphore> permits, CancellationToken cancel,
                  std::size_t workers = 10);

    /**
     * @brief Run one pass and block until it finishes or is cancelled.
     *
     * @p on_status is never invoked concurrently.
     */
    void check(const std::vector<FlakeInput>& inputs, const StatusCallback& on_status) const;

  private:
    AheadFn ahead_;
    std::shared_ptr<Semaphore> permits_;
    CancellationToken cancel_;
    std::size_t workers_;
};

} // namespace melt

#endif // MELT_UPDATE_CHECKER_HPP
