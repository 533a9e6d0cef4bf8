#ifndef THREAD_UTILS_HPP
#define THREAD_UTILS_HPP
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "thread_compat.hpp"

namespace melt {

/**
 * @brief Shared cooperative cancellation flag.
 *
 * Copies refer to the same flag, so one token handed to every worker stops
 * all of them at their next check.
 */
class CancellationToken {
    std::shared_ptr<std::atomic<bool>> flag_ = std::make_shared<std::atomic<bool>>(false);

  public:
    void cancel() const { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }
};

/**
 * @brief Counting semaphore bounding concurrent fallback operations.
 */
class Semaphore {
    std::mutex mtx_;
    std::condition_variable cv_;
    std::size_t available_;
    std::size_t capacity_;

    void release() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++available_;
        }
        cv_.notify_one();
    }

  public:
    /** RAII permit returning its slot on destruction. */
    class Permit {
        Semaphore* sem_ = nullptr;

      public:
        Permit() = default;
        explicit Permit(Semaphore* s) : sem_(s) {}
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& o) noexcept : sem_(std::exchange(o.sem_, nullptr)) {}
        Permit& operator=(Permit&& o) noexcept {
            if (this != &o) {
                if (sem_)
                    sem_->release();
                sem_ = std::exchange(o.sem_, nullptr);
            }
            return *this;
        }
        ~Permit() {
            if (sem_)
                sem_->release();
        }
    };

    explicit Semaphore(std::size_t capacity) : available_(capacity), capacity_(capacity) {}

    /**
     * @brief Wait for a free slot.
     *
     * @return A permit, or `std::nullopt` once @p cancel is set.
     */
    std::optional<Permit> acquire(const CancellationToken& cancel) {
        std::unique_lock<std::mutex> lk(mtx_);
        while (available_ == 0) {
            if (cancel.is_cancelled())
                return std::nullopt;
            cv_.wait_for(lk, std::chrono::milliseconds(50));
        }
        if (cancel.is_cancelled())
            return std::nullopt;
        --available_;
        return Permit(this);
    }

    std::size_t available() {
        std::lock_guard<std::mutex> lk(mtx_);
        return available_;
    }
    std::size_t capacity() const { return capacity_; }
};

/**
 * @brief Unbounded multi-producer queue drained by the control thread.
 */
template <typename T> class TaskQueue {
    std::mutex mtx_;
    std::deque<T> items_;

  public:
    void push(T item) {
        std::lock_guard<std::mutex> lk(mtx_);
        items_.push_back(std::move(item));
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (items_.empty())
            return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    bool empty() {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.empty();
    }
};

/**
 * @brief Fixed set of threads running submitted jobs in FIFO order.
 *
 * The destructor finishes queued jobs before joining.
 */
class WorkerPool {
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    bool stopping_ = false;
    std::vector<th_compat::jthread> threads_;

    void run() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lk(mtx_);
                cv_.wait(lk, [this] { return stopping_ || !jobs_.empty(); });
                if (jobs_.empty())
                    return;
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }

  public:
    explicit WorkerPool(std::size_t threads) {
        threads = std::max<std::size_t>(1, threads);
        for (std::size_t i = 0; i < threads; ++i)
            threads_.emplace_back([this] { run(); });
    }
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            stopping_ = true;
        }
        cv_.notify_all();
        th_compat::join_all(threads_);
    }

    void submit(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
    }
};

namespace detail {
struct BlockingCalls {
    std::mutex m;
    std::condition_variable cv;
    std::size_t running = 0;
};

// Never destroyed so threads still running at exit can reach it.
inline BlockingCalls& blocking_calls() {
    static auto* calls = new BlockingCalls;
    return *calls;
}
} // namespace detail

/** Number of run_with_timeout() calls whose thread has not returned yet. */
inline std::size_t blocking_calls_in_flight() {
    auto& calls = detail::blocking_calls();
    std::lock_guard<std::mutex> lk(calls.m);
    return calls.running;
}

/**
 * @brief Wait until every call started by run_with_timeout() has returned.
 *
 * @return `false` when some are still running after @p timeout.
 */
inline bool wait_for_blocking_calls(std::chrono::milliseconds timeout) {
    auto& calls = detail::blocking_calls();
    std::unique_lock<std::mutex> lk(calls.m);
    return calls.cv.wait_for(lk, timeout, [&calls] { return calls.running == 0; });
}

/**
 * @brief Run a blocking call on its own thread and wait for it with a deadline.
 *
 * @p fn has the signature `std::optional<T>(Error*)`. The waiting thread gives
 * up with ErrorKind::Timeout once @p timeout elapses, or with
 * ErrorKind::Cancelled when @p cancel is set. The call itself keeps running
 * detached until it returns; its result is then discarded. Such calls are
 * counted until they return, see wait_for_blocking_calls().
 *
 * @param what Label added to timeout errors.
 */
template <typename T, typename Fn>
std::optional<T> run_with_timeout(Fn fn, std::chrono::milliseconds timeout,
                                  const CancellationToken& cancel, Error* error,
                                  const std::string& what) {
    struct Shared {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        std::optional<T> result;
        Error err;
    };
    if (cancel.is_cancelled()) {
        set_error(error, ErrorKind::Cancelled, what);
        return std::nullopt;
    }
    auto shared = std::make_shared<Shared>();
    auto& calls = detail::blocking_calls();
    {
        std::lock_guard<std::mutex> lk(calls.m);
        ++calls.running;
    }
    std::thread([shared, &calls, fn = std::move(fn)]() mutable {
        Error err;
        std::optional<T> r;
        try {
            r = fn(&err);
        } catch (const std::exception& e) {
            err = Error{ErrorKind::Cache, e.what()};
        }
        {
            std::lock_guard<std::mutex> lk(shared->m);
            shared->result = std::move(r);
            shared->err = std::move(err);
            shared->done = true;
            shared->cv.notify_all();
        }
        std::lock_guard<std::mutex> lk(calls.m);
        --calls.running;
        calls.cv.notify_all();
    }).detach();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lk(shared->m);
    while (!shared->done) {
        if (cancel.is_cancelled()) {
            set_error(error, ErrorKind::Cancelled, what);
            return std::nullopt;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            set_error(error, ErrorKind::Timeout, what);
            return std::nullopt;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(std::chrono::milliseconds(50),
                                                                   deadline - now);
        shared->cv.wait_for(lk, slice);
    }
    if (!shared->result && error)
        *error = shared->err;
    return std::move(shared->result);
}

} // namespace melt

#endif // THREAD_UTILS_HPP
