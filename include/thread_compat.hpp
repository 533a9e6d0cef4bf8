#ifndef THREAD_COMPAT_HPP
#define THREAD_COMPAT_HPP
#include <thread>
#include <utility>
#include <vector>

// `th_compat::jthread` is `std::jthread` when the library ships it. Otherwise a
// thread that joins on destruction is used; callers stop it through their own
// flags since no stop token is available.
#if defined(__cpp_lib_jthread)
#include <stop_token>
namespace th_compat {
using jthread = std::jthread;
}
#else
namespace th_compat {
class jthread {
    std::thread t;

  public:
    jthread() noexcept = default;
    template <class Fn, class... Args>
    explicit jthread(Fn&& fn, Args&&... args)
        : t(std::forward<Fn>(fn), std::forward<Args>(args)...) {}
    jthread(jthread&&) noexcept = default;
    jthread& operator=(jthread&& other) noexcept {
        join();
        t = std::move(other.t);
        return *this;
    }
    ~jthread() { join(); }
    void join() {
        if (t.joinable())
            t.join();
    }
    bool joinable() const noexcept { return t.joinable(); }
};
} // namespace th_compat
#endif

namespace th_compat {
/** Join every thread in @p threads and clear the vector. */
inline void join_all(std::vector<jthread>& threads) {
    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }
    threads.clear();
}
} // namespace th_compat

#endif // THREAD_COMPAT_HPP
