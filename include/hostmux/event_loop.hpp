#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace hostmux {

    /*
     * Single-threaded poll(2) reactor shared by every protocol client.
     *
     * Blocking operations elsewhere in the project never sleep on their own; they call
     * run_until() so that every other registered descriptor and timer keeps being serviced
     * while they wait. Handlers may add or remove watches and timers while being dispatched.
     */
    class event_loop {
      public:
        using clock = std::chrono::steady_clock;
        using handle = std::uint64_t;
        using fd_handler = std::function<void(short revents)>;
        using timer_handler = std::function<void()>;

        event_loop() = default;
        event_loop(const event_loop&) = delete;
        event_loop& operator=(const event_loop&) = delete;

        handle watch(int fd, short events, fd_handler handler);
        void unwatch(handle id);

        handle add_timer(clock::time_point deadline, timer_handler handler);
        void cancel_timer(handle id);

        // polls at most `max_wait` (shortened to the next timer); false when nothing is registered
        bool run_once(std::chrono::milliseconds max_wait);

        // pumps until `done` holds or `deadline` passes; returns done()
        bool run_until(const std::function<bool()>& done, std::optional<clock::time_point> deadline = std::nullopt);

        std::size_t watch_count() const { return watches_.size(); }
        std::size_t timer_count() const { return timers_.size(); }

      private:
        struct fd_watch {
            int fd{-1};
            short events{};
            fd_handler handler{};
        };

        struct timer {
            clock::time_point deadline{};
            timer_handler handler{};
        };

        void fire_expired_timers();

        std::map<handle, fd_watch> watches_{};
        std::map<handle, timer> timers_{};
        handle next_handle_{1};
    };

}  // namespace hostmux
