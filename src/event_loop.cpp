#include "hostmux/event_loop.hpp"

#include "hostmux/utils.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace hostmux {

    event_loop::handle event_loop::watch(int fd, short events, fd_handler handler) {
        auto id = next_handle_++;
        watches_.emplace(id, fd_watch{.fd = fd, .events = events, .handler = std::move(handler)});
        return id;
    }

    void event_loop::unwatch(handle id) {
        watches_.erase(id);
    }

    event_loop::handle event_loop::add_timer(clock::time_point deadline, timer_handler handler) {
        auto id = next_handle_++;
        timers_.emplace(id, timer{.deadline = deadline, .handler = std::move(handler)});
        return id;
    }

    void event_loop::cancel_timer(handle id) {
        timers_.erase(id);
    }

    void event_loop::fire_expired_timers() {
        auto now = clock::now();
        std::vector<handle> expired{};
        for (const auto& [id, t] : timers_) {
            if (t.deadline <= now) {
                expired.push_back(id);
            }
        }
        for (auto id : expired) {
            auto it = timers_.find(id);
            if (it == timers_.end()) {
                continue;
            }
            auto handler = std::move(it->second.handler);
            timers_.erase(it);
            handler();
        }
    }

    bool event_loop::run_once(std::chrono::milliseconds max_wait) {
        if (watches_.empty() && timers_.empty()) {
            return false;
        }

        auto wait = max_wait;
        if (!timers_.empty()) {
            auto next = std::ranges::min_element(timers_, {}, [](const auto& entry) { return entry.second.deadline; });
            auto until_next =
                    std::chrono::duration_cast<std::chrono::milliseconds>(next->second.deadline - clock::now());
            // round up so a timer that is a fraction of a millisecond away does not spin
            until_next += std::chrono::milliseconds{1};
            wait = std::clamp(until_next, std::chrono::milliseconds{0}, max_wait);
        }

        std::vector<pollfd> fds{};
        std::vector<handle> ids{};
        fds.reserve(watches_.size());
        ids.reserve(watches_.size());
        for (const auto& [id, w] : watches_) {
            fds.push_back(pollfd{.fd = w.fd, .events = w.events, .revents = 0});
            ids.push_back(id);
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(wait);
        }
        else {
            int ret = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), static_cast<int>(wait.count()));
            if (ret < 0) {
                if (errno != EINTR) {
                    throw std::runtime_error("poll() failed: " + std::string{std::strerror(errno)});
                }
            }
            else if (ret > 0) {
                for (size_t i = 0; i < fds.size(); ++i) {
                    if (fds[i].revents == 0) {
                        continue;
                    }
                    // a previous handler may have removed this watch
                    auto it = watches_.find(ids[i]);
                    if (it == watches_.end()) {
                        continue;
                    }
                    auto handler = it->second.handler;
                    handler(fds[i].revents);
                }
            }
        }

        fire_expired_timers();
        return true;
    }

    bool event_loop::run_until(const std::function<bool()>& done, std::optional<clock::time_point> deadline) {
        constexpr auto slice = std::chrono::milliseconds{10};
        while (!done()) {
            auto wait = slice;
            if (deadline) {
                auto now = clock::now();
                if (now >= *deadline) {
                    return done();
                }
                wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now));
            }
            if (!run_once(wait)) {
                if (!deadline) {
                    // nothing left that could ever change the predicate
                    debug_log("event loop idle with unmet predicate");
                    return done();
                }
                std::this_thread::sleep_for(wait);
            }
        }
        return true;
    }

}  // namespace hostmux
