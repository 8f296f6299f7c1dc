#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace whoshome {
    namespace util {

        // ─── Listener token for unsubscription ────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Synchronous presence notifications ─────────────────────────────────────
        // Carries the daemon's in-process signals: per-device transitions and cycle
        // reports from PollScheduler, aggregate changes from HouseholdMonitor.
        // Everything runs on the loop thread that emits (never on probe workers),
        // so listeners such as NotificationDispatcher see events in the order the
        // scheduler produced them and may publish straight away.
        //
        // Listeners run in subscription order. One subscribed during an emit is
        // first called on the next emit; one unsubscribed during an emit is skipped
        // for the rest of it and removed when the emit returns.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = 0;
                std::function<void(const Args &...)> fn;
                bool pending_remove = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            bool dispatching_ = false;

          public:
            ListenerToken subscribe(std::function<void(const Args &...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if (it->token == token) {
                        if (dispatching_) {
                            it->pending_remove = true;
                        } else {
                            listeners_.erase(it);
                        }
                        return true;
                    }
                }
                return false;
            }

            void emit(const Args &...args) {
                dispatching_ = true;
                const usize live = listeners_.size();
                for (usize i = 0; i < live; ++i) {
                    if (!listeners_[i].pending_remove && listeners_[i].fn) {
                        // The vector may grow under a subscribing listener
                        auto fn = listeners_[i].fn;
                        fn(args...);
                    }
                }
                dispatching_ = false;

                for (auto it = listeners_.begin(); it != listeners_.end();) {
                    if (it->pending_remove) {
                        it = listeners_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.pending_remove)
                        active++;
                }
                return active;
            }

            bool empty() const noexcept { return count() == 0; }

            void clear() { listeners_.clear(); }

            ListenerToken operator+=(std::function<void(const Args &...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace whoshome
