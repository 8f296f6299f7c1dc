#pragma once

#include "../core/config.hpp"
#include "../core/constants.hpp"
#include "../core/device.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace whoshome {
    namespace notify {

        // Publish topics carry no wildcards and fit a 16-bit length prefix
        inline bool valid_topic_name(const dp::String &topic) noexcept {
            if (topic.empty() || topic.size() > 0xFFFF)
                return false;
            for (usize i = 0; i < topic.size(); ++i) {
                char c = topic[i];
                if (c == '+' || c == '#' || c == '\0')
                    return false;
            }
            return true;
        }

        // ─── Topic and payload mapping ──────────────────────────────────────────────
        class TopicScheme {
            TopicConfig config_;

            dp::String under_base(const dp::String &leaf) const {
                const dp::String &base = config_.base;
                usize end = base.size();
                while (end > 0 && base[end - 1] == '/') {
                    end--;
                }
                dp::String topic;
                for (usize i = 0; i < end; ++i) {
                    topic += base[i];
                }
                topic += '/';
                topic += leaf;
                return topic;
            }

          public:
            explicit TopicScheme(TopicConfig config = {}) : config_(std::move(config)) {}

            dp::String device_topic(const dp::String &device) const { return under_base(slugify(device)); }
            dp::String household_topic() const { return under_base(config_.household); }
            dp::String status_topic() const { return under_base(STATUS_TOPIC_LEAF); }
            bool household_enabled() const noexcept { return !config_.household.empty(); }

            const dp::String &payload(Status s) const noexcept {
                return s == Status::Present ? config_.present_payload : config_.absent_payload;
            }

            const TopicConfig &config() const noexcept { return config_; }
        };

    } // namespace notify
    using namespace notify;
} // namespace whoshome
