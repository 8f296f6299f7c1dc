#pragma once

#include "constants.hpp"
#include "device.hpp"
#include "error.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>

namespace whoshome {

    // ─── Hysteresis thresholds ───────────────────────────────────────────────────
    // hit: consecutive successful probes needed to confirm Present.
    // miss: consecutive failed probes needed to confirm Absent.
    // A value of 1 disables debouncing in that direction.
    struct Thresholds {
        u32 hit = DEFAULT_HIT_THRESHOLD;
        u32 miss = DEFAULT_MISS_THRESHOLD;
    };

    // ─── MQTT connection settings ────────────────────────────────────────────────
    struct MqttConfig {
        dp::String host;
        u16 port = MQTT_DEFAULT_PORT;
        dp::String client_id = DEFAULT_CLIENT_ID;
        dp::String username;
        dp::String password;
        u16 keepalive_s = MQTT_DEFAULT_KEEPALIVE_S;
        u32 publish_attempts = MQTT_DEFAULT_PUBLISH_ATTEMPTS;
        u32 connect_timeout_ms = MQTT_CONNECT_TIMEOUT_MS;

        MqttConfig &broker(dp::String h, u16 p = MQTT_DEFAULT_PORT) {
            host = std::move(h);
            port = p;
            return *this;
        }
        MqttConfig &client(dp::String id) {
            client_id = std::move(id);
            return *this;
        }
        MqttConfig &credentials(dp::String user, dp::String pass) {
            username = std::move(user);
            password = std::move(pass);
            return *this;
        }
        MqttConfig &keepalive(u16 seconds) {
            keepalive_s = seconds;
            return *this;
        }
        MqttConfig &attempts(u32 n) {
            publish_attempts = n;
            return *this;
        }
    };

    // ─── Topic naming ────────────────────────────────────────────────────────────
    // Device topics are <base>/<device>, the aggregate is <base>/<household>.
    // An empty household leaf disables the aggregate topic.
    struct TopicConfig {
        dp::String base = DEFAULT_TOPIC_BASE;
        dp::String household = DEFAULT_HOUSEHOLD_TOPIC;
        dp::String present_payload = DEFAULT_PRESENT_PAYLOAD;
        dp::String absent_payload = DEFAULT_ABSENT_PAYLOAD;
    };

    // ─── Daemon configuration ────────────────────────────────────────────────────
    struct Config {
        dp::Vector<Device> devices;
        u32 poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
        u32 probe_timeout_ms = DEFAULT_PROBE_TIMEOUT_MS;
        u32 max_parallel_probes = DEFAULT_MAX_PARALLEL_PROBES;
        u32 refresh_interval_ms = DEFAULT_REFRESH_INTERVAL_MS;
        dp::String interface_name; // empty = any interface for MAC lookups
        Thresholds thresholds;
        MqttConfig mqtt;
        TopicConfig topics;

        // Fluent API
        Config &device(dp::String name, const dp::String &address) {
            Device d;
            d.name = std::move(name);
            auto parsed = parse_address(address);
            if (parsed.is_ok()) {
                d.address = parsed.value();
                devices.push_back(std::move(d));
            } else {
                rejected_.push_back(address);
            }
            return *this;
        }
        Config &device(Device d) {
            devices.push_back(std::move(d));
            return *this;
        }
        Config &interval(u32 ms) {
            poll_interval_ms = ms;
            return *this;
        }
        Config &timeout(u32 ms) {
            probe_timeout_ms = ms;
            return *this;
        }
        Config &hysteresis(u32 hit, u32 miss) {
            thresholds.hit = hit;
            thresholds.miss = miss;
            return *this;
        }
        Config &parallel(u32 n) {
            max_parallel_probes = n;
            return *this;
        }
        Config &refresh(u32 ms) {
            refresh_interval_ms = ms;
            return *this;
        }
        Config &interface(dp::String name) {
            interface_name = std::move(name);
            return *this;
        }
        Config &broker(dp::String host, u16 port = MQTT_DEFAULT_PORT) {
            mqtt.broker(std::move(host), port);
            return *this;
        }
        Config &topic_base(dp::String base) {
            topics.base = std::move(base);
            return *this;
        }

        const Device *find_device(const dp::String &name) const noexcept {
            for (const auto &d : devices) {
                if (d.name == name)
                    return &d;
            }
            return nullptr;
        }

        // Every check that makes the daemon refuse to start
        Result<void> validate() const {
            if (!rejected_.empty()) {
                return Result<void>::err(Error::invalid_config("invalid device address: " + rejected_[0]));
            }
            if (devices.empty()) {
                return Result<void>::err(Error::invalid_config("no devices configured"));
            }
            for (usize i = 0; i < devices.size(); ++i) {
                if (!valid_device_name(devices[i].name)) {
                    return Result<void>::err(Error::invalid_config("invalid device name: '" + devices[i].name + "'"));
                }
                dp::String slug = slugify(devices[i].name);
                if (slug == STATUS_TOPIC_LEAF || (!topics.household.empty() && slug == topics.household)) {
                    return Result<void>::err(Error::invalid_config("device " + devices[i].name +
                                                                   " would publish on the reserved topic leaf '" +
                                                                   slug + "'"));
                }
                for (usize j = i + 1; j < devices.size(); ++j) {
                    if (devices[i].name == devices[j].name) {
                        return Result<void>::err(Error::invalid_config("duplicate device name: " + devices[i].name));
                    }
                    if (slug == slugify(devices[j].name)) {
                        return Result<void>::err(Error::invalid_config("devices " + devices[i].name + " and " +
                                                                       devices[j].name + " share a topic"));
                    }
                }
            }
            if (thresholds.hit == 0 || thresholds.miss == 0) {
                return Result<void>::err(Error::invalid_config("hysteresis thresholds must be >= 1"));
            }
            if (poll_interval_ms == 0) {
                return Result<void>::err(Error::invalid_config("poll interval must be > 0"));
            }
            if (probe_timeout_ms == 0 || probe_timeout_ms >= poll_interval_ms) {
                return Result<void>::err(
                    Error::invalid_config("probe timeout must be > 0 and shorter than the poll interval"));
            }
            if (max_parallel_probes == 0) {
                return Result<void>::err(Error::invalid_config("max parallel probes must be >= 1"));
            }
            if (mqtt.host.empty()) {
                return Result<void>::err(Error::invalid_config("MQTT broker not set"));
            }
            if (mqtt.port == 0) {
                return Result<void>::err(Error::invalid_config("MQTT port must be > 0"));
            }
            if (mqtt.client_id.empty()) {
                return Result<void>::err(Error::invalid_config("MQTT client id not set"));
            }
            if (mqtt.publish_attempts == 0) {
                return Result<void>::err(Error::invalid_config("MQTT publish attempts must be >= 1"));
            }
            if (topics.base.empty()) {
                return Result<void>::err(Error::invalid_config("topic base not set"));
            }
            return {};
        }

      private:
        dp::Vector<dp::String> rejected_;
    };

} // namespace whoshome
