#pragma once

#include "../core/config.hpp"
#include "../core/constants.hpp"
#include "../core/device.hpp"
#include "../core/error.hpp"
#include <cerrno>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <functional>
#include <string>

namespace whoshome {
    namespace config {

        // Returns the value of a variable, or nullopt when it is not set. A variable
        // set to the empty string is returned as an empty value.
        using EnvLookup = std::function<dp::Optional<dp::String>(const char *)>;

        inline dp::Optional<dp::String> process_env(const char *name) {
            const char *value = std::getenv(name);
            if (value == nullptr) {
                return dp::nullopt;
            }
            return dp::String(value);
        }

        inline std::string trim(const std::string &s) {
            usize begin = 0;
            usize end = s.size();
            while (begin < end && (s[begin] == ' ' || s[begin] == '\t' || s[begin] == '\n' || s[begin] == '\r'))
                ++begin;
            while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\n' || s[end - 1] == '\r'))
                --end;
            return s.substr(begin, end - begin);
        }

        inline Result<u32> parse_u32(const char *name, const dp::String &text) {
            std::string s = trim(std::string(text.c_str()));
            if (s.empty() || s[0] == '-' || s[0] == '+') {
                return Result<u32>::err(Error::invalid_config(dp::String(name) + ": expected a number, got '" + text + "'"));
            }
            errno = 0;
            char *end = nullptr;
            unsigned long long value = std::strtoull(s.c_str(), &end, 10);
            if (*end != '\0' || errno == ERANGE || value > 0xFFFFFFFFull) {
                return Result<u32>::err(Error::invalid_config(dp::String(name) + ": expected a number, got '" + text + "'"));
            }
            return Result<u32>::ok(static_cast<u32>(value));
        }

        inline Result<u16> parse_u16(const char *name, const dp::String &text) {
            auto value = parse_u32(name, text);
            if (!value.is_ok()) {
                return Result<u16>::err(value.error());
            }
            if (value.value() > 0xFFFF) {
                return Result<u16>::err(Error::invalid_config(dp::String(name) + ": out of range: " + text));
            }
            return Result<u16>::ok(static_cast<u16>(value.value()));
        }

        // "phone_a=192.168.1.20, phone_b=192.168.1.21:62078, tablet=aa:bb:cc:dd:ee:ff"
        inline Result<dp::Vector<Device>> parse_device_list(const dp::String &text) {
            dp::Vector<Device> devices;
            std::string s(text.c_str());
            usize pos = 0;
            while (pos <= s.size()) {
                usize comma = s.find(',', pos);
                if (comma == std::string::npos)
                    comma = s.size();
                std::string item = trim(s.substr(pos, comma - pos));
                pos = comma + 1;
                if (item.empty())
                    continue;

                usize eq = item.find('=');
                if (eq == std::string::npos) {
                    return Result<dp::Vector<Device>>::err(
                        Error::invalid_config("device entry '" + dp::String(item.c_str()) + "' is not name=address"));
                }
                Device device;
                device.name = dp::String(trim(item.substr(0, eq)).c_str());
                if (!valid_device_name(device.name)) {
                    return Result<dp::Vector<Device>>::err(
                        Error::invalid_config("invalid device name: '" + device.name + "'"));
                }
                auto address = parse_address(dp::String(trim(item.substr(eq + 1)).c_str()));
                if (!address.is_ok()) {
                    return Result<dp::Vector<Device>>::err(
                        Error::invalid_config(device.name + ": " + address.error().message));
                }
                device.address = address.value();
                devices.push_back(std::move(device));
            }
            return Result<dp::Vector<Device>>::ok(std::move(devices));
        }

        // ─── Environment loader ─────────────────────────────────────────────────────
        // Builds and validates the daemon configuration. Unset variables keep their
        // defaults. Any error here is fatal at startup.
        inline Result<Config> from_environment(const EnvLookup &lookup = process_env) {
            Config cfg;

            auto required = [&](const char *name) -> Result<dp::String> {
                auto value = lookup(name);
                if (!value.has_value() || trim(std::string(value.value().c_str())).empty()) {
                    return Result<dp::String>::err(Error::invalid_config(dp::String(name) + " is not set"));
                }
                return Result<dp::String>::ok(dp::String(trim(std::string(value.value().c_str())).c_str()));
            };
            auto number = [&](const char *name, u32 &out) -> Result<void> {
                auto value = lookup(name);
                if (!value.has_value())
                    return {};
                auto parsed = parse_u32(name, value.value());
                if (!parsed.is_ok())
                    return Result<void>::err(parsed.error());
                out = parsed.value();
                return {};
            };
            auto port = [&](const char *name, u16 &out) -> Result<void> {
                auto value = lookup(name);
                if (!value.has_value())
                    return {};
                auto parsed = parse_u16(name, value.value());
                if (!parsed.is_ok())
                    return Result<void>::err(parsed.error());
                out = parsed.value();
                return {};
            };
            auto text = [&](const char *name, dp::String &out) {
                auto value = lookup(name);
                if (value.has_value())
                    out = value.value();
            };

            auto device_list = required("WHOSHOME_DEVICES");
            if (!device_list.is_ok())
                return Result<Config>::err(device_list.error());
            auto devices = parse_device_list(device_list.value());
            if (!devices.is_ok())
                return Result<Config>::err(devices.error());
            cfg.devices = std::move(devices.value());

            if (auto r = number("WHOSHOME_POLL_INTERVAL_MS", cfg.poll_interval_ms); !r.is_ok())
                return Result<Config>::err(r.error());
            if (auto r = number("WHOSHOME_PROBE_TIMEOUT_MS", cfg.probe_timeout_ms); !r.is_ok())
                return Result<Config>::err(r.error());
            if (auto r = number("WHOSHOME_HIT_THRESHOLD", cfg.thresholds.hit); !r.is_ok())
                return Result<Config>::err(r.error());
            if (auto r = number("WHOSHOME_MISS_THRESHOLD", cfg.thresholds.miss); !r.is_ok())
                return Result<Config>::err(r.error());
            if (auto r = number("WHOSHOME_MAX_PARALLEL", cfg.max_parallel_probes); !r.is_ok())
                return Result<Config>::err(r.error());
            if (auto r = number("WHOSHOME_REFRESH_INTERVAL_MS", cfg.refresh_interval_ms); !r.is_ok())
                return Result<Config>::err(r.error());
            if (auto r = number("MQTT_PUBLISH_ATTEMPTS", cfg.mqtt.publish_attempts); !r.is_ok())
                return Result<Config>::err(r.error());
            if (auto r = port("MQTT_PORT", cfg.mqtt.port); !r.is_ok())
                return Result<Config>::err(r.error());
            if (auto r = port("MQTT_KEEPALIVE_S", cfg.mqtt.keepalive_s); !r.is_ok())
                return Result<Config>::err(r.error());

            auto broker = required("MQTT_BROKER");
            if (!broker.is_ok())
                return Result<Config>::err(broker.error());
            cfg.mqtt.host = broker.value();

            text("WHOSHOME_INTERFACE", cfg.interface_name);
            text("MQTT_CLIENT", cfg.mqtt.client_id);
            text("MQTT_USERNAME", cfg.mqtt.username);
            text("MQTT_PASSWORD", cfg.mqtt.password);
            text("MQTT_TOPIC", cfg.topics.base);
            text("WHOSHOME_PRESENT_PAYLOAD", cfg.topics.present_payload);
            text("WHOSHOME_ABSENT_PAYLOAD", cfg.topics.absent_payload);
            text("WHOSHOME_HOUSEHOLD_TOPIC", cfg.topics.household);

            if (auto valid = cfg.validate(); !valid.is_ok()) {
                return Result<Config>::err(valid.error());
            }
            return Result<Config>::ok(std::move(cfg));
        }

    } // namespace config
    using config::from_environment;
} // namespace whoshome
