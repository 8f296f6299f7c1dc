#pragma once

#include "../core/config.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../net/cancel.hpp"
#include "../notify/publisher.hpp"
#include "../notify/topics.hpp"
#include <chrono>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <memory>
#include <mqtt/client.h>
#include <string>

namespace whoshome {
    namespace mqtt {

        inline std::string to_std(const dp::String &s) { return std::string(s.c_str(), s.size()); }

        // CONNACK return codes 1..5 of MQTT 3.1.1
        inline const char *connack_reason(int code) noexcept {
            switch (code) {
            case 1:
                return "unacceptable protocol version";
            case 2:
                return "identifier rejected";
            case 3:
                return "server unavailable";
            case 4:
                return "bad user name or password";
            case 5:
                return "not authorized";
            default:
                return "unknown";
            }
        }

        inline Error from_paho(const ::mqtt::exception &e) {
            if (dynamic_cast<const ::mqtt::timeout_error *>(&e)) {
                return Error::timeout(dp::String(e.what()));
            }
            int rc = e.get_return_code();
            if (rc >= 1 && rc <= 5) {
                return Error::refused("broker refused connection: " + dp::String(connack_reason(rc)));
            }
            return Error::not_connected(dp::String(e.what()));
        }

        // ─── MQTT publisher on paho ─────────────────────────────────────────────────
        // QoS 0 only. Connects lazily on the first publish and again after any
        // failure, so a broker that is down at startup is not fatal. The session
        // carries a retained last will of "offline" on <base>/status and announces
        // "online" there after every connect. Keep-alive runs on paho's own thread;
        // a connection it declares lost is noticed in service().
        class MqttClient : public Publisher {
            MqttConfig config_;
            dp::String status_topic_;
            const CancelSignal *cancel_;

            std::unique_ptr<::mqtt::client> client_;
            bool connected_ = false;
            u64 connects_ = 0;

          public:
            MqttClient(MqttConfig config, dp::String status_topic, const CancelSignal *cancel = nullptr)
                : config_(std::move(config)), status_topic_(std::move(status_topic)), cancel_(cancel) {}

            ~MqttClient() override { drop_connection(); }

            MqttClient(const MqttClient &) = delete;
            MqttClient &operator=(const MqttClient &) = delete;

            bool connected() const noexcept { return connected_; }
            u64 connect_count() const noexcept { return connects_; }

            dp::String server_uri() const {
                return "tcp://" + config_.host + ":" + dp::String(std::to_string(config_.port));
            }

            ::mqtt::connect_options connect_options() const {
                ::mqtt::connect_options opts;
                opts.set_mqtt_version(MQTTVERSION_3_1_1);
                opts.set_clean_session(true);
                opts.set_automatic_reconnect(false);
                opts.set_keep_alive_interval(std::chrono::seconds(config_.keepalive_s));
                opts.set_connect_timeout(std::chrono::milliseconds(config_.connect_timeout_ms));
                opts.set_will(::mqtt::will_options(to_std(status_topic_), std::string(OFFLINE_PAYLOAD), 0, true));
                if (!config_.username.empty()) {
                    opts.set_user_name(to_std(config_.username));
                    opts.set_password(to_std(config_.password));
                }
                return opts;
            }

            Result<void> connect() {
                drop_connection();
                if (cancel_ && cancel_->raised()) {
                    return Result<void>::err(Error::cancelled());
                }

                try {
                    auto cli = std::make_unique<::mqtt::client>(to_std(server_uri()), to_std(config_.client_id));
                    cli->set_timeout(std::chrono::milliseconds(config_.connect_timeout_ms));
                    cli->connect(connect_options());
                    client_ = std::move(cli);
                } catch (const ::mqtt::exception &e) {
                    drop_connection();
                    return Result<void>::err(from_paho(e));
                }

                connected_ = true;
                connects_++;
                echo::category("whoshome.mqtt")
                    .info("connected to ", config_.host, ":", config_.port, " as ", config_.client_id);

                if (auto online = send(status_topic_, ONLINE_PAYLOAD, true); !online.is_ok()) {
                    drop_connection();
                    return online;
                }
                return {};
            }

            // ─── Publisher ──────────────────────────────────────────────────────────
            Result<void> publish(const dp::String &topic, const dp::String &payload, bool retained) override {
                if (!valid_topic_name(topic)) {
                    return Result<void>::err(Error::invalid_data("invalid topic name: '" + topic + "'"));
                }

                Error last = Error::not_connected();
                for (u32 attempt = 1; attempt <= config_.publish_attempts; ++attempt) {
                    if (cancel_ && cancel_->raised()) {
                        return Result<void>::err(Error::cancelled());
                    }
                    if (!connected_) {
                        auto c = connect();
                        if (!c.is_ok()) {
                            last = c.error();
                            echo::category("whoshome.mqtt")
                                .warn("connect attempt ", attempt, "/", config_.publish_attempts, " to ", config_.host,
                                      ":", config_.port, " failed: ", last.message);
                            continue;
                        }
                    }
                    auto sent = send(topic, payload, retained);
                    if (sent.is_ok()) {
                        return {};
                    }
                    last = sent.error();
                    echo::category("whoshome.mqtt")
                        .warn("publish attempt ", attempt, "/", config_.publish_attempts, " to ", topic,
                              " failed: ", last.message);
                    drop_connection();
                }
                return Result<void>::err(last);
            }

            // Picks up a connection paho has given up on (missed PINGRESP, broker
            // closed the socket) so the next publish reconnects
            void service() override {
                if (!connected_)
                    return;
                if (!client_ || !client_->is_connected()) {
                    echo::category("whoshome.mqtt").warn("connection to ", config_.host, " lost");
                    drop_connection();
                }
            }

            // Announces offline and disconnects. Runs after shutdown has been
            // signalled, so it does not watch the cancel signal.
            void close() override {
                if (!connected_)
                    return;
                auto offline = send(status_topic_, OFFLINE_PAYLOAD, true);
                if (!offline.is_ok()) {
                    echo::category("whoshome.mqtt").warn("offline announcement failed: ", offline.error().message);
                }
                if (client_) {
                    try {
                        client_->disconnect();
                    } catch (const ::mqtt::exception &e) {
                        echo::category("whoshome.mqtt").warn("disconnect failed: ", e.what());
                    }
                }
                drop_connection();
                echo::category("whoshome.mqtt").info("disconnected from ", config_.host);
            }

          private:
            // Without DISCONNECT the broker delivers the will
            void drop_connection() noexcept {
                client_.reset();
                connected_ = false;
            }

            Result<void> send(const dp::String &topic, const dp::String &payload, bool retained) {
                if (!client_) {
                    return Result<void>::err(Error::not_connected());
                }
                try {
                    client_->publish(::mqtt::make_message(to_std(topic), to_std(payload), 0, retained));
                } catch (const ::mqtt::exception &e) {
                    return Result<void>::err(from_paho(e));
                }
                return {};
            }
        };

    } // namespace mqtt
    using mqtt::MqttClient;
} // namespace whoshome
