/*******************************************************************************
 * WHOSHOME PRESENCE DAEMON
 *******************************************************************************
 *
 * Probes the household's phones on the LAN and publishes who is home to an
 * MQTT broker as retained messages.
 *
 *     ┌──────────────┐  probe   ┌───────────────┐  change  ┌──────────────┐
 *     │ PollScheduler├─────────►│ DeviceTracker ├─────────►│ Dispatcher   │
 *     │ (every N ms) │  joined  │ (hysteresis)  │  events  │ (MQTT, QoS0) │
 *     └──────────────┘          └───────────────┘          └──────────────┘
 *
 *   <base>/<device>     home | away      retained, on confirmed change
 *   <base>/household    home | away      anyone home
 *   <base>/status       online | offline last will
 *
 * Configured from the environment, for example:
 *
 *   WHOSHOME_DEVICES="alice=192.168.1.20,bob=192.168.1.21:62078,carol=aa:bb:cc:dd:ee:ff"
 *   MQTT_BROKER=192.168.1.2
 *
 * SIGINT/SIGTERM stop the daemon cleanly (exit 0). A configuration error exits
 * with 2 before anything is probed.
 *
 ******************************************************************************/

#include <whoshome.hpp>
#include <echo/echo.hpp>
#include <csignal>

using namespace whoshome;

static CancelSignal *shutdown_signal = nullptr;
void signal_handler(int) {
    if (shutdown_signal)
        shutdown_signal->raise();
}

int main() {
    auto loaded = config::from_environment();
    if (!loaded.is_ok()) {
        echo::error("configuration error: ", loaded.error().message);
        return 2;
    }
    const Config cfg = std::move(loaded.value());

    echo::info("=== whoshome ===");
    for (const auto &d : cfg.devices) {
        echo::info("  ", d.name, " -> ", d.address_text());
    }
    echo::info("  broker ", cfg.mqtt.host, ":", cfg.mqtt.port, ", topics under ", cfg.topics.base, "/");

    CancelSignal cancel;
    if (cancel.fd() < 0) {
        echo::warn("eventfd unavailable, shutdown may take up to 100ms longer");
    }
    shutdown_signal = &cancel;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    AddressProber prober(cfg.interface_name);
    TopicScheme topics(cfg.topics);
    MqttClient mqtt(cfg.mqtt, topics.status_topic(), &cancel);

    auto connected = mqtt.connect();
    if (!connected.is_ok()) {
        // Not fatal: every publish reconnects on its own
        echo::warn("MQTT broker not reachable yet: ", connected.error().message);
    }

    Daemon daemon(cfg, prober, mqtt, cancel);
    int rc = daemon.run();

    shutdown_signal = nullptr;
    echo::info("Stopped.");
    return rc;
}
