#include <whoshome.hpp>
#include <echo/echo.hpp>

using namespace whoshome;

// Plays back a fixed reachability script per device, one step per cycle.
// No network needed: shows the hysteresis and the messages it produces.
class ScriptedProber : public Prober {
    struct Script {
        dp::String device;
        dp::String steps; // '1' reachable, '0' unreachable
    };
    dp::Vector<Script> scripts_;
    usize step_ = 0;

  public:
    void script(dp::String device, dp::String steps) { scripts_.push_back({std::move(device), std::move(steps)}); }
    void next_cycle() { step_++; }

    dp::String name() const override { return "scripted"; }

    ProbeOutcome probe(const Device &device, u32, const CancelSignal *) override {
        for (const auto &s : scripts_) {
            if (s.device == device.name && step_ < s.steps.size()) {
                return s.steps[step_] == '1' ? ProbeOutcome::Reachable : ProbeOutcome::Unreachable;
            }
        }
        return ProbeOutcome::Unreachable;
    }
};

// Prints every message and refuses one in `fail_every` to show dropped publishes
class ConsolePublisher : public Publisher {
    u32 fail_every_;
    u32 count_ = 0;

  public:
    explicit ConsolePublisher(u32 fail_every) : fail_every_(fail_every) {}

    Result<void> publish(const dp::String &topic, const dp::String &payload, bool retained) override {
        count_++;
        if (fail_every_ > 0 && count_ % fail_every_ == 0) {
            return Result<void>::err(Error::not_connected());
        }
        echo::info("  MQTT ", topic, " = ", payload, retained ? " (retained)" : "");
        return {};
    }
};

int main() {
    echo::info("=== whoshome simulation ===");

    Config cfg;
    cfg.device("alice", "192.168.1.20")
        .device("bob", "192.168.1.21:62078")
        .device("carol", "aa:bb:cc:dd:ee:ff")
        .interval(30000)
        .timeout(2000)
        .hysteresis(2, 3)
        .broker("localhost")
        .refresh(300000);

    auto valid = cfg.validate();
    if (!valid.is_ok()) {
        echo::error("invalid config: ", valid.error().message);
        return 2;
    }

    ScriptedProber prober;
    prober.script("alice", "011111110001111111000000");
    prober.script("bob", "111111111111000000000000");
    prober.script("carol", "010101010101010101010101");

    ConsolePublisher publisher(7);
    SequentialProbeExecutor executor(prober);
    DeviceTracker tracker(cfg.devices, cfg.thresholds);
    PollScheduler scheduler(tracker, executor,
                            SchedulerConfig{}.interval(cfg.poll_interval_ms).timeout(cfg.probe_timeout_ms));
    HouseholdMonitor household(tracker);
    NotificationDispatcher dispatcher(publisher, TopicScheme(cfg.topics), cfg.refresh_interval_ms);

    dispatcher.attach(scheduler);
    household.attach(scheduler);
    dispatcher.attach(household);

    scheduler.on_transition.subscribe([](const TransitionEvent &ev) {
        echo::info("t=", ev.timestamp_ms / 1000, "s ", ev.device, " is now ", status_name(ev.status));
    });
    household.on_change.subscribe([](const HouseholdEvent &ev) {
        echo::info("t=", ev.timestamp_ms / 1000, "s household ", status_name(ev.status), " (", ev.present, "/",
                   ev.total, ")");
    });

    scheduler.start();
    scheduler.update(0);
    for (int cycle = 1; cycle < 24; ++cycle) {
        prober.next_cycle();
        scheduler.update(cfg.poll_interval_ms);
        dispatcher.update(cfg.poll_interval_ms);
    }

    const auto &stats = dispatcher.stats();
    echo::info("cycles: ", scheduler.cycles(), ", published: ", stats.published, ", dropped: ", stats.dropped,
               ", refreshes: ", stats.refreshes);
    for (usize i = 0; i < tracker.size(); ++i) {
        echo::info("  ", tracker.device_at(i).name, ": ", status_name(tracker.state_at(i).status));
    }
    return 0;
}
