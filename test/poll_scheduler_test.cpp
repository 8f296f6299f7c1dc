#include <doctest/doctest.h>
#include <whoshome/notify/dispatcher.hpp>
#include <whoshome/presence/poll_scheduler.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace whoshome;

namespace {

    // Returns one scripted row of outcomes per cycle and logs each call
    class ScriptedExecutor : public ProbeExecutor {
      public:
        dp::Vector<dp::Vector<ProbeOutcome>> rows;
        usize next_row = 0;
        u32 last_timeout = 0;
        dp::Vector<std::string> *log = nullptr;

        dp::Vector<ProbeOutcome> run(const dp::Vector<const Device *> &devices, u32 timeout_ms,
                                     const CancelSignal *) override {
            last_timeout = timeout_ms;
            if (log)
                log->push_back("probe");
            if (next_row < rows.size())
                return rows[next_row++];
            return dp::Vector<ProbeOutcome>(devices.size(), ProbeOutcome::Unreachable);
        }
    };

    class RecordingPublisher : public Publisher {
      public:
        bool fail = false;
        u32 calls = 0;
        Result<void> publish(const dp::String &, const dp::String &, bool) override {
            calls++;
            if (fail)
                return Result<void>::err(Error::not_connected());
            return {};
        }
    };

    constexpr ProbeOutcome R = ProbeOutcome::Reachable;
    constexpr ProbeOutcome U = ProbeOutcome::Unreachable;
    constexpr ProbeOutcome C = ProbeOutcome::Cancelled;
    constexpr ProbeOutcome S = ProbeOutcome::Skipped;

    // Devices named "slow*" sleep through their whole timeout; the rest answer
    class SlowFirstProber : public Prober {
      public:
        dp::String name() const override { return "slow-first"; }
        ProbeOutcome probe(const Device &device, u32 timeout_ms, const CancelSignal *) override {
            if (device.name.size() >= 4 && device.name[0] == 's' && device.name[1] == 'l') {
                std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
                return ProbeOutcome::Unreachable;
            }
            return ProbeOutcome::Reachable;
        }
    };

    // Uses up the timeout it is given, like a silent host
    class SilentProber : public Prober {
      public:
        dp::String name() const override { return "silent"; }
        ProbeOutcome probe(const Device &, u32 timeout_ms, const CancelSignal *) override {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return ProbeOutcome::Unreachable;
        }
    };

    dp::Vector<Device> two_devices() {
        Config cfg;
        cfg.device("alice", "192.168.1.20").device("bob", "192.168.1.21");
        return cfg.devices;
    }

} // namespace

TEST_CASE("PollScheduler timing") {
    auto devices = two_devices();
    DeviceTracker tracker(devices, Thresholds{1, 1});
    ScriptedExecutor exec;
    PollScheduler scheduler(tracker, exec, SchedulerConfig{}.interval(1000).timeout(200));

    SUBCASE("idle until started") {
        CHECK_FALSE(scheduler.running());
        CHECK_FALSE(scheduler.update(5000));
        CHECK(scheduler.cycles() == 0);
    }

    SUBCASE("first cycle immediately, then once per interval") {
        scheduler.start();
        CHECK(scheduler.update(0));
        CHECK(scheduler.cycles() == 1);
        CHECK(exec.last_timeout == 200);
        CHECK(scheduler.time_until_next_cycle() == 1000);
        CHECK_FALSE(scheduler.update(999));
        CHECK(scheduler.update(1));
        CHECK(scheduler.cycles() == 2);
        CHECK(scheduler.now() == 1000);
    }

    SUBCASE("stop halts cycles") {
        scheduler.start();
        scheduler.update(0);
        scheduler.stop();
        CHECK_FALSE(scheduler.update(10000));
        CHECK(scheduler.cycles() == 1);
    }

    SUBCASE("a timeout not below the interval is clamped") {
        PollScheduler clamped(tracker, exec, SchedulerConfig{}.interval(1000).timeout(5000));
        CHECK(clamped.config().timeout_ms == 999);
    }

    SUBCASE("a zero interval falls back to the default") {
        PollScheduler fixed(tracker, exec, SchedulerConfig{}.interval(0).timeout(200));
        CHECK(fixed.config().interval_ms == DEFAULT_POLL_INTERVAL_MS);
        fixed.start();
        CHECK(fixed.update(0));
        CHECK_FALSE(fixed.update(DEFAULT_POLL_INTERVAL_MS - 1));
        CHECK(fixed.update(1));
        CHECK(fixed.cycles() == 2);
    }
}

TEST_CASE("PollScheduler applies results and emits events") {
    auto devices = two_devices();
    DeviceTracker tracker(devices, Thresholds{1, 2});
    ScriptedExecutor exec;
    PollScheduler scheduler(tracker, exec, SchedulerConfig{}.interval(1000).timeout(100));

    dp::Vector<std::string> log;
    exec.log = &log;
    scheduler.on_transition.subscribe([&](const TransitionEvent &ev) {
        log.push_back(std::string(ev.device.c_str()) + "=" + status_name(ev.status));
    });
    scheduler.on_cycle.subscribe([&](const CycleReport &r) { log.push_back("cycle " + std::to_string(r.cycle)); });

    SUBCASE("events in device order, before the cycle report and the next probes") {
        exec.rows = {{R, R}, {U, R}, {U, U}};
        scheduler.start();
        scheduler.update(0);
        scheduler.update(1000);
        scheduler.update(1000);

        dp::Vector<std::string> expected = {"probe", "alice=present", "bob=present", "cycle 1",
                                            "probe", "cycle 2",
                                            "probe", "alice=absent", "cycle 3"};
        REQUIRE(log.size() == expected.size());
        for (usize i = 0; i < expected.size(); ++i) {
            CHECK(log[i] == expected[i]);
        }
        CHECK(tracker.status("bob").value() == Status::Present);
        CHECK(tracker.state("bob")->consecutive_misses == 1);
    }

    SUBCASE("timestamps come from scheduler time") {
        exec.rows = {{U, U}, {R, U}};
        TimestampMs stamped = 0;
        scheduler.on_transition.subscribe([&](const TransitionEvent &ev) { stamped = ev.timestamp_ms; });
        scheduler.start();
        scheduler.update(0);
        scheduler.update(1500);
        CHECK(stamped == 1500);
    }

    SUBCASE("cycle report counts") {
        exec.rows = {{R, C}};
        CycleReport last;
        scheduler.on_cycle.subscribe([&](const CycleReport &r) { last = r; });
        scheduler.start();
        scheduler.update(0);
        CHECK(last.cycle == 1);
        CHECK(last.reachable == 1);
        CHECK(last.cancelled == 1);
        CHECK(last.transitions == 1);
    }

    SUBCASE("skipped outcomes leave state untouched") {
        exec.rows = {{R, R}, {S, U}};
        CycleReport last;
        scheduler.on_cycle.subscribe([&](const CycleReport &r) { last = r; });
        scheduler.start();
        scheduler.update(0);
        scheduler.update(1000);
        CHECK(last.skipped == 1);
        CHECK(last.unreachable == 1);
        CHECK(tracker.state("alice")->probes_recorded == 1);
        CHECK(tracker.state("alice")->consecutive_misses == 0);
        CHECK(tracker.state("bob")->consecutive_misses == 1);
    }
}

TEST_CASE("Device queued behind slow hosts keeps its state") {
    Config cfg;
    cfg.device("slow1", "192.168.1.30").device("slow2", "192.168.1.31").device("alice", "192.168.1.20");
    DeviceTracker tracker(cfg.devices, Thresholds{1, 1});
    SlowFirstProber prober;
    ThreadedProbeExecutor exec(prober, 1);
    PollScheduler scheduler(tracker, exec, SchedulerConfig{}.interval(1000).timeout(50));

    tracker.record_probe("alice", true, 0);
    REQUIRE(tracker.status("alice").value() == Status::Present);

    auto report = scheduler.run_cycle(1000);
    CHECK(report.skipped >= 1);
    CHECK(report.transitions == 0);
    CHECK(tracker.status("alice").value() == Status::Present);
    CHECK(tracker.state("alice")->consecutive_misses == 0);
}

TEST_CASE("A timeout counts exactly like an explicit miss") {
    Config cfg;
    cfg.device("alice", "192.168.1.20").device("bob", "192.168.1.21");
    const Thresholds thresholds{2, 3};

    DeviceTracker probed(cfg.devices, thresholds);
    DeviceTracker reported(cfg.devices, thresholds);
    for (const auto &d : cfg.devices) {
        probed.record_probe(d, true, 0);
        probed.record_probe(d, true, 0);
        reported.record_probe(d, true, 0);
        reported.record_probe(d, true, 0);
    }

    SilentProber prober;
    ThreadedProbeExecutor exec(prober, 4);
    PollScheduler scheduler(probed, exec, SchedulerConfig{}.interval(1000).timeout(30));

    for (TimestampMs now = 1000; now <= 4000; now += 1000) {
        scheduler.run_cycle(now);
        for (const auto &d : cfg.devices)
            reported.record_probe(d, false, now);
    }

    for (const auto &d : cfg.devices) {
        const DeviceState *a = probed.state(d.name);
        const DeviceState *b = reported.state(d.name);
        REQUIRE(a != nullptr);
        REQUIRE(b != nullptr);
        CHECK(a->status == Status::Absent);
        CHECK(a->status == b->status);
        CHECK(a->consecutive_hits == b->consecutive_hits);
        CHECK(a->consecutive_misses == b->consecutive_misses);
        CHECK(a->last_change_ms == b->last_change_ms);
        CHECK(a->probes_recorded == b->probes_recorded);
    }
}

TEST_CASE("PollScheduler cancellation") {
    auto devices = two_devices();
    DeviceTracker tracker(devices, Thresholds{1, 1});
    ScriptedExecutor exec;
    CancelSignal cancel;
    PollScheduler scheduler(tracker, exec, SchedulerConfig{}.interval(1000).timeout(100), &cancel);

    SUBCASE("cancelled outcomes are not recorded") {
        exec.rows = {{C, R}};
        scheduler.start();
        scheduler.update(0);
        CHECK(tracker.state("alice")->probes_recorded == 0);
        CHECK(tracker.state("bob")->probes_recorded == 1);
        CHECK(tracker.status("bob").value() == Status::Present);
    }

    SUBCASE("no cycle starts once cancel is raised") {
        scheduler.start();
        scheduler.update(0);
        cancel.raise();
        CHECK_FALSE(scheduler.update(1000));
        CHECK(scheduler.cycles() == 1);
    }
}

TEST_CASE("PollScheduler discards a malformed executor result") {
    auto devices = two_devices();
    DeviceTracker tracker(devices, Thresholds{1, 1});
    ScriptedExecutor exec;
    exec.rows = {{R}};
    PollScheduler scheduler(tracker, exec, SchedulerConfig{}.interval(1000).timeout(100));
    auto report = scheduler.run_cycle(0);
    CHECK(report.transitions == 0);
    CHECK(tracker.state("alice")->probes_recorded == 0);
}

TEST_CASE("Publish failure does not affect device state") {
    auto run = [](bool fail) {
        auto devices = two_devices();
        DeviceTracker tracker(devices, Thresholds{2, 2});
        ScriptedExecutor exec;
        exec.rows = {{R, U}, {R, R}, {U, R}, {U, R}, {R, U}};
        PollScheduler scheduler(tracker, exec, SchedulerConfig{}.interval(1000).timeout(100));
        RecordingPublisher publisher;
        publisher.fail = fail;
        NotificationDispatcher dispatcher(publisher, TopicScheme{});
        dispatcher.attach(scheduler);

        scheduler.start();
        for (int i = 0; i < 5; ++i)
            scheduler.update(i == 0 ? 0 : 1000);

        dp::Vector<DeviceState> states;
        for (usize i = 0; i < tracker.size(); ++i)
            states.push_back(tracker.state_at(i));
        CHECK(publisher.calls == 3);
        CHECK(dispatcher.stats().dropped == (fail ? 3u : 0u));
        return states;
    };

    auto ok = run(false);
    auto failing = run(true);
    REQUIRE(ok.size() == failing.size());
    for (usize i = 0; i < ok.size(); ++i) {
        CHECK(ok[i].status == failing[i].status);
        CHECK(ok[i].consecutive_hits == failing[i].consecutive_hits);
        CHECK(ok[i].consecutive_misses == failing[i].consecutive_misses);
        CHECK(ok[i].last_change_ms == failing[i].last_change_ms);
    }
}
