#include <doctest/doctest.h>

// Include the master header to verify all headers compile together
#include <whoshome.hpp>

#include <string>

TEST_CASE("All headers compile") {
    // If this compiles, all headers are syntactically valid
    CHECK(true);
}

TEST_CASE("Core types available") {
    whoshome::Status s = whoshome::Status::Absent;
    whoshome::ProbeOutcome o = whoshome::ProbeOutcome::Cancelled;
    CHECK(s == whoshome::Status::Absent);
    CHECK(std::string(whoshome::status_name(whoshome::Status::Present)) == "present");
    CHECK(std::string(whoshome::outcome_name(o)) == "cancelled");
}

TEST_CASE("Config constructible") {
    whoshome::Config cfg;
    cfg.device("alice", "192.168.1.20").broker("localhost");
    CHECK(cfg.validate().is_ok());
}

TEST_CASE("Daemon wires up and stops on cancel") {
    class NeverProber : public whoshome::Prober {
      public:
        dp::String name() const override { return "never"; }
        whoshome::ProbeOutcome probe(const whoshome::Device &, whoshome::u32, const whoshome::CancelSignal *) override {
            return whoshome::ProbeOutcome::Unreachable;
        }
    };
    class NullPublisher : public whoshome::Publisher {
      public:
        bool closed = false;
        whoshome::Result<void> publish(const dp::String &, const dp::String &, bool) override {
            return {};
        }
        void close() override { closed = true; }
    };

    whoshome::Config cfg;
    cfg.device("alice", "192.168.1.20").broker("localhost");
    NeverProber prober;
    NullPublisher publisher;
    whoshome::CancelSignal cancel;
    cancel.raise();

    whoshome::Daemon daemon(cfg, prober, publisher, cancel);
    CHECK(daemon.run() == 0);
    CHECK(publisher.closed);
    CHECK(daemon.tracker().size() == 1);
}
