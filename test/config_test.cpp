#include <doctest/doctest.h>
#include <whoshome/config/environment.hpp>
#include <whoshome/core/config.hpp>

#include <map>
#include <string>

using namespace whoshome;

namespace {

    // Environment stand-in: only the given variables are set
    config::EnvLookup fake_env(std::map<std::string, std::string> vars) {
        return [vars](const char *name) -> dp::Optional<dp::String> {
            auto it = vars.find(name);
            if (it == vars.end())
                return dp::nullopt;
            return dp::String(it->second.c_str());
        };
    }

    Config valid_config() {
        Config cfg;
        cfg.device("alice", "192.168.1.20").device("bob", "192.168.1.21:62078").broker("127.0.0.1");
        return cfg;
    }

} // namespace

TEST_CASE("Config defaults") {
    Config cfg;
    CHECK(cfg.poll_interval_ms == 30000);
    CHECK(cfg.probe_timeout_ms == 2000);
    CHECK(cfg.thresholds.hit == 1);
    CHECK(cfg.thresholds.miss == 5);
    CHECK(cfg.max_parallel_probes == 16);
    CHECK(cfg.refresh_interval_ms == 0);
    CHECK(cfg.mqtt.port == 1883);
    CHECK(cfg.mqtt.client_id == "whoshome");
    CHECK(cfg.mqtt.publish_attempts == 3);
    CHECK(cfg.topics.base == "whoshome");
    CHECK(cfg.topics.household == "household");
    CHECK(cfg.topics.present_payload == "home");
    CHECK(cfg.topics.absent_payload == "away");
}

TEST_CASE("Config::validate") {
    SUBCASE("valid") {
        auto cfg = valid_config();
        CHECK(cfg.validate().is_ok());
        REQUIRE(cfg.find_device("bob") != nullptr);
        CHECK(cfg.find_device("bob")->address.port == 62078);
        CHECK(cfg.find_device("carol") == nullptr);
    }

    SUBCASE("empty device list") {
        Config cfg;
        cfg.broker("127.0.0.1");
        auto r = cfg.validate();
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidConfig);
    }

    SUBCASE("bad address") {
        auto cfg = valid_config();
        cfg.device("carol", "not-an-address");
        CHECK(cfg.validate().is_err());
    }

    SUBCASE("duplicate name") {
        auto cfg = valid_config();
        cfg.device("alice", "192.168.1.40");
        CHECK(cfg.validate().is_err());
    }

    SUBCASE("names that map to the same topic") {
        auto cfg = valid_config();
        cfg.device("Alice", "192.168.1.40");
        auto r = cfg.validate();
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidConfig);
    }

    SUBCASE("name that maps to the status topic") {
        auto cfg = valid_config();
        cfg.device("Status", "192.168.1.40");
        auto r = cfg.validate();
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidConfig);
    }

    SUBCASE("name that maps to the household topic") {
        auto cfg = valid_config();
        cfg.device("household", "192.168.1.40");
        CHECK(cfg.validate().is_err());

        cfg.topics.household = "family";
        CHECK(cfg.validate().is_ok());
        cfg.device("Family", "192.168.1.41");
        CHECK(cfg.validate().is_err());
    }

    SUBCASE("household leaf is free to use when the aggregate is off") {
        auto cfg = valid_config();
        cfg.topics.household = "";
        cfg.device("household", "192.168.1.40");
        CHECK(cfg.validate().is_ok());
    }

    SUBCASE("zero thresholds") {
        auto cfg = valid_config();
        cfg.hysteresis(0, 3);
        CHECK(cfg.validate().is_err());
        cfg.hysteresis(2, 0);
        CHECK(cfg.validate().is_err());
        cfg.hysteresis(2, 3);
        CHECK(cfg.validate().is_ok());
    }

    SUBCASE("timeout must stay inside the interval") {
        auto cfg = valid_config();
        cfg.interval(1000).timeout(1000);
        CHECK(cfg.validate().is_err());
        cfg.timeout(0);
        CHECK(cfg.validate().is_err());
        cfg.timeout(999);
        CHECK(cfg.validate().is_ok());
        cfg.interval(0);
        CHECK(cfg.validate().is_err());
    }

    SUBCASE("missing broker") {
        Config cfg;
        cfg.device("alice", "192.168.1.20");
        CHECK(cfg.validate().is_err());
    }

    SUBCASE("zero parallelism and attempts") {
        auto cfg = valid_config();
        cfg.parallel(0);
        CHECK(cfg.validate().is_err());
        cfg.parallel(4);
        cfg.mqtt.attempts(0);
        CHECK(cfg.validate().is_err());
    }
}

TEST_CASE("parse_device_list") {
    SUBCASE("mixed kinds with whitespace") {
        auto r = config::parse_device_list(" alice=192.168.1.20 , bob = 192.168.1.21:62078,carol=aa:bb:cc:dd:ee:ff,");
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 3);
        CHECK(r.value()[0].name == "alice");
        CHECK(r.value()[1].name == "bob");
        CHECK(r.value()[1].address.kind == AddressKind::Ipv4Port);
        CHECK(r.value()[2].address.kind == AddressKind::Mac);
    }

    SUBCASE("missing separator") {
        CHECK(config::parse_device_list("alice").is_err());
    }

    SUBCASE("bad name or address") {
        CHECK(config::parse_device_list("=192.168.1.20").is_err());
        CHECK(config::parse_device_list("a/b=192.168.1.20").is_err());
        CHECK(config::parse_device_list("alice=192.168.1.300").is_err());
    }
}

TEST_CASE("parse_u32") {
    CHECK(config::parse_u32("X", "42").value() == 42);
    CHECK(config::parse_u32("X", " 7 ").value() == 7);
    CHECK(config::parse_u32("X", "").is_err());
    CHECK(config::parse_u32("X", "-1").is_err());
    CHECK(config::parse_u32("X", "12ms").is_err());
    CHECK(config::parse_u32("X", "4294967296").is_err());
    CHECK(config::parse_u16("X", "65536").is_err());
}

TEST_CASE("from_environment") {
    SUBCASE("minimal") {
        auto r = config::from_environment(
            fake_env({{"WHOSHOME_DEVICES", "alice=192.168.1.20"}, {"MQTT_BROKER", "broker.lan"}}));
        REQUIRE(r.is_ok());
        const Config &cfg = r.value();
        CHECK(cfg.devices.size() == 1);
        CHECK(cfg.mqtt.host == "broker.lan");
        CHECK(cfg.mqtt.port == 1883);
        CHECK(cfg.poll_interval_ms == 30000);
        CHECK(cfg.topics.household == "household");
    }

    SUBCASE("everything set") {
        auto r = config::from_environment(fake_env({
            {"WHOSHOME_DEVICES", "alice=192.168.1.20,bob=aa:bb:cc:dd:ee:ff"},
            {"WHOSHOME_POLL_INTERVAL_MS", "10000"},
            {"WHOSHOME_PROBE_TIMEOUT_MS", "1500"},
            {"WHOSHOME_HIT_THRESHOLD", "2"},
            {"WHOSHOME_MISS_THRESHOLD", "3"},
            {"WHOSHOME_MAX_PARALLEL", "4"},
            {"WHOSHOME_INTERFACE", "eth0"},
            {"WHOSHOME_REFRESH_INTERVAL_MS", "600000"},
            {"MQTT_BROKER", "10.0.0.2"},
            {"MQTT_PORT", "8883"},
            {"MQTT_CLIENT", "presence"},
            {"MQTT_USERNAME", "user"},
            {"MQTT_PASSWORD", "secret"},
            {"MQTT_TOPIC", "home/presence"},
            {"MQTT_KEEPALIVE_S", "30"},
            {"MQTT_PUBLISH_ATTEMPTS", "5"},
            {"WHOSHOME_PRESENT_PAYLOAD", "on"},
            {"WHOSHOME_ABSENT_PAYLOAD", "off"},
            {"WHOSHOME_HOUSEHOLD_TOPIC", ""},
        }));
        REQUIRE(r.is_ok());
        const Config &cfg = r.value();
        CHECK(cfg.devices.size() == 2);
        CHECK(cfg.poll_interval_ms == 10000);
        CHECK(cfg.probe_timeout_ms == 1500);
        CHECK(cfg.thresholds.hit == 2);
        CHECK(cfg.thresholds.miss == 3);
        CHECK(cfg.max_parallel_probes == 4);
        CHECK(cfg.interface_name == "eth0");
        CHECK(cfg.refresh_interval_ms == 600000);
        CHECK(cfg.mqtt.port == 8883);
        CHECK(cfg.mqtt.client_id == "presence");
        CHECK(cfg.mqtt.username == "user");
        CHECK(cfg.mqtt.password == "secret");
        CHECK(cfg.mqtt.keepalive_s == 30);
        CHECK(cfg.mqtt.publish_attempts == 5);
        CHECK(cfg.topics.base == "home/presence");
        CHECK(cfg.topics.present_payload == "on");
        CHECK(cfg.topics.absent_payload == "off");
        CHECK(cfg.topics.household.empty());
    }

    SUBCASE("missing required variables") {
        CHECK(config::from_environment(fake_env({{"MQTT_BROKER", "b"}})).is_err());
        CHECK(config::from_environment(fake_env({{"WHOSHOME_DEVICES", "a=192.168.1.2"}})).is_err());
        CHECK(config::from_environment(fake_env({{"WHOSHOME_DEVICES", " "}, {"MQTT_BROKER", "b"}})).is_err());
    }

    SUBCASE("malformed numbers and invalid combinations") {
        auto base = std::map<std::string, std::string>{{"WHOSHOME_DEVICES", "a=192.168.1.2"}, {"MQTT_BROKER", "b"}};

        auto bad_number = base;
        bad_number["WHOSHOME_MISS_THRESHOLD"] = "three";
        auto r = config::from_environment(fake_env(bad_number));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidConfig);

        auto zero_hit = base;
        zero_hit["WHOSHOME_HIT_THRESHOLD"] = "0";
        CHECK(config::from_environment(fake_env(zero_hit)).is_err());

        auto slow_probe = base;
        slow_probe["WHOSHOME_POLL_INTERVAL_MS"] = "1000";
        slow_probe["WHOSHOME_PROBE_TIMEOUT_MS"] = "2000";
        CHECK(config::from_environment(fake_env(slow_probe)).is_err());

        auto bad_port = base;
        bad_port["MQTT_PORT"] = "70000";
        CHECK(config::from_environment(fake_env(bad_port)).is_err());
    }
}
