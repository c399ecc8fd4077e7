// relay_core configuration and logging tests

#include <catch2/catch_test_macros.hpp>
#include <relay/core/config.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace relay_core;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // anonymous namespace

// =============================================================================
// config_from_json
// =============================================================================

TEST_CASE("Config: defaults from an empty document", "[core][config]") {
    auto config = config_from_json(nlohmann::json::object());

    REQUIRE(config.is_ok());
    REQUIRE(config->logging.console_enabled);
    REQUIRE_FALSE(config->logging.file_enabled);
    REQUIRE(config->logging.level == spdlog::level::info);
    REQUIRE(config->worker.name == "cascade-worker");
    REQUIRE_FALSE(config->worker.log_level.has_value());
}

TEST_CASE("Config: reads every section", "[core][config]") {
    nlohmann::json j = {
        {"logging", {
            {"level", "debug"},
            {"console", false},
            {"file", true},
            {"directory", "logs"},
            {"max_file_size", 4096},
            {"max_files", 2},
        }},
        {"worker", {
            {"name", "ui-router"},
            {"log_level", "trace"},
        }},
    };

    auto config = config_from_json(j);

    REQUIRE(config.is_ok());
    REQUIRE(config->logging.level == spdlog::level::debug);
    REQUIRE_FALSE(config->logging.console_enabled);
    REQUIRE(config->logging.file_enabled);
    REQUIRE(config->logging.log_directory == "logs");
    REQUIRE(config->logging.max_file_size == 4096);
    REQUIRE(config->logging.max_files == 2);
    REQUIRE(config->worker.name == "ui-router");
    REQUIRE(config->worker.log_level == spdlog::level::trace);
}

TEST_CASE("Config: rejects invalid values", "[core][config]") {
    SECTION("unknown level name") {
        auto config = config_from_json({{"logging", {{"level", "loud"}}}});
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(config.error().as<ConfigError>()->key == "logging.level");
    }

    SECTION("wrong type") {
        auto config = config_from_json({{"logging", {{"max_files", "many"}}}});
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("worker name not a string") {
        auto config = config_from_json({{"worker", {{"name", 3}}}});
        REQUIRE(config.is_err());
        REQUIRE(config.error().as<ConfigError>()->key == "worker.name");
    }

    SECTION("root not an object") {
        auto config = config_from_json(nlohmann::json::array());
        REQUIRE(config.is_err());
    }
}

TEST_CASE("Config: config_to_json round trip", "[core][config]") {
    RelayConfig saved;
    saved.logging.level = spdlog::level::warn;
    saved.worker.name = "net-router";
    saved.worker.log_level = spdlog::level::debug;

    auto restored = config_from_json(config_to_json(saved));

    REQUIRE(restored.is_ok());
    REQUIRE(restored->logging.level == spdlog::level::warn);
    REQUIRE(restored->worker.name == "net-router");
    REQUIRE(restored->worker.log_level == spdlog::level::debug);
}

// =============================================================================
// load_config
// =============================================================================

TEST_CASE("Config: load_config", "[core][config]") {
    SECTION("missing file") {
        auto config = load_config("/nonexistent/relay-config.json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::NotFound);
    }

    SECTION("malformed file") {
        auto path = write_temp("relay_test_malformed.json", "{ \"logging\": ");
        auto config = load_config(path);
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
        std::filesystem::remove(path);
    }

    SECTION("valid file") {
        auto path = write_temp("relay_test_valid.json", R"({"worker": {"name": "from-file"}})");
        auto config = load_config(path);
        REQUIRE(config.is_ok());
        REQUIRE(config->worker.name == "from-file");
        std::filesystem::remove(path);
    }
}

// =============================================================================
// Logging helpers
// =============================================================================

TEST_CASE("Logging: level names", "[core][log]") {
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE(std::string(log_level_name(spdlog::level::critical)) == "critical");
}

TEST_CASE("Logging: named loggers", "[core][log]") {
    auto a = get_logger("relay_test");
    auto b = get_logger("relay_test");
    REQUIRE(a == b);
    REQUIRE(cascade_logger()->name() == "cascade");
    REQUIRE(event_logger()->name() == "relay_event");
}

TEST_CASE("Logging: level override survives reconfiguration", "[core][log]") {
    set_logger_level("relay_test_override", spdlog::level::err);

    LogConfig config;
    config.level = spdlog::level::debug;
    configure_logging(config);

    REQUIRE(get_logger("relay_test_override")->level() == spdlog::level::err);
    REQUIRE(get_logger("relay_test")->level() == spdlog::level::debug);

    configure_logging(LogConfig{});
    REQUIRE(get_logger("relay_test")->level() == spdlog::level::info);
}

TEST_CASE("Logging: reconfigure while another thread logs", "[core][log][threads]") {
    set_logger_level("relay_test_busy", spdlog::level::trace);
    auto logger = get_logger("relay_test_busy");

    LogConfig quiet;
    quiet.console_enabled = false;
    configure_logging(quiet);

    std::atomic<bool> done{false};
    std::thread writer([&] {
        while (!done.load()) {
            logger->trace("tick");
        }
    });

    for (int i = 0; i < 100; ++i) {
        configure_logging(quiet);
    }
    done.store(true);
    writer.join();

    REQUIRE(get_logger("relay_test_busy") == logger);
    configure_logging(LogConfig{});
}
