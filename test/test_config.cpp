#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>

#include <knotstore/common/config.hpp>
#include <knotstore/common/error.hpp>
#include <knotstore/common/logger.hpp>

using namespace knotstore;

TEST_CASE("Configuration loading") {
    SUBCASE("Defaults are valid") {
        NodeConfig defaults;
        CHECK(ConfigLoader::validate(defaults).is_ok());
        CHECK(defaults.events.socket.port == 28333);
        CHECK(defaults.events.webhook.retry_attempts == 3);
        CHECK(defaults.health.max_storage_failures == 3);
    }

    SUBCASE("Keys override defaults") {
        auto parsed = ConfigLoader::parse(R"(
# node identity
node.network = regtest
node.id = node-a

storage.path = /tmp/knot/ledger.db
storage.sync_mode = full
storage.read_connections = 2
mempool.max_bytes = 1048576

events.enabled_publishers = socket, webhook
events.socket.port = 29000
events.socket.topics = block,chain
events.webhook.endpoints = http://a.local/hook, http://b.local/hook
events.webhook.retry_attempts = 5
)");
        REQUIRE(parsed.is_ok());
        const auto &cfg = parsed.value();
        CHECK(cfg.network == "regtest");
        CHECK(cfg.node_id == "node-a");
        CHECK(cfg.storage.path == "/tmp/knot/ledger.db");
        CHECK(cfg.storage.sync_mode == "full");
        CHECK(cfg.storage.read_connections == 2);
        CHECK(cfg.mempool.max_bytes == 1048576);
        CHECK(cfg.events.isEnabled("socket"));
        CHECK(cfg.events.isEnabled("webhook"));
        CHECK_FALSE(cfg.events.isEnabled("cluster"));
        CHECK(cfg.events.socket.port == 29000);
        REQUIRE(cfg.events.socket.topics.size() == 2);
        CHECK(cfg.events.socket.topics[1] == "chain");
        REQUIRE(cfg.events.webhook.endpoints.size() == 2);
        CHECK(cfg.events.webhook.endpoints[1] == "http://b.local/hook");
        CHECK(cfg.events.webhook.retry_attempts == 5);
    }

    SUBCASE("Unknown key is InvalidConfig") {
        auto parsed = ConfigLoader::parse("storage.colour = blue\n");
        REQUIRE(parsed.is_err());
        CHECK(is_error(parsed.error(), ERR_INVALID_CONFIG));
    }

    SUBCASE("Malformed values are InvalidConfig") {
        CHECK(ConfigLoader::parse("mempool.max_bytes = lots\n").is_err());
        CHECK(ConfigLoader::parse("health.max_storage_failures = -1\n").is_err());
        CHECK(ConfigLoader::parse("just some words\n").is_err());
    }

    SUBCASE("Values too large for their field are InvalidConfig") {
        auto port = ConfigLoader::parse("events.socket.port = 70000\n");
        REQUIRE(port.is_err());
        CHECK(is_error(port.error(), ERR_INVALID_CONFIG));

        CHECK(ConfigLoader::parse("storage.busy_timeout_ms = 2147483648\n").is_err());
        CHECK(ConfigLoader::parse("storage.cache_size_kb = 4294967296\n").is_err());
        CHECK(ConfigLoader::parse("events.webhook.retry_attempts = 4294967296\n").is_err());
        CHECK(ConfigLoader::parse("mempool.max_bytes = 99999999999999999999999\n").is_err());

        auto edge = ConfigLoader::parse("events.socket.port = 65535\nstorage.busy_timeout_ms = 2147483647\n");
        REQUIRE(edge.is_ok());
        CHECK(edge.value().events.socket.port == 65535);
        CHECK(edge.value().storage.busy_timeout_ms == 2147483647);
    }

    SUBCASE("Cross-field validation") {
        auto no_endpoints = ConfigLoader::parse("events.enabled_publishers = webhook\n");
        REQUIRE(no_endpoints.is_err());
        CHECK(is_error(no_endpoints.error(), ERR_INVALID_CONFIG));

        CHECK(ConfigLoader::parse("events.enabled_publishers = carrier-pigeon\n").is_err());
        CHECK(ConfigLoader::parse("storage.sync_mode = sometimes\n").is_err());
        CHECK(ConfigLoader::parse("coordinator.mailbox_capacity = 0\n").is_err());
    }

    SUBCASE("Loading from a file") {
        const std::string path = "test_knotstore.conf";
        {
            std::ofstream out(path);
            out << "node.network = testnet\nlogging.level = debug\n";
        }
        auto loaded = ConfigLoader::loadFile(path);
        std::filesystem::remove(path);
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().network == "testnet");
        CHECK(loaded.value().logging.level == "debug");

        CHECK(ConfigLoader::loadFile("does-not-exist.conf").is_err());
    }
}

TEST_CASE("Logger") {
    SUBCASE("Level names parse case-insensitively with a fallback") {
        CHECK(Logger::parseLevel("debug") == LogLevel::DEBUG);
        CHECK(Logger::parseLevel("WARN") == LogLevel::WARN);
        CHECK(Logger::parseLevel("nonsense", LogLevel::ERROR) == LogLevel::ERROR);
        CHECK(std::string(Logger::levelName(LogLevel::ERROR)) == "ERROR");
    }

    SUBCASE("Entries below the level are filtered") {
        auto previous = Logger::getLevel();
        Logger::enableConsole(false);
        Logger::setLevel(LogLevel::WARN);

        auto before = Logger::getLogCount();
        KNOTSTORE_LOG_INFO("test", "filtered");
        KNOTSTORE_LOG_WARN("test", "kept");
        KNOTSTORE_LOG_ERROR("test", "kept too");
        CHECK(Logger::getLogCount() - before == 2);

        Logger::setLevel(previous);
        Logger::enableConsole(true);
    }

    SUBCASE("File output") {
        const std::string path = "test_knotstore.log";
        std::filesystem::remove(path);
        Logger::enableConsole(false);
        REQUIRE(Logger::init(path));
        KNOTSTORE_LOG_ERROR("storage", "written to file");
        Logger::shutdown();
        Logger::enableConsole(true);

        std::ifstream in(path);
        std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        CHECK(contents.find("written to file") != std::string::npos);
        CHECK(contents.find("storage") != std::string::npos);
        std::filesystem::remove(path);
    }
}
