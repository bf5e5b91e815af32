#include <knotstore/common/config.hpp>
#include <knotstore/common/error.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace knotstore {

    namespace {

        std::string trim(const std::string &s) {
            auto begin = s.find_first_not_of(" \t\r");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r");
            return s.substr(begin, end - begin + 1);
        }

        std::vector<std::string> splitList(const std::string &value) {
            std::vector<std::string> out;
            std::stringstream ss(value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                item = trim(item);
                if (!item.empty())
                    out.push_back(item);
            }
            return out;
        }

        bool parseBool(const std::string &value) { return value == "true" || value == "1" || value == "yes"; }

        std::uint64_t parseUnsigned(const std::string &key, const std::string &value) {
            if (value.empty() || value[0] == '-')
                throw std::invalid_argument("expected non-negative integer for " + key);
            std::size_t used = 0;
            std::uint64_t v = std::stoull(value, &used);
            if (used != value.size())
                throw std::invalid_argument("expected non-negative integer for " + key);
            return v;
        }

        /// parseUnsigned, rejecting values the target field cannot hold
        template <typename T> T parseBounded(const std::string &key, const std::string &value) {
            std::uint64_t v = parseUnsigned(key, value);
            if (v > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
                throw std::invalid_argument("value out of range for " + key + ": " + value);
            return static_cast<T>(v);
        }

        void applyKey(NodeConfig &cfg, const std::string &key, const std::string &value) {
            if (key == "node.network")
                cfg.network = value;
            else if (key == "node.id")
                cfg.node_id = value;
            else if (key == "storage.path")
                cfg.storage.path = value;
            else if (key == "storage.wal")
                cfg.storage.enable_wal = parseBool(value);
            else if (key == "storage.busy_timeout_ms")
                cfg.storage.busy_timeout_ms = parseBounded<std::int32_t>(key, value);
            else if (key == "storage.cache_size_kb")
                cfg.storage.cache_size_kb = parseBounded<std::int32_t>(key, value);
            else if (key == "storage.sync_mode")
                cfg.storage.sync_mode = value;
            else if (key == "storage.read_connections")
                cfg.storage.read_connections = parseBounded<std::uint32_t>(key, value);
            else if (key == "storage.backup_path")
                cfg.storage.backup_path = value;
            else if (key == "mempool.max_bytes")
                cfg.mempool.max_bytes = parseUnsigned(key, value);
            else if (key == "coordinator.mailbox_capacity")
                cfg.coordinator.mailbox_capacity = parseBounded<std::size_t>(key, value);
            else if (key == "health.max_storage_failures")
                cfg.health.max_storage_failures = parseBounded<std::uint32_t>(key, value);
            else if (key == "events.enabled_publishers")
                cfg.events.enabled_publishers = splitList(value);
            else if (key == "events.queue_capacity")
                cfg.events.queue_capacity = parseBounded<std::size_t>(key, value);
            else if (key == "events.lane_capacity")
                cfg.events.lane_capacity = parseBounded<std::size_t>(key, value);
            else if (key == "events.socket.host")
                cfg.events.socket.host = value;
            else if (key == "events.socket.port")
                cfg.events.socket.port = parseBounded<std::uint16_t>(key, value);
            else if (key == "events.socket.topics")
                cfg.events.socket.topics = splitList(value);
            else if (key == "events.socket.send_buffer_messages")
                cfg.events.socket.send_buffer_messages = parseBounded<std::size_t>(key, value);
            else if (key == "events.cluster.api_url")
                cfg.events.cluster.api_url = value;
            else if (key == "events.cluster.namespace")
                cfg.events.cluster.namespace_name = value;
            else if (key == "events.cluster.node_name")
                cfg.events.cluster.node_name = value;
            else if (key == "events.cluster.event_types")
                cfg.events.cluster.event_types = splitList(value);
            else if (key == "events.cluster.token")
                cfg.events.cluster.token = value;
            else if (key == "events.cluster.timeout_secs")
                cfg.events.cluster.timeout_secs = parseBounded<std::uint32_t>(key, value);
            else if (key == "events.webhook.endpoints")
                cfg.events.webhook.endpoints = splitList(value);
            else if (key == "events.webhook.timeout_secs")
                cfg.events.webhook.timeout_secs = parseBounded<std::uint32_t>(key, value);
            else if (key == "events.webhook.retry_attempts")
                cfg.events.webhook.retry_attempts = parseBounded<std::uint32_t>(key, value);
            else if (key == "events.webhook.backoff_ms")
                cfg.events.webhook.backoff_ms = parseBounded<std::uint32_t>(key, value);
            else if (key == "logging.level")
                cfg.logging.level = value;
            else if (key == "logging.file")
                cfg.logging.file = value;
            else if (key == "logging.max_file_size_mb")
                cfg.logging.max_file_size_mb = parseUnsigned(key, value);
            else if (key == "logging.max_files")
                cfg.logging.max_files = parseBounded<std::uint32_t>(key, value);
            else
                throw std::invalid_argument("unknown configuration key: " + key);
        }

    } // namespace

    bool EventsConfig::isEnabled(const std::string &publisher) const {
        return std::find(enabled_publishers.begin(), enabled_publishers.end(), publisher) != enabled_publishers.end();
    }

    dp::Result<NodeConfig, dp::Error> ConfigLoader::loadFile(const std::string &path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return dp::Result<NodeConfig, dp::Error>::err(
                dp::Error::not_found(dp::String(("cannot open config file: " + path).c_str())));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    }

    dp::Result<NodeConfig, dp::Error> ConfigLoader::parse(const std::string &text) {
        NodeConfig cfg;
        std::stringstream ss(text);
        std::string line;
        std::size_t line_no = 0;

        while (std::getline(ss, line)) {
            ++line_no;
            line = trim(line);
            if (line.empty() || line[0] == '#')
                continue;

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                return dp::Result<NodeConfig, dp::Error>::err(invalid_config(
                    dp::String(("line " + std::to_string(line_no) + ": expected key = value").c_str())));
            }

            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            try {
                applyKey(cfg, key, value);
            } catch (const std::exception &e) {
                return dp::Result<NodeConfig, dp::Error>::err(
                    invalid_config(dp::String(("line " + std::to_string(line_no) + ": " + e.what()).c_str())));
            }
        }

        auto valid = validate(cfg);
        if (valid.is_err())
            return dp::Result<NodeConfig, dp::Error>::err(valid.error());
        return dp::Result<NodeConfig, dp::Error>::ok(cfg);
    }

    dp::Result<void, dp::Error> ConfigLoader::validate(const NodeConfig &config) {
        auto fail = [](const std::string &msg) {
            return dp::Result<void, dp::Error>::err(invalid_config(dp::String(msg.c_str())));
        };

        if (config.storage.path.empty())
            return fail("storage.path must not be empty");
        if (config.storage.sync_mode != "off" && config.storage.sync_mode != "normal" &&
            config.storage.sync_mode != "full")
            return fail("storage.sync_mode must be off, normal or full");
        if (config.storage.read_connections == 0)
            return fail("storage.read_connections must be at least 1");
        if (config.coordinator.mailbox_capacity == 0)
            return fail("coordinator.mailbox_capacity must be at least 1");
        if (config.events.queue_capacity == 0 || config.events.lane_capacity == 0)
            return fail("event queue capacities must be at least 1");

        for (const auto &name : config.events.enabled_publishers) {
            if (name != "socket" && name != "cluster" && name != "webhook")
                return fail("unknown publisher: " + name);
        }
        if (config.events.isEnabled("webhook") && config.events.webhook.endpoints.empty())
            return fail("webhook publisher enabled without endpoints");
        if (config.events.isEnabled("webhook") && config.events.webhook.timeout_secs == 0)
            return fail("events.webhook.timeout_secs must be at least 1");
        if (config.events.isEnabled("cluster") && config.events.cluster.api_url.empty())
            return fail("cluster publisher enabled without api_url");
        if (config.events.isEnabled("socket") && config.events.socket.send_buffer_messages == 0)
            return fail("events.socket.send_buffer_messages must be at least 1");

        return dp::Result<void, dp::Error>::ok();
    }

} // namespace knotstore
