#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace knotstore {

    struct StorageConfig {
        std::string path = "data/knotstore.db";
        bool enable_wal = true;
        std::int32_t busy_timeout_ms = 5000;
        std::int32_t cache_size_kb = 20000;
        std::string sync_mode = "normal"; // off | normal | full
        std::uint32_t read_connections = 4;
        std::string backup_path;
    };

    struct MempoolConfig {
        std::uint64_t max_bytes = 300ULL * 1024 * 1024;
    };

    struct CoordinatorConfig {
        std::size_t mailbox_capacity = 1024;
    };

    struct HealthConfig {
        std::uint32_t max_storage_failures = 3;
    };

    struct SocketPublisherConfig {
        std::string host = "127.0.0.1";
        std::uint16_t port = 28333;
        std::vector<std::string> topics = {"block", "transaction", "peer", "chain"};
        std::size_t send_buffer_messages = 1000;
    };

    struct ClusterPublisherConfig {
        std::string api_url = "https://kubernetes.default.svc";
        std::string namespace_name = "default";
        std::string node_name = "knotstore-node";
        std::vector<std::string> event_types = {"block", "transaction", "peer", "chain"};
        std::string token;
        std::uint32_t timeout_secs = 10;
    };

    struct WebhookPublisherConfig {
        std::vector<std::string> endpoints;
        std::uint32_t timeout_secs = 10;
        std::uint32_t retry_attempts = 3;
        std::uint32_t backoff_ms = 1000;
    };

    struct EventsConfig {
        std::vector<std::string> enabled_publishers;
        std::size_t queue_capacity = 10000;
        std::size_t lane_capacity = 1000;
        SocketPublisherConfig socket;
        ClusterPublisherConfig cluster;
        WebhookPublisherConfig webhook;

        bool isEnabled(const std::string &publisher) const;
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string file;
        std::uint64_t max_file_size_mb = 100;
        std::uint32_t max_files = 10;
    };

    struct NodeConfig {
        std::string network = "mainnet";
        std::string node_id = "knotstore-node";
        StorageConfig storage;
        MempoolConfig mempool;
        CoordinatorConfig coordinator;
        HealthConfig health;
        EventsConfig events;
        LoggingConfig logging;
    };

    /// Reads `key = value` files (with `#` comments and comma lists) over NodeConfig defaults
    class ConfigLoader {
      public:
        static dp::Result<NodeConfig, dp::Error> loadFile(const std::string &path);
        static dp::Result<NodeConfig, dp::Error> parse(const std::string &text);
        static dp::Result<void, dp::Error> validate(const NodeConfig &config);
    };

} // namespace knotstore
