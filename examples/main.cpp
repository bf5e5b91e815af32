#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "knotstore.hpp"

using namespace knotstore;

namespace {
    std::atomic<bool> g_stop{false};

    void onSignal(int) { g_stop = true; }

    void printUsage(const char *program) {
        std::cout << "Usage: " << program << " [config-file]" << std::endl;
        std::cout << "Runs a storage node until SIGINT or SIGTERM." << std::endl;
    }
} // namespace

int main(int argc, char **argv) {
    if (argc > 2) {
        printUsage(argv[0]);
        return 1;
    }

    NodeConfig config;
    if (argc == 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        auto loaded = ConfigLoader::loadFile(arg);
        if (loaded.is_err()) {
            std::cerr << "Failed to load " << arg << ": " << error_text(loaded.error()) << std::endl;
            return 1;
        }
        config = loaded.value();
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    node::Node node(config);
    auto started = node.start();
    if (started.is_err()) {
        std::cerr << "Failed to start node: " << error_text(started.error()) << std::endl;
        return 1;
    }

    KNOTSTORE_LOG_INFO("main", "node " + config.node_id + " running on " + config.network);
    if (node.socketPort() != 0)
        KNOTSTORE_LOG_INFO("main", "socket publisher on port " + std::to_string(node.socketPort()));

    auto last_report = std::chrono::steady_clock::now();
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() - last_report < std::chrono::seconds(60))
            continue;
        last_report = std::chrono::steady_clock::now();

        auto metrics = node.metrics();
        if (metrics.is_err()) {
            KNOTSTORE_LOG_WARN("main", "metrics unavailable: " + error_text(metrics.error()));
            continue;
        }
        const auto &m = metrics.value();
        KNOTSTORE_LOG_INFO("main", "blocks=" + std::to_string(m.blocks_processed) +
                                       " txs=" + std::to_string(m.transactions_processed) +
                                       " reorgs=" + std::to_string(m.reorgs) +
                                       " mempool=" + std::to_string(m.mempool_count) +
                                       " healthy=" + (m.healthy ? "yes" : "no"));
    }

    KNOTSTORE_LOG_INFO("main", "shutting down");
    node.stop();
    return 0;
}
