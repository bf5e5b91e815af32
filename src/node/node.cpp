#include <knotstore/common/logger.hpp>
#include <knotstore/events/cluster_publisher.hpp>
#include <knotstore/events/webhook_publisher.hpp>
#include <knotstore/node/node.hpp>

namespace knotstore::node {

    namespace {
        const char *CATEGORY = "node";

        storage::OpenOptions openOptions(const StorageConfig &config) {
            storage::OpenOptions opts;
            opts.enable_wal = config.enable_wal;
            opts.busy_timeout_ms = config.busy_timeout_ms;
            opts.cache_size_kb = config.cache_size_kb;
            opts.read_connections = config.read_connections;
            if (config.sync_mode == "off")
                opts.sync_mode = storage::OpenOptions::Synchronous::OFF;
            else if (config.sync_mode == "full")
                opts.sync_mode = storage::OpenOptions::Synchronous::FULL;
            else
                opts.sync_mode = storage::OpenOptions::Synchronous::NORMAL;
            return opts;
        }

        void configureLogging(const LoggingConfig &config) {
            Logger::setLevel(Logger::parseLevel(config.level));
            Logger::setMaxFileSize(config.max_file_size_mb * 1024 * 1024);
            Logger::setMaxFiles(config.max_files);
            if (!config.file.empty() && !Logger::init(config.file))
                KNOTSTORE_LOG_WARN(CATEGORY, "cannot open log file " + config.file + ", logging to console only");
        }
    } // namespace

    Node::Node(NodeConfig config, std::shared_ptr<events::HttpTransport> transport)
        : config_(std::move(config)), transport_(std::move(transport)) {}

    Node::~Node() { stop(); }

    dp::Error Node::notRunning() const { return mailbox_closed("node is not running"); }

    dp::Result<void, dp::Error> Node::start() {
        if (running_)
            return dp::Result<void, dp::Error>::ok();

        auto valid = ConfigLoader::validate(config_);
        if (valid.is_err())
            return valid;

        configureLogging(config_.logging);
        KNOTSTORE_LOG_INFO(CATEGORY, "starting " + config_.node_id + " on " + config_.network);

        auto opened = store_.open(config_.storage.path, openOptions(config_.storage));
        if (opened.is_err()) {
            KNOTSTORE_LOG_ERROR(CATEGORY, "cannot open store: " + error_text(opened.error()));
            return opened;
        }

        mempool_ = std::make_unique<mempool::Mempool>(
            [this](const ledger::OutPoint &outpoint) { return store_.getUtxo(outpoint).is_ok(); });

        auto events_started = startEvents();
        if (events_started.is_err()) {
            stop();
            return events_started;
        }

        const std::size_t capacity = config_.coordinator.mailbox_capacity;
        auto emitter = [this](events::EventPayload payload) { emit(std::move(payload)); };
        metrics_ = std::make_unique<MetricsWorker>(capacity, config_.health.max_storage_failures);
        storage_worker_ = std::make_unique<StorageWorker>(store_, *metrics_, capacity);
        mempool_worker_ =
            std::make_unique<MempoolWorker>(*mempool_, *metrics_, emitter, config_.mempool.max_bytes, capacity);
        chain_worker_ = std::make_unique<ChainWorker>(*storage_worker_, *mempool_worker_, *metrics_, emitter, capacity);

        metrics_->start();
        storage_worker_->start();
        mempool_worker_->start();
        chain_worker_->start();
        running_ = true;

        auto resumed = resumeChain();
        if (resumed.is_err()) {
            stop();
            return resumed;
        }

        KNOTSTORE_LOG_INFO(CATEGORY, "node started");
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Node::startEvents() {
        const auto &events_config = config_.events;
        dispatcher_ = std::make_unique<events::EventDispatcher>(config_.network, config_.node_id,
                                                                events_config.queue_capacity,
                                                                events_config.lane_capacity);

        if (events_config.isEnabled("socket")) {
            socket_ = std::make_shared<events::SocketPublisher>(events_config.socket);
            auto bound = socket_->start();
            if (bound.is_err()) {
                KNOTSTORE_LOG_ERROR(CATEGORY, "socket publisher failed to start: " + error_text(bound.error()));
                return bound;
            }
            dispatcher_->addPublisher(socket_);
        }

        const bool wants_http = events_config.isEnabled("cluster") || events_config.isEnabled("webhook");
        if (wants_http && !transport_)
            transport_ = std::make_shared<events::CurlTransport>();
        if (events_config.isEnabled("cluster"))
            dispatcher_->addPublisher(std::make_shared<events::ClusterEventPublisher>(events_config.cluster, transport_));
        if (events_config.isEnabled("webhook"))
            dispatcher_->addPublisher(std::make_shared<events::WebhookPublisher>(events_config.webhook, transport_));

        dispatcher_->start();
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Node::resumeChain() {
        auto index = store_.loadBlockIndex();
        if (index.is_err())
            return dp::Result<void, dp::Error>::err(index.error());

        std::optional<ledger::ChainTip> tip;
        auto stored_tip = store_.getChainTip();
        if (stored_tip.is_ok())
            tip = stored_tip.value();
        else if (!is_error(stored_tip.error(), ERR_NOT_FOUND))
            return dp::Result<void, dp::Error>::err(stored_tip.error());

        return chain_worker_->load(std::move(index.value()), tip);
    }

    void Node::stop() {
        const bool was_running = running_.exchange(false);

        // Producers first, so every message still in flight finds its consumer alive
        if (chain_worker_)
            chain_worker_->stop();
        if (mempool_worker_)
            mempool_worker_->stop();
        if (storage_worker_)
            storage_worker_->stop();
        if (metrics_)
            metrics_->stop();
        if (dispatcher_)
            dispatcher_->stop();

        chain_worker_.reset();
        mempool_worker_.reset();
        storage_worker_.reset();
        metrics_.reset();
        dispatcher_.reset();
        socket_.reset();
        mempool_.reset();
        store_.close();

        if (was_running)
            KNOTSTORE_LOG_INFO(CATEGORY, "node stopped");
    }

    void Node::emit(events::EventPayload payload) {
        if (dispatcher_)
            dispatcher_->post(std::move(payload));
    }

    // ===========================================
    // Submission
    // ===========================================

    dp::Result<AcceptResult, dp::Error> Node::acceptBlock(ledger::Block block, ledger::UtxoDiff diff) {
        if (!running_)
            return dp::Result<AcceptResult, dp::Error>::err(notRunning());
        return chain_worker_->acceptBlock(std::move(block), std::move(diff));
    }

    dp::Result<mempool::EntryPtr, dp::Error> Node::submitTransaction(ledger::Transaction tx, std::int64_t fee) {
        if (!running_)
            return dp::Result<mempool::EntryPtr, dp::Error>::err(notRunning());
        return mempool_worker_->submit(std::move(tx), fee);
    }

    dp::Result<void, dp::Error> Node::notifyPeer(const std::string &peer_id, const std::string &address,
                                                 bool connected, const std::string &reason) {
        if (!running_)
            return dp::Result<void, dp::Error>::err(notRunning());
        KNOTSTORE_LOG_DEBUG(CATEGORY, "peer " + peer_id + (connected ? " connected" : " disconnected"));
        emit(events::PeerChanged{peer_id, address, connected, reason});
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Queries
    // ===========================================

    dp::Result<ledger::Block, dp::Error> Node::getBlock(const ledger::Hash256 &hash) {
        if (!running_)
            return dp::Result<ledger::Block, dp::Error>::err(notRunning());
        return store_.getBlock(hash);
    }

    dp::Result<ledger::Block, dp::Error> Node::getBlockByHeight(std::uint64_t height) {
        if (!running_)
            return dp::Result<ledger::Block, dp::Error>::err(notRunning());
        return store_.getBlockByHeight(height);
    }

    dp::Result<ledger::Transaction, dp::Error> Node::getTransaction(const ledger::Hash256 &txid) {
        if (!running_)
            return dp::Result<ledger::Transaction, dp::Error>::err(notRunning());
        return store_.getTransaction(txid);
    }

    dp::Result<ledger::Utxo, dp::Error> Node::getUtxo(const ledger::OutPoint &outpoint) {
        if (!running_)
            return dp::Result<ledger::Utxo, dp::Error>::err(notRunning());
        return store_.getUtxo(outpoint);
    }

    dp::Result<ledger::ChainTip, dp::Error> Node::getChainTip() {
        if (!running_)
            return dp::Result<ledger::ChainTip, dp::Error>::err(notRunning());
        return chain_worker_->tip();
    }

    mempool::MempoolSnapshot Node::mempoolSnapshot() const {
        if (!running_ || !mempool_)
            return mempool::MempoolSnapshot{};
        return mempool_->snapshot();
    }

    dp::Result<MetricsSnapshot, dp::Error> Node::metrics() {
        if (!running_)
            return dp::Result<MetricsSnapshot, dp::Error>::err(notRunning());

        auto snap = metrics_->snapshot();
        if (snap.is_err())
            return snap;

        MetricsSnapshot merged = snap.value();
        auto dispatch = dispatcher_->stats();
        merged.events_posted = dispatch.posted;
        merged.events_dropped = dispatch.totalDropped();
        merged.publisher_failures = dispatch.totalFailures();

        auto stats = store_.stats();
        if (stats.is_ok())
            merged.storage_size_bytes = stats.value().size_bytes;
        else
            KNOTSTORE_LOG_WARN(CATEGORY, "cannot read store size: " + error_text(stats.error()));

        return dp::Result<MetricsSnapshot, dp::Error>::ok(std::move(merged));
    }

    dp::Result<void, dp::Error> Node::backup(const std::string &destination) {
        if (!running_)
            return dp::Result<void, dp::Error>::err(notRunning());
        const std::string target = destination.empty() ? config_.storage.backup_path : destination;
        if (target.empty())
            return dp::Result<void, dp::Error>::err(invalid_config("no backup destination configured"));
        KNOTSTORE_LOG_INFO(CATEGORY, "backing up store to " + target);
        return storage_worker_->backup(target);
    }

    std::uint16_t Node::socketPort() const { return socket_ ? socket_->boundPort() : 0; }

} // namespace knotstore::node
