#include <knotstore/common/logger.hpp>
#include <knotstore/storage/ledger_store.hpp>
#include <knotstore/storage/records.hpp>

#include <chrono>
#include <filesystem>
#include <sqlite3.h>

namespace knotstore::storage {

    namespace {

        struct StmtDeleter {
            void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
        };
        using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

        Stmt prepare(sqlite3 *db, const char *sql) {
            sqlite3_stmt *raw = nullptr;
            if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
                sqlite3_finalize(raw);
                return Stmt();
            }
            return Stmt(raw);
        }

        void bindBlob(sqlite3_stmt *stmt, int index, const void *data, std::size_t size) {
            sqlite3_bind_blob(stmt, index, data, static_cast<int>(size), SQLITE_TRANSIENT);
        }

        void bindHash(sqlite3_stmt *stmt, int index, const Hash256 &hash) {
            bindBlob(stmt, index, hash.data(), hash.size());
        }

        void bindBytes(sqlite3_stmt *stmt, int index, const std::vector<dp::u8> &bytes) {
            bindBlob(stmt, index, bytes.data(), bytes.size());
        }

        std::vector<dp::u8> columnBytes(sqlite3_stmt *stmt, int col) {
            const auto *data = static_cast<const dp::u8 *>(sqlite3_column_blob(stmt, col));
            int size = sqlite3_column_bytes(stmt, col);
            if (!data || size <= 0)
                return {};
            return std::vector<dp::u8>(data, data + size);
        }

        Hash256 columnHash(sqlite3_stmt *stmt, int col) {
            auto bytes = columnBytes(stmt, col);
            return ledger::hashFromBytes(bytes.data(), bytes.size());
        }

        /// Read transaction on a leased connection so multi-statement reads see one WAL snapshot
        class ReadSnapshot {
          public:
            explicit ReadSnapshot(sqlite3 *db) : db_(db) { sqlite3_exec(db_, "BEGIN", nullptr, nullptr, nullptr); }
            ~ReadSnapshot() {
                if (!sqlite3_get_autocommit(db_))
                    sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
            }
            ReadSnapshot(const ReadSnapshot &) = delete;
            ReadSnapshot &operator=(const ReadSnapshot &) = delete;

          private:
            sqlite3 *db_;
        };

        const char *CATEGORY = "storage";

    } // namespace

    std::int64_t currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // ===========================================
    // Lifecycle
    // ===========================================

    LedgerStore::LedgerStore() : writer_(nullptr), is_open_(false) {}

    LedgerStore::~LedgerStore() { close(); }

    dp::Result<void, dp::Error> LedgerStore::open(const std::string &path, const OpenOptions &opts) {
        close();

        int rc = sqlite3_open_v2(path.c_str(), &writer_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            auto err = engineError(writer_, "open " + path);
            sqlite3_close(writer_);
            writer_ = nullptr;
            return dp::Result<void, dp::Error>::err(err);
        }
        db_path_ = path;

        auto pragmas = applyPragmas(writer_, opts);
        if (pragmas.is_err()) {
            close();
            return pragmas;
        }

        auto schema = initializeSchema();
        if (schema.is_err()) {
            close();
            return schema;
        }

        std::uint32_t reader_count = opts.read_connections == 0 ? 1 : opts.read_connections;
        for (std::uint32_t i = 0; i < reader_count; ++i) {
            sqlite3 *reader = nullptr;
            rc = sqlite3_open_v2(path.c_str(), &reader, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
            if (rc != SQLITE_OK) {
                auto err = engineError(reader, "open reader");
                sqlite3_close(reader);
                close();
                return dp::Result<void, dp::Error>::err(err);
            }
            sqlite3_busy_timeout(reader, opts.busy_timeout_ms);
            std::lock_guard<std::mutex> pool_lock(pool_mutex_);
            readers_.push_back(reader);
            idle_readers_.push_back(reader);
        }
        {
            std::lock_guard<std::mutex> pool_lock(pool_mutex_);
            is_open_ = true;
        }

        KNOTSTORE_LOG_INFO(CATEGORY, "opened ledger store at " + path + " with " + std::to_string(reader_count) +
                                         " read connections");
        return dp::Result<void, dp::Error>::ok();
    }

    void LedgerStore::close() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        {
            // New leases fail from here on; leases already handed out are waited for
            std::unique_lock<std::mutex> pool_lock(pool_mutex_);
            is_open_ = false;
            pool_cv_.notify_all();
            pool_cv_.wait(pool_lock, [this] { return idle_readers_.size() == readers_.size(); });
            for (auto *reader : readers_)
                sqlite3_close(reader);
            readers_.clear();
            idle_readers_.clear();
        }
        if (writer_) {
            sqlite3_close(writer_);
            writer_ = nullptr;
        }
    }

    bool LedgerStore::isOpen() const { return is_open_; }

    dp::Result<void, dp::Error> LedgerStore::applyPragmas(sqlite3 *db, const OpenOptions &opts) {
        if (opts.enable_wal && !executeSql(db, "PRAGMA journal_mode=WAL;"))
            return dp::Result<void, dp::Error>::err(engineError(db, "enable WAL"));

        sqlite3_busy_timeout(db, opts.busy_timeout_ms);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        if (!executeSql(db, cache_size.c_str()))
            return dp::Result<void, dp::Error>::err(engineError(db, "set cache size"));

        const char *sync_mode = "PRAGMA synchronous=NORMAL;";
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        if (!executeSql(db, sync_mode))
            return dp::Result<void, dp::Error>::err(engineError(db, "set synchronous mode"));

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::initializeSchema() {
        TxGuard tx(writer_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "begin schema transaction"));

        if (!executeSql(writer_, SCHEMA_MIGRATIONS_TABLE))
            return dp::Result<void, dp::Error>::err(engineError(writer_, "create schema_migrations"));

        if (getCurrentSchemaVersion() < 1) {
            const char *statements[] = {BLOCKS_TABLE,           BLOCK_INDEX_TABLE,    TRANSACTIONS_TABLE,
                                        UTXOS_TABLE,            BLOCK_UNDO_TABLE,     CHAIN_META_TABLE,
                                        IDX_BLOCK_INDEX_ACTIVE, IDX_BLOCK_INDEX_HASH, IDX_TX_BLOCK};
            for (const char *sql : statements) {
                if (!executeSql(writer_, sql))
                    return dp::Result<void, dp::Error>::err(engineError(writer_, "create schema v1"));
            }

            auto stmt = prepare(writer_, "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)");
            if (!stmt)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "record schema version"));
            sqlite3_bind_int(stmt.get(), 1, 1);
            sqlite3_bind_int64(stmt.get(), 2, currentTimestamp());
            if (sqlite3_step(stmt.get()) != SQLITE_DONE)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "record schema version"));
        }

        if (!tx.commit())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "commit schema"));
        return dp::Result<void, dp::Error>::ok();
    }

    std::int32_t LedgerStore::getCurrentSchemaVersion() {
        auto stmt = prepare(writer_, "SELECT MAX(version) FROM schema_migrations");
        if (!stmt)
            return 0;
        std::int32_t version = 0;
        if (sqlite3_step(stmt.get()) == SQLITE_ROW)
            version = sqlite3_column_int(stmt.get(), 0);
        return version;
    }

    bool LedgerStore::executeSql(sqlite3 *db, const char *sql) {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            KNOTSTORE_LOG_ERROR(CATEGORY, std::string("SQL error: ") + (err_msg ? err_msg : "unknown"));
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    dp::Error LedgerStore::engineError(sqlite3 *db, const std::string &context) const {
        std::string msg = context + ": " + (db ? sqlite3_errmsg(db) : "no database handle");
        return storage_unavailable(dp::String(msg.c_str()));
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    LedgerStore::TxGuard::TxGuard(sqlite3 *db) : db_(db), active_(false), committed_(false) {
        if (db_)
            active_ = (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK);
    }

    LedgerStore::TxGuard::~TxGuard() {
        if (active_ && !committed_)
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }

    bool LedgerStore::TxGuard::commit() {
        if (!active_ || committed_)
            return false;
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            rollback();
            return false;
        }
        committed_ = true;
        active_ = false;
        return true;
    }

    void LedgerStore::TxGuard::rollback() {
        if (active_ && !committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            active_ = false;
        }
    }

    // ===========================================
    // Read pool
    // ===========================================

    LedgerStore::ReadLease::ReadLease(LedgerStore &store) : store_(store), db_(nullptr) {
        std::unique_lock<std::mutex> lock(store_.pool_mutex_);
        store_.pool_cv_.wait(lock, [this] { return !store_.is_open_ || !store_.idle_readers_.empty(); });
        if (!store_.is_open_)
            return;
        db_ = store_.idle_readers_.back();
        store_.idle_readers_.pop_back();
    }

    LedgerStore::ReadLease::~ReadLease() {
        if (!db_)
            return;
        {
            std::lock_guard<std::mutex> lock(store_.pool_mutex_);
            store_.idle_readers_.push_back(db_);
        }
        // close() may be waiting for the last lease alongside readers waiting for a free one
        store_.pool_cv_.notify_all();
    }

    // ===========================================
    // Blocks and transactions
    // ===========================================

    dp::Result<void, dp::Error> LedgerStore::putBlock(const Block &block, const UtxoDiff *diff) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        std::lock_guard<std::mutex> lock(write_mutex_);
        TxGuard tx(writer_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "begin putBlock"));

        auto result = putBlockLocked(block, diff);
        if (result.is_err())
            return result;

        if (!tx.commit())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "commit putBlock"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::putBlockLocked(const Block &block, const UtxoDiff *diff) {
        auto exists = prepare(writer_, "SELECT 1 FROM blocks WHERE hash = ?");
        if (!exists)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare block lookup"));
        bindHash(exists.get(), 1, block.hash);
        if (sqlite3_step(exists.get()) == SQLITE_ROW) {
            return dp::Result<void, dp::Error>::err(
                duplicate_key(dp::String(("block already stored: " + ledger::toHex(block.hash)).c_str())));
        }

        // Active when it extends the active chain into an empty height
        auto active_at = prepare(writer_, "SELECT COUNT(*) FROM block_index WHERE height = ? AND active = 1");
        if (!active_at)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare active lookup"));
        sqlite3_bind_int64(active_at.get(), 1, static_cast<sqlite3_int64>(block.height));
        bool height_taken = sqlite3_step(active_at.get()) == SQLITE_ROW && sqlite3_column_int64(active_at.get(), 0) > 0;

        bool parent_active = block.height == 0;
        if (block.height > 0) {
            auto parent = prepare(writer_, "SELECT active FROM block_index WHERE height = ? AND hash = ?");
            if (!parent)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare parent lookup"));
            sqlite3_bind_int64(parent.get(), 1, static_cast<sqlite3_int64>(block.height - 1));
            bindHash(parent.get(), 2, block.previous_hash);
            parent_active = sqlite3_step(parent.get()) == SQLITE_ROW && sqlite3_column_int(parent.get(), 0) == 1;
        }
        bool active = !height_taken && parent_active;

        auto insert_block = prepare(writer_, "INSERT INTO blocks (hash, previous_hash, height, timestamp, work, payload, "
                                             "diff, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        if (!insert_block)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare block insert"));
        bindHash(insert_block.get(), 1, block.hash);
        bindHash(insert_block.get(), 2, block.previous_hash);
        sqlite3_bind_int64(insert_block.get(), 3, static_cast<sqlite3_int64>(block.height));
        sqlite3_bind_int64(insert_block.get(), 4, block.timestamp);
        sqlite3_bind_int64(insert_block.get(), 5, static_cast<sqlite3_int64>(block.work));
        bindBytes(insert_block.get(), 6, block.payload);
        if (diff)
            bindBytes(insert_block.get(), 7, encodeRecord(toRecord(*diff)));
        else
            sqlite3_bind_null(insert_block.get(), 7);
        sqlite3_bind_int64(insert_block.get(), 8, currentTimestamp());
        if (sqlite3_step(insert_block.get()) != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "insert block"));

        auto insert_index = prepare(writer_, "INSERT INTO block_index (height, hash, active) VALUES (?, ?, ?)");
        if (!insert_index)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare index insert"));
        sqlite3_bind_int64(insert_index.get(), 1, static_cast<sqlite3_int64>(block.height));
        bindHash(insert_index.get(), 2, block.hash);
        sqlite3_bind_int(insert_index.get(), 3, active ? 1 : 0);
        if (sqlite3_step(insert_index.get()) != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "insert block index"));

        auto insert_tx = prepare(writer_, "INSERT INTO transactions (txid, block_hash, position, record) VALUES (?, ?, ?, ?)");
        if (!insert_tx)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare transaction insert"));
        for (std::size_t i = 0; i < block.transactions.size(); ++i) {
            const auto &txn = block.transactions[i];
            sqlite3_reset(insert_tx.get());
            bindHash(insert_tx.get(), 1, txn.txid);
            bindHash(insert_tx.get(), 2, block.hash);
            sqlite3_bind_int64(insert_tx.get(), 3, static_cast<sqlite3_int64>(i));
            bindBytes(insert_tx.get(), 4, encodeRecord(toRecord(txn)));
            int rc = sqlite3_step(insert_tx.get());
            if (rc == SQLITE_CONSTRAINT) {
                return dp::Result<void, dp::Error>::err(invariant_violation(
                    dp::String(("transaction listed twice in block: " + ledger::toHex(txn.txid)).c_str())));
            }
            if (rc != SQLITE_DONE)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "insert transaction"));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Block, dp::Error> LedgerStore::readBlock(sqlite3 *db, const Hash256 &hash) {
        auto stmt = prepare(db, "SELECT previous_hash, height, timestamp, work, payload FROM blocks WHERE hash = ?");
        if (!stmt)
            return dp::Result<Block, dp::Error>::err(engineError(db, "prepare block read"));
        bindHash(stmt.get(), 1, hash);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return dp::Result<Block, dp::Error>::err(
                not_found(dp::String(("block not found: " + ledger::toHex(hash)).c_str())));
        }
        if (rc != SQLITE_ROW)
            return dp::Result<Block, dp::Error>::err(engineError(db, "read block"));

        Block block;
        block.hash = hash;
        block.previous_hash = columnHash(stmt.get(), 0);
        block.height = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 1));
        block.timestamp = sqlite3_column_int64(stmt.get(), 2);
        block.work = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 3));
        block.payload = columnBytes(stmt.get(), 4);

        auto txs = prepare(db, "SELECT record FROM transactions WHERE block_hash = ? ORDER BY position");
        if (!txs)
            return dp::Result<Block, dp::Error>::err(engineError(db, "prepare transaction read"));
        bindHash(txs.get(), 1, hash);
        while ((rc = sqlite3_step(txs.get())) == SQLITE_ROW) {
            auto decoded = decodeRecord<TransactionRecord>(columnBytes(txs.get(), 0));
            if (decoded.is_err())
                return dp::Result<Block, dp::Error>::err(decoded.error());
            block.transactions.push_back(fromRecord(decoded.value()));
        }
        if (rc != SQLITE_DONE)
            return dp::Result<Block, dp::Error>::err(engineError(db, "read block transactions"));

        return dp::Result<Block, dp::Error>::ok(std::move(block));
    }

    dp::Result<Block, dp::Error> LedgerStore::getBlock(const Hash256 &hash) {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<Block, dp::Error>::err(storage_unavailable("Ledger store is not open"));
        ReadSnapshot snapshot(lease.db());
        return readBlock(lease.db(), hash);
    }

    dp::Result<Block, dp::Error> LedgerStore::getBlockByHeight(std::uint64_t height) {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<Block, dp::Error>::err(storage_unavailable("Ledger store is not open"));
        ReadSnapshot snapshot(lease.db());

        auto stmt = prepare(lease.db(), "SELECT hash FROM block_index WHERE height = ? AND active = 1");
        if (!stmt)
            return dp::Result<Block, dp::Error>::err(engineError(lease.db(), "prepare height lookup"));
        sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(height));
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return dp::Result<Block, dp::Error>::err(
                not_found(dp::String(("no active block at height " + std::to_string(height)).c_str())));
        }
        if (rc != SQLITE_ROW)
            return dp::Result<Block, dp::Error>::err(engineError(lease.db(), "height lookup"));

        Hash256 hash = columnHash(stmt.get(), 0);
        stmt.reset();
        return readBlock(lease.db(), hash);
    }

    dp::Result<bool, dp::Error> LedgerStore::hasBlock(const Hash256 &hash) {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<bool, dp::Error>::err(storage_unavailable("Ledger store is not open"));
        auto stmt = prepare(lease.db(), "SELECT 1 FROM blocks WHERE hash = ?");
        if (!stmt)
            return dp::Result<bool, dp::Error>::err(engineError(lease.db(), "prepare block lookup"));
        bindHash(stmt.get(), 1, hash);
        int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
            return dp::Result<bool, dp::Error>::err(engineError(lease.db(), "block lookup"));
        return dp::Result<bool, dp::Error>::ok(rc == SQLITE_ROW);
    }

    dp::Result<Transaction, dp::Error> LedgerStore::getTransaction(const Hash256 &txid) {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<Transaction, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        // Prefer the copy in a block on the active chain
        auto stmt = prepare(lease.db(), "SELECT t.record FROM transactions t "
                                        "LEFT JOIN block_index b ON b.hash = t.block_hash AND b.active = 1 "
                                        "WHERE t.txid = ? ORDER BY b.active DESC LIMIT 1");
        if (!stmt)
            return dp::Result<Transaction, dp::Error>::err(engineError(lease.db(), "prepare transaction lookup"));
        bindHash(stmt.get(), 1, txid);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return dp::Result<Transaction, dp::Error>::err(
                not_found(dp::String(("transaction not found: " + ledger::toHex(txid)).c_str())));
        }
        if (rc != SQLITE_ROW)
            return dp::Result<Transaction, dp::Error>::err(engineError(lease.db(), "transaction lookup"));

        auto decoded = decodeRecord<TransactionRecord>(columnBytes(stmt.get(), 0));
        if (decoded.is_err())
            return dp::Result<Transaction, dp::Error>::err(decoded.error());
        return dp::Result<Transaction, dp::Error>::ok(fromRecord(decoded.value()));
    }

    dp::Result<UtxoDiff, dp::Error> LedgerStore::readDiff(sqlite3 *db, const Hash256 &hash) {
        auto stmt = prepare(db, "SELECT diff FROM blocks WHERE hash = ?");
        if (!stmt)
            return dp::Result<UtxoDiff, dp::Error>::err(engineError(db, "prepare diff read"));
        bindHash(stmt.get(), 1, hash);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return dp::Result<UtxoDiff, dp::Error>::err(
                not_found(dp::String(("block not found: " + ledger::toHex(hash)).c_str())));
        }
        if (rc != SQLITE_ROW)
            return dp::Result<UtxoDiff, dp::Error>::err(engineError(db, "read diff"));
        if (sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL) {
            return dp::Result<UtxoDiff, dp::Error>::err(
                not_found(dp::String(("no UTXO diff stored for block " + ledger::toHex(hash)).c_str())));
        }

        auto decoded = decodeRecord<DiffRecord>(columnBytes(stmt.get(), 0));
        if (decoded.is_err())
            return dp::Result<UtxoDiff, dp::Error>::err(decoded.error());
        return dp::Result<UtxoDiff, dp::Error>::ok(fromRecord(decoded.value()));
    }

    dp::Result<UtxoDiff, dp::Error> LedgerStore::getBlockDiff(const Hash256 &hash) {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<UtxoDiff, dp::Error>::err(storage_unavailable("Ledger store is not open"));
        return readDiff(lease.db(), hash);
    }

    // ===========================================
    // UTXO set
    // ===========================================

    dp::Result<void, dp::Error> LedgerStore::applyBlockUtxoChanges(const Hash256 &block_hash,
                                                                   const std::vector<OutPoint> &spent,
                                                                   const std::vector<Utxo> &created) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        std::lock_guard<std::mutex> lock(write_mutex_);
        TxGuard tx(writer_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "begin apply"));

        auto result = applyLocked(block_hash, spent, created);
        if (result.is_err())
            return result;

        if (!tx.commit())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "commit apply"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::applyLocked(const Hash256 &block_hash, const std::vector<OutPoint> &spent,
                                                         const std::vector<Utxo> &created) {
        auto applied = prepare(writer_, "SELECT 1 FROM block_undo WHERE block_hash = ?");
        if (!applied)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare undo lookup"));
        bindHash(applied.get(), 1, block_hash);
        if (sqlite3_step(applied.get()) == SQLITE_ROW) {
            return dp::Result<void, dp::Error>::err(
                invariant_violation(dp::String(("block already applied: " + ledger::toHex(block_hash)).c_str())));
        }

        auto lookup = prepare(writer_, "SELECT record FROM utxos WHERE outpoint = ?");
        auto erase = prepare(writer_, "DELETE FROM utxos WHERE outpoint = ?");
        auto insert = prepare(writer_, "INSERT INTO utxos (outpoint, record) VALUES (?, ?)");
        if (!lookup || !erase || !insert)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare UTXO statements"));

        BlockUndoRecord undo;

        for (const auto &op : spent) {
            auto key = outpointKey(op);
            sqlite3_reset(lookup.get());
            bindBytes(lookup.get(), 1, key);
            int rc = sqlite3_step(lookup.get());
            if (rc == SQLITE_DONE) {
                return dp::Result<void, dp::Error>::err(
                    invariant_violation(dp::String(("spent outpoint not in UTXO set: " + op.toString()).c_str())));
            }
            if (rc != SQLITE_ROW)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "read spent UTXO"));

            undo.spent.push_back(UndoEntry{toDp(key), toDp(columnBytes(lookup.get(), 0))});

            sqlite3_reset(erase.get());
            bindBytes(erase.get(), 1, key);
            if (sqlite3_step(erase.get()) != SQLITE_DONE)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "delete spent UTXO"));
        }

        for (const auto &utxo : created) {
            auto key = outpointKey(utxo.outpoint);
            sqlite3_reset(insert.get());
            bindBytes(insert.get(), 1, key);
            bindBytes(insert.get(), 2, encodeRecord(toRecord(utxo)));
            int rc = sqlite3_step(insert.get());
            if (rc == SQLITE_CONSTRAINT) {
                return dp::Result<void, dp::Error>::err(invariant_violation(
                    dp::String(("created outpoint already unspent: " + utxo.outpoint.toString()).c_str())));
            }
            if (rc != SQLITE_DONE)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "insert UTXO"));
            undo.created.push_back(toDp(key));
        }

        auto store_undo = prepare(writer_, "INSERT INTO block_undo (block_hash, record) VALUES (?, ?)");
        if (!store_undo)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare undo insert"));
        bindHash(store_undo.get(), 1, block_hash);
        bindBytes(store_undo.get(), 2, encodeRecord(undo));
        if (sqlite3_step(store_undo.get()) != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "insert undo record"));

        auto activate = prepare(writer_, "UPDATE block_index SET active = 1 WHERE hash = ?");
        if (!activate)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare activate"));
        bindHash(activate.get(), 1, block_hash);
        int rc = sqlite3_step(activate.get());
        if (rc == SQLITE_CONSTRAINT) {
            return dp::Result<void, dp::Error>::err(invariant_violation(
                dp::String(("another block is active at the height of " + ledger::toHex(block_hash)).c_str())));
        }
        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "activate block"));

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::rollbackBlockUtxoChanges(const Hash256 &block_hash) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        std::lock_guard<std::mutex> lock(write_mutex_);
        TxGuard tx(writer_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "begin rollback"));

        auto result = rollbackLocked(block_hash);
        if (result.is_err())
            return result;

        if (!tx.commit())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "commit rollback"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::rollbackLocked(const Hash256 &block_hash) {
        auto load = prepare(writer_, "SELECT record FROM block_undo WHERE block_hash = ?");
        if (!load)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare undo read"));
        bindHash(load.get(), 1, block_hash);
        int rc = sqlite3_step(load.get());
        if (rc == SQLITE_DONE) {
            return dp::Result<void, dp::Error>::err(
                not_found(dp::String(("no undo record for block " + ledger::toHex(block_hash)).c_str())));
        }
        if (rc != SQLITE_ROW)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "read undo record"));

        auto decoded = decodeRecord<BlockUndoRecord>(columnBytes(load.get(), 0));
        if (decoded.is_err())
            return dp::Result<void, dp::Error>::err(decoded.error());
        const auto &undo = decoded.value();

        auto erase = prepare(writer_, "DELETE FROM utxos WHERE outpoint = ?");
        auto restore = prepare(writer_, "INSERT INTO utxos (outpoint, record) VALUES (?, ?)");
        if (!erase || !restore)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare UTXO statements"));

        for (const auto &key : undo.created) {
            sqlite3_reset(erase.get());
            bindBytes(erase.get(), 1, fromDp(key));
            if (sqlite3_step(erase.get()) != SQLITE_DONE)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "remove created UTXO"));
        }

        for (const auto &entry : undo.spent) {
            sqlite3_reset(restore.get());
            bindBytes(restore.get(), 1, fromDp(entry.key));
            bindBytes(restore.get(), 2, fromDp(entry.record));
            rc = sqlite3_step(restore.get());
            if (rc == SQLITE_CONSTRAINT)
                return dp::Result<void, dp::Error>::err(invariant_violation("restored outpoint already unspent"));
            if (rc != SQLITE_DONE)
                return dp::Result<void, dp::Error>::err(engineError(writer_, "restore spent UTXO"));
        }

        auto drop = prepare(writer_, "DELETE FROM block_undo WHERE block_hash = ?");
        auto deactivate = prepare(writer_, "UPDATE block_index SET active = 0 WHERE hash = ?");
        if (!drop || !deactivate)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare undo cleanup"));
        bindHash(drop.get(), 1, block_hash);
        bindHash(deactivate.get(), 1, block_hash);
        if (sqlite3_step(drop.get()) != SQLITE_DONE || sqlite3_step(deactivate.get()) != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "undo cleanup"));

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Utxo, dp::Error> LedgerStore::getUtxo(const OutPoint &outpoint) {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<Utxo, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        auto stmt = prepare(lease.db(), "SELECT record FROM utxos WHERE outpoint = ?");
        if (!stmt)
            return dp::Result<Utxo, dp::Error>::err(engineError(lease.db(), "prepare UTXO lookup"));
        bindBytes(stmt.get(), 1, outpointKey(outpoint));
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return dp::Result<Utxo, dp::Error>::err(
                not_found(dp::String(("no unspent output " + outpoint.toString()).c_str())));
        }
        if (rc != SQLITE_ROW)
            return dp::Result<Utxo, dp::Error>::err(engineError(lease.db(), "UTXO lookup"));

        auto decoded = decodeRecord<UtxoRecord>(columnBytes(stmt.get(), 0));
        if (decoded.is_err())
            return dp::Result<Utxo, dp::Error>::err(decoded.error());
        return dp::Result<Utxo, dp::Error>::ok(fromRecord(outpoint, decoded.value()));
    }

    // ===========================================
    // Chain metadata
    // ===========================================

    dp::Result<void, dp::Error> LedgerStore::setChainTip(const ChainTip &tip) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        std::lock_guard<std::mutex> lock(write_mutex_);
        TxGuard tx(writer_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "begin setChainTip"));

        auto result = setChainTipLocked(tip);
        if (result.is_err())
            return result;

        if (!tx.commit())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "commit setChainTip"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::setChainTipLocked(const ChainTip &tip) {
        auto stmt = prepare(writer_, "INSERT OR REPLACE INTO chain_meta (key, value) VALUES ('tip', ?)");
        if (!stmt)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "prepare tip write"));
        bindBytes(stmt.get(), 1, encodeRecord(ChainTipRecord{toDp(tip.hash), tip.height, tip.work}));
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(engineError(writer_, "write tip"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<ChainTip, dp::Error> LedgerStore::getChainTip() {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<ChainTip, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        auto stmt = prepare(lease.db(), "SELECT value FROM chain_meta WHERE key = 'tip'");
        if (!stmt)
            return dp::Result<ChainTip, dp::Error>::err(engineError(lease.db(), "prepare tip read"));
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE)
            return dp::Result<ChainTip, dp::Error>::err(not_found("Chain tip not set"));
        if (rc != SQLITE_ROW)
            return dp::Result<ChainTip, dp::Error>::err(engineError(lease.db(), "read tip"));

        auto decoded = decodeRecord<ChainTipRecord>(columnBytes(stmt.get(), 0));
        if (decoded.is_err())
            return dp::Result<ChainTip, dp::Error>::err(decoded.error());
        const auto &rec = decoded.value();
        return dp::Result<ChainTip, dp::Error>::ok(ChainTip{hashFromDp(rec.hash), rec.height, rec.work});
    }

    // ===========================================
    // Composite mutations
    // ===========================================

    dp::Result<void, dp::Error> LedgerStore::connectBlock(const Block &block, const UtxoDiff &diff,
                                                          const ChainTip &tip) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        std::lock_guard<std::mutex> lock(write_mutex_);
        TxGuard tx(writer_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "begin connectBlock"));

        auto put = putBlockLocked(block, &diff);
        if (put.is_err())
            return put;
        auto apply = applyLocked(block.hash, diff.spent, diff.created);
        if (apply.is_err())
            return apply;
        auto set_tip = setChainTipLocked(tip);
        if (set_tip.is_err())
            return set_tip;

        if (!tx.commit())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "commit connectBlock"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LedgerStore::reorganize(const std::vector<Hash256> &disconnect,
                                                        const std::vector<Hash256> &connect, const ChainTip &tip,
                                                        const Block *incoming, const UtxoDiff *incoming_diff) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        std::lock_guard<std::mutex> lock(write_mutex_);
        TxGuard tx(writer_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "begin reorganize"));

        if (incoming) {
            auto put = putBlockLocked(*incoming, incoming_diff);
            if (put.is_err())
                return put;
        }

        for (const auto &hash : disconnect) {
            auto rolled = rollbackLocked(hash);
            if (rolled.is_err())
                return rolled;
        }

        for (const auto &hash : connect) {
            auto diff = readDiff(writer_, hash);
            if (diff.is_err())
                return dp::Result<void, dp::Error>::err(diff.error());
            auto applied = applyLocked(hash, diff.value().spent, diff.value().created);
            if (applied.is_err())
                return applied;
        }

        auto set_tip = setChainTipLocked(tip);
        if (set_tip.is_err())
            return set_tip;

        if (!tx.commit())
            return dp::Result<void, dp::Error>::err(engineError(writer_, "commit reorganize"));

        KNOTSTORE_LOG_INFO(CATEGORY, "reorganized: disconnected " + std::to_string(disconnect.size()) +
                                         ", connected " + std::to_string(connect.size()) + ", new tip " +
                                         ledger::toHex(tip.hash));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Maintenance
    // ===========================================

    dp::Result<void, dp::Error> LedgerStore::backup(const std::string &destination) {
        if (!is_open_)
            return dp::Result<void, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        std::error_code ec;
        std::filesystem::path dest(destination);
        if (dest.has_parent_path())
            std::filesystem::create_directories(dest.parent_path(), ec);

        sqlite3 *dest_db = nullptr;
        if (sqlite3_open(destination.c_str(), &dest_db) != SQLITE_OK) {
            auto err = engineError(dest_db, "open backup destination");
            sqlite3_close(dest_db);
            return dp::Result<void, dp::Error>::err(err);
        }

        ReadLease lease(*this);
        if (!lease.db()) {
            sqlite3_close(dest_db);
            return dp::Result<void, dp::Error>::err(storage_unavailable("Ledger store is not open"));
        }
        sqlite3_backup *job = sqlite3_backup_init(dest_db, "main", lease.db(), "main");
        if (!job) {
            auto err = engineError(dest_db, "start backup");
            sqlite3_close(dest_db);
            return dp::Result<void, dp::Error>::err(err);
        }

        // One step copies every page under a single read snapshot
        int rc = sqlite3_backup_step(job, -1);
        sqlite3_backup_finish(job);
        if (rc != SQLITE_DONE) {
            auto err = engineError(dest_db, "copy pages");
            sqlite3_close(dest_db);
            return dp::Result<void, dp::Error>::err(err);
        }

        sqlite3_close(dest_db);
        KNOTSTORE_LOG_INFO(CATEGORY, "backup written to " + destination);
        return dp::Result<void, dp::Error>::ok();
    }

    std::int64_t LedgerStore::countRows(sqlite3 *db, const char *sql) {
        auto stmt = prepare(db, sql);
        if (!stmt)
            return -1;
        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
            return -1;
        return sqlite3_column_int64(stmt.get(), 0);
    }

    dp::Result<StoreStats, dp::Error> LedgerStore::stats() {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<StoreStats, dp::Error>::err(storage_unavailable("Ledger store is not open"));
        ReadSnapshot snapshot(lease.db());

        StoreStats s;
        s.block_count = countRows(lease.db(), "SELECT COUNT(*) FROM blocks");
        s.transaction_count = countRows(lease.db(), "SELECT COUNT(*) FROM transactions");
        s.utxo_count = countRows(lease.db(), "SELECT COUNT(*) FROM utxos");
        s.undo_count = countRows(lease.db(), "SELECT COUNT(*) FROM block_undo");
        std::int64_t pages = countRows(lease.db(), "PRAGMA page_count");
        std::int64_t page_size = countRows(lease.db(), "PRAGMA page_size");
        if (s.block_count < 0 || s.transaction_count < 0 || s.utxo_count < 0 || s.undo_count < 0 || pages < 0 ||
            page_size < 0)
            return dp::Result<StoreStats, dp::Error>::err(engineError(lease.db(), "collect stats"));

        s.size_bytes = pages * page_size;
        std::error_code ec;
        auto wal_size = std::filesystem::file_size(db_path_ + "-wal", ec);
        if (!ec)
            s.size_bytes += static_cast<std::int64_t>(wal_size);

        return dp::Result<StoreStats, dp::Error>::ok(s);
    }

    dp::Result<bool, dp::Error> LedgerStore::quickCheck() {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<bool, dp::Error>::err(storage_unavailable("Ledger store is not open"));

        auto stmt = prepare(lease.db(), "PRAGMA quick_check");
        if (!stmt)
            return dp::Result<bool, dp::Error>::err(engineError(lease.db(), "prepare quick_check"));
        bool ok = false;
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 0));
            ok = text && std::string(text) == "ok";
        }
        return dp::Result<bool, dp::Error>::ok(ok);
    }

    dp::Result<std::vector<BlockIndexEntry>, dp::Error> LedgerStore::loadBlockIndex() {
        ReadLease lease(*this);
        if (!lease.db())
            return dp::Result<std::vector<BlockIndexEntry>, dp::Error>::err(
                storage_unavailable("Ledger store is not open"));

        auto stmt = prepare(lease.db(), "SELECT hash, previous_hash, height, work FROM blocks ORDER BY height");
        if (!stmt)
            return dp::Result<std::vector<BlockIndexEntry>, dp::Error>::err(
                engineError(lease.db(), "prepare index load"));

        std::vector<BlockIndexEntry> entries;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            BlockIndexEntry entry;
            entry.hash = columnHash(stmt.get(), 0);
            entry.previous_hash = columnHash(stmt.get(), 1);
            entry.height = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 2));
            entry.work = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 3));
            entries.push_back(entry);
        }
        if (rc != SQLITE_DONE)
            return dp::Result<std::vector<BlockIndexEntry>, dp::Error>::err(engineError(lease.db(), "load index"));

        return dp::Result<std::vector<BlockIndexEntry>, dp::Error>::ok(std::move(entries));
    }

} // namespace knotstore::storage
