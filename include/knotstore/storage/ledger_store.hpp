#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <knotstore/common/error.hpp>
#include <knotstore/ledger/types.hpp>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace knotstore::storage {

    using ledger::Block;
    using ledger::BlockIndexEntry;
    using ledger::ChainTip;
    using ledger::Hash256;
    using ledger::OutPoint;
    using ledger::Transaction;
    using ledger::Utxo;
    using ledger::UtxoDiff;

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        std::int32_t busy_timeout_ms = 5000;
        std::int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
        /// Read-only connections serving concurrent point reads
        std::uint32_t read_connections = 4;

        OpenOptions() = default;
    };

    struct StoreStats {
        std::int64_t block_count{0};
        std::int64_t transaction_count{0};
        std::int64_t utxo_count{0};
        std::int64_t undo_count{0};
        std::int64_t size_bytes{0};
    };

    // ===========================================
    // LedgerStore - blocks, transactions, UTXOs, chain tip
    // ===========================================

    /// Durable ledger keyspaces in one SQLite file.
    /// Mutations go through a single writer connection, each inside one engine transaction.
    /// Reads borrow one of several read-only WAL connections and never wait for the writer.
    class LedgerStore {
      public:
        LedgerStore();
        ~LedgerStore();

        LedgerStore(const LedgerStore &) = delete;
        LedgerStore &operator=(const LedgerStore &) = delete;

        /// Open or create the database, apply pragmas and migrate the schema
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});
        /// Waits for read leases already handed out; reads that start afterwards fail with StorageUnavailable
        void close();
        bool isOpen() const;
        const std::string &path() const { return db_path_; }

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            explicit TxGuard(sqlite3 *db);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            bool active() const { return active_; }
            bool commit();
            void rollback();

          private:
            sqlite3 *db_;
            bool active_;
            bool committed_;
        };

        // ===========================================
        // Blocks and transactions
        // ===========================================

        /// Store a block, its height-index row and its transactions in one transaction.
        /// The index row is active only if its height has no active entry and the parent is active.
        dp::Result<void, dp::Error> putBlock(const Block &block, const UtxoDiff *diff = nullptr);

        dp::Result<Block, dp::Error> getBlock(const Hash256 &hash);
        dp::Result<Block, dp::Error> getBlockByHeight(std::uint64_t height);
        dp::Result<bool, dp::Error> hasBlock(const Hash256 &hash);
        dp::Result<Transaction, dp::Error> getTransaction(const Hash256 &txid);

        /// Diff stored alongside the block by putBlock
        dp::Result<UtxoDiff, dp::Error> getBlockDiff(const Hash256 &hash);

        // ===========================================
        // UTXO set
        // ===========================================

        /// Remove spent outpoints and insert created ones; InvariantViolation if any spent outpoint is absent
        dp::Result<void, dp::Error> applyBlockUtxoChanges(const Hash256 &block_hash, const std::vector<OutPoint> &spent,
                                                          const std::vector<Utxo> &created);

        /// Undo a previous apply for this block using its stored undo record
        dp::Result<void, dp::Error> rollbackBlockUtxoChanges(const Hash256 &block_hash);

        dp::Result<Utxo, dp::Error> getUtxo(const OutPoint &outpoint);

        // ===========================================
        // Chain metadata
        // ===========================================

        dp::Result<void, dp::Error> setChainTip(const ChainTip &tip);
        dp::Result<ChainTip, dp::Error> getChainTip();

        // ===========================================
        // Composite mutations (single transaction)
        // ===========================================

        /// putBlock + applyBlockUtxoChanges + setChainTip
        dp::Result<void, dp::Error> connectBlock(const Block &block, const UtxoDiff &diff, const ChainTip &tip);

        /// Roll back `disconnect` (tip first), apply the stored diffs of `connect` (fork first), set the tip.
        /// `incoming` is stored first when given; it must be the last entry of `connect`.
        dp::Result<void, dp::Error> reorganize(const std::vector<Hash256> &disconnect,
                                               const std::vector<Hash256> &connect, const ChainTip &tip,
                                               const Block *incoming = nullptr,
                                               const UtxoDiff *incoming_diff = nullptr);

        // ===========================================
        // Maintenance
        // ===========================================

        /// Point-in-time copy through the online backup API, read from a WAL snapshot
        dp::Result<void, dp::Error> backup(const std::string &destination);

        dp::Result<StoreStats, dp::Error> stats();

        /// Run SQLite quick_check
        dp::Result<bool, dp::Error> quickCheck();

        /// Every stored block as (hash, parent, height, work), ordered by height
        dp::Result<std::vector<BlockIndexEntry>, dp::Error> loadBlockIndex();

      private:
        sqlite3 *writer_;
        std::vector<sqlite3 *> readers_;
        std::vector<sqlite3 *> idle_readers_;
        std::string db_path_;
        std::atomic<bool> is_open_;

        std::mutex write_mutex_;
        std::mutex pool_mutex_;
        std::condition_variable pool_cv_;

        /// Borrowed read connection, returned to the pool on destruction
        class ReadLease {
          public:
            explicit ReadLease(LedgerStore &store);
            ~ReadLease();
            ReadLease(const ReadLease &) = delete;
            ReadLease &operator=(const ReadLease &) = delete;
            sqlite3 *db() const { return db_; }

          private:
            LedgerStore &store_;
            sqlite3 *db_;
        };

        dp::Result<void, dp::Error> applyPragmas(sqlite3 *db, const OpenOptions &opts);
        dp::Result<void, dp::Error> initializeSchema();
        std::int32_t getCurrentSchemaVersion();
        bool executeSql(sqlite3 *db, const char *sql);
        dp::Error engineError(sqlite3 *db, const std::string &context) const;

        // Writer-side steps; caller holds write_mutex_ and an open TxGuard
        dp::Result<void, dp::Error> putBlockLocked(const Block &block, const UtxoDiff *diff);
        dp::Result<void, dp::Error> applyLocked(const Hash256 &block_hash, const std::vector<OutPoint> &spent,
                                                const std::vector<Utxo> &created);
        dp::Result<void, dp::Error> rollbackLocked(const Hash256 &block_hash);
        dp::Result<void, dp::Error> setChainTipLocked(const ChainTip &tip);
        dp::Result<UtxoDiff, dp::Error> readDiff(sqlite3 *db, const Hash256 &hash);

        // Reader-side steps on a leased connection
        dp::Result<Block, dp::Error> readBlock(sqlite3 *db, const Hash256 &hash);
        std::int64_t countRows(sqlite3 *db, const char *sql);

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *BLOCKS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS blocks (
                hash BLOB PRIMARY KEY,
                previous_hash BLOB NOT NULL,
                height INTEGER NOT NULL,
                timestamp INTEGER NOT NULL,
                work INTEGER NOT NULL,
                payload BLOB NOT NULL,
                diff BLOB,
                created_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *BLOCK_INDEX_TABLE = R"(
            CREATE TABLE IF NOT EXISTS block_index (
                height INTEGER NOT NULL,
                hash BLOB NOT NULL,
                active INTEGER NOT NULL DEFAULT 0,
                PRIMARY KEY(height, hash)
            )
        )";

        static constexpr const char *TRANSACTIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS transactions (
                txid BLOB NOT NULL,
                block_hash BLOB NOT NULL,
                position INTEGER NOT NULL,
                record BLOB NOT NULL,
                PRIMARY KEY(txid, block_hash)
            )
        )";

        static constexpr const char *UTXOS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS utxos (
                outpoint BLOB PRIMARY KEY,
                record BLOB NOT NULL
            ) WITHOUT ROWID
        )";

        static constexpr const char *BLOCK_UNDO_TABLE = R"(
            CREATE TABLE IF NOT EXISTS block_undo (
                block_hash BLOB PRIMARY KEY,
                record BLOB NOT NULL
            )
        )";

        static constexpr const char *CHAIN_META_TABLE = R"(
            CREATE TABLE IF NOT EXISTS chain_meta (
                key TEXT PRIMARY KEY,
                value BLOB NOT NULL
            )
        )";

        // At most one active entry per height
        static constexpr const char *IDX_BLOCK_INDEX_ACTIVE =
            "CREATE UNIQUE INDEX IF NOT EXISTS idx_block_index_active ON block_index(height) WHERE active = 1";
        static constexpr const char *IDX_BLOCK_INDEX_HASH =
            "CREATE INDEX IF NOT EXISTS idx_block_index_hash ON block_index(hash)";
        static constexpr const char *IDX_TX_BLOCK =
            "CREATE INDEX IF NOT EXISTS idx_tx_block ON transactions(block_hash, position)";
    };

    /// Current Unix timestamp in seconds
    std::int64_t currentTimestamp();

} // namespace knotstore::storage
