#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <thread>

#include <knotstore/storage/records.hpp>

#include "test_helpers.hpp"

using namespace knotstore;
using namespace knotstore::storage;
using namespace testutil;

// ===========================================
// Utility function tests
// ===========================================

TEST_CASE("Ledger utility functions") {
    SUBCASE("SHA256 is deterministic") {
        CHECK(sha256("hello") == sha256("hello"));
        CHECK(sha256("hello") != sha256("hello!"));
    }

    SUBCASE("Hex round trip") {
        auto hash = sha256("knot");
        auto hex = toHex(hash);
        CHECK(hex.size() == 64);
        CHECK(hashFromHex(hex) == hash);
    }

    SUBCASE("Outpoint keys order by txid then index") {
        auto txid = sha256("a");
        auto k0 = outpointKey(OutPoint{txid, 0});
        auto k1 = outpointKey(OutPoint{txid, 1});
        auto k256 = outpointKey(OutPoint{txid, 256});
        CHECK(k0.size() == 36);
        CHECK(k0 < k1);
        CHECK(k1 < k256);
    }
}

// ===========================================
// Lifecycle
// ===========================================

TEST_CASE("Ledger store lifecycle") {
    TestDB db("test_ledger_lifecycle");

    SUBCASE("Open and close") {
        REQUIRE(db.store.open(db.path).is_ok());
        CHECK(db.store.isOpen());
        db.store.close();
        CHECK_FALSE(db.store.isOpen());
    }

    SUBCASE("Reopen keeps data") {
        REQUIRE(db.store.open(db.path).is_ok());
        auto genesis = makeBlock("g", zeroHash(), 0, {makeTx("coinbase-0", {}, {5000})});
        REQUIRE(db.store.connectBlock(genesis, diffFor(genesis), tipOf(genesis, 1)).is_ok());
        db.store.close();

        REQUIRE(db.store.open(db.path).is_ok());
        auto tip = db.store.getChainTip();
        REQUIRE(tip.is_ok());
        CHECK(tip.value().hash == genesis.hash);
        CHECK(db.store.hasBlock(genesis.hash).value());
    }

    SUBCASE("Operations on a closed store report StorageUnavailable") {
        auto result = db.store.getBlock(sha256("nothing"));
        REQUIRE(result.is_err());
        CHECK(is_error(result.error(), ERR_STORAGE_UNAVAILABLE));
    }

    SUBCASE("Quick check passes on a fresh store") {
        REQUIRE(db.store.open(db.path).is_ok());
        auto check = db.store.quickCheck();
        REQUIRE(check.is_ok());
        CHECK(check.value());
    }
}

// ===========================================
// Blocks and transactions
// ===========================================

TEST_CASE("Block storage") {
    TestDB db("test_ledger_blocks");
    REQUIRE(db.store.open(db.path).is_ok());

    auto coinbase = makeTx("coinbase-0", {}, {5000, 2500});
    auto genesis = makeBlock("g", zeroHash(), 0, {coinbase});

    SUBCASE("Round trip by hash and height") {
        REQUIRE(db.store.putBlock(genesis).is_ok());

        auto by_hash = db.store.getBlock(genesis.hash);
        REQUIRE(by_hash.is_ok());
        CHECK(by_hash.value().hash == genesis.hash);
        CHECK(by_hash.value().payload == genesis.payload);
        REQUIRE(by_hash.value().transactions.size() == 1);
        CHECK(by_hash.value().transactions[0] == coinbase);

        auto by_height = db.store.getBlockByHeight(0);
        REQUIRE(by_height.is_ok());
        CHECK(by_height.value().hash == genesis.hash);
    }

    SUBCASE("Duplicate block is DuplicateKey") {
        REQUIRE(db.store.putBlock(genesis).is_ok());
        auto again = db.store.putBlock(genesis);
        REQUIRE(again.is_err());
        CHECK(is_error(again.error(), ERR_DUPLICATE_KEY));
    }

    SUBCASE("Missing block is NotFound") {
        auto missing = db.store.getBlock(sha256("absent"));
        REQUIRE(missing.is_err());
        CHECK(is_error(missing.error(), ERR_NOT_FOUND));
        CHECK_FALSE(db.store.hasBlock(sha256("absent")).value());
        CHECK(db.store.getBlockByHeight(7).is_err());
    }

    SUBCASE("Transaction lookup") {
        REQUIRE(db.store.putBlock(genesis).is_ok());
        auto tx = db.store.getTransaction(coinbase.txid);
        REQUIRE(tx.is_ok());
        CHECK(tx.value() == coinbase);

        auto missing = db.store.getTransaction(sha256("nope"));
        REQUIRE(missing.is_err());
        CHECK(is_error(missing.error(), ERR_NOT_FOUND));
    }

    SUBCASE("Stored diff is returned") {
        auto diff = diffFor(genesis);
        REQUIRE(db.store.putBlock(genesis, &diff).is_ok());
        auto stored = db.store.getBlockDiff(genesis.hash);
        REQUIRE(stored.is_ok());
        CHECK(stored.value().created.size() == 2);
        CHECK(stored.value().spent.empty());
    }

    SUBCASE("Side block does not take the active height") {
        REQUIRE(db.store.putBlock(genesis).is_ok());
        auto a = makeBlock("a1", genesis.hash, 1, {makeTx("coinbase-a1", {}, {50})});
        auto b = makeBlock("b1", genesis.hash, 1, {makeTx("coinbase-b1", {}, {50})});
        REQUIRE(db.store.putBlock(a).is_ok());
        REQUIRE(db.store.putBlock(b).is_ok());

        auto at_one = db.store.getBlockByHeight(1);
        REQUIRE(at_one.is_ok());
        CHECK(at_one.value().hash == a.hash);
        CHECK(db.store.hasBlock(b.hash).value());
    }
}

// ===========================================
// UTXO set
// ===========================================

TEST_CASE("UTXO apply and rollback") {
    TestDB db("test_ledger_utxo");
    REQUIRE(db.store.open(db.path).is_ok());

    auto coinbase = makeTx("coinbase-0", {}, {5000});
    auto genesis = makeBlock("g", zeroHash(), 0, {coinbase});
    REQUIRE(db.store.connectBlock(genesis, diffFor(genesis), tipOf(genesis, 1)).is_ok());

    OutPoint funding{coinbase.txid, 0};
    auto spend = makeTx("spend-1", {funding}, {3000, 1900});
    auto block1 = makeBlock("b1", genesis.hash, 1, {makeTx("coinbase-1", {}, {5000}), spend});
    auto diff1 = diffFor(block1);

    SUBCASE("Apply replaces spent outputs with created ones") {
        REQUIRE(db.store.putBlock(block1, &diff1).is_ok());
        REQUIRE(db.store.applyBlockUtxoChanges(block1.hash, diff1.spent, diff1.created).is_ok());

        CHECK(db.store.getUtxo(funding).is_err());
        auto created = db.store.getUtxo(OutPoint{spend.txid, 1});
        REQUIRE(created.is_ok());
        CHECK(created.value().value == 1900);
        CHECK(created.value().height == 1);
    }

    SUBCASE("Rollback restores the exact prior set") {
        auto before = db.store.getUtxo(funding);
        REQUIRE(before.is_ok());

        REQUIRE(db.store.putBlock(block1, &diff1).is_ok());
        REQUIRE(db.store.applyBlockUtxoChanges(block1.hash, diff1.spent, diff1.created).is_ok());
        REQUIRE(db.store.rollbackBlockUtxoChanges(block1.hash).is_ok());

        auto after = db.store.getUtxo(funding);
        REQUIRE(after.is_ok());
        CHECK(after.value() == before.value());
        CHECK(db.store.getUtxo(OutPoint{spend.txid, 0}).is_err());

        auto stats = db.store.stats();
        REQUIRE(stats.is_ok());
        CHECK(stats.value().utxo_count == 1);
    }

    SUBCASE("Spending an absent outpoint is an invariant violation and changes nothing") {
        REQUIRE(db.store.putBlock(block1, &diff1).is_ok());
        std::vector<OutPoint> spent{funding, OutPoint{sha256("ghost"), 0}};
        auto result = db.store.applyBlockUtxoChanges(block1.hash, spent, diff1.created);
        REQUIRE(result.is_err());
        CHECK(is_error(result.error(), ERR_INVARIANT_VIOLATION));

        CHECK(db.store.getUtxo(funding).is_ok());
        CHECK(db.store.getUtxo(OutPoint{spend.txid, 0}).is_err());
    }

    SUBCASE("Applying a block twice is rejected") {
        REQUIRE(db.store.putBlock(block1, &diff1).is_ok());
        REQUIRE(db.store.applyBlockUtxoChanges(block1.hash, diff1.spent, diff1.created).is_ok());
        auto again = db.store.applyBlockUtxoChanges(block1.hash, {}, {});
        REQUIRE(again.is_err());
        CHECK(is_error(again.error(), ERR_INVARIANT_VIOLATION));
    }

    SUBCASE("Rollback without an undo record is NotFound") {
        auto result = db.store.rollbackBlockUtxoChanges(sha256("never applied"));
        REQUIRE(result.is_err());
        CHECK(is_error(result.error(), ERR_NOT_FOUND));
    }

    SUBCASE("Failed connect leaves block, UTXOs and tip untouched") {
        UtxoDiff bad = diff1;
        bad.spent.push_back(OutPoint{sha256("ghost"), 3});
        auto result = db.store.connectBlock(block1, bad, tipOf(block1, 2));
        REQUIRE(result.is_err());

        CHECK_FALSE(db.store.hasBlock(block1.hash).value());
        CHECK(db.store.getUtxo(funding).is_ok());
        CHECK(db.store.getChainTip().value().hash == genesis.hash);
    }
}

// ===========================================
// Chain tip, stats and backup
// ===========================================

TEST_CASE("Chain tip and maintenance") {
    TestDB db("test_ledger_maintenance");
    REQUIRE(db.store.open(db.path).is_ok());

    SUBCASE("Tip is NotFound before the first block") {
        auto tip = db.store.getChainTip();
        REQUIRE(tip.is_err());
        CHECK(is_error(tip.error(), ERR_NOT_FOUND));
    }

    SUBCASE("Tip round trip") {
        ChainTip tip{sha256("tip"), 42, 99};
        REQUIRE(db.store.setChainTip(tip).is_ok());
        CHECK(db.store.getChainTip().value() == tip);
    }

    auto genesis = makeBlock("g", zeroHash(), 0, {makeTx("coinbase-0", {}, {5000, 10})});
    REQUIRE(db.store.connectBlock(genesis, diffFor(genesis), tipOf(genesis, 1)).is_ok());

    SUBCASE("Stats count every keyspace") {
        auto stats = db.store.stats();
        REQUIRE(stats.is_ok());
        CHECK(stats.value().block_count == 1);
        CHECK(stats.value().transaction_count == 1);
        CHECK(stats.value().utxo_count == 2);
        CHECK(stats.value().undo_count == 1);
        CHECK(stats.value().size_bytes > 0);
    }

    SUBCASE("Backup produces an openable copy") {
        TestDB copy("test_ledger_backup_copy");
        REQUIRE(db.store.backup(copy.path).is_ok());

        REQUIRE(copy.store.open(copy.path).is_ok());
        CHECK(copy.store.hasBlock(genesis.hash).value());
        CHECK(copy.store.getChainTip().value().hash == genesis.hash);
    }

    SUBCASE("Block index lists stored headers by height") {
        auto block1 = makeBlock("b1", genesis.hash, 1, {makeTx("coinbase-1", {}, {50})}, 3);
        REQUIRE(db.store.putBlock(block1).is_ok());
        auto index = db.store.loadBlockIndex();
        REQUIRE(index.is_ok());
        REQUIRE(index.value().size() == 2);
        CHECK(index.value()[0].hash == genesis.hash);
        CHECK(index.value()[1].previous_hash == genesis.hash);
        CHECK(index.value()[1].work == 3);
    }
}

// ===========================================
// Concurrent readers
// ===========================================

TEST_CASE("Readers never observe a half-applied block") {
    TestDB db("test_ledger_concurrency");
    REQUIRE(db.store.open(db.path).is_ok());

    auto coinbase = makeTx("coinbase-0", {}, {5000});
    auto genesis = makeBlock("g", zeroHash(), 0, {coinbase});
    REQUIRE(db.store.connectBlock(genesis, diffFor(genesis), tipOf(genesis, 1)).is_ok());

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};
    std::atomic<int> failures{0};

    // Each block moves the single coin; exactly one of (old, new) outpoint must be visible per snapshot
    auto reader = [&] {
        while (!done) {
            auto stats = db.store.stats();
            if (stats.is_err()) {
                failures++;
                continue;
            }
            if (stats.value().utxo_count != stats.value().block_count)
                inconsistent++;
        }
    };

    std::thread r1(reader);
    std::thread r2(reader);

    OutPoint coin{coinbase.txid, 0};
    Hash256 previous = genesis.hash;
    for (std::uint64_t h = 1; h <= 30; ++h) {
        auto move = makeTx("move-" + std::to_string(h), {coin}, {5000 - static_cast<std::int64_t>(h)});
        auto reward = makeTx("coinbase-" + std::to_string(h), {}, {50});
        auto block = makeBlock("c" + std::to_string(h), previous, h, {reward, move});
        REQUIRE(db.store.connectBlock(block, diffFor(block), tipOf(block, h + 1)).is_ok());
        coin = OutPoint{move.txid, 0};
        previous = block.hash;
    }

    done = true;
    r1.join();
    r2.join();

    CHECK(inconsistent == 0);
    CHECK(failures == 0);
}

TEST_CASE("Closing waits for readers in flight") {
    TestDB db("test_ledger_close_readers");
    REQUIRE(db.store.open(db.path).is_ok());

    auto genesis = makeBlock("g", zeroHash(), 0, {makeTx("coinbase-0", {}, {5000})});
    REQUIRE(db.store.connectBlock(genesis, diffFor(genesis), tipOf(genesis, 1)).is_ok());

    std::atomic<bool> started{false};
    std::atomic<int> ok_reads{0};
    std::atomic<int> unavailable{0};
    std::atomic<int> other_errors{0};

    auto reader = [&] {
        for (int i = 0; i < 2000; ++i) {
            auto block = db.store.getBlock(genesis.hash);
            started = true;
            if (block.is_ok())
                ok_reads++;
            else if (is_error(block.error(), ERR_STORAGE_UNAVAILABLE))
                unavailable++;
            else
                other_errors++;
        }
    };

    std::thread r1(reader);
    std::thread r2(reader);
    std::thread r3(reader);

    while (!started)
        std::this_thread::yield();
    db.store.close();

    r1.join();
    r2.join();
    r3.join();

    CHECK_FALSE(db.store.isOpen());
    CHECK(ok_reads + unavailable == 6000);
    CHECK(other_errors == 0);
    CHECK(ok_reads > 0);

    auto after = db.store.getChainTip();
    REQUIRE(after.is_err());
    CHECK(is_error(after.error(), ERR_STORAGE_UNAVAILABLE));
}
