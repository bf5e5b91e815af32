#include <doctest/doctest.h>

#include "test_helpers.hpp"

using namespace knotstore;
using namespace testutil;

TEST_CASE("Reorganize switches the active branch in one transaction") {
    TestDB db("test_ledger_reorg");
    REQUIRE(db.store.open(db.path).is_ok());

    auto coinbase = makeTx("coinbase-0", {}, {5000});
    auto genesis = makeBlock("g", zeroHash(), 0, {coinbase});
    REQUIRE(db.store.connectBlock(genesis, diffFor(genesis), tipOf(genesis, 1)).is_ok());

    OutPoint coin{coinbase.txid, 0};

    // Active branch: g <- a1 (spends the coin)
    auto pay_a = makeTx("pay-a", {coin}, {4900});
    auto a1 = makeBlock("a1", genesis.hash, 1, {makeTx("coinbase-a1", {}, {50}), pay_a});
    REQUIRE(db.store.connectBlock(a1, diffFor(a1), tipOf(a1, 2)).is_ok());

    // Competing branch: g <- b1 <- b2, b1 stored as a side block
    auto pay_b = makeTx("pay-b", {coin}, {4800});
    auto b1 = makeBlock("b1", genesis.hash, 1, {makeTx("coinbase-b1", {}, {50}), pay_b});
    auto b1_diff = diffFor(b1);
    REQUIRE(db.store.putBlock(b1, &b1_diff).is_ok());
    CHECK(db.store.getBlockByHeight(1).value().hash == a1.hash);

    auto b2 = makeBlock("b2", b1.hash, 2, {makeTx("coinbase-b2", {}, {50})});
    auto b2_diff = diffFor(b2);

    SUBCASE("Successful reorganize") {
        auto result = db.store.reorganize({a1.hash}, {b1.hash, b2.hash}, tipOf(b2, 3), &b2, &b2_diff);
        REQUIRE(result.is_ok());

        CHECK(db.store.getChainTip().value().hash == b2.hash);
        CHECK(db.store.getBlockByHeight(1).value().hash == b1.hash);
        CHECK(db.store.getBlockByHeight(2).value().hash == b2.hash);

        CHECK(db.store.getUtxo(OutPoint{pay_a.txid, 0}).is_err());
        CHECK(db.store.getUtxo(OutPoint{pay_b.txid, 0}).is_ok());
        CHECK(db.store.getUtxo(coin).is_err());

        // Still stored, no longer active
        CHECK(db.store.hasBlock(a1.hash).value());
        auto stats = db.store.stats();
        REQUIRE(stats.is_ok());
        CHECK(stats.value().undo_count == 3);
    }

    SUBCASE("Failure midway leaves the old branch fully in place") {
        // The second connected block spends an outpoint that never existed
        auto phantom = makeBlock("b2-bad", b1.hash, 2, {makeTx("coinbase-bad", {}, {50})});
        UtxoDiff phantom_diff = diffFor(phantom);
        phantom_diff.spent.push_back(OutPoint{sha256("phantom"), 0});

        auto result =
            db.store.reorganize({a1.hash}, {b1.hash, phantom.hash}, tipOf(phantom, 3), &phantom, &phantom_diff);
        REQUIRE(result.is_err());
        CHECK(is_error(result.error(), ERR_INVARIANT_VIOLATION));

        CHECK(db.store.getChainTip().value().hash == a1.hash);
        CHECK(db.store.getBlockByHeight(1).value().hash == a1.hash);
        CHECK(db.store.getUtxo(OutPoint{pay_a.txid, 0}).is_ok());
        CHECK(db.store.getUtxo(OutPoint{pay_b.txid, 0}).is_err());
        CHECK_FALSE(db.store.hasBlock(phantom.hash).value());
    }

    SUBCASE("Transaction lookup prefers the active copy") {
        // The same transaction confirmed on both branches
        auto shared = makeTx("shared", {}, {1});
        auto a2 = makeBlock("a2", a1.hash, 2, {shared});
        REQUIRE(db.store.connectBlock(a2, diffFor(a2), tipOf(a2, 3)).is_ok());
        auto b2_shared = makeBlock("b2-shared", b1.hash, 2, {shared});
        REQUIRE(db.store.putBlock(b2_shared).is_ok());

        auto tx = db.store.getTransaction(shared.txid);
        REQUIRE(tx.is_ok());
        CHECK(tx.value() == shared);
    }
}
