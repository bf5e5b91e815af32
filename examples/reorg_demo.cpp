#include <filesystem>
#include <iostream>
#include <string>

#include "knotstore.hpp"

using namespace knotstore;
using namespace knotstore::ledger;

namespace {

    void printSeparator(const std::string &title) {
        std::cout << "\n" << std::string(60, '=') << std::endl;
        std::cout << "  " << title << std::endl;
        std::cout << std::string(60, '=') << std::endl;
    }

    Transaction coinbase(const std::string &tag, std::int64_t value) {
        Transaction tx;
        tx.txid = sha256("coinbase:" + tag);
        tx.raw = Bytes(tag.begin(), tag.end());
        tx.outputs.push_back(TxOut{value, Bytes{0x51}});
        return tx;
    }

    Transaction spend(const std::string &tag, const OutPoint &input, std::int64_t value) {
        Transaction tx;
        tx.txid = sha256("spend:" + tag);
        tx.raw = Bytes(120, 0x01);
        tx.inputs.push_back(input);
        tx.outputs.push_back(TxOut{value, Bytes{0x51}});
        return tx;
    }

    Block block(const std::string &tag, const Hash256 &previous, std::uint64_t height,
                std::vector<Transaction> txs) {
        Block b;
        b.hash = sha256("block:" + tag);
        b.previous_hash = previous;
        b.height = height;
        b.timestamp = 1700000000 + static_cast<std::int64_t>(height) * 600;
        b.work = 1;
        b.payload = Bytes(80, 0x00);
        b.transactions = std::move(txs);
        return b;
    }

    UtxoDiff diffOf(const Block &b) {
        UtxoDiff diff;
        for (const auto &tx : b.transactions) {
            for (const auto &in : tx.inputs)
                diff.spent.push_back(in);
            for (std::uint32_t i = 0; i < tx.outputs.size(); ++i)
                diff.created.push_back(Utxo{OutPoint{tx.txid, i}, tx.outputs[i].value, tx.outputs[i].script, b.height});
        }
        return diff;
    }

    const char *outcomeName(node::AcceptOutcome outcome) {
        switch (outcome) {
        case node::AcceptOutcome::Connected:
            return "connected";
        case node::AcceptOutcome::Reorganized:
            return "reorganized";
        case node::AcceptOutcome::SideChain:
            return "side chain";
        }
        return "unknown";
    }

    bool submit(node::Node &n, const std::string &label, const Block &b) {
        auto result = n.acceptBlock(b, diffOf(b));
        if (result.is_err()) {
            std::cout << "  " << label << ": rejected (" << error_text(result.error()) << ")" << std::endl;
            return false;
        }
        std::cout << "  " << label << ": " << outcomeName(result.value().outcome) << ", tip height "
                  << result.value().tip.height << ", cumulative work " << result.value().tip.work << std::endl;
        if (result.value().outcome == node::AcceptOutcome::Reorganized) {
            std::cout << "    disconnected " << result.value().disconnected.size() << ", connected "
                      << result.value().connected.size() << std::endl;
        }
        return true;
    }

} // namespace

int main() {
    const std::string path = "reorg_demo.db";
    for (const auto &p : {path, path + "-wal", path + "-shm"})
        std::filesystem::remove(p);

    NodeConfig config;
    config.network = "regtest";
    config.node_id = "reorg-demo";
    config.storage.path = path;
    config.events.enabled_publishers.clear();
    config.logging.level = "warn";

    node::Node n(config);
    auto started = n.start();
    if (started.is_err()) {
        std::cerr << "Failed to start node: " << error_text(started.error()) << std::endl;
        return 1;
    }

    printSeparator("BUILDING THE FIRST BRANCH");
    auto cb = coinbase("genesis", 5000);
    auto genesis = block("genesis", zeroHash(), 0, {cb});
    submit(n, "genesis", genesis);

    auto payment = spend("payment", OutPoint{cb.txid, 0}, 4800);
    auto admitted = n.submitTransaction(payment, 200);
    if (admitted.is_ok())
        std::cout << "  payment pending, fee rate " << admitted.value()->fee_rate << " per byte" << std::endl;

    auto a1 = block("a1", genesis.hash, 1, {coinbase("a1", 50), payment});
    submit(n, "a1", a1);
    std::cout << "  mempool size after a1: " << n.mempoolSnapshot().size() << std::endl;

    printSeparator("COMPETING BRANCH");
    auto b1 = block("b1", genesis.hash, 1, {coinbase("b1", 50)});
    auto b2 = block("b2", b1.hash, 2, {coinbase("b2", 50)});
    submit(n, "b1", b1);
    submit(n, "b2", b2);

    printSeparator("STATE AFTER THE REORG");
    auto tip = n.getChainTip();
    if (tip.is_ok())
        std::cout << "  tip " << toHex(tip.value().hash).substr(0, 16) << " at height " << tip.value().height
                  << std::endl;
    std::cout << "  genesis coin unspent again: " << (n.getUtxo(OutPoint{cb.txid, 0}).is_ok() ? "yes" : "no")
              << std::endl;
    std::cout << "  payment output present: " << (n.getUtxo(OutPoint{payment.txid, 0}).is_ok() ? "yes" : "no")
              << std::endl;

    auto metrics = n.metrics();
    if (metrics.is_ok()) {
        std::cout << "  blocks processed: " << metrics.value().blocks_processed << std::endl;
        std::cout << "  reorgs: " << metrics.value().reorgs << std::endl;
        std::cout << "  store size: " << metrics.value().storage_size_bytes << " bytes" << std::endl;
    }

    n.stop();
    for (const auto &p : {path, path + "-wal", path + "-shm"})
        std::filesystem::remove(p);
    return 0;
}
