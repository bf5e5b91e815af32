#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <knotstore/ledger/types.hpp>

namespace knotstore::events {

    struct BlockAccepted {
        ledger::Hash256 hash{};
        std::uint64_t height{0};
        std::size_t size{0};
        std::size_t tx_count{0};
        std::int64_t timestamp{0};
    };

    struct TransactionAccepted {
        ledger::Hash256 txid{};
        std::size_t size{0};
        std::int64_t fee{0};
        double fee_rate{0.0};
    };

    struct PeerChanged {
        std::string peer_id;
        std::string address;
        bool connected{false};
        std::string reason;
    };

    struct ChainReorg {
        ledger::Hash256 old_tip{};
        ledger::Hash256 new_tip{};
        std::uint64_t old_height{0};
        std::uint64_t new_height{0};
        std::uint64_t fork_height{0};
        std::size_t depth{0};
    };

    using EventPayload = std::variant<BlockAccepted, TransactionAccepted, PeerChanged, ChainReorg>;

    /// Payload plus the envelope assigned when the event is posted
    struct Event {
        std::uint64_t id{0};
        std::int64_t timestamp{0};
        std::string network;
        std::string node_id;
        EventPayload payload;

        /// Subscription topic: block, transaction, peer or chain
        std::string topic() const;
        /// Variant name, e.g. "BlockAccepted"
        std::string typeName() const;
        /// Envelope and payload as one JSON object
        std::string toJson() const;
    };

    /// Escape a string for inclusion in a JSON document
    std::string jsonEscape(const std::string &in);

    /// RFC 3339 UTC timestamp, e.g. 2024-01-01T00:00:00Z
    std::string isoTimestamp(std::int64_t unix_seconds);

} // namespace knotstore::events
