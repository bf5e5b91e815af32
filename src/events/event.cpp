#include <knotstore/common/overloaded.hpp>
#include <knotstore/events/event.hpp>

#include <cstdio>
#include <ctime>
#include <sstream>

namespace knotstore::events {

    std::string jsonEscape(const std::string &in) {
        std::string out;
        out.reserve(in.size() + 2);
        for (char c : in) {
            switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
            }
        }
        return out;
    }

    std::string isoTimestamp(std::int64_t unix_seconds) {
        std::time_t t = static_cast<std::time_t>(unix_seconds);
        std::tm tm_buf{};
        gmtime_r(&t, &tm_buf);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
        return buf;
    }

    std::string Event::topic() const {
        return std::visit(overloaded{[](const BlockAccepted &) { return std::string("block"); },
                                     [](const TransactionAccepted &) { return std::string("transaction"); },
                                     [](const PeerChanged &) { return std::string("peer"); },
                                     [](const ChainReorg &) { return std::string("chain"); }},
                          payload);
    }

    std::string Event::typeName() const {
        return std::visit(overloaded{[](const BlockAccepted &) { return std::string("BlockAccepted"); },
                                     [](const TransactionAccepted &) { return std::string("TransactionAccepted"); },
                                     [](const PeerChanged &) { return std::string("PeerChanged"); },
                                     [](const ChainReorg &) { return std::string("ChainReorg"); }},
                          payload);
    }

    std::string Event::toJson() const {
        std::ostringstream data;
        std::visit(overloaded{[&](const BlockAccepted &e) {
                                  data << "{\"hash\":\"" << ledger::toHex(e.hash) << "\",\"height\":" << e.height
                                       << ",\"size\":" << e.size << ",\"tx_count\":" << e.tx_count
                                       << ",\"timestamp\":" << e.timestamp << "}";
                              },
                              [&](const TransactionAccepted &e) {
                                  data << "{\"txid\":\"" << ledger::toHex(e.txid) << "\",\"size\":" << e.size
                                       << ",\"fee\":" << e.fee << ",\"fee_rate\":" << e.fee_rate << "}";
                              },
                              [&](const PeerChanged &e) {
                                  data << "{\"peer_id\":\"" << jsonEscape(e.peer_id) << "\",\"address\":\""
                                       << jsonEscape(e.address)
                                       << "\",\"connected\":" << (e.connected ? "true" : "false")
                                       << ",\"reason\":\"" << jsonEscape(e.reason) << "\"}";
                              },
                              [&](const ChainReorg &e) {
                                  data << "{\"old_tip\":\"" << ledger::toHex(e.old_tip) << "\",\"new_tip\":\""
                                       << ledger::toHex(e.new_tip) << "\",\"old_height\":" << e.old_height
                                       << ",\"new_height\":" << e.new_height << ",\"fork_height\":" << e.fork_height
                                       << ",\"depth\":" << e.depth << "}";
                              }},
                   payload);

        std::ostringstream json;
        json << "{\"id\":" << id << ",\"timestamp\":" << timestamp << ",\"network\":\"" << jsonEscape(network)
             << "\",\"node_id\":\"" << jsonEscape(node_id) << "\",\"type\":\"" << typeName()
             << "\",\"data\":" << data.str() << "}";
        return json.str();
    }

} // namespace knotstore::events
