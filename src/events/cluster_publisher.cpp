#include <knotstore/common/error.hpp>
#include <knotstore/events/cluster_publisher.hpp>

#include <algorithm>
#include <sstream>

namespace knotstore::events {

    namespace {

        struct Summary {
            std::string reason;
            std::string message;
            std::string type;
        };

        Summary summarize(const Event &event) {
            Summary s{"", "", "Normal"};
            if (const auto *e = std::get_if<BlockAccepted>(&event.payload)) {
                s.reason = "NewBlock";
                s.message = "New block " + ledger::toHex(e->hash) + " at height " + std::to_string(e->height);
            } else if (const auto *e = std::get_if<TransactionAccepted>(&event.payload)) {
                s.reason = "NewTransaction";
                s.message = "New transaction " + ledger::toHex(e->txid) + " with fee " + std::to_string(e->fee);
            } else if (const auto *e = std::get_if<PeerChanged>(&event.payload)) {
                s.reason = e->connected ? "PeerConnected" : "PeerDisconnected";
                s.message = "Peer " + e->peer_id + (e->connected ? " connected from " : " disconnected from ") +
                            e->address;
            } else if (const auto *e = std::get_if<ChainReorg>(&event.payload)) {
                s.reason = "ChainReorg";
                s.message = "Chain reorganization from " + ledger::toHex(e->old_tip) + " to " +
                            ledger::toHex(e->new_tip) + " (depth " + std::to_string(e->depth) + ")";
                s.type = "Warning";
            }
            return s;
        }

    } // namespace

    ClusterEventPublisher::ClusterEventPublisher(ClusterPublisherConfig config, std::shared_ptr<HttpTransport> transport)
        : config_(std::move(config)), transport_(std::move(transport)) {}

    std::string ClusterEventPublisher::endpoint() const {
        std::string base = config_.api_url;
        while (!base.empty() && base.back() == '/')
            base.pop_back();
        return base + "/api/v1/namespaces/" + config_.namespace_name + "/events";
    }

    bool ClusterEventPublisher::accepts(const Event &event) const {
        const auto &types = config_.event_types;
        return std::find(types.begin(), types.end(), event.topic()) != types.end();
    }

    std::string ClusterEventPublisher::buildRecord(const Event &event) const {
        Summary s = summarize(event);
        std::string when = isoTimestamp(event.timestamp);
        std::string ns = jsonEscape(config_.namespace_name);
        std::string node = jsonEscape(config_.node_name);

        std::ostringstream json;
        json << "{\"apiVersion\":\"v1\",\"kind\":\"Event\","
             << "\"metadata\":{\"name\":\"" << node << "." << event.id << "\",\"namespace\":\"" << ns
             << "\",\"annotations\":{\"knotstore/event\":\"" << jsonEscape(event.toJson()) << "\"}},"
             << "\"involvedObject\":{\"kind\":\"Pod\",\"name\":\"" << node << "\",\"namespace\":\"" << ns << "\"},"
             << "\"reason\":\"" << s.reason << "\",\"message\":\"" << jsonEscape(s.message) << "\","
             << "\"type\":\"" << s.type << "\",\"action\":\"" << event.typeName() << "\","
             << "\"firstTimestamp\":\"" << when << "\",\"lastTimestamp\":\"" << when << "\",\"count\":1,"
             << "\"source\":{\"component\":\"knotstore\",\"host\":\"" << node << "\"},"
             << "\"reportingComponent\":\"knotstore\",\"reportingInstance\":\"" << node << "\"}";
        return json.str();
    }

    dp::Result<void, dp::Error> ClusterEventPublisher::publish(const Event &event) {
        if (!accepts(event))
            return dp::Result<void, dp::Error>::ok();

        HttpRequest request;
        request.url = endpoint();
        request.headers = {"Content-Type: application/json", "Accept: application/json"};
        if (!config_.token.empty())
            request.headers.push_back("Authorization: Bearer " + config_.token);
        request.body = buildRecord(event);
        request.timeout_secs = config_.timeout_secs;

        HttpResponse response = transport_->post(request);
        if (!response.ok()) {
            std::string reason = response.error.empty() ? "HTTP status " + std::to_string(response.status)
                                                        : response.error;
            return dp::Result<void, dp::Error>::err(
                publisher_failure(dp::String(("cluster event API: " + reason).c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace knotstore::events
