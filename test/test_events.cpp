#include <doctest/doctest.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include <knotstore/events/cluster_publisher.hpp>
#include <knotstore/events/dispatcher.hpp>
#include <knotstore/events/webhook_publisher.hpp>

using namespace knotstore;
using namespace knotstore::events;
using knotstore::ledger::sha256;

namespace {

    // Answers POSTs from a scripted list of statuses; falls back to `fallback` once the script runs out
    class ScriptedTransport : public HttpTransport {
      public:
        explicit ScriptedTransport(int fallback) : fallback_(fallback) {}

        void script(std::initializer_list<int> statuses) {
            std::lock_guard<std::mutex> lock(mutex_);
            statuses_.insert(statuses_.end(), statuses.begin(), statuses.end());
        }

        HttpResponse post(const HttpRequest &request) override {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            HttpResponse response;
            if (!statuses_.empty()) {
                response.status = statuses_.front();
                statuses_.pop_front();
            } else {
                response.status = fallback_;
            }
            if (response.status == 0)
                response.error = "connection refused";
            return response;
        }

        std::vector<HttpRequest> requests() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

      private:
        int fallback_;
        std::deque<int> statuses_;
        std::vector<HttpRequest> requests_;
        mutable std::mutex mutex_;
    };

    class RecordingPublisher : public IPublisher {
      public:
        std::string name() const override { return "recording"; }

        dp::Result<void, dp::Error> publish(const Event &event) override {
            std::lock_guard<std::mutex> lock(mutex_);
            ids_.push_back(event.id);
            return dp::Result<void, dp::Error>::ok();
        }

        std::vector<std::uint64_t> ids() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return ids_;
        }

      private:
        std::vector<std::uint64_t> ids_;
        mutable std::mutex mutex_;
    };

    // Blocks inside publish() until released
    class GatedPublisher : public IPublisher {
      public:
        std::string name() const override { return "gated"; }

        dp::Result<void, dp::Error> publish(const Event &) override {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return open_; });
            return dp::Result<void, dp::Error>::ok();
        }

        void release() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                open_ = true;
            }
            cv_.notify_all();
        }

      private:
        std::mutex mutex_;
        std::condition_variable cv_;
        bool open_{false};
    };

    Event sampleBlockEvent() {
        Event event;
        event.id = 7;
        event.timestamp = 1700000000;
        event.network = "regtest";
        event.node_id = "node-a";
        event.payload = BlockAccepted{sha256("block"), 12, 1234, 3, 1700000000};
        return event;
    }

    bool waitFor(const std::function<bool()> &condition) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return condition();
    }

} // namespace

TEST_CASE("Event envelope") {
    auto event = sampleBlockEvent();

    SUBCASE("Topic and type name") {
        CHECK(event.topic() == "block");
        CHECK(event.typeName() == "BlockAccepted");

        Event peer;
        peer.payload = PeerChanged{"p1", "10.0.0.1:8333", true, ""};
        CHECK(peer.topic() == "peer");
        Event reorg;
        reorg.payload = ChainReorg{};
        CHECK(reorg.topic() == "chain");
        Event tx;
        tx.payload = TransactionAccepted{};
        CHECK(tx.topic() == "transaction");
    }

    SUBCASE("JSON carries envelope and payload") {
        auto json = event.toJson();
        CHECK(json.find("\"id\":7") != std::string::npos);
        CHECK(json.find("\"network\":\"regtest\"") != std::string::npos);
        CHECK(json.find("\"type\":\"BlockAccepted\"") != std::string::npos);
        CHECK(json.find("\"height\":12") != std::string::npos);
        CHECK(json.find(ledger::toHex(sha256("block"))) != std::string::npos);
    }

    SUBCASE("Escaping and timestamps") {
        CHECK(jsonEscape("a\"b\\c\n") == "a\\\"b\\\\c\\n");
        CHECK(isoTimestamp(0) == "1970-01-01T00:00:00Z");
    }
}

TEST_CASE("Webhook publisher") {
    WebhookPublisherConfig config;
    config.endpoints = {"http://hooks.local/a"};
    config.retry_attempts = 2;
    config.backoff_ms = 1;
    config.timeout_secs = 3;

    SUBCASE("Gives up after retry_attempts extra tries") {
        auto transport = std::make_shared<ScriptedTransport>(500);
        WebhookPublisher publisher(config, transport);

        auto result = publisher.publish(sampleBlockEvent());
        REQUIRE(result.is_err());
        CHECK(is_error(result.error(), ERR_PUBLISHER_FAILURE));
        CHECK(publisher.attempts() == 3);
        CHECK(publisher.failures() == 1);
        CHECK(transport->requests().size() == 3);
    }

    SUBCASE("Succeeds on a retry") {
        auto transport = std::make_shared<ScriptedTransport>(200);
        transport->script({0});
        WebhookPublisher publisher(config, transport);

        REQUIRE(publisher.publish(sampleBlockEvent()).is_ok());
        CHECK(publisher.attempts() == 2);
        CHECK(publisher.failures() == 0);

        auto requests = transport->requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests[1].url == "http://hooks.local/a");
        CHECK(requests[1].timeout_secs == 3);
        CHECK(requests[1].body == sampleBlockEvent().toJson());
    }

    SUBCASE("Every endpoint receives the event") {
        config.endpoints.push_back("http://hooks.local/b");
        auto transport = std::make_shared<ScriptedTransport>(204);
        WebhookPublisher publisher(config, transport);
        REQUIRE(publisher.publish(sampleBlockEvent()).is_ok());
        CHECK(transport->requests().size() == 2);
    }
}

TEST_CASE("Cluster event publisher") {
    ClusterPublisherConfig config;
    config.api_url = "https://cluster.local:6443/";
    config.namespace_name = "chain";
    config.node_name = "node-a";
    config.token = "secret";
    config.event_types = {"block", "chain"};

    auto transport = std::make_shared<ScriptedTransport>(201);
    ClusterEventPublisher publisher(config, transport);

    SUBCASE("Posts an Event record to the namespace") {
        CHECK(publisher.endpoint() == "https://cluster.local:6443/api/v1/namespaces/chain/events");
        REQUIRE(publisher.publish(sampleBlockEvent()).is_ok());

        auto requests = transport->requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].url == publisher.endpoint());
        bool has_auth = false;
        for (const auto &header : requests[0].headers)
            has_auth = has_auth || header == "Authorization: Bearer secret";
        CHECK(has_auth);

        const auto &body = requests[0].body;
        CHECK(body.find("\"kind\":\"Event\"") != std::string::npos);
        CHECK(body.find("\"reason\":\"NewBlock\"") != std::string::npos);
        CHECK(body.find("\"type\":\"Normal\"") != std::string::npos);
        CHECK(body.find("\"involvedObject\":{\"kind\":\"Pod\",\"name\":\"node-a\"") != std::string::npos);
    }

    SUBCASE("Reorgs are warnings") {
        Event reorg = sampleBlockEvent();
        reorg.payload = ChainReorg{sha256("old"), sha256("new"), 10, 11, 9, 1};
        auto record = publisher.buildRecord(reorg);
        CHECK(record.find("\"reason\":\"ChainReorg\"") != std::string::npos);
        CHECK(record.find("\"type\":\"Warning\"") != std::string::npos);
    }

    SUBCASE("Filtered event types are skipped") {
        Event tx = sampleBlockEvent();
        tx.payload = TransactionAccepted{sha256("tx"), 200, 400, 2.0};
        CHECK_FALSE(publisher.accepts(tx));
        REQUIRE(publisher.publish(tx).is_ok());
        CHECK(transport->requests().empty());
    }

    SUBCASE("API errors are publisher failures without retry") {
        auto failing = std::make_shared<ScriptedTransport>(403);
        ClusterEventPublisher rejected(config, failing);
        auto result = rejected.publish(sampleBlockEvent());
        REQUIRE(result.is_err());
        CHECK(is_error(result.error(), ERR_PUBLISHER_FAILURE));
        CHECK(failing->requests().size() == 1);
    }
}

TEST_CASE("Event dispatcher") {
    SUBCASE("A failing publisher does not affect the others") {
        WebhookPublisherConfig config;
        config.endpoints = {"http://hooks.local/down"};
        config.retry_attempts = 1;
        config.backoff_ms = 1;
        auto transport = std::make_shared<ScriptedTransport>(503);
        auto webhook = std::make_shared<WebhookPublisher>(config, transport);
        auto recording = std::make_shared<RecordingPublisher>();

        EventDispatcher dispatcher("regtest", "node-a", 100, 100);
        dispatcher.addPublisher(webhook);
        dispatcher.addPublisher(recording);
        dispatcher.start();

        std::vector<std::uint64_t> posted;
        for (int i = 0; i < 3; ++i)
            posted.push_back(dispatcher.post(PeerChanged{"peer-" + std::to_string(i), "127.0.0.1", true, ""}));

        REQUIRE(dispatcher.waitIdle(std::chrono::seconds(5)));
        CHECK(recording->ids() == posted);

        auto stats = dispatcher.stats();
        CHECK(stats.posted == 3);
        CHECK(stats.totalFailures() == 3);
        CHECK(webhook->failures() == 3);
        dispatcher.stop();
    }

    SUBCASE("A stuck publisher only fills its own lane") {
        auto gated = std::make_shared<GatedPublisher>();
        auto recording = std::make_shared<RecordingPublisher>();

        EventDispatcher dispatcher("regtest", "node-a", 100, 2);
        dispatcher.addPublisher(gated);
        dispatcher.addPublisher(recording);
        dispatcher.start();

        for (int i = 0; i < 6; ++i)
            dispatcher.post(TransactionAccepted{sha256("tx" + std::to_string(i)), 100, 10, 0.1});

        CHECK(waitFor([&] { return recording->ids().size() == 6; }));

        auto stats = dispatcher.stats();
        REQUIRE(stats.publishers.size() == 2);
        CHECK(stats.publishers[0].name == "gated");
        CHECK(stats.publishers[0].dropped >= 3);
        CHECK(stats.publishers[1].dropped == 0);

        gated->release();
        dispatcher.stop();
        auto final_stats = dispatcher.stats();
        CHECK(final_stats.publishers[0].delivered + final_stats.publishers[0].dropped == 6);
    }

    SUBCASE("Stopping interrupts a webhook waiting to retry") {
        WebhookPublisherConfig config;
        config.endpoints = {"http://hooks.local/down"};
        config.retry_attempts = 3;
        config.backoff_ms = 60000;
        auto transport = std::make_shared<ScriptedTransport>(503);
        auto webhook = std::make_shared<WebhookPublisher>(config, transport);

        EventDispatcher dispatcher("regtest", "node-a", 100, 100);
        dispatcher.addPublisher(webhook);
        dispatcher.start();
        for (int i = 0; i < 5; ++i)
            dispatcher.post(PeerChanged{"peer-" + std::to_string(i), "127.0.0.1", true, ""});

        // First event is now sleeping between attempts
        REQUIRE(waitFor([&] { return transport->requests().size() == 1; }));

        auto started = std::chrono::steady_clock::now();
        dispatcher.stop();
        auto elapsed = std::chrono::steady_clock::now() - started;
        CHECK(elapsed < std::chrono::seconds(5));

        CHECK(transport->requests().size() == 1);
        auto stats = dispatcher.stats();
        REQUIRE(stats.publishers.size() == 1);
        CHECK(stats.publishers[0].failed == 1);
        CHECK(stats.publishers[0].dropped == 4);
    }

    SUBCASE("Full central queue drops the oldest event") {
        EventDispatcher dispatcher("regtest", "node-a", 2, 10);
        auto recording = std::make_shared<RecordingPublisher>();
        dispatcher.addPublisher(recording);

        // Not started: the queue only fills
        dispatcher.post(PeerChanged{"a", "", true, ""});
        auto second = dispatcher.post(PeerChanged{"b", "", true, ""});
        auto third = dispatcher.post(PeerChanged{"c", "", true, ""});
        CHECK(dispatcher.stats().dropped == 1);

        dispatcher.start();
        REQUIRE(dispatcher.waitIdle(std::chrono::seconds(5)));
        std::vector<std::uint64_t> expected{second, third};
        CHECK(recording->ids() == expected);
        dispatcher.stop();
    }
}
