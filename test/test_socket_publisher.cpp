#include <doctest/doctest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <knotstore/events/dispatcher.hpp>
#include <knotstore/events/socket_publisher.hpp>
#include <knotstore/events/webhook_publisher.hpp>

using namespace knotstore;
using namespace knotstore::events;
using knotstore::ledger::sha256;

namespace {

    int connectTo(std::uint16_t port) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
            ::close(fd);
            return -1;
        }
        return fd;
    }

    // Reads until a newline arrives or the timeout passes
    std::string readLine(int fd, int timeout_ms = 3000) {
        std::string line;
        char c;
        while (true) {
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, timeout_ms) <= 0)
                return line;
            if (::recv(fd, &c, 1, 0) != 1)
                return line;
            if (c == '\n')
                return line;
            line += c;
        }
    }

    bool waitForSubscribers(const SocketPublisher &publisher, std::size_t count) {
        for (int i = 0; i < 500; ++i) {
            if (publisher.subscriberCount() >= count)
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

    // Every POST fails as if the host were down
    class UnreachableTransport : public HttpTransport {
      public:
        HttpResponse post(const HttpRequest &) override {
            calls_++;
            HttpResponse response;
            response.error = "could not connect to host";
            return response;
        }

        std::uint64_t calls() const { return calls_; }

      private:
        std::atomic<std::uint64_t> calls_{0};
    };

    Event makeEvent(std::uint64_t id, EventPayload payload) {
        Event event;
        event.id = id;
        event.timestamp = 1700000000;
        event.network = "regtest";
        event.node_id = "node-a";
        event.payload = std::move(payload);
        return event;
    }

} // namespace

TEST_CASE("Socket publisher") {
    SocketPublisherConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.topics = {"block", "chain"};

    SocketPublisher publisher(config);

    SUBCASE("Publishing before start fails") {
        auto event = makeEvent(1, BlockAccepted{sha256("b"), 1, 10, 1, 0});
        auto result = publisher.publish(event);
        REQUIRE(result.is_err());
        CHECK(is_error(result.error(), ERR_PUBLISHER_FAILURE));
    }

    SUBCASE("Subscribers receive frames for configured topics") {
        REQUIRE(publisher.start().is_ok());
        REQUIRE(publisher.boundPort() != 0);

        int fd = connectTo(publisher.boundPort());
        REQUIRE(fd >= 0);
        REQUIRE(waitForSubscribers(publisher, 1));

        // Filtered out
        REQUIRE(publisher.publish(makeEvent(1, PeerChanged{"p", "a", true, ""})).is_ok());
        auto block = makeEvent(2, BlockAccepted{sha256("b"), 5, 10, 1, 0});
        REQUIRE(publisher.publish(block).is_ok());

        auto line = readLine(fd);
        CHECK(line.rfind("block ", 0) == 0);
        CHECK(line + "\n" == publisher.frame(block));

        ::close(fd);
        publisher.shutdown();
    }

    SUBCASE("Every subscriber gets its own copy") {
        REQUIRE(publisher.start().is_ok());
        int a = connectTo(publisher.boundPort());
        int b = connectTo(publisher.boundPort());
        REQUIRE(a >= 0);
        REQUIRE(b >= 0);
        REQUIRE(waitForSubscribers(publisher, 2));

        REQUIRE(publisher.publish(makeEvent(3, ChainReorg{sha256("o"), sha256("n"), 4, 5, 3, 1})).is_ok());
        CHECK(readLine(a).rfind("chain ", 0) == 0);
        CHECK(readLine(b).rfind("chain ", 0) == 0);

        ::close(a);
        ::close(b);
        publisher.shutdown();
    }

    SUBCASE("Disconnected subscribers are removed") {
        REQUIRE(publisher.start().is_ok());
        int fd = connectTo(publisher.boundPort());
        REQUIRE(fd >= 0);
        REQUIRE(waitForSubscribers(publisher, 1));
        ::close(fd);

        bool removed = false;
        for (int i = 0; i < 200 && !removed; ++i) {
            CHECK(publisher.publish(makeEvent(10 + i, BlockAccepted{sha256("b"), 1, 10, 1, 0})).is_ok());
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            removed = publisher.subscriberCount() == 0;
        }
        CHECK(removed);
        publisher.shutdown();
    }
}

TEST_CASE("Unreachable webhook does not hold back socket subscribers") {
    SocketPublisherConfig socket_config;
    socket_config.host = "127.0.0.1";
    socket_config.port = 0;
    auto socket = std::make_shared<SocketPublisher>(socket_config);
    REQUIRE(socket->start().is_ok());

    WebhookPublisherConfig webhook_config;
    webhook_config.endpoints = {"http://unreachable.local/hook"};
    webhook_config.retry_attempts = 2;
    webhook_config.backoff_ms = 10000;
    auto transport = std::make_shared<UnreachableTransport>();
    auto webhook = std::make_shared<WebhookPublisher>(webhook_config, transport);

    EventDispatcher dispatcher("regtest", "node-a", 100, 100);
    dispatcher.addPublisher(webhook);
    dispatcher.addPublisher(socket);
    dispatcher.start();

    int fd = connectTo(socket->boundPort());
    REQUIRE(fd >= 0);
    REQUIRE(waitForSubscribers(*socket, 1));

    auto id = dispatcher.post(BlockAccepted{sha256("b"), 7, 10, 1, 0});

    // The webhook is still retrying the same event while the subscriber already has it
    auto line = readLine(fd);
    CHECK(line.rfind("block ", 0) == 0);
    CHECK(line.find("\"id\":" + std::to_string(id)) != std::string::npos);
    for (int i = 0; i < 500 && transport->calls() == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    CHECK(transport->calls() >= 1);
    CHECK(webhook->failures() == 0);

    ::close(fd);
    dispatcher.stop();
    CHECK(webhook->failures() == 1);
}
