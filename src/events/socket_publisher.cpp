#include <knotstore/common/error.hpp>
#include <knotstore/common/logger.hpp>
#include <knotstore/events/socket_publisher.hpp>

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace knotstore::events {

    namespace {

        const char *CATEGORY = "socket";

        bool setNonBlocking(int fd) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0)
                return false;
            return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
        }

    } // namespace

    SocketPublisher::SocketPublisher(SocketPublisherConfig config) : config_(std::move(config)) {}

    SocketPublisher::~SocketPublisher() { shutdown(); }

    dp::Result<void, dp::Error> SocketPublisher::start() {
        if (running_)
            return dp::Result<void, dp::Error>::ok();

        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0)
            return dp::Result<void, dp::Error>::err(publisher_failure(dp::String(std::strerror(errno))));

        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(config_.port);
        if (inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
            close(listen_fd_);
            listen_fd_ = -1;
            return dp::Result<void, dp::Error>::err(
                publisher_failure(dp::String(("invalid listen address: " + config_.host).c_str())));
        }

        if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 || listen(listen_fd_, 16) != 0 ||
            !setNonBlocking(listen_fd_)) {
            std::string reason = std::strerror(errno);
            close(listen_fd_);
            listen_fd_ = -1;
            return dp::Result<void, dp::Error>::err(publisher_failure(dp::String(
                ("cannot listen on " + config_.host + ":" + std::to_string(config_.port) + ": " + reason).c_str())));
        }

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
        bound_port_ = ntohs(addr.sin_port);

        if (pipe(wake_fds_) != 0) {
            close(listen_fd_);
            listen_fd_ = -1;
            return dp::Result<void, dp::Error>::err(publisher_failure(dp::String(std::strerror(errno))));
        }
        setNonBlocking(wake_fds_[0]);
        setNonBlocking(wake_fds_[1]);

        running_ = true;
        io_thread_ = std::thread([this] { ioLoop(); });
        KNOTSTORE_LOG_INFO(CATEGORY, "publishing on " + config_.host + ":" + std::to_string(bound_port_));
        return dp::Result<void, dp::Error>::ok();
    }

    void SocketPublisher::shutdown() {
        if (running_.exchange(false)) {
            wake();
            if (io_thread_.joinable())
                io_thread_.join();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sub : subscribers_)
            close(sub.fd);
        subscribers_.clear();
        for (int &fd : wake_fds_) {
            if (fd >= 0)
                close(fd);
            fd = -1;
        }
        if (listen_fd_ >= 0) {
            close(listen_fd_);
            listen_fd_ = -1;
        }
    }

    std::size_t SocketPublisher::subscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

    bool SocketPublisher::wantsTopic(const std::string &topic) const {
        return std::find(config_.topics.begin(), config_.topics.end(), topic) != config_.topics.end();
    }

    std::string SocketPublisher::frame(const Event &event) const { return event.topic() + " " + event.toJson() + "\n"; }

    dp::Result<void, dp::Error> SocketPublisher::publish(const Event &event) {
        if (!running_)
            return dp::Result<void, dp::Error>::err(publisher_failure("socket publisher not started"));
        if (!wantsTopic(event.topic()))
            return dp::Result<void, dp::Error>::ok();

        std::string data = frame(event);
        {
            // Held through wake() so shutdown cannot close the pipe underneath us
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_)
                return dp::Result<void, dp::Error>::err(publisher_failure("socket publisher shut down"));
            for (auto &sub : subscribers_) {
                if (sub.pending.size() >= config_.send_buffer_messages) {
                    auto victim = sub.pending.begin();
                    if (sub.offset > 0)
                        ++victim; // front frame is partially written
                    if (victim != sub.pending.end()) {
                        sub.pending.erase(victim);
                        dropped_frames_++;
                    }
                }
                sub.pending.push_back(data);
            }
            wake();
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void SocketPublisher::wake() {
        if (wake_fds_[1] >= 0) {
            char byte = 1;
            ssize_t n = write(wake_fds_[1], &byte, 1);
            (void)n; // a full pipe already guarantees a wakeup
        }
    }

    void SocketPublisher::acceptPending() {
        while (true) {
            sockaddr_in client{};
            socklen_t len = sizeof(client);
            int fd = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client), &len);
            if (fd < 0)
                return;
            if (!setNonBlocking(fd)) {
                close(fd);
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            subscribers_.push_back(Subscriber{fd, {}, 0});
            KNOTSTORE_LOG_DEBUG(CATEGORY, "subscriber connected (" + std::to_string(subscribers_.size()) + " total)");
        }
    }

    void SocketPublisher::flushSubscriber(Subscriber &sub) {
        while (!sub.pending.empty()) {
            const std::string &front = sub.pending.front();
            ssize_t n = send(sub.fd, front.data() + sub.offset, front.size() - sub.offset, MSG_NOSIGNAL | MSG_DONTWAIT);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    return;
                close(sub.fd);
                sub.fd = -1;
                return;
            }
            sub.offset += static_cast<std::size_t>(n);
            if (sub.offset == front.size()) {
                sub.pending.pop_front();
                sub.offset = 0;
            }
        }
    }

    void SocketPublisher::ioLoop() {
        while (running_) {
            std::vector<pollfd> fds;
            fds.push_back(pollfd{listen_fd_, POLLIN, 0});
            fds.push_back(pollfd{wake_fds_[0], POLLIN, 0});
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto &sub : subscribers_) {
                    short events = POLLIN;
                    if (!sub.pending.empty())
                        events |= POLLOUT;
                    fds.push_back(pollfd{sub.fd, events, 0});
                }
            }

            if (poll(fds.data(), fds.size(), 200) < 0 && errno != EINTR) {
                KNOTSTORE_LOG_ERROR(CATEGORY, std::string("poll failed: ") + std::strerror(errno));
                continue;
            }

            if (fds[1].revents & POLLIN) {
                char drain[64];
                while (read(wake_fds_[0], drain, sizeof(drain)) > 0) {
                }
            }
            if (fds[0].revents & POLLIN)
                acceptPending();

            std::lock_guard<std::mutex> lock(mutex_);
            for (std::size_t i = 2; i < fds.size(); ++i) {
                auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                                       [&](const Subscriber &s) { return s.fd == fds[i].fd; });
                if (it == subscribers_.end())
                    continue;
                if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                    close(it->fd);
                    it->fd = -1;
                    continue;
                }
                if (fds[i].revents & POLLIN) {
                    char buf[256];
                    ssize_t n = recv(it->fd, buf, sizeof(buf), MSG_DONTWAIT);
                    if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
                        close(it->fd);
                        it->fd = -1;
                        continue;
                    }
                }
            }
            // Frames queued since poll() was armed are flushed here as well
            for (auto &sub : subscribers_) {
                if (sub.fd >= 0 && !sub.pending.empty())
                    flushSubscriber(sub);
            }
            auto before = subscribers_.size();
            subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                              [](const Subscriber &s) { return s.fd < 0; }),
                               subscribers_.end());
            if (subscribers_.size() != before)
                KNOTSTORE_LOG_DEBUG(CATEGORY, "subscriber disconnected");
        }
    }

} // namespace knotstore::events
