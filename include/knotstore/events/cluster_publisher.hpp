#pragma once

#include <memory>

#include <knotstore/common/config.hpp>
#include <knotstore/events/http_transport.hpp>
#include <knotstore/events/publisher.hpp>

namespace knotstore::events {

    /// Records events in a Kubernetes-style cluster event API, one POST per event, no retry
    class ClusterEventPublisher : public IPublisher {
      public:
        ClusterEventPublisher(ClusterPublisherConfig config, std::shared_ptr<HttpTransport> transport);

        std::string name() const override { return "cluster"; }
        dp::Result<void, dp::Error> publish(const Event &event) override;

        /// Cluster event record for this event; exposed for inspection
        std::string buildRecord(const Event &event) const;
        std::string endpoint() const;
        bool accepts(const Event &event) const;

      private:
        ClusterPublisherConfig config_;
        std::shared_ptr<HttpTransport> transport_;
    };

} // namespace knotstore::events
