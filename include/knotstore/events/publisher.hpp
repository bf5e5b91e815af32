#pragma once

#include <datapod/datapod.hpp>
#include <string>

#include <knotstore/events/event.hpp>

namespace knotstore::events {

    /// Event sink driven by one dispatcher lane thread
    class IPublisher {
      public:
        virtual ~IPublisher() = default;

        virtual std::string name() const = 0;

        /// Deliver one event. Errors are counted by the dispatcher and never reach the coordinator.
        virtual dp::Result<void, dp::Error> publish(const Event &event) = 0;

        /// Release sockets and wake any sleeping retry; called once before the lane is joined
        virtual void shutdown() {}
    };

} // namespace knotstore::events
