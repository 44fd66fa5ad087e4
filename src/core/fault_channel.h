#pragma once

#include <sigc++/sigc++.h>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

// Multi-subscriber channel for faults that escaped their originating context.
// publish() may be called from any thread; subscribers run on the publishing
// thread, outside the channel lock, so a subscriber may block on another thread
// that publishes in turn.
class FaultChannel {
    struct State;

public:
    using Slot = sigc::slot<void(std::exception_ptr)>;

    // Handle returned by subscribe(). Copies refer to the same subscription.
    // Outlives the channel safely; disconnecting then does nothing.
    class Subscription {
    public:
        Subscription() = default;

        void disconnect();
        bool connected() const;

    private:
        friend class FaultChannel;
        Subscription(std::weak_ptr<State> state, std::uint64_t id)
            : state_(std::move(state)), id_(id) {}

        std::weak_ptr<State> state_;
        std::uint64_t id_ = 0;
    };

    FaultChannel();
    FaultChannel(const FaultChannel&) = delete;
    FaultChannel& operator=(const FaultChannel&) = delete;

    Subscription subscribe(Slot slot);
    void publish(std::exception_ptr error);

    std::size_t subscriber_count() const;

private:
    struct State {
        std::mutex mutex;
        std::uint64_t next_id = 1;
        std::vector<std::pair<std::uint64_t, std::shared_ptr<Slot>>> slots;
    };

    std::shared_ptr<State> state_;
};
