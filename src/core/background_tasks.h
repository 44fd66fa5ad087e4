#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

class FaultChannel;

// Runs work on detached worker threads. A fault escaping the work is marked
// observed and published on the channel instead of terminating the process.
class BackgroundTasks {
public:
    explicit BackgroundTasks(std::shared_ptr<FaultChannel> faults);

    void run(const std::string& name, std::function<void()> work);

    // Blocks until every task started so far has finished.
    void wait_idle();

    int active_count() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable idle;
        int active = 0;
    };

    std::shared_ptr<FaultChannel> faults_;
    std::shared_ptr<State> state_;
};
