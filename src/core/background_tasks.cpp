#include "core/background_tasks.h"

#include <iostream>
#include <thread>

#include "core/errors.h"
#include "core/fault_channel.h"

BackgroundTasks::BackgroundTasks(std::shared_ptr<FaultChannel> faults)
    : faults_(std::move(faults))
    , state_(std::make_shared<State>())
{
}

void BackgroundTasks::run(const std::string& name, std::function<void()> work) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->active;
    }
    std::thread worker([name, work = std::move(work), faults = faults_, state = state_]() {
        try {
            work();
        } catch (...) {
            auto error = std::current_exception();
            std::cerr << "⚠️  Background task '" << name << "' failed: " << describe_exception(error) << std::endl;
            if (faults) {
                faults->publish(error);
            }
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        --state->active;
        state->idle.notify_all();
    });
    worker.detach();
}

void BackgroundTasks::wait_idle() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->idle.wait(lock, [this]() { return state_->active == 0; });
}

int BackgroundTasks::active_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->active;
}
