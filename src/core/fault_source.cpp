#include "core/fault_source.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <vector>

#include "core/errors.h"
#include "core/fault_channel.h"

namespace {
struct TerminateRegistry {
    std::mutex mutex;
    std::vector<std::weak_ptr<FaultChannel>> channels;
    std::terminate_handler previous = nullptr;
    bool installed = false;
};

TerminateRegistry& registry() {
    static TerminateRegistry instance;
    return instance;
}
}

TerminateFaultSource::~TerminateFaultSource() {
    detach();
}

void TerminateFaultSource::attach(std::shared_ptr<FaultChannel> channel) {
    if (attached_ || !channel) {
        return;
    }

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    if (!reg.installed) {
        reg.previous = std::set_terminate(&TerminateFaultSource::on_terminate);
        reg.installed = true;
    }
    reg.channels.push_back(channel);
    channel_ = std::move(channel);
    attached_ = true;
}

void TerminateFaultSource::detach() {
    if (!attached_) {
        return;
    }

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    auto* mine = channel_.get();
    auto it = std::find_if(reg.channels.begin(), reg.channels.end(),
        [mine](const std::weak_ptr<FaultChannel>& weak) {
            return weak.lock().get() == mine;
        });
    if (it != reg.channels.end()) {
        reg.channels.erase(it);
    }
    reg.channels.erase(
        std::remove_if(reg.channels.begin(), reg.channels.end(),
            [](const std::weak_ptr<FaultChannel>& weak) { return weak.expired(); }),
        reg.channels.end());

    if (reg.channels.empty() && reg.installed) {
        std::set_terminate(reg.previous);
        reg.previous = nullptr;
        reg.installed = false;
    }

    channel_.reset();
    attached_ = false;
}

void TerminateFaultSource::on_terminate() {
    auto& reg = registry();
    std::vector<std::shared_ptr<FaultChannel>> channels;
    std::terminate_handler previous = nullptr;
    {
        std::lock_guard<std::mutex> lock(reg.mutex);
        for (const auto& weak : reg.channels) {
            if (auto channel = weak.lock()) {
                channels.push_back(channel);
            }
        }
        previous = reg.previous;
    }

    if (auto error = std::current_exception()) {
        std::cerr << "💥 Unhandled exception: " << describe_exception(error) << std::endl;
        for (const auto& channel : channels) {
            channel->publish(error);
        }
    }

    if (previous) {
        previous();
    }
    std::abort();
}
