#include "core/fault_channel.h"

#include <algorithm>
#include <iostream>

#include "core/errors.h"

void FaultChannel::Subscription::disconnect() {
    auto state = state_.lock();
    state_.reset();
    if (!state) {
        return;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    auto id = id_;
    state->slots.erase(
        std::remove_if(state->slots.begin(), state->slots.end(),
            [id](const std::pair<std::uint64_t, std::shared_ptr<Slot>>& entry) { return entry.first == id; }),
        state->slots.end());
}

bool FaultChannel::Subscription::connected() const {
    auto state = state_.lock();
    if (!state) {
        return false;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    auto id = id_;
    return std::any_of(state->slots.begin(), state->slots.end(),
        [id](const std::pair<std::uint64_t, std::shared_ptr<Slot>>& entry) { return entry.first == id; });
}

FaultChannel::FaultChannel()
    : state_(std::make_shared<State>())
{
}

FaultChannel::Subscription FaultChannel::subscribe(Slot slot) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto id = state_->next_id++;
    state_->slots.emplace_back(id, std::make_shared<Slot>(std::move(slot)));
    return Subscription(state_, id);
}

void FaultChannel::publish(std::exception_ptr error) {
    if (!error) {
        return;
    }

    std::vector<std::shared_ptr<Slot>> snapshot;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        snapshot.reserve(state_->slots.size());
        for (const auto& entry : state_->slots) {
            snapshot.push_back(entry.second);
        }
    }

    if (snapshot.empty()) {
        std::cerr << "⚠️  Unhandled fault with no subscriber: " << describe_exception(error) << std::endl;
        return;
    }
    for (const auto& slot : snapshot) {
        (*slot)(error);
    }
}

std::size_t FaultChannel::subscriber_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->slots.size();
}
