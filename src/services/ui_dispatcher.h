#pragma once

#include <glibmm.h>
#include <functional>
#include <memory>
#include <thread>

class FaultChannel;

// Single-threaded task queue bound to the main context of the thread that
// created it. Every UI-affecting operation goes through here.
class UiDispatcher {
public:
    explicit UiDispatcher(Glib::RefPtr<Glib::MainContext> context = Glib::MainContext::get_default());

    UiDispatcher(const UiDispatcher&) = delete;
    UiDispatcher& operator=(const UiDispatcher&) = delete;

    bool is_owner_thread() const { return std::this_thread::get_id() == owner_thread_; }

    // Send and await. Runs inline on the owner thread; from any other thread
    // the work is queued and the caller blocks until it ran. Exceptions thrown
    // by the work are rethrown to the caller. The owner thread must be running
    // the main context for a cross-thread invoke to complete.
    void invoke(std::function<void()> work);

    // Fire and forget, always deferred to the next main context iteration.
    void post(std::function<void()> work);

    // Receives exceptions escaping posted work. Without one they are logged.
    void set_fault_channel(std::shared_ptr<FaultChannel> faults) { faults_ = std::move(faults); }

    Glib::RefPtr<Glib::MainContext> context() const { return context_; }

private:
    Glib::RefPtr<Glib::MainContext> context_;
    std::thread::id owner_thread_;
    std::shared_ptr<FaultChannel> faults_;
};
