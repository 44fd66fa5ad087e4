#include "services/ui_dispatcher.h"

#include <future>
#include <iostream>

#include "core/errors.h"
#include "core/fault_channel.h"

UiDispatcher::UiDispatcher(Glib::RefPtr<Glib::MainContext> context)
    : context_(std::move(context))
    , owner_thread_(std::this_thread::get_id())
{
}

void UiDispatcher::invoke(std::function<void()> work) {
    if (is_owner_thread()) {
        work();
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto result = done->get_future();
    context_->invoke([work = std::move(work), done]() -> bool {
        try {
            work();
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
        return false;
    });
    result.get();
}

void UiDispatcher::post(std::function<void()> work) {
    auto faults = faults_;
    context_->signal_idle().connect_once([work = std::move(work), faults]() {
        try {
            work();
        } catch (...) {
            auto error = std::current_exception();
            if (faults) {
                faults->publish(error);
            } else {
                std::cerr << "⚠️  Dispatched work failed: " << describe_exception(error) << std::endl;
            }
        }
    });
}
