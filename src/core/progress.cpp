#include "core/progress.h"

#include "services/ui_dispatcher.h"

void Progress::set_value(double value) {
    set_field(value_, value, "value");
}

void Progress::set_message(const std::string& message) {
    set_field(message_, message, "message");
}

void Progress::set_indeterminate(bool is_indeterminate) {
    set_field(is_indeterminate_, is_indeterminate, "is_indeterminate");
}

void Progress::update_progress(const ProgressUpdate& update) {
    if (update.value) {
        set_value(*update.value);
    }
    if (update.message) {
        set_message(*update.message);
    }
    if (update.is_indeterminate) {
        set_indeterminate(*update.is_indeterminate);
    }
}

DispatchedProgress::DispatchedProgress(std::shared_ptr<UiDispatcher> dispatcher, std::shared_ptr<Progress> progress)
    : dispatcher_(std::move(dispatcher))
    , progress_(std::move(progress))
{
}

void DispatchedProgress::update_progress(const ProgressUpdate& update) {
    std::weak_ptr<Progress> weak_progress = progress_;
    dispatcher_->post([weak_progress, update]() {
        if (auto progress = weak_progress.lock()) {
            progress->update_progress(update);
        }
    });
}
