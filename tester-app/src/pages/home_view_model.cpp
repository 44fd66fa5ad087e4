#include "pages/home_view_model.h"

#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

#include "core/background_tasks.h"
#include "core/message_collector.h"
#include "core/progress.h"
#include "services/info_bar_service.h"
#include "services/overlay_service.h"
#include "services/ui_dispatcher.h"
#include "ui/progress_view.h"

HomeViewModel::HomeViewModel(std::shared_ptr<OverlayService> overlay,
                             std::shared_ptr<InfoBarService> info_bar,
                             std::shared_ptr<MessageCollector> messages,
                             std::shared_ptr<BackgroundTasks> tasks,
                             std::shared_ptr<UiDispatcher> dispatcher)
    : overlay_(std::move(overlay))
    , info_bar_(std::move(info_bar))
    , messages_(std::move(messages))
    , tasks_(std::move(tasks))
    , dispatcher_(std::move(dispatcher)) {}

void HomeViewModel::on_appeared() {
    ++appear_count_;
    std::cout << "🔧 Home page appeared (" << appear_count_ << ")" << std::endl;
}

void HomeViewModel::run_long_operation() {
    auto progress = std::make_shared<Progress>();
    progress->set_message("Working...");
    overlay_->show(std::make_shared<ProgressView>(progress));

    auto reporter = std::make_shared<DispatchedProgress>(dispatcher_, progress);
    auto overlay = overlay_;
    auto info_bar = info_bar_;
    auto dispatcher = dispatcher_;
    tasks_->run("long operation", [reporter, overlay, info_bar, dispatcher]() {
        for (int step = 0; step <= 20; ++step) {
            ProgressUpdate update;
            update.value = step * 5.0;
            update.message = "Step " + std::to_string(step) + " of 20";
            reporter->update_progress(update);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        dispatcher->post([overlay, info_bar]() {
            overlay->hide();
            info_bar->show(InfoBarSeverity::Success, "The operation completed.");
        });
    });
}

void HomeViewModel::show_info_bar(InfoBarSeverity severity, const std::string& message) {
    info_bar_->show(severity, message);
}

void HomeViewModel::validate(const HomeInputs& inputs) {
    messages_->clear();

    if (!inputs.name || inputs.name->empty()) {
        messages_->add_error("Name is required.");
    }
    if (!inputs.length) {
        messages_->add_error("Length is required.");
    } else if (*inputs.length <= 0.0) {
        messages_->add_warning("Length should be positive.");
    }
    if (inputs.count && *inputs.count == 0) {
        messages_->add_warning("Count is zero.");
    }
    messages_->add_info("Validation finished.");

    if (messages_->has_errors()) {
        info_bar_->show(InfoBarSeverity::Error, messages_summary());
    } else if (messages_->has_warnings()) {
        info_bar_->show(InfoBarSeverity::Warning, messages_summary());
    } else {
        info_bar_->show(InfoBarSeverity::Success, "All values are valid.");
    }
}

std::string HomeViewModel::messages_summary() const {
    std::ostringstream summary;
    bool first = true;
    for (const auto& message : messages_->enumerate()) {
        if (message.severity() == Severity::Info) {
            continue;
        }
        if (!first) {
            summary << " ";
        }
        summary << message.text();
        first = false;
    }
    return summary.str();
}
