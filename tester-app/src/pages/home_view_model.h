#pragma once

#include <memory>
#include <optional>
#include <string>

#include "services/navigation_page.h"
#include "ui/info_bar.h"

class BackgroundTasks;
class InfoBarService;
class MessageCollector;
class OverlayService;
class UiDispatcher;

struct HomeInputs {
    std::optional<std::string> name;
    std::optional<double> length;
    std::optional<int> count;
};

class HomeViewModel : public NavigationPageViewModel {
public:
    HomeViewModel(std::shared_ptr<OverlayService> overlay,
                  std::shared_ptr<InfoBarService> info_bar,
                  std::shared_ptr<MessageCollector> messages,
                  std::shared_ptr<BackgroundTasks> tasks,
                  std::shared_ptr<UiDispatcher> dispatcher);

    void on_appeared() override;

    // Runs a fake operation on a worker while a progress overlay is shown.
    void run_long_operation();

    void show_info_bar(InfoBarSeverity severity, const std::string& message);

    // Collects validation messages and summarizes them in the info bar.
    void validate(const HomeInputs& inputs);

    std::string messages_summary() const;

private:
    std::shared_ptr<OverlayService> overlay_;
    std::shared_ptr<InfoBarService> info_bar_;
    std::shared_ptr<MessageCollector> messages_;
    std::shared_ptr<BackgroundTasks> tasks_;
    std::shared_ptr<UiDispatcher> dispatcher_;
    int appear_count_ = 0;
};
