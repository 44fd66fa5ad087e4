#pragma once

#include <memory>
#include <string>

#include "core/errors.h"
#include "services/content_host.h"
#include "services/ui_dispatcher.h"

// Single-slot presenter: show() hides whatever is displayed, then assigns
// the new content on the UI thread.
template <typename Content>
class SlotPresenter {
public:
    SlotPresenter(std::shared_ptr<UiDispatcher> dispatcher, std::string host_name)
        : dispatcher_(std::move(dispatcher))
        , host_name_(std::move(host_name)) {}

    void set_host(std::shared_ptr<ContentHost<Content>> host) {
        host_ = std::move(host);
    }

    bool has_host() const { return static_cast<bool>(host_); }
    const std::shared_ptr<ContentHost<Content>>& host() const { return host_; }

    void ensure_host() const {
        if (!host_) {
            throw InvalidStateError("The " + host_name_ + " host has not been set. "
                                    "Set the host control before calling show().");
        }
    }

    void show(std::shared_ptr<Content> content) {
        ensure_host();
        hide();

        auto host = host_;
        dispatcher_->invoke([host, content]() {
            host->set_content(content);
        });
    }

    // No-op without a host.
    void hide() {
        if (!host_) {
            return;
        }

        auto host = host_;
        dispatcher_->invoke([host]() {
            host->set_content(nullptr);
        });
    }

    std::shared_ptr<Content> current() const {
        return host_ ? host_->get_content() : nullptr;
    }

    const std::shared_ptr<UiDispatcher>& dispatcher() const { return dispatcher_; }

private:
    std::shared_ptr<UiDispatcher> dispatcher_;
    std::shared_ptr<ContentHost<Content>> host_;
    std::string host_name_;
};
