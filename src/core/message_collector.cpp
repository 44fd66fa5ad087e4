#include "core/message_collector.h"

#include <algorithm>

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::Info: return "Info";
        case Severity::Warning: return "Warning";
        case Severity::Error: return "Error";
    }
    return "Unknown";
}

void MessageCollector::add(Severity severity, const std::string& text, std::exception_ptr fault) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.emplace_back(severity, text, std::move(fault));
}

void MessageCollector::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.clear();
}

bool MessageCollector::has_errors() const {
    return any_of(Severity::Error);
}

bool MessageCollector::has_warnings() const {
    return any_of(Severity::Warning);
}

std::size_t MessageCollector::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

MessageCollector::Snapshot MessageCollector::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

bool MessageCollector::any_of(Severity severity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(messages_.begin(), messages_.end(),
        [severity](const Message& message) { return message.severity() == severity; });
}
