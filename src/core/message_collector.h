#pragma once

#include <exception>
#include <mutex>
#include <string>
#include <vector>

enum class Severity {
    Info,
    Warning,
    Error
};

std::string to_string(Severity severity);

class Message {
public:
    Message(Severity severity, std::string text, std::exception_ptr fault = nullptr)
        : severity_(severity)
        , text_(std::move(text))
        , fault_(std::move(fault)) {}

    Severity severity() const { return severity_; }
    const std::string& text() const { return text_; }
    const std::exception_ptr& fault() const { return fault_; }
    bool has_fault() const { return static_cast<bool>(fault_); }

private:
    Severity severity_;
    std::string text_;
    std::exception_ptr fault_;
};

// Thread-safe list of messages. Enumeration works on a snapshot.
class MessageCollector {
public:
    using Snapshot = std::vector<Message>;

    void add(Severity severity, const std::string& text, std::exception_ptr fault = nullptr);
    void add_info(const std::string& text) { add(Severity::Info, text); }
    void add_warning(const std::string& text) { add(Severity::Warning, text); }
    void add_error(const std::string& text) { add(Severity::Error, text); }
    void add_error(const std::string& text, std::exception_ptr fault) { add(Severity::Error, text, std::move(fault)); }

    void clear();

    bool has_errors() const;
    bool has_warnings() const;
    std::size_t count() const;

    Snapshot messages() const;

    // Range-for over a snapshot taken when the iteration starts.
    class Range {
    public:
        explicit Range(Snapshot snapshot) : snapshot_(std::move(snapshot)) {}
        Snapshot::const_iterator begin() const { return snapshot_.begin(); }
        Snapshot::const_iterator end() const { return snapshot_.end(); }
        std::size_t size() const { return snapshot_.size(); }

    private:
        Snapshot snapshot_;
    };

    Range enumerate() const { return Range(messages()); }

private:
    bool any_of(Severity severity) const;

    mutable std::mutex mutex_;
    std::vector<Message> messages_;
};
