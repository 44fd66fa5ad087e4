#pragma once

#include <sigc++/sigc++.h>
#include <memory>
#include <optional>
#include <string>

struct ProgressUpdate {
    std::optional<double> value;
    std::optional<std::string> message;
    std::optional<bool> is_indeterminate;
};

// Anything long-running work can report to.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void update_progress(const ProgressUpdate& update) = 0;
};

// UI-side progress state. Not thread safe: mutate it from the UI thread, or
// report through a DispatchedProgress.
class Progress : public ProgressReporter {
public:
    double value() const { return value_; }
    const std::string& message() const { return message_; }
    bool is_indeterminate() const { return is_indeterminate_; }

    void set_value(double value);
    void set_message(const std::string& message);
    void set_indeterminate(bool is_indeterminate);

    // Applies only the fields present in the update.
    void update_progress(const ProgressUpdate& update) override;

    // Emitted with the property name ("value", "message", "is_indeterminate")
    // whenever a property actually changes.
    sigc::signal<void(const std::string&)>& signal_property_changed() { return signal_property_changed_; }

private:
    template <typename T>
    bool set_field(T& field, const T& value, const char* name) {
        if (field == value) {
            return false;
        }
        field = value;
        signal_property_changed_.emit(name);
        return true;
    }

    double value_ = 0.0;
    std::string message_;
    bool is_indeterminate_ = false;
    sigc::signal<void(const std::string&)> signal_property_changed_;
};

class UiDispatcher;

// Reporter usable from worker threads: every update is posted to the UI
// thread before it touches the Progress.
class DispatchedProgress : public ProgressReporter {
public:
    DispatchedProgress(std::shared_ptr<UiDispatcher> dispatcher, std::shared_ptr<Progress> progress);

    void update_progress(const ProgressUpdate& update) override;

private:
    std::shared_ptr<UiDispatcher> dispatcher_;
    std::shared_ptr<Progress> progress_;
};
