#pragma once

#include <stdexcept>
#include <string>

// Operation invoked outside of the lifecycle state it is valid in.
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what) : std::logic_error(what) {}
};

// Operation invoked after the owner was torn down.
class DisposedError : public std::logic_error {
public:
    explicit DisposedError(const std::string& object_name)
        : std::logic_error("Cannot access a disposed object: " + object_name)
        , object_name_(object_name) {}

    const std::string& object_name() const { return object_name_; }

private:
    std::string object_name_;
};

// Best effort text for a captured exception.
std::string describe_exception(std::exception_ptr error);
