#pragma once

#include <memory>

// A container that displays at most one piece of content.
template <typename Content>
class ContentHost {
public:
    virtual ~ContentHost() = default;

    // Null clears the slot.
    virtual void set_content(std::shared_ptr<Content> content) = 0;
    virtual std::shared_ptr<Content> get_content() const = 0;
};
