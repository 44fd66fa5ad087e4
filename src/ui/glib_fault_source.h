#pragma once

#include <sigc++/sigc++.h>
#include <memory>

#include "core/fault_source.h"

// Exceptions escaping signal handlers on the GLib main loop. They are marked
// handled, so the loop keeps running, and forwarded to the channel.
class GlibFaultSource : public FaultSource {
public:
    ~GlibFaultSource() override;

    void attach(std::shared_ptr<FaultChannel> channel) override;
    void detach() override;

private:
    sigc::connection connection_;
};
