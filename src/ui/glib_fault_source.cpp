#include "ui/glib_fault_source.h"

#include <glibmm.h>
#include <iostream>

#include "core/errors.h"
#include "core/fault_channel.h"

GlibFaultSource::~GlibFaultSource() {
    detach();
}

void GlibFaultSource::attach(std::shared_ptr<FaultChannel> channel) {
    if (connection_.connected() || !channel) {
        return;
    }

    connection_ = Glib::add_exception_handler([channel]() {
        // Called from inside glibmm's catch block.
        try {
            throw;
        } catch (...) {
            auto error = std::current_exception();
            std::cerr << "⚠️  Unhandled exception in signal handler: " << describe_exception(error) << std::endl;
            channel->publish(error);
        }
    });
}

void GlibFaultSource::detach() {
    connection_.disconnect();
}
