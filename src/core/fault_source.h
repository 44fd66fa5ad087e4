#pragma once

#include <exception>
#include <memory>

class FaultChannel;

// A process-wide origin of faults that the bootstrapper can route into its channel.
class FaultSource {
public:
    virtual ~FaultSource() = default;

    virtual void attach(std::shared_ptr<FaultChannel> channel) = 0;
    virtual void detach() = 0;
};

// Forwards exceptions reaching std::terminate. C++ cannot resume after terminate,
// so the previous handler still runs once every attached channel saw the fault.
class TerminateFaultSource : public FaultSource {
public:
    TerminateFaultSource() = default;
    ~TerminateFaultSource() override;

    void attach(std::shared_ptr<FaultChannel> channel) override;
    void detach() override;

    bool is_attached() const { return attached_; }

private:
    static void on_terminate();

    std::shared_ptr<FaultChannel> channel_;
    bool attached_ = false;
};
