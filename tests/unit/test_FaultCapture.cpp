#include <doctest/doctest.h>

#include "core/background_tasks.h"
#include "core/errors.h"
#include "core/fault_channel.h"
#include "core/fault_source.h"

#include <atomic>
#include <exception>
#include <future>
#include <stdexcept>
#include <thread>

namespace {
void custom_terminate() {
    std::abort();
}
}

TEST_SUITE("FaultChannel") {
    TEST_CASE("Every subscriber sees each fault") {
        FaultChannel channel;
        int first = 0;
        int second = 0;
        auto a = channel.subscribe([&](std::exception_ptr) { ++first; });
        auto b = channel.subscribe([&](std::exception_ptr) { ++second; });
        CHECK(channel.subscriber_count() == 2);

        channel.publish(std::make_exception_ptr(std::runtime_error("x")));
        CHECK(first == 1);
        CHECK(second == 1);

        a.disconnect();
        channel.publish(std::make_exception_ptr(std::runtime_error("y")));
        CHECK(first == 1);
        CHECK(second == 2);
        CHECK(channel.subscriber_count() == 1);
        b.disconnect();
    }

    TEST_CASE("Null faults and faults without subscribers are dropped") {
        FaultChannel channel;
        CHECK_NOTHROW(channel.publish(nullptr));
        CHECK_NOTHROW(channel.publish(std::make_exception_ptr(std::runtime_error("lost"))));
    }

    TEST_CASE("A subscriber blocked on another thread does not hold up publishers") {
        FaultChannel channel;
        std::promise<void> entered;
        std::promise<void> release;
        auto entered_future = entered.get_future();
        auto release_future = release.get_future().share();
        std::atomic<int> from_main{0};

        auto subscription = channel.subscribe([&](std::exception_ptr error) {
            if (describe_exception(error) == "worker") {
                entered.set_value();
                release_future.wait();
            } else {
                ++from_main;
            }
        });

        std::thread worker([&]() {
            channel.publish(std::make_exception_ptr(std::runtime_error("worker")));
        });
        entered_future.wait();

        channel.publish(std::make_exception_ptr(std::runtime_error("main")));
        CHECK(from_main.load() == 1);

        release.set_value();
        worker.join();
        subscription.disconnect();
    }

    TEST_CASE("Subscribers may subscribe and disconnect from inside a publish") {
        FaultChannel channel;
        int late = 0;
        FaultChannel::Subscription late_subscription;
        FaultChannel::Subscription first;
        first = channel.subscribe([&](std::exception_ptr) {
            first.disconnect();
            late_subscription = channel.subscribe([&](std::exception_ptr) { ++late; });
        });

        channel.publish(std::make_exception_ptr(std::runtime_error("one")));
        CHECK_FALSE(first.connected());
        CHECK(late == 0);
        CHECK(channel.subscriber_count() == 1);

        channel.publish(std::make_exception_ptr(std::runtime_error("two")));
        CHECK(late == 1);
        late_subscription.disconnect();
        CHECK(channel.subscriber_count() == 0);
    }

    TEST_CASE("A subscription outliving its channel disconnects quietly") {
        FaultChannel::Subscription subscription;
        {
            FaultChannel channel;
            subscription = channel.subscribe([](std::exception_ptr) {});
            CHECK(subscription.connected());
        }
        CHECK_FALSE(subscription.connected());
        CHECK_NOTHROW(subscription.disconnect());
    }

    TEST_CASE("describe_exception") {
        CHECK(describe_exception(std::make_exception_ptr(std::logic_error("bad"))) == "bad");
        CHECK(describe_exception(nullptr).size() > 0);
    }
}

TEST_SUITE("TerminateFaultSource") {
    TEST_CASE("Attach installs a handler and the last detach restores the previous one") {
        auto previous = std::set_terminate(&custom_terminate);
        auto channel = std::make_shared<FaultChannel>();

        {
            TerminateFaultSource first;
            TerminateFaultSource second;
            first.attach(channel);
            second.attach(channel);
            CHECK(first.is_attached());
            CHECK(std::get_terminate() != &custom_terminate);

            first.detach();
            CHECK_FALSE(first.is_attached());
            CHECK(std::get_terminate() != &custom_terminate);

            second.detach();
            CHECK(std::get_terminate() == &custom_terminate);
        }

        std::set_terminate(previous);
    }

    TEST_CASE("Attaching without a channel is ignored") {
        TerminateFaultSource source;
        source.attach(nullptr);
        CHECK_FALSE(source.is_attached());
    }
}

TEST_SUITE("BackgroundTasks") {
    TEST_CASE("Work runs off the calling thread") {
        auto channel = std::make_shared<FaultChannel>();
        BackgroundTasks tasks(channel);
        std::atomic<bool> ran{false};
        auto caller = std::this_thread::get_id();
        std::atomic<bool> other_thread{false};

        tasks.run("work", [&]() {
            other_thread = std::this_thread::get_id() != caller;
            ran = true;
        });
        tasks.wait_idle();

        CHECK(ran.load());
        CHECK(other_thread.load());
        CHECK(tasks.active_count() == 0);
    }

    TEST_CASE("An escaping exception is published instead of terminating") {
        auto channel = std::make_shared<FaultChannel>();
        std::atomic<int> faults{0};
        auto connection = channel->subscribe([&](std::exception_ptr) { ++faults; });

        BackgroundTasks tasks(channel);
        tasks.run("failing", []() { throw std::runtime_error("worker"); });
        tasks.run("fine", []() {});
        tasks.wait_idle();

        CHECK(faults.load() == 1);
        connection.disconnect();
    }
}
