#include <doctest/doctest.h>

#include "core/message_collector.h"

#include <stdexcept>
#include <thread>
#include <vector>

TEST_SUITE("MessageCollector") {
    TEST_CASE("Messages keep their order and severity") {
        MessageCollector collector;
        collector.add_info("one");
        collector.add_warning("two");
        collector.add_error("three");

        auto messages = collector.messages();
        REQUIRE(messages.size() == 3);
        CHECK(messages[0].severity() == Severity::Info);
        CHECK(messages[1].text() == "two");
        CHECK(messages[2].severity() == Severity::Error);
        CHECK_FALSE(messages[2].has_fault());
    }

    TEST_CASE("Severity queries") {
        MessageCollector collector;
        CHECK_FALSE(collector.has_errors());
        CHECK_FALSE(collector.has_warnings());

        collector.add_warning("careful");
        CHECK(collector.has_warnings());
        CHECK_FALSE(collector.has_errors());

        collector.add_error("broken", std::make_exception_ptr(std::runtime_error("cause")));
        CHECK(collector.has_errors());
        CHECK(collector.messages().back().has_fault());
    }

    TEST_CASE("Clear empties the collector") {
        MessageCollector collector;
        collector.add_error("x");
        collector.add_warning("y");
        CHECK(collector.has_errors());
        CHECK(collector.has_warnings());

        collector.clear();
        CHECK(collector.count() == 0);
        CHECK_FALSE(collector.has_errors());
        CHECK_FALSE(collector.has_warnings());
        CHECK(collector.enumerate().size() == 0);
    }

    TEST_CASE("Enumeration works on a snapshot") {
        MessageCollector collector;
        collector.add_info("a");
        collector.add_info("b");

        int visited = 0;
        for (const auto& message : collector.enumerate()) {
            (void)message;
            collector.add_info("added while iterating");
            ++visited;
        }
        CHECK(visited == 2);
        CHECK(collector.count() == 4);
    }

    TEST_CASE("Concurrent adds are all kept") {
        MessageCollector collector;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&collector]() {
                for (int i = 0; i < 250; ++i) {
                    collector.add_info("message");
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        CHECK(collector.count() == 1000);
    }

    TEST_CASE("Severity names") {
        CHECK(to_string(Severity::Warning) == "Warning");
    }
}
