#include <gtest/gtest.h>
#include "access_trace.hpp"
#include "utils/test_utils.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

class ThreadSafetyTest : public ::testing::Test {};

TEST_F(ThreadSafetyTest, ConcurrentRenderOfSharedFormat) {
    atrace::TagRegistry registry;
    registry.registerRequestTag("P", [](const atrace::RequestView& r) { return r.path; });
    const atrace::AccessFormat format("%M %{P}xi %s %b(bytes)");

    const int threadCount = 8;
    const int perThread = 500;
    std::atomic<int> mismatches(0);
    std::vector<std::thread> threads;

    for (int t = 0; t < threadCount; ++t) {
        threads.push_back(std::thread([&, t]() {
            atrace::RequestView request = TestUtils::sampleRequest();
            request.path = "/t" + std::to_string(t);
            for (int i = 0; i < perThread; ++i) {
                atrace::ResponseView response(200, static_cast<uint64_t>(i));
                atrace::RenderContext ctx(request, response, TestUtils::sampleStartTime(),
                                          std::chrono::nanoseconds(i));
                std::string expected = "GET " + request.path + " 200 " + std::to_string(i) + "(bytes)";
                if (format.render(ctx, registry) != expected) ++mismatches;
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();

    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(ThreadSafetyTest, ConcurrentHandleKeepsSpansApart) {
    std::mutex mtx;
    std::vector<atrace::LogEntry> entries;
    std::shared_ptr<atrace::Logger> logger = std::make_shared<atrace::Logger>(atrace::LogLevel::TRACE, false);
    logger->addCustomSink(atrace::detail::make_unique<atrace::CallbackSink>(
        atrace::CallbackSink::EntryCallback([&](const atrace::LogEntry& e) {
            std::lock_guard<std::mutex> lock(mtx);
            entries.push_back(e);
        })));

    std::atomic<int> nextId(0);
    atrace::AccessLogger access = atrace::AccessLogger::configure()
        .format("%U")
        .spanFactory([&nextId](const atrace::RequestView&) {
            return atrace::Span("R", std::to_string(++nextId));
        })
        .logger(logger)
        .build();

    const int threadCount = 6;
    const int perThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.push_back(std::thread([&, t]() {
            for (int i = 0; i < perThread; ++i) {
                atrace::RequestView request = TestUtils::sampleRequest();
                request.path = "/t" + std::to_string(t) + "/" + std::to_string(i);
                access.handle(request, [&logger](const atrace::RequestView& r) {
                    logger->debug(r.path);
                    return atrace::ResponseView(200, 0);
                });
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();
    logger->flush();

    std::lock_guard<std::mutex> lock(mtx);
    ASSERT_EQ(entries.size(), static_cast<size_t>(2 * threadCount * perThread));

    // Every handler line and its access line carry the same span id.
    std::map<std::string, std::set<std::string> > idsByPath;
    std::set<std::string> allIds;
    for (size_t i = 0; i < entries.size(); ++i) {
        ASSERT_TRUE(entries[i].hasSpan());
        idsByPath[entries[i].message].insert(entries[i].span.id());
        allIds.insert(entries[i].span.id());
    }
    EXPECT_EQ(idsByPath.size(), static_cast<size_t>(threadCount * perThread));
    for (std::map<std::string, std::set<std::string> >::const_iterator it = idsByPath.begin();
         it != idsByPath.end(); ++it) {
        EXPECT_EQ(it->second.size(), 1u) << it->first;
    }
    EXPECT_EQ(allIds.size(), static_cast<size_t>(threadCount * perThread));
}

TEST_F(ThreadSafetyTest, BuildAddsSinksWhileSharedLoggerIsWriting) {
    std::atomic<int> firstSinkCount(0);
    std::shared_ptr<atrace::Logger> logger = std::make_shared<atrace::Logger>(atrace::LogLevel::TRACE, false);
    logger->addCustomSink(atrace::detail::make_unique<atrace::CallbackSink>(
        atrace::CallbackSink::EntryCallback([&firstSinkCount](const atrace::LogEntry&) { ++firstSinkCount; })));

    std::atomic<bool> done(false);
    std::atomic<int> written(0);
    std::thread writer([&]() {
        while (!done.load()) {
            logger->info("background");
            ++written;
        }
    });

    std::atomic<int> addedSinkCount(0);
    const int builds = 50;
    for (int i = 0; i < builds; ++i) {
        atrace::AccessLogger access = atrace::AccessLogger::configure()
            .format("%s")
            .writeTo(atrace::detail::make_unique<atrace::CallbackSink>(
                atrace::CallbackSink::EntryCallback([&addedSinkCount](const atrace::LogEntry&) {
                    ++addedSinkCount;
                })))
            .logger(logger)
            .build();
        EXPECT_EQ(access.logger(), logger);
    }

    done = true;
    writer.join();
    logger->flush();

    EXPECT_EQ(logger->sinkCount(), static_cast<size_t>(builds + 1));
    EXPECT_EQ(firstSinkCount.load(), written.load());
}

TEST_F(ThreadSafetyTest, ConcurrentLoggingFromManyThreads) {
    std::atomic<int> received(0);
    atrace::Logger logger(atrace::LogLevel::TRACE, false);
    logger.addCustomSink(atrace::detail::make_unique<atrace::CallbackSink>(
        atrace::CallbackSink::EntryCallback([&received](const atrace::LogEntry&) { ++received; })));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.push_back(std::thread([&logger]() {
            for (int i = 0; i < 250; ++i) logger.info("line");
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();
    logger.flush();

    EXPECT_EQ(received.load(), 1000);
}
