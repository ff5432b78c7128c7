#include "portico/http/AbortSignal.h"
#include "portico/http/BodyStream.h"
#include "portico/http/Errors.h"
#include "portico/common/Logger.h"

#include <cassert>
#include <string>
#include <thread>
#include <vector>

using namespace portico::http;
using namespace portico::common;

// Reads synchronously available results until the stream has nothing more to give.
static std::vector<BodyStream::ReadResult> Drain(const std::shared_ptr<BodyStream>& s) {
    std::vector<BodyStream::ReadResult> out;
    bool more = true;
    while (more) {
        bool delivered = false;
        s->Read([&](BodyStream::ReadResult r) {
            delivered = true;
            more = r.status == BodyStream::ReadStatus::kChunk;
            out.push_back(std::move(r));
        });
        if (!delivered) break;
    }
    return out;
}

void testOrderAndEnd() {
    auto s = std::make_shared<BodyStream>();
    assert(s->Push("A"));
    assert(s->Push(""));
    assert(s->Push("B"));
    s->Close();
    assert(!s->Push("late"));

    auto results = Drain(s);
    assert(results.size() == 3);
    assert(results[0].data == "A");
    assert(results[1].data == "B");
    assert(results[2].status == BodyStream::ReadStatus::kEnd);
    LOG_INFO << "Order and end PASS";
}

void testReadAfterEndIsMisuse() {
    auto s = BodyStream::FromChunks({"x"});
    Drain(s);
    bool threw = false;
    try {
        s->Read([](BodyStream::ReadResult) {});
    } catch (const StreamUsageError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        s->ReadAll([](std::string, std::exception_ptr) {});
    } catch (const StreamUsageError&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "Exhausted stream PASS";
}

void testSecondPendingReadIsMisuse() {
    auto s = std::make_shared<BodyStream>();
    s->Read([](BodyStream::ReadResult) {});
    bool threw = false;
    try {
        s->Read([](BodyStream::ReadResult) {});
    } catch (const StreamUsageError&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "Concurrent read PASS";
}

void testPendingReadCompletedByPush() {
    auto s = std::make_shared<BodyStream>();
    std::string got;
    s->Read([&](BodyStream::ReadResult r) {
        assert(r.status == BodyStream::ReadStatus::kChunk);
        got = r.data;
    });
    assert(got.empty());
    s->Push("hello");
    assert(got == "hello");

    bool ended = false;
    s->Read([&](BodyStream::ReadResult r) { ended = r.status == BodyStream::ReadStatus::kEnd; });
    assert(!ended);
    s->Close();
    assert(ended);
    LOG_INFO << "Pending read PASS";
}

void testFailReachesPendingAndFutureReads() {
    auto s = std::make_shared<BodyStream>();
    s->Push("queued");
    s->Fail(std::make_exception_ptr(AbortError()));

    BodyStream::ReadResult first{BodyStream::ReadStatus::kChunk, "", nullptr};
    s->Read([&](BodyStream::ReadResult r) { first = std::move(r); });
    assert(first.status == BodyStream::ReadStatus::kError);
    assert(DescribeError(first.error) == "request aborted by client");

    auto pending = std::make_shared<BodyStream>();
    bool sawError = false;
    pending->Read([&](BodyStream::ReadResult r) {
        sawError = r.status == BodyStream::ReadStatus::kError;
    });
    pending->Fail(std::make_exception_ptr(AbortError()));
    assert(sawError);
    LOG_INFO << "Fail PASS";
}

void testReadAll() {
    auto s = std::make_shared<BodyStream>();
    s->Push("ab");
    std::string body;
    bool done = false;
    s->ReadAll([&](std::string b, std::exception_ptr e) {
        assert(!e);
        body = std::move(b);
        done = true;
    });
    assert(!done);
    s->Push("cd");
    s->Close();
    assert(done);
    assert(body == "abcd");

    auto failed = std::make_shared<BodyStream>();
    std::exception_ptr error;
    failed->ReadAll([&](std::string, std::exception_ptr e) { error = e; });
    failed->Fail(std::make_exception_ptr(AbortError()));
    assert(error);
    LOG_INFO << "ReadAll PASS";
}

void testHighWaterMarkAndDrain() {
    auto s = std::make_shared<BodyStream>(8);
    int drains = 0;
    s->SetDrainCallback([&] { ++drains; });
    s->Push("12345");
    assert(!s->full());
    s->Push("6789");
    assert(s->full());
    assert(s->bufferedBytes() == 9);

    s->Read([](BodyStream::ReadResult) {});
    assert(!s->full());
    assert(drains == 1);
    s->Read([](BodyStream::ReadResult) {});
    assert(drains == 1);
    LOG_INFO << "High-water mark PASS";
}

void testCancelReleases() {
    auto s = std::make_shared<BodyStream>();
    s->Push("buffered");
    s->Cancel();
    assert(s->cancelled());
    assert(s->bufferedBytes() == 0);
    assert(!s->Push("more"));
    LOG_INFO << "Cancel PASS";
}

void testCrossThreadProducer() {
    auto s = std::make_shared<BodyStream>(1 << 20);
    std::thread producer([s] {
        for (int i = 0; i < 100; ++i) s->Push(std::to_string(i) + ",");
        s->Close();
    });
    producer.join();
    std::string all;
    for (const auto& r : Drain(s)) all += r.data;
    std::string expected;
    for (int i = 0; i < 100; ++i) expected += std::to_string(i) + ",";
    assert(all == expected);
    LOG_INFO << "Cross-thread producer PASS";
}

void testAbortSignal() {
    AbortSignal signal;
    int calls = 0;
    signal.OnAbort([&] { ++calls; });
    assert(!signal.aborted());
    assert(signal.Abort());
    assert(!signal.Abort());
    assert(signal.aborted());
    assert(calls == 1);
    signal.OnAbort([&] { ++calls; });
    assert(calls == 2);
    LOG_INFO << "AbortSignal PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testOrderAndEnd();
    testReadAfterEndIsMisuse();
    testSecondPendingReadIsMisuse();
    testPendingReadCompletedByPush();
    testFailReachesPendingAndFutureReads();
    testReadAll();
    testHighWaterMarkAndDrain();
    testCancelReleases();
    testCrossThreadProducer();
    testAbortSignal();
    return 0;
}
