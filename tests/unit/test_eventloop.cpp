#include "portico/network/EventLoop.h"
#include "portico/network/EventLoopThread.h"
#include "portico/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

using namespace portico::network;
using namespace portico::common;

void testTimersFireInOrder() {
    EventLoop loop;
    std::vector<int> fired;
    const auto start = std::chrono::steady_clock::now();

    loop.RunAfter(std::chrono::milliseconds(60), [&] {
        fired.push_back(3);
        loop.Quit();
    });
    loop.RunAfter(std::chrono::milliseconds(20), [&] { fired.push_back(2); });
    loop.RunAfter(std::chrono::milliseconds(0), [&] { fired.push_back(1); });
    const EventLoop::TimerId cancelled = loop.RunAfter(std::chrono::milliseconds(30), [&] {
        fired.push_back(99);
    });
    loop.CancelTimer(cancelled);

    loop.Loop();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    assert((fired == std::vector<int>{1, 2, 3}));
    assert(elapsed >= std::chrono::milliseconds(50));
    LOG_INFO << "Timers PASS";
}

void testCrossThreadWork() {
    EventLoopThread thread("worker");
    EventLoop* loop = thread.StartLoop();
    assert(loop != nullptr);
    assert(!loop->IsInLoopThread());

    std::atomic<int> ran{0};
    std::atomic<bool> onLoopThread{false};
    for (int i = 0; i < 100; ++i) {
        loop->RunInLoop([&] {
            onLoopThread = loop->IsInLoopThread();
            ++ran;
        });
    }
    std::atomic<bool> timerFired{false};
    loop->RunAfter(std::chrono::milliseconds(10), [&] { timerFired = true; });

    for (int i = 0; i < 200 && (ran.load() < 100 || !timerFired.load()); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(ran.load() == 100);
    assert(onLoopThread.load());
    assert(timerFired.load());
    LOG_INFO << "Cross-thread work PASS";
}

void testQuitFromAnotherThread() {
    EventLoop loop;
    EventLoop* raw = &loop;
    std::thread t([raw] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        LOG_INFO << "Quitting main loop from thread";
        raw->Quit();
    });
    loop.Loop();
    t.join();
    LOG_INFO << "Quit PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::DEBUG);
    testTimersFireInOrder();
    testCrossThreadWork();
    testQuitFromAnotherThread();
    return 0;
}
