#ifndef FAKEENDPOINT_H
#define FAKEENDPOINT_H
#pragma once
#include "Endpoint.h"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

// Конечная точка по сценарию: read() отдаёт заготовленные передачи по одной,
// после последней: TransportError. Всё записанное сохраняется.
struct FakeEndpoint : public ccidgadget::IEndpoint {
    std::deque<std::vector<uint8_t>> reads;
    std::vector<std::vector<uint8_t>> writes;
    std::function<void()> onRead;   // перед каждым read()
    int flushes = 0;
    bool cancelled = false;

    void push(const std::vector<uint8_t>& transfer) { reads.push_back(transfer); }

    size_t read(uint8_t* buf, size_t max) override {
        if (onRead) onRead();
        if (cancelled) {
            cancelled = false;
            throw ccidgadget::TransportCancelled("fake: cancelled");
        }
        if (reads.empty()) throw ccidgadget::TransportError("fake: end of script");
        auto& front = reads.front();
        const size_t n = std::min(max, front.size());
        std::copy(front.begin(), front.begin() + std::ptrdiff_t(n), buf);
        if (n == front.size()) reads.pop_front();
        else front.erase(front.begin(), front.begin() + std::ptrdiff_t(n));
        return n;
    }

    void write(const uint8_t* buf, size_t len) override {
        writes.emplace_back(buf, buf + len);
    }

    void flush() override { ++flushes; }
    void cancel() override { cancelled = true; }
};

// Точка, которую хост не опрашивает: write() ждёт release() или cancel().
struct BlockingEndpoint : public ccidgadget::IEndpoint {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::vector<uint8_t>> writes;
    int started = 0;
    bool released = false;
    bool cancelled = false;

    size_t read(uint8_t*, size_t) override {
        throw ccidgadget::TransportError("blocking: read");
    }

    void write(const uint8_t* buf, size_t len) override {
        std::unique_lock<std::mutex> lock(mutex);
        ++started;
        cv.notify_all();
        cv.wait(lock, [this]{ return released || cancelled; });
        if (!released) throw ccidgadget::TransportCancelled("blocking: cancelled");
        writes.emplace_back(buf, buf + len);
    }

    void flush() override {}

    void cancel() override {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled = true;
        cv.notify_all();
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        cv.notify_all();
    }

    bool waitStarted(int n) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [&]{ return started >= n; });
    }
};

#endif // FAKEENDPOINT_H
