#ifndef EVENTPUMP_H
#define EVENTPUMP_H
#pragma once
#include "ProtocolEngine.h"
#include <atomic>
#include <cstdint>
#include <vector>

namespace ccidgadget {

// Единственный поток, ведущий ProtocolEngine: команда из bulk OUT,
// обработка, ответ в bulk IN, и так по кругу.
class EventPump {
public:
    explicit EventPump(ProtocolEngine& engine);
    EventPump(const EventPump&) = delete;
    EventPump& operator=(const EventPump&) = delete;

    // Возврат после stop(). TransportError при отказе конечной точки.
    void runForever();

    // Async-signal-safe.
    void stop();

    bool stopping() const { return stopping_.load(); }
    size_t messagesHandled() const { return handled_; }

private:
    std::vector<uint8_t> readMessage();
    void fill(size_t n);

    ProtocolEngine& engine_;
    std::atomic<bool> stopping_{false};
    std::vector<uint8_t> chunk_;
    std::vector<uint8_t> pending_;
    uint64_t discard_ = 0;      // ещё не пришедшие байты отвергнутого сообщения
    size_t handled_ = 0;
};

} // namespace ccidgadget
#endif // EVENTPUMP_H
