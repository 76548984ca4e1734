#ifndef ENDPOINT_H
#define ENDPOINT_H
#pragma once
#include "GadgetApi.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace ccidgadget {

// Поток байт одной уже настроенной конечной точки USB.
class IEndpoint {
public:
    virtual ~IEndpoint() = default;

    // Ждёт данных и возвращает не больше max байт; 0: ZLP.
    // TransportError: точка закрыта, TransportCancelled: после cancel().
    virtual size_t read(uint8_t* buf, size_t max) = 0;

    // Пишет буфер целиком; len == 0: ZLP.
    virtual void write(const uint8_t* buf, size_t len) = 0;

    // Сбросить данные, оставшиеся в FIFO точки.
    virtual void flush() = 0;

    // Прервать ожидающий read()/write(). Async-signal-safe.
    virtual void cancel() = 0;
};

// IEndpoint поверх дескриптора: файл epN FunctionFS, в тестах pipe/socket.
// Владеет дескриптором.
class FdEndpoint final : public IEndpoint {
public:
    enum class Direction { In, Out };   // направление USB, IN: от устройства к хосту

    FdEndpoint(int fd, std::string name);
    ~FdEndpoint() override;
    FdEndpoint(const FdEndpoint&) = delete;
    FdEndpoint& operator=(const FdEndpoint&) = delete;

    // Открыть файл конечной точки смонтированного FunctionFS.
    static FdEndpoint open(const std::string& path, Direction dir);

    size_t read(uint8_t* buf, size_t max) override;
    void write(const uint8_t* buf, size_t len) override;
    void flush() override;
    void cancel() override;

    int fd() const { return fd_; }
    const std::string& name() const { return name_; }

    FdEndpoint(FdEndpoint&& other) noexcept;

private:
    int fd_ = -1;
    int wakeFd_ = -1;
    bool zeroReadIsEof_ = false;
    std::string name_;

    void waitReady(short events, const char* what);
    [[noreturn]] void fail(const char* what, int err) const;
};

} // namespace ccidgadget
#endif // ENDPOINT_H
