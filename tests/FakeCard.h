#ifndef FAKECARD_H
#define FAKECARD_H
#pragma once
#include "GadgetApi.h"
#include <functional>
#include <stdexcept>

// Карта с заданными ответами и счётчиками вызовов.
struct FakeCard : public ccidgadget::ICard {
    std::vector<uint8_t> atr { 0x3B, 0x00 };
    std::vector<uint8_t> response { 0x90, 0x00 };
    bool clearResult = true;
    bool throwOnClear = false;
    bool throwOnAtr = false;
    bool throwOnRun = false;
    std::function<void()> onRun;   // вызывается внутри runAPDU

    int clearCalls = 0;
    int atrCalls = 0;
    int runCalls = 0;
    std::vector<uint8_t> lastCommand;

    bool clearVolatiles() override {
        ++clearCalls;
        if (throwOnClear) throw std::runtime_error("clear failed");
        return clearResult;
    }

    std::vector<uint8_t> getATR() override {
        ++atrCalls;
        if (throwOnAtr) throw std::runtime_error("no ATR");
        return atr;
    }

    std::vector<uint8_t> runAPDU(const std::vector<uint8_t>& capdu) override {
        ++runCalls;
        lastCommand = capdu;
        if (onRun) onRun();
        if (throwOnRun) throw std::runtime_error("card fault");
        return response;
    }
};

#endif // FAKECARD_H
