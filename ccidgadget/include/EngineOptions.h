#ifndef ENGINEOPTIONS_H
#define ENGINEOPTIONS_H
#pragma once
#include "CcidProtocol.h"
#include <cstdint>
#include <cstddef>

namespace ccidgadget {

struct EngineOptions {
    size_t   slotCount = 1;
    // dwMaxCCIDMessageLength вместе с заголовком. По умолчанию помещается
    // один extended APDU (65544 байт) без цепочки.
    uint32_t maxMessageLength = 65554;
    // wMaxPacketSize bulk IN. Ответ кратной длины завершается ZLP.
    // 0: не завершать.
    uint16_t maxPacketSize = 512;
    // bVoltageSupport: допустимые значения bPowerSelect.
    uint8_t  voltageSupport = ccid::VOLTAGE_5V;
    // Предел APDU, собранного из цепочки XfrBlock.
    uint32_t maxApduLength = 65544;
};

} // namespace ccidgadget
#endif // ENGINEOPTIONS_H
