#ifndef SOFTCARD_H
#define SOFTCARD_H

#pragma once
#include "GadgetApi.h"
#include <random>

namespace ccidgadget {

// Программная карта T=1 для запуска гаджета без настоящего апплета:
// SELECT и GET CHALLENGE, остальные INS: 6D 00.
class SoftCard final : public ICard {
public:
    SoftCard();
    ~SoftCard() override = default;

    bool clearVolatiles() override;
    std::vector<uint8_t> getATR() override;
    std::vector<uint8_t> runAPDU(const std::vector<uint8_t>& capdu) override;

    const std::vector<uint8_t>& selected() const { return selected_; }

    static std::vector<uint8_t> defaultATR();

private:
    std::vector<uint8_t> selected_;
    std::mt19937 rng_;

    std::vector<uint8_t> select(const std::vector<uint8_t>& capdu);
    std::vector<uint8_t> getChallenge(const std::vector<uint8_t>& capdu);
};

} // namespace ccidgadget

#endif // SOFTCARD_H
