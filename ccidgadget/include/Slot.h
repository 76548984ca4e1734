#ifndef SLOT_H
#define SLOT_H
#pragma once
#include "GadgetApi.h"
#include "CcidCodec.h"
#include "EngineOptions.h"
#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace ccidgadget {

enum class PowerState { Unpowered, Powered };

// Слот ридера.
//
// insert()/eject() вызывает приложение из любого потока, handle() и
// abortFromControl(): движок. Мьютекс слота держится всё время handle(),
// insert() и eject(): карту нельзя подменить посреди команды.
// abortFromControl() берёт только мьютекс отмены и поэтому может пометить
// команду, застрявшую в runAPDU().
class Slot {
public:
    using EventCallback = std::function<void(Slot&)>;

    Slot(uint8_t index, const EngineOptions& options, EventCallback onEvent = {});
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;

    uint8_t index() const { return index_; }

    // Вставить карту; прежняя карта сбрасывается и заменяется. Питание снято.
    void insert(ICard& card);
    // Сбросить volatile-состояние и извлечь карту. GadgetError, если слот пуст.
    ICard* eject();

    bool hasCard() const { return present_.load(); }
    PowerState powerState() const { return power_.load(); }
    bool busy() const { return busy_.load(); }
    uint8_t currentSequence() const { return seq_.load(); }
    ccid::IccStatus iccStatus() const;
    bool isAborting() const;

    // Выполнить команду этого слота. Пусто только для bulk Abort, control-запрос
    // которого ещё не пришёл.
    std::optional<CcidMessage> handle(const CcidMessage& command);

    // Половина отмены со стороны control-канала. Если bulk Abort с тем же bSeq
    // уже пришёл, возвращает отложенный SlotStatus.
    std::optional<CcidMessage> abortFromControl(uint8_t seq);

    // (есть карта, изменилось) для NotifySlotChange; сбрасывает changed.
    std::pair<bool, bool> takeChangeNotification();
    bool hasPendingChange() const { return changed_.load(); }

private:
    CcidMessage onPowerOn(const CcidMessage& cmd);
    CcidMessage onPowerOff(const CcidMessage& cmd);
    CcidMessage onXfrBlock(const CcidMessage& cmd);
    CcidMessage onParameters(const CcidMessage& cmd);
    std::optional<CcidMessage> onAbort(const CcidMessage& cmd);

    CcidMessage exchange(const CcidMessage& cmd, const std::vector<uint8_t>& capdu);
    CcidMessage nextResponseChunk(const CcidMessage& cmd);
    bool appendChain(const CcidMessage& cmd);

    CcidMessage reply(const CcidMessage& cmd, uint8_t specific, std::vector<uint8_t> payload = {}) const;
    CcidMessage fail(const CcidMessage& cmd, uint8_t error) const;
    uint8_t clockStatus() const;

    void clearCard(const char* why);
    void resetTransfer();

    const uint8_t index_;
    const EngineOptions options_;
    EventCallback onEvent_;

    std::mutex mutex_;
    ICard* card_ = nullptr;
    std::vector<uint8_t> atr_;
    std::array<uint8_t, ccid::T1_PARAMETERS_LEN> t1Params_;

    // цепочки extended APDU
    bool chaining_ = false;
    std::vector<uint8_t> commandChain_;
    std::vector<uint8_t> responseChain_;
    size_t responseOffset_ = 0;

    std::atomic<bool> present_{false};
    std::atomic<bool> changed_{false};
    std::atomic<bool> busy_{false};
    std::atomic<bool> cancel_{false};
    std::atomic<PowerState> power_{PowerState::Unpowered};
    std::atomic<uint8_t> seq_{0};

    mutable std::mutex abortMutex_;
    std::optional<uint8_t> abortControlSeq_;
    std::optional<CcidMessage> abortResponse_;
};

} // namespace ccidgadget
#endif // SLOT_H
