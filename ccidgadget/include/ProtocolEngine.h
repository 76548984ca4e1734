#ifndef PROTOCOLENGINE_H
#define PROTOCOLENGINE_H
#pragma once
#include "CcidCodec.h"
#include "Endpoint.h"
#include "EngineOptions.h"
#include "SlotTable.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace ccidgadget {

// Диспетчер CCID: разбирает сообщение bulk OUT, передаёт его слоту и
// кодирует ответ. Слоты принадлежат движку, конечные точки: нет.
// Interrupt IN пишет отдельный поток движка: запись в него ждёт опроса
// хостом, а insert()/eject() и цикл bulk ждать не должны.
class ProtocolEngine {
public:
    // statusOut: interrupt IN, может быть nullptr.
    ProtocolEngine(const EngineOptions& options, IEndpoint& commandIn, IEndpoint& responseOut,
                   IEndpoint* statusOut = nullptr);
    // Прерывает незавершённую запись в statusOut (cancel()) и ждёт поток.
    ~ProtocolEngine();
    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    // Команда на входе, ответ на выходе. Пусто только для bulk Abort,
    // ждущего control-запроса.
    std::optional<std::vector<uint8_t>> handle(const std::vector<uint8_t>& raw);

    // Ответ в bulk IN; при длине, кратной wMaxPacketSize, следом ZLP.
    void writeResponse(const std::vector<uint8_t>& bytes);

    // Запрос класса ABORT с control-канала. Если парный bulk Abort уже
    // получен, его SlotStatus отправляется отсюда.
    void abortFromControl(uint8_t slot, uint8_t seq);

    // Будит поток interrupt IN, если хоть один слот изменился с прошлого
    // уведомления. Не блокирует. true: уведомление поставлено в очередь.
    bool notifySlotChange();

    // Ждёт, пока все изменения слотов уйдут в interrupt IN.
    // false: истёк timeout, точки нет или поток уже остановлен.
    bool waitNotificationsSent(std::chrono::milliseconds timeout);

    Slot& slot(size_t index) { return slots_.get(index); }
    SlotTable& slots() { return slots_; }
    const CcidCodec& codec() const { return codec_; }
    const EngineOptions& options() const { return options_; }
    IEndpoint& commandEndpoint() { return commandIn_; }

private:
    std::vector<uint8_t> errorResponse(const DecodeResult& decoded);
    std::vector<uint8_t> encodeOrFail(const CcidMessage& response);
    bool anyPendingChange() const;
    void statusLoop();

    const EngineOptions options_;
    CcidCodec codec_;
    IEndpoint& commandIn_;
    IEndpoint& responseOut_;
    IEndpoint* statusOut_;
    std::mutex writeMutex_;
    std::mutex statusMutex_;
    std::condition_variable statusCv_;
    bool statusWake_ = false;
    bool statusBusy_ = false;
    bool statusStop_ = false;
    SlotTable slots_;
    std::thread statusThread_;
};

} // namespace ccidgadget
#endif // PROTOCOLENGINE_H
