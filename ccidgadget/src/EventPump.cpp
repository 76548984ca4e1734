#include "EventPump.h"
#include "Log.h"
#include <algorithm>

namespace ccidgadget {

using namespace ccid;

EventPump::EventPump(ProtocolEngine& engine)
    : engine_(engine), chunk_(engine.codec().maxMessageLength())
{
}

void EventPump::stop(){
    stopping_ = true;
    engine_.commandEndpoint().cancel();
}

// Bulk OUT здесь: поток байт: передача может содержать часть сообщения
// или несколько сообщений. ZLP пропускаются. Хвост отвергнутого сообщения
// (discard_) выбрасывается раньше, чем из потока берётся следующий заголовок.
void EventPump::fill(size_t n){
    if (discard_ && !pending_.empty()) {
        const size_t d = size_t(std::min<uint64_t>(discard_, pending_.size()));
        pending_.erase(pending_.begin(), pending_.begin() + std::ptrdiff_t(d));
        discard_ -= d;
    }
    while (pending_.size() < n) {
        size_t got = engine_.commandEndpoint().read(chunk_.data(), chunk_.size());
        if (got == 0) {
            qCDebug(lcPump) << "ZLP";
            continue;
        }
        size_t skip = 0;
        if (discard_) {
            skip = size_t(std::min<uint64_t>(discard_, got));
            discard_ -= skip;
            if (!discard_) qCDebug(lcPump) << "хвост отвергнутого сообщения пропущен";
        }
        pending_.insert(pending_.end(), chunk_.begin() + std::ptrdiff_t(skip), chunk_.begin() + std::ptrdiff_t(got));
    }
}

std::vector<uint8_t> EventPump::readMessage(){
    fill(HEADER_LEN);
    const uint32_t length = CcidCodec::peekLength(pending_.data());
    if (length > engine_.codec().maxPayload()) {
        // Ответ на заголовок уходит сразу, данные сообщения пропускаются
        // по мере поступления: иначе они разбирались бы как новые команды.
        const uint64_t total = uint64_t(HEADER_LEN) + length;
        std::vector<uint8_t> header(pending_.begin(), pending_.begin() + HEADER_LEN);
        const size_t drop = size_t(std::min<uint64_t>(pending_.size(), total));
        pending_.erase(pending_.begin(), pending_.begin() + std::ptrdiff_t(drop));
        discard_ = total - drop;
        qCWarning(lcPump) << "dwLength" << length << "больше предела, пропускается байт:" << qulonglong(total);
        return header;
    }
    const size_t total = HEADER_LEN + length;
    fill(total);
    std::vector<uint8_t> msg(pending_.begin(), pending_.begin() + std::ptrdiff_t(total));
    pending_.erase(pending_.begin(), pending_.begin() + std::ptrdiff_t(total));
    return msg;
}

void EventPump::runForever(){
    qCInfo(lcPump) << "цикл запущен";
    try {
        // остатки прошлого сеанса в FIFO bulk OUT
        engine_.commandEndpoint().flush();
        engine_.notifySlotChange();
        while (!stopping_) {
            auto raw = readMessage();
            auto response = engine_.handle(raw);
            ++handled_;
            if (response) engine_.writeResponse(*response);
        }
    } catch (const TransportCancelled&) {
        if (!stopping_) throw;
    } catch (const TransportError& e) {
        qCCritical(lcPump) << "отказ транспорта:" << e.what();
        throw;
    }
    qCInfo(lcPump) << "цикл остановлен, обработано сообщений:" << handled_;
}

} // namespace ccidgadget
