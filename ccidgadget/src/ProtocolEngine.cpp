#include "ProtocolEngine.h"
#include "Hex.hpp"
#include "Log.h"
#include <csignal>
#include <pthread.h>

namespace ccidgadget {

using namespace ccid;

ProtocolEngine::ProtocolEngine(const EngineOptions& options, IEndpoint& commandIn, IEndpoint& responseOut,
                               IEndpoint* statusOut)
    : options_(options)
    , codec_(options.maxMessageLength)
    , commandIn_(commandIn)
    , responseOut_(responseOut)
    , statusOut_(statusOut)
    , slots_(options, [this](Slot&){ notifySlotChange(); })
{
    if (statusOut_) {
        // сигналы процесса остаются потоку цикла: они прерывают его чтение bulk OUT
        sigset_t all, old;
        sigfillset(&all);
        pthread_sigmask(SIG_BLOCK, &all, &old);
        statusThread_ = std::thread([this]{ statusLoop(); });
        pthread_sigmask(SIG_SETMASK, &old, nullptr);
    }
    qCInfo(lcEngine) << "движок готов: слотов" << slots_.size() << ", dwMaxCCIDMessageLength"
                     << options_.maxMessageLength;
}

ProtocolEngine::~ProtocolEngine(){
    if (!statusThread_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        statusStop_ = true;
    }
    statusCv_.notify_all();
    statusOut_->cancel();
    statusThread_.join();
}

std::optional<std::vector<uint8_t>> ProtocolEngine::handle(const std::vector<uint8_t>& raw){
    auto decoded = codec_.decode(raw);
    if (!decoded.ok()) return errorResponse(decoded);

    const CcidMessage& cmd = decoded.message;
    Slot* slot = slots_.find(cmd.slot);
    if (!slot) {
        qCWarning(lcEngine) << "сообщение" << Qt::hex << int(cmd.type) << Qt::dec
                            << "для несуществующего слота" << int(cmd.slot);
        auto r = CcidMessage::replyTo(cmd, responseTypeFor(cmd.type));
        r.param = { makeStatus(IccStatus::NotPresent, CommandStatus::Failed), ERROR_SLOT_DOES_NOT_EXIST, 0x00 };
        return encodeOrFail(r);
    }

    qCDebug(lcEngine) << "<<" << bytesToHex(raw, HEADER_LEN + 16).c_str();
    auto response = slot->handle(cmd);
    if (!response) return std::nullopt;
    auto out = encodeOrFail(*response);
    qCDebug(lcEngine) << ">>" << bytesToHex(out, HEADER_LEN + 16).c_str();
    return out;
}

std::vector<uint8_t> ProtocolEngine::errorResponse(const DecodeResult& decoded){
    const CcidMessage& cmd = decoded.message;
    qCWarning(lcEngine) << "сообщение не разобрано:" << decodeErrorName(decoded.error)
                        << "тип" << Qt::hex << int(cmd.type) << Qt::dec
                        << "dwLength" << decoded.declaredLength;
    Slot* slot = slots_.find(cmd.slot);
    const IccStatus icc = slot ? slot->iccStatus() : IccStatus::NotPresent;
    auto r = CcidMessage::replyTo(cmd, responseTypeFor(cmd.type));
    r.param = { makeStatus(icc, CommandStatus::Failed), ERROR_BAD_LENGTH, 0x00 };
    return encodeOrFail(r);
}

std::vector<uint8_t> ProtocolEngine::encodeOrFail(const CcidMessage& response){
    try {
        return codec_.encode(response);
    } catch (const GadgetError& e) {
        // слот выдал больше, чем помещается в сообщение
        qCCritical(lcEngine) << "ответ не кодируется:" << e.what();
        auto r = response;
        r.param[0] = makeStatus(response.iccStatus(), CommandStatus::Failed);
        r.param[1] = ERROR_HW_ERROR;
        r.payload.clear();
        return codec_.encode(r);
    }
}

void ProtocolEngine::writeResponse(const std::vector<uint8_t>& bytes){
    std::lock_guard<std::mutex> lock(writeMutex_);
    responseOut_.write(bytes.data(), bytes.size());
    if (options_.maxPacketSize && !bytes.empty() && bytes.size() % options_.maxPacketSize == 0)
        responseOut_.write(bytes.data(), 0);
}

void ProtocolEngine::abortFromControl(uint8_t slotIndex, uint8_t seq){
    Slot* slot = slots_.find(slotIndex);
    if (!slot) {
        qCWarning(lcEngine) << "ABORT для несуществующего слота" << int(slotIndex);
        return;
    }
    qCInfo(lcEngine) << "ABORT: слот" << int(slotIndex) << "seq" << int(seq);
    if (auto response = slot->abortFromControl(seq))
        writeResponse(encodeOrFail(*response));
}

bool ProtocolEngine::anyPendingChange() const {
    for (const Slot& s : slots_)
        if (s.hasPendingChange()) return true;
    return false;
}

bool ProtocolEngine::notifySlotChange(){
    if (!statusOut_) return false;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        if (statusStop_ || !anyPendingChange()) return false;
        statusWake_ = true;
    }
    statusCv_.notify_all();
    return true;
}

bool ProtocolEngine::waitNotificationsSent(std::chrono::milliseconds timeout){
    if (!statusOut_) return false;
    std::unique_lock<std::mutex> lock(statusMutex_);
    const bool done = statusCv_.wait_for(lock, timeout, [this]{
        return statusStop_ || (!statusWake_ && !statusBusy_ && !anyPendingChange());
    });
    return done && !statusStop_;
}

// Изменения, пришедшие во время записи, накапливаются в слотах и уходят
// следующим сообщением.
void ProtocolEngine::statusLoop(){
    std::unique_lock<std::mutex> lock(statusMutex_);
    for (;;) {
        statusCv_.wait(lock, [this]{ return statusStop_ || statusWake_; });
        if (statusStop_) break;
        statusWake_ = false;
        if (!anyPendingChange()) continue;

        std::vector<std::pair<bool, bool>> bits;
        bits.reserve(slots_.size());
        for (Slot& s : slots_) bits.push_back(s.takeChangeNotification());
        auto msg = CcidCodec::encodeSlotChange(bits);
        statusBusy_ = true;
        lock.unlock();

        qCDebug(lcEngine) << "NotifySlotChange" << bytesToHex(msg).c_str();
        bool failed = false;
        try {
            statusOut_->write(msg.data(), msg.size());
        } catch (const TransportCancelled&) {
            qCDebug(lcEngine) << "запись NotifySlotChange прервана";
            failed = true;
        } catch (const TransportError& e) {
            qCCritical(lcEngine) << "interrupt IN:" << e.what() << ", уведомления остановлены";
            failed = true;
        }

        lock.lock();
        statusBusy_ = false;
        if (failed) statusStop_ = true;
        statusCv_.notify_all();
        if (failed) break;
    }
}

} // namespace ccidgadget
