#include "Slot.h"
#include "Hex.hpp"
#include "Log.h"
#include <algorithm>
#include <string>

namespace ccidgadget {
namespace {

using namespace ccid;

// bmFindexDindex, bmTCCKST1, bGuardTimeT1, bmWaitingIntegersT1,
// bClockStop, bIFSC, bNadValue
constexpr std::array<uint8_t, T1_PARAMETERS_LEN> T1_DEFAULTS = {
    0x11, 0x10, 0x00, 0x4D, 0x00, 0xFE, 0x00
};

constexpr size_t LOG_BYTES = 32;

uint8_t voltageBit(uint8_t powerSelect){
    switch (powerSelect){
    case 1: return VOLTAGE_5V;
    case 2: return VOLTAGE_3V;
    case 3: return VOLTAGE_1_8V;
    default: return 0;
    }
}

class BusyGuard {
public:
    explicit BusyGuard(std::atomic<bool>& flag) : flag_(flag) { flag_ = true; }
    ~BusyGuard() { flag_ = false; }
    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;
private:
    std::atomic<bool>& flag_;
};

}

Slot::Slot(uint8_t index, const EngineOptions& options, EventCallback onEvent)
    : index_(index), options_(options), onEvent_(std::move(onEvent)), t1Params_(T1_DEFAULTS)
{
}

IccStatus Slot::iccStatus() const {
    if (!present_) return IccStatus::NotPresent;
    return power_ == PowerState::Powered ? IccStatus::Active : IccStatus::Inactive;
}

bool Slot::isAborting() const {
    std::lock_guard<std::mutex> lock(abortMutex_);
    return abortControlSeq_.has_value() || abortResponse_.has_value();
}

uint8_t Slot::clockStatus() const {
    return power_ == PowerState::Powered ? CLOCK_RUNNING : CLOCK_STOPPED;
}

// ---- вставка/извлечение ----------------------------------------------------

void Slot::insert(ICard& card){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (card_) clearCard("замена");
        card_ = &card;
        power_ = PowerState::Unpowered;
        atr_.clear();
        resetTransfer();
        present_ = true;
        changed_ = true;
    }
    qCInfo(lcSlot) << "слот" << int(index_) << " карта вставлена";
    if (onEvent_) onEvent_(*this);
}

ICard* Slot::eject(){
    ICard* card = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!card_) throw GadgetError("слот " + std::to_string(index_) + ": карты нет");
        clearCard("извлечение");
        card = card_;
        card_ = nullptr;
        power_ = PowerState::Unpowered;
        atr_.clear();
        resetTransfer();
        present_ = false;
        changed_ = true;
    }
    qCInfo(lcSlot) << "слот" << int(index_) << " карта извлечена";
    if (onEvent_) onEvent_(*this);
    return card;
}

// Уходящая карта: volatile-состояние сбрасывается при любом состоянии питания.
void Slot::clearCard(const char* why){
    try {
        if (!card_->clearVolatiles())
            qCWarning(lcSlot) << "слот" << int(index_) << ":" << why << ": карта не сбросила volatile-состояние";
    } catch (const std::exception& e) {
        qCWarning(lcSlot) << "слот" << int(index_) << ":" << why << ": исключение в clearVolatiles:" << e.what();
    }
}

void Slot::resetTransfer(){
    chaining_ = false;
    commandChain_.clear();
    responseChain_.clear();
    responseOffset_ = 0;
}

std::pair<bool, bool> Slot::takeChangeNotification(){
    const bool changed = changed_.exchange(false);
    return { present_.load(), changed };
}

// ---- команды ---------------------------------------------------------------

CcidMessage Slot::reply(const CcidMessage& cmd, uint8_t specific, std::vector<uint8_t> payload) const {
    auto r = CcidMessage::replyTo(cmd, responseTypeFor(cmd.type));
    r.param = { makeStatus(iccStatus(), CommandStatus::Ok), 0x00, specific };
    r.payload = std::move(payload);
    return r;
}

CcidMessage Slot::fail(const CcidMessage& cmd, uint8_t error) const {
    auto r = CcidMessage::replyTo(cmd, responseTypeFor(cmd.type));
    uint8_t specific = 0;
    if (r.type == RDR_to_PC_SlotStatus) specific = clockStatus();
    else if (r.type == RDR_to_PC_Parameters) specific = PROTOCOL_T1;
    r.param = { makeStatus(iccStatus(), CommandStatus::Failed), error, specific };
    return r;
}

std::optional<CcidMessage> Slot::handle(const CcidMessage& cmd){
    seq_ = cmd.seq;
    // До захвата мьютекса: команда, пришедшая во время APDU, отклоняется,
    // а не встаёт в очередь.
    if (busy_) {
        qCWarning(lcSlot) << "слот" << int(index_) << " занят, отклонено сообщение" << Qt::hex << int(cmd.type);
        return fail(cmd, ERROR_CMD_SLOT_BUSY);
    }
    std::lock_guard<std::mutex> lock(mutex_);

    if (cmd.type == PC_to_RDR_Abort) return onAbort(cmd);
    if (isAborting()) {
        qCDebug(lcSlot) << "слот" << int(index_) << " идёт отмена, отклонён seq" << int(cmd.seq);
        return fail(cmd, ERROR_CMD_ABORTED);
    }

    switch (cmd.type){
    case PC_to_RDR_IccPowerOn:      return onPowerOn(cmd);
    case PC_to_RDR_IccPowerOff:     return onPowerOff(cmd);
    case PC_to_RDR_GetSlotStatus:   return reply(cmd, clockStatus());
    case PC_to_RDR_XfrBlock:        return onXfrBlock(cmd);
    case PC_to_RDR_GetParameters:
    case PC_to_RDR_ResetParameters:
    case PC_to_RDR_SetParameters:   return onParameters(cmd);
    default:
        qCDebug(lcSlot) << "слот" << int(index_) << " неподдерживаемое сообщение" << Qt::hex << int(cmd.type);
        return fail(cmd, ERROR_CMD_NOT_SUPPORTED);
    }
}

CcidMessage Slot::onPowerOn(const CcidMessage& cmd){
    if (!card_) return fail(cmd, ERROR_ICC_MUTE);

    const uint8_t select = cmd.powerSelect();
    if (select != POWER_SELECT_AUTO && !(voltageBit(select) & options_.voltageSupport)) {
        qCWarning(lcSlot) << "слот" << int(index_) << " неподдерживаемый bPowerSelect" << int(select);
        return fail(cmd, ERROR_BAD_POWERSELECT);
    }

    if (power_ == PowerState::Powered) {
        qCDebug(lcSlot) << "слот" << int(index_) << " питание уже подано, повтор ATR";
        resetTransfer();
        return reply(cmd, CHAIN_BEGIN_AND_END, atr_);
    }

    resetTransfer();
    std::vector<uint8_t> atr;
    try {
        atr = card_->getATR();
    } catch (const std::exception& e) {
        qCWarning(lcSlot) << "слот" << int(index_) << " ошибка getATR:" << e.what();
        return fail(cmd, ERROR_HW_ERROR);
    }
    if (atr.empty() || atr.size() > options_.maxMessageLength - HEADER_LEN) {
        qCWarning(lcSlot) << "слот" << int(index_) << " непригодный ATR длиной" << atr.size() << "байт";
        return fail(cmd, ERROR_HW_ERROR);
    }
    atr_ = std::move(atr);
    t1Params_ = T1_DEFAULTS;
    power_ = PowerState::Powered;
    qCInfo(lcSlot) << "слот" << int(index_) << " питание подано, ATR" << bytesToHex(atr_).c_str();
    return reply(cmd, CHAIN_BEGIN_AND_END, atr_);
}

CcidMessage Slot::onPowerOff(const CcidMessage& cmd){
    resetTransfer();
    bool cleared = true;
    if (card_) {
        try {
            cleared = card_->clearVolatiles();
        } catch (const std::exception& e) {
            qCWarning(lcSlot) << "слот" << int(index_) << " исключение в clearVolatiles:" << e.what();
            cleared = false;
        }
    }
    power_ = PowerState::Unpowered;
    atr_.clear();
    qCInfo(lcSlot) << "слот" << int(index_) << " питание снято";
    if (!cleared) return fail(cmd, ERROR_HW_ERROR);
    return reply(cmd, clockStatus());
}

bool Slot::appendChain(const CcidMessage& cmd){
    commandChain_.insert(commandChain_.end(), cmd.payload.begin(), cmd.payload.end());
    return commandChain_.size() <= options_.maxApduLength;
}

CcidMessage Slot::onXfrBlock(const CcidMessage& cmd){
    if (!card_ || power_ != PowerState::Powered) return fail(cmd, ERROR_ICC_MUTE);

    const uint16_t level = cmd.levelParameter();
    switch (level){
    case LEVEL_BEGIN_AND_END:
        resetTransfer();
        return exchange(cmd, cmd.payload);

    case LEVEL_BEGIN:
        resetTransfer();
        chaining_ = true;
        if (!appendChain(cmd)) { resetTransfer(); return fail(cmd, ERROR_BAD_LENGTH); }
        return reply(cmd, CHAIN_CONTINUE);

    case LEVEL_INTERMEDIATE:
    case LEVEL_END: {
        if (!chaining_) {
            qCWarning(lcSlot) << "слот" << int(index_) << " wLevelParameter" << level << "вне цепочки";
            return fail(cmd, ERROR_BAD_WLEVEL);
        }
        if (!appendChain(cmd)) { resetTransfer(); return fail(cmd, ERROR_BAD_LENGTH); }
        if (level == LEVEL_INTERMEDIATE) return reply(cmd, CHAIN_CONTINUE);
        std::vector<uint8_t> capdu;
        capdu.swap(commandChain_);
        resetTransfer();
        return exchange(cmd, capdu);
    }

    case LEVEL_CONTINUE:
        if (responseOffset_ == 0 || responseOffset_ >= responseChain_.size() || !cmd.payload.empty()) {
            qCWarning(lcSlot) << "слот" << int(index_) << " нет данных ответа для продолжения";
            return fail(cmd, ERROR_BAD_WLEVEL);
        }
        return nextResponseChunk(cmd);

    default:
        return fail(cmd, ERROR_BAD_WLEVEL);
    }
}

CcidMessage Slot::exchange(const CcidMessage& cmd, const std::vector<uint8_t>& capdu){
    qCDebug(lcSlot) << "слот" << int(index_) << " C-APDU" << bytesToHex(capdu, LOG_BYTES).c_str();
    std::vector<uint8_t> rapdu;
    {
        BusyGuard guard(busy_);
        try {
            rapdu = card_->runAPDU(capdu);
        } catch (const std::exception& e) {
            qCWarning(lcSlot) << "слот" << int(index_) << " ошибка runAPDU:" << e.what();
            return fail(cmd, ERROR_HW_ERROR);
        }
    }
    // Карту прервать нельзя: отмена лишь не даёт отдать результат.
    if (cancel_) {
        qCInfo(lcSlot) << "слот" << int(index_) << " отброшен R-APDU отменённого seq" << int(cmd.seq);
        return fail(cmd, ERROR_CMD_ABORTED);
    }
    qCDebug(lcSlot) << "слот" << int(index_) << " R-APDU" << bytesToHex(rapdu, LOG_BYTES).c_str();
    responseChain_ = std::move(rapdu);
    responseOffset_ = 0;
    return nextResponseChunk(cmd);
}

CcidMessage Slot::nextResponseChunk(const CcidMessage& cmd){
    const size_t maxPayload = options_.maxMessageLength - HEADER_LEN;
    const size_t remaining = responseChain_.size() - responseOffset_;
    const size_t n = std::min(remaining, maxPayload);
    const bool first = responseOffset_ == 0;
    const bool last = n == remaining;

    uint8_t chain = CHAIN_INTERMEDIATE;
    if (first && last) chain = CHAIN_BEGIN_AND_END;
    else if (first) chain = CHAIN_BEGIN;
    else if (last) chain = CHAIN_END;

    auto begin = responseChain_.begin() + std::ptrdiff_t(responseOffset_);
    auto r = reply(cmd, chain, std::vector<uint8_t>(begin, begin + std::ptrdiff_t(n)));
    if (last) {
        responseChain_.clear();
        responseOffset_ = 0;
    } else {
        responseOffset_ += n;
    }
    return r;
}

CcidMessage Slot::onParameters(const CcidMessage& cmd){
    if (!card_) return fail(cmd, ERROR_ICC_MUTE);

    if (cmd.type == PC_to_RDR_ResetParameters) {
        t1Params_ = T1_DEFAULTS;
    } else if (cmd.type == PC_to_RDR_SetParameters) {
        if (cmd.protocolNum() != PROTOCOL_T1) return fail(cmd, ERROR_BAD_PROTOCOLNUM);
        if (cmd.payload.size() != T1_PARAMETERS_LEN) return fail(cmd, ERROR_BAD_LENGTH);
        std::copy(cmd.payload.begin(), cmd.payload.end(), t1Params_.begin());
    }
    return reply(cmd, PROTOCOL_T1, std::vector<uint8_t>(t1Params_.begin(), t1Params_.end()));
}

// ---- отмена ----------------------------------------------------------------

std::optional<CcidMessage> Slot::onAbort(const CcidMessage& cmd){
    resetTransfer();
    auto response = reply(cmd, clockStatus());
    std::lock_guard<std::mutex> lock(abortMutex_);
    if (abortControlSeq_ && *abortControlSeq_ == cmd.seq) {
        abortControlSeq_.reset();
        abortResponse_.reset();
        cancel_ = false;
        qCInfo(lcSlot) << "слот" << int(index_) << " отмена seq" << int(cmd.seq) << "завершена";
        return response;
    }
    if (abortResponse_)
        qCWarning(lcSlot) << "слот" << int(index_) << " замена ожидающего bulk Abort seq" << int(abortResponse_->seq);
    abortResponse_ = std::move(response);
    qCDebug(lcSlot) << "слот" << int(index_) << " bulk Abort seq" << int(cmd.seq) << "ждёт control-запроса";
    return std::nullopt;
}

std::optional<CcidMessage> Slot::abortFromControl(uint8_t seq){
    std::lock_guard<std::mutex> lock(abortMutex_);
    if (abortResponse_ && abortResponse_->seq == seq) {
        std::optional<CcidMessage> response;
        response.swap(abortResponse_);
        abortControlSeq_.reset();
        cancel_ = false;
        qCInfo(lcSlot) << "слот" << int(index_) << " отмена seq" << int(seq) << "завершена";
        return response;
    }
    abortResponse_.reset();
    abortControlSeq_ = seq;
    cancel_ = true;
    qCDebug(lcSlot) << "слот" << int(index_) << " control ABORT seq" << int(seq) << "ждёт bulk Abort";
    return std::nullopt;
}

} // namespace ccidgadget
