#include "CcidCodec.h"
#include "GadgetApi.h"
#include "Log.h"
#include <cstring>
#include <string>

namespace ccidgadget {
namespace {

uint32_t le32(const uint8_t* p){
    return (uint32_t)p[0] | ((uint32_t)p[1]<<8) | ((uint32_t)p[2]<<16) | ((uint32_t)p[3]<<24);
}

void putLe32(uint8_t* p, uint32_t v){
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)((v>>8)&0xFF);
    p[2] = (uint8_t)((v>>16)&0xFF);
    p[3] = (uint8_t)((v>>24)&0xFF);
}

}

CcidMessage CcidMessage::replyTo(const CcidMessage& command, uint8_t responseType){
    CcidMessage r;
    r.type = responseType;
    r.slot = command.slot;
    r.seq  = command.seq;
    return r;
}

const char* decodeErrorName(DecodeError e){
    switch (e){
    case DecodeError::None:            return "нет";
    case DecodeError::MalformedHeader: return "неполный заголовок";
    case DecodeError::LengthMismatch:  return "dwLength не совпадает с данными";
    case DecodeError::PayloadTooLarge: return "слишком длинное сообщение";
    }
    return "неизвестно";
}

CcidCodec::CcidCodec(uint32_t maxMessageLength)
    : maxMessageLength_(maxMessageLength)
{
    if (maxMessageLength_ <= ccid::HEADER_LEN)
        throw GadgetError("CCID: максимальная длина сообщения должна быть больше 10-байтового заголовка");
}

uint32_t CcidCodec::peekLength(const uint8_t* header){
    return le32(header+1);
}

DecodeResult CcidCodec::decode(const uint8_t* data, size_t size) const {
    DecodeResult r;
    // Прочитанные поля заголовка сохраняем: ответ с ошибкой повторяет их.
    if (size>0) r.message.type = data[0];
    if (size>5) r.message.slot = data[5];
    if (size>6) r.message.seq  = data[6];
    for (size_t i=0; i<3 && 7+i<size; ++i) r.message.param[i] = data[7+i];

    if (size<ccid::HEADER_LEN) {
        r.error = DecodeError::MalformedHeader;
        qCDebug(lcCodec) << "короткий заголовок:" << size << "байт";
        return r;
    }
    r.declaredLength = le32(data+1);
    if (r.declaredLength > maxPayload()) {
        r.error = DecodeError::PayloadTooLarge;
        qCDebug(lcCodec) << "dwLength" << r.declaredLength << "больше" << maxPayload();
        return r;
    }
    if (size - ccid::HEADER_LEN != r.declaredLength) {
        r.error = DecodeError::LengthMismatch;
        qCDebug(lcCodec) << "dwLength" << r.declaredLength << ", а данных"
                         << (size - ccid::HEADER_LEN) << "байт";
        return r;
    }
    r.message.payload.assign(data+ccid::HEADER_LEN, data+size);
    return r;
}

std::vector<uint8_t> CcidCodec::encode(const CcidMessage& msg) const {
    if (msg.payload.size() > maxPayload()) {
        throw GadgetError("CCID: данные ответа (" + std::to_string(msg.payload.size())
                          + " байт) превышают предел " + std::to_string(maxPayload()) + " байт");
    }
    std::vector<uint8_t> out(ccid::HEADER_LEN + msg.payload.size());
    out[0] = msg.type;
    putLe32(&out[1], (uint32_t)msg.payload.size());
    out[5] = msg.slot;
    out[6] = msg.seq;
    out[7] = msg.param[0]; out[8] = msg.param[1]; out[9] = msg.param[2];
    if (!msg.payload.empty()) std::memcpy(out.data()+ccid::HEADER_LEN, msg.payload.data(), msg.payload.size());
    return out;
}

std::vector<uint8_t> CcidCodec::encodeSlotChange(const std::vector<std::pair<bool, bool>>& slots){
    std::vector<uint8_t> out(1 + (slots.size()+3)/4, 0);
    out[0] = ccid::RDR_to_PC_NotifySlotChange;
    for (size_t i=0;i<slots.size();++i){
        uint8_t bits = uint8_t((slots[i].first ? 1 : 0) | (slots[i].second ? 2 : 0));
        out[1 + i/4] |= uint8_t(bits << ((i%4)*2));
    }
    return out;
}

} // namespace ccidgadget
