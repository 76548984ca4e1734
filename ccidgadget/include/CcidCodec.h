#ifndef CCIDCODEC_H
#define CCIDCODEC_H
#pragma once
#include "CcidProtocol.h"
#include <array>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>

namespace ccidgadget {

// Сообщение bulk-канала в любом направлении. Три байта после bSeq хранятся
// как есть: параметры команды на входе, bStatus/bError/специфичный байт
// на выходе.
struct CcidMessage {
    uint8_t type = 0;
    uint8_t slot = 0;
    uint8_t seq = 0;
    std::array<uint8_t, 3> param{};
    std::vector<uint8_t> payload;

    // PC_to_RDR
    uint8_t  powerSelect() const { return param[0]; }
    uint8_t  bwi() const { return param[0]; }
    uint16_t levelParameter() const { return uint16_t(param[1] | (param[2] << 8)); }
    uint8_t  protocolNum() const { return param[0]; }

    // RDR_to_PC
    uint8_t status() const { return param[0]; }
    uint8_t error() const { return param[1]; }
    uint8_t chainParameter() const { return param[2]; }
    uint8_t clockStatus() const { return param[2]; }
    ccid::IccStatus iccStatus() const { return ccid::iccStatusOf(param[0]); }
    ccid::CommandStatus commandStatus() const { return ccid::commandStatusOf(param[0]); }

    // Заголовок ответа с тем же слотом и bSeq, что у команды.
    static CcidMessage replyTo(const CcidMessage& command, uint8_t responseType);
};

enum class DecodeError { None, MalformedHeader, LengthMismatch, PayloadTooLarge };

const char* decodeErrorName(DecodeError e);

struct DecodeResult {
    DecodeError error = DecodeError::None;
    // Поля заголовка, которые удалось прочитать. При ошибке payload пуст.
    CcidMessage message;
    uint32_t declaredLength = 0;

    bool ok() const { return error == DecodeError::None; }
};

class CcidCodec {
public:
    // maxMessageLength включает 10-байтовый заголовок (dwMaxCCIDMessageLength).
    explicit CcidCodec(uint32_t maxMessageLength);

    uint32_t maxMessageLength() const { return maxMessageLength_; }
    uint32_t maxPayload() const { return maxMessageLength_ - ccid::HEADER_LEN; }

    DecodeResult decode(const uint8_t* data, size_t size) const;
    DecodeResult decode(const std::vector<uint8_t>& raw) const { return decode(raw.data(), raw.size()); }

    // GadgetError, если данные не помещаются в maxPayload().
    std::vector<uint8_t> encode(const CcidMessage& msg) const;

    // dwLength заголовка; доступно не меньше HEADER_LEN байт.
    static uint32_t peekLength(const uint8_t* header);

    // RDR_to_PC_NotifySlotChange: по два бита на слот (карта есть, изменилось).
    static std::vector<uint8_t> encodeSlotChange(const std::vector<std::pair<bool, bool>>& slots);

private:
    uint32_t maxMessageLength_;
};

} // namespace ccidgadget
#endif // CCIDCODEC_H
