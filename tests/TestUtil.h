#ifndef TESTUTIL_H
#define TESTUTIL_H
#pragma once
#include "CcidCodec.h"
#include <array>
#include <vector>

namespace testutil {

using ccidgadget::CcidMessage;

inline CcidMessage command(uint8_t type, uint8_t slot, uint8_t seq,
                           std::array<uint8_t, 3> param = {0, 0, 0},
                           std::vector<uint8_t> payload = {})
{
    CcidMessage m;
    m.type = type; m.slot = slot; m.seq = seq;
    m.param = param;
    m.payload = std::move(payload);
    return m;
}

inline CcidMessage xfr(uint8_t seq, std::vector<uint8_t> apdu, uint16_t level = 0, uint8_t slot = 0){
    return command(ccidgadget::ccid::PC_to_RDR_XfrBlock, slot, seq,
                   {0, uint8_t(level & 0xFF), uint8_t(level >> 8)}, std::move(apdu));
}

inline std::vector<uint8_t> raw(const CcidMessage& m, uint32_t maxMessageLength = 65554){
    return ccidgadget::CcidCodec(maxMessageLength).encode(m);
}

inline CcidMessage parse(const std::vector<uint8_t>& bytes, uint32_t maxMessageLength = 65554){
    return ccidgadget::CcidCodec(maxMessageLength).decode(bytes).message;
}

inline int icc(const CcidMessage& m) { return int(m.iccStatus()); }
inline int cmdStatus(const CcidMessage& m) { return int(m.commandStatus()); }

} // namespace testutil

#endif // TESTUTIL_H
