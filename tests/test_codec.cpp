#include "CcidCodec.h"
#include "GadgetApi.h"
#include "TestUtil.h"
#include <CppUTest/TestHarness.h>

using namespace ccidgadget;
using namespace ccidgadget::ccid;
using namespace testutil;

TEST_GROUP(CcidCodec) {
    CcidCodec codec{65554};
};

TEST(CcidCodec, DecodesXfrBlock) {
    const std::vector<uint8_t> bytes = {
        0x6F, 0x04, 0x00, 0x00, 0x00, 0x00, 0x07, 0x00, 0x01, 0x00,
        0x00, 0xA4, 0x04, 0x00 };
    auto r = codec.decode(bytes);
    CHECK_TRUE(r.ok());
    LONGS_EQUAL(PC_to_RDR_XfrBlock, r.message.type);
    LONGS_EQUAL(0, r.message.slot);
    LONGS_EQUAL(7, r.message.seq);
    LONGS_EQUAL(LEVEL_BEGIN, r.message.levelParameter());
    LONGS_EQUAL(4, r.declaredLength);
    CHECK(r.message.payload == std::vector<uint8_t>({0x00, 0xA4, 0x04, 0x00}));
}

TEST(CcidCodec, ShortHeaderIsMalformedButKeepsFields) {
    const std::vector<uint8_t> bytes = { 0x65, 0x00, 0x00, 0x00, 0x00, 0x02, 0x09 };
    auto r = codec.decode(bytes);
    CHECK_FALSE(r.ok());
    LONGS_EQUAL(int(DecodeError::MalformedHeader), int(r.error));
    LONGS_EQUAL(0x65, r.message.type);
    LONGS_EQUAL(2, r.message.slot);
    LONGS_EQUAL(9, r.message.seq);
}

TEST(CcidCodec, EmptyInputIsMalformed) {
    auto r = codec.decode(nullptr, 0);
    LONGS_EQUAL(int(DecodeError::MalformedHeader), int(r.error));
}

TEST(CcidCodec, LengthFieldLargerThanData) {
    auto bytes = raw(command(PC_to_RDR_XfrBlock, 0, 3, {0,0,0}, {1, 2, 3, 4}));
    bytes.pop_back();
    auto r = codec.decode(bytes);
    LONGS_EQUAL(int(DecodeError::LengthMismatch), int(r.error));
    LONGS_EQUAL(3, r.message.seq);
    LONGS_EQUAL(4, r.declaredLength);
    CHECK_TRUE(r.message.payload.empty());
}

TEST(CcidCodec, LengthFieldSmallerThanData) {
    auto bytes = raw(command(PC_to_RDR_GetSlotStatus, 0, 1));
    bytes.push_back(0xAA);
    LONGS_EQUAL(int(DecodeError::LengthMismatch), int(codec.decode(bytes).error));
}

TEST(CcidCodec, LengthAboveConfiguredMaximum) {
    CcidCodec small(10 + 16);
    std::vector<uint8_t> header = { 0x6F, 17, 0, 0, 0, 0, 5, 0, 0, 0 };
    auto r = small.decode(header);
    LONGS_EQUAL(int(DecodeError::PayloadTooLarge), int(r.error));
    LONGS_EQUAL(17, r.declaredLength);
    LONGS_EQUAL(5, r.message.seq);

    header[1] = 16;
    std::vector<uint8_t> full = header;
    full.resize(26);
    CHECK_TRUE(small.decode(full).ok());
}

TEST(CcidCodec, EncodesLittleEndianLength) {
    CcidMessage m = command(RDR_to_PC_DataBlock, 1, 0x42, {0x00, 0x00, 0x00},
                            std::vector<uint8_t>(0x0123, 0x5A));
    auto out = codec.encode(m);
    LONGS_EQUAL(10 + 0x0123, out.size());
    LONGS_EQUAL(0x80, out[0]);
    LONGS_EQUAL(0x23, out[1]);
    LONGS_EQUAL(0x01, out[2]);
    LONGS_EQUAL(0x00, out[3]);
    LONGS_EQUAL(0x00, out[4]);
    LONGS_EQUAL(1, out[5]);
    LONGS_EQUAL(0x42, out[6]);
    LONGS_EQUAL(0x123, CcidCodec::peekLength(out.data()));
}

TEST(CcidCodec, EncodeRejectsOversizedPayload) {
    CcidCodec small(10 + 4);
    CcidMessage m = command(RDR_to_PC_DataBlock, 0, 0, {0,0,0}, {1, 2, 3, 4, 5});
    CHECK_THROWS(GadgetError, small.encode(m));
}

TEST(CcidCodec, ConstructorRejectsHeaderOnlyLimit) {
    CHECK_THROWS(GadgetError, CcidCodec(10));
}

// Ответ, собранный из полей разобранной команды, кодируется и
// разбирается обратно без искажений.
TEST(CcidCodec, HeaderEchoRoundTrip) {
    auto cmd = codec.decode(raw(command(PC_to_RDR_IccPowerOn, 0, 0x9C, {0x01, 0, 0}))).message;
    CcidMessage resp = CcidMessage::replyTo(cmd, responseTypeFor(cmd.type));
    resp.param = { makeStatus(IccStatus::Active, CommandStatus::Ok), 0x00, 0x00 };
    resp.payload = { 0x3B, 0x00 };

    auto bytes = codec.encode(resp);
    auto again = codec.decode(bytes);
    CHECK_TRUE(again.ok());
    CHECK(codec.encode(again.message) == bytes);
    LONGS_EQUAL(0x9C, again.message.seq);
    LONGS_EQUAL(RDR_to_PC_DataBlock, again.message.type);
}

TEST(CcidCodec, StatusByteLayout) {
    LONGS_EQUAL(0x00, makeStatus(IccStatus::Active, CommandStatus::Ok));
    LONGS_EQUAL(0x42, makeStatus(IccStatus::NotPresent, CommandStatus::Failed));
    LONGS_EQUAL(0x41, makeStatus(IccStatus::Inactive, CommandStatus::Failed));
    LONGS_EQUAL(int(IccStatus::NotPresent), int(iccStatusOf(0x42)));
    LONGS_EQUAL(int(CommandStatus::Failed), int(commandStatusOf(0x42)));
}

TEST(CcidCodec, ResponseTypes) {
    LONGS_EQUAL(RDR_to_PC_DataBlock, responseTypeFor(PC_to_RDR_IccPowerOn));
    LONGS_EQUAL(RDR_to_PC_DataBlock, responseTypeFor(PC_to_RDR_XfrBlock));
    LONGS_EQUAL(RDR_to_PC_SlotStatus, responseTypeFor(PC_to_RDR_IccPowerOff));
    LONGS_EQUAL(RDR_to_PC_SlotStatus, responseTypeFor(PC_to_RDR_GetSlotStatus));
    LONGS_EQUAL(RDR_to_PC_SlotStatus, responseTypeFor(PC_to_RDR_Abort));
    LONGS_EQUAL(RDR_to_PC_Parameters, responseTypeFor(PC_to_RDR_SetParameters));
    LONGS_EQUAL(RDR_to_PC_Escape, responseTypeFor(PC_to_RDR_Escape));
    LONGS_EQUAL(RDR_to_PC_DataRateAndClockFrequency, responseTypeFor(PC_to_RDR_SetDataRateAndClockFrequency));
    LONGS_EQUAL(RDR_to_PC_SlotStatus, responseTypeFor(0x99));
}

TEST(CcidCodec, SlotChangeBitmap) {
    // слоты 0..4: есть+изменился, пусто, есть, пусто+изменился, есть+изменился
    auto m = CcidCodec::encodeSlotChange({ {true, true}, {false, false}, {true, false},
                                           {false, true}, {true, true} });
    LONGS_EQUAL(3, m.size());
    LONGS_EQUAL(RDR_to_PC_NotifySlotChange, m[0]);
    LONGS_EQUAL(0x03 | (0x00 << 2) | (0x01 << 4) | (0x02 << 6), m[1]);
    LONGS_EQUAL(0x03, m[2]);
}
