#include "Hex.hpp"
#include <CppUTest/TestHarness.h>

using namespace ccidgadget;

TEST_GROUP(Hex) {
};

TEST(Hex, TruncatesLongDumps) {
    const std::vector<uint8_t> v = { 0x00, 0xA4, 0x04, 0x00, 0x07 };
    STRCMP_EQUAL("00 a4 04 00 07", bytesToHex(v).c_str());
    STRCMP_EQUAL("00 a4 ...", bytesToHex(v, 2).c_str());
}
