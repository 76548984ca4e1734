#include "GadgetConfig.h"
#include "GadgetApi.h"
#include <QTemporaryDir>
#include <QFile>
#include <CppUTest/TestHarness.h>

using namespace ccidgadget;

TEST_GROUP(GadgetConfig) {
};

TEST(GadgetConfig, DefaultsFromEmptyObject) {
    auto c = GadgetConfig::parse("{}");
    LONGS_EQUAL(1, c.engine.slotCount);
    LONGS_EQUAL(65554, c.engine.maxMessageLength);
    LONGS_EQUAL(512, c.engine.maxPacketSize);
    LONGS_EQUAL(ccid::VOLTAGE_5V, c.engine.voltageSupport);
    LONGS_EQUAL(65544, c.engine.maxApduLength);
    CHECK_TRUE(c.endpoints.directory.isEmpty());
    CHECK_TRUE(c.endpoints.path(c.endpoints.bulkOut) == "ep1");
    CHECK_TRUE(c.cards.empty());
}

TEST(GadgetConfig, FullDocument) {
    auto c = GadgetConfig::parse(R"({
        "slots": 3,
        "maxMessageLength": 271,
        "maxPacketSize": 64,
        "voltageSupport": 7,
        "maxApduLength": 4096,
        "endpoints": { "directory": "/dev/ffs-ccid", "interruptIn": "" },
        "cards": [ { "slot": 0, "library": "libsoftcard.so" },
                   { "slot": 2, "library": "/opt/cards/libother.so" } ]
    })");
    LONGS_EQUAL(3, c.engine.slotCount);
    LONGS_EQUAL(271, c.engine.maxMessageLength);
    LONGS_EQUAL(64, c.engine.maxPacketSize);
    LONGS_EQUAL(7, c.engine.voltageSupport);
    LONGS_EQUAL(4096, c.engine.maxApduLength);
    CHECK_TRUE(c.endpoints.path(c.endpoints.bulkIn) == "/dev/ffs-ccid/ep2");
    CHECK_TRUE(c.endpoints.interruptIn.isEmpty());
    LONGS_EQUAL(2, c.cards.size());
    LONGS_EQUAL(2, c.cards[1].slot);
    CHECK_TRUE(c.cards[1].library == "/opt/cards/libother.so");
}

TEST(GadgetConfig, RejectsBadValues) {
    CHECK_THROWS(GadgetError, GadgetConfig::parse("not json"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse("[1, 2]"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"slots": 0})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"slots": 257})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"slots": 1.5})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"slots": "2"})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"maxMessageLength": 10})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"maxPacketSize": 100})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"maxPacketSize": 2048})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"voltageSupport": 0})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"maxApduLength": 0})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"endpoints": {"bulkIn": ""}})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"endpoints": "ep"})"));
}

TEST(GadgetConfig, RejectsBadCards) {
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"cards": {}})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"cards": [ {"slot": 1, "library": "a.so"} ]})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(R"({"cards": [ {"slot": 0} ]})"));
    CHECK_THROWS(GadgetError, GadgetConfig::parse(
        R"({"slots": 2, "cards": [ {"slot": 1, "library": "a.so"}, {"slot": 1, "library": "b.so"} ]})"));
}

TEST(GadgetConfig, ValidateAfterOverride) {
    auto c = GadgetConfig::parse(R"({"slots": 2})");
    c.cards.push_back({ 1, "libsoftcard.so" });
    c.validate();
    c.engine.slotCount = 1;
    CHECK_THROWS(GadgetError, c.validate());
}

TEST(GadgetConfig, ReadsFile) {
    QTemporaryDir dir;
    CHECK_TRUE(dir.isValid());
    const QString path = dir.filePath("gadget.json");
    QFile f(path);
    CHECK_TRUE(f.open(QIODevice::WriteOnly));
    f.write(R"({"slots": 2, "maxPacketSize": 0})");
    f.close();

    auto c = GadgetConfig::parseFile(path);
    LONGS_EQUAL(2, c.engine.slotCount);
    LONGS_EQUAL(0, c.engine.maxPacketSize);

    CHECK_THROWS(GadgetError, GadgetConfig::parseFile(dir.filePath("missing.json")));
}
