#include "GadgetConfig.h"
#include "GadgetApi.h"
#include "Log.h"
#include "SlotTable.h"
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <set>

namespace ccidgadget {

static GadgetError configError(const QString& what){
    return GadgetError(("Конфигурация: " + what).toStdString());
}

// Неотрицательное целое не больше max; отсутствующий ключ: def.
static quint64 uintValue(const QJsonObject& o, const char* key, quint64 def, quint64 max){
    if (!o.contains(key)) return def;
    const QJsonValue v = o.value(key);
    const double d = v.toDouble(-1);
    if (!v.isDouble() || d < 0 || d != double(quint64(d)) || quint64(d) > max)
        throw configError(QString("'%1' должно быть целым числом 0..%2").arg(QLatin1String(key)).arg(max));
    return quint64(d);
}

static QString stringValue(const QJsonObject& o, const char* key, const QString& def){
    if (!o.contains(key)) return def;
    const QJsonValue v = o.value(key);
    if (!v.isString()) throw configError(QString("'%1' должно быть строкой").arg(QLatin1String(key)));
    return v.toString();
}

QString EndpointPaths::path(const QString& name) const {
    if (directory.isEmpty()) return name;
    return QDir(directory).filePath(name);
}

GadgetConfig GadgetConfig::parse(const QByteArray& json){
    QJsonParseError perr{};
    auto doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError)
        throw configError("ошибка разбора JSON: " + perr.errorString() + " (смещение " + QString::number(perr.offset) + ")");
    if (!doc.isObject()) throw configError("корневой элемент должен быть объектом JSON");
    auto o = doc.object();

    GadgetConfig C;
    EngineOptions& E = C.engine;
    E.slotCount        = size_t(uintValue(o, "slots", E.slotCount, SlotTable::MAX_SLOTS));
    E.maxMessageLength = uint32_t(uintValue(o, "maxMessageLength", E.maxMessageLength, 0xFFFFFFFFu));
    E.maxPacketSize    = uint16_t(uintValue(o, "maxPacketSize", E.maxPacketSize, 1024));
    E.voltageSupport   = uint8_t(uintValue(o, "voltageSupport", E.voltageSupport, 0x07));
    E.maxApduLength    = uint32_t(uintValue(o, "maxApduLength", E.maxApduLength, 0xFFFFFFFFu));

    if (o.contains("endpoints")) {
        if (!o.value("endpoints").isObject()) throw configError("'endpoints' должен быть объектом");
        auto ep = o.value("endpoints").toObject();
        C.endpoints.directory   = stringValue(ep, "directory", C.endpoints.directory);
        C.endpoints.bulkOut     = stringValue(ep, "bulkOut", C.endpoints.bulkOut);
        C.endpoints.bulkIn      = stringValue(ep, "bulkIn", C.endpoints.bulkIn);
        C.endpoints.interruptIn = stringValue(ep, "interruptIn", C.endpoints.interruptIn);
    }

    if (o.contains("cards")) {
        if (!o.value("cards").isArray()) throw configError("'cards' должен быть массивом");
        for (auto v: o.value("cards").toArray()) {
            if (!v.isObject()) throw configError("элемент 'cards' должен быть объектом");
            auto c = v.toObject();
            CardBinding S;
            S.slot = size_t(uintValue(c, "slot", 0, SlotTable::MAX_SLOTS - 1));
            S.library = stringValue(c, "library", QString());
            C.cards.push_back(S);
        }
    }

    C.validate();
    qCDebug(lcConfig) << "slots" << E.slotCount << "maxMessageLength" << E.maxMessageLength
                      << "maxPacketSize" << E.maxPacketSize << "cards" << C.cards.size();
    return C;
}

GadgetConfig GadgetConfig::parseFile(const QString& path){
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) throw configError("невозможно открыть файл " + path + ": " + f.errorString());
    qCInfo(lcConfig) << "чтение" << path;
    return parse(f.readAll());
}

void GadgetConfig::validate() const {
    if (engine.slotCount == 0 || engine.slotCount > SlotTable::MAX_SLOTS)
        throw configError(QString("число слотов должно быть 1..%1").arg(SlotTable::MAX_SLOTS));
    if (engine.maxMessageLength <= ccid::HEADER_LEN)
        throw configError("maxMessageLength должно быть больше длины заголовка (10)");
    if (engine.maxPacketSize != 0 && (engine.maxPacketSize & (engine.maxPacketSize - 1)) != 0)
        throw configError("maxPacketSize должно быть степенью двойки или 0");
    if (engine.voltageSupport == 0)
        throw configError("voltageSupport: нужен хотя бы один класс напряжения");
    if (engine.maxApduLength == 0)
        throw configError("maxApduLength должно быть положительным");
    if (endpoints.bulkOut.isEmpty() || endpoints.bulkIn.isEmpty())
        throw configError("не заданы файлы bulk-конечных точек");

    std::set<size_t> used;
    for (const auto& c: cards) {
        if (c.slot >= engine.slotCount)
            throw configError(QString("карта для несуществующего слота %1").arg(c.slot));
        if (c.library.isEmpty())
            throw configError(QString("для слота %1 не указана библиотека карты").arg(c.slot));
        if (!used.insert(c.slot).second)
            throw configError(QString("слот %1 указан дважды").arg(c.slot));
    }
}

} // namespace ccidgadget
