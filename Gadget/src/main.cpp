#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QLoggingCategory>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>
#include "CardLibrary.hpp"
#include "Endpoint.h"
#include "EventPump.h"
#include "GadgetConfig.h"
#include "ProtocolEngine.h"

using namespace ccidgadget;

static EventPump* g_pump = nullptr;

static void onSignal(int){
    if (g_pump) g_pump->stop();
}

static void installSignals(){
    struct sigaction sa{};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// "[SLOT=]ПУТЬ"
static CardBinding parseCardOpt(const QString& s){
    CardBinding c;
    const int eq = s.indexOf('=');
    if (eq < 0) { c.library = s; return c; }
    bool ok = false;
    c.slot = s.left(eq).toUInt(&ok, 10);
    if (!ok) throw GadgetError(("некорректный номер слота в --card: " + s).toStdString());
    c.library = s.mid(eq+1);
    return c;
}

static uint32_t uintOpt(const QCommandLineParser& p, const QCommandLineOption& o){
    bool ok = false;
    uint v = p.value(o).toUInt(&ok, 10);
    if (!ok) throw GadgetError(("некорректное значение --" + o.names().first() + ": " + p.value(o)).toStdString());
    return v;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ccid-gadget");
    QCoreApplication::setApplicationVersion("0.1");

    QCommandLineParser p;
    p.setApplicationDescription(
        "USB CCID/ICCD ридер на стороне устройства (FunctionFS).\n"
        "Дескрипторы и монтирование FunctionFS выполняются заранее;\n"
        "программа работает с готовыми файлами конечных точек ep1/ep2/ep3.\n"
        "Остановка: SIGINT/SIGTERM."
        );
    p.addHelpOption();
    p.addVersionOption();

    QCommandLineOption cfgOpt(QStringList() << "c" << "config",
                              "JSON-файл конфигурации", "ФАЙЛ");
    QCommandLineOption dirOpt(QStringList() << "ep-dir",
                              "Каталог смонтированного FunctionFS", "КАТАЛОГ");
    QCommandLineOption slotsOpt(QStringList() << "slots",
                                "Число слотов (1..256)", "N");
    QCommandLineOption cardOpt(QStringList() << "card",
                               "Плагин карты для слота, можно несколько раз (напр. 0=softcard)", "[SLOT=]ПУТЬ");
    QCommandLineOption maxMsgOpt(QStringList() << "max-message",
                                 "dwMaxCCIDMessageLength, байт (по умолчанию 65554)", "N");
    QCommandLineOption packetOpt(QStringList() << "packet-size",
                                 "wMaxPacketSize bulk IN для завершения ZLP (0: выкл.)", "N");
    QCommandLineOption noIntrOpt(QStringList() << "no-interrupt",
                                 "Не использовать interrupt IN (уведомления о слотах)");
    QCommandLineOption verboseOpt(QStringList() << "v" << "verbose",
                                  "Подробный журнал (ccidgadget.*.debug)");
    p.addOption(cfgOpt); p.addOption(dirOpt);
    p.addOption(slotsOpt); p.addOption(cardOpt);
    p.addOption(maxMsgOpt); p.addOption(packetOpt);
    p.addOption(noIntrOpt); p.addOption(verboseOpt);
    p.process(app);

    if (p.isSet(verboseOpt))
        QLoggingCategory::setFilterRules("ccidgadget.*.debug=true");

    GadgetConfig cfg;
    try {
        if (p.isSet(cfgOpt)) cfg = GadgetConfig::parseFile(p.value(cfgOpt));
        if (p.isSet(dirOpt)) cfg.endpoints.directory = p.value(dirOpt);
        if (p.isSet(slotsOpt)) cfg.engine.slotCount = uintOpt(p, slotsOpt);
        if (p.isSet(maxMsgOpt)) cfg.engine.maxMessageLength = uintOpt(p, maxMsgOpt);
        if (p.isSet(packetOpt)) cfg.engine.maxPacketSize = uint16_t(uintOpt(p, packetOpt));
        if (p.isSet(noIntrOpt)) cfg.endpoints.interruptIn.clear();
        if (p.isSet(cardOpt)) {
            cfg.cards.clear();
            for (const auto& s: p.values(cardOpt)) cfg.cards.push_back(parseCardOpt(s));
        }
        cfg.validate();
    } catch (const GadgetError& ex) {
        std::cerr << "Ошибка: " << ex.what() << "\n";
        return 2;
    }

    // --- загрузка карт ---
    std::vector<std::unique_ptr<CardLibrary>> libs;
    for (const auto& c: cfg.cards) {
        auto lib = std::make_unique<CardLibrary>();
        QString err;
        if (!lib->load(c.library, &err)) {
            std::cerr << "Слот " << c.slot << ": " << err.toStdString() << "\n";
            return 1;
        }
        std::cerr << "Слот " << c.slot << ": " << lib->libVersion() << "\n";
        libs.push_back(std::move(lib));
    }

    try {
        auto epOut = FdEndpoint::open(cfg.endpoints.path(cfg.endpoints.bulkOut).toStdString(), FdEndpoint::Direction::Out);
        auto epIn  = FdEndpoint::open(cfg.endpoints.path(cfg.endpoints.bulkIn).toStdString(), FdEndpoint::Direction::In);
        std::optional<FdEndpoint> epIntr;
        if (!cfg.endpoints.interruptIn.isEmpty())
            epIntr.emplace(FdEndpoint::open(cfg.endpoints.path(cfg.endpoints.interruptIn).toStdString(), FdEndpoint::Direction::In));

        ProtocolEngine engine(cfg.engine, epOut, epIn, epIntr ? &*epIntr : nullptr);
        for (size_t i=0;i<cfg.cards.size();++i)
            engine.slots().attach(cfg.cards[i].slot, *libs[i]->card());

        EventPump pump(engine);
        g_pump = &pump;
        installSignals();
        pump.runForever();
        g_pump = nullptr;

        for (size_t i=0;i<cfg.cards.size();++i)
            engine.slots().detach(cfg.cards[i].slot);
        // хост узнаёт об извлечении, если ещё опрашивает interrupt IN
        if (epIntr && !engine.waitNotificationsSent(std::chrono::milliseconds(500)))
            std::cerr << "NotifySlotChange об извлечении не отправлено\n";
        std::cerr << "Остановлено, обработано сообщений: " << pump.messagesHandled() << "\n";
    } catch (const TransportError& ex) {
        g_pump = nullptr;
        std::cerr << "Ошибка транспорта: " << ex.what() << "\n";
        return 1;
    } catch (const GadgetError& ex) {
        g_pump = nullptr;
        std::cerr << "Ошибка: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
