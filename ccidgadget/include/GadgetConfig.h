#ifndef GADGETCONFIG_H
#define GADGETCONFIG_H
#pragma once
#include "EngineOptions.h"
#include <QByteArray>
#include <QString>
#include <vector>

namespace ccidgadget {

// Файлы конечных точек в смонтированном каталоге FunctionFS.
struct EndpointPaths {
    QString directory;
    QString bulkOut = "ep1";
    QString bulkIn = "ep2";
    QString interruptIn = "ep3";   // пусто: без уведомлений о слотах

    QString path(const QString& name) const;
};

struct CardBinding {
    size_t slot = 0;
    QString library;   // путь/имя плагина карты (.so)
};

struct GadgetConfig {
    EngineOptions engine;
    EndpointPaths endpoints;
    std::vector<CardBinding> cards;

    // Бросают GadgetError с описанием проблемы.
    static GadgetConfig parseFile(const QString& path);
    static GadgetConfig parse(const QByteArray& json);
    void validate() const;
};

} // namespace ccidgadget
#endif // GADGETCONFIG_H
