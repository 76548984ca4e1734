#pragma once
#include <QString>
#include <QLibrary>
#include "GadgetApi.h"

// Плагин карты (.so) и созданный им экземпляр ICard.
class CardLibrary {
public:
    CardLibrary();
    ~CardLibrary();
    CardLibrary(const CardLibrary&) = delete;
    CardLibrary& operator=(const CardLibrary&) = delete;

    bool load(const QString& path, QString* err=nullptr);
    void unload();

    ccidgadget::ICard* card() const { return card_; }
    bool isLoaded() const { return card_!=nullptr; }
    const char* libVersion() const { return ver_? ver_() : ""; }
    QString fileName() const { return lib_.fileName(); }

private:
    QLibrary lib_;
    using CreateFn  = ccidgadget::ICard*(*)();
    using DestroyFn = void(*)(ccidgadget::ICard*);
    using VerFn     = const char*(*)();

    CreateFn  create_ = nullptr;
    DestroyFn destroy_ = nullptr;
    VerFn     ver_     = nullptr;

    ccidgadget::ICard* card_ = nullptr;
};
