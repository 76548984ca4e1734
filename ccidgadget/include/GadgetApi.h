#ifndef GADGETAPI_H
#define GADGETAPI_H
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>

#if defined(_WIN32)
#define CCIDGADGET_API __declspec(dllexport)
#else
#define CCIDGADGET_API __attribute((visibility("default")))
#endif

namespace ccidgadget {

struct GadgetError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Конечная точка закрыта, устройство отключено или ошибка ввода-вывода.
// Завершает цикл EventPump.
struct TransportError : public GadgetError {
    using GadgetError::GadgetError;
};

// Блокирующее чтение прервано через cancel().
struct TransportCancelled : public TransportError {
    using TransportError::TransportError;
};

// Карта в слоте. Движок ею не владеет: объект живёт, пока вставлен в слот.
class ICard {
public:
    virtual ~ICard() = default;

    // Сбросить всё volatile-состояние (выбранный апплет, статус безопасности...).
    // false: сброс не удался.
    virtual bool clearVolatiles() = 0;

    // ATR; вызывается при каждой подаче питания из выключенного состояния.
    virtual std::vector<uint8_t> getATR() = 0;

    // Полный C-APDU на входе, полный R-APDU (данные + SW1 SW2) на выходе.
    virtual std::vector<uint8_t> runAPDU(const std::vector<uint8_t>& capdu) = 0;
};

// Экспорт плагина карты, загружаемого ccid-gadget.
extern "C" {
CCIDGADGET_API ICard*      create_card();
CCIDGADGET_API void        destroy_card(ICard*);
CCIDGADGET_API const char* card_library_version();
}

} // namespace ccidgadget
#endif // GADGETAPI_H
