#ifndef SLOTTABLE_H
#define SLOTTABLE_H
#pragma once
#include "Slot.h"
#include <deque>

namespace ccidgadget {

// Неизменный набор слотов по bSlot. Слоты не перемещаются, ссылки на них
// действительны всё время жизни таблицы.
class SlotTable {
public:
    static constexpr size_t MAX_SLOTS = 256;

    SlotTable(const EngineOptions& options, Slot::EventCallback onEvent = {});
    SlotTable(const SlotTable&) = delete;
    SlotTable& operator=(const SlotTable&) = delete;

    size_t size() const { return slots_.size(); }

    Slot& get(size_t index);
    const Slot& get(size_t index) const;
    Slot* find(size_t index) { return index < slots_.size() ? &slots_[index] : nullptr; }

    void attach(size_t index, ICard& card) { get(index).insert(card); }
    ICard* detach(size_t index) { return get(index).eject(); }

    std::deque<Slot>::iterator begin() { return slots_.begin(); }
    std::deque<Slot>::iterator end() { return slots_.end(); }
    std::deque<Slot>::const_iterator begin() const { return slots_.begin(); }
    std::deque<Slot>::const_iterator end() const { return slots_.end(); }

private:
    std::deque<Slot> slots_;
};

} // namespace ccidgadget
#endif // SLOTTABLE_H
