#include "SlotTable.h"
#include <string>

namespace ccidgadget {

SlotTable::SlotTable(const EngineOptions& options, Slot::EventCallback onEvent){
    if (options.slotCount == 0 || options.slotCount > MAX_SLOTS)
        throw GadgetError("число слотов должно быть 1.." + std::to_string(MAX_SLOTS));
    for (size_t i=0; i<options.slotCount; ++i)
        slots_.emplace_back(uint8_t(i), options, onEvent);
}

Slot& SlotTable::get(size_t index){
    if (index >= slots_.size())
        throw GadgetError("нет слота " + std::to_string(index));
    return slots_[index];
}

const Slot& SlotTable::get(size_t index) const {
    if (index >= slots_.size())
        throw GadgetError("нет слота " + std::to_string(index));
    return slots_[index];
}

} // namespace ccidgadget
