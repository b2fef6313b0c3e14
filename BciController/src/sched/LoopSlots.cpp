#include "LoopSlots.hpp"
#include "../utils/Logger.hpp"

TaskId_T LoopSlots_C::stop_start(LoopSlot_E slot, std::unique_ptr<CoopTask_I> task){
    // old occupant is cancelled before the new one takes its first step
    stop(slot);
    TaskId_T id = scheduler_.spawn(std::move(task));
    if (slots_[slot] != TASK_ID_NONE) {
        // the first step restarted this same slot; the newer occupant wins
        scheduler_.cancel(id);
        return id;
    }
    slots_[slot] = id;
    LOG_DBG("slots: " << LoopSlotToString(slot) << " <- task " << id);
    return id;
}

void LoopSlots_C::stop(LoopSlot_E slot){
    TaskId_T id = slots_[slot];
    slots_[slot] = TASK_ID_NONE;
    if (id != TASK_ID_NONE) {
        scheduler_.cancel(id);
    }
}

void LoopSlots_C::stop_all(){
    for (int s = 0; s < LoopSlot_Count; ++s) {
        stop(static_cast<LoopSlot_E>(s));
    }
}

bool LoopSlots_C::is_occupied(LoopSlot_E slot) const {
    return slots_[slot] != TASK_ID_NONE && scheduler_.is_live(slots_[slot]);
}
