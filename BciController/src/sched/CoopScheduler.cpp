#include "CoopScheduler.hpp"
#include <algorithm>
#include <exception>
#include "../utils/Logger.hpp"

TaskId_T CoopScheduler_C::spawn(std::unique_ptr<CoopTask_I> task){
    if (!task) {
        LOG_ERR("sched: refusing to spawn null task");
        return TASK_ID_NONE;
    }
    auto entry = std::make_shared<taskEntry_S>();
    entry->id = nextId_++;
    entry->task = std::move(task);
    entries_.push_back(entry);
    LOG_DBG("sched: spawn id=" << entry->id << " (" << entry->task->name() << ")");

    // first step runs now, same as starting a coroutine
    step_entry(*entry);
    sweep();
    return entry->id;
}

bool CoopScheduler_C::cancel(TaskId_T id){
    if (id == TASK_ID_NONE) return false;
    for (auto& entry : entries_) {
        if (entry->id == id) {
            if (entry->cancelled || entry->finished) {
                return false;
            }
            entry->cancelled = true;
            LOG_DBG("sched: cancel id=" << id << " (" << entry->task->name() << ")");
            sweep();
            return true;
        }
    }
    return false;
}

void CoopScheduler_C::cancel_all(){
    for (auto& entry : entries_) {
        entry->cancelled = true;
    }
    sweep();
}

bool CoopScheduler_C::is_live(TaskId_T id) const {
    const taskEntry_S* entry = find(id);
    return entry != nullptr && !entry->cancelled && !entry->finished;
}

std::size_t CoopScheduler_C::live_count() const {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const std::shared_ptr<taskEntry_S>& e){ return !e->cancelled && !e->finished; }));
}

void CoopScheduler_C::tick(time_point_T now){
    now_ = now;
    ++tickCount_;
    // snapshot: tasks spawned during this tick already ran their first step
    std::vector<std::shared_ptr<taskEntry_S>> snapshot = entries_;
    for (auto& entry : snapshot) {
        step_entry(*entry);
    }
    sweep();
}

void CoopScheduler_C::step_entry(taskEntry_S& entry){
    if (entry.cancelled || entry.finished || entry.inStep) {
        return;
    }
    entry.inStep = true;
    TaskStatus_E status = TaskStatus_Done;
    try {
        status = entry.task->step(now_);
    }
    catch (const std::exception& e) {
        LOG_ERR("sched: task '" << entry.task->name() << "' (id=" << entry.id << ") failed: " << e.what());
        status = TaskStatus_Done;
    }
    entry.inStep = false;
    if (status == TaskStatus_Done) {
        entry.finished = true;
    }
}

void CoopScheduler_C::sweep(){
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
        [](const std::shared_ptr<taskEntry_S>& e){
            return (e->cancelled || e->finished) && !e->inStep;
        }), entries_.end());
}

const CoopScheduler_C::taskEntry_S* CoopScheduler_C::find(TaskId_T id) const {
    for (const auto& entry : entries_) {
        if (entry->id == id) return entry.get();
    }
    return nullptr;
}
