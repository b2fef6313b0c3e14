#include "LoggedSpo.hpp"
#include <utility>
#include "../utils/Logger.hpp"

LoggedSpo_C::LoggedSpo_C(std::string name, bool selectable) : name_(std::move(name)), selectable_(selectable) {
}

void LoggedSpo_C::select(){
    ++selectCount_;
    LOG_ALWAYS("spo '" << name_ << "' (pool idx " << poolIndex_ << "): select #" << selectCount_);
}

void LoggedSpo_C::on_train_target(){
    ++trainOnCount_;
    isTrainTarget_ = true;
    LOG_DBG("spo '" << name_ << "': train target on");
}

void LoggedSpo_C::off_train_target(){
    ++trainOffCount_;
    isTrainTarget_ = false;
    LOG_DBG("spo '" << name_ << "': train target off");
}
