#pragma once
#include "../comms/IMarkerChannel.h"
#include "../comms/IResponseChannel.h"
#include "../spo/SelectableItem.h"
#include "../utils/Types.h"
/* SESSIONSTATE
--> what the controller components share about the current session:
    1) is a stimulus run going
    2) what got selected last (cleared at every run start)
    3) which training (if any) is running + the active train target
--> only touched from the scheduler thread, no atomics needed
*/

struct SessionState_S {
    bool stimulusRunning = false;
    SelectableItem_I* lastSelected = nullptr; // non-owning
    TrainingType_E currentTrainingType = TrainingType_None;
    int trainTarget = TRAIN_TARGET_NONE; // pool index being trained, TRAIN_TARGET_NONE otherwise

    bool is_training_running() const { return currentTrainingType != TrainingType_None; }
};

// Channels bound by BciController_C::initialize(); null until then (and again after clean_up())
struct SessionChannels_S {
    IMarkerChannel_S* markers = nullptr;
    IResponseChannel_S* responses = nullptr;

    bool is_bound() const { return markers != nullptr && responses != nullptr; }
};
