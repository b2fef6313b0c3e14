#pragma once
#include <utility>
#include "SessionState.hpp"
#include "../comms/ResponseReceiver.hpp"
#include "../sched/CoopScheduler.hpp"
#include "../sched/LoopSlots.hpp"
#include "../spo/ISpoProvider.h"
#include "../spo/SpoRegistry.hpp"
#include "../utils/Types.h"
/* CONTROLLERCONTEXT
--> everything the stimulus engine, selection coordinator and training sequencer share, injected by reference:
    scheduler + loop slots, session state, bound channels, config, registry, response receiver
--> owned by BciController_C (or a test harness); members reference each other, so it never moves
*/

struct ControllerContext_S {
    ControllerContext_S(const ISpoProvider_S& provider, ControllerConfig_S cfg)
        : config(std::move(cfg)), registry(provider, config), receiver(channels, slots) {}
    ControllerContext_S(const ControllerContext_S&) = delete;
    ControllerContext_S& operator=(const ControllerContext_S&) = delete;

    // declaration order matters: registry/receiver hold references to the members above them
    ControllerConfig_S config;
    CoopScheduler_C scheduler;
    LoopSlots_C slots{scheduler};
    SessionState_S state;
    SessionChannels_S channels;
    SpoRegistry_C registry;
    ResponseReceiver_C receiver;
};
