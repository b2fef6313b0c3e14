/*
==============================================================================
	File: SessionBridge.hpp
	Desc: Glue between the http thread and the frame loop, kept free of
	httplib so it can be self-tested headless.
	* http thread side: parse POST /event and POST /config bodies into a
	  ControlRequest_S / ControllerConfig_S (no controller access)
	* frame thread side: pump_frame() drains queued requests into the
	  controller, ticks it and publishes the snapshot to the StateStore
==============================================================================
*/

#pragma once
#include <optional>
#include <string>
#include "BciController.hpp"
#include "../shared/StateStore.hpp"
#include "../utils/Types.h"

namespace bridge {

std::optional<ControlEvent_E> action_to_event(const std::string& action);

// false + short error code ("missing_action", "unknown_training", ...) on a bad body
bool parse_control_request(const std::string& body, ControlRequest_S& out, std::string& error);

// overrides the fields present in body, returns how many were found
int apply_config_overrides(const std::string& body, ControllerConfig_S& cfg);
bool is_config_valid(const ControllerConfig_S& cfg);

// frame thread only
bool apply_control(BciController_C& controller, const ControlRequest_S& req);
bool publish_state(const BciController_C& controller, StateStore_s& stateStore); // true if anything changed
void pump_frame(BciController_C& controller, StateStore_s& stateStore, time_point_T now);

} // namespace bridge
