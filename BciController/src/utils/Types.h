/*
==============================================================================
	File: Types.h
	Desc: Common type definitions between modules.
	This header is used by:
  - the cooperative scheduler + loop slots (task status, slot names)
  - the stimulus engine / selection / training components (config, enums)
  - the session bridge app (control events sent over HTTP)

==============================================================================
*/

#pragma once
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// _T for type
// Use steady clock for time measurements (monotonic, not affected by system clock changes)
using clock_T = std::chrono::steady_clock;
using ms_T = std::chrono::milliseconds;
using time_point_T = std::chrono::time_point<clock_T>;

/* START CONFIGS */

// train target value meaning "no active training target" (anything >= spo count works the same)
inline constexpr int TRAIN_TARGET_NONE = 99;

// pings between liveness log lines
inline constexpr int PING_LOG_EVERY = 100;

// fixed waits inside the automated training sequence
inline constexpr float TRAIN_INITIAL_PAUSE_S = 0.001f;
inline constexpr float TRAIN_SETTLE_S = 0.5f;

/* END CONFIGS */

/* START ENUMS */

enum TrainingType_E {
	TrainingType_None,
	TrainingType_Automated,
	TrainingType_Iterative,
	TrainingType_User,
}; // TrainingType_E

enum SpoPopulation_E {
	SpoPopulation_Predefined, // keep current contents
	SpoPopulation_Tag,        // query tagged objects from provider
	SpoPopulation_Children,   // not implemented
}; // SpoPopulation_E

// paradigm a controller implements
enum BciBehaviorType_E {
	BciBehaviorType_Unset,
	BciBehaviorType_SSVEP,
	BciBehaviorType_P300,
	BciBehaviorType_MI,
	BciBehaviorType_Switch,
}; // BciBehaviorType_E

// named loop slots, each holds at most one live task
enum LoopSlot_E {
	LoopSlot_ReceiveMarkers,
	LoopSlot_SendMarkers,
	LoopSlot_RunStimulus,
	LoopSlot_WaitToSelect,
	LoopSlot_Training,
	LoopSlot_Count,
}; // LoopSlot_E

enum TaskStatus_E {
	TaskStatus_Running, // resume on a later tick
	TaskStatus_Done,
}; // TaskStatus_E

// requests the bridge app's HTTP thread hands to the frame loop
enum ControlEvent_E {
	ControlEvent_None,
	ControlEvent_StartRun,
	ControlEvent_StartRunNoMarkers,
	ControlEvent_StopRun,
	ControlEvent_ToggleRun,
	ControlEvent_StartTraining,
	ControlEvent_StopTraining,
	ControlEvent_Select,
	ControlEvent_SelectAtEnd,
}; // ControlEvent_E

/* END ENUMS */

/* START STRUCTS */

struct ControllerConfig_S {
	// stimulus on/off + sending markers
	float windowLength_s = 1.0f;
	float interWindowInterval_s = 0.0f;

	// training
	int numTrainingSelections = 0;
	int numTrainWindows = 3;
	float pauseBeforeTraining_s = 2.0f; // unused: the automated routine has its own fixed initial pause
	bool trainTargetPersistent = false;
	float trainTargetPresentationTime_s = 3.0f;
	float trainBreak_s = 1.0f;
	bool shamFeedback = false;

	// tag used by SpoPopulation_Tag
	std::string groupTag = "BCI";
}; // ControllerConfig_S

struct ControlRequest_S {
	ControlEvent_E event = ControlEvent_None;
	TrainingType_E training = TrainingType_None;
	int index = -1;
}; // ControlRequest_S

/* END STRUCTS */

/* START HELPERS */

inline clock_T::duration SecondsToDuration(float seconds) {
	if (seconds <= 0.0f) {
		return clock_T::duration{ 0 };
	}
	return std::chrono::duration_cast<clock_T::duration>(std::chrono::duration<float>(seconds));
}

inline const char* TrainingTypeToString(TrainingType_E type) {
	switch (type) {
		case TrainingType_Automated:
			return "Automated";
		case TrainingType_Iterative:
			return "Iterative";
		case TrainingType_User:
			return "User";
		case TrainingType_None:
		default:
			return "None";
	}
}

// accepts "automated" / "Automated" etc
inline std::optional<TrainingType_E> TrainingTypeFromString(std::string name) {
	for (char& c : name) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	if (name == "none") return TrainingType_None;
	if (name == "automated") return TrainingType_Automated;
	if (name == "iterative") return TrainingType_Iterative;
	if (name == "user") return TrainingType_User;
	return std::nullopt;
}

inline const char* SpoPopulationToString(SpoPopulation_E method) {
	switch (method) {
		case SpoPopulation_Predefined:
			return "Predefined";
		case SpoPopulation_Children:
			return "Children";
		case SpoPopulation_Tag:
		default:
			return "Tag";
	}
}

// exact enumerator names only ("Predefined", "Tag", "Children")
inline std::optional<SpoPopulation_E> SpoPopulationFromString(const std::string& name) {
	if (name == "Predefined") return SpoPopulation_Predefined;
	if (name == "Tag") return SpoPopulation_Tag;
	if (name == "Children") return SpoPopulation_Children;
	return std::nullopt;
}

inline const char* LoopSlotToString(LoopSlot_E slot) {
	switch (slot) {
		case LoopSlot_ReceiveMarkers:
			return "receiveMarkers";
		case LoopSlot_SendMarkers:
			return "sendMarkers";
		case LoopSlot_RunStimulus:
			return "runStimulus";
		case LoopSlot_WaitToSelect:
			return "waitToSelect";
		case LoopSlot_Training:
			return "training";
		default:
			return "unknown";
	}
}

/* END HELPERS */
