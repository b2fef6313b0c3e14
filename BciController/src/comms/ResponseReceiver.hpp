/*
RESPONSE RECEIVER
- (re)starts response reception: connect if needed, restart polling, then park a pump loop in the receiveMarkers slot
- the pump loop calls dispatch_pending() once per tick, so batches reach the handler on the scheduler thread
- the handler (SelectionCoordinator_C) is wired in once by the controller
*/

#pragma once
#include "IResponseChannel.h"
#include "../sched/LoopSlots.hpp"
#include "../shared/SessionState.hpp"

class ResponseReceiver_C {
public:
	ResponseReceiver_C(SessionChannels_S& channels, LoopSlots_C& slots) : channels_(channels), slots_(slots) {};

	void set_batch_handler(ResponseBatchCallback_T handler);
	bool start_receiving(); // false if no response channel is bound
	void stop_receiving();
	bool is_receiving() const;

private:
	SessionChannels_S& channels_;
	LoopSlots_C& slots_;
	ResponseBatchCallback_T handler_;
}; // ResponseReceiver_C
