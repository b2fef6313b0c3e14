/*
==============================================================================
	File: IResponseChannel.h
	Desc: Inbound classifier/user response tokens ("ping", "" or a decimal
	selection index), delivered in batches.
	Threading contract: the onBatch callback must only ever run on the
	scheduler thread. Implementations that receive on another thread queue
	the batches and hand them over from dispatch_pending(), which the
	receiveMarkers loop calls once per tick.
==============================================================================
*/

#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

using ResponseBatch_T = std::vector<std::string>;
using ResponseBatchCallback_T = std::function<void(const ResponseBatch_T&)>;

struct IResponseChannel_S {
	virtual bool connect() = 0;
	virtual void disconnect() = 0;
	virtual bool is_connected() const = 0;

	virtual bool start_polling(ResponseBatchCallback_T onBatch) = 0;
	virtual void stop_polling() = 0;
	virtual bool is_polling() const = 0;

	// delivers whatever arrived since the last call; returns number of batches delivered
	virtual std::size_t dispatch_pending() = 0;

	virtual ~IResponseChannel_S() = default;
}; // IResponseChannel_S
