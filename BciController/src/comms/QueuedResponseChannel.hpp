/*
==============================================================================
	File: QueuedResponseChannel.hpp
	Desc: IResponseChannel_S fed from any thread (HTTP handler, classifier
	thread, test driver) through push_batch(). Batches wait in a mutex
	guarded queue until dispatch_pending() runs on the scheduler thread, so
	the onBatch callback never runs concurrently with the controller.
	* pushes are refused while disconnected
	* disconnect() drops anything still queued
==============================================================================
*/

#pragma once
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include "IResponseChannel.h"

class QueuedResponseChannel_C : public IResponseChannel_S {
public:
	QueuedResponseChannel_C() = default;
	QueuedResponseChannel_C(const QueuedResponseChannel_C&) = delete;
	QueuedResponseChannel_C& operator=(const QueuedResponseChannel_C&) = delete;

	bool connect() override;
	void disconnect() override;
	bool is_connected() const override { return connected_.load(std::memory_order_acquire); };

	bool start_polling(ResponseBatchCallback_T onBatch) override;
	void stop_polling() override;
	bool is_polling() const override { return polling_.load(std::memory_order_acquire); };

	std::size_t dispatch_pending() override;

	// producer side (any thread)
	bool push_batch(ResponseBatch_T batch);
	bool push_tokens(const std::string& csv); // "ping,2" -> {"ping","2"}
	std::size_t pending_count() const;

	static ResponseBatch_T split_tokens(const std::string& csv, char sep = ',');

private:
	std::atomic<bool> connected_{false};
	std::atomic<bool> polling_{false};
	ResponseBatchCallback_T onBatch_; // scheduler thread only

	mutable std::mutex queue_mtx_;
	std::deque<ResponseBatch_T> pending_;
}; // QueuedResponseChannel_C
