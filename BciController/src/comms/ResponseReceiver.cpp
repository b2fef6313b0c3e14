#include "ResponseReceiver.hpp"
#include <memory>
#include <utility>
#include "../utils/Logger.hpp"

namespace {

// pumps queued batches onto the scheduler thread while the channel polls
class ResponsePumpTask_C : public CoopTask_I {
public:
    explicit ResponsePumpTask_C(IResponseChannel_S& channel) : channel_(channel) {}

    TaskStatus_E step(time_point_T now) override {
        (void)now;
        if (!channel_.is_polling()) {
            return TaskStatus_Done;
        }
        channel_.dispatch_pending();
        return TaskStatus_Running;
    }

    const char* name() const override { return "receiveMarkers"; }

private:
    IResponseChannel_S& channel_;
};

} // namespace

void ResponseReceiver_C::set_batch_handler(ResponseBatchCallback_T handler){
    handler_ = std::move(handler);
}

bool ResponseReceiver_C::start_receiving(){
    IResponseChannel_S* channel = channels_.responses;
    if (channel == nullptr) {
        LOG_ERR("RR: no response channel bound (initialize() not called)");
        return false;
    }
    if (!channel->is_connected()) {
        channel->connect();
    }
    if (channel->is_polling()) {
        channel->stop_polling();
    }

    // forward through a lambda so a later set_batch_handler() still applies
    bool ok = channel->start_polling([this](const ResponseBatch_T& batch){
        if (handler_) {
            handler_(batch);
        }
    });
    if (!ok) {
        LOG_ERR("RR: response channel refused to start polling");
        slots_.stop(LoopSlot_ReceiveMarkers);
        return false;
    }

    slots_.stop_start(LoopSlot_ReceiveMarkers, std::make_unique<ResponsePumpTask_C>(*channel));
    return true;
}

void ResponseReceiver_C::stop_receiving(){
    if (channels_.responses != nullptr) {
        channels_.responses->stop_polling();
    }
    slots_.stop(LoopSlot_ReceiveMarkers);
}

bool ResponseReceiver_C::is_receiving() const {
    return channels_.responses != nullptr && channels_.responses->is_polling();
}
