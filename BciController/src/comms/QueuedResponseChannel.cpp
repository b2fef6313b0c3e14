#include "QueuedResponseChannel.hpp"
#include <iterator>
#include <utility>
#include "../utils/Logger.hpp"

bool QueuedResponseChannel_C::connect(){
    connected_.store(true, std::memory_order_release);
    LOG_ALWAYS("responses: connected");
    return true;
}

void QueuedResponseChannel_C::disconnect(){
    stop_polling();
    connected_.store(false, std::memory_order_release);
    std::lock_guard<std::mutex> lock(queue_mtx_);
    if (!pending_.empty()) {
        LOG_DBG("responses: dropping " << pending_.size() << " queued batches on disconnect");
    }
    pending_.clear();
    LOG_ALWAYS("responses: disconnected");
}

bool QueuedResponseChannel_C::start_polling(ResponseBatchCallback_T onBatch){
    if (!is_connected()) {
        LOG_WARN("responses: start_polling while disconnected");
        return false;
    }
    if (!onBatch) {
        LOG_WARN("responses: start_polling without a callback");
        return false;
    }
    onBatch_ = std::move(onBatch);
    polling_.store(true, std::memory_order_release);
    return true;
}

void QueuedResponseChannel_C::stop_polling(){
    polling_.store(false, std::memory_order_release);
    onBatch_ = nullptr;
}

std::size_t QueuedResponseChannel_C::dispatch_pending(){
    if (!is_polling()) {
        return 0;
    }
    std::deque<ResponseBatch_T> ready;
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        ready.swap(pending_);
    }
    // local copy: the handler may stop polling (and clear onBatch_) mid-dispatch
    ResponseBatchCallback_T cb = onBatch_;
    std::size_t delivered = 0;
    while (!ready.empty() && cb && is_polling()) {
        ResponseBatch_T batch = std::move(ready.front());
        ready.pop_front();
        cb(batch);
        ++delivered;
    }
    if (!ready.empty() && is_connected()) {
        // polling stopped mid-dispatch: keep the rest, in order, for the next poller
        std::lock_guard<std::mutex> lock(queue_mtx_);
        pending_.insert(pending_.begin(), std::make_move_iterator(ready.begin()), std::make_move_iterator(ready.end()));
    }
    return delivered;
}

bool QueuedResponseChannel_C::push_batch(ResponseBatch_T batch){
    if (!is_connected()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(queue_mtx_);
    pending_.push_back(std::move(batch));
    return true;
}

bool QueuedResponseChannel_C::push_tokens(const std::string& csv){
    return push_batch(split_tokens(csv));
}

std::size_t QueuedResponseChannel_C::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mtx_);
    return pending_.size();
}

ResponseBatch_T QueuedResponseChannel_C::split_tokens(const std::string& csv, char sep){
    ResponseBatch_T out;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = csv.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(csv.substr(start));
            break;
        }
        out.push_back(csv.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}
