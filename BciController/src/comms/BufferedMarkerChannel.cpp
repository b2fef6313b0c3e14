#include "BufferedMarkerChannel.hpp"
#include <algorithm>
#include "../utils/Logger.hpp"

BufferedMarkerChannel_C::BufferedMarkerChannel_C(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

void BufferedMarkerChannel_C::write(const std::string& marker){
    markerRecord_S rec;
    rec.t_ms = logger::ms_since_start();
    rec.text = marker;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        rec.seq = ++seq_;
        history_.push_back(rec);
        while (history_.size() > capacity_) {
            history_.pop_front();
        }
    }
    LOG_DBG("marker #" << rec.seq << ": " << marker);
}

std::vector<BufferedMarkerChannel_C::markerRecord_S> BufferedMarkerChannel_C::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<markerRecord_S>(history_.begin(), history_.end());
}

std::vector<std::string> BufferedMarkerChannel_C::get_texts() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    out.reserve(history_.size());
    for (const auto& rec : history_) {
        out.push_back(rec.text);
    }
    return out;
}

std::size_t BufferedMarkerChannel_C::count_of(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<std::size_t>(std::count_if(history_.begin(), history_.end(),
        [&text](const markerRecord_S& rec){ return rec.text == text; }));
}

std::uint64_t BufferedMarkerChannel_C::get_total_written() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return seq_;
}

void BufferedMarkerChannel_C::clear(){
    std::lock_guard<std::mutex> lock(mtx_);
    history_.clear();
}
