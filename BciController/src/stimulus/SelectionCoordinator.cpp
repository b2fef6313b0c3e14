#include "SelectionCoordinator.hpp"
#include <charconv>
#include <memory>
#include "../utils/Logger.hpp"

namespace {

// waitToSelect slot: waits out the current run, then selects unless something else already did
class WaitToSelectTask_C : public CoopTask_I {
public:
    WaitToSelectTask_C(SelectionCoordinator_C& coordinator, ControllerContext_S& ctx, int index)
        : coordinator_(coordinator), ctx_(ctx), index_(index) {}

    TaskStatus_E step(time_point_T now) override {
        (void)now;
        if (ctx_.state.stimulusRunning) {
            return TaskStatus_Running;
        }
        if (ctx_.state.lastSelected == nullptr) {
            coordinator_.select_by_index(index_);
        }
        else {
            LOG_DBG("SEL: run ended with '" << ctx_.state.lastSelected->get_name()
                    << "' already selected, dropping deferred index " << index_);
        }
        return TaskStatus_Done;
    }

    const char* name() const override { return "waitToSelect"; }

private:
    SelectionCoordinator_C& coordinator_;
    ControllerContext_S& ctx_;
    int index_;
};

// strip spaces/tabs/CR the classifier may leave around a token
std::string trim_token(const std::string& token){
    const char* ws = " \t\r\n";
    std::size_t first = token.find_first_not_of(ws);
    if (first == std::string::npos) {
        return {};
    }
    std::size_t last = token.find_last_not_of(ws);
    return token.substr(first, last - first + 1);
}

} // namespace

bool SelectionCoordinator_C::select_by_index(int index, bool stopRun){
    if (ctx_.registry.empty()) {
        LOG_WARN("SEL: no spos to select from (registry empty)");
        return false;
    }
    if (index < 0 || index >= static_cast<int>(ctx_.registry.count())) {
        LOG_WARN("SEL: invalid selection index " << index << " (have " << ctx_.registry.count() << " spos)");
        return false;
    }

    SelectableItem_I* spo = ctx_.registry.get(static_cast<std::size_t>(index));
    if (spo == nullptr || !spo->is_valid()) {
        LOG_WARN("SEL: spo at index " << index << " is no longer valid");
        return false;
    }

    spo->select();
    ctx_.state.lastSelected = spo;
    LOG_ALWAYS("SEL: SPO '" << spo->get_name() << "' selected.");

    if (stopRun && ctx_.state.stimulusRunning) {
        engine_.stop_stimulus_run();
    }
    return true;
}

void SelectionCoordinator_C::select_at_end_of_run(int index){
    ctx_.slots.stop_start(LoopSlot_WaitToSelect, std::make_unique<WaitToSelectTask_C>(*this, ctx_, index));
}

void SelectionCoordinator_C::handle_incoming_responses(const ResponseBatch_T& tokens){
    for (const std::string& raw : tokens) {
        const std::string token = trim_token(raw);
        if (token.empty()) {
            continue;
        }

        if (token == "ping") {
            ++pingCount_;
            if (pingCount_ % PING_LOG_EVERY == 0) {
                LOG_ALWAYS("SEL: " << pingCount_ << " pings received");
            }
            continue;
        }

        int value = -1;
        if (!parse_index(token, value)) {
            LOG_DBG("SEL: ignoring response token '" << token << "'");
            continue;
        }
        if (value < static_cast<int>(ctx_.registry.count())) {
            SelectableItem_I* spo = ctx_.registry.get(static_cast<std::size_t>(value));
            if (spo != nullptr && spo->is_valid()) {
                // classifier picks bypass lastSelected/stop-on-select
                spo->select();
            }
        }
        else {
            LOG_DBG("SEL: response index " << value << " out of range (" << ctx_.registry.count() << " spos)");
        }
    }
}

bool SelectionCoordinator_C::parse_index(const std::string& token, int& out){
    if (token.empty()) {
        return false;
    }
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (*first == '+') {
        ++first;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value < 0) {
        return false;
    }
    out = value;
    return true;
}
