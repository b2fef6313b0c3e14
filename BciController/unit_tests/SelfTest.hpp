/* SELFTEST HELPERS
- SELFTEST_CHECK(cond): counts + logs a failed check, keeps going
- RUN_SELFTEST(fn): runs one named check group
- selftest::finish(): summary line, returns the process exit code
- FrameClock_S / SessionRig_S: synthetic frame clock + a headless controller
  (directory of LoggedSpo_C, buffered markers, queued responses), so nothing sleeps
*/

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "../src/comms/BufferedMarkerChannel.hpp"
#include "../src/comms/QueuedResponseChannel.hpp"
#include "../src/spo/LoggedSpo.hpp"
#include "../src/spo/SpoDirectory.hpp"
#include "../src/stimulus/BciController.hpp"
#include "../src/utils/Logger.hpp"
#include "../src/utils/Types.h"

namespace selftest {
inline int g_checks = 0;
inline int g_failures = 0;

inline int finish(const char* suite) {
    if (g_failures == 0) {
        LOG_ALWAYS(suite << ": all " << g_checks << " checks passed");
        return 0;
    }
    LOG_ERR(suite << ": " << g_failures << " of " << g_checks << " checks FAILED");
    return 1;
}
} // namespace selftest

#define SELFTEST_CHECK(cond) do { \
    ++selftest::g_checks; \
    if (!(cond)) { \
        ++selftest::g_failures; \
        LOG_ERR("CHECK FAILED: " #cond " (" << __FILE__ << ":" << __LINE__ << ")"); \
    } \
} while(0)

#define RUN_SELFTEST(fn) do { \
    LOG_ALWAYS("TEST: " #fn); \
    fn(); \
} while(0)

// 60 Hz synthetic frames starting at the clock's epoch (same time the scheduler starts at)
struct FrameClock_S {
    time_point_T now{};
    clock_T::duration frame = std::chrono::duration_cast<clock_T::duration>(std::chrono::microseconds(16667));
};

struct SessionRig_S {
    explicit SessionRig_S(int numSpos, ControllerConfig_S cfg = ControllerConfig_S{},
                          EngineFactory_T engineFactory = nullptr, TrainingFactory_T trainingFactory = nullptr)
        : controller(make_directory(numSpos, cfg.groupTag), cfg, BciBehaviorType_Unset,
                     std::move(engineFactory), std::move(trainingFactory))
    {
        controller.initialize(&markers, &responses);
    }

    // one frame
    void step() {
        clock.now += clock.frame;
        controller.tick(clock.now);
    }

    // frames until at least `seconds` of synthetic time passed
    void run_for(float seconds) {
        const time_point_T until = clock.now + SecondsToDuration(seconds);
        while (clock.now < until) {
            step();
        }
    }

    LoggedSpo_C& spo(std::size_t i) { return *spos[i]; }

    std::vector<std::unique_ptr<LoggedSpo_C>> spos;
    SpoDirectory_C directory;
    BufferedMarkerChannel_C markers;
    QueuedResponseChannel_C responses;
    FrameClock_S clock;
    BciController_C controller; // last: torn down before the channels it points at

private:
    const SpoDirectory_C& make_directory(int numSpos, const std::string& tag) {
        for (int i = 0; i < numSpos; ++i) {
            spos.push_back(std::make_unique<LoggedSpo_C>("spo" + std::to_string(i)));
            directory.register_spo(tag, spos.back().get());
        }
        return directory;
    }
};
