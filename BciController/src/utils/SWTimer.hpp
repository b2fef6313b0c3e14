/*
==============================================================================
	File: SWTimer.hpp
	Desc: Software one-shot timer read against the frame clock.
	* "now" is always passed in by the caller (the scheduler's tick time),
	  so cooperative loops never look at the wall clock themselves.
==============================================================================
*/
#pragma once
#include <chrono>

class SW_Timer_C {

public:
	using clock_t = std::chrono::steady_clock;
	using dur_t = clock_t::duration;
	using timepoint_t = clock_t::time_point;

	void start_timer(timepoint_t now, dur_t timer_dur) {
		// timeout should occur in timer_dur time from now
		timer_start_time = now;
		until = timer_start_time + timer_dur;
		timer_started = true;
	}

	// stop & return elapsed time
	dur_t stop_timer(timepoint_t now) {
		auto ended_at = get_timer_value(now);
		timer_started = false;
		return ended_at;
	}

	// elapsed since start (0 if not started)
	dur_t get_timer_value(timepoint_t now) const {
		if (timer_started == false) {
			return dur_t{ 0 };
		}
		return now - timer_start_time;
	}

	bool check_timer_expired(timepoint_t now) const {
		return timer_started && now >= until;
	}

	bool is_started() const { return timer_started; }

private:
	bool timer_started = false;
	timepoint_t until{};
	timepoint_t timer_start_time{};

};
