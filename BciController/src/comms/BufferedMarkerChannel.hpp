/*
==============================================================================
	File: BufferedMarkerChannel.hpp
	Desc: IMarkerChannel_S that timestamps each marker, logs it and keeps
	the most recent ones in memory. The frame loop writes, the HTTP thread
	reads (GET /markers), so history access is mutex guarded.
==============================================================================
*/

#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "IMarkerChannel.h"

class BufferedMarkerChannel_C : public IMarkerChannel_S {
public:
	struct markerRecord_S {
		std::uint64_t seq = 0;    // monotonic, first marker is 1
		std::uint64_t t_ms = 0;   // ms since program start
		std::string text;
	};

	explicit BufferedMarkerChannel_C(std::size_t capacity = 256);

	void write(const std::string& marker) override;

	std::vector<markerRecord_S> snapshot() const;     // oldest first
	std::vector<std::string> get_texts() const;       // oldest first
	std::size_t count_of(const std::string& text) const;
	std::uint64_t get_total_written() const;
	void clear();

private:
	std::size_t capacity_;
	mutable std::mutex mtx_;
	std::deque<markerRecord_S> history_;
	std::uint64_t seq_ = 0;
}; // BufferedMarkerChannel_C
