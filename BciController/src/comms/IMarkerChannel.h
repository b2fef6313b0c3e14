/*
==============================================================================
	File: IMarkerChannel.h
	Desc: Write-only event marker outlet (fire-and-forget, no ack).
	Markers the controller writes:
	  "Trial Started", "Trial Ends", "marker" / "marker,<idx>", "Training Complete"
==============================================================================
*/

#pragma once
#include <string>

struct IMarkerChannel_S {
	virtual void write(const std::string& marker) = 0;
	virtual ~IMarkerChannel_S() = default;
}; // IMarkerChannel_S
