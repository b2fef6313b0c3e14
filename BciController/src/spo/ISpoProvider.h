/*
==============================================================================
	File: ISpoProvider.h
	Desc: Abstract interface for whatever owns the scene objects. The
	registry asks it for every object registered under a group tag, in
	discovery order; filtering on the selectable flag happens in the registry.
==============================================================================
*/

#pragma once
#include <string>
#include <vector>
#include "SelectableItem.h"

struct ISpoProvider_S {
	virtual std::vector<SelectableItem_I*> list_tagged_spos(const std::string& tag) const = 0;
	virtual ~ISpoProvider_S() = default;
}; // ISpoProvider_S
