/*
==============================================================================
	File: SpoDirectory.hpp
	Desc: In-memory ISpoProvider_S. Objects are registered under a tag and
	listed back in registration order. Stands in for the scene graph when the
	controller runs headless (bridge app, self-tests).
	NOTE: not thread safe, use from the scheduler thread only.
==============================================================================
*/

#pragma once
#include <string>
#include <utility>
#include <vector>
#include "ISpoProvider.h"

class SpoDirectory_C : public ISpoProvider_S {
public:
	void register_spo(const std::string& tag, SelectableItem_I* item);
	bool unregister_spo(const SelectableItem_I* item); // false if it wasn't registered
	void clear() { entries_.clear(); };
	std::size_t size() const { return entries_.size(); };

	std::vector<SelectableItem_I*> list_tagged_spos(const std::string& tag) const override;

private:
	std::vector<std::pair<std::string, SelectableItem_I*>> entries_; // (tag, item)
}; // SpoDirectory_C
