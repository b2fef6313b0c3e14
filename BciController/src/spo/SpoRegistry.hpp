/*
==============================================================================
	File: SpoRegistry.hpp
	Desc: Ordered set of selectable objects available during a stimulus run.
	* insertion order == pool index order, indices always 0..N-1
	* repopulating builds the new list aside and swaps it in, callers never
	  see a half-filled registry
	* get() out of range throws std::out_of_range; callers bounds-check first
==============================================================================
*/

#pragma once
#include <string>
#include <vector>
#include "ISpoProvider.h"
#include "SelectableItem.h"
#include "../utils/Types.h"

class SpoRegistry_C {
public:
	SpoRegistry_C(const ISpoProvider_S& provider, const ControllerConfig_S& config);

	bool populate(SpoPopulation_E method = SpoPopulation_Tag); // false if nothing was done
	bool populate(const std::string& methodName);
	void set_predefined(const std::vector<SelectableItem_I*>& items); // contents kept by SpoPopulation_Predefined

	std::size_t count() const { return spos_.size(); };
	bool empty() const { return spos_.empty(); };
	SelectableItem_I* get(std::size_t idx) const;
	const std::vector<SelectableItem_I*>& get_items() const { return spos_; };

private:
	const ISpoProvider_S& provider_;
	const ControllerConfig_S& config_;
	std::vector<SelectableItem_I*> spos_;

	void assign_pool_indices();
}; // SpoRegistry_C
