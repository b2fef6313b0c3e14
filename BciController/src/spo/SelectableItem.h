/*
==============================================================================
	File: SelectableItem.h
	Desc: Capability interface for a selectable presentation object (SPO).
	Rendering/effects live in the implementation; the controller only calls
	these hooks. Items are owned externally, the registry keeps non-owning
	pointers and (re)assigns the pool index every time it repopulates.
==============================================================================
*/

#pragma once
#include <string>

class SelectableItem_I {
public:
	virtual ~SelectableItem_I() = default;

	virtual void select() = 0;
	virtual void on_train_target() = 0;  // highlight as current training target
	virtual void off_train_target() = 0;

	virtual bool is_selectable() const = 0;
	// false once the underlying object is gone but still referenced somewhere
	virtual bool is_valid() const { return true; }
	virtual std::string get_name() const = 0;

	int get_pool_index() const { return poolIndex_; }
	void set_pool_index(int idx) { poolIndex_ = idx; }

protected:
	int poolIndex_ = -1; // -1 until a registry populates with this item
}; // SelectableItem_I
