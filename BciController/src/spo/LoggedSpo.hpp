/*
==============================================================================
	File: LoggedSpo.hpp
	Desc: SelectableItem_I with no visuals. Logs every hook and counts calls,
	so a headless session (and the self-tests) can see what the controller
	asked for.
==============================================================================
*/

#pragma once
#include <string>
#include "SelectableItem.h"

class LoggedSpo_C : public SelectableItem_I {
public:
	explicit LoggedSpo_C(std::string name, bool selectable = true);

	void select() override;
	void on_train_target() override;
	void off_train_target() override;

	bool is_selectable() const override { return selectable_; };
	bool is_valid() const override { return valid_; };
	std::string get_name() const override { return name_; };

	void set_selectable(bool selectable) { selectable_ = selectable; };
	void set_valid(bool valid) { valid_ = valid; }; // false simulates a destroyed object

	int get_select_count() const { return selectCount_; };
	int get_train_on_count() const { return trainOnCount_; };
	int get_train_off_count() const { return trainOffCount_; };
	bool is_train_target() const { return isTrainTarget_; };

private:
	std::string name_;
	bool selectable_ = true;
	bool valid_ = true;
	bool isTrainTarget_ = false;
	int selectCount_ = 0;
	int trainOnCount_ = 0;
	int trainOffCount_ = 0;
}; // LoggedSpo_C
