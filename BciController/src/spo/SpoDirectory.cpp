#include "SpoDirectory.hpp"
#include <algorithm>
#include "../utils/Logger.hpp"

void SpoDirectory_C::register_spo(const std::string& tag, SelectableItem_I* item){
    if (item == nullptr) {
        LOG_WARN("spodir: ignoring null object for tag '" << tag << "'");
        return;
    }
    entries_.emplace_back(tag, item);
}

bool SpoDirectory_C::unregister_spo(const SelectableItem_I* item){
    auto it = std::remove_if(entries_.begin(), entries_.end(),
        [item](const std::pair<std::string, SelectableItem_I*>& e){ return e.second == item; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it, entries_.end());
    return true;
}

std::vector<SelectableItem_I*> SpoDirectory_C::list_tagged_spos(const std::string& tag) const {
    std::vector<SelectableItem_I*> out;
    for (const auto& e : entries_) {
        if (e.first == tag) {
            out.push_back(e.second);
        }
    }
    return out;
}
