#include "SpoRegistry.hpp"
#include <stdexcept>
#include <string>
#include "../utils/Logger.hpp"

SpoRegistry_C::SpoRegistry_C(const ISpoProvider_S& provider, const ControllerConfig_S& config) : provider_(provider), config_(config) {
}

bool SpoRegistry_C::populate(SpoPopulation_E method){
    switch (method) {
        case SpoPopulation_Predefined:
            // use current contents
            return true;

        case SpoPopulation_Children:
            LOG_WARN("registry: populating by children is not yet implemented");
            return false;

        case SpoPopulation_Tag:
        default: {
            std::vector<SelectableItem_I*> found;
            for (SelectableItem_I* spo : provider_.list_tagged_spos(config_.groupTag)) {
                if (spo == nullptr || !spo->is_valid() || !spo->is_selectable()) {
                    continue;
                }
                found.push_back(spo);
            }
            spos_.swap(found);
            assign_pool_indices();
            LOG_DBG("registry: tag '" << config_.groupTag << "' -> " << spos_.size() << " selectable spos");
            return true;
        }
    }
}

bool SpoRegistry_C::populate(const std::string& methodName){
    std::optional<SpoPopulation_E> method = SpoPopulationFromString(methodName);
    if (!method.has_value()) {
        LOG_ERR("registry: unable to convert '" << methodName << "' to a valid population method");
        return false;
    }
    return populate(method.value());
}

void SpoRegistry_C::set_predefined(const std::vector<SelectableItem_I*>& items){
    std::vector<SelectableItem_I*> kept;
    for (SelectableItem_I* spo : items) {
        if (spo != nullptr) kept.push_back(spo);
    }
    spos_.swap(kept);
    assign_pool_indices();
}

SelectableItem_I* SpoRegistry_C::get(std::size_t idx) const {
    if (idx >= spos_.size()) {
        throw std::out_of_range("registry: index out of range (" + std::to_string(idx)
                                + " >= " + std::to_string(spos_.size()) + ")");
    }
    return spos_[idx];
}

void SpoRegistry_C::assign_pool_indices(){
    for (std::size_t i = 0; i < spos_.size(); ++i) {
        spos_[i]->set_pool_index(static_cast<int>(i));
    }
}
