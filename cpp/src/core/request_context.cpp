#include "typegraph/request_context.hpp"
#include "typegraph/error.hpp"

namespace typegraph {

std::shared_ptr<ReferenceableInstance> RequestContext::get_instance(const std::string& guid) const {
    auto it = instances_.find(guid);
    return it == instances_.end() ? nullptr : it->second;
}

void RequestContext::cache(const std::shared_ptr<ReferenceableInstance>& instance) {
    TYPEGRAPH_CHECK_POINTER(instance.get(), "instance");
    TYPEGRAPH_CHECK_ARGUMENT(instance->id().is_assigned(), "Cannot cache an instance without a guid");
    if (instances_.emplace(instance->id().guid, instance).second) {
        order_.push_back(instance->id().guid);
    }
}

void RequestContext::rollback(size_t mark) {
    while (order_.size() > mark) {
        instances_.erase(order_.back());
        order_.pop_back();
    }
}

void RequestContext::clear() {
    instances_.clear();
    order_.clear();
}

} // namespace typegraph
