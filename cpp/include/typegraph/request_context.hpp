#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "typegraph/value.hpp"

namespace typegraph {

/**
 * Per-operation cache of class instances keyed by guid.
 *
 * Within one context a guid is materialized at most once, so references to
 * the same entity share one instance and reference cycles terminate.
 * The context owns every instance it caches; fields of cached instances
 * refer to each other through non-owning InstanceRefs.
 * Not thread-safe; one context belongs to one operation.
 */
class RequestContext {
public:
    RequestContext() = default;

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    // nullptr when the guid has not been materialized in this context.
    std::shared_ptr<ReferenceableInstance> get_instance(const std::string& guid) const;

    // First entry for a guid wins; later calls for the same guid are ignored.
    void cache(const std::shared_ptr<ReferenceableInstance>& instance);

    // Drops every instance cached after `mark` (a previous size()).
    void rollback(size_t mark);

    bool contains(const std::string& guid) const { return instances_.count(guid) > 0; }
    size_t size() const { return order_.size(); }
    void clear();

private:
    std::unordered_map<std::string, std::shared_ptr<ReferenceableInstance>> instances_;
    std::vector<std::string> order_;
};

} // namespace typegraph
