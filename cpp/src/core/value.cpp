#include "typegraph/value.hpp"
#include "typegraph/error.hpp"
#include "typegraph/types.hpp"

#include <algorithm>
#include <sstream>

namespace typegraph {

std::string Id::to_string() const {
    std::ostringstream oss;
    oss << "(type: " << type_name << ", id: " << (guid.empty() ? "<unassigned>" : guid)
        << ", version: " << version;
    if (state) {
        oss << ", state: " << *state;
    }
    oss << ")";
    return oss.str();
}

// =============================================================================
// Value
// =============================================================================

Value::Value(List values) : storage_(std::make_shared<const List>(std::move(values))) {}

Value::Value(ListPtr values) : storage_(std::move(values)) {}

Value::Value(StructPtr instance) : storage_(std::move(instance)) {}

Value::Value(ReferenceablePtr instance) : storage_(std::move(instance)) {}

Value::Value(InstanceRef reference) : storage_(std::move(reference)) {}

namespace {

template<typename T>
const T& expect(const Value::Storage& storage, const char* wanted, const Value& self) {
    if (const T* held = std::get_if<T>(&storage)) {
        return *held;
    }
    throw ConversionError(std::string("Expected ") + wanted + " but value holds " + self.kind_name());
}

} // namespace

bool Value::as_bool() const { return expect<bool>(storage_, "bool", *this); }

std::int64_t Value::as_int() const { return expect<std::int64_t>(storage_, "int", *this); }

double Value::as_double() const { return expect<double>(storage_, "double", *this); }

const std::string& Value::as_string() const { return expect<std::string>(storage_, "string", *this); }

const EnumValue& Value::as_enum() const { return expect<EnumValue>(storage_, "enum", *this); }

const Value::List& Value::as_list() const {
    const ListPtr& list = expect<ListPtr>(storage_, "list", *this);
    static const List empty;
    return list ? *list : empty;
}

const Value::StructPtr& Value::as_struct() const {
    return expect<StructPtr>(storage_, "struct", *this);
}

Value::ReferenceablePtr Value::as_referenceable() const {
    if (const auto* ref = std::get_if<InstanceRef>(&storage_)) {
        ReferenceablePtr instance = ref->instance.lock();
        if (!instance) {
            throw ConversionError("Instance " + ref->guid + " is no longer held by its request context");
        }
        return instance;
    }
    return expect<ReferenceablePtr>(storage_, "referenceable", *this);
}

Value Value::to_reference() const {
    if (const auto* owned = std::get_if<ReferenceablePtr>(&storage_)) {
        if (!*owned) return Value();
        return Value(InstanceRef{*owned, (*owned)->id().guid});
    }
    if (const auto* list = std::get_if<ListPtr>(&storage_)) {
        if (!*list) return *this;
        List elements;
        elements.reserve((*list)->size());
        for (const auto& element : **list) {
            elements.push_back(element.to_reference());
        }
        return Value(std::move(elements));
    }
    return *this;
}

const char* Value::kind_name() const {
    switch (storage_.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        case 5: return "enum";
        case 6: return "list";
        case 7: return "struct";
        case 8: return "referenceable";
        case 9: return "reference";
        default: return "unknown";
    }
}

std::string Value::to_string() const {
    std::ostringstream oss;
    if (is_null()) {
        oss << "null";
    } else if (is_bool()) {
        oss << (as_bool() ? "true" : "false");
    } else if (is_int()) {
        oss << as_int();
    } else if (is_double()) {
        oss << as_double();
    } else if (is_string()) {
        oss << '"' << as_string() << '"';
    } else if (is_enum()) {
        oss << as_enum().name;
    } else if (is_list()) {
        oss << '[';
        bool first = true;
        for (const auto& element : as_list()) {
            if (!first) oss << ", ";
            oss << element.to_string();
            first = false;
        }
        oss << ']';
    } else if (is_struct()) {
        oss << (as_struct() ? as_struct()->to_string() : "null");
    } else if (is_reference()) {
        const auto& ref = std::get<InstanceRef>(storage_);
        auto instance = ref.instance.lock();
        oss << (instance ? instance->id().to_string() : "<released " + ref.guid + ">");
    } else if (is_referenceable()) {
        // Class instances print by identity only; reference cycles are legal.
        auto instance = std::get<ReferenceablePtr>(storage_);
        oss << (instance ? instance->id().to_string() : "null");
    }
    return oss.str();
}

// =============================================================================
// StructInstance
// =============================================================================

StructInstance::StructInstance(std::shared_ptr<const StructType> type) : type_(std::move(type)) {
    TYPEGRAPH_CHECK_POINTER(type_.get(), "type");
}

const std::string& StructInstance::type_name() const {
    return type_->name();
}

void StructInstance::check_declared(const std::string& attr_name) const {
    if (!type_->field_mapping().contains(attr_name)) {
        throw ConversionError("Unknown field " + attr_name + " for Struct type " + type_->name());
    }
}

void StructInstance::set(const std::string& attr_name, Value value) {
    check_declared(attr_name);
    if (value.is_null()) {
        values_.erase(attr_name);
        return;
    }
    // Fields never own class instances.
    values_[attr_name] = value.to_reference();
}

const Value& StructInstance::get(const std::string& attr_name) const {
    check_declared(attr_name);
    static const Value null_value;
    auto it = values_.find(attr_name);
    return it == values_.end() ? null_value : it->second;
}

bool StructInstance::is_set(const std::string& attr_name) const {
    return values_.count(attr_name) > 0;
}

std::string StructInstance::to_string() const {
    std::ostringstream oss;
    oss << "{" << std::endl;
    oss << "\tid : " << type_name() << std::endl;
    for (const auto& [name, value] : values_) {
        oss << "\t" << name << " : " << value.to_string() << std::endl;
    }
    oss << "}";
    return oss.str();
}

// =============================================================================
// ReferenceableInstance
// =============================================================================

ReferenceableInstance::ReferenceableInstance(std::shared_ptr<const ClassType> type, Id id,
                                             std::vector<std::string> trait_names)
    : StructInstance(std::move(type))
    , id_(std::move(id))
    , trait_names_(std::move(trait_names)) {}

void ReferenceableInstance::set_trait(const std::string& trait_name,
                                      std::shared_ptr<StructInstance> trait) {
    TYPEGRAPH_CHECK_POINTER(trait.get(), "trait");
    if (std::find(trait_names_.begin(), trait_names_.end(), trait_name) == trait_names_.end()) {
        throw ConversionError("Trait " + trait_name + " is not attached to " + id_.to_string());
    }
    traits_[trait_name] = std::move(trait);
}

std::shared_ptr<StructInstance> ReferenceableInstance::trait(const std::string& trait_name) const {
    auto it = traits_.find(trait_name);
    return it == traits_.end() ? nullptr : it->second;
}

std::string ReferenceableInstance::to_string() const {
    std::ostringstream oss;
    oss << id_.to_string() << " " << StructInstance::to_string();
    for (const auto& name : trait_names_) {
        oss << std::endl << "\ttrait " << name;
    }
    return oss.str();
}

} // namespace typegraph
