#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace typegraph {

class StructType;
class ClassType;
class StructInstance;
class ReferenceableInstance;

struct EnumValue {
    std::string name;
    int ordinal = 0;

    bool operator==(const EnumValue& other) const {
        return name == other.name && ordinal == other.ordinal;
    }
    bool operator!=(const EnumValue& other) const { return !(*this == other); }
};

// Identity of a class instance as persisted on its vertex.
struct Id {
    std::string guid;
    std::string type_name;
    int version = 0;
    std::optional<std::string> state;

    bool is_assigned() const { return !guid.empty(); }
    std::string to_string() const;
};

// Non-owning reference to a class instance held by a RequestContext.
struct InstanceRef {
    std::weak_ptr<ReferenceableInstance> instance;
    std::string guid;
};

/**
 * A materialized, typed value. Null means "absent".
 *
 * Lists are immutable once built. Struct and class instances are held by
 * shared_ptr so that two references to the same persisted entity compare
 * identical by pointer.
 *
 * A class instance stored as a field of another instance is kept as an
 * InstanceRef. The RequestContext that materialized it owns it, so cyclic
 * object graphs are released together with the context. Such a field is
 * only readable while its context is alive.
 */
class Value {
public:
    using List = std::vector<Value>;
    using ListPtr = std::shared_ptr<const List>;
    using StructPtr = std::shared_ptr<StructInstance>;
    using ReferenceablePtr = std::shared_ptr<ReferenceableInstance>;
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                                 EnumValue, ListPtr, StructPtr, ReferenceablePtr, InstanceRef>;

    Value() = default;
    Value(bool v) : storage_(v) {}
    Value(int v) : storage_(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : storage_(v) {}
    Value(double v) : storage_(v) {}
    Value(const char* v) : storage_(std::string(v)) {}
    Value(std::string v) : storage_(std::move(v)) {}
    Value(EnumValue v) : storage_(std::move(v)) {}
    Value(List values);
    Value(ListPtr values);
    Value(StructPtr instance);
    Value(ReferenceablePtr instance);
    Value(InstanceRef reference);

    bool is_null() const { return std::holds_alternative<std::monostate>(storage_); }
    bool is_bool() const { return std::holds_alternative<bool>(storage_); }
    bool is_int() const { return std::holds_alternative<std::int64_t>(storage_); }
    bool is_double() const { return std::holds_alternative<double>(storage_); }
    bool is_string() const { return std::holds_alternative<std::string>(storage_); }
    bool is_enum() const { return std::holds_alternative<EnumValue>(storage_); }
    bool is_list() const { return std::holds_alternative<ListPtr>(storage_); }
    bool is_struct() const { return std::holds_alternative<StructPtr>(storage_); }
    bool is_referenceable() const {
        return std::holds_alternative<ReferenceablePtr>(storage_) || is_reference();
    }
    bool is_reference() const { return std::holds_alternative<InstanceRef>(storage_); }

    // Accessors throw ConversionError when the value holds another alternative.
    bool as_bool() const;
    std::int64_t as_int() const;
    double as_double() const;
    const std::string& as_string() const;
    const EnumValue& as_enum() const;
    const List& as_list() const;
    const StructPtr& as_struct() const;
    // Also throws ConversionError when a reference outlived its context.
    ReferenceablePtr as_referenceable() const;

    // Copy in which owned class instances, also inside lists, become InstanceRefs.
    Value to_reference() const;

    const Storage& storage() const { return storage_; }

    // Short name of the held alternative, used in error messages.
    const char* kind_name() const;
    std::string to_string() const;

private:
    Storage storage_;
};

/**
 * Field values of a struct or trait, keyed by attribute name.
 * Only attributes declared by the type's field mapping may be set.
 */
class StructInstance {
public:
    explicit StructInstance(std::shared_ptr<const StructType> type);
    virtual ~StructInstance() = default;

    StructInstance(const StructInstance&) = delete;
    StructInstance& operator=(const StructInstance&) = delete;

    const std::string& type_name() const;
    const StructType& type() const { return *type_; }

    void set(const std::string& attr_name, Value value);
    const Value& get(const std::string& attr_name) const;
    bool is_set(const std::string& attr_name) const;

    const std::map<std::string, Value>& values() const { return values_; }

    virtual std::string to_string() const;

private:
    void check_declared(const std::string& attr_name) const;

    std::shared_ptr<const StructType> type_;
    std::map<std::string, Value> values_;
};

// A class instance: fields plus identity and attached traits.
class ReferenceableInstance : public StructInstance {
public:
    ReferenceableInstance(std::shared_ptr<const ClassType> type, Id id,
                          std::vector<std::string> trait_names);

    const Id& id() const { return id_; }
    const std::vector<std::string>& trait_names() const { return trait_names_; }

    void set_trait(const std::string& trait_name, std::shared_ptr<StructInstance> trait);
    std::shared_ptr<StructInstance> trait(const std::string& trait_name) const;

    std::string to_string() const override;

private:
    Id id_;
    std::vector<std::string> trait_names_;
    std::map<std::string, std::shared_ptr<StructInstance>> traits_;
};

} // namespace typegraph
