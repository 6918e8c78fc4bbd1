#pragma once

#include <string>
#include <vector>

namespace typegraph {

/**
 * Text of a traversal-language expression as assembled by the query
 * compiler. This layer only wraps or prefixes expressions it is handed.
 */
class TraversalExpression {
public:
    TraversalExpression() = default;
    explicit TraversalExpression(std::string text) : text_(std::move(text)) {}

    static TraversalExpression literal(const std::string& value);

    // `<this>.<function>(<args>)`, or `<function>(<args>)` when this is empty.
    TraversalExpression call(const std::string& function,
                             const std::vector<TraversalExpression>& args = {}) const;

    const std::string& text() const { return text_; }
    bool empty() const { return text_.empty(); }

    bool operator==(const TraversalExpression& other) const { return text_ == other.text_; }
    bool operator!=(const TraversalExpression& other) const { return text_ != other.text_; }

private:
    std::string text_;
};

} // namespace typegraph
