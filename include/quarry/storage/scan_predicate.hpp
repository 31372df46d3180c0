#pragma once

#include "quarry/storage/table_schema.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace quarry::storage {

enum class BinaryOperator : std::uint8_t {
    Eq = 0,
    NotEq,
    Lt,
    LtEq,
    Gt,
    GtEq,
    And,
    Or,
    Plus,
    Minus
};

struct ColumnReference final {
    std::string relation{};
    std::string name{};

    // "t.a" -> {relation "t", name "a"}; an unqualified name has no relation.
    static ColumnReference from_qualified_name(std::string_view qualified_name);

    friend bool operator==(const ColumnReference&, const ColumnReference&) = default;
};

// Null, integer, floating point or string literal.
using ScalarValue = std::variant<std::monostate, std::int64_t, double, std::string>;

// Predicate tree handed down by the query engine. Children are shared and
// immutable so expressions copy cheaply.
struct ScanExpression final {
    enum class Kind : std::uint8_t {
        Column = 0,
        Literal,
        Binary
    };

    Kind kind = Kind::Literal;
    ColumnReference column{};
    ScalarValue literal{};
    BinaryOperator op = BinaryOperator::Eq;
    std::shared_ptr<const ScanExpression> left{};
    std::shared_ptr<const ScanExpression> right{};

    static ScanExpression column_ref(std::string_view qualified_name);
    static ScanExpression literal_value(ScalarValue value);
    static ScanExpression binary(ScanExpression lhs, BinaryOperator op, ScanExpression rhs);
};

// Key of a `column == literal` or `literal == column` predicate over the
// primary-key column with an integer literal; nullopt for any other shape.
[[nodiscard]] std::optional<PrimaryKey> extract_primary_key_equality(const ScanExpression& expression,
                                                                     std::string_view primary_key_column);

}  // namespace quarry::storage
