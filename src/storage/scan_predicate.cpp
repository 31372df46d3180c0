#include "quarry/storage/scan_predicate.hpp"

#include <utility>

namespace quarry::storage {

namespace {

[[nodiscard]] std::optional<PrimaryKey> match_column_literal(const ScanExpression& column_side,
                                                             const ScanExpression& literal_side,
                                                             std::string_view primary_key_column)
{
    if (column_side.kind != ScanExpression::Kind::Column || literal_side.kind != ScanExpression::Kind::Literal) {
        return std::nullopt;
    }
    if (column_side.column.name != primary_key_column) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<std::int64_t>(&literal_side.literal)) {
        return *value;
    }
    return std::nullopt;
}

}  // namespace

ColumnReference ColumnReference::from_qualified_name(std::string_view qualified_name)
{
    ColumnReference reference{};
    const auto dot = qualified_name.rfind('.');
    if (dot == std::string_view::npos) {
        reference.name = std::string{qualified_name};
        return reference;
    }
    reference.relation = std::string{qualified_name.substr(0, dot)};
    reference.name = std::string{qualified_name.substr(dot + 1U)};
    return reference;
}

ScanExpression ScanExpression::column_ref(std::string_view qualified_name)
{
    ScanExpression expression{};
    expression.kind = Kind::Column;
    expression.column = ColumnReference::from_qualified_name(qualified_name);
    return expression;
}

ScanExpression ScanExpression::literal_value(ScalarValue value)
{
    ScanExpression expression{};
    expression.kind = Kind::Literal;
    expression.literal = std::move(value);
    return expression;
}

ScanExpression ScanExpression::binary(ScanExpression lhs, BinaryOperator op, ScanExpression rhs)
{
    ScanExpression expression{};
    expression.kind = Kind::Binary;
    expression.op = op;
    expression.left = std::make_shared<const ScanExpression>(std::move(lhs));
    expression.right = std::make_shared<const ScanExpression>(std::move(rhs));
    return expression;
}

std::optional<PrimaryKey> extract_primary_key_equality(const ScanExpression& expression,
                                                       std::string_view primary_key_column)
{
    if (expression.kind != ScanExpression::Kind::Binary || expression.op != BinaryOperator::Eq) {
        return std::nullopt;
    }
    if (!expression.left || !expression.right) {
        return std::nullopt;
    }
    if (auto key = match_column_literal(*expression.left, *expression.right, primary_key_column)) {
        return key;
    }
    return match_column_literal(*expression.right, *expression.left, primary_key_column);
}

}  // namespace quarry::storage
