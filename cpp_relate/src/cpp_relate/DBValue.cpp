#include "cpp_relate/src/cpp_relate/DBValue.hpp"

#include <sstream>
#include <type_traits>

#include "cpp_relate/src/cpp_relate/DBErrors.hpp"

namespace cpp_relate
{

namespace
{

// Rank of each value category in the natural ordering. Integers and floats
// share a rank so that they compare numerically.
int categoryRank(const AttributeValue& value)
{
  if (isNull(value))
  {
    return 0;
  }
  if (std::holds_alternative<bool>(value))
  {
    return 1;
  }
  if (isNumeric(value))
  {
    return 2;
  }
  return 3;
}

template <typename V>
int threeWay(const V& lhs, const V& rhs)
{
  if (lhs < rhs)
    return -1;
  if (rhs < lhs)
    return 1;
  return 0;
}

}  // namespace

bool matchesType(const AttributeValue& value, AttributeType type)
{
  switch (type)
  {
    case AttributeType::INT:
      return std::holds_alternative<int64_t>(value);
    case AttributeType::FLOAT:
      return isNumeric(value);
    case AttributeType::BOOL:
      return std::holds_alternative<bool>(value);
    case AttributeType::TEXT:
      return std::holds_alternative<std::string>(value);
  }
  return false;
}

AttributeValue coerceToType(const AttributeValue& value, AttributeType type)
{
  if (isNull(value))
  {
    return value;
  }

  if (!matchesType(value, type))
  {
    throw ValidationError("Value " + toString(value) +
                          " cannot be stored as " + toString(type));
  }

  if (type == AttributeType::FLOAT && std::holds_alternative<int64_t>(value))
  {
    return static_cast<double>(std::get<int64_t>(value));
  }
  return value;
}

double toDouble(const AttributeValue& value)
{
  if (const auto* i = std::get_if<int64_t>(&value))
  {
    return static_cast<double>(*i);
  }
  if (const auto* d = std::get_if<double>(&value))
  {
    return *d;
  }
  throw ValidationError("Value " + toString(value) + " is not numeric");
}

int compareValues(const AttributeValue& lhs, const AttributeValue& rhs)
{
  const int lhsRank = categoryRank(lhs);
  const int rhsRank = categoryRank(rhs);

  if (lhsRank == 0 || rhsRank == 0)
  {
    return threeWay(lhsRank, rhsRank);
  }

  if (lhsRank != rhsRank)
  {
    throw ValidationError("Cannot compare " + toString(lhs) + " with " +
                          toString(rhs));
  }

  if (std::holds_alternative<int64_t>(lhs) &&
      std::holds_alternative<int64_t>(rhs))
  {
    return threeWay(std::get<int64_t>(lhs), std::get<int64_t>(rhs));
  }
  if (isNumeric(lhs))
  {
    return threeWay(toDouble(lhs), toDouble(rhs));
  }
  if (std::holds_alternative<bool>(lhs))
  {
    return threeWay(std::get<bool>(lhs), std::get<bool>(rhs));
  }
  const int cmp = std::get<std::string>(lhs).compare(std::get<std::string>(rhs));
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

std::string toString(const AttributeValue& value)
{
  std::ostringstream out;
  std::visit(
    [&out](const auto& v)
    {
      using V = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<V, std::monostate>)
      {
        out << "null";
      }
      else if constexpr (std::is_same_v<V, bool>)
      {
        out << (v ? "true" : "false");
      }
      else if constexpr (std::is_same_v<V, std::string>)
      {
        out << "'" << v << "'";
      }
      else
      {
        out << v;
      }
    },
    value);
  return out.str();
}

std::string toString(AttributeType type)
{
  switch (type)
  {
    case AttributeType::INT:
      return "INT";
    case AttributeType::FLOAT:
      return "FLOAT";
    case AttributeType::BOOL:
      return "BOOL";
    case AttributeType::TEXT:
      return "TEXT";
  }
  return "UNKNOWN";
}

}  // namespace cpp_relate
