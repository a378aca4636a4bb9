#include "cpp_relate/src/cpp_relate/DBScope.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>

#include "cpp_relate/src/cpp_relate/DBErrors.hpp"
#include "cpp_relate/src/utils/StringUtils.hpp"

namespace cpp_relate
{

bool Range::contains(const AttributeValue& value) const
{
  if (isNull(value))
  {
    return false;
  }
  if (lower && compareValues(value, *lower) < 0)
  {
    return false;
  }
  if (upper && compareValues(value, *upper) > 0)
  {
    return false;
  }
  return true;
}

std::string Range::toString() const
{
  return "[" + (lower ? cpp_relate::toString(*lower) : std::string{"-inf"}) +
         ", " + (upper ? cpp_relate::toString(*upper) : std::string{"+inf"}) +
         (upper ? "]" : ")");
}

bool matches(const Condition& condition, const AttributeValue& value)
{
  if (const auto* range = std::get_if<Range>(&condition))
  {
    return range->contains(value);
  }

  const auto& expected = std::get<AttributeValue>(condition);
  if (isNull(expected) || isNull(value))
  {
    return isNull(expected) && isNull(value);
  }
  return compareValues(value, expected) == 0;
}

std::string toString(const Condition& condition)
{
  if (const auto* range = std::get_if<Range>(&condition))
  {
    return range->toString();
  }
  return toString(std::get<AttributeValue>(condition));
}

std::string toString(OrderDirection direction)
{
  return direction == OrderDirection::ASCENDING ? "ASC" : "DESC";
}

RecordSet order(const RecordSet& records,
                const std::string& column,
                OrderDirection direction)
{
  // Read every sort key once, then sort positions
  std::vector<AttributeValue> keys;
  keys.reserve(records.size());
  for (const auto& record : records)
  {
    keys.push_back(record.get(column));
  }

  std::vector<std::size_t> positions(records.size());
  std::iota(positions.begin(), positions.end(), std::size_t{0});

  std::stable_sort(positions.begin(),
                   positions.end(),
                   [&keys, direction](std::size_t lhs, std::size_t rhs)
                   {
                     return direction == OrderDirection::ASCENDING
                              ? compareValues(keys[lhs], keys[rhs]) < 0
                              : compareValues(keys[rhs], keys[lhs]) < 0;
                   });

  RecordSet sorted;
  sorted.reserve(records.size());
  for (auto position : positions)
  {
    sorted.push_back(records[position]);
  }
  return sorted;
}

RecordSet where(const RecordSet& records,
                const std::string& attribute,
                const Condition& condition)
{
  RecordSet filtered;
  std::copy_if(records.begin(),
               records.end(),
               std::back_inserter(filtered),
               [&](const Record& record)
               { return matches(condition, record.get(attribute)); });
  return filtered;
}

RecordSet limit(const RecordSet& records, std::size_t n)
{
  if (n >= records.size())
  {
    return records;
  }
  return RecordSet(records.begin(),
                   records.begin() + static_cast<std::ptrdiff_t>(n));
}

ScopeRegistry::ScopeRegistry(std::shared_ptr<spdlog::logger> pLogger)
  : scopes_{}, pLogger_{std::move(pLogger)}
{
}

void ScopeRegistry::define(const std::string& kind,
                           const std::string& name,
                           ScopeFunction function)
{
  if (!isIdentifier(name))
  {
    throw ValidationError("Invalid scope name '" + name + "'");
  }
  if (!function)
  {
    throw ValidationError("Scope " + kind + "." + name + " has no function");
  }

  auto key = std::make_pair(kind, name);
  if (scopes_.find(key) != scopes_.end())
  {
    throw DuplicateScopeError("Scope " + kind + "." + name +
                              " is already defined");
  }

  scopes_.emplace(std::move(key), std::move(function));

  LOG_SAFE(pLogger_, spdlog::level::debug, "Defined scope {}.{}", kind, name);
}

bool ScopeRegistry::contains(const std::string& kind,
                             const std::string& name) const
{
  return scopes_.find(std::make_pair(kind, name)) != scopes_.end();
}

RecordSet ScopeRegistry::apply(const RecordSet& records,
                               const std::string& kind,
                               const std::string& name,
                               const ScopeArgs& args) const
{
  auto it = scopes_.find(std::make_pair(kind, name));
  if (it == scopes_.end())
  {
    throw UnknownScopeError("Unknown scope " + kind + "." + name);
  }

  LOG_SAFE(pLogger_,
           spdlog::level::trace,
           "Applying scope {}.{} to {} record(s)",
           kind,
           name,
           records.size());

  return it->second(records, args);
}

}  // namespace cpp_relate
