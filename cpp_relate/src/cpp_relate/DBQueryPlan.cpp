#include "cpp_relate/src/cpp_relate/DBQueryPlan.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <boost/unordered_set.hpp>

#include "cpp_relate/src/cpp_relate/DBDatabase.hpp"
#include "cpp_relate/src/cpp_relate/DBErrors.hpp"
#include "cpp_relate/src/utils/StringUtils.hpp"

namespace cpp_relate
{

RecordSet joins(Database& db,
                const RecordSet& records,
                const std::string& associationName)
{
  RecordSet targets;
  for (const auto& record : records)
  {
    RecordSet associated = db.resolve(record, associationName);
    std::move(associated.begin(), associated.end(), std::back_inserter(targets));
  }
  return targets;
}

RecordSet merge(const RecordSet& records, const RecordSet& other)
{
  boost::unordered_set<std::pair<std::string, uint32_t>> identities;
  for (const auto& record : other)
  {
    identities.emplace(record.getKind(), record.getId());
  }

  RecordSet merged;
  std::copy_if(records.begin(),
               records.end(),
               std::back_inserter(merged),
               [&identities](const Record& record)
               {
                 return identities.count(
                          std::make_pair(record.getKind(), record.getId())) > 0;
               });
  return merged;
}

QueryPlan::QueryPlan(Database& db, const std::string& kind)
  : db_{&db}, baseKind_{kind}, kind_{kind}, operations_{}, state_{State::BUILT}
{
  if (!db.hasKind(kind))
  {
    throw UnknownKindError("Cannot query unknown kind " + kind);
  }
}

QueryPlan QueryPlan::scope(const std::string& name, ScopeArgs args) const
{
  requireBuilt();
  if (!db_->getScopes().contains(kind_, name))
  {
    throw UnknownScopeError("Unknown scope " + kind_ + "." + name);
  }

  std::vector<std::string> printedArgs;
  for (const auto& arg : args)
  {
    printedArgs.push_back(cpp_relate::toString(arg));
  }
  std::string description = "scope(" + name;
  if (!printedArgs.empty())
  {
    description += ", " + joinStrings(printedArgs, ", ");
  }
  description += ")";

  return chain({std::move(description),
                [kind = kind_, name, args = std::move(args)](
                  Database& db, const RecordSet& records)
                { return db.getScopes().apply(records, kind, name, args); }},
               kind_);
}

QueryPlan QueryPlan::where(const std::string& attribute,
                           AttributeValue value) const
{
  requireBuilt();
  requireAttribute(attribute);

  Condition condition{std::move(value)};
  std::string description =
    "where(" + attribute + " = " + cpp_relate::toString(condition) + ")";

  return chain({std::move(description),
                [attribute, condition](Database&, const RecordSet& records)
                { return cpp_relate::where(records, attribute, condition); }},
               kind_);
}

QueryPlan QueryPlan::where(const std::string& attribute, Range range) const
{
  requireBuilt();
  requireAttribute(attribute);

  Condition condition{std::move(range)};
  std::string description =
    "where(" + attribute + " in " + cpp_relate::toString(condition) + ")";

  return chain({std::move(description),
                [attribute, condition](Database&, const RecordSet& records)
                { return cpp_relate::where(records, attribute, condition); }},
               kind_);
}

QueryPlan QueryPlan::join(const std::string& associationName) const
{
  requireBuilt();
  const auto& definition = db_->getAssociations().find(kind_, associationName);

  return chain({"join(" + associationName + ")",
                [associationName](Database& db, const RecordSet& records)
                { return joins(db, records, associationName); }},
               definition.targetKind);
}

QueryPlan QueryPlan::merge(const QueryPlan& other) const
{
  requireBuilt();
  other.requireBuilt();

  if (other.kind_ != kind_)
  {
    throw ValidationError("Cannot merge a " + other.kind_ + " plan into a " +
                          kind_ + " plan");
  }

  return chain({"merge(" + other.toString() + ")",
                [other](Database&, const RecordSet& records)
                {
                  QueryPlan rhs = other;
                  return cpp_relate::merge(records, rhs.toSequence());
                }},
               kind_);
}

QueryPlan QueryPlan::merge(RecordSet records) const
{
  requireBuilt();

  std::string description =
    "merge(<" + std::to_string(records.size()) + " records>)";

  return chain({std::move(description),
                [others = std::move(records)](Database&, const RecordSet& current)
                { return cpp_relate::merge(current, others); }},
               kind_);
}

QueryPlan QueryPlan::order(const std::string& column,
                           OrderDirection direction) const
{
  requireBuilt();
  requireAttribute(column);

  return chain({"order(" + column + " " + cpp_relate::toString(direction) + ")",
                [column, direction](Database&, const RecordSet& records)
                { return cpp_relate::order(records, column, direction); }},
               kind_);
}

QueryPlan QueryPlan::limit(std::size_t n) const
{
  requireBuilt();

  return chain({"limit(" + std::to_string(n) + ")",
                [n](Database&, const RecordSet& records)
                { return cpp_relate::limit(records, n); }},
               kind_);
}

RecordSet QueryPlan::toSequence()
{
  return evaluate();
}

std::size_t QueryPlan::count()
{
  return evaluate().size();
}

double QueryPlan::average(const std::string& attribute)
{
  requireBuilt();
  requireAttribute(attribute);

  if (attribute != "id")
  {
    const auto* definition = db_->getKind(kind_).findAttribute(attribute);
    if (definition->type != AttributeType::INT &&
        definition->type != AttributeType::FLOAT)
    {
      throw ValidationError("Cannot average non-numeric attribute " + kind_ +
                            "." + attribute);
    }
  }

  double total = 0.0;
  std::size_t counted = 0;
  for (const auto& record : evaluate())
  {
    AttributeValue value = record.get(attribute);
    if (isNull(value))
    {
      continue;
    }
    total += toDouble(value);
    counted++;
  }

  return counted == 0 ? 0.0 : total / static_cast<double>(counted);
}

Record QueryPlan::first()
{
  RecordSet records = evaluate();
  if (records.empty())
  {
    throw EmptySetError("first() on an empty result: " + toString());
  }
  return std::move(records.front());
}

std::string QueryPlan::toString() const
{
  std::string result = baseKind_;
  for (const auto& operation : operations_)
  {
    result += "." + operation.description;
  }
  return result;
}

QueryPlan QueryPlan::chain(Operation operation, std::string resultKind) const
{
  QueryPlan next = *this;
  next.operations_.push_back(std::move(operation));
  next.kind_ = std::move(resultKind);
  return next;
}

void QueryPlan::requireBuilt() const
{
  if (state_ == State::MATERIALIZED)
  {
    throw MaterializedPlanError("Query plan " + toString() +
                                " was already materialized");
  }
}

void QueryPlan::requireAttribute(const std::string& attribute) const
{
  if (!db_->getKind(kind_).hasAttribute(attribute))
  {
    throw ValidationError("Unknown attribute '" + attribute + "' for " +
                          kind_);
  }
}

RecordSet QueryPlan::evaluate()
{
  requireBuilt();
  state_ = State::MATERIALIZED;

  auto pLogger = db_->getLogger();
  LOG_SAFE(pLogger, spdlog::level::debug, "Materializing {}", toString());

  RecordSet records = db_->all(baseKind_);
  for (const auto& operation : operations_)
  {
    records = operation.apply(*db_, records);
  }

  LOG_SAFE(pLogger,
           spdlog::level::debug,
           "{} yielded {} record(s)",
           toString(),
           records.size());

  return records;
}

}  // namespace cpp_relate
