#include "cpp_relate/src/cpp_relate/DBAssociation.hpp"

#include <limits>

#include "cpp_relate/src/cpp_relate/DBDatabase.hpp"
#include "cpp_relate/src/cpp_relate/DBErrors.hpp"
#include "cpp_relate/src/utils/StringUtils.hpp"

namespace cpp_relate
{

namespace
{

// Read a foreign key. Null and 0 both mean "unset".
std::optional<int64_t> readForeignKey(const Record& record,
                                      const std::string& key)
{
  AttributeValue value = record.get(key);
  if (isNull(value))
  {
    return std::nullopt;
  }

  const auto* id = std::get_if<int64_t>(&value);
  if (id == nullptr)
  {
    throw ValidationError("Foreign key '" + key + "' of " + record.getKind() +
                          " is not an integer");
  }
  if (*id <= 0)
  {
    return std::nullopt;
  }
  return *id;
}

// Look up the target of a foreign key. Keys outside the id range can never
// match a stored record.
std::optional<Record> findTarget(Database& db,
                                 const std::string& kind,
                                 int64_t id)
{
  if (id > static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
  {
    return std::nullopt;
  }
  return db.find(kind, static_cast<uint32_t>(id));
}

// Writes must only reference records that are in the store
void requireStored(Database& db, const Record& record)
{
  if (!db.find(record.getKind(), record.getId()))
  {
    throw NotFoundError("No " + record.getKind() + " with id " +
                        std::to_string(record.getId()));
  }
}

std::string describe(const std::string& sourceKind, const std::string& name)
{
  return sourceKind + "." + name;
}

}  // namespace

AssociationDefinition AssociationDefinition::oneToOne(std::string targetKind,
                                                      std::string foreignKey)
{
  AssociationDefinition definition;
  definition.type = AssociationType::ONE_TO_ONE;
  definition.targetKind = std::move(targetKind);
  definition.foreignKey = std::move(foreignKey);
  return definition;
}

AssociationDefinition AssociationDefinition::oneToMany(std::string targetKind,
                                                       std::string foreignKey)
{
  AssociationDefinition definition;
  definition.type = AssociationType::ONE_TO_MANY;
  definition.targetKind = std::move(targetKind);
  definition.foreignKey = std::move(foreignKey);
  return definition;
}

AssociationDefinition AssociationDefinition::manyToManyThrough(
  std::string throughKind,
  std::string targetKind,
  std::string sourceKey,
  std::string targetKey)
{
  AssociationDefinition definition;
  definition.type = AssociationType::MANY_TO_MANY_THROUGH;
  definition.throughKind = std::move(throughKind);
  definition.targetKind = std::move(targetKind);
  definition.sourceKey = std::move(sourceKey);
  definition.targetKey = std::move(targetKey);
  return definition;
}

std::string AssociationDefinition::owningKind(
  const std::string& sourceKind) const
{
  switch (type)
  {
    case AssociationType::ONE_TO_ONE:
      return sourceKind;
    case AssociationType::ONE_TO_MANY:
      return targetKind;
    case AssociationType::MANY_TO_MANY_THROUGH:
      return throughKind;
  }
  return sourceKind;
}

AssociationRegistry::AssociationRegistry(std::shared_ptr<spdlog::logger> pLogger)
  : definitions_{}, pLogger_{std::move(pLogger)}
{
}

void AssociationRegistry::define(Database& db,
                                 const std::string& sourceKind,
                                 const std::string& name,
                                 AssociationDefinition definition)
{
  if (!db.hasKind(sourceKind))
  {
    throw UnknownKindError("Cannot define association " +
                           describe(sourceKind, name) + " on unknown kind " +
                           sourceKind);
  }
  if (!isIdentifier(name))
  {
    throw ValidationError("Invalid association name '" + name + "'");
  }
  if (!isIdentifier(definition.targetKind))
  {
    throw ValidationError("Invalid target kind '" + definition.targetKind +
                          "' for " + describe(sourceKind, name));
  }

  auto key = std::make_pair(sourceKind, name);
  if (definitions_.find(key) != definitions_.end())
  {
    throw DuplicateAssociationError("Association " +
                                    describe(sourceKind, name) +
                                    " is already defined");
  }

  const std::string owner = definition.owningKind(sourceKind);
  if (definition.type == AssociationType::MANY_TO_MANY_THROUGH)
  {
    if (!isIdentifier(owner))
    {
      throw ValidationError("Invalid join kind '" + owner + "' for " +
                            describe(sourceKind, name));
    }
    checkForeignKey(db, owner, definition.sourceKey);
    checkForeignKey(db, owner, definition.targetKey);
  }
  else
  {
    checkForeignKey(db, owner, definition.foreignKey);
  }

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Defined {} association {} -> {}",
           toString(definition.type),
           describe(sourceKind, name),
           definition.targetKind);

  definitions_.emplace(std::move(key), std::move(definition));
}

bool AssociationRegistry::contains(const std::string& sourceKind,
                                   const std::string& name) const
{
  return definitions_.find(std::make_pair(sourceKind, name)) !=
         definitions_.end();
}

const AssociationDefinition& AssociationRegistry::find(
  const std::string& sourceKind,
  const std::string& name) const
{
  auto it = definitions_.find(std::make_pair(sourceKind, name));
  if (it == definitions_.end())
  {
    throw UnknownAssociationError("Unknown association " +
                                  describe(sourceKind, name));
  }
  return it->second;
}

RecordSet AssociationRegistry::resolve(Database& db,
                                       const Record& record,
                                       const std::string& name) const
{
  const auto& definition = find(record.getKind(), name);

  switch (definition.type)
  {
    case AssociationType::ONE_TO_ONE:
    {
      checkForeignKey(db, record.getKind(), definition.foreignKey);
      auto targetId = readForeignKey(record, definition.foreignKey);
      if (!targetId)
      {
        return {};
      }

      auto target = findTarget(db, definition.targetKind, *targetId);
      if (!target)
      {
        LOG_SAFE(pLogger_,
                 spdlog::level::warn,
                 "{} of {} references missing {}#{}",
                 describe(record.getKind(), name),
                 record.toString(),
                 definition.targetKind,
                 *targetId);
        return {};
      }
      return {std::move(*target)};
    }
    case AssociationType::ONE_TO_MANY:
      return db.selectWhere(definition.targetKind,
                            definition.foreignKey,
                            static_cast<int64_t>(record.getId()));
    case AssociationType::MANY_TO_MANY_THROUGH:
    {
      RecordSet targets;
      RecordSet joins = db.selectWhere(definition.throughKind,
                                       definition.sourceKey,
                                       static_cast<int64_t>(record.getId()));
      for (const auto& join : joins)
      {
        auto targetId = readForeignKey(join, definition.targetKey);
        if (!targetId)
        {
          continue;
        }

        auto target = findTarget(db, definition.targetKind, *targetId);
        if (!target)
        {
          LOG_SAFE(pLogger_,
                   spdlog::level::warn,
                   "Join record {} references missing {}#{}",
                   join.toString(),
                   definition.targetKind,
                   *targetId);
          continue;
        }
        targets.push_back(std::move(*target));
      }
      return targets;
    }
  }
  return {};
}

std::optional<Record> AssociationRegistry::resolveOne(
  Database& db,
  const Record& record,
  const std::string& name) const
{
  const auto& definition = find(record.getKind(), name);
  if (definition.type != AssociationType::ONE_TO_ONE)
  {
    throw ValidationError(describe(record.getKind(), name) +
                          " is not a one-to-one association");
  }

  checkForeignKey(db, record.getKind(), definition.foreignKey);
  auto targetId = readForeignKey(record, definition.foreignKey);
  if (!targetId)
  {
    return std::nullopt;
  }

  auto target = findTarget(db, definition.targetKind, *targetId);
  if (!target)
  {
    throw NotFoundError(describe(record.getKind(), name) + " of " +
                        record.toString() + " references missing " +
                        definition.targetKind + "#" + std::to_string(*targetId));
  }
  return target;
}

void AssociationRegistry::assign(Database& db,
                                 Record& record,
                                 const std::string& name,
                                 const std::optional<Record>& target) const
{
  const auto& definition = find(record.getKind(), name);
  if (definition.type != AssociationType::ONE_TO_ONE)
  {
    throw ValidationError(describe(record.getKind(), name) +
                          " is not a one-to-one association");
  }

  AttributeValue key{};
  if (target)
  {
    checkTarget(definition, *target, name);
    requireStored(db, *target);
    key = static_cast<int64_t>(target->getId());
  }

  db.update(record, definition.foreignKey, key);
}

void AssociationRegistry::append(Database& db,
                                 const Record& record,
                                 const std::string& name,
                                 const RecordSet& items) const
{
  const auto& definition = find(record.getKind(), name);

  if (definition.type == AssociationType::ONE_TO_ONE)
  {
    throw ValidationError("Cannot append to one-to-one association " +
                          describe(record.getKind(), name));
  }

  // Check every item before writing anything
  requireStored(db, record);
  for (const auto& item : items)
  {
    checkTarget(definition, item, name);
    requireStored(db, item);
  }

  const auto sourceId = static_cast<int64_t>(record.getId());

  switch (definition.type)
  {
    case AssociationType::ONE_TO_ONE:
      break;
    case AssociationType::ONE_TO_MANY:
      for (const auto& item : items)
      {
        Record target = item;
        db.update(target, definition.foreignKey, sourceId);
      }
      break;
    case AssociationType::MANY_TO_MANY_THROUGH:
      for (const auto& item : items)
      {
        db.insert(definition.throughKind,
                  {{definition.sourceKey, sourceId},
                   {definition.targetKey, static_cast<int64_t>(item.getId())}});
      }
      break;
  }

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Appended {} record(s) to {}#{}.{}",
           items.size(),
           record.getKind(),
           record.getId(),
           name);
}

void AssociationRegistry::checkForeignKey(Database& db,
                                          const std::string& kind,
                                          const std::string& key) const
{
  if (!db.hasKind(kind))
  {
    // Checked again when the association is resolved
    return;
  }

  const auto* attribute = db.getKind(kind).findAttribute(key);
  if (attribute == nullptr)
  {
    throw ValidationError("Foreign key '" + key + "' is not an attribute of " +
                          kind);
  }
  if (attribute->type != AttributeType::INT)
  {
    throw ValidationError("Foreign key '" + key + "' of " + kind +
                          " must be an INT attribute");
  }
}

void AssociationRegistry::checkTarget(const AssociationDefinition& definition,
                                      const Record& target,
                                      const std::string& name) const
{
  if (target.getKind() != definition.targetKind)
  {
    throw ValidationError("Association '" + name + "' expects " +
                          definition.targetKind + " records, got " +
                          target.getKind());
  }
}

std::string toString(AssociationType type)
{
  switch (type)
  {
    case AssociationType::ONE_TO_ONE:
      return "one-to-one";
    case AssociationType::ONE_TO_MANY:
      return "one-to-many";
    case AssociationType::MANY_TO_MANY_THROUGH:
      return "many-to-many-through";
  }
  return "unknown";
}

}  // namespace cpp_relate
