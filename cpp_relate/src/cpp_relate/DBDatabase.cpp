#include "cpp_relate/src/cpp_relate/DBDatabase.hpp"

#include <utility>

namespace cpp_relate
{

Database::Database(const std::string& url,
                   std::shared_ptr<spdlog::logger> pLogger)
  : db_(nullptr, sqlite3_close),
    pLogger_{pLogger},
    daos_{},
    associations_{pLogger},
    scopes_{pLogger}
{
  LOG_SAFE(pLogger_, spdlog::level::debug, "Creating database with url: {}", url);

  sqlite3* raw_db = nullptr;

  int result = sqlite3_open_v2(url.c_str(),
                               &raw_db,
                               SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                               nullptr);

  if (result != SQLITE_OK)
  {
    std::string error_msg = "Failed to open database: ";
    if (raw_db)
    {
      error_msg += sqlite3_errmsg(raw_db);
      sqlite3_close(raw_db);
    }
    else
    {
      error_msg += "Unknown error";
    }
    LOG_SAFE(pLogger_, spdlog::level::err, error_msg);
    throw StorageError(error_msg);
  }

  // Transfer ownership to unique_ptr
  db_.reset(raw_db);
}

void Database::defineKind(EntityKind kind)
{
  kind.validate();

  if (hasKind(kind.name))
  {
    throw DuplicateKindError("Entity kind " + kind.name +
                             " is already defined");
  }

  std::string name = kind.name;
  auto dao = std::make_unique<DataAccessObject>(*db_, std::move(kind), pLogger_);
  daos_.emplace(name, std::move(dao));

  LOG_SAFE(pLogger_, spdlog::level::info, "Defined entity kind {}", name);
}

bool Database::hasKind(const std::string& kind) const
{
  return daos_.find(kind) != daos_.end();
}

const EntityKind& Database::getKind(const std::string& kind) const
{
  auto it = daos_.find(kind);
  if (it == daos_.end())
  {
    throw UnknownKindError("Unknown entity kind " + kind);
  }
  return it->second->getKind();
}

Record Database::insert(const std::string& kind, const AttributeMap& attributes)
{
  return getDAO(kind).insert(attributes);
}

Record Database::get(const std::string& kind, uint32_t id)
{
  auto record = find(kind, id);
  if (!record)
  {
    throw NotFoundError("No " + kind + " with id " + std::to_string(id));
  }
  return std::move(*record);
}

std::optional<Record> Database::find(const std::string& kind, uint32_t id)
{
  return getDAO(kind).selectById(id);
}

RecordSet Database::all(const std::string& kind)
{
  return getDAO(kind).selectAll();
}

RecordSet Database::selectWhere(const std::string& kind,
                                const std::string& attribute,
                                int64_t value)
{
  return getDAO(kind).selectWhereEquals(attribute, value);
}

std::size_t Database::count(const std::string& kind)
{
  return getDAO(kind).count();
}

void Database::update(Record& record,
                      const std::string& attribute,
                      const AttributeValue& value)
{
  auto& dao = getDAO(record.getKind());
  if (!dao.updateAttribute(record.getId(), attribute, value))
  {
    throw NotFoundError("No " + record.getKind() + " with id " +
                        std::to_string(record.getId()));
  }

  record.set(attribute,
             coerceToType(value, dao.getKind().findAttribute(attribute)->type));
}

void Database::defineAssociation(const std::string& sourceKind,
                                 const std::string& name,
                                 AssociationDefinition definition)
{
  associations_.define(*this, sourceKind, name, std::move(definition));
}

RecordSet Database::resolve(const Record& record, const std::string& name)
{
  return associations_.resolve(*this, record, name);
}

std::optional<Record> Database::resolveOne(const Record& record,
                                           const std::string& name)
{
  return associations_.resolveOne(*this, record, name);
}

void Database::assign(Record& record,
                      const std::string& name,
                      const std::optional<Record>& target)
{
  associations_.assign(*this, record, name, target);
}

void Database::append(const Record& record,
                      const std::string& name,
                      const RecordSet& items)
{
  associations_.append(*this, record, name, items);
}

void Database::defineScope(const std::string& kind,
                           const std::string& name,
                           ScopeFunction function)
{
  if (!hasKind(kind))
  {
    throw UnknownKindError("Cannot define scope " + kind + "." + name +
                           " on unknown kind " + kind);
  }
  scopes_.define(kind, name, std::move(function));
}

QueryPlan Database::query(const std::string& kind)
{
  return QueryPlan{*this, kind};
}

sqlite3& Database::getRawDB()
{
  return *db_;
}

DataAccessObject& Database::getDAO(const std::string& kind)
{
  auto it = daos_.find(kind);
  if (it == daos_.end())
  {
    throw UnknownKindError("Unknown entity kind " + kind);
  }
  return *it->second;
}

}  // namespace cpp_relate
