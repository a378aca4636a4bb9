#include "cpp_relate/src/cpp_relate/DBDataAccessObject.hpp"

#include <limits>
#include <sstream>
#include <utility>

#include "cpp_relate/src/cpp_relate/DBErrors.hpp"
#include "cpp_relate/src/utils/StringUtils.hpp"

namespace cpp_relate
{

namespace
{

// Helper function to map attribute types to SQL types
std::string getSQLType(AttributeType type)
{
  switch (type)
  {
    case AttributeType::INT:
    case AttributeType::BOOL:
      return "INTEGER";
    case AttributeType::FLOAT:
      return "FLOAT";
    case AttributeType::TEXT:
      return "TEXT";
  }
  return "BLOB";
}

}  // namespace

DataAccessObject::DataAccessObject(sqlite3& database,
                                   EntityKind kind,
                                   std::shared_ptr<spdlog::logger> pLogger)
  : kind_{std::move(kind)},
    db_{database},
    insertStmt_{nullptr, sqlite3_finalize},
    selectAllStmt_{nullptr, sqlite3_finalize},
    selectByIdStmt_{nullptr, sqlite3_finalize},
    countStmt_{nullptr, sqlite3_finalize},
    selectWhereStmts_{},
    updateStmts_{},
    idCounter_{0},
    pLogger_{std::move(pLogger)}
{
  executeCreateStmt();
  loadIdCounter();

  insertStmt_ = prepare(generateInsertSQL());
  selectAllStmt_ = prepare(generateSelectSQL(""));
  selectByIdStmt_ = prepare(generateSelectSQL("WHERE \"id\" = ?"));
  countStmt_ = prepare("SELECT COUNT(*) FROM " + quoteIdentifier(kind_.name) + ";");
}

Record DataAccessObject::insert(const AttributeMap& attributes)
{
  AttributeMap normalized = kind_.normalize(attributes);

  const uint32_t id = incrementIdCounter();

  sqlite3_reset(insertStmt_.get());
  sqlite3_clear_bindings(insertStmt_.get());

  // SQLite uses 1-based parameter indexing, the id comes first
  int paramIndex = 1;
  sqlite3_bind_int64(
    insertStmt_.get(), paramIndex++, static_cast<sqlite3_int64>(id));

  for (const auto& attribute : kind_.attributes)
  {
    bindValue(insertStmt_.get(),
              paramIndex++,
              normalized.at(attribute.name),
              attribute.type);
  }

  int result = sqlite3_step(insertStmt_.get());
  sqlite3_reset(insertStmt_.get());

  if (result != SQLITE_DONE)
  {
    // Give the id back so that ids stay contiguous
    --idCounter_;
    throwStorageError("Insert into " + kind_.name + " failed", result);
  }

  Record record{kind_.name, id, std::move(normalized)};

  LOG_SAFE(pLogger_, spdlog::level::debug, "Inserted {}", record.toString());

  return record;
}

RecordSet DataAccessObject::selectAll()
{
  return select(selectAllStmt_);
}

std::optional<Record> DataAccessObject::selectById(uint32_t id)
{
  sqlite3_reset(selectByIdStmt_.get());
  sqlite3_bind_int64(
    selectByIdStmt_.get(), 1, static_cast<sqlite3_int64>(id));

  auto results = select(selectByIdStmt_);

  if (results.empty())
  {
    return std::nullopt;
  }

  return results[0];
}

RecordSet DataAccessObject::selectWhereEquals(const std::string& attribute,
                                              int64_t value)
{
  if (attribute != "id")
  {
    const auto* definition = kind_.findAttribute(attribute);
    if (definition == nullptr || definition->type != AttributeType::INT)
    {
      throw ValidationError("'" + attribute + "' is not an INT attribute of " +
                            kind_.name);
    }
  }

  auto it = selectWhereStmts_.find(attribute);
  if (it == selectWhereStmts_.end())
  {
    auto stmt = prepare(
      generateSelectSQL("WHERE " + quoteIdentifier(attribute) + " = ?"));
    it = selectWhereStmts_.emplace(attribute, std::move(stmt)).first;
  }

  auto& stmt = it->second;
  sqlite3_reset(stmt.get());
  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(value));

  return select(stmt);
}

bool DataAccessObject::updateAttribute(uint32_t id,
                                       const std::string& attribute,
                                       const AttributeValue& value)
{
  const auto* definition = kind_.findAttribute(attribute);
  if (definition == nullptr)
  {
    throw ValidationError("Unknown attribute '" + attribute + "' for " +
                          kind_.name);
  }
  if (isNull(value) && definition->required)
  {
    throw ValidationError("Required attribute '" + attribute + "' of " +
                          kind_.name + " cannot be null");
  }

  AttributeValue stored = coerceToType(value, definition->type);

  auto it = updateStmts_.find(attribute);
  if (it == updateStmts_.end())
  {
    std::string sql = "UPDATE " + quoteIdentifier(kind_.name) + " SET " +
                      quoteIdentifier(attribute) + " = ? WHERE \"id\" = ?;";
    LOG_SAFE(pLogger_, spdlog::level::debug, sql);
    it = updateStmts_.emplace(attribute, prepare(sql)).first;
  }

  auto& stmt = it->second;
  sqlite3_reset(stmt.get());
  bindValue(stmt.get(), 1, stored, definition->type);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(id));

  int result = sqlite3_step(stmt.get());
  sqlite3_reset(stmt.get());

  if (result != SQLITE_DONE)
  {
    throwStorageError("Update of " + kind_.name + "." + attribute + " failed",
                      result);
  }

  const bool updated = sqlite3_changes(&db_) > 0;

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Updated {}#{}.{} = {} ({})",
           kind_.name,
           id,
           attribute,
           toString(stored),
           updated ? "ok" : "no such record");

  return updated;
}

std::size_t DataAccessObject::count()
{
  sqlite3_reset(countStmt_.get());

  std::size_t total = 0;
  int result = sqlite3_step(countStmt_.get());
  if (result == SQLITE_ROW)
  {
    total = static_cast<std::size_t>(sqlite3_column_int64(countStmt_.get(), 0));
  }
  sqlite3_reset(countStmt_.get());

  if (result != SQLITE_ROW)
  {
    throwStorageError("Count of " + kind_.name + " failed", result);
  }
  return total;
}

/*!
 * \brief Create the string that is used to generate the SQL
 *        CREATE TABLE command
 */
std::string DataAccessObject::generateCreateTableSQL() const
{
  std::ostringstream sql;
  sql << "CREATE TABLE IF NOT EXISTS " << quoteIdentifier(kind_.name)
      << " (\"id\" INTEGER PRIMARY KEY";

  for (const auto& attribute : kind_.attributes)
  {
    sql << ", " << quoteIdentifier(attribute.name) << " "
        << getSQLType(attribute.type);
    if (attribute.required)
    {
      sql << " NOT NULL";
    }
  }

  sql << ");";
  return sql.str();
}

/*!
 * \brief Create the string that prepares an insert statement.
 */
std::string DataAccessObject::generateInsertSQL() const
{
  std::vector<std::string> columns{"\"id\""};
  std::vector<std::string> placeholders{"?"};

  for (const auto& attribute : kind_.attributes)
  {
    columns.push_back(quoteIdentifier(attribute.name));
    placeholders.push_back("?");
  }

  return "INSERT INTO " + quoteIdentifier(kind_.name) + " (" +
         joinStrings(columns, ", ") + ") VALUES (" +
         joinStrings(placeholders, ", ") + ");";
}

/*!
 * \brief Generate a SELECT statement over every column, ordered by id
 *        so that results come back in insertion order
 */
std::string DataAccessObject::generateSelectSQL(
  const std::string& whereClause) const
{
  std::vector<std::string> columns{"\"id\""};
  for (const auto& attribute : kind_.attributes)
  {
    columns.push_back(quoteIdentifier(attribute.name));
  }

  std::string sql =
    "SELECT " + joinStrings(columns, ", ") + " FROM " + quoteIdentifier(kind_.name);
  if (!whereClause.empty())
  {
    sql += " " + whereClause;
  }
  sql += " ORDER BY \"id\";";
  return sql;
}

PreparedSQLStmt DataAccessObject::prepare(const std::string& sql)
{
  LOG_SAFE(pLogger_, spdlog::level::debug, sql);

  sqlite3_stmt* rawPtr = nullptr;
  int result = sqlite3_prepare_v2(&db_, sql.c_str(), -1, &rawPtr, nullptr);

  PreparedSQLStmt stmt{rawPtr, sqlite3_finalize};

  if (result != SQLITE_OK)
  {
    throwStorageError("Could not prepare statement for table " + kind_.name,
                      result);
  }

  return stmt;
}

void DataAccessObject::executeCreateStmt()
{
  std::string createQuery = generateCreateTableSQL();

  LOG_SAFE(pLogger_, spdlog::level::trace, "Executing: {}", createQuery);

  int result = sqlite3_exec(&db_, createQuery.c_str(), nullptr, nullptr, nullptr);
  if (result != SQLITE_OK)
  {
    throwStorageError("Could not create table " + kind_.name, result);
  }
}

void DataAccessObject::loadIdCounter()
{
  auto stmt = prepare("SELECT MAX(\"id\") FROM " + quoteIdentifier(kind_.name) + ";");

  int result = sqlite3_step(stmt.get());
  if (result != SQLITE_ROW)
  {
    throwStorageError("Could not read the largest id of " + kind_.name,
                      result);
  }

  if (sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL)
  {
    idCounter_ = readId(stmt.get());
    LOG_SAFE(pLogger_,
             spdlog::level::info,
             "Resuming {} ids after {}",
             kind_.name,
             idCounter_);
  }
}

void DataAccessObject::bindValue(sqlite3_stmt* stmt,
                                 int index,
                                 const AttributeValue& value,
                                 AttributeType type)
{
  if (isNull(value))
  {
    sqlite3_bind_null(stmt, index);
    return;
  }

  switch (type)
  {
    case AttributeType::INT:
      sqlite3_bind_int64(
        stmt, index, static_cast<sqlite3_int64>(std::get<int64_t>(value)));
      break;
    case AttributeType::BOOL:
      sqlite3_bind_int64(stmt, index, std::get<bool>(value) ? 1 : 0);
      break;
    case AttributeType::FLOAT:
      sqlite3_bind_double(stmt, index, toDouble(value));
      break;
    case AttributeType::TEXT:
    {
      const auto& text = std::get<std::string>(value);
      sqlite3_bind_text(stmt,
                        index,
                        text.c_str(),
                        static_cast<int>(text.length()),
                        SQLITE_TRANSIENT);
      break;
    }
  }
}

AttributeValue DataAccessObject::readColumn(sqlite3_stmt* stmt,
                                            int column,
                                            AttributeType type)
{
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL)
  {
    return AttributeValue{};
  }

  switch (type)
  {
    case AttributeType::INT:
      return static_cast<int64_t>(sqlite3_column_int64(stmt, column));
    case AttributeType::BOOL:
      return sqlite3_column_int64(stmt, column) != 0;
    case AttributeType::FLOAT:
      return sqlite3_column_double(stmt, column);
    case AttributeType::TEXT:
    {
      const unsigned char* text = sqlite3_column_text(stmt, column);
      return std::string(text ? reinterpret_cast<const char*>(text) : "");
    }
  }
  return AttributeValue{};
}

RecordSet DataAccessObject::select(PreparedSQLStmt& stmt)
{
  RecordSet results;

  int result = SQLITE_ROW;
  while ((result = sqlite3_step(stmt.get())) == SQLITE_ROW)
  {
    uint32_t id = 0;
    try
    {
      id = readId(stmt.get());
    }
    catch (const StorageError&)
    {
      sqlite3_reset(stmt.get());
      throw;
    }

    AttributeMap attributes;
    int columnIndex = 1;
    for (const auto& attribute : kind_.attributes)
    {
      attributes.emplace(attribute.name,
                         readColumn(stmt.get(), columnIndex, attribute.type));
      columnIndex++;
    }

    results.emplace_back(kind_.name, id, std::move(attributes));
  }

  // Reset the statement for potential reuse
  sqlite3_reset(stmt.get());

  if (result != SQLITE_DONE)
  {
    throwStorageError("Select from " + kind_.name + " failed", result);
  }

  return results;
}

uint32_t DataAccessObject::readId(sqlite3_stmt* stmt)
{
  const sqlite3_int64 id = sqlite3_column_int64(stmt, 0);
  if (id < 0 || id > static_cast<sqlite3_int64>(std::numeric_limits<uint32_t>::max()))
  {
    throwStorageError("Id " + std::to_string(id) + " in table " + kind_.name +
                        " is out of range",
                      SQLITE_RANGE);
  }
  return static_cast<uint32_t>(id);
}

void DataAccessObject::throwStorageError(const std::string& what, int code)
{
  std::string message = what + ": " + sqlite3_errmsg(&db_) +
                        " (SQLITE code " + std::to_string(code) + ")";
  LOG_SAFE(pLogger_, spdlog::level::err, message);
  throw StorageError(message);
}

}  // namespace cpp_relate
