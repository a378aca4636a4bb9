#ifndef DATA_ACCESS_OBJECT_HPP
#define DATA_ACCESS_OBJECT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/unordered_map.hpp>
#include "sqlite3.h"

#include "cpp_relate/src/cpp_relate/DBEntityKind.hpp"
#include "cpp_relate/src/cpp_relate/DBRecord.hpp"
#include "cpp_relate/src/cpp_relate/DBTraits.hpp"
#include "cpp_relate/src/utils/Logger.hpp"

namespace cpp_relate
{

/*!
 * \brief Table access for a single entity kind
 *
 * Creates the kind's table on construction and keeps one prepared
 * statement per access pattern. Ids are assigned from a counter owned by
 * this object, starting after the largest id already stored.
 */
class DataAccessObject
{
public:
  /*!
   * Construct a data access object for this kind
   * \throw StorageError if the table cannot be created or a statement
   *        cannot be prepared
   */
  DataAccessObject(sqlite3& database,
                   EntityKind kind,
                   std::shared_ptr<spdlog::logger> pLogger = nullptr);

  DataAccessObject(const DataAccessObject&) = delete;
  DataAccessObject& operator=(const DataAccessObject&) = delete;

  const std::string& getTableName() const
  {
    return kind_.name;
  }

  const EntityKind& getKind() const
  {
    return kind_;
  }

  /*!
   * \brief Validate and insert a new record
   * \return The stored record, carrying its new id
   * \throw ValidationError, StorageError
   */
  Record insert(const AttributeMap& attributes);

  /*!
   * \brief Select all records from the table, in insertion order
   */
  RecordSet selectAll();

  /*!
   * \brief Select a single record by ID
   * \return Optional containing the record if found, empty otherwise
   */
  std::optional<Record> selectById(uint32_t id);

  /*!
   * \brief Select the records whose integer attribute equals a value, in
   *        insertion order
   * \throw ValidationError if the attribute is not an INT attribute
   */
  RecordSet selectWhereEquals(const std::string& attribute, int64_t value);

  /*!
   * \brief Persist a single attribute of a stored record
   * \return false if no record has this id
   * \throw ValidationError, StorageError
   */
  bool updateAttribute(uint32_t id,
                       const std::string& attribute,
                       const AttributeValue& value);

  //! Number of stored records
  std::size_t count();

  uint32_t incrementIdCounter()
  {
    return ++idCounter_;
  }

private:
  std::string generateCreateTableSQL() const;

  std::string generateInsertSQL() const;

  std::string generateSelectSQL(const std::string& whereClause) const;

  PreparedSQLStmt prepare(const std::string& sql);

  void executeCreateStmt();

  void loadIdCounter();

  void bindValue(sqlite3_stmt* stmt,
                 int index,
                 const AttributeValue& value,
                 AttributeType type);

  AttributeValue readColumn(sqlite3_stmt* stmt, int column, AttributeType type);

  //! Read the id in column 0
  //! \throw StorageError if it does not fit a record id
  uint32_t readId(sqlite3_stmt* stmt);

  //! Step a bound SELECT statement to completion and reset it
  RecordSet select(PreparedSQLStmt& stmt);

  [[noreturn]] void throwStorageError(const std::string& what, int code);

  //! The schema of the kind stored in this table
  EntityKind kind_;

  //! The raw SQLite connection, owned by the Database
  sqlite3& db_;

  //!< The prepared statement to facilitate inserting data into the database
  PreparedSQLStmt insertStmt_;

  //!< The prepared statement for SELECT ALL queries
  PreparedSQLStmt selectAllStmt_;

  //!< The prepared statement for SELECT BY ID queries
  PreparedSQLStmt selectByIdStmt_;

  //!< The prepared statement for COUNT queries
  PreparedSQLStmt countStmt_;

  //! Lazily prepared "WHERE column = ?" statements, keyed by column
  boost::unordered_map<std::string, PreparedSQLStmt> selectWhereStmts_;

  //! Lazily prepared single column UPDATE statements, keyed by column
  boost::unordered_map<std::string, PreparedSQLStmt> updateStmts_;

  //! The current ID counter for inserting new data
  uint32_t idCounter_;

  //! The local logger
  std::shared_ptr<spdlog::logger> pLogger_;
};

}  // namespace cpp_relate

#endif  // DATA_ACCESS_OBJECT_HPP
