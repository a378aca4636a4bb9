#ifndef DB_DATABASE_HPP
#define DB_DATABASE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/unordered_map.hpp>
#include "sqlite3.h"

#include "cpp_relate/src/cpp_relate/DBAssociation.hpp"
#include "cpp_relate/src/cpp_relate/DBDataAccessObject.hpp"
#include "cpp_relate/src/cpp_relate/DBEntityKind.hpp"
#include "cpp_relate/src/cpp_relate/DBErrors.hpp"
#include "cpp_relate/src/cpp_relate/DBQueryPlan.hpp"
#include "cpp_relate/src/cpp_relate/DBRecord.hpp"
#include "cpp_relate/src/cpp_relate/DBScope.hpp"
#include "cpp_relate/src/utils/Logger.hpp"

namespace cpp_relate
{


/*!
 * \brief The record store and the registries of associations and scopes
 *
 * Owns the SQLite connection and one DataAccessObject per entity kind.
 * Query plans and association resolution run against an explicit
 * Database instance; there is no global registry.
 *
 * Single writer: callers must serialize every mutation.
 */
class Database
{
public:
  /*!
   * \brief Open a store
   * \param url The string url to pass to the sqlite constructor.
   *        ":memory:" keeps everything in memory.
   * \param pLogger The logger, or nullptr to stay silent
   * \throw StorageError if the database cannot be opened
   */
  explicit Database(const std::string& url = ":memory:",
                    std::shared_ptr<spdlog::logger> pLogger = nullptr);

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Plans and DAOs hold references to this object
  Database(Database&&) = delete;
  Database& operator=(Database&&) = delete;

  // --- Entity kinds ---

  /*!
   * \brief Define an entity kind and create its table
   * \throw ValidationError, DuplicateKindError, StorageError
   */
  void defineKind(EntityKind kind);

  bool hasKind(const std::string& kind) const;

  /*!
   * \throw UnknownKindError
   */
  const EntityKind& getKind(const std::string& kind) const;

  // --- Record store ---

  /*!
   * \brief Insert a record, assigning the next id of its kind
   * \throw UnknownKindError, ValidationError, StorageError
   */
  Record insert(const std::string& kind, const AttributeMap& attributes);

  /*!
   * \throw NotFoundError if no record of the kind has this id
   */
  Record get(const std::string& kind, uint32_t id);

  std::optional<Record> find(const std::string& kind, uint32_t id);

  //! Every record of the kind, in insertion order
  RecordSet all(const std::string& kind);

  //! Records whose INT attribute equals the value, in insertion order
  RecordSet selectWhere(const std::string& kind,
                        const std::string& attribute,
                        int64_t value);

  std::size_t count(const std::string& kind);

  /*!
   * \brief Persist one attribute of a record and update the snapshot
   * \throw NotFoundError if the record is no longer stored
   * \throw ValidationError, StorageError
   */
  void update(Record& record,
              const std::string& attribute,
              const AttributeValue& value);

  // --- Associations ---

  void defineAssociation(const std::string& sourceKind,
                         const std::string& name,
                         AssociationDefinition definition);

  RecordSet resolve(const Record& record, const std::string& name);

  std::optional<Record> resolveOne(const Record& record,
                                   const std::string& name);

  //! One-to-one setter, persisted immediately
  void assign(Record& record,
              const std::string& name,
              const std::optional<Record>& target);

  //! Append to a one-to-many or many-to-many-through collection
  void append(const Record& record,
              const std::string& name,
              const RecordSet& items);

  const AssociationRegistry& getAssociations() const
  {
    return associations_;
  }

  // --- Scopes and queries ---

  /*!
   * \throw UnknownKindError, DuplicateScopeError
   */
  void defineScope(const std::string& kind,
                   const std::string& name,
                   ScopeFunction function);

  const ScopeRegistry& getScopes() const
  {
    return scopes_;
  }

  /*!
   * \brief Start a query plan over every record of the kind
   * \throw UnknownKindError
   */
  QueryPlan query(const std::string& kind);

  // --- Accessors ---

  /*!
   * \brief Get raw SQLite database pointer for direct access
   */
  sqlite3& getRawDB();

  std::shared_ptr<spdlog::logger> getLogger() const
  {
    return pLogger_;
  }

private:
  /*!
   * \throw UnknownKindError
   */
  DataAccessObject& getDAO(const std::string& kind);

  //!< The unique pointer storing the SQLite database
  //!< object
  std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db_;

  //! The pointer to the spdlog for this object.
  std::shared_ptr<spdlog::logger> pLogger_;

  //! One DAO per entity kind, keyed by kind name. Declared after db_ so
  //! that every statement is finalized before the connection closes.
  boost::unordered_map<std::string, std::unique_ptr<DataAccessObject>> daos_;

  AssociationRegistry associations_;

  ScopeRegistry scopes_;
};

}  // namespace cpp_relate

#endif  // DB_DATABASE_HPP
