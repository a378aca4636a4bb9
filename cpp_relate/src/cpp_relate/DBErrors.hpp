#ifndef DB_ERRORS_HPP
#define DB_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cpp_relate
{

/*!
 * \brief Base class of every error raised by cpp_relate
 */
class DBError : public std::runtime_error
{
public:
  explicit DBError(const std::string& msg) : std::runtime_error(msg)
  {
  }
};

//! A missing, mistyped or unknown attribute, or an invalid name
class ValidationError : public DBError
{
public:
  explicit ValidationError(const std::string& msg) : DBError(msg)
  {
  }
};

//! A lookup by id, or a one-to-one target, that does not exist
class NotFoundError : public DBError
{
public:
  explicit NotFoundError(const std::string& msg) : DBError(msg)
  {
  }
};

class UnknownKindError : public DBError
{
public:
  explicit UnknownKindError(const std::string& msg) : DBError(msg)
  {
  }
};

class DuplicateKindError : public DBError
{
public:
  explicit DuplicateKindError(const std::string& msg) : DBError(msg)
  {
  }
};

class DuplicateAssociationError : public DBError
{
public:
  explicit DuplicateAssociationError(const std::string& msg) : DBError(msg)
  {
  }
};

class UnknownAssociationError : public DBError
{
public:
  explicit UnknownAssociationError(const std::string& msg) : DBError(msg)
  {
  }
};

class DuplicateScopeError : public DBError
{
public:
  explicit DuplicateScopeError(const std::string& msg) : DBError(msg)
  {
  }
};

class UnknownScopeError : public DBError
{
public:
  explicit UnknownScopeError(const std::string& msg) : DBError(msg)
  {
  }
};

//! Raised by QueryPlan::first() when the materialized set is empty
class EmptySetError : public DBError
{
public:
  explicit EmptySetError(const std::string& msg) : DBError(msg)
  {
  }
};

//! Raised when a query plan is reused after materialization
class MaterializedPlanError : public DBError
{
public:
  explicit MaterializedPlanError(const std::string& msg) : DBError(msg)
  {
  }
};

//! An SQLite call failed. The message carries the SQLite error text.
class StorageError : public DBError
{
public:
  explicit StorageError(const std::string& msg) : DBError(msg)
  {
  }
};

}  // namespace cpp_relate

#endif  // DB_ERRORS_HPP
