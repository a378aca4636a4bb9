#ifndef DB_TRAITS_HPP
#define DB_TRAITS_HPP

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>

#include "sqlite3.h"

#include "cpp_relate/src/cpp_relate/DBBaseTransferObject.hpp"

namespace cpp_relate
{


/*!
 * A wrapping alias for the sqlite3 prepared statement
 * that allows us to use modern C++ memory management
 * with this library.
 */
using PreparedSQLStmt =
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Primary concept: Must derive from BaseTransferObject
template <typename T>
concept TransferObject = std::derived_from<T, BaseTransferObject>;

// Extended concept: Must be a transfer object with default constructor
template <typename T>
concept DefaultConstructibleTransferObject =
  TransferObject<T> && std::default_initializable<T>;

// Comprehensive concept combining common requirements
template <typename T>
concept ValidTransferObject =
  DefaultConstructibleTransferObject<T> && std::copyable<T>;

template <ValidTransferObject T>
struct ForeignKey;

// --- ForeignKey Type Traits ---

// Primary template for detecting ForeignKey
template <typename T>
struct is_foreign_key : std::false_type
{
};

// Specialization for ForeignKey<T>
template <ValidTransferObject T>
struct is_foreign_key<ForeignKey<T>> : std::true_type
{
};

// Concept for detecting ForeignKey types
template <typename T>
concept IsForeignKey = is_foreign_key<T>::value;

// Extract the referenced type from ForeignKey
template <typename T>
struct foreign_key_type
{
};

template <ValidTransferObject T>
struct foreign_key_type<ForeignKey<T>>
{
  using type = T;
};

// Helper alias to get the referenced type
template <IsForeignKey T>
using ForeignKeyType = typename foreign_key_type<T>::type;

// --- Basic Type Concepts ---

template <typename T>
concept isBool = std::is_same_v<T, bool>;
template <typename T>
concept isIntegral = std::integral<T> && !isBool<T>;
template <typename T>
concept floatingPoint = std::floating_point<T>;
template <typename T>
concept isString = std::is_same_v<T, std::string>;

/*!
 * A member type supported by a typed record is either:
 *  - A basic integral type
 *  - A boolean
 *  - A floating point type
 *  - A string
 *  - A ForeignKey to another transfer object
 */
template <typename T>
concept isSupportedDBType = isIntegral<T> || isBool<T> || floatingPoint<T> ||
                            isString<T> || IsForeignKey<T>;


}  // namespace cpp_relate

#endif  // DB_TRAITS_HPP
