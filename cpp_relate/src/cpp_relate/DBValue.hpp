#ifndef DB_VALUE_HPP
#define DB_VALUE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace cpp_relate
{

/*!
 * The value types an attribute may be declared with
 */
enum class AttributeType : uint8_t
{
  INT,
  FLOAT,
  BOOL,
  TEXT
};

/*!
 * \brief A single attribute value
 *
 * std::monostate is the null value (an unset optional attribute or
 * an unset foreign key).
 */
using AttributeValue =
  std::variant<std::monostate, int64_t, double, bool, std::string>;

//! Attribute values keyed by attribute name
using AttributeMap = std::map<std::string, AttributeValue>;

/*!
 * \brief Check whether a value is null
 */
inline bool isNull(const AttributeValue& value)
{
  return std::holds_alternative<std::monostate>(value);
}

/*!
 * \brief Check whether a value holds an integer or a float
 */
inline bool isNumeric(const AttributeValue& value)
{
  return std::holds_alternative<int64_t>(value) ||
         std::holds_alternative<double>(value);
}

/*!
 * \brief Check whether a (non-null) value can be stored in an attribute
 *        of the given type. Integers are accepted for FLOAT attributes.
 */
bool matchesType(const AttributeValue& value, AttributeType type);

/*!
 * \brief Convert a value to the representation stored for the given type
 *
 * Widens integers stored in FLOAT attributes. Null stays null.
 * \throw ValidationError if the value does not match the type
 */
AttributeValue coerceToType(const AttributeValue& value, AttributeType type);

/*!
 * \brief Read a numeric value as a double
 * \throw ValidationError if the value is not an integer or a float
 */
double toDouble(const AttributeValue& value);

/*!
 * \brief Natural ordering of attribute values
 *
 * Null sorts before everything else. Integers and floats compare
 * numerically with each other, booleans order false before true and
 * strings compare lexicographically.
 *
 * \return A negative number, zero or a positive number when lhs is
 *         respectively less than, equal to or greater than rhs.
 * \throw ValidationError when the values cannot be compared (e.g. a
 *        string against a number)
 */
int compareValues(const AttributeValue& lhs, const AttributeValue& rhs);

//! Printable form of a value, strings are single-quoted
std::string toString(const AttributeValue& value);

//! Printable name of an attribute type
std::string toString(AttributeType type);

}  // namespace cpp_relate

#endif  // DB_VALUE_HPP
