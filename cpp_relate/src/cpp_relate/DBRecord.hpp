#ifndef DB_RECORD_HPP
#define DB_RECORD_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "cpp_relate/src/cpp_relate/DBErrors.hpp"
#include "cpp_relate/src/cpp_relate/DBValue.hpp"

namespace cpp_relate
{

/*!
 * \brief A snapshot of one stored record
 *
 * The store owns the persisted record. A Record handed out by the
 * Database is a value copy: changing it with set() does not persist
 * anything, use Database::update() for that.
 */
class Record
{
public:
  Record(std::string kind, uint32_t id, AttributeMap attributes);

  const std::string& getKind() const
  {
    return kind_;
  }

  uint32_t getId() const
  {
    return id_;
  }

  const AttributeMap& getAttributes() const
  {
    return attributes_;
  }

  /*!
   * \brief Read an attribute. "id" yields the record id as an integer.
   * \throw ValidationError if the record has no such attribute
   */
  AttributeValue get(const std::string& attribute) const;

  /*!
   * \brief Read an attribute as a specific alternative
   * \throw ValidationError if the attribute is missing, null or holds a
   *        different type
   */
  template <typename V>
  V getAs(const std::string& attribute) const
  {
    AttributeValue value = get(attribute);
    if (const auto* typed = std::get_if<V>(&value))
    {
      return *typed;
    }
    throw ValidationError("Attribute '" + attribute + "' of " + kind_ + " #" +
                          std::to_string(id_) + " holds " +
                          cpp_relate::toString(value));
  }

  bool isNull(const std::string& attribute) const;

  /*!
   * \brief Change an attribute on this snapshot only
   * \throw ValidationError if the record has no such attribute
   */
  void set(const std::string& attribute, AttributeValue value);

  bool operator==(const Record& other) const = default;

  //! e.g. Video#3{duration: 90, title: 'Cat'}
  std::string toString() const;

private:
  std::string kind_;

  uint32_t id_;

  AttributeMap attributes_;
};

//! An ordered sequence of records; duplicates are allowed
using RecordSet = std::vector<Record>;

}  // namespace cpp_relate

#endif  // DB_RECORD_HPP
