#ifndef DB_ENTITY_KIND_HPP
#define DB_ENTITY_KIND_HPP

#include <string>
#include <vector>

#include "cpp_relate/src/cpp_relate/DBValue.hpp"

namespace cpp_relate
{

/*!
 * \brief A single column of an entity kind
 */
struct AttributeDefinition
{
  //! The attribute (and column) name
  std::string name;

  //! The declared value type
  AttributeType type{AttributeType::INT};

  //! Required attributes must be present and non-null on insert
  bool required{true};
};

/*!
 * \brief A named record type with an ordered attribute schema
 *
 * The `id` attribute is implicit: every record of every kind carries an
 * auto-incremented integer identity assigned by the store.
 *
 * Example:
 * \code
 * cpp_relate::EntityKind video{"Video",
 *                              {{"title", cpp_relate::AttributeType::TEXT},
 *                               {"engine", cpp_relate::AttributeType::TEXT},
 *                               {"duration", cpp_relate::AttributeType::INT}}};
 * db.defineKind(video);
 * \endcode
 */
struct EntityKind
{
  std::string name;

  std::vector<AttributeDefinition> attributes;

  /*!
   * \brief Find an attribute by name
   * \return A pointer to the definition, or nullptr if the kind has no
   *         such attribute
   */
  const AttributeDefinition* findAttribute(const std::string& attributeName) const;

  /*!
   * \brief Check whether the kind has the attribute. `id` is always present.
   */
  bool hasAttribute(const std::string& attributeName) const;

  /*!
   * \brief Check the kind name and attribute names
   * \throw ValidationError on invalid or duplicate names, or a declared `id`
   */
  void validate() const;

  /*!
   * \brief Validate attributes supplied for an insert
   *
   * Every supplied attribute must belong to the schema and match its type.
   * Required attributes must be present and non-null. The result contains
   * every schema attribute (absent optional ones are null) with integers
   * widened for FLOAT attributes.
   *
   * \throw ValidationError
   */
  AttributeMap normalize(const AttributeMap& supplied) const;
};

}  // namespace cpp_relate

#endif  // DB_ENTITY_KIND_HPP
