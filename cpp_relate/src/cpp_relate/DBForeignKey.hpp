#ifndef DB_FOREIGN_KEY_HPP
#define DB_FOREIGN_KEY_HPP

#include <cstdint>
#include <functional>
#include <optional>

#include "cpp_relate/src/cpp_relate/DBTraits.hpp"

namespace cpp_relate
{

// Forward declarations
class Database;

/*!
 * \brief ForeignKey<T> stores only the ID of a related object T
 *
 * A ForeignKey member named `favorite` maps to an optional INT attribute
 * `favorite_id`, so it can back a one-to-one association declared on the
 * owning kind. The referenced object is not loaded until resolve() is
 * called. T must be a complete type, so a struct cannot hold a ForeignKey
 * to itself; declare self-referential keys on the EntityKind instead.
 *
 * Example:
 * \code
 * struct User : public cpp_relate::BaseTransferObject {
 *     std::string name;
 *     cpp_relate::ForeignKey<Video> favorite;  // column favorite_id
 * };
 *
 * auto user = cpp_relate::getObject<User>(db, 1);
 * if (auto video = user.favorite.resolve(db)) {
 *     std::cout << video->get().title << "\n";
 * }
 * \endcode
 */
template <ValidTransferObject T>
struct ForeignKey
{
  //! The ID of the referenced object
  uint32_t id{0};

  // The referenced object, loaded on demand
  std::optional<T> data_;

  /*!
   * \brief Default constructor - creates unset FK (id = 0)
   */
  ForeignKey() = default;

  /*!
   * \brief Construct from an ID
   */
  explicit ForeignKey(uint32_t foreignId) : id{foreignId}, data_{std::nullopt}
  {
  }

  /*!
   * \brief Point at another object, dropping any loaded one
   */
  ForeignKey& operator=(uint32_t foreignId)
  {
    id = foreignId;
    data_.reset();
    return *this;
  }

  /*!
   * \brief Resolve the foreign key to the full object
   * \param db Reference to the database
   * \return Optional containing the loaded object, or empty if the key is
   *         unset or the object does not exist
   */
  std::optional<std::reference_wrapper<const T>> resolve(Database& db);

  /*!
   * \brief Check if this FK is set (non-zero ID)
   */
  bool isSet() const
  {
    return id != 0;
  }
};

}  // namespace cpp_relate

#endif  // DB_FOREIGN_KEY_HPP
