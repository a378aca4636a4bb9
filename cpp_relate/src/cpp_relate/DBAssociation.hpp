#ifndef DB_ASSOCIATION_HPP
#define DB_ASSOCIATION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/unordered_map.hpp>

#include "cpp_relate/src/cpp_relate/DBRecord.hpp"
#include "cpp_relate/src/utils/Logger.hpp"

namespace cpp_relate
{

// Forward declarations
class Database;

enum class AssociationType : uint8_t
{
  ONE_TO_ONE,
  ONE_TO_MANY,
  MANY_TO_MANY_THROUGH
};

/*!
 * \brief Declares how a source kind relates to a target kind
 *
 * Kinds are referenced by name and looked up when the association is
 * resolved, so a kind may refer to itself or to a kind defined later.
 *
 * Example:
 * \code
 * // Video.sequel: the Video whose id is stored in Video.sequel_id
 * db.defineAssociation(
 *   "Video", "sequel", AssociationDefinition::oneToOne("Video", "sequel_id"));
 *
 * // Playlist.likes: the Likes whose playlist_id is the playlist id
 * db.defineAssociation(
 *   "Playlist", "likes", AssociationDefinition::oneToMany("Like", "playlist_id"));
 *
 * // Playlist.videos: through Like(playlist_id, video_id)
 * db.defineAssociation("Playlist",
 *                      "videos",
 *                      AssociationDefinition::manyToManyThrough(
 *                        "Like", "Video", "playlist_id", "video_id"));
 * \endcode
 */
struct AssociationDefinition
{
  AssociationType type{AssociationType::ONE_TO_ONE};

  //! The kind of the associated records
  std::string targetKind;

  //! ONE_TO_ONE: key on the source. ONE_TO_MANY: key on the target.
  std::string foreignKey;

  //! MANY_TO_MANY_THROUGH: the join kind
  std::string throughKind;

  //! MANY_TO_MANY_THROUGH: join key holding the source id
  std::string sourceKey;

  //! MANY_TO_MANY_THROUGH: join key holding the target id
  std::string targetKey;

  static AssociationDefinition oneToOne(std::string targetKind,
                                        std::string foreignKey);

  static AssociationDefinition oneToMany(std::string targetKind,
                                         std::string foreignKey);

  static AssociationDefinition manyToManyThrough(std::string throughKind,
                                                 std::string targetKind,
                                                 std::string sourceKey,
                                                 std::string targetKey);

  //! The kind that carries the foreign key(s)
  std::string owningKind(const std::string& sourceKind) const;
};

/*!
 * \brief Holds the association definitions of every kind and resolves them
 *        against a Database
 */
class AssociationRegistry
{
public:
  explicit AssociationRegistry(std::shared_ptr<spdlog::logger> pLogger = nullptr);

  /*!
   * \brief Register an association of the source kind
   * \throw UnknownKindError if the source kind is undefined
   * \throw DuplicateAssociationError if the name is taken for that kind
   * \throw ValidationError if a foreign key is missing or not INT on an
   *        owning kind that is already defined
   */
  void define(Database& db,
              const std::string& sourceKind,
              const std::string& name,
              AssociationDefinition definition);

  bool contains(const std::string& sourceKind, const std::string& name) const;

  /*!
   * \throw UnknownAssociationError
   */
  const AssociationDefinition& find(const std::string& sourceKind,
                                    const std::string& name) const;

  /*!
   * \brief Resolve an association of a record to its target records
   *
   * ONE_TO_ONE yields zero or one record, the others yield every target in
   * insertion order (of the targets, or of the join records for a through
   * association). Targets referenced by a dangling key are skipped.
   */
  RecordSet resolve(Database& db,
                    const Record& record,
                    const std::string& name) const;

  /*!
   * \brief Resolve a ONE_TO_ONE association
   * \return Empty if the foreign key is unset
   * \throw NotFoundError if the foreign key points to a missing record
   * \throw ValidationError if the association is not ONE_TO_ONE
   */
  std::optional<Record> resolveOne(Database& db,
                                   const Record& record,
                                   const std::string& name) const;

  /*!
   * \brief Set a ONE_TO_ONE association, persisting the foreign key
   *        immediately. std::nullopt clears it.
   */
  void assign(Database& db,
              Record& record,
              const std::string& name,
              const std::optional<Record>& target) const;

  /*!
   * \brief Append records to a collection association
   *
   * MANY_TO_MANY_THROUGH inserts one join record per item, in order, even
   * when the pair is already linked. ONE_TO_MANY writes the source id into
   * each item's foreign key.
   */
  void append(Database& db,
              const Record& record,
              const std::string& name,
              const RecordSet& items) const;

private:
  //! Check that a key exists as an INT attribute on the kind, if defined
  void checkForeignKey(Database& db,
                       const std::string& kind,
                       const std::string& key) const;

  void checkTarget(const AssociationDefinition& definition,
                   const Record& target,
                   const std::string& name) const;

  //! Definitions keyed by (source kind, association name)
  boost::unordered_map<std::pair<std::string, std::string>, AssociationDefinition>
    definitions_;

  std::shared_ptr<spdlog::logger> pLogger_;
};

std::string toString(AssociationType type);

}  // namespace cpp_relate

#endif  // DB_ASSOCIATION_HPP
