#ifndef DB_QUERY_PLAN_HPP
#define DB_QUERY_PLAN_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "cpp_relate/src/cpp_relate/DBRecord.hpp"
#include "cpp_relate/src/cpp_relate/DBScope.hpp"

namespace cpp_relate
{

// Forward declarations
class Database;

/*!
 * \brief Map each record through an association and flatten the targets
 *
 * Source order is kept, then per-source target order. Duplicates are kept.
 */
RecordSet joins(Database& db,
                const RecordSet& records,
                const std::string& associationName);

/*!
 * \brief Keep the records of `records` whose identity (kind and id) appears
 *        in `other`, in the order of `records`
 */
RecordSet merge(const RecordSet& records, const RecordSet& other);

/*!
 * \brief A lazily evaluated chain of operations over a base kind
 *
 * Every chaining call validates its arguments against the current kind and
 * returns a new plan; nothing touches the store until a terminal call
 * (toSequence, count, average, first) materializes the plan. A materialized
 * plan cannot be reused.
 *
 * Example:
 * \code
 * auto videos = db.query("Video")
 *                 .scope("duration_min", {100})
 *                 .order("engine")
 *                 .toSequence();
 * \endcode
 */
class QueryPlan
{
public:
  enum class State : uint8_t
  {
    BUILT,
    MATERIALIZED
  };

  /*!
   * \brief Start a plan over every record of the kind
   * \throw UnknownKindError
   */
  QueryPlan(Database& db, const std::string& kind);

  /*!
   * \brief Apply a named scope of the current kind
   * \throw UnknownScopeError
   */
  QueryPlan scope(const std::string& name, ScopeArgs args = {}) const;

  //! Keep records whose attribute equals the value
  QueryPlan where(const std::string& attribute, AttributeValue value) const;

  //! Keep records whose attribute falls within the inclusive range
  QueryPlan where(const std::string& attribute, Range range) const;

  /*!
   * \brief Replace every record by its associated records. The plan's kind
   *        becomes the association's target kind.
   * \throw UnknownAssociationError
   */
  QueryPlan join(const std::string& associationName) const;

  /*!
   * \brief Keep the records that the other plan also yields
   * \throw ValidationError if the other plan is of a different kind
   * \throw MaterializedPlanError if the other plan was already materialized
   */
  QueryPlan merge(const QueryPlan& other) const;

  //! Keep the records that appear in the given set
  QueryPlan merge(RecordSet records) const;

  /*!
   * \brief Stable sort by an attribute
   * \throw ValidationError if the current kind has no such attribute
   */
  QueryPlan order(const std::string& column,
                  OrderDirection direction = OrderDirection::ASCENDING) const;

  QueryPlan limit(std::size_t n) const;

  // --- Terminal operations ---

  RecordSet toSequence();

  std::size_t count();

  /*!
   * \brief Mean of a numeric attribute, ignoring nulls. 0.0 when nothing
   *        is left to average.
   * \throw ValidationError if the attribute is not INT or FLOAT
   */
  double average(const std::string& attribute);

  /*!
   * \throw EmptySetError if the plan yields no record
   */
  Record first();

  const std::string& getBaseKind() const
  {
    return baseKind_;
  }

  //! The kind of the records the plan currently yields
  const std::string& getKind() const
  {
    return kind_;
  }

  State getState() const
  {
    return state_;
  }

  //! e.g. Video.scope(duration_min, 100).order(engine ASC)
  std::string toString() const;

private:
  struct Operation
  {
    //! Rendered by toString()
    std::string description;

    std::function<RecordSet(Database&, const RecordSet&)> apply;
  };

  QueryPlan chain(Operation operation, std::string resultKind) const;

  void requireBuilt() const;

  void requireAttribute(const std::string& attribute) const;

  //! Run every operation against the store and mark the plan materialized
  RecordSet evaluate();

  //! The database, which must outlive the plan
  Database* db_;

  std::string baseKind_;

  std::string kind_;

  std::vector<Operation> operations_;

  State state_;
};

}  // namespace cpp_relate

#endif  // DB_QUERY_PLAN_HPP
