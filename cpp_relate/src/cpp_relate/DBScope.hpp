#ifndef DB_SCOPE_HPP
#define DB_SCOPE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <boost/unordered_map.hpp>

#include "cpp_relate/src/cpp_relate/DBRecord.hpp"
#include "cpp_relate/src/utils/Logger.hpp"

namespace cpp_relate
{

//! Positional arguments passed to a named scope
using ScopeArgs = std::vector<AttributeValue>;

/*!
 * \brief A named scope: a pure transformation of a record set
 *
 * Receives the current set and the arguments of the call and returns the
 * new set. The input records must not be modified.
 */
using ScopeFunction =
  std::function<RecordSet(const RecordSet& records, const ScopeArgs& args)>;

enum class OrderDirection : uint8_t
{
  ASCENDING,
  DESCENDING
};

/*!
 * \brief An inclusive range; a missing bound is open
 *
 * Range::atLeast(100) matches every value >= 100.
 */
struct Range
{
  Range() = default;

  Range(std::optional<AttributeValue> lowerBound,
        std::optional<AttributeValue> upperBound)
    : lower{std::move(lowerBound)}, upper{std::move(upperBound)}
  {
  }

  std::optional<AttributeValue> lower;

  std::optional<AttributeValue> upper;

  static Range atLeast(AttributeValue value)
  {
    return Range{std::move(value), std::nullopt};
  }

  static Range atMost(AttributeValue value)
  {
    return Range{std::nullopt, std::move(value)};
  }

  static Range between(AttributeValue lowerBound, AttributeValue upperBound)
  {
    return Range{std::move(lowerBound), std::move(upperBound)};
  }

  //! Null never falls within a range
  bool contains(const AttributeValue& value) const;

  //! e.g. [100, +inf)
  std::string toString() const;
};

//! A where() condition: an exact value or a range
using Condition = std::variant<AttributeValue, Range>;

bool matches(const Condition& condition, const AttributeValue& value);

std::string toString(const Condition& condition);

std::string toString(OrderDirection direction);

// --- Built-in scopes ---

/*!
 * \brief Stable sort by an attribute's natural ordering
 * \throw ValidationError if a record lacks the attribute or two values
 *        cannot be compared
 */
RecordSet order(const RecordSet& records,
                const std::string& column,
                OrderDirection direction = OrderDirection::ASCENDING);

/*!
 * \brief Keep the records whose attribute equals the value or falls within
 *        the range, preserving order
 */
RecordSet where(const RecordSet& records,
                const std::string& attribute,
                const Condition& condition);

//! Keep the first n records
RecordSet limit(const RecordSet& records, std::size_t n);

/*!
 * \brief Named scopes, per kind
 *
 * Example:
 * \code
 * db.defineScope("Video", "duration_min",
 *   [](const cpp_relate::RecordSet& videos, const cpp_relate::ScopeArgs& args)
 *   {
 *     return cpp_relate::where(
 *       videos, "duration", cpp_relate::Range::atLeast(args.at(0)));
 *   });
 * \endcode
 */
class ScopeRegistry
{
public:
  explicit ScopeRegistry(std::shared_ptr<spdlog::logger> pLogger = nullptr);

  /*!
   * \throw DuplicateScopeError if the kind already has a scope by that name
   * \throw ValidationError for an invalid name or an empty function
   */
  void define(const std::string& kind,
              const std::string& name,
              ScopeFunction function);

  bool contains(const std::string& kind, const std::string& name) const;

  /*!
   * \brief Apply a named scope of the kind to a record set
   * \throw UnknownScopeError if the kind has no scope by that name
   */
  RecordSet apply(const RecordSet& records,
                  const std::string& kind,
                  const std::string& name,
                  const ScopeArgs& args) const;

private:
  //! Scope functions keyed by (kind, scope name)
  boost::unordered_map<std::pair<std::string, std::string>, ScopeFunction>
    scopes_;

  std::shared_ptr<spdlog::logger> pLogger_;
};

}  // namespace cpp_relate

#endif  // DB_SCOPE_HPP
