#ifndef DB_TRANSFER_OBJECT_HPP
#define DB_TRANSFER_OBJECT_HPP

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/describe.hpp>
#include <boost/describe/class.hpp>
#include <boost/mp11.hpp>
#include <boost/type_index.hpp>

#include "cpp_relate/src/cpp_relate/DBBaseTransferObject.hpp"
#include "cpp_relate/src/cpp_relate/DBDatabase.hpp"
#include "cpp_relate/src/cpp_relate/DBForeignKey.hpp"
#include "cpp_relate/src/cpp_relate/DBTraits.hpp"
#include "cpp_relate/src/utils/StringUtils.hpp"

namespace cpp_relate
{

// Register the base transfer object with
// boost::describe
BOOST_DESCRIBE_STRUCT(BaseTransferObject, (), (id));

/*!
 * \brief The entity kind name of a transfer object: its unqualified type name
 */
template <ValidTransferObject T>
std::string kindName()
{
  return stripNamespace(boost::typeindex::type_id<T>().pretty_name());
}

/*!
 * \brief The attribute name a described member is stored under.
 *        ForeignKey members gain an "_id" suffix.
 */
template <typename MemberType>
std::string attributeName(const char* memberName)
{
  if constexpr (IsForeignKey<MemberType>)
  {
    return std::string(memberName) + "_id";
  }
  else
  {
    return std::string(memberName);
  }
}

/*!
 * \brief Derive an entity kind from the public members described with
 *        BOOST_DESCRIBE_STRUCT
 *
 * Integral members map to INT, bool to BOOL, floating point members to
 * FLOAT and std::string to TEXT; all of them are required. A
 * ForeignKey<U> member maps to an optional INT attribute.
 */
template <ValidTransferObject T>
EntityKind describeKind()
{
  EntityKind kind{kindName<T>(), {}};

  boost::mp11::mp_for_each<boost::describe::describe_members<
    T,
    boost::describe::mod_inherited | boost::describe::mod_public>>(
    [&](auto D)
    {
      using memberType = std::remove_cv_t<
        std::remove_reference_t<decltype(std::declval<T>().*D.pointer)>>;

      static_assert(isSupportedDBType<memberType>,
                    "Unsupported member type in transfer object");

      // The identity is implicit
      if (std::string(D.name) == "id")
      {
        return;
      }

      const std::string name = attributeName<memberType>(D.name);

      if constexpr (IsForeignKey<memberType>)
      {
        kind.attributes.push_back({name, AttributeType::INT, false});
      }
      else if constexpr (isBool<memberType>)
      {
        kind.attributes.push_back({name, AttributeType::BOOL, true});
      }
      else if constexpr (isIntegral<memberType>)
      {
        kind.attributes.push_back({name, AttributeType::INT, true});
      }
      else if constexpr (floatingPoint<memberType>)
      {
        kind.attributes.push_back({name, AttributeType::FLOAT, true});
      }
      else if constexpr (isString<memberType>)
      {
        kind.attributes.push_back({name, AttributeType::TEXT, true});
      }
    });

  return kind;
}

/*!
 * \brief Read the described members of an object into attribute values
 */
template <ValidTransferObject T>
AttributeMap toAttributes(const T& object)
{
  AttributeMap attributes;

  boost::mp11::mp_for_each<boost::describe::describe_members<
    T,
    boost::describe::mod_inherited | boost::describe::mod_public>>(
    [&](auto D)
    {
      using memberType = std::remove_cv_t<
        std::remove_reference_t<decltype(std::declval<T>().*D.pointer)>>;

      if (std::string(D.name) == "id")
      {
        return;
      }

      const auto& value = object.*D.pointer;
      const std::string name = attributeName<memberType>(D.name);

      if constexpr (IsForeignKey<memberType>)
      {
        attributes.emplace(name,
                           value.isSet()
                             ? AttributeValue{static_cast<int64_t>(value.id)}
                             : AttributeValue{});
      }
      else if constexpr (isBool<memberType>)
      {
        attributes.emplace(name, AttributeValue{value});
      }
      else if constexpr (isIntegral<memberType>)
      {
        attributes.emplace(name, AttributeValue{static_cast<int64_t>(value)});
      }
      else if constexpr (floatingPoint<memberType>)
      {
        attributes.emplace(name, AttributeValue{static_cast<double>(value)});
      }
      else if constexpr (isString<memberType>)
      {
        attributes.emplace(name, AttributeValue{value});
      }
    });

  return attributes;
}

/*!
 * \brief Build an object from a stored record of its kind
 * \throw ValidationError if the record is of another kind
 */
template <ValidTransferObject T>
T toObject(const Record& record)
{
  if (record.getKind() != kindName<T>())
  {
    throw ValidationError("Cannot read a " + record.getKind() +
                          " record as " + kindName<T>());
  }

  T object;
  object.id = record.getId();

  boost::mp11::mp_for_each<boost::describe::describe_members<
    T,
    boost::describe::mod_inherited | boost::describe::mod_public>>(
    [&](auto D)
    {
      using memberType = std::remove_cv_t<
        std::remove_reference_t<decltype(std::declval<T>().*D.pointer)>>;

      if (std::string(D.name) == "id")
      {
        return;
      }

      auto& member = object.*D.pointer;
      const std::string name = attributeName<memberType>(D.name);

      if constexpr (IsForeignKey<memberType>)
      {
        AttributeValue value = record.get(name);
        member = isNull(value) ? 0u
                               : static_cast<uint32_t>(std::get<int64_t>(value));
      }
      else if constexpr (isBool<memberType>)
      {
        member = record.getAs<bool>(name);
      }
      else if constexpr (isIntegral<memberType>)
      {
        member = static_cast<memberType>(record.getAs<int64_t>(name));
      }
      else if constexpr (floatingPoint<memberType>)
      {
        member = static_cast<memberType>(toDouble(record.get(name)));
      }
      else if constexpr (isString<memberType>)
      {
        member = record.getAs<std::string>(name);
      }
    });

  return object;
}

template <ValidTransferObject T>
std::vector<T> toObjects(const RecordSet& records)
{
  std::vector<T> objects;
  objects.reserve(records.size());
  for (const auto& record : records)
  {
    objects.push_back(toObject<T>(record));
  }
  return objects;
}

// --- Typed access to a Database ---

template <ValidTransferObject T>
void defineKindOf(Database& db)
{
  db.defineKind(describeKind<T>());
}

/*!
 * \brief Insert an object, writing the assigned id back into it
 */
template <ValidTransferObject T>
Record insertObject(Database& db, T& object)
{
  Record record = db.insert(kindName<T>(), toAttributes(object));
  object.id = record.getId();
  return record;
}

/*!
 * \throw NotFoundError
 */
template <ValidTransferObject T>
T getObject(Database& db, uint32_t id)
{
  return toObject<T>(db.get(kindName<T>(), id));
}

template <ValidTransferObject T>
std::optional<T> findObject(Database& db, uint32_t id)
{
  auto record = db.find(kindName<T>(), id);
  if (!record)
  {
    return std::nullopt;
  }
  return toObject<T>(*record);
}

template <ValidTransferObject T>
std::vector<T> allObjects(Database& db)
{
  return toObjects<T>(db.all(kindName<T>()));
}

// Implementation of ForeignKey::resolve() (needs Database definition)
template <ValidTransferObject T>
std::optional<std::reference_wrapper<const T>> ForeignKey<T>::resolve(
  Database& db)
{
  if (!isSet())
  {
    return std::nullopt;
  }

  if (!data_ || data_->id != id)
  {
    data_ = findObject<T>(db, id);
  }

  if (!data_)
  {
    return std::nullopt;
  }
  return std::cref(*data_);
}

}  // namespace cpp_relate

#endif  // DB_TRANSFER_OBJECT_HPP
