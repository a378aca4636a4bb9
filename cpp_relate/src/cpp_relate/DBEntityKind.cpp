#include "cpp_relate/src/cpp_relate/DBEntityKind.hpp"

#include <boost/unordered_set.hpp>

#include "cpp_relate/src/cpp_relate/DBErrors.hpp"
#include "cpp_relate/src/utils/StringUtils.hpp"

namespace cpp_relate
{

const AttributeDefinition* EntityKind::findAttribute(
  const std::string& attributeName) const
{
  for (const auto& attribute : attributes)
  {
    if (attribute.name == attributeName)
    {
      return &attribute;
    }
  }
  return nullptr;
}

bool EntityKind::hasAttribute(const std::string& attributeName) const
{
  return attributeName == "id" || findAttribute(attributeName) != nullptr;
}

void EntityKind::validate() const
{
  if (!isIdentifier(name))
  {
    throw ValidationError("Invalid entity kind name '" + name + "'");
  }

  boost::unordered_set<std::string> seen;
  for (const auto& attribute : attributes)
  {
    if (!isIdentifier(attribute.name))
    {
      throw ValidationError("Invalid attribute name '" + attribute.name +
                            "' on " + name);
    }
    if (attribute.name == "id")
    {
      throw ValidationError("Attribute 'id' is reserved on " + name);
    }
    if (!seen.insert(attribute.name).second)
    {
      throw ValidationError("Duplicate attribute '" + attribute.name +
                            "' on " + name);
    }
  }
}

AttributeMap EntityKind::normalize(const AttributeMap& supplied) const
{
  for (const auto& [attributeName, value] : supplied)
  {
    if (findAttribute(attributeName) == nullptr)
    {
      throw ValidationError("Unknown attribute '" + attributeName + "' for " +
                            name);
    }
  }

  AttributeMap result;
  for (const auto& attribute : attributes)
  {
    auto it = supplied.find(attribute.name);
    AttributeValue value =
      it == supplied.end() ? AttributeValue{} : it->second;

    if (isNull(value))
    {
      if (attribute.required)
      {
        throw ValidationError("Missing required attribute '" +
                              attribute.name + "' for " + name);
      }
    }
    else if (!matchesType(value, attribute.type))
    {
      throw ValidationError("Attribute '" + attribute.name + "' of " + name +
                            " expects " + toString(attribute.type) +
                            ", got " + toString(value));
    }

    result.emplace(attribute.name, coerceToType(value, attribute.type));
  }
  return result;
}

}  // namespace cpp_relate
