#include "cpp_relate/src/cpp_relate/DBRecord.hpp"

#include <utility>

namespace cpp_relate
{

Record::Record(std::string kind, uint32_t id, AttributeMap attributes)
  : kind_{std::move(kind)}, id_{id}, attributes_{std::move(attributes)}
{
}

AttributeValue Record::get(const std::string& attribute) const
{
  if (attribute == "id")
  {
    return static_cast<int64_t>(id_);
  }

  auto it = attributes_.find(attribute);
  if (it == attributes_.end())
  {
    throw ValidationError("Unknown attribute '" + attribute + "' for " +
                          kind_);
  }
  return it->second;
}

bool Record::isNull(const std::string& attribute) const
{
  return cpp_relate::isNull(get(attribute));
}

void Record::set(const std::string& attribute, AttributeValue value)
{
  auto it = attributes_.find(attribute);
  if (it == attributes_.end())
  {
    throw ValidationError("Unknown attribute '" + attribute + "' for " +
                          kind_);
  }
  it->second = std::move(value);
}

std::string Record::toString() const
{
  std::string result = kind_ + "#" + std::to_string(id_) + "{";
  bool first = true;
  for (const auto& [name, value] : attributes_)
  {
    if (!first)
      result += ", ";
    result += name + ": " + cpp_relate::toString(value);
    first = false;
  }
  result += "}";
  return result;
}

}  // namespace cpp_relate
