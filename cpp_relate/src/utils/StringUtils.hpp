#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace cpp_relate
{

/*!
 * \brief Strip namespace prefix from a type name
 *
 * Converts "namespace::TypeName" to "TypeName"
 * Handles nested namespaces: "outer::inner::TypeName" -> "TypeName"
 * If no namespace exists, returns the original name unchanged
 *
 * \param fullTypeName The full type name (e.g., from boost::typeindex)
 * \return Type name without namespace prefix
 */
inline std::string stripNamespace(std::string_view fullTypeName)
{
  auto pos = fullTypeName.rfind("::");

  if (pos == std::string_view::npos)
  {
    return std::string(fullTypeName);
  }

  return std::string(fullTypeName.substr(pos + 2));
}

/*!
 * \brief Check that a kind or attribute name is a plain identifier
 *        ([A-Za-z_][A-Za-z0-9_]*), which makes it safe to splice into SQL.
 */
inline bool isIdentifier(std::string_view name)
{
  if (name.empty())
  {
    return false;
  }

  auto first = static_cast<unsigned char>(name.front());
  if (!std::isalpha(first) && first != '_')
  {
    return false;
  }

  for (char c : name.substr(1))
  {
    auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && uc != '_')
    {
      return false;
    }
  }
  return true;
}

//! Wrap an identifier in SQL double quotes
inline std::string quoteIdentifier(std::string_view name)
{
  return "\"" + std::string(name) + "\"";
}

//! Join strings with a separator
inline std::string joinStrings(const std::vector<std::string>& parts,
                               std::string_view separator)
{
  std::string result;
  bool first = true;
  for (const auto& part : parts)
  {
    if (!first)
      result += separator;
    result += part;
    first = false;
  }
  return result;
}

}  // namespace cpp_relate

#endif  // STRING_UTILS_HPP
