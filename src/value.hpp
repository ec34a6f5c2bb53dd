#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace asterism
{

  // null, integer, float, boolean, text
  using Value = std::variant<std::monostate, int64_t, double, bool, std::string>;

  // property name -> value, as held by a mapped node and exchanged with the store client
  using PropertyMap = std::map<std::string, Value>;

  enum class Direction : uint8_t
  {
    Out = 0,
    In = 1,
    Both = 2
  };

  inline const char *valueTypeName(const Value &v)
  {
    switch (v.index())
    {
    case 1:
      return "integer";
    case 2:
      return "float";
    case 3:
      return "boolean";
    case 4:
      return "string";
    default:
      return "null";
    }
  }

  // Human readable rendering used in error messages and logs.
  inline std::string describeValue(const Value &v)
  {
    if (std::holds_alternative<int64_t>(v))
      return std::to_string(std::get<int64_t>(v));
    if (std::holds_alternative<double>(v))
      return std::to_string(std::get<double>(v));
    if (std::holds_alternative<bool>(v))
      return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<std::string>(v))
      return "\"" + std::get<std::string>(v) + "\"";
    return "null";
  }

} // namespace asterism
