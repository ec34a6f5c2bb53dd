#include "property.hpp"
#include "errors.hpp"

namespace asterism
{

  namespace
  {

    // names double as query keys
    bool validName(const std::string &name)
    {
      if (name.empty())
        return false;
      char c0 = name.front();
      if (!((c0 >= 'a' && c0 <= 'z') || (c0 >= 'A' && c0 <= 'Z') || c0 == '_'))
        return false;
      for (char c : name)
      {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        if (!ok)
          return false;
      }
      return true;
    }

  } // namespace

  const char *kindName(PropertyKind kind)
  {
    switch (kind)
    {
    case PropertyKind::String:
      return "string";
    case PropertyKind::Integer:
      return "integer";
    case PropertyKind::Float:
      return "float";
    case PropertyKind::Boolean:
      return "boolean";
    }
    return "unknown";
  }

  PropertyDescriptor::PropertyDescriptor(std::string name, PropertyKind kind, PropertyOptions opts)
      : name_(std::move(name)), kind_(kind), blank_(opts.blank)
  {
    if (!validName(name_))
      throw SchemaError("invalid property name '" + name_ + "'");
    if (opts.uniqueIndex && opts.index)
      throw SchemaError("property '" + name_ + "': unique_index and index are mutually exclusive");
    if (opts.uniqueIndex && opts.blank)
      throw SchemaError("property '" + name_ + "': uniquely indexed properties cannot also be blank");
    if (opts.uniqueIndex)
      indexing_ = Indexing::UniqueIndex;
    else if (opts.index)
      indexing_ = Indexing::Index;
  }

  void PropertyDescriptor::validate(const Value &v) const
  {
    bool ok = false;
    switch (kind_)
    {
    case PropertyKind::String:
      ok = std::holds_alternative<std::string>(v);
      break;
    case PropertyKind::Integer:
      ok = std::holds_alternative<int64_t>(v);
      break;
    case PropertyKind::Float:
      ok = std::holds_alternative<double>(v);
      break;
    case PropertyKind::Boolean:
      ok = std::holds_alternative<bool>(v);
      break;
    }
    if (!ok && blank_ && std::holds_alternative<std::monostate>(v))
      ok = true;
    if (!ok)
      throw InvalidType(name_, kindName(kind_), v);
  }

} // namespace asterism
