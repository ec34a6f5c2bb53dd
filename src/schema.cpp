#include "schema.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include <kj/debug.h>
#include <cctype>
#include <set>

namespace asterism
{

  SchemaEntry::SchemaEntry(Connection &conn, TypeDescriptor desc, IndexHandle index)
      : conn_(&conn), desc_(std::move(desc)), index_(std::move(index)) {}

  const PropertyDescriptor *SchemaEntry::findProperty(const std::string &name) const
  {
    for (const auto &p : desc_.properties)
    {
      if (p.name() == name)
        return &p;
    }
    return nullptr;
  }

  const PropertyDescriptor &SchemaEntry::getProperty(const std::string &name) const
  {
    const auto *p = findProperty(name);
    if (!p)
      throw NoSuchProperty(desc_.name, name);
    return *p;
  }

  const RelationshipDefinition &SchemaEntry::getRelationship(const std::string &name) const
  {
    for (const auto &r : desc_.relationships)
    {
      if (r.name == name)
        return r;
    }
    throw SchemaError(desc_.name + " has no relationship '" + name + "'");
  }

  std::string SchemaEntry::categoryRelation() const
  {
    std::string out = desc_.name;
    for (auto &c : out)
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
  }

  const SchemaEntry &SchemaRegistry::define(TypeDescriptor desc)
  {
    if (desc.name.empty())
      throw SchemaError("type name must not be empty");
    if (desc.name == Connection::kCategoryIndex)
      throw SchemaError("type name " + desc.name + " is reserved for category anchors");
    if (entries_.count(desc.name))
      throw SchemaError("type " + desc.name + " is already registered");

    std::set<std::string> names;
    for (const auto &p : desc.properties)
    {
      if (!names.insert(p.name()).second)
        throw SchemaError(desc.name + ": duplicate property '" + p.name() + "'");
    }
    for (const auto &r : desc.relationships)
    {
      if (r.name.empty() || r.relationType.empty() || r.targetType.empty())
        throw SchemaError(desc.name + ": relationship needs a name, a relation type and a target type");
      if (!names.insert(r.name).second)
        throw SchemaError(desc.name + " already has attribute '" + r.name + "'");
    }

    auto index = IndexHandle::open(conn_.client(), desc.name);
    auto name = desc.name;
    auto entry = std::make_unique<SchemaEntry>(conn_, std::move(desc), std::move(index));
    const auto &ref = *entry;
    entries_.emplace(name, std::move(entry));
    KJ_LOG(INFO, "registered type", name.c_str(), ref.index().id());
    return ref;
  }

  const SchemaEntry *SchemaRegistry::find(const std::string &typeName) const
  {
    auto it = entries_.find(typeName);
    return it == entries_.end() ? nullptr : it->second.get();
  }

  const SchemaEntry &SchemaRegistry::get(const std::string &typeName) const
  {
    const auto *e = find(typeName);
    if (!e)
      throw SchemaError("unknown type " + typeName);
    return *e;
  }

} // namespace asterism
