#pragma once
#include "index.hpp"
#include "property.hpp"
#include "value.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace asterism
{

  class Connection;

  enum class ManagerFlavor : uint8_t
  {
    Cached = 0
  };

  // Declared edge kind of a mapped type. Direction is seen from the owning
  // node: Out means owner -> target, In means target -> owner, Both matches
  // either way.
  struct RelationshipDefinition
  {
    std::string name{};
    std::string relationType{};
    Direction direction{Direction::Out};
    std::string targetType{};
    ManagerFlavor flavor{ManagerFlavor::Cached};
  };

  struct TypeDescriptor
  {
    std::string name{};
    std::vector<PropertyDescriptor> properties{};
    std::vector<RelationshipDefinition> relationships{};
  };

  // Registered type; immutable once built by SchemaRegistry::define.
  class SchemaEntry
  {
  public:
    SchemaEntry(Connection &conn, TypeDescriptor desc, IndexHandle index);

    const std::string &typeName() const { return desc_.name; }
    const std::vector<PropertyDescriptor> &properties() const { return desc_.properties; }
    const std::vector<RelationshipDefinition> &relationships() const { return desc_.relationships; }
    const IndexHandle &index() const { return index_; }
    Connection &connection() const { return *conn_; }

    // throws NoSuchProperty
    const PropertyDescriptor &getProperty(const std::string &name) const;
    const PropertyDescriptor *findProperty(const std::string &name) const;
    // throws SchemaError
    const RelationshipDefinition &getRelationship(const std::string &name) const;

    // label of the edge from the type's category anchor to each instance
    std::string categoryRelation() const;

  private:
    Connection *conn_;
    TypeDescriptor desc_;
    IndexHandle index_;
  };

  class SchemaRegistry
  {
  public:
    explicit SchemaRegistry(Connection &conn) : conn_(conn) {}

    // Validates the declaration, opens the type's index (named after the
    // type) and registers it. Throws SchemaError on any conflict.
    const SchemaEntry &define(TypeDescriptor desc);

    // throws SchemaError for an unknown type
    const SchemaEntry &get(const std::string &typeName) const;
    const SchemaEntry *find(const std::string &typeName) const;
    bool contains(const std::string &typeName) const { return find(typeName) != nullptr; }
    size_t size() const { return entries_.size(); }

  private:
    Connection &conn_;
    std::map<std::string, std::unique_ptr<SchemaEntry>> entries_;
  };

} // namespace asterism
