#pragma once
#include "client.hpp"
#include "schema.hpp"
#include "value.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace asterism
{

  class RelationshipManager;

  // Typed, schema-validated view of one store node.
  //
  // A node starts transient (no remote id), becomes persisted on save() and
  // goes back to transient on remove(). Every held property value has passed
  // its descriptor's validate(). The node owns one relationship manager per
  // relationship declared on its type.
  class MappedNode
  {
  public:
    // throws NoSuchProperty / InvalidType before assigning anything
    explicit MappedNode(const SchemaEntry &entry, PropertyMap props = {});
    ~MappedNode();

    // Copies carry properties and identity but start with empty caches.
    MappedNode(const MappedNode &other);
    MappedNode &operator=(const MappedNode &other);
    MappedNode(MappedNode &&other) noexcept;
    MappedNode &operator=(MappedNode &&other) noexcept;

    // Node of entry's type with identity and properties read from the store.
    static MappedNode inflate(const SchemaEntry &entry, const NodeData &data);

    const SchemaEntry &schema() const { return *entry_; }
    const std::string &typeName() const { return entry_->typeName(); }

    std::optional<uint64_t> remoteId() const { return remoteId_; }
    bool persisted() const { return remoteId_.has_value(); }
    // throws NodeNotPersisted when transient
    uint64_t id() const;

    const PropertyMap &properties() const { return props_; }
    // null when declared but never set; throws NoSuchProperty when undeclared
    const Value &get(const std::string &name) const;
    // revalidates; the node is unchanged when this throws
    void set(const std::string &name, Value val);

    // Creates or updates the store node and refreshes the type index.
    // Throws NotUnique when a unique value is taken; a first save is rolled
    // back in that case.
    MappedNode &save();
    // Deletes the node and its relationships; throws NodeNotPersisted.
    void remove();

    // throws SchemaError for an undeclared relationship
    RelationshipManager &rel(const std::string &name);

  private:
    void buildManagers();
    void rebindManagers();
    void create();
    // first unique conflict, if any
    std::optional<std::string> updateIndex();

    const SchemaEntry *entry_;
    std::optional<uint64_t> remoteId_;
    PropertyMap props_;
    std::map<std::string, std::unique_ptr<RelationshipManager>> managers_;
  };

} // namespace asterism
