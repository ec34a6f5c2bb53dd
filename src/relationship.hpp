#pragma once
#include "schema.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace asterism
{

  class MappedNode;

  // Traverses and mutates one declared edge kind of its origin node and
  // caches related nodes in the order the store returned them, then in
  // relate() order.
  //
  // The cache is loaded by all() and grows with relate(); only unrelate()
  // removes entries. isRelated() answers true from the cache without asking
  // the store, so an edge deleted behind this manager's back still counts
  // until the entry is unrelated.
  class RelationshipManager
  {
  public:
    RelationshipManager(MappedNode &origin, const RelationshipDefinition &def);

    const RelationshipDefinition &definition() const { return *def_; }

    // Cached related nodes, loading them first when the cache is empty.
    std::vector<std::shared_ptr<MappedNode>> all();
    bool isRelated(const MappedNode &obj);
    // throws TypeMismatch / NodeNotPersisted; creates the edge only if missing
    void relate(const MappedNode &obj);
    // throws MultipleRelationships; no-op when no edge exists
    void unrelate(const MappedNode &obj);

    size_t cachedCount() const { return related_.size(); }

  private:
    friend class MappedNode;
    void rebind(MappedNode &origin) { origin_ = &origin; }

    StoreClient &client() const;
    uint64_t originId() const;
    void remember(std::shared_ptr<MappedNode> node);
    void forget(uint64_t id);

    MappedNode *origin_;
    const RelationshipDefinition *def_;
    std::vector<std::shared_ptr<MappedNode>> related_;
    std::map<uint64_t, size_t> positions_; // remote id -> index in related_
  };

} // namespace asterism
