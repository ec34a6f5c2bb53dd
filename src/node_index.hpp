#pragma once
#include "node.hpp"
#include "query.hpp"
#include "schema.hpp"
#include <vector>

namespace asterism
{

  // Typed lookups through a mapped type's index.
  class NodeIndex
  {
  public:
    explicit NodeIndex(const SchemaEntry &entry) : entry_(entry) {}

    // Every term must name a declared (NoSuchProperty), indexed
    // (PropertyNotIndexed) property with a value of its kind (InvalidType).
    std::vector<MappedNode> search(const PropertyMap &terms) const;
    std::vector<MappedNode> search(const Query &q) const;

    // exactly one match, otherwise NotFound / MultipleResults
    MappedNode get(const PropertyMap &terms) const;
    MappedNode get(const Query &q) const;

  private:
    void check(const Query &q) const;

    const SchemaEntry &entry_;
  };

} // namespace asterism
