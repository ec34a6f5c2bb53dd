#include "node_index.hpp"
#include "errors.hpp"

namespace asterism
{

  namespace
  {

    Query toQuery(const SchemaEntry &entry, const PropertyMap &terms)
    {
      Query q;
      for (const auto &[name, val] : terms)
      {
        entry.getProperty(name);
        q &= Query(name, val);
      }
      return q;
    }

  } // namespace

  void NodeIndex::check(const Query &q) const
  {
    if (q.empty())
      throw QueryError("empty query on " + entry_.typeName());
    for (const auto &t : q.terms())
    {
      const auto &p = entry_.getProperty(t.key);
      if (!p.isIndexed())
        throw PropertyNotIndexed(t.key);
      p.validate(t.val);
    }
  }

  std::vector<MappedNode> NodeIndex::search(const PropertyMap &terms) const
  {
    return search(toQuery(entry_, terms));
  }

  std::vector<MappedNode> NodeIndex::search(const Query &q) const
  {
    check(q);
    std::vector<MappedNode> out;
    for (const auto &n : entry_.index().query(q))
      out.push_back(MappedNode::inflate(entry_, n));
    return out;
  }

  MappedNode NodeIndex::get(const PropertyMap &terms) const
  {
    return get(toQuery(entry_, terms));
  }

  MappedNode NodeIndex::get(const Query &q) const
  {
    auto nodes = search(q);
    if (nodes.empty())
      throw NotFound(q.str());
    if (nodes.size() > 1)
      throw MultipleResults(q.str(), nodes.size());
    return std::move(nodes.front());
  }

} // namespace asterism
