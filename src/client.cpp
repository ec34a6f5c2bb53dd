#include "client.hpp"
#include "query.hpp"
#include <kj/debug.h>

namespace asterism
{

  // -------------------- StoreClient conveniences --------------------

  PropertyMap StoreClient::getProperties(uint64_t node)
  {
    return getNode(node).props;
  }

  std::vector<NodeData> StoreClient::getRelatedNodes(uint64_t node, Direction direction, const std::string &type)
  {
    EdgeFilter f{};
    f.node = node;
    f.direction = direction;
    f.type = type;
    return relatedNodes(f);
  }

  bool StoreClient::hasRelationshipWith(uint64_t node, uint64_t other, Direction direction, const std::string &type)
  {
    EdgeFilter f{};
    f.node = node;
    f.direction = direction;
    f.type = type;
    f.other = other;
    f.limit = 1;
    return !listEdges(f).empty();
  }

  std::vector<Relationship> StoreClient::getRelationshipsWith(uint64_t node, uint64_t other, Direction direction,
                                                              const std::string &type)
  {
    EdgeFilter f{};
    f.node = node;
    f.direction = direction;
    f.type = type;
    f.other = other;
    return listEdges(f);
  }

  std::vector<Relationship> StoreClient::getRelationships(uint64_t node)
  {
    EdgeFilter f{};
    f.node = node;
    f.direction = Direction::Both;
    return listEdges(f);
  }

  // -------------------- LocalStoreClient --------------------

  namespace
  {
    std::unique_ptr<Env> openEnv(const std::filesystem::path &dir, size_t mapSizeBytes)
    {
      std::filesystem::create_directories(dir);
      return std::make_unique<Env>(dir, mapSizeBytes);
    }
  } // namespace

  LocalStoreClient::LocalStoreClient(Store &store) : store_(store) {}

  LocalStoreClient::LocalStoreClient(const std::filesystem::path &dir, size_t mapSizeBytes)
      : ownedEnv_(openEnv(dir, mapSizeBytes)),
        ownedStore_(std::make_unique<Store>(*ownedEnv_)),
        store_(*ownedStore_)
  {
    KJ_LOG(INFO, "opened embedded store", dir.c_str());
  }

  std::vector<Property> LocalStoreClient::toStoreProps(const PropertyMap &props)
  {
    std::vector<Property> out;
    out.reserve(props.size());
    for (const auto &[name, val] : props)
      out.push_back(Property{store_.getOrCreatePropKeyId(GetOrCreatePropKeyIdParams{name, true}), val});
    return out;
  }

  NodeData LocalStoreClient::fromStoreNode(const NodeRecord &n)
  {
    NodeData out{};
    out.id = n.id;
    for (const auto &p : n.props)
      out.props.emplace(store_.getPropKeyName(p.keyId), p.val);
    return out;
  }

  Relationship LocalStoreClient::fromStoreEdge(const EdgeRef &e)
  {
    return Relationship{e.id, e.src, e.dst, store_.getRelTypeName(e.typeId)};
  }

  // nullopt when the filter names a type the store has never seen
  std::optional<ListEdgesParams> LocalStoreClient::toStoreFilter(const EdgeFilter &filter)
  {
    ListEdgesParams p{};
    p.node = filter.node;
    p.direction = filter.direction;
    p.other = filter.other;
    p.limit = filter.limit;
    if (!filter.type.empty())
    {
      auto typeId = store_.findRelTypeId(filter.type);
      if (!typeId)
        return std::nullopt;
      p.typeId = *typeId;
    }
    return p;
  }

  CreatedNode LocalStoreClient::createNode(const PropertyMap &props, const std::optional<NodeLink> &link)
  {
    CreateNodeParams in{};
    in.props = toStoreProps(props);
    if (link)
    {
      EdgeLink l{};
      l.other = link->other;
      l.typeId = store_.getOrCreateRelTypeId(GetOrCreateRelTypeIdParams{link->type, true});
      l.direction = link->direction;
      in.link = l;
    }
    auto res = store_.createNode(in);
    CreatedNode out{};
    out.node = fromStoreNode(res.node);
    if (res.edge)
      out.edge = fromStoreEdge(*res.edge);
    return out;
  }

  void LocalStoreClient::setProperties(uint64_t node, const PropertyMap &props)
  {
    store_.setNodeProps(SetNodePropsParams{node, toStoreProps(props)});
  }

  NodeData LocalStoreClient::getNode(uint64_t node)
  {
    return fromStoreNode(store_.getNode(GetNodeParams{node}));
  }

  void LocalStoreClient::deleteEntities(const std::vector<uint64_t> &nodes, const std::vector<uint64_t> &edges)
  {
    store_.deleteEntities(DeleteEntitiesParams{nodes, edges});
  }

  std::vector<Relationship> LocalStoreClient::listEdges(const EdgeFilter &filter)
  {
    std::vector<Relationship> out;
    auto p = toStoreFilter(filter);
    if (!p)
      return out;
    for (const auto &e : store_.listEdges(*p).edges)
      out.push_back(fromStoreEdge(e));
    return out;
  }

  std::vector<NodeData> LocalStoreClient::relatedNodes(const EdgeFilter &filter)
  {
    std::vector<NodeData> out;
    auto p = toStoreFilter(filter);
    if (!p)
      return out;
    for (const auto &n : store_.relatedNodes(*p).nodes)
      out.push_back(fromStoreNode(n));
    return out;
  }

  Relationship LocalStoreClient::getOrCreateRelationship(uint64_t src, const std::string &type, uint64_t dst)
  {
    AddEdgeParams in{};
    in.src = src;
    in.dst = dst;
    in.typeId = store_.getOrCreateRelTypeId(GetOrCreateRelTypeIdParams{type, true});
    return fromStoreEdge(store_.getOrCreateEdge(in).edge);
  }

  uint32_t LocalStoreClient::getOrCreateIndex(const std::string &name)
  {
    return store_.getOrCreateIndexId(GetOrCreateIndexIdParams{name, true});
  }

  std::vector<IndexOpStatus> LocalStoreClient::applyIndexBatch(uint32_t indexId, const std::vector<IndexEntryOp> &ops)
  {
    IndexBatchParams in{};
    in.indexId = indexId;
    in.ops.reserve(ops.size());
    for (const auto &op : ops)
      in.ops.push_back(IndexOp{op.kind, store_.getOrCreatePropKeyId(GetOrCreatePropKeyIdParams{op.key, true}), op.val, op.node});
    return store_.applyIndexBatch(in).statuses;
  }

  void LocalStoreClient::removeFromIndex(uint32_t indexId, uint64_t node)
  {
    store_.removeFromIndex(RemoveFromIndexParams{indexId, node});
  }

  std::vector<NodeData> LocalStoreClient::queryIndex(uint32_t indexId, const std::string &expression)
  {
    std::vector<NodeData> out;
    QueryIndexParams in{};
    in.indexId = indexId;
    for (auto &t : parseQuery(expression))
    {
      auto keyId = store_.findPropKeyId(t.key);
      if (!keyId)
        return out; // key never indexed, nothing can match
      in.terms.push_back(IndexTerm{*keyId, std::move(t.val)});
    }
    auto ids = store_.queryIndex(in).nodeIds;
    for (const auto &n : store_.getNodes(ids))
      out.push_back(fromStoreNode(n));
    return out;
  }

  IndexedNode LocalStoreClient::getOrCreateIndexedNode(uint32_t indexId, const std::string &key, const Value &val,
                                                       const PropertyMap &props)
  {
    GetOrCreateIndexedNodeParams in{};
    in.indexId = indexId;
    in.keyId = store_.getOrCreatePropKeyId(GetOrCreatePropKeyIdParams{key, true});
    in.val = val;
    in.props = toStoreProps(props);
    auto res = store_.getOrCreateIndexedNode(in);
    return IndexedNode{fromStoreNode(res.node), res.created};
  }

} // namespace asterism
