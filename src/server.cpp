#include "server.hpp"
#include <kj/debug.h>

namespace asterism::rpc
{

  namespace
  {

    std::string toStd(capnp::Text::Reader t)
    {
      return std::string(t.cStr(), t.size());
    }

    kj::StringPtr toKj(const std::string &s)
    {
      return kj::StringPtr(s.c_str(), s.size());
    }

  } // namespace

  asterism::Value fromRpcValue(Value::Reader v)
  {
    switch (v.which())
    {
    case Value::I64:
      return static_cast<int64_t>(v.getI64());
    case Value::F64:
      return static_cast<double>(v.getF64());
    case Value::BOOLV:
      return static_cast<bool>(v.getBoolv());
    case Value::TEXT:
      return toStd(v.getText());
    case Value::NULLV:
    default:
      return std::monostate{};
    }
  }

  void toRpcValue(Value::Builder b, const asterism::Value &v)
  {
    if (std::holds_alternative<int64_t>(v))
    {
      b.setI64(std::get<int64_t>(v));
      return;
    }
    if (std::holds_alternative<double>(v))
    {
      b.setF64(std::get<double>(v));
      return;
    }
    if (std::holds_alternative<bool>(v))
    {
      b.setBoolv(std::get<bool>(v));
      return;
    }
    if (std::holds_alternative<std::string>(v))
    {
      b.setText(toKj(std::get<std::string>(v)));
      return;
    }
    b.setNullv();
  }

  asterism::PropertyMap fromRpcProps(capnp::List<Property>::Reader props)
  {
    asterism::PropertyMap out;
    for (auto p : props)
      out[toStd(p.getKey())] = fromRpcValue(p.getVal());
    return out;
  }

  void toRpcProps(capnp::List<Property>::Builder b, const asterism::PropertyMap &props)
  {
    uint32_t i = 0;
    for (const auto &[name, val] : props)
    {
      auto p = b[i++];
      p.setKey(toKj(name));
      toRpcValue(p.initVal(), val);
    }
  }

  asterism::Direction fromRpcDirection(Direction d)
  {
    switch (d)
    {
    case Direction::OUT:
      return asterism::Direction::Out;
    case Direction::IN:
      return asterism::Direction::In;
    case Direction::BOTH:
    default:
      return asterism::Direction::Both;
    }
  }

  Direction toRpcDirection(asterism::Direction d)
  {
    switch (d)
    {
    case asterism::Direction::Out:
      return Direction::OUT;
    case asterism::Direction::In:
      return Direction::IN;
    case asterism::Direction::Both:
    default:
      return Direction::BOTH;
    }
  }

  asterism::NodeData fromRpcNode(NodeRecord::Reader n)
  {
    asterism::NodeData out{};
    out.id = n.getId();
    out.props = fromRpcProps(n.getProps());
    return out;
  }

  void toRpcNode(NodeRecord::Builder b, const asterism::NodeData &n)
  {
    b.setId(n.id);
    toRpcProps(b.initProps(n.props.size()), n.props);
  }

  asterism::Relationship fromRpcEdge(EdgeRef::Reader e)
  {
    return asterism::Relationship{e.getId(), e.getSrc(), e.getDst(), toStd(e.getType())};
  }

  void toRpcEdge(EdgeRef::Builder b, const asterism::Relationship &e)
  {
    b.setId(e.id);
    b.setSrc(e.src);
    b.setDst(e.dst);
    b.setType(toKj(e.type));
  }

  asterism::EdgeFilter fromRpcFilter(ListEdgesParams::Reader p)
  {
    asterism::EdgeFilter out{};
    out.node = p.getNode();
    out.direction = fromRpcDirection(p.getDirection());
    out.type = toStd(p.getType());
    out.other = p.getOther();
    out.limit = p.getLimit();
    return out;
  }

  void toRpcFilter(ListEdgesParams::Builder b, const asterism::EdgeFilter &f)
  {
    b.setNode(f.node);
    b.setDirection(toRpcDirection(f.direction));
    b.setType(toKj(f.type));
    b.setOther(f.other);
    b.setLimit(f.limit);
  }

  GraphStoreImpl::GraphStoreImpl(asterism::StoreClient &client) : client_(client) {}

  kj::Promise<void> GraphStoreImpl::createNode(CreateNodeContext ctx)
  {
    auto params = ctx.getParams().getParams();

    std::optional<asterism::NodeLink> link;
    auto l = params.getLink();
    if (l.which() == CreateNodeParams::Link::EDGE)
    {
      auto e = l.getEdge();
      link = asterism::NodeLink{e.getOther(), toStd(e.getType()), fromRpcDirection(e.getDirection())};
    }

    auto created = client_.createNode(fromRpcProps(params.getProps()), link);

    auto out = ctx.getResults().initResult();
    toRpcNode(out.initNode(), created.node);
    auto edge = out.initEdge();
    if (created.edge)
      toRpcEdge(edge.initRef(), *created.edge);
    else
      edge.setNone();
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::setNodeProps(SetNodePropsContext ctx)
  {
    auto p = ctx.getParams();
    client_.setProperties(p.getId(), fromRpcProps(p.getProps()));
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::getNode(GetNodeContext ctx)
  {
    auto node = client_.getNode(ctx.getParams().getId());
    toRpcNode(ctx.getResults().initNode(), node);
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::deleteEntities(DeleteEntitiesContext ctx)
  {
    auto p = ctx.getParams();
    std::vector<uint64_t> nodes;
    std::vector<uint64_t> edges;
    for (auto id : p.getNodeIds())
      nodes.push_back(id);
    for (auto id : p.getEdgeIds())
      edges.push_back(id);
    client_.deleteEntities(nodes, edges);
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::listEdges(ListEdgesContext ctx)
  {
    auto edges = client_.listEdges(fromRpcFilter(ctx.getParams().getParams()));
    auto out = ctx.getResults().initEdges(edges.size());
    for (uint32_t i = 0; i < edges.size(); ++i)
      toRpcEdge(out[i], edges[i]);
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::relatedNodes(RelatedNodesContext ctx)
  {
    auto nodes = client_.relatedNodes(fromRpcFilter(ctx.getParams().getParams()));
    auto out = ctx.getResults().initNodes(nodes.size());
    for (uint32_t i = 0; i < nodes.size(); ++i)
      toRpcNode(out[i], nodes[i]);
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::getOrCreateEdge(GetOrCreateEdgeContext ctx)
  {
    auto p = ctx.getParams();
    auto edge = client_.getOrCreateRelationship(p.getSrc(), toStd(p.getType()), p.getDst());
    toRpcEdge(ctx.getResults().initEdge(), edge);
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::getOrCreateIndex(GetOrCreateIndexContext ctx)
  {
    auto id = client_.getOrCreateIndex(toStd(ctx.getParams().getName()));
    ctx.getResults().setIndexId(id);
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::applyIndexBatch(ApplyIndexBatchContext ctx)
  {
    auto p = ctx.getParams();
    std::vector<asterism::IndexEntryOp> ops;
    auto rpcOps = p.getOps();
    ops.reserve(rpcOps.size());
    for (auto op : rpcOps)
    {
      asterism::IndexEntryOp in{};
      in.kind = op.getKind() == IndexOpKind::INSERT_IF_ABSENT ? asterism::IndexOpKind::InsertIfAbsent
                                                              : asterism::IndexOpKind::Insert;
      in.key = toStd(op.getKey());
      in.val = fromRpcValue(op.getVal());
      in.node = op.getNode();
      ops.push_back(std::move(in));
    }

    auto statuses = client_.applyIndexBatch(p.getIndexId(), ops);

    auto out = ctx.getResults().initStatuses(statuses.size());
    for (uint32_t i = 0; i < statuses.size(); ++i)
      out.set(i, statuses[i] == asterism::IndexOpStatus::Exists ? IndexOpStatus::EXISTS : IndexOpStatus::INSERTED);
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::removeFromIndex(RemoveFromIndexContext ctx)
  {
    auto p = ctx.getParams();
    client_.removeFromIndex(p.getIndexId(), p.getNode());
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::queryIndex(QueryIndexContext ctx)
  {
    auto p = ctx.getParams();
    auto nodes = client_.queryIndex(p.getIndexId(), toStd(p.getExpression()));
    auto out = ctx.getResults().initNodes(nodes.size());
    for (uint32_t i = 0; i < nodes.size(); ++i)
      toRpcNode(out[i], nodes[i]);
    return kj::READY_NOW;
  }

  kj::Promise<void> GraphStoreImpl::getOrCreateIndexedNode(GetOrCreateIndexedNodeContext ctx)
  {
    auto p = ctx.getParams();
    auto res = client_.getOrCreateIndexedNode(p.getIndexId(), toStd(p.getKey()), fromRpcValue(p.getVal()),
                                              fromRpcProps(p.getProps()));
    auto results = ctx.getResults();
    toRpcNode(results.initNode(), res.node);
    results.setCreated(res.created);
    if (res.created)
      KJ_LOG(INFO, "created indexed node", p.getIndexId(), res.node.id);
    return kj::READY_NOW;
  }

} // namespace asterism::rpc
