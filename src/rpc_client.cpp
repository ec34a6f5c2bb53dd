#include "rpc_client.hpp"
#include "server.hpp"
#include <kj/debug.h>

namespace asterism
{

  RpcStoreClient::RpcStoreClient(const std::string &bind)
      : client_(bind.c_str()), cap_(client_.getMain<rpc::GraphStore>())
  {
    KJ_LOG(INFO, "connected to graph store", bind.c_str());
  }

  CreatedNode RpcStoreClient::createNode(const PropertyMap &props, const std::optional<NodeLink> &link)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.createNodeRequest();
    auto p = req.initParams();
    rpc::toRpcProps(p.initProps(props.size()), props);
    auto l = p.initLink();
    if (link)
    {
      auto e = l.initEdge();
      e.setOther(link->other);
      e.setType(kj::StringPtr(link->type.c_str(), link->type.size()));
      e.setDirection(rpc::toRpcDirection(link->direction));
    }
    else
    {
      l.setNone();
    }

    auto resp = req.send().wait(ws);
    auto r = resp.getResult();
    CreatedNode out{};
    out.node = rpc::fromRpcNode(r.getNode());
    auto edge = r.getEdge();
    if (edge.which() == rpc::CreateNodeResult::Edge::REF)
      out.edge = rpc::fromRpcEdge(edge.getRef());
    return out;
  }

  void RpcStoreClient::setProperties(uint64_t node, const PropertyMap &props)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.setNodePropsRequest();
    req.setId(node);
    rpc::toRpcProps(req.initProps(props.size()), props);
    req.send().wait(ws);
  }

  NodeData RpcStoreClient::getNode(uint64_t node)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.getNodeRequest();
    req.setId(node);
    auto resp = req.send().wait(ws);
    return rpc::fromRpcNode(resp.getNode());
  }

  void RpcStoreClient::deleteEntities(const std::vector<uint64_t> &nodes, const std::vector<uint64_t> &edges)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.deleteEntitiesRequest();
    auto n = req.initNodeIds(nodes.size());
    for (uint32_t i = 0; i < nodes.size(); ++i)
      n.set(i, nodes[i]);
    auto e = req.initEdgeIds(edges.size());
    for (uint32_t i = 0; i < edges.size(); ++i)
      e.set(i, edges[i]);
    req.send().wait(ws);
  }

  std::vector<Relationship> RpcStoreClient::listEdges(const EdgeFilter &filter)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.listEdgesRequest();
    rpc::toRpcFilter(req.initParams(), filter);
    auto resp = req.send().wait(ws);
    std::vector<Relationship> out;
    for (auto e : resp.getEdges())
      out.push_back(rpc::fromRpcEdge(e));
    return out;
  }

  std::vector<NodeData> RpcStoreClient::relatedNodes(const EdgeFilter &filter)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.relatedNodesRequest();
    rpc::toRpcFilter(req.initParams(), filter);
    auto resp = req.send().wait(ws);
    std::vector<NodeData> out;
    for (auto n : resp.getNodes())
      out.push_back(rpc::fromRpcNode(n));
    return out;
  }

  Relationship RpcStoreClient::getOrCreateRelationship(uint64_t src, const std::string &type, uint64_t dst)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.getOrCreateEdgeRequest();
    req.setSrc(src);
    req.setType(kj::StringPtr(type.c_str(), type.size()));
    req.setDst(dst);
    auto resp = req.send().wait(ws);
    return rpc::fromRpcEdge(resp.getEdge());
  }

  uint32_t RpcStoreClient::getOrCreateIndex(const std::string &name)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.getOrCreateIndexRequest();
    req.setName(kj::StringPtr(name.c_str(), name.size()));
    return req.send().wait(ws).getIndexId();
  }

  std::vector<IndexOpStatus> RpcStoreClient::applyIndexBatch(uint32_t indexId, const std::vector<IndexEntryOp> &ops)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.applyIndexBatchRequest();
    req.setIndexId(indexId);
    auto list = req.initOps(ops.size());
    for (uint32_t i = 0; i < ops.size(); ++i)
    {
      auto b = list[i];
      b.setKind(ops[i].kind == IndexOpKind::InsertIfAbsent ? rpc::IndexOpKind::INSERT_IF_ABSENT
                                                           : rpc::IndexOpKind::INSERT);
      b.setKey(kj::StringPtr(ops[i].key.c_str(), ops[i].key.size()));
      rpc::toRpcValue(b.initVal(), ops[i].val);
      b.setNode(ops[i].node);
    }

    auto resp = req.send().wait(ws);
    std::vector<IndexOpStatus> out;
    for (auto s : resp.getStatuses())
      out.push_back(s == rpc::IndexOpStatus::EXISTS ? IndexOpStatus::Exists : IndexOpStatus::Inserted);
    KJ_REQUIRE(out.size() == ops.size(), "index batch status count mismatch", out.size(), ops.size());
    return out;
  }

  void RpcStoreClient::removeFromIndex(uint32_t indexId, uint64_t node)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.removeFromIndexRequest();
    req.setIndexId(indexId);
    req.setNode(node);
    req.send().wait(ws);
  }

  std::vector<NodeData> RpcStoreClient::queryIndex(uint32_t indexId, const std::string &expression)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.queryIndexRequest();
    req.setIndexId(indexId);
    req.setExpression(kj::StringPtr(expression.c_str(), expression.size()));
    auto resp = req.send().wait(ws);
    std::vector<NodeData> out;
    for (auto n : resp.getNodes())
      out.push_back(rpc::fromRpcNode(n));
    return out;
  }

  IndexedNode RpcStoreClient::getOrCreateIndexedNode(uint32_t indexId, const std::string &key, const Value &val,
                                                     const PropertyMap &props)
  {
    auto &ws = client_.getWaitScope();
    auto req = cap_.getOrCreateIndexedNodeRequest();
    req.setIndexId(indexId);
    req.setKey(kj::StringPtr(key.c_str(), key.size()));
    rpc::toRpcValue(req.initVal(), val);
    rpc::toRpcProps(req.initProps(props.size()), props);
    auto resp = req.send().wait(ws);
    return IndexedNode{rpc::fromRpcNode(resp.getNode()), resp.getCreated()};
  }

} // namespace asterism
