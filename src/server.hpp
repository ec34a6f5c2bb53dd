#pragma once
#include "client.hpp"
#include "schemas/graph.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>

namespace asterism::rpc
{

  // Serves the GraphStore interface on top of any store client.
  class GraphStoreImpl final : public GraphStore::Server
  {
  public:
    explicit GraphStoreImpl(asterism::StoreClient &client);

    kj::Promise<void> createNode(CreateNodeContext ctx) override;
    kj::Promise<void> setNodeProps(SetNodePropsContext ctx) override;
    kj::Promise<void> getNode(GetNodeContext ctx) override;
    kj::Promise<void> deleteEntities(DeleteEntitiesContext ctx) override;

    kj::Promise<void> listEdges(ListEdgesContext ctx) override;
    kj::Promise<void> relatedNodes(RelatedNodesContext ctx) override;
    kj::Promise<void> getOrCreateEdge(GetOrCreateEdgeContext ctx) override;

    kj::Promise<void> getOrCreateIndex(GetOrCreateIndexContext ctx) override;
    kj::Promise<void> applyIndexBatch(ApplyIndexBatchContext ctx) override;
    kj::Promise<void> removeFromIndex(RemoveFromIndexContext ctx) override;
    kj::Promise<void> queryIndex(QueryIndexContext ctx) override;
    kj::Promise<void> getOrCreateIndexedNode(GetOrCreateIndexedNodeContext ctx) override;

  private:
    asterism::StoreClient &client_;
  };

  // Conversions shared with RpcStoreClient.
  asterism::Value fromRpcValue(Value::Reader v);
  void toRpcValue(Value::Builder b, const asterism::Value &v);
  asterism::PropertyMap fromRpcProps(capnp::List<Property>::Reader props);
  void toRpcProps(capnp::List<Property>::Builder b, const asterism::PropertyMap &props);
  asterism::Direction fromRpcDirection(Direction d);
  Direction toRpcDirection(asterism::Direction d);
  asterism::NodeData fromRpcNode(NodeRecord::Reader n);
  void toRpcNode(NodeRecord::Builder b, const asterism::NodeData &n);
  asterism::Relationship fromRpcEdge(EdgeRef::Reader e);
  void toRpcEdge(EdgeRef::Builder b, const asterism::Relationship &e);
  asterism::EdgeFilter fromRpcFilter(ListEdgesParams::Reader p);
  void toRpcFilter(ListEdgesParams::Builder b, const asterism::EdgeFilter &f);

} // namespace asterism::rpc
