#pragma once
#include "client.hpp"
#include "schemas/graph.capnp.h"
#include <capnp/ez-rpc.h>
#include <string>

namespace asterism
{

  // StoreClient over a GraphStore RPC connection. Each call blocks on the
  // client's wait scope, so an instance must stay on the thread that made it.
  class RpcStoreClient final : public StoreClient
  {
  public:
    // bind is "unix:<path>" or "<host>:<port>"
    explicit RpcStoreClient(const std::string &bind);

    CreatedNode createNode(const PropertyMap &props, const std::optional<NodeLink> &link) override;
    void setProperties(uint64_t node, const PropertyMap &props) override;
    NodeData getNode(uint64_t node) override;
    void deleteEntities(const std::vector<uint64_t> &nodes, const std::vector<uint64_t> &edges) override;

    std::vector<Relationship> listEdges(const EdgeFilter &filter) override;
    std::vector<NodeData> relatedNodes(const EdgeFilter &filter) override;
    Relationship getOrCreateRelationship(uint64_t src, const std::string &type, uint64_t dst) override;

    uint32_t getOrCreateIndex(const std::string &name) override;
    std::vector<IndexOpStatus> applyIndexBatch(uint32_t indexId, const std::vector<IndexEntryOp> &ops) override;
    void removeFromIndex(uint32_t indexId, uint64_t node) override;
    std::vector<NodeData> queryIndex(uint32_t indexId, const std::string &expression) override;
    IndexedNode getOrCreateIndexedNode(uint32_t indexId, const std::string &key, const Value &val,
                                       const PropertyMap &props) override;

  private:
    capnp::EzRpcClient client_;
    rpc::GraphStore::Client cap_;
  };

} // namespace asterism
