#pragma once
#include "env.hpp"
#include "value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace asterism
{

  struct Property
  {
    uint32_t keyId{0};
    Value val{};
  };

  // -------------------- node / edge data ---------------------------

  struct NodeRecord
  {
    uint64_t id{0};
    std::vector<Property> props{};
  };

  struct EdgeRef
  {
    uint64_t id{0};
    uint64_t src{0};
    uint64_t dst{0};
    uint32_t typeId{0};
  };

  // Edge created together with a node. Direction is seen from the new node:
  // In means other -> new, Out means new -> other.
  struct EdgeLink
  {
    uint64_t other{0};
    uint32_t typeId{0};
    Direction direction{Direction::In};
  };

  // -------------------- params / results ---------------------------

  struct CreateNodeParams
  {
    std::vector<Property> props{};
    std::optional<EdgeLink> link{};
  };
  struct CreateNodeResult
  {
    NodeRecord node{};
    std::optional<EdgeRef> edge{};
  };

  // replaces the full property list of a node
  struct SetNodePropsParams
  {
    uint64_t id{0};
    std::vector<Property> props{};
  };

  struct GetNodeParams
  {
    uint64_t id{0};
  };

  struct DeleteEntitiesParams
  {
    std::vector<uint64_t> nodeIds{};
    std::vector<uint64_t> edgeIds{};
  };

  struct AddEdgeParams
  {
    uint64_t src{0};
    uint64_t dst{0};
    uint32_t typeId{0};
  };

  struct GetOrCreateEdgeResult
  {
    EdgeRef edge{};
    bool created{false};
  };

  // typeId 0 -> any type, other 0 -> any neighbour, limit 0 -> unbounded
  struct ListEdgesParams
  {
    uint64_t node{0};
    Direction direction{Direction::Out};
    uint32_t typeId{0};
    uint64_t other{0};
    uint32_t limit{0};
  };
  struct ListEdgesResult
  {
    std::vector<EdgeRef> edges;
  };

  struct RelatedNodesResult
  {
    std::vector<NodeRecord> nodes;
  };

  // -------------------- secondary indexes ---------------------------

  enum class IndexOpKind : uint8_t
  {
    Insert = 0,
    InsertIfAbsent = 1
  };

  enum class IndexOpStatus : uint8_t
  {
    Inserted = 0,
    Exists = 1
  };

  struct IndexOp
  {
    IndexOpKind kind{IndexOpKind::Insert};
    uint32_t keyId{0};
    Value val{};
    uint64_t node{0};
  };

  struct IndexBatchParams
  {
    uint32_t indexId{0};
    std::vector<IndexOp> ops{};
  };
  struct IndexBatchResult
  {
    std::vector<IndexOpStatus> statuses;
  };

  struct RemoveFromIndexParams
  {
    uint32_t indexId{0};
    uint64_t node{0};
  };

  struct IndexTerm
  {
    uint32_t keyId{0};
    Value val{};
  };

  // conjunction of equality terms
  struct QueryIndexParams
  {
    uint32_t indexId{0};
    std::vector<IndexTerm> terms{};
    uint32_t limit{0};
  };
  struct QueryIndexResult
  {
    std::vector<uint64_t> nodeIds;
  };

  struct GetOrCreateIndexedNodeParams
  {
    uint32_t indexId{0};
    uint32_t keyId{0};
    Value val{};
    std::vector<Property> props{};
  };
  struct GetOrCreateIndexedNodeResult
  {
    NodeRecord node{};
    bool created{false};
  };

  // -------------------- dictionaries ---------------------------

  struct GetOrCreateRelTypeIdParams
  {
    std::string name{};
    bool createIfMissing{false};
  };
  struct GetOrCreatePropKeyIdParams
  {
    std::string name{};
    bool createIfMissing{false};
  };
  struct GetOrCreateIndexIdParams
  {
    std::string name{};
    bool createIfMissing{false};
  };

  class Store
  {
  public:
    explicit Store(Env &e) : env_(e) {}

    // writes
    CreateNodeResult createNode(const CreateNodeParams &params);
    void setNodeProps(const SetNodePropsParams &params);
    EdgeRef addEdge(const AddEdgeParams &params);
    GetOrCreateEdgeResult getOrCreateEdge(const AddEdgeParams &params);
    void deleteEntities(const DeleteEntitiesParams &params);

    // reads / queries
    NodeRecord getNode(const GetNodeParams &params);
    EdgeRef getEdge(uint64_t edgeId);
    ListEdgesResult listEdges(const ListEdgesParams &params);
    RelatedNodesResult relatedNodes(const ListEdgesParams &params);

    // secondary indexes
    IndexBatchResult applyIndexBatch(const IndexBatchParams &params);
    void removeFromIndex(const RemoveFromIndexParams &params);
    QueryIndexResult queryIndex(const QueryIndexParams &params);
    std::vector<NodeRecord> getNodes(const std::vector<uint64_t> &ids);
    GetOrCreateIndexedNodeResult getOrCreateIndexedNode(const GetOrCreateIndexedNodeParams &params);

    // string interning helpers
    uint32_t getOrCreateRelTypeId(const GetOrCreateRelTypeIdParams &params);
    uint32_t getOrCreatePropKeyId(const GetOrCreatePropKeyIdParams &params);
    uint32_t getOrCreateIndexId(const GetOrCreateIndexIdParams &params);
    std::optional<uint32_t> findRelTypeId(const std::string &name);
    std::optional<uint32_t> findPropKeyId(const std::string &name);
    std::string getRelTypeName(uint32_t id);
    std::string getPropKeyName(uint32_t id);

  private:
    Env &env_;
  };

} // namespace asterism
