#pragma once
#include "store.hpp"
#include "value.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace asterism
{

  // -------------------- name-level records ---------------------------

  struct NodeData
  {
    uint64_t id{0};
    PropertyMap props{};
  };

  struct Relationship
  {
    uint64_t id{0};
    uint64_t src{0};
    uint64_t dst{0};
    std::string type{};
  };

  // Edge created together with a node; direction is seen from the new node.
  struct NodeLink
  {
    uint64_t other{0};
    std::string type{};
    Direction direction{Direction::In};
  };

  struct CreatedNode
  {
    NodeData node{};
    std::optional<Relationship> edge{};
  };

  // type "" matches any type, other 0 any neighbour, limit 0 unbounded
  struct EdgeFilter
  {
    uint64_t node{0};
    Direction direction{Direction::Both};
    std::string type{};
    uint64_t other{0};
    uint32_t limit{0};
  };

  struct IndexEntryOp
  {
    IndexOpKind kind{IndexOpKind::Insert};
    std::string key{};
    Value val{};
    uint64_t node{0};
  };

  struct IndexedNode
  {
    NodeData node{};
    bool created{false};
  };

  // Graph store driver consumed by the mapping layer. Every call is a blocking
  // round trip; implementations provide node-level atomicity per call and make
  // InsertIfAbsent index ops atomic with respect to concurrent writers.
  class StoreClient
  {
  public:
    virtual ~StoreClient() = default;

    // nodes
    virtual CreatedNode createNode(const PropertyMap &props, const std::optional<NodeLink> &link) = 0;
    virtual void setProperties(uint64_t node, const PropertyMap &props) = 0;
    virtual NodeData getNode(uint64_t node) = 0;
    virtual void deleteEntities(const std::vector<uint64_t> &nodes, const std::vector<uint64_t> &edges) = 0;

    // relationships
    virtual std::vector<Relationship> listEdges(const EdgeFilter &filter) = 0;
    virtual std::vector<NodeData> relatedNodes(const EdgeFilter &filter) = 0;
    virtual Relationship getOrCreateRelationship(uint64_t src, const std::string &type, uint64_t dst) = 0;

    // indexes
    virtual uint32_t getOrCreateIndex(const std::string &name) = 0;
    virtual std::vector<IndexOpStatus> applyIndexBatch(uint32_t indexId, const std::vector<IndexEntryOp> &ops) = 0;
    virtual void removeFromIndex(uint32_t indexId, uint64_t node) = 0;
    virtual std::vector<NodeData> queryIndex(uint32_t indexId, const std::string &expression) = 0;
    virtual IndexedNode getOrCreateIndexedNode(uint32_t indexId, const std::string &key, const Value &val,
                                               const PropertyMap &props) = 0;

    PropertyMap getProperties(uint64_t node);
    std::vector<NodeData> getRelatedNodes(uint64_t node, Direction direction, const std::string &type);
    bool hasRelationshipWith(uint64_t node, uint64_t other, Direction direction, const std::string &type);
    std::vector<Relationship> getRelationshipsWith(uint64_t node, uint64_t other, Direction direction,
                                                   const std::string &type);
    std::vector<Relationship> getRelationships(uint64_t node);
  };

  // In-process client over an LMDB store.
  class LocalStoreClient final : public StoreClient
  {
  public:
    explicit LocalStoreClient(Store &store);
    // opens (creating if needed) a store in dir and owns it
    explicit LocalStoreClient(const std::filesystem::path &dir, size_t mapSizeBytes = kDefaultMapSize);

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

    Store &store() { return store_; }

  private:
    std::vector<Property> toStoreProps(const PropertyMap &props);
    NodeData fromStoreNode(const NodeRecord &n);
    Relationship fromStoreEdge(const EdgeRef &e);
    std::optional<ListEdgesParams> toStoreFilter(const EdgeFilter &filter);

    std::unique_ptr<Env> ownedEnv_;
    std::unique_ptr<Store> ownedStore_;
    Store &store_;
  };

} // namespace asterism
