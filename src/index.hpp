#pragma once
#include "client.hpp"
#include "query.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace asterism
{

  // Handle on one named secondary index in the store. Shared by every
  // instance of a mapped type; copies refer to the same index.
  class IndexHandle
  {
  public:
    IndexHandle(StoreClient &client, std::string name, uint32_t id);

    // get-or-create by name
    static IndexHandle open(StoreClient &client, const std::string &name);

    const std::string &name() const { return name_; }
    uint32_t id() const { return id_; }

    void insert(const std::string &key, const Value &val, uint64_t node) const;
    // Atomic in the store: true when the entry was written, false when
    // (key, val) already had an entry, which is left untouched.
    bool insertIfAbsent(const std::string &key, const Value &val, uint64_t node) const;
    // drops every entry pointing at node
    void remove(uint64_t node) const;

    std::vector<NodeData> query(const std::string &expression) const;
    std::vector<NodeData> query(const Query &q) const;

    StoreClient &client() const { return *client_; }

  private:
    StoreClient *client_;
    std::string name_;
    uint32_t id_;
  };

  // Index writes collected and submitted in one store call.
  class IndexBatch
  {
  public:
    explicit IndexBatch(const IndexHandle &index) : index_(index) {}

    void insert(const std::string &key, const Value &val, uint64_t node);
    void insertIfAbsent(const std::string &key, const Value &val, uint64_t node);

    const std::vector<IndexEntryOp> &ops() const { return ops_; }
    bool empty() const { return ops_.empty(); }
    size_t size() const { return ops_.size(); }

    // One status per op, in submission order. The batch is empty afterwards.
    std::vector<IndexOpStatus> submit();

  private:
    const IndexHandle &index_;
    std::vector<IndexEntryOp> ops_;
  };

} // namespace asterism
