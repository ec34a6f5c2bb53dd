#include "index.hpp"
#include <kj/debug.h>

namespace asterism
{

  IndexHandle::IndexHandle(StoreClient &client, std::string name, uint32_t id)
      : client_(&client), name_(std::move(name)), id_(id) {}

  IndexHandle IndexHandle::open(StoreClient &client, const std::string &name)
  {
    return IndexHandle(client, name, client.getOrCreateIndex(name));
  }

  void IndexHandle::insert(const std::string &key, const Value &val, uint64_t node) const
  {
    client_->applyIndexBatch(id_, {IndexEntryOp{IndexOpKind::Insert, key, val, node}});
  }

  bool IndexHandle::insertIfAbsent(const std::string &key, const Value &val, uint64_t node) const
  {
    auto statuses = client_->applyIndexBatch(id_, {IndexEntryOp{IndexOpKind::InsertIfAbsent, key, val, node}});
    return !statuses.empty() && statuses.front() == IndexOpStatus::Inserted;
  }

  void IndexHandle::remove(uint64_t node) const
  {
    client_->removeFromIndex(id_, node);
  }

  std::vector<NodeData> IndexHandle::query(const std::string &expression) const
  {
    return client_->queryIndex(id_, expression);
  }

  std::vector<NodeData> IndexHandle::query(const Query &q) const
  {
    return query(q.str());
  }

  void IndexBatch::insert(const std::string &key, const Value &val, uint64_t node)
  {
    ops_.push_back(IndexEntryOp{IndexOpKind::Insert, key, val, node});
  }

  void IndexBatch::insertIfAbsent(const std::string &key, const Value &val, uint64_t node)
  {
    ops_.push_back(IndexEntryOp{IndexOpKind::InsertIfAbsent, key, val, node});
  }

  std::vector<IndexOpStatus> IndexBatch::submit()
  {
    if (ops_.empty())
      return {};
    auto statuses = index_.client().applyIndexBatch(index_.id(), ops_);
    KJ_REQUIRE(statuses.size() == ops_.size(), "index batch status count mismatch", index_.name().c_str());
    ops_.clear();
    return statuses;
  }

} // namespace asterism
