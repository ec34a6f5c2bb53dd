#include "relationship.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "node.hpp"
#include <utility>

namespace asterism
{

  RelationshipManager::RelationshipManager(MappedNode &origin, const RelationshipDefinition &def)
      : origin_(&origin), def_(&def) {}

  StoreClient &RelationshipManager::client() const
  {
    return origin_->schema().connection().client();
  }

  uint64_t RelationshipManager::originId() const
  {
    return origin_->id();
  }

  std::vector<std::shared_ptr<MappedNode>> RelationshipManager::all()
  {
    if (related_.empty())
    {
      const auto &target = origin_->schema().connection().schemas().get(def_->targetType);
      for (const auto &n : client().getRelatedNodes(originId(), def_->direction, def_->relationType))
        remember(std::make_shared<MappedNode>(MappedNode::inflate(target, n)));
    }
    return related_;
  }

  void RelationshipManager::remember(std::shared_ptr<MappedNode> node)
  {
    uint64_t id = node->id();
    auto it = positions_.find(id);
    if (it != positions_.end())
    {
      related_[it->second] = std::move(node);
      return;
    }
    positions_.emplace(id, related_.size());
    related_.push_back(std::move(node));
  }

  void RelationshipManager::forget(uint64_t id)
  {
    auto it = positions_.find(id);
    if (it == positions_.end())
      return;
    size_t removed = it->second;
    positions_.erase(it);
    related_.erase(related_.begin() + static_cast<std::ptrdiff_t>(removed));
    for (auto &entry : positions_)
    {
      if (entry.second > removed)
        --entry.second;
    }
  }

  bool RelationshipManager::isRelated(const MappedNode &obj)
  {
    uint64_t other = obj.id();
    if (positions_.count(other))
      return true;
    return client().hasRelationshipWith(originId(), other, def_->direction, def_->relationType);
  }

  void RelationshipManager::relate(const MappedNode &obj)
  {
    if (obj.typeName() != def_->targetType)
      throw TypeMismatch(def_->targetType, obj.typeName());
    if (!obj.persisted())
      throw NodeNotPersisted("can't create relationship to unsaved " + obj.typeName() + " node");

    // an Either edge may already exist pointing the other way
    if (def_->direction != Direction::Both ||
        client().getRelationshipsWith(originId(), obj.id(), Direction::Both, def_->relationType).empty())
    {
      uint64_t src = originId();
      uint64_t dst = obj.id();
      if (def_->direction == Direction::In)
        std::swap(src, dst);
      client().getOrCreateRelationship(src, def_->relationType, dst);
    }
    remember(std::make_shared<MappedNode>(obj));
  }

  void RelationshipManager::unrelate(const MappedNode &obj)
  {
    uint64_t other = obj.id();
    forget(other);
    auto rels = client().getRelationshipsWith(originId(), other, def_->direction, def_->relationType);
    if (rels.empty())
      return;
    if (rels.size() > 1)
      throw MultipleRelationships(def_->relationType, rels.size());
    client().deleteEntities({}, {rels.front().id});
  }

} // namespace asterism
