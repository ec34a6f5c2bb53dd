#include "node.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "index.hpp"
#include "relationship.hpp"
#include <kj/debug.h>

namespace asterism
{

  MappedNode::MappedNode(const SchemaEntry &entry, PropertyMap props) : entry_(&entry)
  {
    for (const auto &[name, val] : props)
      entry.getProperty(name).validate(val);
    props_ = std::move(props);
    buildManagers();
  }

  MappedNode::~MappedNode() = default;

  MappedNode::MappedNode(const MappedNode &other)
      : entry_(other.entry_), remoteId_(other.remoteId_), props_(other.props_)
  {
    buildManagers();
  }

  MappedNode &MappedNode::operator=(const MappedNode &other)
  {
    if (this != &other)
    {
      entry_ = other.entry_;
      remoteId_ = other.remoteId_;
      props_ = other.props_;
      buildManagers();
    }
    return *this;
  }

  MappedNode::MappedNode(MappedNode &&other) noexcept
      : entry_(other.entry_), remoteId_(std::move(other.remoteId_)), props_(std::move(other.props_)),
        managers_(std::move(other.managers_))
  {
    rebindManagers();
  }

  MappedNode &MappedNode::operator=(MappedNode &&other) noexcept
  {
    if (this != &other)
    {
      entry_ = other.entry_;
      remoteId_ = std::move(other.remoteId_);
      props_ = std::move(other.props_);
      managers_ = std::move(other.managers_);
      rebindManagers();
    }
    return *this;
  }

  MappedNode MappedNode::inflate(const SchemaEntry &entry, const NodeData &data)
  {
    MappedNode n(entry, data.props);
    n.remoteId_ = data.id;
    return n;
  }

  void MappedNode::buildManagers()
  {
    managers_.clear();
    for (const auto &def : entry_->relationships())
    {
      switch (def.flavor)
      {
      case ManagerFlavor::Cached:
        managers_.emplace(def.name, std::make_unique<RelationshipManager>(*this, def));
        break;
      }
    }
  }

  void MappedNode::rebindManagers()
  {
    for (auto &[name, mgr] : managers_)
      mgr->rebind(*this);
  }

  uint64_t MappedNode::id() const
  {
    if (!remoteId_)
      throw NodeNotPersisted(typeName() + " node has not been saved");
    return *remoteId_;
  }

  const Value &MappedNode::get(const std::string &name) const
  {
    static const Value null{};
    entry_->getProperty(name);
    auto it = props_.find(name);
    return it == props_.end() ? null : it->second;
  }

  void MappedNode::set(const std::string &name, Value val)
  {
    entry_->getProperty(name).validate(val);
    props_[name] = std::move(val);
  }

  RelationshipManager &MappedNode::rel(const std::string &name)
  {
    auto it = managers_.find(name);
    if (it == managers_.end())
      throw SchemaError(typeName() + " has no relationship '" + name + "'");
    return *it->second;
  }

  std::optional<std::string> MappedNode::updateIndex()
  {
    IndexBatch batch(entry_->index());
    for (const auto &[name, val] : props_)
    {
      if (std::holds_alternative<std::monostate>(val))
        continue;
      const auto &p = entry_->getProperty(name);
      if (p.isUnique())
        batch.insertIfAbsent(name, val, *remoteId_);
      else if (p.isIndexed())
        batch.insert(name, val, *remoteId_);
    }
    if (batch.empty())
      return std::nullopt;

    auto ops = batch.ops();
    auto statuses = batch.submit();
    for (size_t i = 0; i < ops.size(); ++i)
    {
      if (ops[i].kind == IndexOpKind::InsertIfAbsent && statuses[i] == IndexOpStatus::Exists)
        return ops[i].key;
    }
    return std::nullopt;
  }

  void MappedNode::create()
  {
    auto &conn = entry_->connection();
    auto &client = conn.client();

    NodeLink link{conn.category(typeName()), entry_->categoryRelation(), Direction::In};
    auto created = client.createNode(props_, link);
    remoteId_ = created.node.id;

    std::vector<uint64_t> edges;
    if (created.edge)
      edges.push_back(created.edge->id);

    std::optional<std::string> conflict;
    try
    {
      conflict = updateIndex();
    }
    catch (...)
    {
      client.deleteEntities({created.node.id}, edges);
      remoteId_.reset();
      throw;
    }

    if (conflict)
    {
      client.deleteEntities({created.node.id}, edges);
      remoteId_.reset();
      KJ_LOG(WARNING, "unique conflict, new node rolled back", typeName().c_str(), created.node.id, conflict->c_str());
      throw NotUnique(*conflict, props_.at(*conflict));
    }
  }

  MappedNode &MappedNode::save()
  {
    if (!remoteId_)
    {
      create();
      return *this;
    }

    auto &client = entry_->connection().client();
    client.setProperties(*remoteId_, props_);
    entry_->index().remove(*remoteId_);
    if (auto conflict = updateIndex())
    {
      // properties stay overwritten and the conflicting value stays unindexed
      KJ_LOG(WARNING, "unique conflict on update, not rolled back", typeName().c_str(), *remoteId_, conflict->c_str());
      throw NotUnique(*conflict, props_.at(*conflict));
    }
    return *this;
  }

  void MappedNode::remove()
  {
    if (!remoteId_)
      throw NodeNotPersisted(typeName() + " node has not been saved so cannot be deleted");

    auto &client = entry_->connection().client();
    std::vector<uint64_t> edges;
    for (const auto &r : client.getRelationships(*remoteId_))
      edges.push_back(r.id);
    client.deleteEntities({*remoteId_}, edges);
    remoteId_.reset();
    buildManagers();
  }

} // namespace asterism
