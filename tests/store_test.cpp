#include "env.hpp"
#include "store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace asterism;
using asterism::test::TempDir;

class StoreTest : public ::testing::Test
{
protected:
  StoreTest() : dir_("asterism-store-"), env_(openEnv(dir_.path)), store_(env_) {}

  static Env openEnv(const std::filesystem::path &p)
  {
    std::filesystem::create_directories(p);
    return Env(p, asterism::test::kTestMapSize);
  }

  uint32_t key(const std::string &name)
  {
    return store_.getOrCreatePropKeyId(GetOrCreatePropKeyIdParams{name, true});
  }

  uint32_t relType(const std::string &name)
  {
    return store_.getOrCreateRelTypeId(GetOrCreateRelTypeIdParams{name, true});
  }

  uint64_t node()
  {
    return store_.createNode(CreateNodeParams{}).node.id;
  }

  TempDir dir_;
  Env env_;
  Store store_;
};

TEST_F(StoreTest, CreateAndReadNodeProperties)
{
  CreateNodeParams in{};
  in.props = {
      Property{key("i"), int64_t{-42}},
      Property{key("f"), 2.5},
      Property{key("b"), true},
      Property{key("s"), std::string("hello")},
      Property{key("n"), std::monostate{}},
  };
  auto created = store_.createNode(in);
  EXPECT_GT(created.node.id, 0u);
  EXPECT_FALSE(created.edge.has_value());

  auto got = store_.getNode(GetNodeParams{created.node.id});
  ASSERT_EQ(got.props.size(), 5u);
  auto find = [&](const std::string &name) -> Value
  {
    uint32_t k = key(name);
    for (const auto &p : got.props)
    {
      if (p.keyId == k)
        return p.val;
    }
    return Value{std::string("<missing>")};
  };
  EXPECT_EQ(find("i"), Value{int64_t{-42}});
  EXPECT_EQ(find("f"), Value{2.5});
  EXPECT_EQ(find("b"), Value{true});
  EXPECT_EQ(find("s"), Value{std::string("hello")});
  EXPECT_TRUE(std::holds_alternative<std::monostate>(find("n")));
}

TEST_F(StoreTest, SetNodePropsReplacesWholeList)
{
  CreateNodeParams in{};
  in.props = {Property{key("a"), int64_t{1}}, Property{key("b"), int64_t{2}}};
  auto id = store_.createNode(in).node.id;

  store_.setNodeProps(SetNodePropsParams{id, {Property{key("a"), int64_t{7}}}});
  auto got = store_.getNode(GetNodeParams{id});
  ASSERT_EQ(got.props.size(), 1u);
  EXPECT_EQ(got.props[0].keyId, key("a"));
  EXPECT_EQ(got.props[0].val, Value{int64_t{7}});
}

TEST_F(StoreTest, MissingNodeThrows)
{
  EXPECT_THROW(store_.getNode(GetNodeParams{999}), MdbError);
  EXPECT_THROW(store_.setNodeProps(SetNodePropsParams{999, {}}), MdbError);
  EXPECT_THROW(store_.deleteEntities(DeleteEntitiesParams{{999}, {}}), MdbError);
}

TEST_F(StoreTest, CreateNodeWithIncomingLink)
{
  uint64_t anchor = node();
  CreateNodeParams in{};
  in.link = EdgeLink{anchor, relType("PERSON"), Direction::In};
  auto created = store_.createNode(in);
  ASSERT_TRUE(created.edge.has_value());
  EXPECT_EQ(created.edge->src, anchor);
  EXPECT_EQ(created.edge->dst, created.node.id);

  ListEdgesParams q{};
  q.node = anchor;
  q.direction = Direction::Out;
  q.typeId = relType("PERSON");
  auto edges = store_.listEdges(q).edges;
  ASSERT_EQ(edges.size(), 1u);
  EXPECT_EQ(edges[0].id, created.edge->id);
}

TEST_F(StoreTest, LinkToMissingNodeRollsBackCreate)
{
  CreateNodeParams in{};
  in.link = EdgeLink{12345, relType("PERSON"), Direction::In};
  EXPECT_THROW(store_.createNode(in), MdbError);

  // the aborted transaction must not leave the node (or its id) behind
  EXPECT_EQ(node(), 1u);
}

TEST_F(StoreTest, GetOrCreateEdgeIsIdempotent)
{
  uint64_t a = node();
  uint64_t b = node();
  uint32_t knows = relType("KNOWS");

  auto first = store_.getOrCreateEdge(AddEdgeParams{a, b, knows});
  auto second = store_.getOrCreateEdge(AddEdgeParams{a, b, knows});
  EXPECT_TRUE(first.created);
  EXPECT_FALSE(second.created);
  EXPECT_EQ(first.edge.id, second.edge.id);

  // opposite direction is a different edge
  auto reverse = store_.getOrCreateEdge(AddEdgeParams{b, a, knows});
  EXPECT_TRUE(reverse.created);
  EXPECT_NE(reverse.edge.id, first.edge.id);
}

TEST_F(StoreTest, ListEdgesFiltersByDirectionTypeAndNeighbour)
{
  uint64_t a = node();
  uint64_t b = node();
  uint64_t c = node();
  uint32_t knows = relType("KNOWS");
  uint32_t likes = relType("LIKES");
  store_.addEdge(AddEdgeParams{a, b, knows});
  store_.addEdge(AddEdgeParams{a, c, knows});
  store_.addEdge(AddEdgeParams{c, a, likes});

  ListEdgesParams q{};
  q.node = a;
  q.direction = Direction::Out;
  EXPECT_EQ(store_.listEdges(q).edges.size(), 2u);

  q.direction = Direction::In;
  EXPECT_EQ(store_.listEdges(q).edges.size(), 1u);

  q.direction = Direction::Both;
  EXPECT_EQ(store_.listEdges(q).edges.size(), 3u);

  q.typeId = knows;
  q.other = c;
  auto edges = store_.listEdges(q).edges;
  ASSERT_EQ(edges.size(), 1u);
  EXPECT_EQ(edges[0].src, a);
  EXPECT_EQ(edges[0].dst, c);

  q.other = 0;
  q.typeId = 0;
  q.limit = 2;
  EXPECT_EQ(store_.listEdges(q).edges.size(), 2u);
}

TEST_F(StoreTest, RelatedNodesDeduplicatesNeighbours)
{
  uint64_t a = node();
  uint64_t b = node();
  uint32_t knows = relType("KNOWS");
  store_.addEdge(AddEdgeParams{a, b, knows});
  store_.addEdge(AddEdgeParams{b, a, knows});

  ListEdgesParams q{};
  q.node = a;
  q.direction = Direction::Both;
  q.typeId = knows;
  auto nodes = store_.relatedNodes(q).nodes;
  ASSERT_EQ(nodes.size(), 1u);
  EXPECT_EQ(nodes[0].id, b);
}

TEST_F(StoreTest, DeleteNodeDetachesEdgesAndIndexEntries)
{
  uint64_t a = node();
  uint64_t b = node();
  uint32_t knows = relType("KNOWS");
  auto e = store_.addEdge(AddEdgeParams{a, b, knows});
  uint32_t idx = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", true});
  store_.applyIndexBatch(IndexBatchParams{idx, {IndexOp{IndexOpKind::Insert, key("name"), std::string("bob"), b}}});

  store_.deleteEntities(DeleteEntitiesParams{{b}, {}});

  EXPECT_THROW(store_.getNode(GetNodeParams{b}), MdbError);
  EXPECT_THROW(store_.getEdge(e.id), MdbError);
  ListEdgesParams q{};
  q.node = a;
  q.direction = Direction::Both;
  EXPECT_TRUE(store_.listEdges(q).edges.empty());
  EXPECT_TRUE(store_.queryIndex(QueryIndexParams{idx, {IndexTerm{key("name"), std::string("bob")}}}).nodeIds.empty());
}

TEST_F(StoreTest, DeleteIgnoresMissingEdges)
{
  uint64_t a = node();
  uint64_t b = node();
  auto e = store_.addEdge(AddEdgeParams{a, b, relType("KNOWS")});
  store_.deleteEntities(DeleteEntitiesParams{{}, {e.id}});
  EXPECT_NO_THROW(store_.deleteEntities(DeleteEntitiesParams{{}, {e.id}}));
  EXPECT_NO_THROW(store_.getNode(GetNodeParams{a}));
}

TEST_F(StoreTest, InsertIfAbsentKeepsFirstEntry)
{
  uint64_t a = node();
  uint64_t b = node();
  uint32_t idx = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", true});
  uint32_t name = key("name");

  auto r1 = store_.applyIndexBatch(IndexBatchParams{idx, {IndexOp{IndexOpKind::InsertIfAbsent, name, std::string("alice"), a}}});
  auto r2 = store_.applyIndexBatch(IndexBatchParams{idx, {IndexOp{IndexOpKind::InsertIfAbsent, name, std::string("alice"), b}}});
  ASSERT_EQ(r1.statuses.size(), 1u);
  ASSERT_EQ(r2.statuses.size(), 1u);
  EXPECT_EQ(r1.statuses[0], IndexOpStatus::Inserted);
  EXPECT_EQ(r2.statuses[0], IndexOpStatus::Exists);

  auto ids = store_.queryIndex(QueryIndexParams{idx, {IndexTerm{name, std::string("alice")}}}).nodeIds;
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_EQ(ids[0], a);
}

TEST_F(StoreTest, LongValuesAreIndexedByDigest)
{
  uint64_t a = node();
  uint64_t b = node();
  uint32_t idx = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", true});
  uint32_t bio = key("bio");
  std::string text(1024, 'q');
  std::string other = text;
  other.back() = 'r';

  auto r = store_.applyIndexBatch(IndexBatchParams{idx, {
                                                            IndexOp{IndexOpKind::InsertIfAbsent, bio, text, a},
                                                            IndexOp{IndexOpKind::InsertIfAbsent, bio, other, b},
                                                            IndexOp{IndexOpKind::InsertIfAbsent, bio, text, b},
                                                        }});
  EXPECT_EQ(r.statuses, (std::vector<IndexOpStatus>{IndexOpStatus::Inserted, IndexOpStatus::Inserted, IndexOpStatus::Exists}));
  EXPECT_EQ(store_.queryIndex(QueryIndexParams{idx, {IndexTerm{bio, text}}}).nodeIds, (std::vector<uint64_t>{a}));
  EXPECT_EQ(store_.queryIndex(QueryIndexParams{idx, {IndexTerm{bio, other}}}).nodeIds, (std::vector<uint64_t>{b}));

  store_.removeFromIndex(RemoveFromIndexParams{idx, a});
  EXPECT_TRUE(store_.queryIndex(QueryIndexParams{idx, {IndexTerm{bio, text}}}).nodeIds.empty());
}

TEST_F(StoreTest, PlainInsertAllowsDuplicates)
{
  uint64_t a = node();
  uint64_t b = node();
  uint32_t idx = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", true});
  uint32_t age = key("age");
  store_.applyIndexBatch(IndexBatchParams{idx, {
                                                   IndexOp{IndexOpKind::Insert, age, int64_t{30}, a},
                                                   IndexOp{IndexOpKind::Insert, age, int64_t{30}, b},
                                               }});
  auto ids = store_.queryIndex(QueryIndexParams{idx, {IndexTerm{age, int64_t{30}}}}).nodeIds;
  std::sort(ids.begin(), ids.end());
  EXPECT_EQ(ids, (std::vector<uint64_t>{a, b}));
}

TEST_F(StoreTest, IndexesAreSeparatedByNameAndValueType)
{
  uint64_t a = node();
  uint32_t people = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", true});
  uint32_t pets = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"Pets", true});
  EXPECT_NE(people, pets);
  EXPECT_EQ(people, store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", false}));

  uint32_t k = key("code");
  store_.applyIndexBatch(IndexBatchParams{people, {IndexOp{IndexOpKind::Insert, k, int64_t{1}, a}}});

  EXPECT_TRUE(store_.queryIndex(QueryIndexParams{pets, {IndexTerm{k, int64_t{1}}}}).nodeIds.empty());
  EXPECT_TRUE(store_.queryIndex(QueryIndexParams{people, {IndexTerm{k, 1.0}}}).nodeIds.empty());
  EXPECT_TRUE(store_.queryIndex(QueryIndexParams{people, {IndexTerm{k, std::string("1")}}}).nodeIds.empty());
  EXPECT_EQ(store_.queryIndex(QueryIndexParams{people, {IndexTerm{k, int64_t{1}}}}).nodeIds.size(), 1u);
}

TEST_F(StoreTest, QueryIntersectsTerms)
{
  uint64_t a = node();
  uint64_t b = node();
  uint32_t idx = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", true});
  uint32_t age = key("age");
  uint32_t city = key("city");
  store_.applyIndexBatch(IndexBatchParams{idx, {
                                                   IndexOp{IndexOpKind::Insert, age, int64_t{30}, a},
                                                   IndexOp{IndexOpKind::Insert, city, std::string("Oslo"), a},
                                                   IndexOp{IndexOpKind::Insert, age, int64_t{30}, b},
                                                   IndexOp{IndexOpKind::Insert, city, std::string("Rome"), b},
                                               }});

  auto ids = store_.queryIndex(QueryIndexParams{idx, {IndexTerm{age, int64_t{30}}, IndexTerm{city, std::string("Rome")}}}).nodeIds;
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_EQ(ids[0], b);
  EXPECT_THROW(store_.queryIndex(QueryIndexParams{idx, {}}), MdbError);
}

TEST_F(StoreTest, RemoveFromIndexOnlyTouchesThatIndex)
{
  uint64_t a = node();
  uint32_t people = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", true});
  uint32_t staff = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"Staff", true});
  uint32_t k = key("name");
  store_.applyIndexBatch(IndexBatchParams{people, {IndexOp{IndexOpKind::Insert, k, std::string("a"), a}}});
  store_.applyIndexBatch(IndexBatchParams{staff, {IndexOp{IndexOpKind::Insert, k, std::string("a"), a}}});

  store_.removeFromIndex(RemoveFromIndexParams{people, a});

  EXPECT_TRUE(store_.queryIndex(QueryIndexParams{people, {IndexTerm{k, std::string("a")}}}).nodeIds.empty());
  EXPECT_EQ(store_.queryIndex(QueryIndexParams{staff, {IndexTerm{k, std::string("a")}}}).nodeIds.size(), 1u);
}

TEST_F(StoreTest, IndexingMissingNodeThrows)
{
  uint32_t idx = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"People", true});
  EXPECT_THROW(store_.applyIndexBatch(IndexBatchParams{idx, {IndexOp{IndexOpKind::Insert, key("name"), std::string("x"), 77}}}),
               MdbError);
}

TEST_F(StoreTest, GetOrCreateIndexedNodeIsIdempotent)
{
  uint32_t idx = store_.getOrCreateIndexId(GetOrCreateIndexIdParams{"Category", true});
  uint32_t k = key("category");
  GetOrCreateIndexedNodeParams in{};
  in.indexId = idx;
  in.keyId = k;
  in.val = std::string("Person");
  in.props = {Property{k, std::string("Person")}};

  auto first = store_.getOrCreateIndexedNode(in);
  auto second = store_.getOrCreateIndexedNode(in);
  EXPECT_TRUE(first.created);
  EXPECT_FALSE(second.created);
  EXPECT_EQ(first.node.id, second.node.id);

  in.val = std::string("Company");
  auto other = store_.getOrCreateIndexedNode(in);
  EXPECT_TRUE(other.created);
  EXPECT_NE(other.node.id, first.node.id);
}

TEST_F(StoreTest, DictionariesResolveBothWays)
{
  uint32_t id = relType("KNOWS");
  EXPECT_EQ(store_.getRelTypeName(id), "KNOWS");
  EXPECT_EQ(store_.findRelTypeId("KNOWS"), std::optional<uint32_t>(id));
  EXPECT_FALSE(store_.findRelTypeId("NEVER").has_value());
  EXPECT_FALSE(store_.findPropKeyId("never").has_value());
  EXPECT_THROW(store_.getOrCreatePropKeyId(GetOrCreatePropKeyIdParams{"never", false}), MdbError);
}
