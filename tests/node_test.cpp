#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace asterism;
using asterism::test::GraphTest;

namespace
{

  size_t countCategoryMembers(StoreClient &client, uint64_t anchor, const std::string &relation)
  {
    return client.getRelatedNodes(anchor, Direction::Out, relation).size();
  }

} // namespace

TEST_F(GraphTest, ConstructValidatesBeforeAssigning)
{
  EXPECT_THROW(MappedNode(person_, {{"height", Value{int64_t{180}}}}), NoSuchProperty);
  EXPECT_THROW(MappedNode(person_, {{"name", Value{std::string("a")}}, {"age", Value{std::string("old")}}}), InvalidType);

  MappedNode p(person_, {{"name", Value{std::string("alice")}}, {"age", Value{int64_t{30}}}});
  EXPECT_FALSE(p.persisted());
  EXPECT_EQ(p.typeName(), "Person");
  PropertyMap expected{{"name", Value{std::string("alice")}}, {"age", Value{int64_t{30}}}};
  EXPECT_EQ(p.properties(), expected);
  EXPECT_THROW(p.id(), NodeNotPersisted);
}

TEST_F(GraphTest, SetRevalidatesAndLeavesNodeUntouchedOnFailure)
{
  auto p = person("alice", 30);
  EXPECT_THROW(p.set("age", Value{std::string("thirty")}), InvalidType);
  EXPECT_THROW(p.set("height", Value{int64_t{1}}), NoSuchProperty);
  EXPECT_EQ(p.get("age"), Value{int64_t{30}});
  EXPECT_EQ(p.properties().size(), 2u);

  p.set("score", Value{9.5});
  EXPECT_EQ(p.get("score"), Value{9.5});
  EXPECT_TRUE(std::holds_alternative<std::monostate>(p.get("email")));
  EXPECT_THROW(p.get("height"), NoSuchProperty);
}

TEST_F(GraphTest, SaveAssignsIdentityAndLinksCategory)
{
  auto p = person("alice", 30);
  p.save();
  ASSERT_TRUE(p.persisted());

  auto stored = conn_.client().getProperties(p.id());
  EXPECT_EQ(stored, p.properties());

  uint64_t anchor = conn_.category("Person");
  auto members = conn_.client().getRelatedNodes(anchor, Direction::Out, "PERSON");
  ASSERT_EQ(members.size(), 1u);
  EXPECT_EQ(members[0].id, p.id());

  // anchor is get-or-create and cached
  EXPECT_EQ(conn_.category("Person"), anchor);
  EXPECT_NE(conn_.category("Company"), anchor);
}

TEST_F(GraphTest, SaveIndexesUniqueAndPlainProperties)
{
  auto p = person("alice", 30);
  p.set("active", Value{true});
  p.save();

  auto byName = person_.index().query(Query("name", std::string("alice")));
  ASSERT_EQ(byName.size(), 1u);
  EXPECT_EQ(byName[0].id, p.id());
  EXPECT_EQ(person_.index().query(Query("age", int64_t{30})).size(), 1u);
  EXPECT_EQ(person_.index().query(Query("active", true)).size(), 1u);
  // email is not indexed
  EXPECT_TRUE(person_.index().query("email:null").empty());
}

TEST_F(GraphTest, DuplicateUniqueValueRollsBackSecondSave)
{
  auto first = savedPerson("alice", 30);
  auto second = person("alice", 41);

  try
  {
    second.save();
    FAIL() << "expected NotUnique";
  }
  catch (const NotUnique &e)
  {
    EXPECT_EQ(e.property, "name");
    EXPECT_EQ(e.value, Value{std::string("alice")});
  }

  EXPECT_FALSE(second.persisted());
  // no orphan: one category member, one index entry for the name, none for the rolled back age
  EXPECT_EQ(countCategoryMembers(conn_.client(), conn_.category("Person"), "PERSON"), 1u);
  auto byName = person_.index().query(Query("name", std::string("alice")));
  ASSERT_EQ(byName.size(), 1u);
  EXPECT_EQ(byName[0].id, first.id());
  EXPECT_TRUE(person_.index().query(Query("age", int64_t{41})).empty());

  // a different value goes through
  second.set("name", Value{std::string("bob")});
  EXPECT_NO_THROW(second.save());
  EXPECT_TRUE(second.persisted());
  EXPECT_NE(second.id(), first.id());
}

TEST_F(GraphTest, ResaveOverwritesPropertiesAndRefreshesIndex)
{
  auto p = savedPerson("alice", 30);
  uint64_t id = p.id();

  p.set("age", Value{int64_t{31}});
  p.set("name", Value{std::string("alicia")});
  p.save();
  EXPECT_EQ(p.id(), id);

  EXPECT_EQ(conn_.client().getProperties(id).at("age"), Value{int64_t{31}});
  EXPECT_TRUE(person_.index().query(Query("age", int64_t{30})).empty());
  EXPECT_TRUE(person_.index().query(Query("name", std::string("alice"))).empty());
  EXPECT_EQ(person_.index().query(Query("name", std::string("alicia"))).size(), 1u);

  // resaving unchanged values must not trip over the node's own entries
  EXPECT_NO_THROW(p.save());
  EXPECT_EQ(person_.index().query(Query("name", std::string("alicia"))).size(), 1u);
}

TEST_F(GraphTest, ResaveConflictSurfacesWithoutRollback)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);

  bob.set("name", Value{std::string("alice")});
  EXPECT_THROW(bob.save(), NotUnique);

  // bob stays persisted with the overwritten properties
  EXPECT_TRUE(bob.persisted());
  EXPECT_EQ(conn_.client().getProperties(bob.id()).at("name"), Value{std::string("alice")});
  auto byName = person_.index().query(Query("name", std::string("alice")));
  ASSERT_EQ(byName.size(), 1u);
  EXPECT_EQ(byName[0].id, alice.id());
}

TEST_F(GraphTest, RemoveDeletesNodeAndRelationships)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  alice.rel("friends").relate(bob);
  uint64_t bobId = bob.id();

  bob.remove();
  EXPECT_FALSE(bob.persisted());
  EXPECT_THROW(conn_.client().getNode(bobId), MdbError);
  EXPECT_TRUE(conn_.client().getRelatedNodes(alice.id(), Direction::Out, "KNOWS").empty());
  EXPECT_TRUE(person_.index().query(Query("name", std::string("bob"))).empty());
  EXPECT_EQ(countCategoryMembers(conn_.client(), conn_.category("Person"), "PERSON"), 1u);

  // a fresh manager sees bob gone
  auto reloaded = NodeIndex(person_).get(PropertyMap{{"name", Value{std::string("alice")}}});
  EXPECT_TRUE(reloaded.rel("friends").all().empty());

  EXPECT_THROW(bob.remove(), NodeNotPersisted);
}

TEST_F(GraphTest, RemoveTransientThrows)
{
  auto p = person("alice", 30);
  EXPECT_THROW(p.remove(), NodeNotPersisted);
}

TEST_F(GraphTest, CopiesKeepIdentityButNotCaches)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  alice.rel("friends").relate(bob);
  EXPECT_EQ(alice.rel("friends").cachedCount(), 1u);

  MappedNode copy = alice;
  EXPECT_EQ(copy.id(), alice.id());
  EXPECT_EQ(copy.rel("friends").cachedCount(), 0u);
  EXPECT_TRUE(copy.rel("friends").isRelated(bob));

  MappedNode moved = std::move(copy);
  EXPECT_EQ(moved.id(), alice.id());
  // the moved manager now answers for its new owner
  EXPECT_EQ(moved.rel("friends").all().size(), 1u);
}
