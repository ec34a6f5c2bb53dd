#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace asterism;
using asterism::test::GraphTest;

TEST_F(GraphTest, RelateThenAllListsTargetOnce)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);

  alice.rel("friends").relate(bob);
  alice.rel("friends").relate(bob);

  auto friends = alice.rel("friends").all();
  ASSERT_EQ(friends.size(), 1u);
  EXPECT_EQ(friends[0]->id(), bob.id());
  EXPECT_EQ(friends[0]->get("name"), Value{std::string("bob")});

  // get-or-create in the store too
  EXPECT_EQ(conn_.client().getRelationshipsWith(alice.id(), bob.id(), Direction::Out, "KNOWS").size(), 1u);
}

TEST_F(GraphTest, AllLoadsFromStoreWhenCacheIsEmpty)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  auto carol = savedPerson("carol", 50);
  alice.rel("friends").relate(bob);
  alice.rel("friends").relate(carol);

  auto reloaded = NodeIndex(person_).get(PropertyMap{{"name", Value{std::string("alice")}}});
  EXPECT_EQ(reloaded.rel("friends").cachedCount(), 0u);
  auto friends = reloaded.rel("friends").all();
  ASSERT_EQ(friends.size(), 2u);
  EXPECT_EQ(reloaded.rel("friends").cachedCount(), 2u);
  for (const auto &f : friends)
  {
    EXPECT_EQ(f->typeName(), "Person");
    EXPECT_TRUE(f->persisted());
  }
}

TEST_F(GraphTest, AllWithNoEdgesLeavesCacheEmpty)
{
  auto alice = savedPerson("alice", 30);
  EXPECT_TRUE(alice.rel("friends").all().empty());
  EXPECT_EQ(alice.rel("friends").cachedCount(), 0u);
}

TEST_F(GraphTest, AllReturnsCacheVerbatimOnceLoaded)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  auto carol = savedPerson("carol", 50);
  alice.rel("friends").relate(bob);
  ASSERT_EQ(alice.rel("friends").all().size(), 1u);

  // an edge made behind the manager's back is not seen until reload
  conn_.client().getOrCreateRelationship(alice.id(), "KNOWS", carol.id());
  EXPECT_EQ(alice.rel("friends").all().size(), 1u);
}

TEST_F(GraphTest, UnrelateRemovesEdgeAndCacheEntry)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  alice.rel("friends").relate(bob);

  alice.rel("friends").unrelate(bob);
  EXPECT_TRUE(alice.rel("friends").all().empty());
  EXPECT_FALSE(alice.rel("friends").isRelated(bob));
  EXPECT_TRUE(conn_.client().getRelationshipsWith(alice.id(), bob.id(), Direction::Out, "KNOWS").empty());
}

TEST_F(GraphTest, UnrelateNeverRelatedIsNoOp)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  EXPECT_NO_THROW(alice.rel("friends").unrelate(bob));
}

TEST_F(GraphTest, UnrelateWithParallelEdgesIsAmbiguous)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  auto &store = local().store();
  uint32_t knows = store.getOrCreateRelTypeId(GetOrCreateRelTypeIdParams{"KNOWS", true});
  store.addEdge(AddEdgeParams{alice.id(), bob.id(), knows});
  store.addEdge(AddEdgeParams{alice.id(), bob.id(), knows});

  EXPECT_THROW(alice.rel("friends").unrelate(bob), MultipleRelationships);
  EXPECT_EQ(conn_.client().getRelationshipsWith(alice.id(), bob.id(), Direction::Out, "KNOWS").size(), 2u);
}

TEST_F(GraphTest, RelateChecksTargetTypeAndPersistence)
{
  auto alice = savedPerson("alice", 30);
  auto acme = savedCompany("acme", "Oslo");
  auto ghost = person("ghost", 99);

  EXPECT_THROW(alice.rel("friends").relate(acme), TypeMismatch);
  EXPECT_THROW(alice.rel("friends").relate(ghost), NodeNotPersisted);
  EXPECT_EQ(alice.rel("friends").cachedCount(), 0u);

  auto transientOrigin = person("dora", 20);
  EXPECT_THROW(transientOrigin.rel("friends").relate(alice), NodeNotPersisted);
  EXPECT_THROW(alice.rel("enemies"), SchemaError);
}

TEST_F(GraphTest, IncomingDefinitionsPointEdgesAtOrigin)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);

  // bob follows alice
  alice.rel("followers").relate(bob);
  EXPECT_EQ(conn_.client().getRelationshipsWith(bob.id(), alice.id(), Direction::Out, "FOLLOWS").size(), 1u);
  EXPECT_TRUE(alice.rel("followers").isRelated(bob));

  auto fresh = NodeIndex(person_).get(PropertyMap{{"name", Value{std::string("alice")}}});
  auto followers = fresh.rel("followers").all();
  ASSERT_EQ(followers.size(), 1u);
  EXPECT_EQ(followers[0]->id(), bob.id());
  EXPECT_TRUE(fresh.rel("friends").all().empty());
}

TEST_F(GraphTest, CrossTypeRelationshipsSeenFromBothEnds)
{
  auto alice = savedPerson("alice", 30);
  auto acme = savedCompany("acme", "Oslo");

  alice.rel("employer").relate(acme);
  auto staff = acme.rel("staff").all();
  ASSERT_EQ(staff.size(), 1u);
  EXPECT_EQ(staff[0]->id(), alice.id());

  acme.rel("staff").unrelate(alice);
  EXPECT_FALSE(acme.rel("staff").isRelated(alice));
  // alice's manager still has acme cached; only its own unrelate clears it
  EXPECT_TRUE(alice.rel("employer").isRelated(acme));
  auto fresh = NodeIndex(person_).get(PropertyMap{{"name", Value{std::string("alice")}}});
  EXPECT_FALSE(fresh.rel("employer").isRelated(acme));
}

TEST_F(GraphTest, IsRelatedAsksStoreOnCacheMiss)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  conn_.client().getOrCreateRelationship(alice.id(), "KNOWS", bob.id());

  EXPECT_TRUE(alice.rel("friends").isRelated(bob));
  // the store answer is not cached
  EXPECT_EQ(alice.rel("friends").cachedCount(), 0u);
  EXPECT_FALSE(bob.rel("friends").isRelated(alice));
}

TEST_F(GraphTest, ManagersFollowMovedNodes)
{
  std::vector<MappedNode> people;
  people.push_back(savedPerson("alice", 30));
  auto bob = savedPerson("bob", 40);
  people.front().rel("friends").relate(bob);

  // force reallocation
  for (int i = 0; i < 16; ++i)
    people.push_back(person("p" + std::to_string(i), i));

  EXPECT_EQ(people.front().rel("friends").all().size(), 1u);
  people.front().rel("friends").unrelate(bob);
  EXPECT_TRUE(conn_.client().getRelationshipsWith(people.front().id(), bob.id(), Direction::Out, "KNOWS").empty());
}

TEST_F(GraphTest, EitherRelateReusesEdgeFromOtherEnd)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);

  alice.rel("peers").relate(bob);
  bob.rel("peers").relate(alice);
  EXPECT_EQ(conn_.client().getRelationshipsWith(alice.id(), bob.id(), Direction::Both, "PEER").size(), 1u);
  EXPECT_TRUE(bob.rel("peers").isRelated(alice));

  EXPECT_NO_THROW(alice.rel("peers").unrelate(bob));
  EXPECT_TRUE(conn_.client().getRelationshipsWith(alice.id(), bob.id(), Direction::Both, "PEER").empty());
  bob.rel("peers").unrelate(alice);
  EXPECT_FALSE(bob.rel("peers").isRelated(alice));
}

TEST_F(GraphTest, AllKeepsRelateOrder)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  auto carol = savedPerson("carol", 50);
  auto dave = savedPerson("dave", 60);

  alice.rel("friends").relate(dave);
  alice.rel("friends").relate(bob);
  alice.rel("friends").relate(carol);
  alice.rel("friends").unrelate(bob);

  auto friends = alice.rel("friends").all();
  ASSERT_EQ(friends.size(), 2u);
  EXPECT_EQ(friends[0]->id(), dave.id());
  EXPECT_EQ(friends[1]->id(), carol.id());
  EXPECT_TRUE(alice.rel("friends").isRelated(carol));
}

TEST_F(GraphTest, AllKeepsStoreOrderOnLoad)
{
  auto alice = savedPerson("alice", 30);
  auto bob = savedPerson("bob", 40);
  auto dave = savedPerson("dave", 60);

  // outgoing edges are listed before incoming ones
  alice.rel("peers").relate(dave);
  bob.rel("peers").relate(alice);

  auto fresh = NodeIndex(person_).get(PropertyMap{{"name", Value{std::string("alice")}}});
  auto peers = fresh.rel("peers").all();
  ASSERT_EQ(peers.size(), 2u);
  EXPECT_EQ(peers[0]->id(), dave.id());
  EXPECT_EQ(peers[1]->id(), bob.id());
}
