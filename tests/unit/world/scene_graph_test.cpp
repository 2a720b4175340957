#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "ftr/world/scene_graph.hpp"

using namespace ftr::world;

namespace {

Collider groundSlab(float topY) {
    Collider collider;
    collider.bounds.center = {0.0f, topY - 1.0f, 0.0f};
    collider.bounds.halfExtents = {50.0f, 1.0f, 50.0f};
    return collider;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Hierarchy
// ═══════════════════════════════════════════════════════════════════════════

TEST(SceneGraphTest, CreateNodeWiresParentAndChildren) {
    SceneGraph graph("Town");
    auto root = graph.createNode("House");
    auto child = graph.createNode("PlayerChar_1", root, {1.0f, 0.0f, 0.0f});

    EXPECT_TRUE(graph.isAlive(root));
    EXPECT_EQ(graph.parentOf(child), root);
    ASSERT_EQ(graph.childrenOf(root).size(), 1u);
    EXPECT_EQ(graph.childrenOf(root)[0], child);
    EXPECT_EQ(graph.nodeName(child), "PlayerChar_1");
    EXPECT_EQ(graph.sceneOf(child), "Town");
    EXPECT_EQ(rootOf(graph, child), root);
    EXPECT_TRUE(isInHierarchy(graph, child, root));
    EXPECT_FALSE(isInHierarchy(graph, root, child));
}

TEST(SceneGraphTest, DestroyRemovesSubtree) {
    SceneGraph graph;
    auto root = graph.createNode("Root");
    auto child = graph.createNode("Child", root);
    auto grandchild = graph.createNode("Grandchild", child);

    graph.destroyNode(child);

    EXPECT_TRUE(graph.isAlive(root));
    EXPECT_FALSE(graph.isAlive(child));
    EXPECT_FALSE(graph.isAlive(grandchild));
    EXPECT_TRUE(graph.childrenOf(root).empty());
}

TEST(SceneGraphTest, DeadNodeQueriesThrow) {
    SceneGraph graph;
    auto node = graph.createNode("Temp");
    graph.destroyNode(node);

    EXPECT_THROW((void)graph.nodeName(node), std::out_of_range);
    EXPECT_THROW((void)graph.positionOf(node), std::out_of_range);
    EXPECT_FALSE(graph.setPosition(node, Vector3::Zero()));
}

TEST(SceneGraphTest, SelfAndDescendantsIsDepthFirst) {
    SceneGraph graph;
    auto root = graph.createNode("Root");
    auto a = graph.createNode("A", root);
    auto a1 = graph.createNode("A1", a);
    auto b = graph.createNode("B", root);

    auto order = selfAndDescendants(graph, root);
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], root);
    EXPECT_EQ(order[1], a);
    EXPECT_EQ(order[2], a1);
    EXPECT_EQ(order[3], b);
}

// ═══════════════════════════════════════════════════════════════════════════
// Lookups
// ═══════════════════════════════════════════════════════════════════════════

TEST(SceneGraphTest, ComponentAndTagLookups) {
    SceneGraph graph;
    auto root = graph.createNode("Rig");
    auto body = graph.createNode("Body", root);
    graph.addComponent(body, "Character");
    graph.setTag(root, "Player");

    EXPECT_TRUE(graph.hasComponent(body, "Character"));
    EXPECT_FALSE(graph.hasComponent(root, "Character"));
    ASSERT_EQ(graph.findByComponent("Character").size(), 1u);
    EXPECT_EQ(graph.findByTag("Player"), root);
    EXPECT_FALSE(graph.findByTag("Enemy").has_value());
    EXPECT_EQ(graph.findByName("Body"), body);
}

TEST(SceneGraphTest, InventoriesCoverDescendants) {
    SceneGraph graph;
    auto root = graph.createNode("Rig");
    auto body = graph.createNode("Body", root);
    graph.attachInventory(root, std::make_unique<ReflectedInventory>("Pouch"));
    graph.attachInventory(body, std::make_unique<ReflectedInventory>("CharacterInventory"));

    EXPECT_EQ(graph.inventoriesOf(root).size(), 2u);
    ASSERT_EQ(graph.inventoriesOf(body).size(), 1u);
    EXPECT_EQ(graph.inventoriesOf(body)[0]->typeName(), "CharacterInventory");
}

// ═══════════════════════════════════════════════════════════════════════════
// Spatial state
// ═══════════════════════════════════════════════════════════════════════════

TEST(SceneGraphTest, SetPositionMovesSubtreeAndColliders) {
    SceneGraph graph;
    auto root = graph.createNode("Rig", {}, {0.0f, 0.0f, 0.0f});
    auto child = graph.createNode("Hand", root, {1.0f, 1.0f, 0.0f});
    Collider box;
    box.bounds.center = {1.0f, 1.0f, 0.0f};
    graph.setCollider(child, box);

    ASSERT_TRUE(graph.setPosition(root, {10.0f, 0.0f, -5.0f}));

    EXPECT_EQ(graph.positionOf(root), Vector3(10.0f, 0.0f, -5.0f));
    EXPECT_EQ(graph.positionOf(child), Vector3(11.0f, 1.0f, -5.0f));
    auto hit = graph.raycast({11.0f, 10.0f, -5.0f}, Vector3::Down(), 20.0f,
                             TriggerInteraction::Ignore);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->node, child);
}

TEST(SceneGraphTest, ZeroVelocityNeedsRigidbody) {
    SceneGraph graph;
    auto body = graph.createNode("Body");
    auto prop = graph.createNode("Prop");
    graph.addRigidbody(body, Rigidbody{{3.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}});

    EXPECT_TRUE(graph.zeroVelocity(body));
    EXPECT_EQ(graph.velocityOf(body), Vector3::Zero());
    EXPECT_FALSE(graph.zeroVelocity(prop));
    EXPECT_FALSE(graph.velocityOf(prop).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Raycast
// ═══════════════════════════════════════════════════════════════════════════

TEST(SceneGraphRaycastTest, HitsTopFaceOfGround) {
    SceneGraph graph;
    auto ground = graph.createNode("Ground");
    graph.setCollider(ground, groundSlab(2.0f));

    auto hit = graph.raycast({0.0f, 10.0f, 0.0f}, Vector3::Down(), 50.0f,
                             TriggerInteraction::Ignore);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->node, ground);
    EXPECT_NEAR(hit->point.y, 2.0f, 1e-4f);
    EXPECT_NEAR(hit->distance, 8.0f, 1e-4f);
    EXPECT_NEAR(hit->normal.y, 1.0f, 1e-6f);
}

TEST(SceneGraphRaycastTest, NearestHitWins) {
    SceneGraph graph;
    auto low = graph.createNode("Low");
    auto high = graph.createNode("High");
    graph.setCollider(low, groundSlab(0.0f));
    graph.setCollider(high, groundSlab(4.0f));

    auto hit = graph.raycast({0.0f, 10.0f, 0.0f}, Vector3::Down(), 50.0f,
                             TriggerInteraction::Ignore);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->node, high);
}

TEST(SceneGraphRaycastTest, TriggersIgnoredOnRequest) {
    SceneGraph graph;
    auto ground = graph.createNode("Ground");
    auto zone = graph.createNode("Zone");
    graph.setCollider(ground, groundSlab(0.0f));
    auto trigger = groundSlab(5.0f);
    trigger.isTrigger = true;
    graph.setCollider(zone, trigger);

    auto ignoring = graph.raycast({0.0f, 10.0f, 0.0f}, Vector3::Down(), 50.0f,
                                  TriggerInteraction::Ignore);
    ASSERT_TRUE(ignoring.has_value());
    EXPECT_EQ(ignoring->node, ground);

    auto colliding = graph.raycast({0.0f, 10.0f, 0.0f}, Vector3::Down(), 50.0f,
                                   TriggerInteraction::Collide);
    ASSERT_TRUE(colliding.has_value());
    EXPECT_EQ(colliding->node, zone);
}

TEST(SceneGraphRaycastTest, MissesOutOfRangeAndInsideStart) {
    SceneGraph graph;
    auto ground = graph.createNode("Ground");
    graph.setCollider(ground, groundSlab(0.0f));

    EXPECT_FALSE(graph.raycast({0.0f, 100.0f, 0.0f}, Vector3::Down(), 50.0f,
                               TriggerInteraction::Ignore).has_value());
    EXPECT_FALSE(graph.raycast({200.0f, 10.0f, 0.0f}, Vector3::Down(), 50.0f,
                               TriggerInteraction::Ignore).has_value());
    // Starting inside the slab does not report it.
    EXPECT_FALSE(graph.raycast({0.0f, -1.0f, 0.0f}, Vector3::Down(), 50.0f,
                               TriggerInteraction::Ignore).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Scenes
// ═══════════════════════════════════════════════════════════════════════════

TEST(SceneGraphSceneTest, UnloadKeepsPersistentNodes) {
    SceneGraph graph("Monsoon");
    auto player = graph.createNode("PlayerChar");
    auto weapon = graph.createNode("Sword", player);
    graph.markPersistent(player);
    auto tree = graph.createNode("Tree");

    graph.unloadScene("Monsoon");
    graph.setActiveScene("Cierzo");

    EXPECT_TRUE(graph.isAlive(player));
    EXPECT_TRUE(graph.isAlive(weapon));
    EXPECT_FALSE(graph.isAlive(tree));
    EXPECT_EQ(graph.sceneOf(weapon), kPersistentScene);
    EXPECT_EQ(graph.activeScene(), "Cierzo");
}

TEST(SceneGraphSceneTest, ActiveSceneRootsExcludePersistent) {
    SceneGraph graph("Berg");
    auto player = graph.createNode("PlayerChar");
    graph.markPersistent(player);
    auto gate = graph.createNode("Gate");
    graph.createNode("Hinge", gate);

    auto roots = graph.activeSceneRoots();
    ASSERT_EQ(roots.size(), 1u);
    EXPECT_EQ(roots[0], gate);
}

TEST(SceneGraphSceneTest, OnlyRootsBecomePersistent) {
    SceneGraph graph;
    auto root = graph.createNode("Root");
    auto child = graph.createNode("Child", root);
    EXPECT_THROW(graph.markPersistent(child), std::invalid_argument);
}

TEST(SceneGraphSceneTest, DestroyingCameraClearsMainCamera) {
    SceneGraph graph;
    auto camera = graph.createNode("Main Camera");
    graph.setMainCamera(camera);
    EXPECT_EQ(graph.mainCamera(), camera);

    graph.unloadScene(graph.activeScene());
    EXPECT_FALSE(graph.mainCamera().has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// segmentIntersectsAabb
// ═══════════════════════════════════════════════════════════════════════════

TEST(SegmentIntersectsAabbTest, ReportsEntryFraction) {
    Aabb box;
    box.center = {0.0f, 0.0f, 0.0f};
    box.halfExtents = {1.0f, 1.0f, 1.0f};

    float t = -1.0f;
    Vector3 normal;
    ASSERT_TRUE(segmentIntersectsAabb({-5.0f, 0.0f, 0.0f}, {5.0f, 0.0f, 0.0f}, box, &t, &normal));
    EXPECT_NEAR(t, 0.4f, 1e-5f);
    EXPECT_EQ(normal, Vector3(-1.0f, 0.0f, 0.0f));

    EXPECT_FALSE(segmentIntersectsAabb({-5.0f, 3.0f, 0.0f}, {5.0f, 3.0f, 0.0f}, box));
    EXPECT_FALSE(segmentIntersectsAabb({-5.0f, 0.0f, 0.0f}, {-3.0f, 0.0f, 0.0f}, box));
}
