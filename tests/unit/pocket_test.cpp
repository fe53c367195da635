#include <gtest/gtest.h>
#include <entt/entt.hpp>

#include "carrom/components/basic.hpp"
#include "carrom/systems/pocket.hpp"

namespace {

entt::entity makeDisc(entt::registry& registry, int id, Position pos, Vector vel) {
    auto e = registry.create();
    registry.emplace<Components::Position>(e, pos);
    registry.emplace<Components::Velocity>(e, vel);
    registry.emplace<Components::Radius>(e, 15.0);
    registry.emplace<Components::DiscTag>(e, id, Components::DiscKind::RegularDark);
    return e;
}

} // namespace

TEST(PocketSystemTest, CaptureRequiresDistanceBelowRadiusMinusMargin) {
    Systems::PocketSystem pockets;

    // Default capture distance is 30 - 5 = 25 from (100, 100)
    EXPECT_TRUE(pockets.insidePocket(Position(115.0, 115.0)));     // ~21.2
    EXPECT_FALSE(pockets.insidePocket(Position(125.0, 100.0)));    // exactly 25
    EXPECT_TRUE(pockets.insidePocket(Position(124.99, 100.0)));
    EXPECT_FALSE(pockets.insidePocket(Position(400.0, 400.0)));
}

TEST(PocketSystemTest, AllFourCorners) {
    Systems::PocketSystem pockets;
    EXPECT_TRUE(pockets.insidePocket(Position(110.0, 110.0)));
    EXPECT_TRUE(pockets.insidePocket(Position(690.0, 110.0)));
    EXPECT_TRUE(pockets.insidePocket(Position(110.0, 690.0)));
    EXPECT_TRUE(pockets.insidePocket(Position(690.0, 690.0)));
    EXPECT_FALSE(pockets.insidePocket(Position(400.0, 110.0)));
}

TEST(PocketSystemTest, UpdateMarksCapturedInListOrder) {
    entt::registry registry;
    auto far = makeDisc(registry, 1, Position(400.0, 400.0), Vector(1.0, 0.0));
    auto second = makeDisc(registry, 2, Position(690.0, 690.0), Vector(2.0, 2.0));
    auto third = makeDisc(registry, 3, Position(110.0, 110.0), Vector(-1.0, -1.0));

    Systems::PocketSystem pockets;
    pockets.update(registry, {far, second, third});

    ASSERT_EQ(pockets.captured().size(), 2u);
    EXPECT_EQ(pockets.captured()[0], second);
    EXPECT_EQ(pockets.captured()[1], third);

    EXPECT_FALSE(registry.any_of<Components::Captured>(far));
    EXPECT_TRUE(registry.any_of<Components::Captured>(second));
    EXPECT_TRUE(registry.get<Components::Velocity>(second).isZero());
}

TEST(PocketSystemTest, AlreadyCapturedIsNotReported) {
    entt::registry registry;
    auto e = makeDisc(registry, 1, Position(100.0, 100.0), Vector());
    registry.emplace<Components::Captured>(e);

    Systems::PocketSystem pockets;
    pockets.update(registry, {e});
    EXPECT_TRUE(pockets.captured().empty());
}

TEST(PocketSystemTest, MarginComesFromBoard) {
    BoardConfig board;
    board.captureMargin = 0.0;

    Systems::PocketSystem pockets;
    pockets.setBoardConfig(board);
    EXPECT_TRUE(pockets.insidePocket(Position(129.0, 100.0)));
}
