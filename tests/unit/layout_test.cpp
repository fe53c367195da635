#include <gtest/gtest.h>

#include "carrom/layouts/standard_layout.hpp"

namespace {

int countKind(const std::vector<DiscPlacement>& placements, Components::DiscKind kind) {
    int n = 0;
    for (const auto& p : placements) {
        if (p.kind == kind) {
            ++n;
        }
    }
    return n;
}

} // namespace

TEST(StandardLayoutTest, PieceCounts) {
    StandardLayout layout;
    auto placements = layout.coinPlacements(BoardConfig{});

    ASSERT_EQ(placements.size(), 24u);
    EXPECT_EQ(countKind(placements, Components::DiscKind::Queen), 1);
    EXPECT_EQ(countKind(placements, Components::DiscKind::RegularLight), 11);
    EXPECT_EQ(countKind(placements, Components::DiscKind::RegularDark), 12);
    EXPECT_EQ(countKind(placements, Components::DiscKind::Striker), 0);
}

TEST(StandardLayoutTest, QueenFirstAtCentre) {
    StandardLayout layout;
    BoardConfig board;
    auto placements = layout.coinPlacements(board);

    EXPECT_EQ(placements.front().kind, Components::DiscKind::Queen);
    EXPECT_EQ(placements.front().position, boardCenter(board));
}

TEST(StandardLayoutTest, RingsAlternateColours) {
    StandardLayout layout;
    auto placements = layout.coinPlacements(BoardConfig{});

    // Inner ring starts dark, middle ring light, outer ring dark
    EXPECT_EQ(placements[1].kind, Components::DiscKind::RegularDark);
    EXPECT_EQ(placements[2].kind, Components::DiscKind::RegularLight);
    EXPECT_EQ(placements[7].kind, Components::DiscKind::RegularLight);
    EXPECT_EQ(placements[8].kind, Components::DiscKind::RegularDark);
    EXPECT_EQ(placements[15].kind, Components::DiscKind::RegularDark);
    EXPECT_EQ(placements[16].kind, Components::DiscKind::RegularLight);
}

TEST(StandardLayoutTest, NoInitialOverlap) {
    StandardLayout layout;
    BoardConfig board;
    auto placements = layout.coinPlacements(board);

    for (std::size_t i = 0; i < placements.size(); ++i) {
        for (std::size_t j = i + 1; j < placements.size(); ++j) {
            EXPECT_GE(placements[i].position.dist(placements[j].position), 2.0 * board.coinRadius)
                << "coins " << i + 1 << " and " << j + 1;
        }
    }
}

TEST(StandardLayoutTest, Name) {
    StandardLayout layout;
    EXPECT_EQ(layout.name(), "standard");
}
