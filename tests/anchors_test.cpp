#include "anchors.hpp"
#include "path_editor.hpp"

#include <gtest/gtest.h>

TEST(anchors, OneHandlePerPoint)
{
    Path p{{0,0},{10,0},{20,5}};
    auto h = handle_positions(p);
    ASSERT_EQ(h.size(), 3u);
    EXPECT_FLOAT_EQ(h[2].y, 5.f);
    EXPECT_TRUE(handle_positions({}).empty());
}

TEST(anchors, PickWithinRadius)
{
    Path p{{0,0},{10,0},{20,0}};
    auto idx = pick_handle(p, {11,2}, 6.f);
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(*idx, 1u);
}

TEST(anchors, PickMissesOutsideRadius)
{
    Path p{{0,0},{100,0}};
    EXPECT_FALSE(pick_handle(p, {50,0}, 6.f).has_value());
    EXPECT_FALSE(pick_handle({}, {0,0}, 6.f).has_value());
}

TEST(anchors, DragRelocatesWithoutSmoothing)
{
    PathEditor ed;
    CorridorConfig c;
    c.smoothing = 0.f;
    ed.commit({{0,0},{50,40},{100,0}}, c);
    ASSERT_EQ(ed.size(), 3u);
    // Dragged onto the chord: smoothing would drop it, a drag keeps it.
    ASSERT_TRUE(drag_anchor(ed, 1, {50,0}));
    ASSERT_EQ(ed.size(), 3u);
    EXPECT_FLOAT_EQ(ed.path()[1].x, 50.f);
    EXPECT_FLOAT_EQ(ed.path()[1].y, 0.f);
    EXPECT_FALSE(drag_anchor(ed, 7, {1,1}));
}
