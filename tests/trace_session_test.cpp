#include "trace_session.hpp"
#include "geometry.hpp"

#include <gtest/gtest.h>

class TraceSessionTest : public ::testing::Test
{
protected:
    TraceSessionTest()
    {
        CorridorConfig c;
        c.smoothing = 0.f;
        session = TraceSession(c);
        session.load_image(800, 600);
    }

    void draw(const Path& stroke)
    {
        ASSERT_TRUE(session.pointer_down(stroke.front(), true));
        for (size_t i=1;i<stroke.size();++i) session.pointer_move(stroke[i]);
        session.frame();
        ASSERT_NE(session.pointer_up(), Release::Ignored);
    }

    TraceSession session;
};

TEST(trace_session, RefusesGestureWithoutImage)
{
    TraceSession s;
    EXPECT_FALSE(s.pointer_down({10,10}, true));
    EXPECT_TRUE(std::holds_alternative<Idle>(s.state()));
    EXPECT_FALSE(s.load_image(0, 600));
    EXPECT_FALSE(s.export_payload().has_value());
}

TEST_F(TraceSessionTest, IgnoresSecondaryButton)
{
    EXPECT_FALSE(session.pointer_down({10,10}, false));
    EXPECT_FALSE(session.capturing());
}

TEST_F(TraceSessionTest, EndToEndDrawThenSpliceCorrection)
{
    draw({{10,10},{50,10},{90,10}});
    Path p = session.committed();
    ASSERT_EQ(p.size(), 2u);
    EXPECT_FLOAT_EQ(p[0].x, 10.f);
    EXPECT_FLOAT_EQ(p[1].x, 90.f);

    session.set_edit_mode(true);
    session.set_show_handles(false);
    draw({{50,10},{50,40},{50,10}});
    p = session.committed();
    ASSERT_GE(p.size(), 2u);
    for (size_t i=1;i<p.size();++i)
        EXPECT_GT(distance(p[i-1], p[i]), 0.01f) << "duplicate at " << i;
}

TEST_F(TraceSessionTest, PreviewFollowsCaptureAndClearsOnRelease)
{
    ASSERT_TRUE(session.pointer_down({0,0}, true));
    session.pointer_move({40,0});
    session.pointer_move({80,0});
    EXPECT_TRUE(session.preview().empty());
    EXPECT_TRUE(session.frame());
    EXPECT_EQ(session.preview().size(), 2u);
    EXPECT_FALSE(session.frame());
    session.pointer_up();
    EXPECT_TRUE(session.preview().empty());
    EXPECT_EQ(session.committed().size(), 2u);
}

TEST_F(TraceSessionTest, CancelDuringCaptureLeavesPathUntouched)
{
    draw({{0,0},{100,0}});
    ASSERT_TRUE(session.pointer_down({300,300}, true));
    session.pointer_move({400,300});
    session.frame();
    EXPECT_TRUE(session.cancel());
    EXPECT_TRUE(std::holds_alternative<Idle>(session.state()));
    EXPECT_TRUE(session.preview().empty());
    Path p = session.committed();
    ASSERT_EQ(p.size(), 2u);
    EXPECT_FLOAT_EQ(p[1].x, 100.f);
    EXPECT_EQ(session.pointer_up(), Release::Ignored);
}

TEST_F(TraceSessionTest, PointerDownOnHandleStartsDrag)
{
    draw({{0,0},{100,0}});
    ASSERT_TRUE(session.pointer_down({101,2}, true));
    const auto* d = std::get_if<Dragging>(&session.state());
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->index, 1u);
    EXPECT_FALSE(session.capturing());

    EXPECT_TRUE(session.pointer_move({150,70}));
    EXPECT_TRUE(session.pointer_move({160,80}));
    Path p = session.committed();
    EXPECT_FLOAT_EQ(p[1].x, 160.f);
    EXPECT_FLOAT_EQ(p[1].y, 80.f);
    EXPECT_EQ(session.pointer_up(), Release::DragEnded);
    EXPECT_TRUE(std::holds_alternative<Idle>(session.state()));
}

TEST_F(TraceSessionTest, PointerUpReportsRejectedEditStroke)
{
    draw({{0,0},{100,0}});
    session.set_edit_mode(true);
    ASSERT_TRUE(session.pointer_down({400,400}, true));
    session.pointer_move({450,400});
    session.frame();
    EXPECT_EQ(session.pointer_up(), Release::Rejected);
    EXPECT_TRUE(std::holds_alternative<Idle>(session.state()));
    EXPECT_EQ(session.committed().size(), 2u);

    session.set_edit_mode(false);
    ASSERT_TRUE(session.pointer_down({110,0}, true));
    session.pointer_move({160,0});
    session.frame();
    EXPECT_EQ(session.pointer_up(), Release::Committed);
}

TEST_F(TraceSessionTest, CaptureAndDragAreExclusive)
{
    draw({{0,0},{100,0}});
    ASSERT_TRUE(session.pointer_down({0,0}, true));
    ASSERT_TRUE(session.dragging());
    EXPECT_FALSE(session.pointer_down({300,300}, true));
    EXPECT_TRUE(session.dragging());

    session.pointer_up();
    ASSERT_TRUE(session.pointer_down({300,300}, true));
    ASSERT_TRUE(session.capturing());
    EXPECT_FALSE(session.pointer_down({0,0}, true));
    EXPECT_TRUE(session.capturing());
}

TEST_F(TraceSessionTest, CancelDuringDragKeepsLastRelocate)
{
    draw({{0,0},{100,0}});
    ASSERT_TRUE(session.pointer_down({100,0}, true));
    session.pointer_move({120,30});
    EXPECT_TRUE(session.cancel());
    Path p = session.committed();
    EXPECT_FLOAT_EQ(p[1].x, 120.f);
    EXPECT_FLOAT_EQ(p[1].y, 30.f);
}

TEST_F(TraceSessionTest, UndoEndsDragSoStaleIndexIsNeverWritten)
{
    draw({{0,0},{100,0}});
    ASSERT_TRUE(session.pointer_down({100,0}, true));
    EXPECT_TRUE(session.undo());
    EXPECT_FALSE(session.dragging());
    EXPECT_FALSE(session.pointer_move({5,5}));
    EXPECT_TRUE(session.committed().empty());
}

TEST_F(TraceSessionTest, HiddenHandlesAreNotDraggable)
{
    draw({{0,0},{100,0}});
    session.set_show_handles(false);
    EXPECT_TRUE(session.handles().empty());
    ASSERT_TRUE(session.pointer_down({100,0}, true));
    EXPECT_TRUE(session.capturing());
}

TEST_F(TraceSessionTest, SettersClamp)
{
    session.set_corridor_px(-4);
    EXPECT_EQ(session.config().corridor_px, 1);
    session.set_corridor_px(1000000);
    EXPECT_EQ(session.config().corridor_px, kMaxCorridorPx);
    session.set_outside_fade(3.f);
    EXPECT_FLOAT_EQ(session.config().outside_fade, 1.f);
    session.set_marker_alpha(-1.f);
    EXPECT_FLOAT_EQ(session.config().marker_alpha, 0.f);
    session.set_smoothing(7.f);
    EXPECT_FLOAT_EQ(session.config().smoothing, 1.f);
    session.set_color("not-a-color");
    EXPECT_EQ(session.config().color, CorridorConfig{}.color);
    session.set_color("#00ff00");
    EXPECT_EQ(session.config().color, "#00ff00");
}

TEST_F(TraceSessionTest, ExportRefusedBelowTwoPoints)
{
    EXPECT_FALSE(session.export_payload().has_value());
    draw({{0,0},{100,0}});
    session.set_image_id("abc.png");
    auto payload = session.export_payload();
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(payload->points.size(), 2u);
    EXPECT_EQ(payload->image_id, "abc.png");
    session.undo();
    EXPECT_FALSE(session.export_payload().has_value());
}

TEST_F(TraceSessionTest, NewPathClears)
{
    draw({{0,0},{100,0}});
    EXPECT_TRUE(session.new_path());
    EXPECT_TRUE(session.committed().empty());
    EXPECT_FALSE(session.new_path());
}
