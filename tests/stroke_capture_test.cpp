#include "stroke_capture.hpp"

#include <gtest/gtest.h>

TEST(stroke_capture, BeginStartsScratchWithFirstSample)
{
    StrokeCapture cap;
    EXPECT_FALSE(cap.active());
    cap.begin({1,2});
    EXPECT_TRUE(cap.active());
    ASSERT_EQ(cap.scratch().size(), 1u);
    EXPECT_TRUE(cap.preview_pending());
}

TEST(stroke_capture, DecimatesByMinimumTravel)
{
    StrokeCapture cap;
    cap.begin({0,0});
    cap.flush_preview(0.f);
    cap.add_sample({1,0}, 1.8f);    // too close
    cap.add_sample({1.8f,0}, 1.8f); // exactly at the limit is kept
    cap.add_sample({2.5f,0}, 1.8f); // 0.7 from the last kept sample
    cap.add_sample({5,0}, 1.8f);
    ASSERT_EQ(cap.scratch().size(), 3u);
    EXPECT_FLOAT_EQ(cap.scratch()[1].x, 1.8f);
    EXPECT_FLOAT_EQ(cap.scratch()[2].x, 5.f);
}

TEST(stroke_capture, PreviewRecomputesCoalesce)
{
    StrokeCapture cap;
    cap.begin({0,0});
    EXPECT_TRUE(cap.flush_preview(0.f));
    EXPECT_FALSE(cap.flush_preview(0.f));

    EXPECT_TRUE(cap.add_sample({10,0}, 1.8f));
    EXPECT_FALSE(cap.add_sample({20,0}, 1.8f));
    EXPECT_FALSE(cap.add_sample({30,0}, 1.8f));
    EXPECT_TRUE(cap.preview_pending());

    // The single scheduled recompute reads every sample gathered so far.
    EXPECT_TRUE(cap.flush_preview(0.f));
    ASSERT_EQ(cap.preview().size(), 2u);
    EXPECT_FLOAT_EQ(cap.preview().back().x, 30.f);
    EXPECT_FALSE(cap.preview_pending());

    EXPECT_TRUE(cap.add_sample({30,40}, 1.8f));
}

TEST(stroke_capture, RejectedSampleDoesNotSchedule)
{
    StrokeCapture cap;
    cap.begin({0,0});
    cap.flush_preview(0.f);
    EXPECT_FALSE(cap.add_sample({0.5f,0}, 1.8f));
    EXPECT_FALSE(cap.preview_pending());
}

TEST(stroke_capture, IgnoresSamplesWhenIdle)
{
    StrokeCapture cap;
    EXPECT_FALSE(cap.add_sample({10,10}, 1.8f));
    EXPECT_TRUE(cap.scratch().empty());
}

TEST(stroke_capture, FinishHandsOverAndClears)
{
    StrokeCapture cap;
    cap.begin({0,0});
    cap.add_sample({10,0}, 1.8f);
    cap.flush_preview(0.f);
    Path out = cap.finish();
    EXPECT_EQ(out.size(), 2u);
    EXPECT_FALSE(cap.active());
    EXPECT_TRUE(cap.scratch().empty());
    EXPECT_TRUE(cap.preview().empty());
}

TEST(stroke_capture, CancelDiscardsScratchAndPreview)
{
    StrokeCapture cap;
    cap.begin({0,0});
    cap.add_sample({10,0}, 1.8f);
    cap.flush_preview(0.f);
    cap.cancel();
    EXPECT_FALSE(cap.active());
    EXPECT_TRUE(cap.scratch().empty());
    EXPECT_TRUE(cap.preview().empty());
    EXPECT_FALSE(cap.flush_preview(0.f));
}
