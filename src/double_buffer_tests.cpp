//
// Unit tests for the frame double buffer.
//
// Copyright (c) 2025 Serge Vakulenko
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#include <gtest/gtest.h>

#include <cstring>
#include <random>
#include <tuple>
#include <vector>

#include "double_buffer.h"
#include "test_fakes.h"

class DoubleBufferTest : public ::testing::Test {
protected:
    void SetUp() override { std::tie(buffer, writer) = DoubleBuffer::create(40, 30); }

    // Paint a black rectangle on the back surface and mark it dirty.
    void paint(const SDL_Rect &rect)
    {
        fill_rect(writer->get_back(), rect, COLOR_BLACK);
        absorb_rect(writer->dirty_rect, rect);
    }

    bool back_matches_front()
    {
        bool same = false;
        buffer->with_front([&](const SDL_Surface *front) {
            const SDL_Surface *back = writer->get_back();
            same = std::memcmp(front->pixels, back->pixels,
                               static_cast<size_t>(front->pitch) * front->h) == 0;
        });
        return same;
    }

    std::shared_ptr<DoubleBuffer> buffer;
    std::unique_ptr<BufferWriter> writer;
};

TEST_F(DoubleBufferTest, StartsWhiteAndClean)
{
    EXPECT_EQ(buffer->get_width(), 40);
    EXPECT_EQ(buffer->get_height(), 30);
    EXPECT_FALSE(buffer->is_dirty());
    buffer->with_front([](const SDL_Surface *front) {
        EXPECT_EQ(pixel_level(front, 0, 0), 255);
        EXPECT_EQ(pixel_level(front, 39, 29), 255);
    });
    EXPECT_TRUE(back_matches_front());
}

TEST_F(DoubleBufferTest, SwapPublishesFrameAndCopiesBack)
{
    SDL_Rect rect = { 2, 3, 5, 4 };
    paint(rect);
    buffer->swap(*writer);

    buffer->with_front([](const SDL_Surface *front) {
        EXPECT_EQ(pixel_level(front, 2, 3), 0);
        EXPECT_EQ(pixel_level(front, 6, 6), 0);
        EXPECT_EQ(pixel_level(front, 7, 7), 255);
    });
    EXPECT_TRUE(back_matches_front());
    EXPECT_FALSE(writer->dirty_rect.has_value());

    std::vector<SDL_Rect> rects = buffer->drain_dirty_rects();
    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], rect);
    EXPECT_TRUE(buffer->drain_dirty_rects().empty());
    EXPECT_FALSE(buffer->is_dirty());
}

TEST_F(DoubleBufferTest, RandomSwapsKeepBackInSync)
{
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> coord(0, 35);
    std::uniform_int_distribution<int> size(1, 5);
    std::bernoulli_distribution black(0.5);

    for (int i = 0; i < 200; ++i) {
        SDL_Rect rect = { coord(rng), coord(rng) % 26, size(rng), size(rng) };
        fill_rect(writer->get_back(), rect, black(rng) ? COLOR_BLACK : COLOR_WHITE);
        if (i % 3 != 0) {
            writer->dirty_rect = rect;
        }
        const SDL_Surface *back = writer->get_back();
        std::vector<Uint8> frame(static_cast<const Uint8 *>(back->pixels),
                                 static_cast<const Uint8 *>(back->pixels) +
                                     static_cast<size_t>(back->pitch) * back->h);

        buffer->swap(*writer);

        // The frame just drawn is published, and the writer continues from it.
        bool published = false;
        buffer->with_front([&](const SDL_Surface *front) {
            published = std::memcmp(front->pixels, frame.data(), frame.size()) == 0;
        });
        ASSERT_TRUE(published) << "after swap " << i;
        ASSERT_TRUE(back_matches_front()) << "after swap " << i;

        if (i % 7 == 0) {
            buffer->take_dirty();
        }
    }
}

TEST_F(DoubleBufferTest, SwapWithoutChangesQueuesNothing)
{
    buffer->swap(*writer);
    EXPECT_FALSE(buffer->is_dirty());
    EXPECT_FALSE(buffer->take_full_refresh());
}

TEST_F(DoubleBufferTest, OverflowTurnsIntoFullRefresh)
{
    for (size_t i = 0; i < DoubleBuffer::MAX_DIRTY_RECTS; ++i) {
        paint({ static_cast<int>(i), 0, 1, 1 });
        buffer->swap(*writer);
    }
    EXPECT_TRUE(buffer->is_dirty());

    // 17th rectangle does not fit.
    paint({ 0, 10, 1, 1 });
    buffer->swap(*writer);

    // While the flag is set, nothing more is queued.
    paint({ 0, 20, 1, 1 });
    buffer->swap(*writer);

    EXPECT_TRUE(buffer->drain_dirty_rects().empty());
    EXPECT_TRUE(buffer->is_dirty());
    EXPECT_TRUE(buffer->take_full_refresh());
    EXPECT_FALSE(buffer->take_full_refresh());
    EXPECT_FALSE(buffer->is_dirty());

    // Incremental updates resume afterwards.
    paint({ 5, 5, 2, 2 });
    buffer->swap(*writer);
    EXPECT_EQ(buffer->drain_dirty_rects().size(), 1u);
}

TEST_F(DoubleBufferTest, TakeDirtyReturnsEverything)
{
    paint({ 0, 0, 2, 2 });
    buffer->swap(*writer);
    paint({ 10, 10, 2, 2 });
    buffer->swap(*writer);

    DirtyState state = buffer->take_dirty();
    EXPECT_FALSE(state.full_refresh);
    ASSERT_EQ(state.rects.size(), 2u);
    EXPECT_EQ(state.rects[0], (SDL_Rect{ 0, 0, 2, 2 }));
    EXPECT_EQ(state.rects[1], (SDL_Rect{ 10, 10, 2, 2 }));
    EXPECT_FALSE(buffer->is_dirty());
}

TEST_F(DoubleBufferTest, BlitFrontCopiesRegion)
{
    paint({ 4, 4, 3, 3 });
    buffer->swap(*writer);

    SurfacePtr target = create_surface(100, 100);
    buffer->blit_front(target.get(), { 4, 4, 3, 3 }, 50, 60);

    EXPECT_EQ(pixel_level(target.get(), 50, 60), 0);
    EXPECT_EQ(pixel_level(target.get(), 52, 62), 0);
    EXPECT_EQ(pixel_level(target.get(), 53, 63), 255);
    EXPECT_EQ(pixel_level(target.get(), 4, 4), 255);
}
