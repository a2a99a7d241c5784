// SPDX-License-Identifier: Apache-2.0
#include <tailview/ModalFrame.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tailview;

TEST_CASE("ModalFrame: geometry inside the list area", "[viewer][modal]")
{
    auto const frame = ModalFrame::forScreen(80, 23);
    CHECK(frame.top == 3);
    CHECK(frame.left == 3);
    CHECK(frame.innerWidth == 72);
    CHECK(frame.innerHeight == 17);
    CHECK(frame.frameWidth() == 76);
    CHECK(frame.contentTop() == 4);
    CHECK(frame.contentLeft() == 5);
}

TEST_CASE("ModalFrame: clicks map to content rows only inside the frame", "[viewer][modal]")
{
    auto const frame = ModalFrame::forScreen(80, 23);

    CHECK(frame.contentRowAt(5, 4) == 0);
    CHECK(frame.contentRowAt(76, 20) == 16);
    CHECK(frame.contentRowAt(40, 10) == 6);

    SECTION("borders")
    {
        CHECK_FALSE(frame.contentRowAt(10, 3).has_value());
        CHECK_FALSE(frame.contentRowAt(10, 21).has_value());
        CHECK_FALSE(frame.contentRowAt(4, 10).has_value());
        CHECK_FALSE(frame.contentRowAt(77, 10).has_value());
    }

    SECTION("outside the frame")
    {
        CHECK_FALSE(frame.contentRowAt(1, 1).has_value());
        CHECK_FALSE(frame.contentRowAt(40, 23).has_value());
        CHECK_FALSE(frame.contentRowAt(80, 10).has_value());
    }
}

TEST_CASE("ModalFrame: tiny screens keep one content cell", "[viewer][modal]")
{
    auto const frame = ModalFrame::forScreen(5, 3);
    CHECK(frame.innerWidth == 1);
    CHECK(frame.innerHeight == 1);
    CHECK(frame.contentRowAt(5, 4) == 0);
    CHECK_FALSE(frame.contentRowAt(6, 4).has_value());
    CHECK_FALSE(frame.contentRowAt(5, 5).has_value());
}
