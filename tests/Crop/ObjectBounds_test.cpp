/*
 * Rmbg
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <Rmbg/Crop/ObjectBounds.hpp>

using namespace Rmbg::Crop;
using Rmbg::Image::Mask;

TEST(ObjectBoundsTest, EmptyMaskIsNotFound)
{
	const Mask mask(32, 32, 0);
	EXPECT_FALSE(detectObjectBounds(mask, 10).has_value());
}

TEST(ObjectBoundsTest, BelowThresholdIsNotFound)
{
	const Mask mask(8, 8, 9);
	EXPECT_FALSE(detectObjectBounds(mask, 10).has_value());
	EXPECT_TRUE(detectObjectBounds(mask, 9).has_value());
}

TEST(ObjectBoundsTest, FindsExtentAndCenter)
{
	Mask mask(100, 80, 0);
	mask.set(40, 30, 255);
	mask.set(60, 30, 10);
	mask.set(50, 50, 200);

	const auto bounds = detectObjectBounds(mask, 10);
	ASSERT_TRUE(bounds.has_value());

	ObjectBounds expected;
	expected.minX = 40;
	expected.minY = 30;
	expected.maxX = 60;
	expected.maxY = 50;
	expected.width = 20;
	expected.height = 20;
	expected.centerX = 50;
	expected.centerY = 40;
	EXPECT_EQ(*bounds, expected);
}

TEST(ObjectBoundsTest, SinglePixelHasZeroExtent)
{
	Mask mask(5, 5, 0);
	mask.set(4, 0, 255);

	const auto bounds = detectObjectBounds(mask, 10);
	ASSERT_TRUE(bounds.has_value());
	EXPECT_EQ(bounds->minX, 4u);
	EXPECT_EQ(bounds->maxY, 0u);
	EXPECT_EQ(bounds->width, 0u);
	EXPECT_EQ(bounds->height, 0u);
}
