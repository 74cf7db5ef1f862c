/*
 * Rmbg
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include <Rmbg/Core/Errors.hpp>
#include <Rmbg/Crop/CropGeometry.hpp>

#include "../GenericImage.hpp"

using namespace Rmbg::Crop;
using namespace Rmbg::Image;

namespace {

ObjectBounds boundsOf(std::size_t minX, std::size_t minY, std::size_t maxX, std::size_t maxY)
{
	ObjectBounds bounds;
	bounds.minX = minX;
	bounds.minY = minY;
	bounds.maxX = maxX;
	bounds.maxY = maxY;
	bounds.width = maxX - minX;
	bounds.height = maxY - minY;
	bounds.centerX = (minX + maxX) / 2;
	bounds.centerY = (minY + maxY) / 2;
	return bounds;
}

} // anonymous namespace

TEST(CropConfigTest, Defaults)
{
	const CropConfig config;
	EXPECT_EQ(config.margin, 0);
	EXPECT_EQ(config.marginPercent, 0.0);
	EXPECT_EQ(config.minThreshold, 10);
	EXPECT_FALSE(config.squareCrop);
	EXPECT_EQ(CropConfig::defaults().margin, 20);
}

TEST(CropGeometryTest, ZeroMarginIsTight)
{
	const CropRect rect = computeCropRect(boundsOf(40, 40, 60, 60), 1.0, 1.0, CropConfig{}, 100, 100);
	EXPECT_EQ(rect, (CropRect{40, 40, 20, 20}));
}

TEST(CropGeometryTest, FixedMarginPadsEverySide)
{
	CropConfig config;
	config.margin = 5;
	const CropRect rect = computeCropRect(boundsOf(40, 40, 60, 60), 1.0, 1.0, config, 100, 100);
	EXPECT_EQ(rect, (CropRect{35, 35, 30, 30}));
}

TEST(CropGeometryTest, PercentMarginUsesObjectSize)
{
	CropConfig config;
	config.marginPercent = 0.5;
	const CropRect rect = computeCropRect(boundsOf(40, 40, 60, 60), 1.0, 1.0, config, 100, 100);
	EXPECT_EQ(rect.width, 40u);
	EXPECT_EQ(rect.height, 40u);
}

TEST(CropGeometryTest, PercentMarginTakesLargerAxisUniformly)
{
	CropConfig config;
	config.marginPercent = 0.1;
	// 40 wide, 10 tall: percent margins are 4 and 1, so 4 on every side.
	const CropRect rect = computeCropRect(boundsOf(30, 50, 70, 60), 1.0, 1.0, config, 100, 100);
	EXPECT_EQ(rect, (CropRect{26, 46, 48, 18}));
}

TEST(CropGeometryTest, LargerOfFixedAndPercentWins)
{
	CropConfig config;
	config.margin = 7;
	config.marginPercent = 0.1;
	const CropRect rect = computeCropRect(boundsOf(40, 40, 60, 60), 1.0, 1.0, config, 100, 100);
	EXPECT_EQ(rect, (CropRect{33, 33, 34, 34}));
}

TEST(CropGeometryTest, SquareCropEqualizesSides)
{
	CropConfig config;
	config.squareCrop = true;
	const CropRect rect = computeCropRect(boundsOf(30, 45, 70, 55), 1.0, 1.0, config, 100, 100);
	EXPECT_EQ(rect.width, rect.height);
	EXPECT_EQ(rect, (CropRect{30, 30, 40, 40}));
}

TEST(CropGeometryTest, SquareCropWithOddDifferenceIsStillSquare)
{
	CropConfig config;
	config.squareCrop = true;
	const CropRect rect = computeCropRect(boundsOf(10, 40, 20, 61), 1.0, 1.0, config, 100, 100);
	EXPECT_EQ(rect.width, rect.height);
	EXPECT_EQ(rect.width, 21u);
}

TEST(CropGeometryTest, SquareCropMayBeTruncatedAtEdge)
{
	CropConfig config;
	config.squareCrop = true;
	const CropRect rect = computeCropRect(boundsOf(0, 10, 4, 90), 1.0, 1.0, config, 20, 100);
	EXPECT_EQ(rect.x, 0u);
	EXPECT_EQ(rect.width, 20u);
	EXPECT_EQ(rect.height, 80u);
}

TEST(CropGeometryTest, MarginIsClippedToImage)
{
	CropConfig config;
	config.margin = 50;
	const CropRect rect = computeCropRect(boundsOf(10, 10, 20, 20), 1.0, 1.0, config, 64, 48);
	EXPECT_EQ(rect, (CropRect{0, 0, 64, 48}));
}

TEST(CropGeometryTest, ScalesMaskBoundsIntoImageSpace)
{
	const CropRect rect = computeCropRect(boundsOf(10, 20, 30, 40), 2.0, 0.5, CropConfig{}, 100, 100);
	EXPECT_EQ(rect, (CropRect{20, 10, 40, 10}));
}

TEST(CropGeometryTest, PointObjectStillYieldsAPixel)
{
	const CropRect rect = computeCropRect(boundsOf(99, 99, 99, 99), 1.0, 1.0, CropConfig{}, 100, 100);
	EXPECT_EQ(rect, (CropRect{99, 99, 1, 1}));
}

TEST(CropGeometryTest, RejectsNegativeMargin)
{
	CropConfig config;
	config.margin = -1;
	EXPECT_THROW(computeCropRect(boundsOf(1, 1, 2, 2), 1.0, 1.0, config, 10, 10), std::invalid_argument);
}

TEST(CropToObjectTest, CropsPackedImage)
{
	PackedImage image(100, 100, PixelFormat::BGRA);
	image.fill(kWhite);
	image.setPixel(40, 40, {1, 2, 3, 255});

	Mask mask(100, 100, 0);
	for (std::size_t y = 40; y <= 60; ++y) {
		for (std::size_t x = 40; x <= 60; ++x) {
			mask.set(x, y, 255);
		}
	}

	const PackedImage cropped = cropToObject(image, mask, CropConfig{});
	EXPECT_EQ(cropped.getWidth(), 20u);
	EXPECT_EQ(cropped.getHeight(), 20u);
	EXPECT_EQ(cropped.getFormat(), PixelFormat::BGRA);
	EXPECT_EQ(cropped.getPixel(0, 0), (ColorRGBA{1, 2, 3, 255}));
}

TEST(CropToObjectTest, CropsGenericImageWithScale)
{
	GenericImage image(40, 40);
	image.setPixel(8, 8, kBlack);

	Mask mask(10, 10, 0);
	mask.set(2, 2, 255);
	mask.set(5, 5, 255);

	const PackedImage cropped = cropToObject(image, mask, CropConfig{}, 4.0, 4.0);
	EXPECT_EQ(cropped.getWidth(), 12u);
	EXPECT_EQ(cropped.getHeight(), 12u);
	EXPECT_EQ(cropped.getPixel(0, 0), kBlack);
}

TEST(CropToObjectTest, EmptyMaskIsInvalid)
{
	PackedImage image(10, 10);
	EXPECT_THROW(cropToObject(image, Mask{}, CropConfig{}), Rmbg::Core::InvalidMaskError);
}

TEST(CropToObjectTest, BlankMaskHasNoObject)
{
	PackedImage image(10, 10);
	EXPECT_THROW(cropToObject(image, Mask(10, 10, 0), CropConfig{}), Rmbg::Core::NoObjectDetectedError);
}
