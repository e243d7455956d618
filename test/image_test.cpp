// $Id$

/*
 * Copyright 2015 Don Kinzer
 *
 * This program is free software; you can redistribute it and/or modify it under
 * the terms of the GNU General Public License as published by the Free Software
 * Foundation; either version 2 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along with
 * this program; if not, write to the Free Software Foundation, Inc., 51 Franklin
 * Street, Fifth Floor, Boston, MA 02110-1301 USA.
 *
 */

/** include files **/
#include "image.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

/** local definitions **/

#define TEENSY40_PID		0x0478
#define TEENSY41_PID		0x0479
#define TEENSY32_PID		0x0484

// an application session followed by a loader session at RAM addresses
#define EHEX_APPLICATION \
	":0200000460009A\n" \
	":020000001122CB\n" \
	":00000001FF\n"
#define EHEX_LOADER \
	":020000042020BA\n" \
	":02010000444574\n" \
	":00000001FF\n"

/** private functions **/

static void
setText(FirmwareImage& image, const std::string& text, const char *filename)
{
	image.SetData((const uint8_t *)text.data(), text.size(), filename);
}

/** tests **/

TEST(DeviceTable, IdentifiesFamilies)
{
	const DeviceInfo_t *dip = FindDevice(PJRC_VENDOR_ID, TEENSY41_PID);
	ASSERT_TRUE(dip != NULL);
	EXPECT_STREQ("Teensy 4.1", dip->name);
	EXPECT_EQ(FamilyLargeAddress, GetDeviceFamily(PJRC_VENDOR_ID, TEENSY40_PID));
	EXPECT_EQ(FamilySmallAddress, GetDeviceFamily(PJRC_VENDOR_ID, TEENSY32_PID));
}

TEST(DeviceTable, UnknownDeviceIsSmallAddress)
{
	EXPECT_TRUE(FindDevice(0x1234, 0x5678) == NULL);
	EXPECT_EQ(FamilySmallAddress, GetDeviceFamily(0x1234, 0x5678));
	EXPECT_EQ(0u, FamilyOffset(FamilySmallAddress));
	EXPECT_EQ(0x60000000u, FamilyOffset(FamilyLargeAddress));
}

TEST(DualSegment, FindsFirstEndOfFileLine)
{
	const std::string text(EHEX_APPLICATION EHEX_LOADER);
	size_t splitPos;
	unsigned splitLine;

	ASSERT_TRUE(SplitDualSegment(text.c_str(), text.size(), splitPos, splitLine));
	EXPECT_EQ(strlen(EHEX_APPLICATION), splitPos);
	EXPECT_EQ(3u, splitLine);
}

TEST(DualSegment, NoEndOfFileLine)
{
	const std::string text(":020000001122CB\n:0108000033C4\n");
	size_t splitPos;
	unsigned splitLine;

	EXPECT_FALSE(SplitDualSegment(text.c_str(), text.size(), splitPos, splitLine));
	EXPECT_EQ(text.size(), splitPos);
	EXPECT_EQ(0u, splitLine);
}

TEST(DualSegment, EndOfFileWithTrailingWhitespace)
{
	const std::string text(":020000001122CB\r\n:00000001FF \r\n:0108000033C4\r\n");
	size_t splitPos;
	unsigned splitLine;

	ASSERT_TRUE(SplitDualSegment(text.c_str(), text.size(), splitPos, splitLine));
	EXPECT_EQ(2u, splitLine);
	EXPECT_EQ(':', text[splitPos]);
}

TEST(BinarySplit, PadsFinalBlock)
{
	std::vector<uint8_t> data(2500);
	for (size_t i = 0; i < data.size(); i++)
		data[i] = (uint8_t)(i % 251);

	BlockList_t blocks;
	SplitBinary(&data[0], data.size(), 0, blocks);
	ASSERT_EQ(3u, blocks.size());
	EXPECT_EQ(0x000u, blocks[0].address);
	EXPECT_EQ(0x400u, blocks[1].address);
	EXPECT_EQ(0x800u, blocks[2].address);
	EXPECT_EQ(data[1024], blocks[1].data[0]);
	EXPECT_EQ(data[2499], blocks[2].data[451]);
	for (unsigned i = 452; i < TEENSY_BLOCK_SIZE; i++)
		EXPECT_EQ(TEENSY_FILL_BYTE, blocks[2].data[i]) << "byte " << i;
}

TEST(BinarySplit, EmptyInput)
{
	BlockList_t blocks(2);
	SplitBinary(NULL, 0, 0, blocks);
	EXPECT_TRUE(blocks.empty());
}

TEST(FirmwareImage, SelectsFormatByExtension)
{
	ImageFormat_t format;

	ASSERT_EQ(TEENSY_SUCCESS, FirmwareImage::SelectFormat("blink.hex", FamilySmallAddress, format));
	EXPECT_EQ(FormatSingleHex, format);
	ASSERT_EQ(TEENSY_SUCCESS, FirmwareImage::SelectFormat("dir.v2/BLINK.HEX", FamilyLargeAddress, format));
	EXPECT_EQ(FormatSingleHex, format);
	ASSERT_EQ(TEENSY_SUCCESS, FirmwareImage::SelectFormat("blink.ehex", FamilyLargeAddress, format));
	EXPECT_EQ(FormatDualSegmentHex, format);
	ASSERT_EQ(TEENSY_SUCCESS, FirmwareImage::SelectFormat("blink.bin", FamilyLargeAddress, format));
	EXPECT_EQ(FormatRawBinary, format);
	ASSERT_EQ(TEENSY_SUCCESS, FirmwareImage::SelectFormat("blink.hexx", FamilyLargeAddress, format));
	EXPECT_EQ(FormatRawBinary, format);
	ASSERT_EQ(TEENSY_SUCCESS, FirmwareImage::SelectFormat("hex.d/blink", FamilyLargeAddress, format));
	EXPECT_EQ(FormatRawBinary, format);
	EXPECT_EQ(TEENSY_ERROR_UNSUPPORTED, FirmwareImage::SelectFormat("blink.ehex", FamilySmallAddress, format));
}

TEST(FirmwareImage, HexUsesFamilyOffset)
{
	const std::string text(":0200000460009A\n:020000001122CB\n:00000001FF\n");
	BlockSet_t blockSet;

	FirmwareImage large;
	setText(large, text, "app.hex");
	large.SetDevice(PJRC_VENDOR_ID, TEENSY40_PID);
	ASSERT_EQ(TEENSY_SUCCESS, large.BuildBlocks(blockSet));
	EXPECT_EQ(FormatSingleHex, large.Format());
	ASSERT_EQ(1u, blockSet.main.size());
	EXPECT_EQ(0x60000000u, blockSet.main[0].address);
	EXPECT_EQ(0x11, blockSet.main[0].data[0]);
	EXPECT_TRUE(blockSet.loader.empty());

	// the same addresses are far beyond the Flash of a 3.x device
	FirmwareImage small;
	setText(small, text, "app.hex");
	small.SetDevice(PJRC_VENDOR_ID, TEENSY32_PID);
	ASSERT_EQ(TEENSY_SUCCESS, small.BuildBlocks(blockSet));
	ASSERT_EQ(1u, blockSet.main.size());
	EXPECT_EQ(0x60000000u, blockSet.main[0].address);
}

TEST(FirmwareImage, DualSegmentProducesLoaderBlocks)
{
	FirmwareImage image;
	setText(image, EHEX_APPLICATION EHEX_LOADER, "app.ehex");
	image.SetDevice(PJRC_VENDOR_ID, TEENSY41_PID);

	BlockSet_t blockSet;
	ASSERT_EQ(TEENSY_SUCCESS, image.BuildBlocks(blockSet));
	EXPECT_EQ(FormatDualSegmentHex, image.Format());

	ASSERT_EQ(1u, blockSet.main.size());
	EXPECT_EQ(0x60000000u, blockSet.main[0].address);
	EXPECT_EQ(0x11, blockSet.main[0].data[0]);
	EXPECT_EQ(0x22, blockSet.main[0].data[1]);

	ASSERT_EQ(1u, blockSet.loader.size());
	EXPECT_EQ(0x20200000u, blockSet.loader[0].address);
	EXPECT_EQ(0x44, blockSet.loader[0].data[0x100]);
	EXPECT_EQ(0x45, blockSet.loader[0].data[0x101]);
	EXPECT_EQ(2u, blockSet.Count());
}

TEST(FirmwareImage, DualSegmentWithoutEndOfFileIsAllApplication)
{
	FirmwareImage image;
	setText(image, ":0200000460009A\n:020000001122CB\n:0108000033C4\n", "app.ehex");
	image.SetDevice(PJRC_VENDOR_ID, TEENSY41_PID);

	BlockSet_t blockSet;
	ASSERT_EQ(TEENSY_SUCCESS, image.BuildBlocks(blockSet));
	ASSERT_EQ(2u, blockSet.main.size());
	EXPECT_EQ(0x60000000u, blockSet.main[0].address);
	EXPECT_EQ(0x60000800u, blockSet.main[1].address);
	EXPECT_TRUE(blockSet.loader.empty());
}

TEST(FirmwareImage, DualSegmentWithBlankRemainder)
{
	FirmwareImage image;
	setText(image, EHEX_APPLICATION "\r\n  \n", "app.ehex");
	image.SetDevice(PJRC_VENDOR_ID, TEENSY41_PID);

	BlockSet_t blockSet;
	ASSERT_EQ(TEENSY_SUCCESS, image.BuildBlocks(blockSet));
	EXPECT_EQ(1u, blockSet.main.size());
	EXPECT_TRUE(blockSet.loader.empty());
}

TEST(FirmwareImage, DualSegmentLoaderErrorLine)
{
	FirmwareImage image;
	setText(image, EHEX_APPLICATION ":020000042020BA\n:02010000444575\n", "app.ehex");
	image.SetDevice(PJRC_VENDOR_ID, TEENSY41_PID);

	BlockSet_t blockSet;
	EXPECT_EQ(TEENSY_ERROR_FORMAT, image.BuildBlocks(blockSet));
	EXPECT_EQ(5u, image.ErrorLine());
	EXPECT_EQ(HexErrChecksum, image.ErrorCode());
	EXPECT_EQ(0u, blockSet.Count());
}

TEST(FirmwareImage, DualSegmentRefusedForSmallFamily)
{
	FirmwareImage image;
	setText(image, EHEX_APPLICATION EHEX_LOADER, "app.ehex");
	image.SetDevice(PJRC_VENDOR_ID, TEENSY32_PID);

	BlockSet_t blockSet;
	EXPECT_EQ(TEENSY_ERROR_UNSUPPORTED, image.BuildBlocks(blockSet));
	EXPECT_EQ(0u, blockSet.Count());
}

TEST(FirmwareImage, MalformedHexLeavesNoBlocks)
{
	FirmwareImage image;
	setText(image, ":020000001122CB\n:0108000033\n", "app.hex");

	BlockSet_t blockSet;
	blockSet.main.push_back(Block_t(0x1000));
	EXPECT_EQ(TEENSY_ERROR_FORMAT, image.BuildBlocks(blockSet));
	EXPECT_EQ(2u, image.ErrorLine());
	EXPECT_EQ(HexErrLength, image.ErrorCode());
	EXPECT_EQ(0u, blockSet.Count());
}

TEST(FirmwareImage, OtherExtensionIsRawBinary)
{
	std::vector<uint8_t> data(1500, 0x5a);
	FirmwareImage image;
	image.SetData(&data[0], data.size(), "firmware.img");
	image.SetDevice(PJRC_VENDOR_ID, TEENSY40_PID);

	BlockSet_t blockSet;
	ASSERT_EQ(TEENSY_SUCCESS, image.BuildBlocks(blockSet));
	EXPECT_EQ(FormatRawBinary, image.Format());
	ASSERT_EQ(2u, blockSet.main.size());
	EXPECT_EQ(0x60000000u, blockSet.main[0].address);
	EXPECT_EQ(0x60000400u, blockSet.main[1].address);
	EXPECT_EQ(0x5a, blockSet.main[1].data[475]);
	EXPECT_EQ(0xff, blockSet.main[1].data[476]);
}

TEST(FirmwareImage, LoadMissingFile)
{
	FirmwareImage image;
	EXPECT_EQ(TEENSY_ERROR_FILE_OPEN, image.Load("/nonexistent/teensy_tool/app.hex"));
	EXPECT_EQ(TEENSY_ERROR_PARAM, image.Load(""));
}

TEST(FirmwareImage, ImageInfoDescribesBlocks)
{
	FirmwareImage image;
	setText(image, EHEX_APPLICATION EHEX_LOADER, "app.ehex");
	image.SetDevice(PJRC_VENDOR_ID, TEENSY41_PID);

	FILE *fp = tmpfile();
	ASSERT_TRUE(fp != NULL);
	ASSERT_EQ(TEENSY_SUCCESS, image.ImageInfo(fp));

	std::string text;
	char buf[256];
	rewind(fp);
	while (fgets(buf, sizeof(buf), fp) != NULL)
		text += buf;
	fclose(fp);

	EXPECT_NE(std::string::npos, text.find("Device: Teensy 4.1 (16c0:0479)"));
	EXPECT_NE(std::string::npos, text.find("Format: dual-segment Intel HEX, offset 0x60000000"));
	EXPECT_NE(std::string::npos, text.find("Main: 1 blocks (1 to send) from 0x60000000 to 0x600003ff"));
	EXPECT_NE(std::string::npos, text.find("Loader: 1 blocks (1 to send) from 0x20200000 to 0x202003ff"));
}
