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
#if	!defined(IMAGE_H__)
#define IMAGE_H__

#include "sysdep.h"
#include "status.h"
#include "block.h"
#include "hex.h"
#include <stdio.h>
#include <string>
#include <vector>

#define PJRC_VENDOR_ID				0x16c0
#define LARGE_FLASH_OFFSET			0x60000000	// FlexSPI Flash base of the 4.x boards

typedef enum
{
	FamilySmallAddress = 0,		// Teensy 3.x, Flash at address 0
	FamilyLargeAddress			// Teensy 4.x, Flash and RAM in separate regions
} DeviceFamily_t;

typedef struct
{
	uint16_t vendorID;
	uint16_t productID;
	DeviceFamily_t family;
	const char *name;			// NULL for the table terminator
} DeviceInfo_t;

const DeviceInfo_t *DeviceList();
const DeviceInfo_t *FindDevice(uint16_t vendorID, uint16_t productID);
DeviceFamily_t GetDeviceFamily(uint16_t vendorID, uint16_t productID);
uint32_t FamilyOffset(DeviceFamily_t family);

// the ways of turning an image file into blocks
typedef enum
{
	FormatSingleHex,			// .hex
	FormatDualSegmentHex,		// .ehex, application plus loader utility
	FormatRawBinary				// anything else
} ImageFormat_t;

const char *FormatName(ImageFormat_t format);
void SplitBinary(const uint8_t *data, size_t size, uint32_t baseAddr, BlockList_t& blocks);

//
// A firmware image file held in memory together with the identity of
// the device for which it is intended.
//
class FirmwareImage
{
public:
	FirmwareImage();

	int Load(const char *filename);
	void SetData(const uint8_t *data, size_t size, const char *filename);
	void SetDevice(uint16_t vendorID, uint16_t productID);

	static int SelectFormat(const char *filename, DeviceFamily_t family, ImageFormat_t& format);
	int BuildBlocks(BlockSet_t& blockSet);
	int ImageInfo(FILE *fpOut = stdout);

	const char *Filename() const { return(m_name.c_str()); }
	size_t Size() const { return(m_data.size()); }
	uint16_t VendorID() const { return(m_vendorID); }
	uint16_t ProductID() const { return(m_productID); }
	DeviceFamily_t Family() const { return(GetDeviceFamily(m_vendorID, m_productID)); }
	ImageFormat_t Format() const { return(m_format); }
	unsigned ErrorLine() const { return(m_errLine); }
	HexError_t ErrorCode() const { return(m_errCode); }

private:
	std::vector<uint8_t> m_data;
	std::string m_name;
	uint16_t m_vendorID;
	uint16_t m_productID;
	ImageFormat_t m_format;		// the format chosen by the last BuildBlocks()
	unsigned m_errLine;			// the offending line of a rejected HEX file
	HexError_t m_errCode;
};

#endif	// defined(IMAGE_H__)
