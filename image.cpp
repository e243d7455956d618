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
#include <sys/stat.h>

/** local definitions **/

// context for a rejected HEX image
typedef struct
{
	unsigned line;
	HexError_t code;
} DecodeError_t;

typedef int (*DecodeFunc_t)(const uint8_t *data, size_t size, uint32_t offset, BlockSet_t& blockSet, DecodeError_t& err);

typedef struct
{
	ImageFormat_t format;
	const char *name;
	DecodeFunc_t decode;
} FormatEntry_t;

/** internal functions **/
static int decodeHex(const uint8_t *data, size_t size, uint32_t offset, BlockSet_t& blockSet, DecodeError_t& err);
static int decodeDualHex(const uint8_t *data, size_t size, uint32_t offset, BlockSet_t& blockSet, DecodeError_t& err);
static int decodeBinary(const uint8_t *data, size_t size, uint32_t offset, BlockSet_t& blockSet, DecodeError_t& err);
static const FormatEntry_t *findFormatEntry(ImageFormat_t format);
static const char *fileExtension(const char *filename);
static void listInfo(FILE *fpOut, const char *label, const BlockList_t& blocks);

/** private data **/

//
// The devices that are recognized.  Devices not listed are treated as
// members of the small address family.
//
static const DeviceInfo_t deviceList[] =
{
	{ PJRC_VENDOR_ID,	0x0478,		FamilyLargeAddress,		"Teensy 4.0" },
	{ PJRC_VENDOR_ID,	0x0479,		FamilyLargeAddress,		"Teensy 4.1" },
	{ PJRC_VENDOR_ID,	0x0477,		FamilySmallAddress,		"Teensy 3.6" },
	{ PJRC_VENDOR_ID,	0x0474,		FamilySmallAddress,		"Teensy 3.5" },
	{ PJRC_VENDOR_ID,	0x0483,		FamilySmallAddress,		"Teensy 3.0" },
	{ PJRC_VENDOR_ID,	0x0484,		FamilySmallAddress,		"Teensy 3.1/3.2" },
	{ 0,				0,			FamilySmallAddress,		NULL }
};

static const FormatEntry_t formatList[] =
{
	{ FormatSingleHex,		"Intel HEX",				decodeHex },
	{ FormatDualSegmentHex,	"dual-segment Intel HEX",	decodeDualHex },
	{ FormatRawBinary,		"raw binary",				decodeBinary },
};

/** public functions **/

//
// Return the device table, terminated by an entry with a NULL name.
//
const DeviceInfo_t *
DeviceList()
{
	return(deviceList);
}

const DeviceInfo_t *
FindDevice(uint16_t vendorID, uint16_t productID)
{
	for (const DeviceInfo_t *dip = deviceList; dip->name != NULL; dip++)
	{
		if ((dip->vendorID == vendorID) && (dip->productID == productID))
			return(dip);
	}
	return(NULL);
}

DeviceFamily_t
GetDeviceFamily(uint16_t vendorID, uint16_t productID)
{
	const DeviceInfo_t *dip = FindDevice(vendorID, productID);
	return((dip != NULL) ? dip->family : FamilySmallAddress);
}

//
// Return the address subtracted from HEX addresses for a device family.
//
uint32_t
FamilyOffset(DeviceFamily_t family)
{
	return((family == FamilyLargeAddress) ? LARGE_FLASH_OFFSET : 0);
}

const char *
FormatName(ImageFormat_t format)
{
	const FormatEntry_t *fep = findFormatEntry(format);
	return((fep != NULL) ? fep->name : "unknown");
}

/*
 ** SplitBinary
 *
 * Divide raw data into blocks, the last one padded with the erased value.
 * Block n is assigned the address 'baseAddr' + n * TEENSY_BLOCK_SIZE.
 *
 */
void
SplitBinary(const uint8_t *data, size_t size, uint32_t baseAddr, BlockList_t& blocks)
{
	blocks.clear();
	if (data == NULL)
		return;

	blocks.reserve((size + TEENSY_BLOCK_SIZE - 1) / TEENSY_BLOCK_SIZE);
	for (size_t ofst = 0; ofst < size; ofst += TEENSY_BLOCK_SIZE)
	{
		size_t part = size - ofst;
		if (part > TEENSY_BLOCK_SIZE)
			part = TEENSY_BLOCK_SIZE;

		Block_t blk(baseAddr + (uint32_t)ofst);
		memcpy(blk.data, data + ofst, part);
		blocks.push_back(blk);
	}
}

/** class implementations **/

FirmwareImage::
FirmwareImage()
{
	m_vendorID = 0;
	m_productID = 0;
	m_format = FormatRawBinary;
	m_errLine = 0;
	m_errCode = HexErrNone;
}

//
// Read the content of a file into memory.
//
int FirmwareImage::
Load(const char *filename)
{
	if ((filename == NULL) || (*filename == '\0'))
		return(TEENSY_ERROR_PARAM);

	FILE *fp;
	if ((fp = fopen(filename, "rb")) == NULL)
	{
		fprintf(stderr, "Can't open file \"%s\" for reading.\n", filename);
		return(TEENSY_ERROR_FILE_OPEN);
	}

	int stat = TEENSY_SUCCESS;
	struct stat fs;
	if ((fstat(fileno(fp), &fs) != 0) || (fs.st_size < 0))
	{
		fprintf(stderr, "Can't determine the size of the file \"%s\".\n", filename);
		stat = TEENSY_ERROR_FILE_SIZE;
	}
	else
	{
		std::vector<uint8_t> data((size_t)fs.st_size);
		if (!data.empty() && (fread(&data[0], 1, data.size(), fp) != data.size()))
		{
			fprintf(stderr, "An error occurred while reading the file \"%s\".\n", filename);
			stat = TEENSY_ERROR_FILE_READ;
		}
		else
		{
			m_data.swap(data);
			m_name = filename;
		}
	}
	fclose(fp);
	return(stat);
}

void FirmwareImage::
SetData(const uint8_t *data, size_t size, const char *filename)
{
	if ((data != NULL) && size)
		m_data.assign(data, data + size);
	else
		m_data.clear();
	m_name = (filename != NULL) ? filename : "";
}

void FirmwareImage::
SetDevice(uint16_t vendorID, uint16_t productID)
{
	m_vendorID = vendorID;
	m_productID = productID;
}

/*
 ** SelectFormat
 *
 * Choose the decoding for a file based on its extension and the device
 * family.  A dual-segment image requires the separate Flash and RAM regions
 * of the large address family so it is refused for other devices.
 *
 */
int FirmwareImage::
SelectFormat(const char *filename, DeviceFamily_t family, ImageFormat_t& format)
{
	const char *ext = fileExtension(filename);

	format = FormatRawBinary;
	if (_stricmp(ext, ".hex") == 0)
		format = FormatSingleHex;
	else if (_stricmp(ext, ".ehex") == 0)
	{
		if (family != FamilyLargeAddress)
			return(TEENSY_ERROR_UNSUPPORTED);
		format = FormatDualSegmentHex;
	}
	return(TEENSY_SUCCESS);
}

/*
 ** BuildBlocks
 *
 * Convert the image to block lists for the selected device.  No partial
 * result is returned on failure.
 *
 */
int FirmwareImage::
BuildBlocks(BlockSet_t& blockSet)
{
	int stat;
	ImageFormat_t format;
	DeviceFamily_t family = Family();

	blockSet.Clear();
	m_errLine = 0;
	m_errCode = HexErrNone;
	if ((stat = SelectFormat(Filename(), family, format)) != 0)
	{
		fprintf(stderr, "The file \"%s\" is a dual-segment image, which is only supported by the 4.x devices.\n",
				Filename());
		return(stat);
	}
	m_format = format;

	const FormatEntry_t *fep = findFormatEntry(format);
	if (fep == NULL)
		return(TEENSY_ERROR_PARAM);

	DecodeError_t err;
	err.line = 0;
	err.code = HexErrNone;
	const uint8_t *data = m_data.empty() ? NULL : &m_data[0];
	if ((stat = fep->decode(data, m_data.size(), FamilyOffset(family), blockSet, err)) != 0)
	{
		m_errLine = err.line;
		m_errCode = err.code;
		fprintf(stderr, "Invalid HEX file \"%s\": %s on line %u.\n", Filename(), HexErrorText(err.code), err.line);
		blockSet.Clear();
	}
	return(stat);
}

//
// Output information about the blocks that the image produces.
//
int FirmwareImage::
ImageInfo(FILE *fpOut)
{
	int stat;
	BlockSet_t blockSet;

	if ((stat = BuildBlocks(blockSet)) != 0)
		return(stat);

	const DeviceInfo_t *dip = FindDevice(m_vendorID, m_productID);
	fprintf(fpOut, "File: \"%s\", %u bytes\n", Filename(), (unsigned)Size());
	if (dip != NULL)
		fprintf(fpOut, "Device: %s (%04x:%04x)\n", dip->name, m_vendorID, m_productID);
	else
		fprintf(fpOut, "Device: unknown (%04x:%04x)\n", m_vendorID, m_productID);
	fprintf(fpOut, "Format: %s, offset 0x%08x\n", FormatName(m_format), FamilyOffset(Family()));
	listInfo(fpOut, "Main", blockSet.main);
	if (m_format == FormatDualSegmentHex)
		listInfo(fpOut, "Loader", blockSet.loader);
	return(TEENSY_SUCCESS);
}

/** private functions **/

static int
decodeHex(const uint8_t *data, size_t size, uint32_t offset, BlockSet_t& blockSet, DecodeError_t& err)
{
	int stat;
	HexDecoder dec(offset);

	if ((stat = dec.Decode((const char *)data, size)) != 0)
	{
		err.line = dec.ErrorLine();
		err.code = dec.ErrorCode();
		return(stat);
	}
	dec.Finish(blockSet.main);
	return(TEENSY_SUCCESS);
}

//
// Decode a dual-segment image.  The application session is relative to the
// Flash base; the loader utility that follows it carries absolute RAM
// addresses.  An image without an end of file line is all application.
//
static int
decodeDualHex(const uint8_t *data, size_t size, uint32_t offset, BlockSet_t& blockSet, DecodeError_t& err)
{
	int stat;
	size_t splitPos;
	unsigned splitLine;
	const char *text = (const char *)data;

	SplitDualSegment(text, size, splitPos, splitLine);

	HexDecoder mainDec(offset);
	if ((stat = mainDec.Decode(text, splitPos)) != 0)
	{
		err.line = mainDec.ErrorLine();
		err.code = mainDec.ErrorCode();
		return(stat);
	}
	mainDec.Finish(blockSet.main);

	if (splitPos < size)
	{
		HexDecoder loaderDec(0, splitLine + 1);
		if ((stat = loaderDec.Decode(text + splitPos, size - splitPos)) != 0)
		{
			err.line = loaderDec.ErrorLine();
			err.code = loaderDec.ErrorCode();
			return(stat);
		}
		loaderDec.Finish(blockSet.loader);
	}
	return(TEENSY_SUCCESS);
}

static int
decodeBinary(const uint8_t *data, size_t size, uint32_t offset, BlockSet_t& blockSet, DecodeError_t& err)
{
	(void)err;
	SplitBinary(data, size, offset, blockSet.main);
	return(TEENSY_SUCCESS);
}

static const FormatEntry_t *
findFormatEntry(ImageFormat_t format)
{
	for (unsigned i = 0; i < sizeof(formatList) / sizeof(formatList[0]); i++)
	{
		if (formatList[i].format == format)
			return(&formatList[i]);
	}
	return(NULL);
}

//
// Return the extension of the base part of a filename, including the
// period, or an empty string.
//
static const char *
fileExtension(const char *filename)
{
	if (filename == NULL)
		return("");

	const char *base = filename;
	for (const char *p = filename; *p != '\0'; p++)
	{
		if ((*p == '/') || (*p == '\\'))
			base = p + 1;
	}
	const char *ext = strrchr(base, '.');
	return((ext != NULL) ? ext : "");
}

static void
listInfo(FILE *fpOut, const char *label, const BlockList_t& blocks)
{
	unsigned blank = 0;
	for (size_t i = 1; i < blocks.size(); i++)
	{
		if (blocks[i].IsBlank())
			blank++;
	}

	if (blocks.empty())
		fprintf(fpOut, "%s: no blocks\n", label);
	else
		fprintf(fpOut, "%s: %u blocks (%u to send) from 0x%08x to 0x%08x\n", label,
				(unsigned)blocks.size(), (unsigned)blocks.size() - blank,
				blocks.front().address, blocks.back().address + TEENSY_BLOCK_SIZE - 1);
}
