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

/*
 * This module decodes Intel HEX text.  A line has the form
 *
 *	:LLAAAATTDD...DDCC
 *
 * where LL is the number of data bytes, AAAA is the 16-bit load offset,
 * TT is the record type, DD are the data bytes and CC is a checksum chosen
 * so that the sum of all of the bytes of the record is zero modulo 256.
 * Data records are placed into 1K blocks relative to a base address that
 * is changed by extended segment and extended linear address records.
 *
 */

/** include files **/
#include "hex.h"
#include <ctype.h>
#include <algorithm>

/** local definitions **/

// the number of hex characters in a record excluding the data
#define HEX_OVERHEAD_CHARS			10

// one past the highest address a record can reach
#define ADDR_SPACE_END				((int64_t)1 << 32)

/** internal functions **/
static int hexDigit(char c);
static int hexByte(const char *p);
static bool isBlank(char c);
static void trim(const char *& line, size_t& len);
static bool blockLess(const Block_t& b1, const Block_t& b2);

/** public functions **/

/*
 ** ParseHexRecord
 *
 * Decode one line of Intel HEX text.  The line should not contain a line
 * terminator but surrounding whitespace is allowed.  Return zero if
 * successful, otherwise TEENSY_ERROR_FORMAT with the reason returned
 * indirectly if 'errp' is not NULL.
 *
 */
int
ParseHexRecord(const char *line, size_t len, HexRecord_t& rec, HexError_t *errp)
{
	HexError_t err = HexErrNone;

	memset(&rec, 0, sizeof(rec));
	trim(line, len);
	if ((line == NULL) || (len == 0) || (*line != ':'))
		err = HexErrMarker;
	else
	{
		const char *p = line + 1;
		size_t charCnt = len - 1;
		int val;

		if (charCnt < HEX_OVERHEAD_CHARS)
			err = HexErrLength;
		else if ((val = hexByte(p)) < 0)
			err = HexErrDigit;
		else if (charCnt != (HEX_OVERHEAD_CHARS + (2 * (size_t)val)))
			err = HexErrLength;
		else
		{
			// convert the count, address, type, data and checksum bytes
			uint8_t buf[HEX_MAX_DATA + 5];
			unsigned byteCnt = (unsigned)(charCnt / 2);
			uint8_t sum = 0;
			for (unsigned i = 0; i < byteCnt; i++, p += 2)
			{
				if ((val = hexByte(p)) < 0)
				{
					err = HexErrDigit;
					break;
				}
				buf[i] = (uint8_t)val;
				sum += (uint8_t)val;
			}

			if (err == HexErrNone)
			{
				rec.dataLen = buf[0];
				rec.address = (uint16_t)((buf[1] << 8) | buf[2]);
				rec.typeCode = buf[3];
				memcpy(rec.data, buf + 4, rec.dataLen);
				rec.cksumValid = (sum == 0);
				switch (rec.typeCode)
				{
				case HexData:			rec.type = HexData;				break;
				case HexEndOfFile:		rec.type = HexEndOfFile;		break;
				case HexExtSegmentAddr:	rec.type = HexExtSegmentAddr;	break;
				case HexExtLinearAddr:	rec.type = HexExtLinearAddr;	break;
				default:				rec.type = HexOther;			break;
				}

				if (!rec.cksumValid)
					err = HexErrChecksum;
				else if (((rec.type == HexExtSegmentAddr) || (rec.type == HexExtLinearAddr)) &&
						(rec.dataLen != 2))
					err = HexErrAddrRecord;
			}
		}
	}

	if (errp != NULL)
		*errp = err;
	return((err == HexErrNone) ? TEENSY_SUCCESS : TEENSY_ERROR_FORMAT);
}

//
// Return a description of a record rejection reason.
//
const char *
HexErrorText(HexError_t err)
{
	switch (err)
	{
	case HexErrNone:		return("no error");
	case HexErrMarker:		return("missing ':'");
	case HexErrLength:		return("line length mismatch");
	case HexErrDigit:		return("invalid hex digit");
	case HexErrChecksum:	return("checksum error");
	case HexErrAddrRecord:	return("bad address record length");
	}
	return("unknown error");
}

//
// Determine if a line is the canonical end of file record, allowing
// trailing whitespace.
//
bool
IsHexEofLine(const char *line, size_t len)
{
	const size_t eofLen = sizeof(HEX_EOF_RECORD) - 1;

	if (line == NULL)
		return(false);
	while ((len > 0) && isBlank(line[len - 1]))
		len--;
	return((len == eofLen) && (_strnicmp(line, HEX_EOF_RECORD, eofLen) == 0));
}

/*
 ** SplitDualSegment
 *
 * Locate the first canonical end of file line in the text of a dual-segment
 * image.  If found, return true with the offset of the first character
 * following that line and its (1-based) line number returned indirectly.
 * Otherwise, return false with 'splitPos' set to the text length.
 *
 */
bool
SplitDualSegment(const char *text, size_t len, size_t& splitPos, unsigned& splitLine)
{
	splitPos = len;
	splitLine = 0;
	if (text == NULL)
		return(false);

	unsigned lineNum = 0;
	for (size_t pos = 0; pos < len; )
	{
		const char *nl = (const char *)memchr(text + pos, '\n', len - pos);
		size_t lineLen = (nl != NULL) ? (size_t)(nl - (text + pos)) : (len - pos);
		size_t next = pos + lineLen + ((nl != NULL) ? 1 : 0);

		lineNum++;
		if (IsHexEofLine(text + pos, lineLen))
		{
			splitPos = next;
			splitLine = lineNum;
			return(true);
		}
		pos = next;
	}
	return(false);
}

/** class implementations **/

HexDecoder::
HexDecoder(uint32_t offset, unsigned firstLine)
{
	m_offset = offset;
	m_firstLine = firstLine ? firstLine : 1;
	Reset();
}

//
// Discard all decoded data and restart at the first line.
//
void HexDecoder::
Reset()
{
	m_base = 0;
	m_eof = false;
	m_lineNum = m_firstLine - 1;
	m_errLine = 0;
	m_errCode = HexErrNone;
	m_blocks.clear();
}

/*
 ** Decode
 *
 * Decode multi-line HEX text, stopping after the first end of file record
 * or at the end of the text.  Lines may be terminated by LF or CR LF.
 * Return zero if successful, otherwise TEENSY_ERROR_FORMAT with the number
 * of the offending line available from ErrorLine().
 *
 */
int HexDecoder::
Decode(const char *text, size_t len)
{
	if ((text == NULL) && len)
		return(TEENSY_ERROR_PARAM);

	int stat = TEENSY_SUCCESS;
	for (size_t pos = 0; (pos < len) && !m_eof; )
	{
		const char *nl = (const char *)memchr(text + pos, '\n', len - pos);
		size_t lineLen = (nl != NULL) ? (size_t)(nl - (text + pos)) : (len - pos);

		if ((stat = DecodeLine(text + pos, lineLen)) != 0)
			break;
		pos += lineLen + ((nl != NULL) ? 1 : 0);
	}
	return(stat);
}

//
// Process one line of the session.  Blank lines are counted but otherwise
// ignored, as are lines following an end of file record.
//
int HexDecoder::
DecodeLine(const char *line, size_t len)
{
	m_lineNum++;
	if (m_eof)
		return(TEENSY_SUCCESS);
	trim(line, len);
	if (len == 0)
		return(TEENSY_SUCCESS);

	HexRecord_t rec;
	HexError_t err;
	if (ParseHexRecord(line, len, rec, &err) != 0)
	{
		m_errLine = m_lineNum;
		m_errCode = err;
		return(TEENSY_ERROR_FORMAT);
	}

	switch (rec.type)
	{
	case HexData:
		{
			// data below the offset is outside the region of interest, as is
			// data past the top of the 32-bit address space
			int64_t addr = (int64_t)m_base + rec.address - m_offset;
			int64_t room = ADDR_SPACE_END - m_offset - addr;
			unsigned len = rec.dataLen;
			if ((int64_t)len > room)
				len = (unsigned)room;
			if ((addr >= 0) && len)
				store((uint32_t)addr, rec.data, len);
		}
		break;

	case HexEndOfFile:
		m_eof = true;
		break;

	case HexExtSegmentAddr:
		m_base = (uint32_t)((rec.data[0] << 8) | rec.data[1]) << 4;
		break;

	case HexExtLinearAddr:
		m_base = (uint32_t)((rec.data[0] << 8) | rec.data[1]) << 16;
		break;

	default:
		break;
	}
	return(TEENSY_SUCCESS);
}

//
// Produce the list of blocks in ascending address order.
//
void HexDecoder::
Finish(BlockList_t& blocks) const
{
	blocks.clear();
	blocks.reserve(m_blocks.size());
	std::map<uint32_t, Block_t>::const_iterator it;
	for (it = m_blocks.begin(); it != m_blocks.end(); ++it)
		blocks.push_back(it->second);
	std::stable_sort(blocks.begin(), blocks.end(), blockLess);
}

//
// Copy data to the blocks covering the given offset-relative address,
// creating blocks as needed.  A record may span a block boundary.
//
void HexDecoder::
store(uint32_t addr, const uint8_t *data, unsigned len)
{
	while (len)
	{
		uint32_t blkIdx = addr / TEENSY_BLOCK_SIZE;
		uint32_t blkOfst = addr % TEENSY_BLOCK_SIZE;
		unsigned part = TEENSY_BLOCK_SIZE - blkOfst;
		if (part > len)
			part = len;

		std::map<uint32_t, Block_t>::iterator it = m_blocks.find(blkIdx);
		if (it == m_blocks.end())
		{
			Block_t blk(m_offset + (blkIdx * TEENSY_BLOCK_SIZE));
			it = m_blocks.insert(std::make_pair(blkIdx, blk)).first;
		}
		memcpy(it->second.data + blkOfst, data, part);

		data += part;
		addr += part;
		len -= part;
	}
}

/** private functions **/

static int
hexDigit(char c)
{
	if (isdigit((unsigned char)c))
		return(c - '0');
	if ((c >= 'A') && (c <= 'F'))
		return(c - 'A' + 10);
	if ((c >= 'a') && (c <= 'f'))
		return(c - 'a' + 10);
	return(-1);
}

//
// Convert two hex characters to a byte value, returning -1 if either is
// not a hex digit.
//
static int
hexByte(const char *p)
{
	int hi, lo;
	if (((hi = hexDigit(p[0])) < 0) || ((lo = hexDigit(p[1])) < 0))
		return(-1);
	return((hi << 4) | lo);
}

static bool
isBlank(char c)
{
	return((c == ' ') || (c == '\t') || (c == '\r') || (c == '\n') || (c == '\f') || (c == '\v'));
}

//
// Remove leading and trailing whitespace from a counted string.
//
static void
trim(const char *& line, size_t& len)
{
	if (line == NULL)
	{
		len = 0;
		return;
	}
	while (len && isBlank(*line))
		line++, len--;
	while (len && isBlank(line[len - 1]))
		len--;
}

static bool
blockLess(const Block_t& b1, const Block_t& b2)
{
	return(b1.address < b2.address);
}
