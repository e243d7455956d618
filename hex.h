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
#if	!defined(HEX_H__)
#define HEX_H__

#include "sysdep.h"
#include "status.h"
#include "block.h"
#include <stddef.h>
#include <map>

#define HEX_MAX_DATA				255			// the most data bytes a record can carry
#define HEX_EOF_RECORD				":00000001FF"

// Intel HEX record types
typedef enum
{
	HexData = 0x00,
	HexEndOfFile = 0x01,
	HexExtSegmentAddr = 0x02,
	HexExtLinearAddr = 0x04,
	HexOther = 0xff				// any other type, validated and ignored
} HexRecordType_t;

// reasons a line is rejected
typedef enum
{
	HexErrNone = 0,
	HexErrMarker,				// missing ':'
	HexErrLength,				// line length inconsistent with the byte count
	HexErrDigit,				// non-hexadecimal character
	HexErrChecksum,				// checksum doesn't sum to zero
	HexErrAddrRecord			// address record without a two byte payload
} HexError_t;

typedef struct
{
	uint8_t dataLen;			// the byte count field
	uint16_t address;			// the 16-bit load offset
	uint8_t typeCode;			// the record type as it appeared in the line
	HexRecordType_t type;
	uint8_t data[HEX_MAX_DATA];
	bool cksumValid;
} HexRecord_t;

int ParseHexRecord(const char *line, size_t len, HexRecord_t& rec, HexError_t *errp = NULL);
const char *HexErrorText(HexError_t err);
bool IsHexEofLine(const char *line, size_t len);
bool SplitDualSegment(const char *text, size_t len, size_t& splitPos, unsigned& splitLine);

//
// Decodes one HEX session into 1K blocks.  Data addresses are reduced by
// the offset given to the constructor; data that lands below the offset
// is discarded.
//
class HexDecoder
{
public:
	HexDecoder(uint32_t offset = 0, unsigned firstLine = 1);

	int Decode(const char *text, size_t len);
	int DecodeLine(const char *line, size_t len);
	void Finish(BlockList_t& blocks) const;
	void Reset();

	bool SawEndOfFile() const { return(m_eof); }
	size_t BlockCount() const { return(m_blocks.size()); }
	uint32_t Offset() const { return(m_offset); }
	uint32_t BaseAddress() const { return(m_base); }
	unsigned LineNumber() const { return(m_lineNum); }
	unsigned ErrorLine() const { return(m_errLine); }
	HexError_t ErrorCode() const { return(m_errCode); }

private:
	void store(uint32_t addr, const uint8_t *data, unsigned len);

	uint32_t m_offset;			// subtracted from every data address
	uint32_t m_base;			// set by extended address records
	bool m_eof;					// an end of file record was processed
	unsigned m_firstLine;		// line number of the first line of the session
	unsigned m_lineNum;			// line number of the most recent line
	unsigned m_errLine;			// line number of a rejected line, 0 if none
	HexError_t m_errCode;
	std::map<uint32_t, Block_t> m_blocks;	// keyed by block index
};

#endif	// defined(HEX_H__)
