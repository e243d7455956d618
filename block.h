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
#if	!defined(BLOCK_H__)
#define BLOCK_H__

#include "sysdep.h"
#include <string.h>
#include <vector>

#define TEENSY_BLOCK_SIZE			0x0400		// 1K byte blocks
#define TEENSY_FILL_BYTE			0xff		// erased Flash content

//
// A block of firmware data tagged with its destination address.  The
// address is always a multiple of the block size.
//
typedef struct Block_tag
{
	uint32_t address;
	uint8_t data[TEENSY_BLOCK_SIZE];

	Block_tag(uint32_t addr = 0)
	{
		address = addr;
		memset(data, TEENSY_FILL_BYTE, sizeof(data));
	}

	// true if every byte is the erased value
	bool IsBlank() const
	{
		for (unsigned i = 0; i < sizeof(data); i++)
		{
			if (data[i] != TEENSY_FILL_BYTE)
				return(false);
		}
		return(true);
	}
} Block_t;

typedef std::vector<Block_t> BlockList_t;

//
// The block lists produced from one firmware image.  The loader list is
// populated only for dual-segment (.ehex) images.
//
typedef struct BlockSet_tag
{
	BlockList_t main;
	BlockList_t loader;

	void Clear() { main.clear(); loader.clear(); }
	size_t Count() const { return(main.size() + loader.size()); }
} BlockSet_t;

#endif	// defined(BLOCK_H__)
