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
#if	!defined(TEENSY_H__)
#define TEENSY_H__

#include "sysdep.h"
#include <stdio.h>
#include <ctype.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include "status.h"
#include "block.h"

// HID report layout
#define REPORT_HDR_SIZE				64
#define REPORT_SIZE					(REPORT_HDR_SIZE + TEENSY_BLOCK_SIZE)
#define REPORT_ADDR_MASK			0x00ffffff	// the header holds a 24-bit address
#define REPORT_SENTINEL_ADDR		0x00ffffff	// tells the bootloader to finish and reboot

// default transfer parameters
#define DEF_SEND_ATTEMPTS			5
#define DEF_ERASE_DELAY				1500		// after the first block, in milliseconds
#define DEF_BLOCK_DELAY				5			// after each later block
#define DEF_RETRY_DELAY				100			// after a failed send
#define DEF_SETTLE_DELAY			100			// after the sentinel

//
// The interface to a HID device that accepts fixed-size output reports.
// All methods return zero on success or a negative error code.
//
class HidTransport
{
public:
	virtual ~HidTransport() {}

	virtual int Open() = 0;
	virtual int Close() = 0;
	virtual bool IsOpen() const = 0;
	virtual int Write(const uint8_t *report, unsigned len) = 0;
};

//
// Supplies the delays used to pace a transfer.
//
class Pacer
{
public:
	virtual ~Pacer() {}
	virtual void Delay(unsigned ms) = 0;
};

class SystemPacer : public Pacer
{
public:
	void Delay(unsigned ms) { msDelay(ms); }
};

// structure to hold transfer parameters
typedef struct TransferConfig_tag
{
	unsigned sendAttempts;		// the number of times a report is offered before giving up
	unsigned eraseDelay;		// pause after the first block while the device erases
	unsigned blockDelay;		// pause after each subsequent block
	unsigned retryDelay;		// pause after a failed send
	unsigned settleDelay;		// pause after the sentinel report

	TransferConfig_tag()
	{
		sendAttempts = DEF_SEND_ATTEMPTS;
		eraseDelay = DEF_ERASE_DELAY;
		blockDelay = DEF_BLOCK_DELAY;
		retryDelay = DEF_RETRY_DELAY;
		settleDelay = DEF_SETTLE_DELAY;
	}
} TransferConfig_t;

// receives the fraction of the blocks sent, 0.0 to 1.0
typedef void (*ProgressFunc_t)(double progress, void *context);

class Teensy
{
public:
	Teensy(const TransferConfig_t& config = TransferConfig_t(), Pacer *pacer = NULL);
	~Teensy();

	int FlashFirmware(const BlockSet_t& blockSet, HidTransport& hid, ProgressFunc_t progress = NULL, void *context = NULL);

	static void FrameReport(uint8_t *report, uint32_t addr, const uint8_t *data);
	static unsigned EligibleCount(const BlockList_t& blocks);
	static bool IsEligible(const BlockList_t& blocks, size_t idx);

	uint32_t ErrorAddress() const { return(m_errAddr); }
	const TransferConfig_t& Config() const { return(m_config); }

	unsigned GetFlags() const { return(m_flags); }
	void SetFlags(unsigned mask) { m_flags |= mask; }
	void ClearFlags(unsigned mask) { m_flags &= ~mask; }

private:
	Teensy(const Teensy&);
	Teensy& operator=(const Teensy&);

	int sendBlocks(const BlockList_t& blocks, HidTransport& hid, uint8_t *report);
	int sendReport(HidTransport& hid, const uint8_t *report, uint32_t addr);

	TransferConfig_t m_config;
	SystemPacer m_sysPacer;
	Pacer *m_pacer;
	unsigned m_flags;
	uint32_t m_errAddr;			// the address of the block that couldn't be sent

	// per-transfer state
	ProgressFunc_t m_progress;
	void *m_context;
	unsigned m_total;			// blocks to be sent in both lists
	unsigned m_sent;			// blocks sent so far
	bool m_needEOL;
};

#endif	// defined(TEENSY_H__)
