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
#include "teensy.h"

/** internal functions **/
static void putData(uint32_t val, unsigned byteCnt, uint8_t *buf, int ofst = 0);

/** class implementations **/

Teensy::
Teensy(const TransferConfig_t& config, Pacer *pacer)
{
	m_config = config;
	if (m_config.sendAttempts == 0)
		m_config.sendAttempts = 1;
	m_pacer = (pacer != NULL) ? pacer : &m_sysPacer;
	m_flags = 0;
	m_errAddr = 0;
	m_progress = NULL;
	m_context = NULL;
	m_total = 0;
	m_sent = 0;
	m_needEOL = false;
}

Teensy::
~Teensy()
{
}

/*
 ** FlashFirmware
 *
 * Send the blocks of an image to the bootloader, the main list first and
 * then the loader list, followed by the sentinel report that causes the
 * device to reboot.  Blank blocks other than the first of each list are
 * skipped since the bootloader's erase leaves them in that state.
 *
 * The transport is opened for the duration of the call and is always
 * closed before returning.  If a report can't be sent after the configured
 * number of attempts, TEENSY_ERROR_TRANSFER is returned and the address of
 * the block is available from ErrorAddress().  A sentinel that can't be
 * sent is reported as a warning.
 *
 */
int Teensy::
FlashFirmware(const BlockSet_t& blockSet, HidTransport& hid, ProgressFunc_t progress, void *context)
{
	int stat;

	m_errAddr = 0;
	if ((stat = hid.Open()) != 0)
	{
		fprintf(stderr, "Can't open the HID device (%d).\n", stat);
		return(stat);
	}

	m_progress = progress;
	m_context = context;
	m_total = EligibleCount(blockSet.main) + EligibleCount(blockSet.loader);
	m_sent = 0;
	m_needEOL = false;

	uint8_t *report = new uint8_t[REPORT_SIZE];
	if (((stat = sendBlocks(blockSet.main, hid, report)) == 0) &&
			((stat = sendBlocks(blockSet.loader, hid, report)) == 0))
	{
		if ((m_flags & TEENSY_QUIET) == 0)
		{
			fprintf(stdout, "%s%u blocks written successfully.\n", m_needEOL ? "\n" : "", m_sent);
			fflush(stdout);
			m_needEOL = false;
		}

		// send the sentinel, then give the bootloader time to act on it; the
		// image is already written so a failure here is only a warning
		FrameReport(report, REPORT_SENTINEL_ADDR, NULL);
		if ((sendReport(hid, report, REPORT_SENTINEL_ADDR) != 0) && !(m_flags & TEENSY_QUIET))
			fprintf(stderr, "Warning: the reboot request could not be sent, reset the device manually.\n");
		m_pacer->Delay(m_config.settleDelay);
	}
	delete[] report;

	if (m_needEOL && !(m_flags & TEENSY_QUIET))
	{
		fputs("\n", stdout);
		fflush(stdout);
	}

	// a failure to close does not affect the outcome
	hid.Close();
	m_progress = NULL;
	m_context = NULL;
	return(stat);
}

//
// Prepare a report for a block.  If 'data' is NULL the payload is zero.
//
void Teensy::
FrameReport(uint8_t *report, uint32_t addr, const uint8_t *data)
{
	if (report == NULL)
		return;
	memset(report, 0, REPORT_SIZE);
	putData(addr & REPORT_ADDR_MASK, 3, report, 0);
	if (data != NULL)
		memcpy(report + REPORT_HDR_SIZE, data, TEENSY_BLOCK_SIZE);
}

//
// Determine if the block at a given position of a list is to be sent.  The
// first block always is, the others only if they are not blank.
//
bool Teensy::
IsEligible(const BlockList_t& blocks, size_t idx)
{
	if (idx >= blocks.size())
		return(false);
	return((idx == 0) || !blocks[idx].IsBlank());
}

unsigned Teensy::
EligibleCount(const BlockList_t& blocks)
{
	unsigned count = 0;
	for (size_t i = 0; i < blocks.size(); i++)
	{
		if (IsEligible(blocks, i))
			count++;
	}
	return(count);
}

//
// Send the eligible blocks of a list in order.
//
int Teensy::
sendBlocks(const BlockList_t& blocks, HidTransport& hid, uint8_t *report)
{
	int stat;

	for (size_t i = 0; i < blocks.size(); i++)
	{
		if (!IsEligible(blocks, i))
			continue;

		const Block_t& blk = blocks[i];
		FrameReport(report, blk.address, blk.data);
		if ((m_flags & TEENSY_QUIET) == 0)
		{
			fprintf(stdout, "\rWriting block %u of %u at 0x%06x", m_sent + 1, m_total, blk.address & REPORT_ADDR_MASK);
			fflush(stdout);
			m_needEOL = true;
		}
		if ((stat = sendReport(hid, report, blk.address)) != 0)
		{
			m_errAddr = blk.address;
			fprintf(stderr, "%sBlock upload failed at address 0x%08x.\n", m_needEOL ? "\n" : "", blk.address);
			m_needEOL = false;
			return(stat);
		}

		m_sent++;
		if ((m_progress != NULL) && m_total)
			m_progress((double)m_sent / m_total, m_context);

		// the first block triggers the erase of the device
		m_pacer->Delay((m_sent == 1) ? m_config.eraseDelay : m_config.blockDelay);
	}
	return(TEENSY_SUCCESS);
}

//
// Offer a report to the transport up to the configured number of times.
//
int Teensy::
sendReport(HidTransport& hid, const uint8_t *report, uint32_t addr)
{
	for (unsigned attempt = 1; attempt <= m_config.sendAttempts; attempt++)
	{
		int stat;
		if ((stat = hid.Write(report, REPORT_SIZE)) == 0)
			return(TEENSY_SUCCESS);

		if ((m_flags & TEENSY_QUIET) == 0)
		{
			fprintf(stderr, "%sSend attempt %u of %u for 0x%08x failed (%d).\n",
					m_needEOL ? "\n" : "", attempt, m_config.sendAttempts, addr, stat);
			m_needEOL = false;
		}
		if (attempt < m_config.sendAttempts)
			m_pacer->Delay(m_config.retryDelay);
	}
	return(TEENSY_ERROR_TRANSFER);
}

/** private functions **/

//
// Put 1-4 bytes of a value in little endian order into a buffer
// beginning at a specified offset.
//
static void
putData(uint32_t val, unsigned byteCnt, uint8_t *buf, int ofst)
{
	if (buf && byteCnt)
	{
		if (byteCnt > 4)
			byteCnt = 4;
		do
		{
			buf[ofst++] = (uint8_t)(val & 0xff);
			val >>= 8;
		} while (--byteCnt);
	}
}
