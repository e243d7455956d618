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
#include <gtest/gtest.h>
#include <vector>

/** local definitions **/

typedef std::vector<uint8_t> Report_t;

//
// A transport that records the reports it accepts.  The first 'failFirst'
// writes fail, as does every write after 'failAfter' have been accepted.
//
class FakeHid : public HidTransport
{
public:
	FakeHid()
	{
		openStat = TEENSY_SUCCESS;
		failFirst = 0;
		failAfter = UINT_MAX;
		attempts = 0;
		openCount = 0;
		closeCount = 0;
		m_open = false;
	}

	int Open()
	{
		if (m_open)
			return(TEENSY_ERROR_ALREADY_OPEN);
		if (openStat != 0)
			return(openStat);
		m_open = true;
		openCount++;
		return(TEENSY_SUCCESS);
	}

	int Close()
	{
		if (!m_open)
			return(TEENSY_ERROR_NOT_OPEN);
		m_open = false;
		closeCount++;
		return(TEENSY_SUCCESS);
	}

	bool IsOpen() const { return(m_open); }

	int Write(const uint8_t *report, unsigned len)
	{
		if (!m_open)
			return(TEENSY_ERROR_NOT_OPEN);
		attempts++;
		if ((attempts <= failFirst) || (reports.size() >= failAfter))
			return(TEENSY_ERROR_COMM_WRITE);
		reports.push_back(Report_t(report, report + len));
		return(TEENSY_SUCCESS);
	}

	int openStat;
	unsigned failFirst;
	unsigned failAfter;
	unsigned attempts;
	unsigned openCount;
	unsigned closeCount;
	std::vector<Report_t> reports;

private:
	bool m_open;
};

class FakePacer : public Pacer
{
public:
	void Delay(unsigned ms) { delays.push_back(ms); }

	std::vector<unsigned> delays;
};

/** private functions **/

static void
recordProgress(double progress, void *context)
{
	((std::vector<double> *)context)->push_back(progress);
}

static Block_t
makeBlock(uint32_t addr, uint8_t fill)
{
	Block_t blk(addr);
	memset(blk.data, fill, sizeof(blk.data));
	return(blk);
}

static uint32_t
reportAddress(const Report_t& report)
{
	return((uint32_t)report[0] | ((uint32_t)report[1] << 8) | ((uint32_t)report[2] << 16));
}

static bool
payloadIs(const Report_t& report, uint8_t val)
{
	for (unsigned i = REPORT_HDR_SIZE; i < REPORT_SIZE; i++)
	{
		if (report[i] != val)
			return(false);
	}
	return(true);
}

static bool
isSentinel(const Report_t& report)
{
	return((report.size() == REPORT_SIZE) && (reportAddress(report) == REPORT_SENTINEL_ADDR) && payloadIs(report, 0));
}

/** tests **/

TEST(Teensy, FrameReportLayout)
{
	Block_t blk = makeBlock(0x60012c00, 0x3c);
	blk.data[0] = 0x01;
	blk.data[TEENSY_BLOCK_SIZE - 1] = 0x02;

	uint8_t report[REPORT_SIZE];
	memset(report, 0xee, sizeof(report));
	Teensy::FrameReport(report, blk.address, blk.data);

	EXPECT_EQ(0x00, report[0]);
	EXPECT_EQ(0x2c, report[1]);
	EXPECT_EQ(0x01, report[2]);
	for (unsigned i = 3; i < REPORT_HDR_SIZE; i++)
		EXPECT_EQ(0, report[i]) << "header byte " << i;
	EXPECT_EQ(0, memcmp(report + REPORT_HDR_SIZE, blk.data, TEENSY_BLOCK_SIZE));
}

TEST(Teensy, FrameSentinelReport)
{
	uint8_t report[REPORT_SIZE];
	memset(report, 0xee, sizeof(report));
	Teensy::FrameReport(report, REPORT_SENTINEL_ADDR, NULL);

	Report_t rep(report, report + REPORT_SIZE);
	EXPECT_TRUE(isSentinel(rep));
	EXPECT_EQ(1088u, rep.size());
}

TEST(Teensy, EligibleBlocks)
{
	BlockList_t blocks;
	blocks.push_back(Block_t(0x0000));
	blocks.push_back(Block_t(0x0400));
	blocks.push_back(makeBlock(0x0800, 0x00));

	// the first block is sent even when blank
	EXPECT_TRUE(Teensy::IsEligible(blocks, 0));
	EXPECT_FALSE(Teensy::IsEligible(blocks, 1));
	EXPECT_TRUE(Teensy::IsEligible(blocks, 2));
	EXPECT_FALSE(Teensy::IsEligible(blocks, 3));
	EXPECT_EQ(2u, Teensy::EligibleCount(blocks));
	EXPECT_EQ(0u, Teensy::EligibleCount(BlockList_t()));
}

TEST(Teensy, SkipsBlankBlocks)
{
	BlockSet_t blockSet;
	blockSet.main.push_back(makeBlock(0x60000000, 0x11));
	blockSet.main.push_back(Block_t(0x60000400));
	blockSet.main.push_back(makeBlock(0x60000800, 0x22));
	blockSet.main.push_back(Block_t(0x60000c00));

	FakeHid hid;
	FakePacer pacer;
	std::vector<double> progress;
	Teensy teensy(TransferConfig_t(), &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	ASSERT_EQ(TEENSY_SUCCESS, teensy.FlashFirmware(blockSet, hid, recordProgress, &progress));

	ASSERT_EQ(3u, hid.reports.size());
	EXPECT_EQ(0x000000u, reportAddress(hid.reports[0]));
	EXPECT_TRUE(payloadIs(hid.reports[0], 0x11));
	EXPECT_EQ(0x000800u, reportAddress(hid.reports[1]));
	EXPECT_TRUE(payloadIs(hid.reports[1], 0x22));
	EXPECT_TRUE(isSentinel(hid.reports[2]));

	ASSERT_EQ(2u, progress.size());
	EXPECT_DOUBLE_EQ(0.5, progress[0]);
	EXPECT_DOUBLE_EQ(1.0, progress[1]);

	ASSERT_EQ(3u, pacer.delays.size());
	EXPECT_EQ((unsigned)DEF_ERASE_DELAY, pacer.delays[0]);
	EXPECT_EQ((unsigned)DEF_BLOCK_DELAY, pacer.delays[1]);
	EXPECT_EQ((unsigned)DEF_SETTLE_DELAY, pacer.delays[2]);

	EXPECT_EQ(1u, hid.openCount);
	EXPECT_EQ(1u, hid.closeCount);
	EXPECT_FALSE(hid.IsOpen());
}

TEST(Teensy, SendsLoaderAfterMain)
{
	BlockSet_t blockSet;
	blockSet.main.push_back(makeBlock(0x60000000, 0x11));
	blockSet.loader.push_back(makeBlock(0x20200000, 0x33));
	blockSet.loader.push_back(makeBlock(0x20200400, 0x44));

	FakeHid hid;
	FakePacer pacer;
	std::vector<double> progress;
	Teensy teensy(TransferConfig_t(), &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	ASSERT_EQ(TEENSY_SUCCESS, teensy.FlashFirmware(blockSet, hid, recordProgress, &progress));

	ASSERT_EQ(4u, hid.reports.size());
	EXPECT_EQ(0x000000u, reportAddress(hid.reports[0]));
	EXPECT_EQ(0x200000u, reportAddress(hid.reports[1]));
	EXPECT_TRUE(payloadIs(hid.reports[1], 0x33));
	EXPECT_EQ(0x200400u, reportAddress(hid.reports[2]));
	EXPECT_TRUE(payloadIs(hid.reports[2], 0x44));
	EXPECT_TRUE(isSentinel(hid.reports[3]));

	ASSERT_EQ(3u, progress.size());
	EXPECT_LT(progress[0], progress[1]);
	EXPECT_LT(progress[1], progress[2]);
	EXPECT_DOUBLE_EQ(1.0, progress[2]);

	// only the first block of the transfer waits for the erase
	ASSERT_EQ(4u, pacer.delays.size());
	EXPECT_EQ((unsigned)DEF_ERASE_DELAY, pacer.delays[0]);
	EXPECT_EQ((unsigned)DEF_BLOCK_DELAY, pacer.delays[1]);
	EXPECT_EQ((unsigned)DEF_BLOCK_DELAY, pacer.delays[2]);
}

TEST(Teensy, RecoversFromTransientFailures)
{
	BlockSet_t blockSet;
	blockSet.main.push_back(makeBlock(0x60000000, 0x11));

	FakeHid hid;
	hid.failFirst = 4;
	FakePacer pacer;
	Teensy teensy(TransferConfig_t(), &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	ASSERT_EQ(TEENSY_SUCCESS, teensy.FlashFirmware(blockSet, hid));
	EXPECT_EQ(6u, hid.attempts);
	ASSERT_EQ(2u, hid.reports.size());
	EXPECT_TRUE(payloadIs(hid.reports[0], 0x11));
	EXPECT_TRUE(isSentinel(hid.reports[1]));

	ASSERT_EQ(6u, pacer.delays.size());
	for (unsigned i = 0; i < 4; i++)
		EXPECT_EQ((unsigned)DEF_RETRY_DELAY, pacer.delays[i]);
	EXPECT_EQ((unsigned)DEF_ERASE_DELAY, pacer.delays[4]);
	EXPECT_EQ((unsigned)DEF_SETTLE_DELAY, pacer.delays[5]);
}

TEST(Teensy, GivesUpAfterAllAttempts)
{
	BlockSet_t blockSet;
	blockSet.main.push_back(makeBlock(0x60000000, 0x11));
	blockSet.main.push_back(makeBlock(0x60000400, 0x22));

	FakeHid hid;
	hid.failAfter = 1;
	FakePacer pacer;
	std::vector<double> progress;
	Teensy teensy(TransferConfig_t(), &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	EXPECT_EQ(TEENSY_ERROR_TRANSFER, teensy.FlashFirmware(blockSet, hid, recordProgress, &progress));
	EXPECT_EQ(0x60000400u, teensy.ErrorAddress());
	EXPECT_EQ(1u + DEF_SEND_ATTEMPTS, hid.attempts);
	EXPECT_EQ(1u, hid.reports.size());
	EXPECT_EQ(1u, progress.size());
	EXPECT_EQ(1u, hid.closeCount);
	EXPECT_FALSE(hid.IsOpen());

	// erase, block, then a pause between each pair of attempts
	ASSERT_EQ(1u + DEF_SEND_ATTEMPTS - 1, pacer.delays.size());
	EXPECT_EQ((unsigned)DEF_ERASE_DELAY, pacer.delays[0]);
	EXPECT_EQ((unsigned)DEF_RETRY_DELAY, pacer.delays.back());
}

TEST(Teensy, SentinelFailureIsNotFatal)
{
	BlockSet_t blockSet;
	blockSet.main.push_back(makeBlock(0x60000000, 0x11));

	FakeHid hid;
	hid.failAfter = 1;
	FakePacer pacer;
	Teensy teensy(TransferConfig_t(), &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	EXPECT_EQ(TEENSY_SUCCESS, teensy.FlashFirmware(blockSet, hid));
	EXPECT_EQ(0u, teensy.ErrorAddress());
	ASSERT_EQ(1u, hid.reports.size());
	EXPECT_EQ(1u + DEF_SEND_ATTEMPTS, hid.attempts);
	EXPECT_EQ(1u, hid.closeCount);

	// erase, the retry delays between sentinel attempts, then the settle delay
	ASSERT_EQ(1u + (DEF_SEND_ATTEMPTS - 1) + 1, pacer.delays.size());
	EXPECT_EQ((unsigned)DEF_ERASE_DELAY, pacer.delays.front());
	EXPECT_EQ((unsigned)DEF_RETRY_DELAY, pacer.delays[1]);
	EXPECT_EQ((unsigned)DEF_SETTLE_DELAY, pacer.delays.back());
}

TEST(Teensy, EmptySetSendsOnlySentinel)
{
	BlockSet_t blockSet;
	FakeHid hid;
	FakePacer pacer;
	std::vector<double> progress;
	Teensy teensy(TransferConfig_t(), &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	ASSERT_EQ(TEENSY_SUCCESS, teensy.FlashFirmware(blockSet, hid, recordProgress, &progress));
	ASSERT_EQ(1u, hid.reports.size());
	EXPECT_TRUE(isSentinel(hid.reports[0]));
	EXPECT_TRUE(progress.empty());
	ASSERT_EQ(1u, pacer.delays.size());
	EXPECT_EQ((unsigned)DEF_SETTLE_DELAY, pacer.delays[0]);
}

TEST(Teensy, OpenFailurePassesThrough)
{
	BlockSet_t blockSet;
	blockSet.main.push_back(makeBlock(0x60000000, 0x11));

	FakeHid hid;
	hid.openStat = TEENSY_ERROR_COMM_OPEN;
	FakePacer pacer;
	Teensy teensy(TransferConfig_t(), &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	EXPECT_EQ(TEENSY_ERROR_COMM_OPEN, teensy.FlashFirmware(blockSet, hid));
	EXPECT_EQ(0u, hid.attempts);
	EXPECT_EQ(0u, hid.closeCount);
	EXPECT_TRUE(pacer.delays.empty());
}

TEST(Teensy, RefusesTransportAlreadyOpen)
{
	BlockSet_t blockSet;
	blockSet.main.push_back(makeBlock(0x60000000, 0x11));

	FakeHid hid;
	ASSERT_EQ(TEENSY_SUCCESS, hid.Open());
	FakePacer pacer;
	Teensy teensy(TransferConfig_t(), &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	EXPECT_EQ(TEENSY_ERROR_ALREADY_OPEN, teensy.FlashFirmware(blockSet, hid));
	EXPECT_EQ(0u, hid.attempts);
	EXPECT_TRUE(hid.IsOpen());
}

TEST(Teensy, CustomConfiguration)
{
	TransferConfig_t config;
	config.sendAttempts = 2;
	config.eraseDelay = 10;
	config.blockDelay = 1;
	config.retryDelay = 3;
	config.settleDelay = 7;

	BlockSet_t blockSet;
	blockSet.main.push_back(makeBlock(0, 0x11));
	blockSet.main.push_back(makeBlock(0x400, 0x22));

	FakeHid hid;
	hid.failFirst = 1;
	FakePacer pacer;
	Teensy teensy(config, &pacer);
	teensy.SetFlags(TEENSY_QUIET);

	ASSERT_EQ(TEENSY_SUCCESS, teensy.FlashFirmware(blockSet, hid));
	ASSERT_EQ(4u, pacer.delays.size());
	EXPECT_EQ(3u, pacer.delays[0]);
	EXPECT_EQ(10u, pacer.delays[1]);
	EXPECT_EQ(1u, pacer.delays[2]);
	EXPECT_EQ(7u, pacer.delays[3]);

	TransferConfig_t none;
	none.sendAttempts = 0;
	EXPECT_EQ(1u, Teensy(none, &pacer).Config().sendAttempts);
}

TEST(Teensy, QuietFlag)
{
	Teensy teensy;
	EXPECT_EQ(0u, teensy.GetFlags());
	teensy.SetFlags(TEENSY_QUIET);
	EXPECT_EQ((unsigned)TEENSY_QUIET, teensy.GetFlags());
	teensy.ClearFlags(TEENSY_QUIET);
	EXPECT_EQ(0u, teensy.GetFlags());
}
