// $Id$

/*
 ** Module: serial.cpp
 *
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
 * This module implements the serial input used to monitor the text output
 * of a device: opening and configuring a port, collecting the bytes that
 * arrive and assembling them into lines.
 *
 */

#if defined(__APPLE__) && defined(__GNUC__) && !defined(__linux__)
  #define __linux__ 1
#endif

/** include files **/
#include <stdio.h>
#include <string.h>
#if defined(WIN32)
  #include <memory.h>
#elif defined(__linux__)
  #include <sys/types.h>
  #include <sys/ioctl.h>
  #include <errno.h>
  #include <fcntl.h>
  #include <poll.h>
  #include <termios.h>
  #include <unistd.h>
#endif
#include "sysdep.h"
#include "status.h"
#include "serial.h"

/** local definitions **/

#define SERVICE_BUF_SIZE		256		// the most bytes taken from the port per Service() call

#if defined(__linux__)
typedef struct
{
	unsigned long baud;
	speed_t speed;
} BaudEntry_t;
#endif

/** private data **/

#if defined(__linux__)
static const BaudEntry_t baudList[] =
{
	{ 1200,		B1200 },
	{ 2400,		B2400 },
	{ 4800,		B4800 },
	{ 9600,		B9600 },
	{ 19200,	B19200 },
	{ 38400,	B38400 },
	{ 57600,	B57600 },
	{ 115200,	B115200 },
	{ 230400,	B230400 },
  #if defined(B460800)
	{ 460800,	B460800 },
  #endif
  #if defined(B921600)
	{ 921600,	B921600 },
  #endif
	{ 0,		B0 }
};
#endif

/** internal functions **/
#if defined(__linux__)
static bool lookupSpeed(unsigned long baud, speed_t& speed);
#endif
static bool isBlank(char c);

/** public functions **/

/*
 ** SerialOpen
 *
 * Open a serial channel described by the first parameter and set the baud rate
 * and other characteristics.  If successful, a SerialHandle_t is returned otherwise
 * the value INVALID_SERIAL_HANDLE is returned.
 *
 * For Windows systems, the serial channel descriptor should be in the
 * form "//./COMn" where n is a numeric value greater than zero.
 *
 */
SerialHandle_t
SerialOpen(const char *desc, unsigned long baud, unsigned flags)
{
	int stat = -1;
	SerialHandle_t hand = INVALID_SERIAL_HANDLE;

	if ((desc == NULL) || (*desc == '\0') || (baud == 0))
		return(hand);

#if defined(WIN32)
	hand = CreateFile(desc, GENERIC_READ | GENERIC_WRITE, 0, 0, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, 0);
	if (IS_VALID_SERIAL_HANDLE(hand))
	{
		DCB dcb;
		memset(&dcb, 0, sizeof(dcb));
		dcb.DCBlength = sizeof(dcb);
		dcb.fBinary = 1;
		dcb.BaudRate = baud;
		dcb.ByteSize = 8 - (flags & SERIAL_BITS_MASK);
		switch (flags & SERIAL_PARITY_MASK)
		{
		case SERIAL_PARITY_EVEN:	dcb.Parity = EVENPARITY;	break;
		case SERIAL_PARITY_ODD:		dcb.Parity = ODDPARITY;		break;
		default:					dcb.Parity = NOPARITY;		break;
		}
		dcb.StopBits = ((flags & SERIAL_STOPBITS_MASK) == SERIAL_STOPBITS_2) ? TWOSTOPBITS : ONESTOPBIT;

		// don't block in ReadFile() when no data is queued
		COMMTIMEOUTS cto;
		memset(&cto, 0, sizeof(cto));
		cto.ReadIntervalTimeout = MAXDWORD;
		if (SetCommState(hand, &dcb) && SetCommTimeouts(hand, &cto))
			stat = 0;
	}
#elif defined(__linux__)
	speed_t speed;
	if (!lookupSpeed(baud, speed))
		return(hand);

	int dflags = O_RDWR | O_NOCTTY;
  #ifdef __APPLE__
	dflags |= O_NONBLOCK;
  #endif
	if ((hand = open(desc, dflags)) >= 0)
	{
		struct termios term;
  #ifdef __APPLE__
		dflags = fcntl(hand, F_GETFL, 0);
		fcntl(hand, F_SETFL, dflags & ~O_NONBLOCK);
  #endif
		if (tcgetattr(hand, &term) == 0)
		{
			cfsetispeed(&term, speed);
			cfsetospeed(&term, speed);

			term.c_cflag |= CLOCAL | CREAD;
			term.c_cflag &= ~(PARENB | PARODD | CSIZE | CSTOPB);
			switch (flags & SERIAL_PARITY_MASK)
			{
			case SERIAL_PARITY_EVEN:	term.c_cflag |= PARENB;				break;
			case SERIAL_PARITY_ODD:		term.c_cflag |= PARENB | PARODD;	break;
			default:														break;
			}
			switch (flags & SERIAL_BITS_MASK)
			{
			case SERIAL_BITS_5:			term.c_cflag |= CS5;				break;
			case SERIAL_BITS_6:			term.c_cflag |= CS6;				break;
			case SERIAL_BITS_7:			term.c_cflag |= CS7;				break;
			default:					term.c_cflag |= CS8;				break;
			}
			if ((flags & SERIAL_STOPBITS_MASK) == SERIAL_STOPBITS_2)
				term.c_cflag |= CSTOPB;
  #if defined(CRTSCTS)
			term.c_cflag &= ~CRTSCTS;
  #endif

			// raw input, no echo, reads return whatever is queued
			term.c_iflag = IGNBRK;
			term.c_lflag = 0;
			term.c_oflag = 0;
			term.c_cc[VMIN] = 0;
			term.c_cc[VTIME] = 1;
			if (tcsetattr(hand, TCSANOW, &term) == 0)
				stat = 0;
		}
	}
#elif defined(ERROR_MISSING_IMPLEMENTATION)
	#error missing implementation of SerialOpen()
#endif

	// close the handle if any configuration error occurred
	if (IS_VALID_SERIAL_HANDLE(hand) && (stat != 0))
	{
		SerialClose(hand);
		hand = INVALID_SERIAL_HANDLE;
	}
	return(hand);
}

/*
 ** SerialAvailable
 *
 * Get the number of bytes queued by the device driver.  A negative value
 * is returned if the port has failed or the device has gone away.
 *
 */
int
SerialAvailable(SerialHandle_t hand)
{
	int count = -1;

	if (IS_VALID_SERIAL_HANDLE(hand))
	{
#if defined(WIN32)
		unsigned long errs;
		COMSTAT cs;

		if (ClearCommError(hand, &errs, &cs))
			count = (int)cs.cbInQue;
#elif defined(__linux__)
		int byteCnt;
		if (ioctl(hand, FIONREAD, &byteCnt) >= 0)
		{
			count = byteCnt;
			if (count == 0)
			{
				// nothing queued, check for a hang up
				struct pollfd pfd;
				pfd.fd = hand;
				pfd.events = POLLIN;
				pfd.revents = 0;
				if ((poll(&pfd, 1, 0) < 0) || (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)))
					count = -1;
			}
		}
#elif defined(ERROR_MISSING_IMPLEMENTATION)
	#error missing implementation of SerialAvailable()
#endif
	}
	return(count);
}

/*
 ** SerialRead
 *
 * Read data from the serial channel.  If the requested amount is greater
 * than the amount available, the smaller amount will be read.  The return
 * value is the number of bytes placed in the buffer or -1 on error.
 *
 */
int
SerialRead(SerialHandle_t hand, unsigned char *buf, unsigned count)
{
	if (!IS_VALID_SERIAL_HANDLE(hand))
		return(-1);
	if ((buf == NULL) || (count == 0))
		return(0);

	int actual = -1;
#if defined(WIN32)
	unsigned long cnt;
	if (ReadFile(hand, buf, count, &cnt, NULL))
		actual = (int)cnt;
#elif defined(__linux__)
	ssize_t cnt = read(hand, buf, count);
	if (cnt >= 0)
		actual = (int)cnt;
	else if ((errno == EAGAIN) || (errno == EINTR))
		actual = 0;
#elif defined(ERROR_MISSING_IMPLEMENTATION)
	#error missing implementation of SerialRead()
#endif
	return(actual);
}

/*
 ** SerialClose
 *
 * Close a serial channel given a SerialHandle_t.  If successful, return zero otherwise
 * non-zero.
 *
 */
int
SerialClose(SerialHandle_t hand)
{
	int stat = -1;
	if (IS_VALID_SERIAL_HANDLE(hand))
	{
#if defined(WIN32)
		if (CloseHandle(hand))
			stat = 0;
#elif defined(__linux__)
		tcflush(hand, TCIOFLUSH);
		if (close(hand) == 0)
			stat = 0;
#elif defined(ERROR_MISSING_IMPLEMENTATION)
	#error missing implementation of SerialClose()
#endif
	}
	return(stat);
}

/** class implementations **/

LineFramer::
LineFramer()
{
	m_handler = NULL;
	m_context = NULL;
	m_generation = 0;
}

//
// Discard any partial line.
//
void LineFramer::
Reset()
{
	m_partial.clear();
	m_generation++;
}

/*
 ** Feed
 *
 * Add text to the partial line and deliver every line that is now complete.
 * If the handler resets the framer (e.g. by closing the stream), delivery
 * stops immediately.  The return value is the number of lines delivered.
 *
 */
unsigned LineFramer::
Feed(const char *chunk, size_t len)
{
	if ((chunk == NULL) || (len == 0))
		return(0);
	m_partial.append(chunk, len);

	unsigned lineCnt = 0;
	unsigned generation = m_generation;
	size_t start = 0;
	size_t nl;
	while ((nl = m_partial.find('\n', start)) != std::string::npos)
	{
		size_t first = start;
		size_t last = nl;
		while ((first < last) && isBlank(m_partial[first]))
			first++;
		while ((last > first) && isBlank(m_partial[last - 1]))
			last--;
		std::string line(m_partial, first, last - first);
		start = nl + 1;

		lineCnt++;
		if (m_handler != NULL)
		{
			m_handler(line.c_str(), m_context);
			if (m_generation != generation)
				return(lineCnt);
		}
	}
	m_partial.erase(0, start);
	return(lineCnt);
}

/*************************************************************************/

SerialMonitor::
SerialMonitor()
{
	m_handle = INVALID_SERIAL_HANDLE;
}

SerialMonitor::
~SerialMonitor()
{
	if (IsOpen())
		Close();
}

//
// Open and configure the serial port.  A second Open() without an
// intervening Close() is refused.
//
int SerialMonitor::
Open(const SerialConfig_t& config)
{
	if (IsOpen())
		return(TEENSY_ERROR_ALREADY_OPEN);
	if ((config.portStr == NULL) || (*config.portStr == '\0') || (config.baud == 0))
		return(TEENSY_ERROR_PARAM);

	SerialHandle_t hand = SerialOpen(config.portStr, config.baud, config.flags);
	if (!IS_VALID_SERIAL_HANDLE(hand))
		return(TEENSY_ERROR_COMM_OPEN);

	m_handle = hand;
	m_port = config.portStr;
	m_framer.Reset();
	return(TEENSY_SUCCESS);
}

//
// Close the serial port, discarding any partial line.
//
int SerialMonitor::
Close()
{
	if (!IsOpen())
		return(TEENSY_ERROR_NOT_OPEN);

	SerialHandle_t hand = m_handle;
	m_handle = INVALID_SERIAL_HANDLE;
	m_framer.Reset();
	return((SerialClose(hand) == 0) ? TEENSY_SUCCESS : TEENSY_ERROR_GENERAL);
}

/*
 ** Service
 *
 * Move the data queued at the port to the line framer.  Return the number
 * of bytes processed (possibly zero), TEENSY_ERROR_NOT_OPEN if the port
 * is closed or TEENSY_ERROR_COMM_READ if the port failed, in which case
 * it has been closed.
 *
 */
int SerialMonitor::
Service()
{
	if (!IsOpen())
		return(TEENSY_ERROR_NOT_OPEN);

	int count;
	if ((count = SerialAvailable(m_handle)) < 0)
	{
		Close();
		return(TEENSY_ERROR_COMM_READ);
	}
	if (count == 0)
		return(0);

	unsigned char buf[SERVICE_BUF_SIZE];
	if (count > (int)sizeof(buf))
		count = (int)sizeof(buf);
	if ((count = SerialRead(m_handle, buf, (unsigned)count)) < 0)
	{
		Close();
		return(TEENSY_ERROR_COMM_READ);
	}
	m_framer.Feed((const char *)buf, (size_t)count);
	return(count);
}

/** private functions **/

#if defined(__linux__)
static bool
lookupSpeed(unsigned long baud, speed_t& speed)
{
	for (const BaudEntry_t *bep = baudList; bep->baud != 0; bep++)
	{
		if (bep->baud == baud)
		{
			speed = bep->speed;
			return(true);
		}
	}
	return(false);
}
#endif

static bool
isBlank(char c)
{
	return((c == ' ') || (c == '\t') || (c == '\r') || (c == '\n') || (c == '\f') || (c == '\v'));
}
