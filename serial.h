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
#if	!defined(SERIAL_H__)
#define SERIAL_H__

#if defined(WIN32)
  #include <windows.h>
  #include <conio.h>
#endif
#include <string>

/****************************************************************************/

// low level serial functions

#if defined(WIN32)
typedef HANDLE SerialHandle_t;
#define IS_VALID_SERIAL_HANDLE(h)		((h) != INVALID_HANDLE_VALUE)
#define INVALID_SERIAL_HANDLE			INVALID_HANDLE_VALUE
#else
typedef int SerialHandle_t;
#define IS_VALID_SERIAL_HANDLE(h)		((h) >= 0)
#define INVALID_SERIAL_HANDLE			-1
#endif

// bit values for the 'flags' parameter to SerialOpen()
#define SERIAL_NO_FLAGS					0x0000

#define SERIAL_BITS_8					0x0000
#define SERIAL_BITS_7					0x0001
#define SERIAL_BITS_6					0x0002
#define SERIAL_BITS_5					0x0003
#define SERIAL_BITS_MASK				0x0003

#define SERIAL_PARITY_NONE				0x0000
#define SERIAL_PARITY_EVEN				0x0008
#define SERIAL_PARITY_ODD				0x000c
#define SERIAL_PARITY_MASK				0x000c

#define SERIAL_STOPBITS_1				0x0000
#define SERIAL_STOPBITS_2				0x0010
#define SERIAL_STOPBITS_MASK			0x0010

#define DEF_SERIAL_SPEED				115200

SerialHandle_t SerialOpen(const char *desc, unsigned long baud, unsigned flags);
int SerialClose(SerialHandle_t hand);
int SerialAvailable(SerialHandle_t hand);
int SerialRead(SerialHandle_t hand, unsigned char *buf, unsigned count);

// structure to hold the serial link parameters
typedef struct SerialConfig_tag
{
	const char *portStr;		// the serial port designator (e.g. COM2 or /dev/ttyACM0)
	unsigned long baud;			// the baud rate
	unsigned flags;				// data bits, parity and stop bits

	SerialConfig_tag(const char *port = NULL, unsigned long speed = DEF_SERIAL_SPEED, unsigned flg = SERIAL_NO_FLAGS)
	{
		portStr = port;
		baud = speed;
		flags = flg;
	}
} SerialConfig_t;

// receives each complete line of text
typedef void (*LineHandler_t)(const char *line, void *context);

/****************************************************************************/

//
// Assembles a stream of text into newline terminated lines.  Each line is
// delivered once, without its terminator or surrounding whitespace.  Text
// following the last newline is held until more arrives or Reset() is
// called.
//
class LineFramer
{
public:
	LineFramer();

	void SetHandler(LineHandler_t handler, void *context) { m_handler = handler; m_context = context; }
	unsigned Feed(const char *chunk, size_t len);
	unsigned Feed(const std::string& chunk) { return(Feed(chunk.data(), chunk.size())); }
	void Reset();
	size_t Pending() const { return(m_partial.size()); }
	const std::string& Partial() const { return(m_partial); }

private:
	LineFramer(const LineFramer&);
	LineFramer& operator=(const LineFramer&);

	std::string m_partial;		// text received since the last newline
	LineHandler_t m_handler;
	void *m_context;
	unsigned m_generation;		// incremented by Reset()
};

/****************************************************************************/

//
// A serial connection whose incoming text is delivered line by line.
// Service() must be called repeatedly to move data from the port to the
// line handler; it does nothing once Close() has been called.
//
class SerialMonitor
{
public:
	SerialMonitor();
	~SerialMonitor();

	int Open(const SerialConfig_t& config);
	int Close();
	bool IsOpen() const { return(IS_VALID_SERIAL_HANDLE(m_handle)); }
	void OnLine(LineHandler_t handler, void *context = NULL) { m_framer.SetHandler(handler, context); }
	int Service();

	const char *PortName() const { return(m_port.c_str()); }
	size_t Pending() const { return(m_framer.Pending()); }

private:
	SerialMonitor(const SerialMonitor&);
	SerialMonitor& operator=(const SerialMonitor&);

	SerialHandle_t m_handle;	// the open serial port
	LineFramer m_framer;
	std::string m_port;
};

#endif	// defined(SERIAL_H__)
