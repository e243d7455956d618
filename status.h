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
#if	!defined(STATUS_H__)
#define STATUS_H__

// flags to control operation
#define TEENSY_QUIET				0x0001

// error codes
#define TEENSY_SUCCESS				0
#define TEENSY_ERROR_GENERAL		-1
#define TEENSY_ERROR_PARAM			-2
#define TEENSY_ERROR_FORMAT			-3		// malformed or checksum-failing HEX input
#define TEENSY_ERROR_UNSUPPORTED	-4		// valid input, disallowed for the device
#define TEENSY_ERROR_TRANSFER		-5		// a report could not be sent after all retries
#define TEENSY_ERROR_ALREADY_OPEN	-6
#define TEENSY_ERROR_NOT_OPEN		-7
#define TEENSY_ERROR_COMM_OPEN		-8
#define TEENSY_ERROR_COMM_READ		-9
#define TEENSY_ERROR_COMM_WRITE		-10
#define TEENSY_ERROR_FILE_OPEN		-11
#define TEENSY_ERROR_FILE_READ		-12
#define TEENSY_ERROR_FILE_SIZE		-13

#endif	// defined(STATUS_H__)
