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
#include "sysdep.h"
#if defined(WIN32)
  #include <windows.h>
#elif defined(__linux__)
  #include <time.h>
  #include <unistd.h>
#endif

/** public functions **/

/*
 ** usDelay
 *
 * Delay for a specified number of microseconds.
 *
 */
void
usDelay(uint32_t us)
{
#if defined(WIN32)
	LARGE_INTEGER end;

	if (QueryPerformanceCounter(&end))
	{
		LARGE_INTEGER freq, tick;

		// convert the delay to performance counter units
		QueryPerformanceFrequency(&freq);
		end.QuadPart += ((LONGLONG)us * freq.QuadPart / 1000000);
		do
		{
			QueryPerformanceCounter(&tick);
		}
		while (tick.QuadPart <= end.QuadPart);
	}
#elif defined(__linux__)
	struct timespec ts;
	ts.tv_sec = us / 1000000;
	ts.tv_nsec = (long)(us % 1000000) * 1000;
	while (nanosleep(&ts, &ts) != 0)
		;
#elif defined(ERROR_MISSING_IMPLEMENTATION)
	#error missing implementation of usDelay()
#endif
}

/*
 ** msDelay
 *
 * Delay for a specified number of milliseconds.
 *
 */
void
msDelay(unsigned ms)
{
#if defined(WIN32)
	if (ms > 65)
		Sleep(ms);
	else
		// for smaller values, to get better resolution
		usDelay(ms * 1000);
#elif defined(__linux__)
	usDelay((uint32_t)ms * 1000);
#elif defined(ERROR_MISSING_IMPLEMENTATION)
	#error missing implementation of msDelay()
#endif
}
