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
#if	!defined(SYSDEP_H__)
#define SYSDEP_H__

#if defined(__APPLE__) && defined(__GNUC__) && !defined(__linux__)
  #define __linux__ 1
#endif

#if defined(WIN32)
  #define _CRT_SECURE_NO_WARNINGS
  #define HAVE_STDINT_H
#elif defined(__linux__)
  #define HAVE_STDINT_H
  #define _stricmp strcasecmp
  #define _strnicmp strncasecmp
  #include <strings.h>
#endif

#if defined(HAVE_STDINT_H)
  #include <stdint.h>
#endif

// uncomment this line to produce errors for missing implementation
#define ERROR_MISSING_IMPLEMENTATION

// timing primitives, implemented in sysdep.cpp
void usDelay(uint32_t us);
void msDelay(unsigned ms);

#endif	// defined(SYSDEP_H__)
