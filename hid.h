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
#if	!defined(HID_H__)
#define HID_H__

#include "teensy.h"
#include "image.h"

struct hid_device_;

//
// A HID transport using hidapi.  The device is identified by its vendor
// and product ID; the first matching device is used.
//
class HidDevice : public HidTransport
{
public:
	HidDevice(uint16_t vendorID = 0, uint16_t productID = 0);
	~HidDevice();

	int Open();
	int Close();
	bool IsOpen() const { return(m_handle != NULL); }
	int Write(const uint8_t *report, unsigned len);

	uint16_t VendorID() const { return(m_vendorID); }
	uint16_t ProductID() const { return(m_productID); }

	static const DeviceInfo_t *FindPresent();
	static void Shutdown();

private:
	HidDevice(const HidDevice&);
	HidDevice& operator=(const HidDevice&);

	struct hid_device_ *m_handle;
	uint16_t m_vendorID;
	uint16_t m_productID;
	uint8_t *m_buf;				// report ID followed by the report
};

#endif	// defined(HID_H__)
