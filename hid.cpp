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
#include "hid.h"
#include <hidapi.h>

/** class implementations **/

HidDevice::
HidDevice(uint16_t vendorID, uint16_t productID)
{
	m_handle = NULL;
	m_vendorID = vendorID;
	m_productID = productID;
	m_buf = new uint8_t[REPORT_SIZE + 1];
}

HidDevice::
~HidDevice()
{
	if (IsOpen())
		Close();
	delete[] m_buf;
}

//
// Open the device.  Opening an open device is refused.
//
int HidDevice::
Open()
{
	if (IsOpen())
		return(TEENSY_ERROR_ALREADY_OPEN);
	if (hid_init() != 0)
		return(TEENSY_ERROR_COMM_OPEN);
	if ((m_handle = hid_open(m_vendorID, m_productID, NULL)) == NULL)
		return(TEENSY_ERROR_COMM_OPEN);
	return(TEENSY_SUCCESS);
}

int HidDevice::
Close()
{
	if (!IsOpen())
		return(TEENSY_ERROR_NOT_OPEN);
	hid_close(m_handle);
	m_handle = NULL;
	return(TEENSY_SUCCESS);
}

//
// Send an output report.  The bootloader doesn't use numbered reports so
// the report ID is zero.
//
int HidDevice::
Write(const uint8_t *report, unsigned len)
{
	if (!IsOpen())
		return(TEENSY_ERROR_NOT_OPEN);
	if ((report == NULL) || (len == 0) || (len > REPORT_SIZE))
		return(TEENSY_ERROR_PARAM);

	m_buf[0] = 0;
	memcpy(m_buf + 1, report, len);
	if (hid_write(m_handle, m_buf, len + 1) < 0)
		return(TEENSY_ERROR_COMM_WRITE);
	return(TEENSY_SUCCESS);
}

/*
 ** FindPresent
 *
 * Return the entry of the device table for the first listed device that is
 * currently attached, or NULL if there is none.
 *
 */
const DeviceInfo_t *HidDevice::
FindPresent()
{
	if (hid_init() != 0)
		return(NULL);
	for (const DeviceInfo_t *dip = DeviceList(); dip->name != NULL; dip++)
	{
		struct hid_device_info *devs = hid_enumerate(dip->vendorID, dip->productID);
		if (devs != NULL)
		{
			hid_free_enumeration(devs);
			return(dip);
		}
	}
	return(NULL);
}

//
// Release the resources held by hidapi.
//
void HidDevice::
Shutdown()
{
	hid_exit();
}
