/*
;    Project:       Telematics Modem Manager (telm)
;    Date:          19th October 2026
;
;    Changes:
;    1.0  Initial release
;
;    (C) 2011       Michael Stegen / Stegen Electronics
;    (C) 2011-2017  Mark Webb-Johnson
;    (C) 2011        Sonny Chen @ EPRO/DX
;    (C) 2026       telm contributors
;
; Permission is hereby granted, free of charge, to any person obtaining a copy
; of this software and associated documentation files (the "Software"), to deal
; in the Software without restriction, including without limitation the rights
; to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
; copies of the Software, and to permit persons to whom the Software is
; furnished to do so, subject to the following conditions:
;
; The above copyright notice and this permission notice shall be included in
; all copies or substantial portions of the Software.
;
; THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
; IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
; FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
; AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
; LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
; OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
; THE SOFTWARE.
*/


#ifndef __TELM_USB_H__
#define __TELM_USB_H__

#include <string>
#include <vector>

#define TELIT_USB_VENDOR  "1bc7"
#define USB_SYSFS_DEVICES "/sys/bus/usb/devices"

struct UsbDevice
  {
  std::string path;
  std::string vendor;
  std::string product;
  std::string manufacturer;
  std::string name;
  };

// List USB devices with the given vendor id, from sysfs
std::vector<UsbDevice> UsbFindDevices(const std::string& vendor = TELIT_USB_VENDOR,
                                      const std::string& root = USB_SYSFS_DEVICES);

bool UsbModemPresent(const std::string& vendor = TELIT_USB_VENDOR,
                     const std::string& root = USB_SYSFS_DEVICES);

#endif //#ifndef __TELM_USB_H__
