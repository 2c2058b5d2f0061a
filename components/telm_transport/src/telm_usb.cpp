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


#include "telm_log.h"
static const char *TAG = "usb";

#include <dirent.h>
#include <errno.h>
#include <string.h>
#include "telm_usb.h"
#include "telm_utils.h"

static std::string read_attr(const std::string& dir, const char* attr)
  {
  std::string value;
  if (load_file(dir + "/" + attr, value) != 0)
    return std::string();
  return trim(value);
  }

std::vector<UsbDevice> UsbFindDevices(const std::string& vendor, const std::string& root)
  {
  std::vector<UsbDevice> found;
  DIR *dir = opendir(root.c_str());
  if (dir == NULL)
    {
    TELM_LOGD(TAG, "Cannot open %s: %s", root.c_str(), strerror(errno));
    return found;
    }

  struct dirent *dp;
  while ((dp = readdir(dir)) != NULL)
    {
    if (dp->d_name[0] == '.')
      continue;
    std::string path = root + "/" + dp->d_name;
    std::string id = read_attr(path, "idVendor");
    if (id.empty() || strcasecmp(id.c_str(), vendor.c_str()) != 0)
      continue;
    UsbDevice dev;
    dev.path = path;
    dev.name = dp->d_name;
    dev.vendor = id;
    dev.product = read_attr(path, "idProduct");
    dev.manufacturer = read_attr(path, "manufacturer");
    TELM_LOGV(TAG, "Found %s:%s at %s", dev.vendor.c_str(), dev.product.c_str(), dev.name.c_str());
    found.push_back(dev);
    }
  closedir(dir);
  return found;
  }

bool UsbModemPresent(const std::string& vendor, const std::string& root)
  {
  return !UsbFindDevices(vendor, root).empty();
  }
