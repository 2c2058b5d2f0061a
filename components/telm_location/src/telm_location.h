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


#ifndef __TELM_LOCATION_H__
#define __TELM_LOCATION_H__

#include <string>
#include "telm.h"
#include "gpsinfo.h"

#define LOCATION_DEFAULT_FILE   "/tmp/telm/location.json"
#define LOCATION_DEFAULT_SEED   "/boot/telm/location.json"

// hdop given to seeded locations, any real fix supersedes them
#define LOCATION_SEED_HDOP      9999.0

/**
 * LocationFile: JSON mirror of the latest fix for external readers
 *  {"latitude":…,"longitude":…,"altitude":…,"fix":…,"hdop":…,"timestamp":…}
 *  Written to a temp file beside it and renamed into place.
 */
class LocationFile
  {
  public:
    LocationFile(const std::string& path = LOCATION_DEFAULT_FILE);
    ~LocationFile();

  public:
    telm_err_t Write(const GpsFix& fix);
    telm_err_t Read(GpsFix& fix);
    const std::string& GetPath() { return m_path; }

  public:
    static std::string Encode(const GpsFix& fix);
    static telm_err_t Decode(const std::string& json, GpsFix& fix);
    static telm_err_t LoadSeed(const std::string& path, GpsFix& fix);

  protected:
    std::string m_path;
  };

#endif //#ifndef __TELM_LOCATION_H__
