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


#ifndef __GPSINFO_H__
#define __GPSINFO_H__

#include <stdint.h>
#include <string>
#include "telm.h"

#define GPS_FIX_NONE   0
#define GPS_FIX_2D     2
#define GPS_FIX_3D     3

class GpsFix
  {
  public:
    GpsFix();

  public:
    bool IsValid(int minfix = GPS_FIX_2D) const { return m_fix >= minfix; }
    std::string ToString() const;

  public:
    double        m_latitude;
    double        m_longitude;
    bool          m_has_altitude;
    double        m_altitude;
    int           m_fix;            // GPS_FIX_NONE / _2D / _3D
    bool          m_has_hdop;
    double        m_hdop;
    int64_t       m_timestamp;      // UTC seconds, 0 = unknown
    int           m_satellites;
  };

/**
 * gps2latlon: convert NMEA degree/minute form ("ddmm.mmmm" / "dddmm.mmmm")
 *  to signed degrees; the hemisphere may be given separately or as the
 *  last character of coord (Telit $GPSACP style)
 */
double gps2latlon(const std::string& coord, char hemisphere = 0);

/**
 * utc_to_timestamp: convert GPS date & time (UTC) to a unix timestamp
 *   date: "ddmmyy"
 *   time: "hhmmss[.sss]"
 *  returns 0 on malformed input
 */
int64_t utc_to_timestamp(const std::string& date, const std::string& time);

// Unix timestamp from broken down UTC date/time (years 1801-2099)
int64_t ymdhms_to_timestamp(int year, int month, int day, int hour, int minute, int second);

/**
 * Decoders for the GPS query responses, payload without the response prefix:
 *  - TELM_OK: fix filled in with a valid lock
 *  - TELM_ERR_NOFIX: well formed, but no lock (fix is left untouched)
 *  - TELM_ERR_PROTOCOL: malformed
 */
telm_err_t GpsParseGpsacp(const std::string& payload, GpsFix& fix);
telm_err_t GpsParseCgpsinfo(const std::string& payload, GpsFix& fix);

#endif //#ifndef __GPSINFO_H__
