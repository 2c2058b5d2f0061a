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
static const char *TAG = "gpsinfo";

#include <ctype.h>
#include <stdlib.h>
#include <math.h>
#include <string>
#include <vector>
#include "gpsinfo.h"
#include "telm_utils.h"

#define JDEpoch 2440588 // Julian date of the Unix epoch

GpsFix::GpsFix()
  {
  m_latitude = 0;
  m_longitude = 0;
  m_has_altitude = false;
  m_altitude = 0;
  m_fix = GPS_FIX_NONE;
  m_has_hdop = false;
  m_hdop = 0;
  m_timestamp = 0;
  m_satellites = 0;
  }

std::string GpsFix::ToString() const
  {
  char buf[160];
  snprintf(buf, sizeof(buf), "(%.4f,%.4f)", m_latitude, m_longitude);
  std::string result(buf);
  if (m_has_altitude)
    {
    snprintf(buf, sizeof(buf), " +%.1fm", m_altitude);
    result.append(buf);
    }
  snprintf(buf, sizeof(buf), " fix=%d", m_fix);
  result.append(buf);
  if (m_has_hdop)
    {
    snprintf(buf, sizeof(buf), " hdop=%.2f", m_hdop);
    result.append(buf);
    }
  if (m_timestamp)
    {
    snprintf(buf, sizeof(buf), " ts=%lld", (long long)m_timestamp);
    result.append(buf);
    }
  return result;
  }

double gps2latlon(const std::string& coord, char hemisphere)
  {
  std::string value = coord;
  if (hemisphere == 0 && !value.empty() && isalpha((unsigned char)value.back()))
    {
    hemisphere = value.back();
    value.pop_back();
    }

  double f = atof(value.c_str());
  long d = (long) (f / 100); // extract degrees
  f = d + (f - (d * 100)) / 60; // convert to decimal format

  if (hemisphere == 'S' || hemisphere == 'W')
    f = -f;
  return f;
  }

/**
 * JdFromYMD:
 *  computes the Julian date from year, month, day
 *  http://aa.usno.navy.mil/faq/docs/JD_Formula.php
 *  only valid for the years 1801-2099 (because 1800 and 2100 are not leap years)
 */
static long JdFromYMD(int year, int month, int day)
  {
  return day-32075+1461L*(year+4800+(month-14)/12)/4+367*(month-2-(month-14)/12*12)/12-3*((year+4900+(month-14)/12)/100)/4;
  }

int64_t ymdhms_to_timestamp(int year, int month, int day, int hour, int minute, int second)
  {
  int64_t jd = JdFromYMD(year, month, day);
  return (jd - JDEpoch) * (24L * 3600)
      + ((hour * 60L + minute) * 60) + second;
  }

static bool all_digits(const std::string& s, size_t count)
  {
  if (s.length() < count) return false;
  for (size_t k=0; k<count; k++)
    if (!isdigit((unsigned char)s[k])) return false;
  return true;
  }

int64_t utc_to_timestamp(const std::string& date, const std::string& time)
  {
  if (!all_digits(date, 6) || !all_digits(time, 6))
    return 0;

  const char* d = date.c_str();
  const char* t = time.c_str();
  int day, month, year, hour, minute, second;

  day = (d[0]-'0')*10 + (d[1]-'0');
  month = (d[2]-'0')*10 + (d[3]-'0');
  year = (d[4]-'0')*10 + (d[5]-'0');

  hour = (t[0]-'0')*10 + (t[1]-'0');
  minute = (t[2]-'0')*10 + (t[3]-'0');
  second = (t[4]-'0')*10 + (t[5]-'0');

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
    return 0;

  return ymdhms_to_timestamp(2000+year, month, day, hour, minute, second);
  }

static bool all_empty(const std::vector<std::string>& fields)
  {
  for (auto& f : fields)
    if (!f.empty()) return false;
  return true;
  }

telm_err_t GpsParseGpsacp(const std::string& payload, GpsFix& fix)
  {
  // $GPSACP: <UTC>,<lat>,<lon>,<hdop>,<alt>,<fix>,<cog>,<spkm>,<spkn>,<date>,<nsat_gps>,<nsat_glonass>
  //  e.g. 120631.999,5433.6013N,01023.6946E,1.2,27.4,3,0.0,0.0,0.0,171120,07,03
  //  no fix yet: ,,,,,1,,,,,, or just empty fields
  std::vector<std::string> fields = split(trim(payload), ',');
  if (fields.size() != 12)
    {
    TELM_LOGD(TAG, "GPSACP: expected 12 fields, got %zu", fields.size());
    return TELM_ERR_PROTOCOL;
    }
  if (all_empty(fields))
    return TELM_ERR_NOFIX;

  const std::string& fixfield = fields[5];
  if (fixfield != "2" && fixfield != "3")
    {
    TELM_LOGV(TAG, "GPSACP: no lock (fix '%s')", fixfield.c_str());
    return TELM_ERR_NOFIX;
    }
  if (fields[1].length() < 5 || fields[2].length() < 6)
    return TELM_ERR_PROTOCOL;

  char ns = fields[1].back(), ew = fields[2].back();
  if ((ns != 'N' && ns != 'S') || (ew != 'E' && ew != 'W'))
    return TELM_ERR_PROTOCOL;

  GpsFix result;
  result.m_fix = atoi(fixfield.c_str());
  result.m_latitude = gps2latlon(fields[1]);
  result.m_longitude = gps2latlon(fields[2]);
  if (!fields[3].empty())
    {
    result.m_has_hdop = true;
    result.m_hdop = atof(fields[3].c_str());
    }
  if (!fields[4].empty())
    {
    result.m_has_altitude = true;
    result.m_altitude = atof(fields[4].c_str());
    }
  result.m_timestamp = utc_to_timestamp(fields[9], fields[0]);
  result.m_satellites = atoi(fields[10].c_str()) + atoi(fields[11].c_str());
  fix = result;
  return TELM_OK;
  }

telm_err_t GpsParseCgpsinfo(const std::string& payload, GpsFix& fix)
  {
  // +CGPSINFO: <lat>,<N/S>,<log>,<E/W>,<date>,<UTC time>,<alt>,<speed>,<course>
  //  e.g. 3113.343286,N,12121.234064,E,250311,072809.3,44.1,0.0,0
  //  no fix yet: ,,,,,,,,
  std::string data = trim(payload);
  if (data.empty())
    return TELM_ERR_NOFIX;
  std::vector<std::string> fields = split(data, ',');
  if (fields.size() != 9)
    {
    TELM_LOGD(TAG, "CGPSINFO: expected 9 fields, got %zu", fields.size());
    return TELM_ERR_PROTOCOL;
    }
  if (all_empty(fields) || fields[0].empty() || fields[2].empty())
    return TELM_ERR_NOFIX;
  if ((fields[1] != "N" && fields[1] != "S") || (fields[3] != "E" && fields[3] != "W"))
    return TELM_ERR_PROTOCOL;

  GpsFix result;
  result.m_latitude = gps2latlon(fields[0], fields[1][0]);
  result.m_longitude = gps2latlon(fields[2], fields[3][0]);
  if (!fields[6].empty())
    {
    result.m_has_altitude = true;
    result.m_altitude = atof(fields[6].c_str());
    result.m_fix = GPS_FIX_3D;
    }
  else
    {
    result.m_fix = GPS_FIX_2D;
    }
  result.m_timestamp = utc_to_timestamp(fields[4], fields[5]);
  fix = result;
  return TELM_OK;
  }
