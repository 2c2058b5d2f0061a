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
static const char *TAG = "location";

#include <errno.h>
#include <math.h>
#include <string.h>
#include <cjson/cJSON.h>
#include "telm_location.h"
#include "telm_utils.h"
#include "telm_config.h"

LocationFile::LocationFile(const std::string& path /*=LOCATION_DEFAULT_FILE*/)
  {
  m_path = path;
  }

LocationFile::~LocationFile()
  {
  }

std::string LocationFile::Encode(const GpsFix& fix)
  {
  char buf[256];
  std::string json;

  snprintf(buf, sizeof(buf), "{\"latitude\":%.4f,\"longitude\":%.4f",
    ROUNDPREC(fix.m_latitude, 4), ROUNDPREC(fix.m_longitude, 4));
  json.append(buf);
  if (fix.m_has_altitude)
    snprintf(buf, sizeof(buf), ",\"altitude\":%.1f", fix.m_altitude);
  else
    snprintf(buf, sizeof(buf), ",\"altitude\":null");
  json.append(buf);
  snprintf(buf, sizeof(buf), ",\"fix\":%d", fix.m_fix);
  json.append(buf);
  if (fix.m_has_hdop)
    snprintf(buf, sizeof(buf), ",\"hdop\":%.2f", fix.m_hdop);
  else
    snprintf(buf, sizeof(buf), ",\"hdop\":null");
  json.append(buf);
  snprintf(buf, sizeof(buf), ",\"timestamp\":%lld}\n", (long long)fix.m_timestamp);
  json.append(buf);
  return json;
  }

telm_err_t LocationFile::Decode(const std::string& json, GpsFix& fix)
  {
  cJSON *root = cJSON_Parse(json.c_str());
  if (root == NULL)
    return TELM_ERR_PROTOCOL;
  if (root->type != cJSON_Object)
    {
    cJSON_Delete(root);
    return TELM_ERR_PROTOCOL;
    }

  GpsFix result;
  bool lat = false, lon = false;
  for (cJSON *el = root->child; el != NULL; el = el->next)
    {
    if (el->type != cJSON_Number || el->string == NULL)
      continue;
    if (strcmp(el->string,"latitude")==0)
      { result.m_latitude = el->valuedouble; lat = true; }
    else if (strcmp(el->string,"longitude")==0)
      { result.m_longitude = el->valuedouble; lon = true; }
    else if (strcmp(el->string,"altitude")==0 || strcmp(el->string,"elevation")==0)
      { result.m_altitude = el->valuedouble; result.m_has_altitude = true; }
    else if (strcmp(el->string,"fix")==0)
      result.m_fix = el->valueint;
    else if (strcmp(el->string,"hdop")==0)
      { result.m_hdop = el->valuedouble; result.m_has_hdop = true; }
    else if (strcmp(el->string,"timestamp")==0)
      result.m_timestamp = (int64_t)el->valuedouble;
    }
  cJSON_Delete(root);

  if (!lat || !lon)
    return TELM_ERR_PROTOCOL;
  fix = result;
  return TELM_OK;
  }

telm_err_t LocationFile::Write(const GpsFix& fix)
  {
  int err = save_file(m_path, Encode(fix));
  if (err != 0)
    {
    TELM_LOGE(TAG, "Cannot write %s: %s", m_path.c_str(), strerror(err));
    return TELM_ERR_IO;
    }
  TELM_LOGD(TAG, "Wrote %s: %s", m_path.c_str(), fix.ToString().c_str());
  return TELM_OK;
  }

telm_err_t LocationFile::Read(GpsFix& fix)
  {
  std::string json;
  int err = load_file(m_path, json);
  if (err == ENOENT)
    return TELM_ERR_NOT_FOUND;
  if (err != 0)
    return TELM_ERR_IO;
  telm_err_t result = Decode(json, fix);
  if (result != TELM_OK)
    TELM_LOGW(TAG, "Malformed location file %s", m_path.c_str());
  return result;
  }

telm_err_t LocationFile::LoadSeed(const std::string& path, GpsFix& fix)
  {
  std::string json;
  int err = load_file(path, json);
  if (err == ENOENT)
    return TELM_ERR_NOT_FOUND;
  if (err != 0)
    return TELM_ERR_IO;

  GpsFix seed;
  telm_err_t result = Decode(json, seed);
  if (result != TELM_OK)
    {
    TELM_LOGW(TAG, "Malformed seed location %s", path.c_str());
    return result;
    }
  seed.m_has_hdop = true;
  seed.m_hdop = LOCATION_SEED_HDOP;
  if (seed.m_fix < GPS_FIX_2D)
    seed.m_fix = GPS_FIX_2D;
  fix = seed;
  return TELM_OK;
  }

////////////////////////////////////////////////////////////////////////////////
// Location Initialisation and Registrations

class LocationInit
  {
  public: LocationInit();
} MyLocationInit  __attribute__ ((init_priority (4700)));

LocationInit::LocationInit()
  {
  TELM_LOGD(TAG, "Initialising LOCATION (4700)");

  MyConfig.RegisterParam("location", "Location file", true, true);
  // Our instances:
  //   'file': JSON location file for external readers (default: /tmp/telm/location.json)
  //   'seed': location to start with, read once at daemon start (default: /boot/telm/location.json)
  //   'hdop.improve': only record fixes with an hdop no worse than the stored one? yes/no (default: no)
  //   'overwrite.nofix': let a no-fix reading replace the stored fix? yes/no (default: no)
  }
