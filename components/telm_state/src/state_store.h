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


#ifndef __STATE_STORE_H__
#define __STATE_STORE_H__

#include <string>
#include <map>
#include <vector>
#include "telm.h"
#include "telm_mutex.h"

// Keys shared with external consumers:
#define STATE_DEVICE_IDENTITY   "device_identity"
#define STATE_ECM_STATE         "ecm_state"
#define STATE_GPS_LATITUDE      "gps_fix.latitude"
#define STATE_GPS_LONGITUDE     "gps_fix.longitude"
#define STATE_GPS_ALTITUDE      "gps_fix.altitude"
#define STATE_GPS_FIX           "gps_fix.fix"
#define STATE_GPS_HDOP          "gps_fix.hdop"
#define STATE_GPS_TIMESTAMP     "gps_fix.timestamp"
#define STATE_ICCID             "iccid"
#define STATE_IMEI              "imei"
#define STATE_HOST_ID           "host_id"
#define STATE_SIGNAL            "signal"

#define STATE_DEFAULT_PATH      "/run/telm/state"

typedef std::map<std::string, std::string> StateMap;

/**
 * StateStore: key/value state shared with other processes
 *  - SetMany() applies a batch in a single write, all of it or nothing
 */
class StateStore
  {
  public:
    StateStore();
    virtual ~StateStore();

  public:
    virtual std::string Get(const std::string& key, const std::string& defvalue = "") = 0;
    virtual telm_err_t Set(const std::string& key, const std::string& value) = 0;
    virtual bool IsDefined(const std::string& key) = 0;
    virtual telm_err_t Delete(const std::string& key) = 0;
    virtual telm_err_t SetMany(const StateMap& values,
                               const std::vector<std::string>& removals = std::vector<std::string>()) = 0;

  public:
    double GetDouble(const std::string& key, double defvalue = 0);
    telm_err_t SetDouble(const std::string& key, double value, int precision = 6);
    static std::string FormatDouble(double value, int precision);
  };

/**
 * FileStateStore: one "key<TAB>value" line per key in <dir>/state,
 *  rewritten atomically on every change
 *  - writers serialise on an flock of <dir>/state.lock and merge the
 *    current file before each rewrite, so processes sharing the
 *    directory keep each other's keys
 */
class FileStateStore : public StateStore
  {
  public:
    FileStateStore(const std::string& dir = STATE_DEFAULT_PATH);
    ~FileStateStore();

  public:
    std::string Get(const std::string& key, const std::string& defvalue = "");
    telm_err_t Set(const std::string& key, const std::string& value);
    bool IsDefined(const std::string& key);
    telm_err_t Delete(const std::string& key);
    telm_err_t SetMany(const StateMap& values,
                       const std::vector<std::string>& removals = std::vector<std::string>());

  public:
    telm_err_t Load();
    const std::string& GetPath() { return m_file; }

  protected:
    telm_err_t LoadLocked();
    telm_err_t Rewrite();

  protected:
    std::string m_file;
    StateMap m_map;
    TelmMutex m_lock;
  };

extern StateStore* MyStateStore;

#endif //#ifndef __STATE_STORE_H__
