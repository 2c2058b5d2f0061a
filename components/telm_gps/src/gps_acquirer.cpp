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
static const char *TAG = "gps";

#include <stdlib.h>
#include <string.h>
#include <vector>
#include "gps_acquirer.h"
#include "telm_command.h"
#include "telm_config.h"
#include "telm_location.h"
#include "telm_semaphore.h"
#include "telm_utils.h"
#include "state_store.h"

GpsAcquirer::GpsAcquirer(modemdriver* driver, StateStore* store, LocationFile* file)
  {
  m_driver = driver;
  m_store = store;
  m_file = file;
  m_delay = [](int ms) { return TelmDelay(ms); };
  }

GpsAcquirer::~GpsAcquirer()
  {
  }

/**
 * Acquire: poll for a fix, at most maxRetries queries
 *  - a valid lock returns at once
 *  - no-fix, timeout and malformed replies consume an attempt, each failed
 *    attempt is followed by a delay of retryDelayMs
 *  - transport and device errors are returned to the caller unchanged
 */
telm_err_t GpsAcquirer::Acquire(int maxRetries, int retryDelayMs, GpsFix& fix)
  {
  for (int attempt=1; attempt<=maxRetries; attempt++)
    {
    GpsFix result;
    telm_err_t err = m_driver->GpsQuery(result);
    switch (err)
      {
      case TELM_OK:
        TELM_LOGI(TAG, "Fix on attempt %d/%d: %s", attempt, maxRetries, result.ToString().c_str());
        fix = result;
        return TELM_OK;
      case TELM_ERR_NOFIX:
      case TELM_ERR_TIMEOUT:
      case TELM_ERR_PROTOCOL:
        TELM_LOGD(TAG, "Attempt %d/%d: %s", attempt, maxRetries, TelmErrName(err));
        break;
      default:
        TELM_LOGD(TAG, "Attempt %d/%d aborted: %s", attempt, maxRetries, TelmErrName(err));
        return err;
      }
    if (!m_delay(retryDelayMs))
      return TELM_ERR_CANCELLED;
    }

  TELM_LOGW(TAG, "No fix after %d attempts", maxRetries);
  return TELM_ERR_ACQUISITION_TIMEOUT;
  }

/**
 * AcquireSettled: take toss+1 fixes, tossDelayMs apart, and return the last
 *  - early fixes after power on are discarded as unsettled
 */
telm_err_t GpsAcquirer::AcquireSettled(int toss, int tossDelayMs, int maxRetries, int retryDelayMs, GpsFix& fix)
  {
  GpsFix result;
  for (int k=0; k<=toss; k++)
    {
    if (k > 0 && !m_delay(tossDelayMs))
      return TELM_ERR_CANCELLED;
    telm_err_t err = Acquire(maxRetries, retryDelayMs, result);
    if (err != TELM_OK)
      return err;
    if (k < toss)
      TELM_LOGD(TAG, "Tossed fix %d/%d: %s", k+1, toss, result.ToString().c_str());
    }
  fix = result;
  return TELM_OK;
  }

/**
 * AcquireUntil: acquire fixes until one reaches the hdop target
 *  - every fix better than the best so far is recorded at once
 *  - a round without a sufficient fix is followed by roundDelayMs
 *  - TELM_ERR_ACQUISITION_TIMEOUT after rounds without reaching the
 *    target, the best fix found stays recorded
 */
telm_err_t GpsAcquirer::AcquireUntil(double hdop, int rounds, int roundDelayMs, int maxRetries, int retryDelayMs, GpsFix& fix)
  {
  GpsFix best;
  bool found = false;
  for (int round=1; round<=rounds; round++)
    {
    GpsFix result;
    telm_err_t err = Acquire(maxRetries, retryDelayMs, result);
    if (err == TELM_OK)
      {
      bool better = !found
        || (result.m_has_hdop && (!best.m_has_hdop || result.m_hdop < best.m_hdop));
      if (better)
        {
        best = result;
        found = true;
        if ((err = Record(best)) != TELM_OK)
          return err;
        }
      if (result.m_has_hdop && result.m_hdop <= hdop)
        {
        TELM_LOGI(TAG, "hdop %.2f reached in round %d", result.m_hdop, round);
        fix = result;
        return TELM_OK;
        }
      TELM_LOGD(TAG, "Round %d/%d: hdop %s above %.2f", round, rounds,
        result.m_has_hdop ? StateStore::FormatDouble(result.m_hdop, 2).c_str() : "unknown", hdop);
      }
    else if (err != TELM_ERR_ACQUISITION_TIMEOUT)
      return err;

    if (round < rounds && !m_delay(roundDelayMs))
      return TELM_ERR_CANCELLED;
    }

  TELM_LOGW(TAG, "hdop %.2f not reached after %d rounds", hdop, rounds);
  return TELM_ERR_ACQUISITION_TIMEOUT;
  }

static const char* const gps_keys[] =
  {
  STATE_GPS_LATITUDE, STATE_GPS_LONGITUDE, STATE_GPS_ALTITUDE,
  STATE_GPS_FIX, STATE_GPS_HDOP, STATE_GPS_TIMESTAMP
  };

/**
 * Record: publish a fix to the state store and the location file
 *  - valid fixes with a worse hdop than the stored one are skipped if
 *    'location hdop.improve' is set
 *  - no-fix readings are only written if 'location overwrite.nofix' is set
 *  - the gps_fix keys are written as one batch, and restored if the
 *    location file cannot be written
 */
telm_err_t GpsAcquirer::Record(const GpsFix& fix, bool* recorded /*=NULL*/)
  {
  if (recorded) *recorded = false;

  int minfix = MyConfig.GetParamValueInt("gps", "fix.min", GPS_FIX_2D);
  if (!fix.IsValid(minfix))
    {
    if (!MyConfig.GetParamValueBool("location", "overwrite.nofix", false))
      {
      TELM_LOGD(TAG, "Record: no fix, keeping stored location");
      return TELM_OK;
      }
    }
  else if (fix.m_has_hdop
           && MyConfig.GetParamValueBool("location", "hdop.improve", false)
           && m_store->IsDefined(STATE_GPS_HDOP))
    {
    double stored = m_store->GetDouble(STATE_GPS_HDOP);
    if (fix.m_hdop > stored)
      {
      TELM_LOGD(TAG, "Record: hdop %.2f worse than stored %.2f, skipped", fix.m_hdop, stored);
      return TELM_OK;
      }
    }

  StateMap previous;
  std::vector<std::string> absent;
  for (const char* key : gps_keys)
    {
    if (m_store->IsDefined(key))
      previous[key] = m_store->Get(key);
    else
      absent.push_back(key);
    }

  StateMap values;
  std::vector<std::string> removals;
  values[STATE_GPS_LATITUDE] = StateStore::FormatDouble(fix.m_latitude, 4);
  values[STATE_GPS_LONGITUDE] = StateStore::FormatDouble(fix.m_longitude, 4);
  if (fix.m_has_altitude)
    values[STATE_GPS_ALTITUDE] = StateStore::FormatDouble(fix.m_altitude, 1);
  else
    removals.push_back(STATE_GPS_ALTITUDE);
  values[STATE_GPS_FIX] = std::to_string(fix.m_fix);
  if (fix.m_has_hdop)
    values[STATE_GPS_HDOP] = StateStore::FormatDouble(fix.m_hdop, 2);
  else
    removals.push_back(STATE_GPS_HDOP);
  values[STATE_GPS_TIMESTAMP] = std::to_string((long long)fix.m_timestamp);

  telm_err_t err = m_store->SetMany(values, removals);
  if (err != TELM_OK)
    {
    TELM_LOGE(TAG, "Record: cannot store fix: %s", TelmErrName(err));
    return err;
    }

  if ((err = m_file->Write(fix)) != TELM_OK)
    {
    telm_err_t rerr = m_store->SetMany(previous, absent);
    if (rerr != TELM_OK)
      TELM_LOGE(TAG, "Record: cannot restore previous fix: %s", TelmErrName(rerr));
    return err;
    }

  TELM_LOGI(TAG, "New location: %s", fix.ToString().c_str());
  if (recorded) *recorded = true;
  return TELM_OK;
  }

telm_err_t GpsAcquirer::GetRecorded(GpsFix& fix)
  {
  if (!m_store->IsDefined(STATE_GPS_LATITUDE) || !m_store->IsDefined(STATE_GPS_LONGITUDE))
    return TELM_ERR_NOT_FOUND;
  GpsFix result;
  result.m_latitude = m_store->GetDouble(STATE_GPS_LATITUDE);
  result.m_longitude = m_store->GetDouble(STATE_GPS_LONGITUDE);
  result.m_has_altitude = m_store->IsDefined(STATE_GPS_ALTITUDE);
  result.m_altitude = m_store->GetDouble(STATE_GPS_ALTITUDE);
  result.m_fix = atoi(m_store->Get(STATE_GPS_FIX, "0").c_str());
  result.m_has_hdop = m_store->IsDefined(STATE_GPS_HDOP);
  result.m_hdop = m_store->GetDouble(STATE_GPS_HDOP);
  result.m_timestamp = atoll(m_store->Get(STATE_GPS_TIMESTAMP, "0").c_str());
  fix = result;
  return TELM_OK;
  }

////////////////////////////////////////////////////////////////////////////////
// GPS commands

static bool gps_ready(TelmWriter* writer)
  {
  if (!ModemCommandReady(writer)) return false;
  if (MyStateStore == NULL)
    {
    writer->puts("ERROR: state store not available");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return false;
    }
  return true;
  }

static bool gps_delay(int ms)
  {
  return MyModem ? MyModem->Delay(ms) : TelmDelay(ms);
  }

void gps_status(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!gps_ready(writer)) return;
  bool on;
  telm_err_t err = MyModem->GetDriver()->GpsGetPower(on);
  if (err != TELM_OK)
    return CommandError(writer, "GPS power query", err);
  writer->printf("GPS power: %s\n", on ? "on" : "off");

  LocationFile file(MyConfig.GetParamValue("location", "file", LOCATION_DEFAULT_FILE));
  GpsAcquirer gps(MyModem->GetDriver(), MyStateStore, &file);
  GpsFix fix;
  if (gps.GetRecorded(fix) == TELM_OK)
    writer->printf("Location:  %s\n", fix.ToString().c_str());
  else
    writer->puts("Location:  none recorded");
  }

void gps_start(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!gps_ready(writer)) return;
  telm_err_t err = MyModem->GetDriver()->GpsSetPower(true);
  if (err != TELM_OK)
    return CommandError(writer, "GPS power on", err);
  writer->puts("GPS powered on");
  }

void gps_stop(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!gps_ready(writer)) return;
  telm_err_t err = MyModem->GetDriver()->GpsSetPower(false);
  if (err != TELM_OK)
    return CommandError(writer, "GPS power off", err);
  writer->puts("GPS powered off");
  }

void gps_fix(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  double until = 0;
  int toss = 0;
  bool usage = false;
  std::vector<const char*> args;
  for (int k=0; k<argc; k++)
    {
    if (strcmp(argv[k], "-u") == 0 && k+1 < argc)
      {
      until = atof(argv[++k]);
      usage |= (until <= 0);
      }
    else if (strcmp(argv[k], "-t") == 0 && k+1 < argc)
      {
      toss = atoi(argv[++k]);
      usage |= (toss < 0);
      }
    else if (argv[k][0] == '-')
      usage = true;
    else
      args.push_back(argv[k]);
    }
  if (usage || args.size() > 2 || (until > 0 && toss > 0))
    {
    writer->puts("Usage: gps fix [-u <hdop> | -t <toss>] [<retries> [<delay>]]");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }
  int retries = (args.size() > 0) ? atoi(args[0]) : MyConfig.GetParamValueInt("gps", "retries", 2);
  int delay = (args.size() > 1) ? atoi(args[1]) : MyConfig.GetParamValueInt("gps", "delay", 10);
  if (retries < 1 || delay < 0)
    {
    writer->puts("ERROR: retries must be at least 1, delay not negative");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }
  if (!gps_ready(writer)) return;
  modemdriver* driver = MyModem->GetDriver();

  bool power = MyConfig.GetParamValueBool("gps", "power", true);
  telm_err_t err;
  if (power && (err = driver->GpsSetPower(true)) != TELM_OK)
    return CommandError(writer, "GPS power on", err);

  LocationFile file(MyConfig.GetParamValue("location", "file", LOCATION_DEFAULT_FILE));
  GpsAcquirer gps(driver, MyStateStore, &file);
  gps.SetDelayFunction(gps_delay);
  GpsFix fix;
  if (until > 0)
    {
    err = gps.AcquireUntil(until,
      LIMIT_MIN(MyConfig.GetParamValueInt("gps", "until.rounds", 10), 1),
      MyConfig.GetParamValueInt("gps", "until.delay", 10) * 1000,
      retries, delay * 1000, fix);
    if (err == TELM_OK)
      writer->printf("%s\n", fix.ToString().c_str());
    else if (err == TELM_ERR_ACQUISITION_TIMEOUT && gps.GetRecorded(fix) == TELM_OK)
      {
      writer->printf("%s (hdop %.2f not reached)\n", fix.ToString().c_str(), until);
      writer->SetResult(err);
      }
    else
      CommandError(writer, "GPS fix", err);
    }
  else
    {
    err = gps.AcquireSettled(toss, MyConfig.GetParamValueInt("gps", "toss.delay", 5) * 1000,
      retries, delay * 1000, fix);
    if (err == TELM_OK)
      {
      bool recorded;
      telm_err_t rerr = gps.Record(fix, &recorded);
      writer->printf("%s%s\n", fix.ToString().c_str(),
        (rerr != TELM_OK) ? " (not recorded)" : recorded ? "" : " (not better than stored)");
      if (rerr != TELM_OK) writer->SetResult(rerr);
      }
    else
      CommandError(writer, "GPS fix", err);
    }

  if (power && err != TELM_ERR_IO && err != TELM_ERR_CANCELLED)
    {
    telm_err_t perr = driver->GpsSetPower(false);
    if (perr != TELM_OK)
      writer->printf("Warning: GPS power off failed (%s)\n", TelmErrName(perr));
    }
  }

void gps_test(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  int count = (argc > 0) ? atoi(argv[0]) : 1;
  if (count < 1)
    {
    writer->puts("ERROR: count must be at least 1");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }
  if (!ModemCommandReady(writer)) return;
  modemdriver* driver = MyModem->GetDriver();
  telm_err_t err;

  std::string iccid;
  if ((err = driver->GetIccid(iccid)) != TELM_OK)
    return CommandError(writer, "ICCID query", err);
  writer->printf("ICCID: %s\n", iccid.c_str());
  double quality;
  if ((err = driver->GetSignalQuality(quality)) == TELM_OK)
    writer->printf("Signal strength: %d%%\n", (int)(quality * 100 + 0.5));
  else if (err == TELM_ERR_NOT_FOUND)
    writer->puts("Signal strength: unknown");
  else
    return CommandError(writer, "signal query", err);

  bool on = false;
  if ((err = driver->GpsGetPower(on)) != TELM_OK)
    return CommandError(writer, "GPS power query", err);
  if (!on && (err = driver->GpsSetPower(true)) != TELM_OK)
    return CommandError(writer, "GPS power on", err);

  int retries = MyConfig.GetParamValueInt("gps", "init.retries", 30);
  int delay = MyConfig.GetParamValueInt("gps", "delay", 10);
  LocationFile file(MyConfig.GetParamValue("location", "file", LOCATION_DEFAULT_FILE));
  GpsAcquirer gps(driver, MyStateStore, &file);
  gps.SetDelayFunction(gps_delay);
  for (int k=0; k<count; k++)
    {
    if (k > 0 && !gps_delay(15000))
      break;
    GpsFix fix;
    err = gps.Acquire(retries, delay * 1000, fix);
    if (err == TELM_OK)
      writer->printf("%.4f,%.4f\n", fix.m_latitude, fix.m_longitude);
    else if (err == TELM_ERR_ACQUISITION_TIMEOUT)
      writer->puts("nowhere");
    else
      {
      CommandError(writer, "GPS fix", err);
      break;
      }
    }

  if (err != TELM_ERR_IO && err != TELM_ERR_CANCELLED)
    {
    telm_err_t perr = driver->GpsSetPower(false);
    if (perr != TELM_OK)
      writer->printf("Warning: GPS power off failed (%s)\n", TelmErrName(perr));
    }
  }

class GpsInit
  {
  public: GpsInit();
} MyGpsInit  __attribute__ ((init_priority (4850)));

GpsInit::GpsInit()
  {
  TELM_LOGD(TAG, "Initialising GPS (4850)");

  TelmCommand* cmd_gps = MyCommandApp.RegisterCommand("gps","GPS/GNSS control");
  cmd_gps->RegisterCommand("status","GPS/GNSS power and last location",gps_status);
  cmd_gps->RegisterCommand("start","Power GPS/GNSS on",gps_start);
  cmd_gps->RegisterCommand("stop","Power GPS/GNSS off",gps_stop);
  cmd_gps->RegisterCommand("fix","Acquire and record a fix",gps_fix,"[-u <hdop> | -t <toss>] [<retries> [<delay>]]",0,4);
  cmd_gps->RegisterCommand("test","Show ICCID, signal and <count> positions",gps_test,"[<count>]",0,1);

  MyConfig.RegisterParam("gps", "GPS/GNSS configuration", true, true);
  // Our instances:
  //   'query': AT command reading the position, AT$GPSACP or AT+CGPSINFO (default: AT$GPSACP)
  //   'fix.min': minimum fix quality accepted, 2 = 2D, 3 = 3D (default: 2)
  //   'retries': queries per daemon cycle (default: 2)
  //   'delay': seconds between queries (default: 10)
  //   'init.retries': queries for the first fix after start (default: 30)
  //   'init.delay': seconds between queries for the first fix (default: 10)
  //   'interval': seconds between daemon cycles (default: 900)
  //   'power': power the GPS on and off around each cycle? yes/no (default: yes)
  //   'toss.delay': seconds between fixes taken by 'gps fix -t' (default: 5)
  //   'until.rounds': acquisition rounds of 'gps fix -u' before giving up (default: 10)
  //   'until.delay': seconds between rounds of 'gps fix -u' (default: 10)
  }
