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
static const char *TAG = "clock";

#include <errno.h>
#include <string.h>
#include <time.h>
#include <sys/time.h>
#include "telm_clock.h"
#include "telm_modem.h"
#include "telm_command.h"
#include "telm_config.h"
#include "telm_utils.h"

telm_err_t ClockSyncHost(modemdriver* driver, const std::string& flagfile, bool& synced)
  {
  synced = false;
  if (!flagfile.empty() && path_exists(flagfile))
    {
    TELM_LOGD(TAG, "Host clock already set this boot (%s exists)", flagfile.c_str());
    return TELM_OK;
    }

  int64_t utc;
  telm_err_t err = driver->GetClock(utc);
  if (err != TELM_OK)
    {
    TELM_LOGW(TAG, "Cannot read modem clock: %s", TelmErrName(err));
    return err;
    }

  struct timeval tv;
  tv.tv_sec = (time_t)utc;
  tv.tv_usec = 0;
  if (settimeofday(&tv, NULL) != 0)
    {
    TELM_LOGE(TAG, "settimeofday failed: %s", strerror(errno));
    return TELM_ERR_INVALID_STATE;
    }
  TELM_LOGI(TAG, "Host clock set to %s", FormatUtc(utc).c_str());

  if (!flagfile.empty())
    {
    int ferr = save_file(flagfile, "");
    if (ferr != 0)
      TELM_LOGW(TAG, "Cannot create %s: %s", flagfile.c_str(), strerror(ferr));
    }
  synced = true;
  return TELM_OK;
  }

void clock_show(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ModemCommandReady(writer)) return;
  int64_t utc;
  telm_err_t err = MyModem->GetDriver()->GetClock(utc);
  if (err != TELM_OK)
    return CommandError(writer, "reading modem clock", err);
  writer->printf("Modem clock: %s\n", FormatUtc(utc).c_str());
  if (verbosity >= COMMAND_RESULT_NORMAL)
    {
    int64_t host = (int64_t)time(NULL);
    writer->printf("Host clock:  %s (%+lld s)\n", FormatUtc(host).c_str(), (long long)(host - utc));
    }
  }

void clock_sync(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ModemCommandReady(writer)) return;
  bool synced;
  std::string flag = MyConfig.GetParamValue("clock", "flag", CLOCK_DEFAULT_FLAG);
  telm_err_t err = ClockSyncHost(MyModem->GetDriver(), flag, synced);
  if (err != TELM_OK)
    return CommandError(writer, "clock sync", err);
  if (synced)
    writer->puts("Host clock set from modem");
  else
    writer->printf("Host clock already set (%s exists)\n", flag.c_str());
  }

void clock_set(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ModemCommandReady(writer)) return;
  int64_t utc = (int64_t)time(NULL);
  telm_err_t err = MyModem->GetDriver()->SetClock(utc);
  if (err != TELM_OK)
    return CommandError(writer, "setting modem clock", err);
  writer->printf("Modem clock set to %s\n", FormatUtc(utc).c_str());
  }

class ClockInit
  {
  public: ClockInit();
} MyClockInit  __attribute__ ((init_priority (4750)));

ClockInit::ClockInit()
  {
  TELM_LOGD(TAG, "Initialising CLOCK (4750)");

  TelmCommand* cmd_clock = MyCommandApp.RegisterCommand("clock","Modem real time clock");
  cmd_clock->RegisterCommand("show","Show modem clock (UTC)",clock_show);
  cmd_clock->RegisterCommand("sync","Set host clock from modem, once per boot",clock_sync);
  cmd_clock->RegisterCommand("set","Set modem clock from host",clock_set);

  MyConfig.RegisterParam("clock", "Clock synchronisation", true, true);
  // Our instances:
  //   'flag': file marking the host clock as set this boot (default: /tmp/telm_clock)
  }
