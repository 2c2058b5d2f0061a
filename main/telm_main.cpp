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
static const char *TAG = "telm";

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include "telm.h"
#include "telm_command.h"
#include "telm_config.h"
#include "serial_transport.h"
#include "telm_modem.h"
#include "state_store.h"

static void usage(const char* argv0)
  {
  fprintf(stderr,
    "telm %s\n"
    "Usage: %s [-v[v]] [-c <confdir>] [-d <device>] <command> [<args>...]\n"
    "       %s ?          (list commands)\n",
    TELM_VERSION, argv0, argv0);
  }

int main(int argc, char* argv[])
  {
  int verbose = 0;
  std::string confdir = TELM_CONFIGPATH;
  std::string device;

  int opt;
  while ((opt = getopt(argc, argv, "+vc:d:h")) != -1)
    {
    switch (opt)
      {
      case 'v': verbose++; break;
      case 'c': confdir = optarg; break;
      case 'd': device = optarg; break;
      default:
        usage(argv[0]);
        return (opt == 'h') ? 0 : 2;
      }
    }
  if (optind >= argc)
    {
    usage(argv[0]);
    return 2;
    }

  telm_err_t err = MyConfig.mount(confdir);
  if (err != TELM_OK)
    TELM_LOGW(TAG, "Config %s not available (%s), using defaults", confdir.c_str(), TelmErrName(err));
  MyCommandApp.ReadConfig();
  if (verbose > 0)
    telm_log_level_set("*", (verbose > 1) ? TELM_LOG_VERBOSE : TELM_LOG_DEBUG);

  FileStateStore store(MyConfig.GetParamValue("store", "path", STATE_DEFAULT_PATH));
  if ((err = store.Load()) != TELM_OK)
    TELM_LOGW(TAG, "State store %s unreadable (%s)", store.GetPath().c_str(), TelmErrName(err));
  MyStateStore = &store;

  SerialTransport transport;
  modem m(&transport);
  MyModem = &m;
  if (!device.empty())
    m.SetDevice(device);
  m.SetCellularModemDriver(MyConfig.GetParamValue("modem", "driver", MODEM_DEFAULT_DRIVER).c_str());

  TelmStdioWriter writer(stdout);
  MyCommandApp.Execute(
    (verbose > 0) ? COMMAND_RESULT_VERBOSE : COMMAND_RESULT_NORMAL,
    &writer, argc - optind, argv + optind);
  err = writer.GetResult();

  m.Close();
  MyModem = NULL;
  MyStateStore = NULL;
  return (err == TELM_OK) ? 0 : 1;
  }
