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
static const char *TAG = "telmd";

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <signal.h>
#include <getopt.h>
#include "telm.h"
#include "telm_command.h"
#include "telm_config.h"
#include "telm_location.h"
#include "telm_usb.h"
#include "serial_transport.h"
#include "telm_modem.h"
#include "state_store.h"
#include "telm_daemon.h"
#include "telm_utils.h"

static TelmDaemon* s_daemon = NULL;

static void signal_handler(int signo)
  {
  if (s_daemon) s_daemon->Shutdown();
  }

static void usage(const char* argv0)
  {
  fprintf(stderr,
    "telmd %s\n"
    "Usage: %s [-v[v]] [-c <confdir>] [-d <device>] [-r <retries>] [-D <delay>]\n"
    "          [--syslog] [--wait-usb]\n"
    "  -r, --retries   GPS queries for the first fix\n"
    "  -D, --delay     seconds between queries for the first fix\n",
    TELM_VERSION, argv0);
  }

// Wait for the modem to enumerate on USB, it may attach after we start
static bool wait_usb(TelmSemaphore* cancel)
  {
  int delay = MyConfig.GetParamValueInt("modem", "usb.wait", 10);
  while (!UsbModemPresent(TELIT_USB_VENDOR))
    {
    TELM_LOGI(TAG, "Telit modem not found on USB, retrying in %d s", delay);
    if (!TelmDelay(delay * 1000, cancel))
      return false;
    }
  TELM_LOGI(TAG, "Found Telit modem");
  return true;
  }

int main(int argc, char* argv[])
  {
  static const struct option long_options[] =
    {
    { "verbose",  no_argument,        NULL, 'v' },
    { "config",   required_argument,  NULL, 'c' },
    { "device",   required_argument,  NULL, 'd' },
    { "retries",  required_argument,  NULL, 'r' },
    { "delay",    required_argument,  NULL, 'D' },
    { "syslog",   no_argument,        NULL, 'S' },
    { "wait-usb", no_argument,        NULL, 'W' },
    { "help",     no_argument,        NULL, 'h' },
    { NULL,       0,                  NULL, 0 }
    };

  int verbose = 0;
  std::string confdir = TELM_CONFIGPATH;
  std::string device;
  int retries = -1, delay = -1;
  bool use_syslog = false, waitusb = false, badarg = false;

  int opt;
  while ((opt = getopt_long(argc, argv, "vc:d:r:D:h", long_options, NULL)) != -1)
    {
    switch (opt)
      {
      case 'v': verbose++; break;
      case 'c': confdir = optarg; break;
      case 'd': device = optarg; break;
      case 'r': badarg |= !parse_int(optarg, 1, retries); break;
      case 'D': badarg |= !parse_int(optarg, 0, delay); break;
      case 'S': use_syslog = true; break;
      case 'W': waitusb = true; break;
      default:
        usage(argv[0]);
        return (opt == 'h') ? 0 : 2;
      }
    }
  if (optind < argc || badarg)
    {
    usage(argv[0]);
    return 2;
    }

  if (use_syslog)
    telm_log_syslog(true, "telmd");
  telm_err_t err = MyConfig.mount(confdir);
  if (err != TELM_OK)
    TELM_LOGW(TAG, "Config %s not available (%s), using defaults", confdir.c_str(), TelmErrName(err));
  MyCommandApp.ReadConfig();
  if (verbose > 0)
    telm_log_level_set("*", (verbose > 1) ? TELM_LOG_VERBOSE : TELM_LOG_DEBUG);
  TELM_LOGI(TAG, "telmd %s starting", TELM_VERSION);

  FileStateStore store(MyConfig.GetParamValue("store", "path", STATE_DEFAULT_PATH));
  if ((err = store.Load()) != TELM_OK)
    TELM_LOGW(TAG, "State store %s unreadable (%s)", store.GetPath().c_str(), TelmErrName(err));
  MyStateStore = &store;

  LocationFile location(MyConfig.GetParamValue("location", "file", LOCATION_DEFAULT_FILE));
  SerialTransport transport;
  modem m(&transport);
  MyModem = &m;
  if (!device.empty())
    m.SetDevice(device);
  m.SetCellularModemDriver(MyConfig.GetParamValue("modem", "driver", MODEM_DEFAULT_DRIVER).c_str());

  TelmDaemon daemon(&m, &store, &location);
  if (retries > 0 || delay >= 0)
    daemon.SetInitBudget(retries, (delay >= 0) ? delay * 1000 : -1);
  s_daemon = &daemon;

  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, NULL);
  sigaction(SIGTERM, &sa, NULL);
  signal(SIGPIPE, SIG_IGN);

  if (!waitusb || wait_usb(daemon.GetShutdown()))
    daemon.Run();

  s_daemon = NULL;
  MyModem = NULL;
  MyStateStore = NULL;
  TELM_LOGI(TAG, "telmd exiting");
  return 0;
  }
