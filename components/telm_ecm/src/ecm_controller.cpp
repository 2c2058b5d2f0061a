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
static const char *TAG = "ecm";

#include <errno.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/types.h>
#include "ecm_controller.h"
#include "telm_modem.h"
#include "telm_semaphore.h"
#include "telm_command.h"
#include "telm_config.h"
#include "telm_clock.h"
#include "telm_utils.h"
#include "state_store.h"

const char* EcmStateName(EcmController::ecm_state_t state)
  {
  switch (state)
    {
    case EcmController::Unknown:           return "Unknown";
    case EcmController::Disabled:          return "Disabled";
    case EcmController::Enabling:          return "Enabling";
    case EcmController::Enabled:           return "Enabled";
    case EcmController::DisableRequested:  return "DisableRequested";
    default:                               return "Undefined";
    }
  }

EcmController::EcmController(modemdriver* driver, StateStore* store)
  {
  m_driver = driver;
  m_store = store;
  m_state = Unknown;
  }

EcmController::~EcmController()
  {
  }

void EcmController::SetState(ecm_state_t newstate)
  {
  if (newstate == m_state) return;
  TELM_LOGD(TAG, "State: %s -> %s", EcmStateName(m_state), EcmStateName(newstate));
  m_state = newstate;

  // Only stable states are published
  if (newstate == Enabling || newstate == DisableRequested)
    return;
  telm_err_t err = m_store->Set(STATE_ECM_STATE, EcmStateName(newstate));
  if (err != TELM_OK)
    TELM_LOGW(TAG, "Cannot persist ecm_state: %s", TelmErrName(err));
  }

telm_err_t EcmController::QueryIdentity(std::string& identity)
  {
  std::string queried;
  telm_err_t err = m_driver->QueryIdentity(queried);

  if (m_store->IsDefined(STATE_DEVICE_IDENTITY))
    {
    std::string stored = m_store->Get(STATE_DEVICE_IDENTITY);
    if (err == TELM_OK && queried != stored)
      TELM_LOGW(TAG, "Modem reports identity %s, keeping %s", queried.c_str(), stored.c_str());
    if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
      return err;
    identity = stored;
    return TELM_OK;
    }

  if (err != TELM_OK)
    {
    TELM_LOGD(TAG, "Identity query failed: %s", TelmErrName(err));
    return err;
    }
  err = m_store->Set(STATE_DEVICE_IDENTITY, queried);
  if (err != TELM_OK)
    return err;
  TELM_LOGI(TAG, "Device identity %s", queried.c_str());
  identity = queried;
  return TELM_OK;
  }

telm_err_t EcmController::Enable()
  {
  if (m_state == Enabled)
    return TELM_OK;

  ecm_state_t previous = m_state;
  SetState(Enabling);
  telm_err_t err = m_driver->EcmStart();
  if (err == TELM_ERR_DEVICE)
    {
    // The modem refuses #ECM while a session is already up
    bool up = false;
    if (m_driver->GetEcmStatus(up) == TELM_OK && up)
      err = TELM_OK;
    }
  if (err != TELM_OK)
    {
    TELM_LOGW(TAG, "ECM enable failed: %s", TelmErrName(err));
    SetState(previous);
    return err;
    }
  SetState(Enabled);
  TELM_LOGI(TAG, "ECM enabled");
  return TELM_OK;
  }

telm_err_t EcmController::Disable()
  {
  if (m_state == Disabled)
    return TELM_OK;

  ecm_state_t previous = m_state;
  SetState(DisableRequested);
  telm_err_t err = m_driver->EcmStop();
  if (err != TELM_OK)
    {
    TELM_LOGW(TAG, "ECM disable failed: %s", TelmErrName(err));
    SetState(previous);
    return err;
    }
  SetState(Disabled);
  TELM_LOGI(TAG, "ECM disabled");
  return TELM_OK;
  }

telm_err_t EcmController::Verify()
  {
  bool up = false;
  telm_err_t err = m_driver->GetEcmStatus(up);
  if (err != TELM_OK)
    {
    TELM_LOGD(TAG, "ECM status query failed: %s", TelmErrName(err));
    return err;
    }
  if (m_state == Enabled && !up)
    TELM_LOGW(TAG, "ECM has dropped");
  SetState(up ? Enabled : Disabled);
  return TELM_OK;
  }

telm_err_t EcmController::Restart()
  {
  TELM_LOGW(TAG, "Restarting ECM");
  SetState(DisableRequested);
  telm_err_t err = m_driver->EcmStop();
  if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
    {
    SetState(Unknown);
    return err;
    }
  if (err != TELM_OK)
    TELM_LOGD(TAG, "ECM stop before restart: %s", TelmErrName(err));
  SetState(Disabled);
  return Enable();
  }

telm_err_t EcmController::Check(const std::string& host, TelmLinkCheckFunc_t link, bool* restarted)
  {
  if (restarted) *restarted = false;
  telm_err_t err = Verify();
  if (err != TELM_OK)
    return err;

  if (m_state == Enabled)
    {
    if (host.empty() || !link)
      return TELM_OK;
    err = link(host);
    if (err == TELM_OK || err == TELM_ERR_CANCELLED)
      return err;
    TELM_LOGW(TAG, "No connection to %s (%s)", host.c_str(), TelmErrName(err));
    err = Restart();
    }
  else
    {
    TELM_LOGW(TAG, "ECM not enabled, re-enabling");
    err = Enable();
    }
  if (err == TELM_OK && restarted)
    *restarted = true;
  return err;
  }

////////////////////////////////////////////////////////////////////////////////
// Link check

static telm_err_t link_connect(const struct addrinfo* ai, int timeoutms, TelmSemaphore* cancel)
  {
  int sock = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
  if (sock < 0)
    {
    TELM_LOGW(TAG, "Link check: socket failed: %s", strerror(errno));
    return TELM_ERR_TIMEOUT;
    }

  telm_err_t result = TELM_ERR_TIMEOUT;
  int err = 0;
  if (connect(sock, ai->ai_addr, ai->ai_addrlen) == 0)
    result = TELM_OK;
  else if (errno != EINPROGRESS)
    err = errno;
  else
    {
    struct pollfd pfd[2];
    pfd[0].fd = sock;
    pfd[0].events = POLLOUT;
    pfd[0].revents = 0;
    pfd[1].fd = cancel ? cancel->GetFd() : -1;
    pfd[1].events = POLLIN;
    pfd[1].revents = 0;
    int n;
    do
      {
      n = poll(pfd, 2, timeoutms);
      } while (n < 0 && errno == EINTR);
    if (n > 0 && (pfd[1].revents & POLLIN))
      result = TELM_ERR_CANCELLED;
    else if (n > 0)
      {
      socklen_t len = sizeof(err);
      if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
        err = errno;
      if (err == 0)
        result = TELM_OK;
      }
    else
      err = ETIMEDOUT;
    }
  close(sock);

  // A refusal still proves the path to the host
  if (err == ECONNREFUSED)
    result = TELM_OK;
  else if (err != 0)
    TELM_LOGD(TAG, "Link check: connect failed: %s", strerror(err));
  return result;
  }

telm_err_t EcmCheckLink(const std::string& host, const std::string& service,
                        int tries, int timeoutms, TelmSemaphore* cancel)
  {
  struct addrinfo hints;
  struct addrinfo *res = NULL;
  memset(&hints,0,sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  int err = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if ((err != 0) || (res == NULL))
    {
    TELM_LOGW(TAG, "DNS lookup on %s failed: %s", host.c_str(), gai_strerror(err));
    return TELM_ERR_NOT_FOUND;
    }

  telm_err_t result = TELM_ERR_TIMEOUT;
  for (int k = 0; k < LIMIT_MIN(tries, 1) && result == TELM_ERR_TIMEOUT; k++)
    {
    if (cancel && cancel->IsAvail())
      {
      result = TELM_ERR_CANCELLED;
      break;
      }
    result = link_connect(res, timeoutms, cancel);
    }
  freeaddrinfo(res);
  TELM_LOGD(TAG, "Link check %s:%s: %s", host.c_str(), service.c_str(), TelmErrName(result));
  return result;
  }

telm_err_t EcmCheckLinkConfigured(const std::string& host, TelmSemaphore* cancel)
  {
  return EcmCheckLink(host,
                      MyConfig.GetParamValue("ecm", "port", ECM_DEFAULT_PORT),
                      MyConfig.GetParamValueInt("ecm", "check.tries", 3),
                      MyConfig.GetParamValueInt("ecm", "check.timeout", 5) * 1000,
                      cancel);
  }

////////////////////////////////////////////////////////////////////////////////
// ECM commands

static bool ecm_ready(TelmWriter* writer)
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

void ecm_start(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (argc > 0 && strcmp(argv[0], "setclock") != 0)
    {
    writer->puts("Usage: ecm start [setclock]");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }
  if (!ecm_ready(writer)) return;
  modemdriver* driver = MyModem->GetDriver();
  EcmController ecm(driver, MyStateStore);

  std::string identity;
  telm_err_t err = ecm.QueryIdentity(identity);
  if (err != TELM_OK)
    return CommandError(writer, "identity query", err);
  if (verbosity >= COMMAND_RESULT_NORMAL)
    writer->printf("Device identity: %s\n", identity.c_str());

  std::string iccid;
  if (driver->GetIccid(iccid) == TELM_OK && MyStateStore->Set(STATE_ICCID, iccid) != TELM_OK)
    writer->puts("Warning: cannot store ICCID");
  std::string hostid = host_identity();
  if (!hostid.empty() && MyStateStore->Set(STATE_HOST_ID, hostid) != TELM_OK)
    writer->puts("Warning: cannot store host id");

  if (argc > 0)
    {
    bool synced;
    err = ClockSyncHost(driver, MyConfig.GetParamValue("clock", "flag", CLOCK_DEFAULT_FLAG), synced);
    if (err != TELM_OK)
      writer->printf("Warning: host clock not set (%s)\n", TelmErrName(err));
    else if (synced)
      writer->puts("Host clock set from modem");
    }

  if ((err = ecm.Enable()) != TELM_OK)
    return CommandError(writer, "ECM start", err);
  writer->puts("ECM started");
  }

void ecm_stop(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ecm_ready(writer)) return;
  EcmController ecm(MyModem->GetDriver(), MyStateStore);

  telm_err_t err = ecm.Verify();
  if (err != TELM_OK)
    return CommandError(writer, "ECM status", err);
  if (ecm.GetState() == EcmController::Disabled)
    {
    writer->puts("ECM is not running");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }
  if ((err = ecm.Disable()) != TELM_OK)
    return CommandError(writer, "ECM stop", err);
  writer->puts("ECM stopped");
  }

void ecm_status(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ecm_ready(writer)) return;
  EcmController ecm(MyModem->GetDriver(), MyStateStore);

  telm_err_t err = ecm.Verify();
  if (err != TELM_OK)
    return CommandError(writer, "ECM status", err);
  writer->printf("ECM:       %s\n", EcmStateName(ecm.GetState()));
  writer->printf("Identity:  %s\n", MyStateStore->Get(STATE_DEVICE_IDENTITY, "-").c_str());
  if (verbosity >= COMMAND_RESULT_NORMAL)
    {
    writer->printf("ICCID:     %s\n", MyStateStore->Get(STATE_ICCID, "-").c_str());
    writer->printf("Host:      %s\n", MyStateStore->Get(STATE_HOST_ID, "-").c_str());
    }
  }

void ecm_check(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ecm_ready(writer)) return;
  EcmController ecm(MyModem->GetDriver(), MyStateStore);
  std::string host = (argc > 0) ? argv[0] : MyConfig.GetParamValue("ecm", "host", ECM_DEFAULT_HOST);

  bool restarted;
  telm_err_t err = ecm.Check(host,
    [](const std::string& h) { return EcmCheckLinkConfigured(h); },
    &restarted);
  if (err != TELM_OK)
    return CommandError(writer, "ECM check", err);
  if (restarted)
    writer->puts("ECM restarted");
  else if (host.empty())
    writer->puts("ECM running");
  else
    writer->printf("ECM running, %s reachable\n", host.c_str());
  }

void ecm_identity(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ecm_ready(writer)) return;
  EcmController ecm(MyModem->GetDriver(), MyStateStore);
  std::string identity;
  telm_err_t err = ecm.QueryIdentity(identity);
  if (err != TELM_OK)
    return CommandError(writer, "identity query", err);
  writer->puts(identity.c_str());
  }

class EcmInit
  {
  public: EcmInit();
} MyEcmInit  __attribute__ ((init_priority (4800)));

EcmInit::EcmInit()
  {
  TELM_LOGD(TAG, "Initialising ECM (4800)");

  TelmCommand* cmd_ecm = MyCommandApp.RegisterCommand("ecm","Ethernet Control Mode");
  cmd_ecm->RegisterCommand("start","Bring ECM up, optionally set host clock",ecm_start,"[setclock]",0,1);
  cmd_ecm->RegisterCommand("stop","Take ECM down",ecm_stop);
  cmd_ecm->RegisterCommand("status","Show ECM state",ecm_status);
  cmd_ecm->RegisterCommand("check","Restart ECM when the link to a host is down",ecm_check,"[<host>]",0,1);
  cmd_ecm->RegisterCommand("identity","Show device identity",ecm_identity);

  MyConfig.RegisterParam("ecm", "ECM configuration", true, true);
  // Our instances:
  //   'identity': modem identity used as device identity, iccid or imei (default: iccid)
  //   'interval': seconds between ECM checks in the daemon (default: 900)
  //   'host': host whose reachability proves the data path, empty to skip (default: sixfab.com)
  //   'port': TCP port connected to on that host (default: 80)
  //   'check.tries': connection attempts per link check (default: 3)
  //   'check.timeout': seconds per connection attempt (default: 5)
  }
