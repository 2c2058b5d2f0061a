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
static const char *TAG = "daemon";

#include "telm_daemon.h"
#include "telm_config.h"
#include "telm_location.h"
#include "telm_utils.h"
#include "state_store.h"

const char* DaemonStateName(TelmDaemon::daemon_state_t state)
  {
  switch (state)
    {
    case TelmDaemon::Starting:    return "Starting";
    case TelmDaemon::Running:     return "Running";
    case TelmDaemon::Recovering:  return "Recovering";
    case TelmDaemon::Stopped:     return "Stopped";
    default:                      return "Undefined";
    }
  }

TelmDaemon::TelmDaemon(modem* m, StateStore* store, LocationFile* location)
  : m_ecm(m->GetDriver(), store),
    m_gps(m->GetDriver(), store, location)
  {
  m_modem = m;
  m_driver = m->GetDriver();
  m_store = store;
  m_location = location;
  m_state = Starting;
  m_failures = 0;
  m_teardown = false;
  m_identity_pending = false;
  m_seeded = false;
  m_first_fix = true;
  m_init_retries = -1;
  m_init_delayms = -1;
  m_next_gps = 0;
  m_next_ecm = 0;

  m_modem->SetCancel(&m_shutdown);
  SetDelayFunction([this](int ms) { return TelmDelay(ms, &m_shutdown); });
  m_link = [this](const std::string& host) { return EcmCheckLinkConfigured(host, &m_shutdown); };
  }

TelmDaemon::~TelmDaemon()
  {
  m_modem->SetCancel(NULL);
  }

void TelmDaemon::SetDelayFunction(TelmDelayFunc_t delay)
  {
  m_delay = delay;
  m_gps.SetDelayFunction(delay);
  }

void TelmDaemon::SetInitBudget(int retries, int delayms)
  {
  m_init_retries = retries;
  m_init_delayms = delayms;
  }

void TelmDaemon::Shutdown()
  {
  m_shutdown.Give();
  }

void TelmDaemon::SetState(daemon_state_t newstate)
  {
  if (newstate == m_state) return;
  TELM_LOGI(TAG, "State transition %s => %s", DaemonStateName(m_state), DaemonStateName(newstate));
  m_state = newstate;
  }

TelmDaemon::daemon_state_t TelmDaemon::Step()
  {
  daemon_state_t newstate;
  if (m_shutdown.IsAvail())
    newstate = Stopped;
  else
    {
    switch (m_state)
      {
      case Starting:    newstate = StateStarting(); break;
      case Running:     newstate = StateRunning(); break;
      case Recovering:  newstate = StateRecovering(); break;
      default:          newstate = Stopped; break;
      }
    }
  if (newstate == Stopped)
    m_modem->Close();
  SetState(newstate);
  return m_state;
  }

void TelmDaemon::Run()
  {
  TELM_LOGI(TAG, "Daemon running on %s", m_modem->GetDevice().c_str());
  while (Step() != Stopped) {}
  TELM_LOGI(TAG, "Daemon stopped");
  }

bool TelmDaemon::Wait(int64_t ms)
  {
  if (ms <= 0) return true;
  if (ms > INT32_MAX) ms = INT32_MAX;
  return m_delay((int)ms);
  }

TelmDaemon::daemon_state_t TelmDaemon::Failed(const char* what, telm_err_t err)
  {
  if (err == TELM_ERR_CANCELLED)
    return Stopped;
  if (err == TELM_ERR_IO)
    m_teardown = true;
  TELM_LOGE(TAG, "%s failed: %s", what, TelmErrName(err));
  return Recovering;
  }

void TelmDaemon::StoreModemInfo()
  {
  std::string value;
  if (m_driver->GetIccid(value) == TELM_OK && m_store->Set(STATE_ICCID, value) != TELM_OK)
    TELM_LOGW(TAG, "Cannot store ICCID");
  if (m_driver->GetImei(value) == TELM_OK && m_store->Set(STATE_IMEI, value) != TELM_OK)
    TELM_LOGW(TAG, "Cannot store IMEI");
  value = host_identity();
  if (!value.empty() && m_store->Set(STATE_HOST_ID, value) != TELM_OK)
    TELM_LOGW(TAG, "Cannot store host id");
  }

void TelmDaemon::SeedLocation()
  {
  m_seeded = true;
  std::string seed = MyConfig.GetParamValue("location", "seed", LOCATION_DEFAULT_SEED);
  GpsFix fix;
  telm_err_t err = LocationFile::LoadSeed(seed, fix);
  if (err == TELM_ERR_NOT_FOUND)
    return;
  if (err != TELM_OK)
    {
    TELM_LOGW(TAG, "Seed location %s unusable: %s", seed.c_str(), TelmErrName(err));
    return;
    }
  TELM_LOGI(TAG, "Seed location: %.4f,%.4f", fix.m_latitude, fix.m_longitude);
  if ((err = m_gps.Record(fix)) != TELM_OK)
    TELM_LOGW(TAG, "Cannot record seed location: %s", TelmErrName(err));
  }

TelmDaemon::daemon_state_t TelmDaemon::StateStarting()
  {
  telm_err_t err;
  if ((err = m_modem->Open()) != TELM_OK)
    return Failed("Open", err);
  if ((err = m_driver->Sync()) != TELM_OK)
    return Failed("Sync", err);

  if ((err = QueryIdentity()) != TELM_OK)
    return Failed("Identity query", err);
  StoreModemInfo();

  if ((err = m_ecm.Enable()) != TELM_OK)
    {
    if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
      return Failed("ECM enable", err);
    TELM_LOGW(TAG, "ECM enable failed: %s, retried by the ECM check", TelmErrName(err));
    }

  if (!m_seeded)
    SeedLocation();

  m_failures = 0;
  int64_t now = telm_monotonic_ms();
  m_next_gps = now;
  m_next_ecm = now + (int64_t)MyConfig.GetParamValueInt("ecm", "interval", 900) * 1000;
  return Running;
  }

TelmDaemon::daemon_state_t TelmDaemon::StateRunning()
  {
  telm_err_t err;
  int64_t now = telm_monotonic_ms();

  if (now >= m_next_ecm)
    {
    err = CheckEcm();
    if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
      return Failed("ECM check", err);
    m_next_ecm = telm_monotonic_ms() + (int64_t)MyConfig.GetParamValueInt("ecm", "interval", 900) * 1000;
    }

  if (now >= m_next_gps)
    {
    err = GpsCycle();
    if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
      return Failed("GPS cycle", err);
    m_next_gps = telm_monotonic_ms() + (int64_t)MyConfig.GetParamValueInt("gps", "interval", 900) * 1000;
    }

  int64_t next = (m_next_gps < m_next_ecm) ? m_next_gps : m_next_ecm;
  if (!Wait(next - telm_monotonic_ms()))
    return Stopped;
  return Running;
  }

TelmDaemon::daemon_state_t TelmDaemon::StateRecovering()
  {
  int minsec = MyConfig.GetParamValueInt("daemon", "backoff.min", 1);
  int maxsec = MyConfig.GetParamValueInt("daemon", "backoff.max", 300);
  int64_t backoff = LIMIT_MIN(minsec, 1);
  for (int k = 0; k < m_failures && backoff < maxsec; k++)
    backoff *= 2;
  backoff = LIMIT_MAX(backoff, (int64_t)LIMIT_MIN(maxsec, 1));
  m_failures++;

  if (!m_teardown)
    {
    TELM_LOGW(TAG, "Recovery attempt %d, restarting in %d s", m_failures, (int)backoff);
    return Wait(backoff * 1000) ? Starting : Stopped;
    }

  m_modem->Close();
  m_ecm.Reset();
  TELM_LOGW(TAG, "Recovery attempt %d, reopening in %d s", m_failures, (int)backoff);
  if (!Wait(backoff * 1000))
    return Stopped;

  telm_err_t err = m_modem->Open();
  if (err != TELM_OK)
    {
    TELM_LOGE(TAG, "Reopen failed: %s", TelmErrName(err));
    return Recovering;
    }
  m_teardown = false;
  return Starting;
  }

telm_err_t TelmDaemon::QueryIdentity()
  {
  std::string identity;
  telm_err_t err = m_ecm.QueryIdentity(identity);
  if (err == TELM_OK)
    {
    TELM_LOGI(TAG, "Device identity: %s", identity.c_str());
    m_identity_pending = false;
    return TELM_OK;
    }
  if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
    return err;
  TELM_LOGW(TAG, "Identity query failed: %s, retried by the ECM check", TelmErrName(err));
  m_identity_pending = true;
  return TELM_OK;
  }

telm_err_t TelmDaemon::CheckEcm()
  {
  telm_err_t err;
  if (m_identity_pending && (err = QueryIdentity()) != TELM_OK)
    return err;

  std::string host = MyConfig.GetParamValue("ecm", "host", ECM_DEFAULT_HOST);
  err = m_ecm.Check(host, m_link);
  if (err != TELM_OK && err != TELM_ERR_IO && err != TELM_ERR_CANCELLED)
    {
    // Retried on the next check
    TELM_LOGW(TAG, "ECM check failed: %s", TelmErrName(err));
    return TELM_OK;
    }
  return err;
  }

telm_err_t TelmDaemon::GpsCycle()
  {
  telm_err_t err;
  int retries, delayms;
  if (m_first_fix)
    {
    retries = (m_init_retries > 0) ? m_init_retries : MyConfig.GetParamValueInt("gps", "init.retries", 30);
    delayms = (m_init_delayms >= 0) ? m_init_delayms : MyConfig.GetParamValueInt("gps", "init.delay", 10) * 1000;
    }
  else
    {
    retries = MyConfig.GetParamValueInt("gps", "retries", 2);
    delayms = MyConfig.GetParamValueInt("gps", "delay", 10) * 1000;
    }

  double quality;
  err = m_driver->GetSignalQuality(quality);
  if (err == TELM_OK)
    {
    if (m_store->SetDouble(STATE_SIGNAL, quality, 2) != TELM_OK)
      TELM_LOGW(TAG, "Cannot store signal quality");
    }
  else if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
    return err;

  bool power = MyConfig.GetParamValueBool("gps", "power", true);
  if (power && (err = m_driver->GpsSetPower(true)) != TELM_OK)
    {
    if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
      return err;
    TELM_LOGW(TAG, "GPS power on failed: %s", TelmErrName(err));
    }

  GpsFix fix;
  err = m_gps.Acquire(LIMIT_MIN(retries, 1), LIMIT_MIN(delayms, 0), fix);
  if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
    return err;
  if (err == TELM_OK)
    {
    m_first_fix = false;
    telm_err_t rerr = m_gps.Record(fix);
    if (rerr != TELM_OK)
      TELM_LOGE(TAG, "Cannot record fix: %s", TelmErrName(rerr));
    }
  else
    TELM_LOGW(TAG, "GPS cycle without fix: %s", TelmErrName(err));

  if (power && (err = m_driver->GpsSetPower(false)) != TELM_OK)
    {
    if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
      return err;
    TELM_LOGW(TAG, "GPS power off failed: %s", TelmErrName(err));
    }
  return TELM_OK;
  }

class DaemonInit
  {
  public: DaemonInit();
} MyDaemonInit  __attribute__ ((init_priority (4900)));

DaemonInit::DaemonInit()
  {
  TELM_LOGD(TAG, "Initialising DAEMON (4900)");

  MyConfig.RegisterParam("daemon", "Daemon configuration", true, true);
  // Our instances:
  //   'backoff.min': first reconnect delay in seconds (default: 1)
  //   'backoff.max': longest reconnect delay in seconds (default: 300)
  }
