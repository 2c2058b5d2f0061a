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


#ifndef __TELM_DAEMON_H__
#define __TELM_DAEMON_H__

#include <stdint.h>
#include "telm.h"
#include "telm_semaphore.h"
#include "telm_modem.h"
#include "ecm_controller.h"
#include "gps_acquirer.h"

class StateStore;
class LocationFile;

/**
 * TelmDaemon: long running coordinator of ECM and GPS
 *
 *  Starting    open + sync the modem, identity, ECM enable, location seed
 *  Running     periodic GPS acquisition and ECM verification
 *  Recovering  back off, then Starting again
 *  Stopped     shutdown requested, modem closed
 *
 *  A transport error in any state leads to Recovering, which then closes
 *  and reopens the modem. Other start failures back off on the open
 *  handle. An identity or ECM enable refusal does not stop the start: both
 *  are retried by the periodic ECM check. Only a shutdown leads to Stopped.
 */
class TelmDaemon
  {
  public:
    typedef enum
      {
      Starting = 0,
      Running,
      Recovering,
      Stopped
      } daemon_state_t;

  public:
    TelmDaemon(modem* m, StateStore* store, LocationFile* location);
    ~TelmDaemon();

  public:
    void SetDelayFunction(TelmDelayFunc_t delay);
    void SetInitBudget(int retries, int delayms);
    void SetLinkCheck(TelmLinkCheckFunc_t link) { m_link = link; }
    daemon_state_t GetState() { return m_state; }
    daemon_state_t Step();
    void Run();
    void Shutdown();
    TelmSemaphore* GetShutdown() { return &m_shutdown; }

  protected:
    void SetState(daemon_state_t newstate);
    daemon_state_t StateStarting();
    daemon_state_t StateRunning();
    daemon_state_t StateRecovering();
    daemon_state_t Failed(const char* what, telm_err_t err);
    telm_err_t QueryIdentity();
    telm_err_t CheckEcm();
    telm_err_t GpsCycle();
    void SeedLocation();
    void StoreModemInfo();
    bool Wait(int64_t ms);

  protected:
    modem* m_modem;
    modemdriver* m_driver;
    StateStore* m_store;
    LocationFile* m_location;
    EcmController m_ecm;
    GpsAcquirer m_gps;
    TelmSemaphore m_shutdown;
    TelmDelayFunc_t m_delay;
    TelmLinkCheckFunc_t m_link;
    daemon_state_t m_state;
    int m_failures;
    bool m_teardown;          // transport failed, reopen on recovery
    bool m_identity_pending;
    bool m_seeded;
    bool m_first_fix;
    int m_init_retries;     // -1 = config
    int m_init_delayms;     // -1 = config
    int64_t m_next_gps;
    int64_t m_next_ecm;
  };

const char* DaemonStateName(TelmDaemon::daemon_state_t state);

#endif //#ifndef __TELM_DAEMON_H__
