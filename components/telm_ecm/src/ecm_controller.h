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


#ifndef __ECM_CONTROLLER_H__
#define __ECM_CONTROLLER_H__

#include <functional>
#include <string>
#include "telm.h"

#define ECM_DEFAULT_HOST    "sixfab.com"
#define ECM_DEFAULT_PORT    "80"

class modemdriver;
class StateStore;
class TelmSemaphore;

// Reachability test of a host through the ECM data path
typedef std::function<telm_err_t(const std::string& host)> TelmLinkCheckFunc_t;

class EcmController
  {
  public:
    typedef enum
      {
      Unknown = 0,
      Disabled,
      Enabling,
      Enabled,
      DisableRequested
      } ecm_state_t;

  public:
    EcmController(modemdriver* driver, StateStore* store);
    ~EcmController();

  public:
    telm_err_t QueryIdentity(std::string& identity);
    telm_err_t Enable();
    telm_err_t Disable();
    telm_err_t Verify();
    telm_err_t Restart();
    telm_err_t Check(const std::string& host, TelmLinkCheckFunc_t link, bool* restarted = NULL);
    ecm_state_t GetState() { return m_state; }
    void Reset() { m_state = Unknown; }   // modem state lost, stored value kept

  protected:
    void SetState(ecm_state_t newstate);

  protected:
    modemdriver* m_driver;
    StateStore* m_store;
    ecm_state_t m_state;
  };

const char* EcmStateName(EcmController::ecm_state_t state);

/**
 * EcmCheckLink: TCP connect to host:service, up to tries attempts
 *  - TELM_OK when the host answers, a refused connection included
 *  - TELM_ERR_NOT_FOUND when the name does not resolve
 *  - TELM_ERR_TIMEOUT when no attempt reached the host
 *  - TELM_ERR_CANCELLED when cancel is given
 */
telm_err_t EcmCheckLink(const std::string& host, const std::string& service,
                        int tries, int timeoutms, TelmSemaphore* cancel = NULL);

// EcmCheckLink with port, tries and timeout from the ecm configuration
telm_err_t EcmCheckLinkConfigured(const std::string& host, TelmSemaphore* cancel = NULL);

#endif //#ifndef __ECM_CONTROLLER_H__
