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


#ifndef __TELIT_LE910_H__
#define __TELIT_LE910_H__

#include "telm_modem.h"

// default wait for the modem to come back after #REBOOT (seconds)
#define   TELIT_REBOOT_WAIT   30

class telitle910 : public modemdriver
  {
  public:
    telitle910();
    ~telitle910();

  public:
    const char* GetModel();
    const char* GetName();

  public:
    telm_err_t GetIccid(std::string& iccid);
    telm_err_t GetImei(std::string& imei);
    telm_err_t EcmStart();
    telm_err_t EcmStop();
    telm_err_t GetEcmStatus(bool& up);
    telm_err_t GpsGetPower(bool& on);
    telm_err_t GpsSetPower(bool on);
    telm_err_t GetUsbConfig(int& config);
    telm_err_t SetUsbConfig(int config);
    telm_err_t Reboot();

  protected:
    telm_err_t WaitReboot();
  };

#endif //#ifndef __TELIT_LE910_H__
