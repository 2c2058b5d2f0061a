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


#ifndef __TELM_H__
#define __TELM_H__

#include <stdint.h>
#include <stdio.h>
#include <stdarg.h>
#include <string.h>
#include <cstddef>
#include <cstdlib>
#include <string>

#define TELM_VERSION "1.0.0"

#ifndef TELM_CONFIGPATH
#define TELM_CONFIGPATH "/etc/telm"
#endif

// Result codes, in the manner of esp_err_t
typedef enum
  {
  TELM_OK = 0,
  TELM_ERR_IO,                    // transport unavailable or broken
  TELM_ERR_TIMEOUT,               // no terminal response within the budget
  TELM_ERR_PROTOCOL,              // response does not match the expected grammar
  TELM_ERR_DEVICE,                // modem reported ERROR / +CME ERROR / +CMS ERROR
  TELM_ERR_NOFIX,                 // GPS answered, but without a valid lock
  TELM_ERR_ACQUISITION_TIMEOUT,   // retry budget exhausted without a valid lock
  TELM_ERR_CANCELLED,             // shutdown requested during a wait
  TELM_ERR_INVALID_STATE,         // operation not possible in the current state
  TELM_ERR_NOT_FOUND              // requested item does not exist
  } telm_err_t;

const char* TelmErrName(telm_err_t err);

// Monotonic milliseconds since an arbitrary epoch
int64_t telm_monotonic_ms();

#endif //#ifndef __TELM_H__
