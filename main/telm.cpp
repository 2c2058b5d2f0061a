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


#include <time.h>
#include "telm.h"

const char* TelmErrName(telm_err_t err)
  {
  switch (err)
    {
    case TELM_OK:                       return "OK";
    case TELM_ERR_IO:                   return "IoError";
    case TELM_ERR_TIMEOUT:              return "TimeoutError";
    case TELM_ERR_PROTOCOL:             return "ProtocolError";
    case TELM_ERR_DEVICE:               return "DeviceError";
    case TELM_ERR_NOFIX:                return "NoFix";
    case TELM_ERR_ACQUISITION_TIMEOUT:  return "AcquisitionTimeout";
    case TELM_ERR_CANCELLED:            return "Cancelled";
    case TELM_ERR_INVALID_STATE:        return "InvalidState";
    case TELM_ERR_NOT_FOUND:            return "NotFound";
    default:                            return "Undefined";
    };
  }

int64_t telm_monotonic_ms()
  {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (int64_t)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
  }
