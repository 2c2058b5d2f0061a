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


#ifndef __AT_TRANSPORT_H__
#define __AT_TRANSPORT_H__

#include <string>
#include "telm.h"

class TelmSemaphore;

/**
 * AtTransport: byte/line exchange with the modem, no protocol semantics.
 *  - Close() on a closed transport is a no-op
 *  - failures propagate unchanged, nothing is retried here
 *  - waits abort with TELM_ERR_CANCELLED when the cancel semaphore is given
 */
class AtTransport
  {
  public:
    AtTransport();
    virtual ~AtTransport();

  public:
    virtual telm_err_t Open(const std::string& path, int baud) = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() = 0;
    virtual telm_err_t Send(const std::string& bytes) = 0;
    virtual telm_err_t ReadUntil(const std::string& terminator, int timeoutms, std::string& result) = 0;
    virtual void Drain() = 0;

  public:
    void SetCancel(TelmSemaphore* cancel) { m_cancel = cancel; }
    const std::string& GetPath() { return m_path; }
    int GetBaud() { return m_baud; }

  protected:
    TelmSemaphore* m_cancel;
    std::string m_path;
    int m_baud;
  };

#endif //#ifndef __AT_TRANSPORT_H__
