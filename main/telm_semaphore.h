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


#ifndef __TELM_SEMAPHORE_H__
#define __TELM_SEMAPHORE_H__

#include "telm_mutex.h"

/**
 * Counting semaphore on a pipe:
 *  - Give() is async-signal-safe, so a signal handler may raise it
 *  - GetFd() can be added to a poll() set to wake blocking I/O
 *  - Wait() checks availability without consuming a count
 */
class TelmSemaphore
  {
  public:
    TelmSemaphore(int initcount = 0);
    ~TelmSemaphore();

  public:
    bool Take(int timeoutms = TELM_MAX_DELAY);
    bool Wait(int timeoutms = TELM_MAX_DELAY);
    void Give();
    bool IsAvail();
    int GetFd() { return m_pipe[0]; }

  protected:
    int m_pipe[2];
  };

/**
 * TelmDelay: sleep for ms milliseconds, cut short when cancel is given
 *  - returns false if the delay was cancelled
 */
bool TelmDelay(int ms, TelmSemaphore* cancel = NULL);

#endif //#ifndef __TELM_SEMAPHORE_H__
