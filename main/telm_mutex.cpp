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


#include "telm_mutex.h"
#include <chrono>

TelmMutex::TelmMutex()
  {
  }

TelmMutex::~TelmMutex()
  {
  }

bool TelmMutex::Lock(int timeoutms)
  {
  if (timeoutms < 0)
    {
    m_mutex.lock();
    return true;
    }
  return m_mutex.try_lock_for(std::chrono::milliseconds(timeoutms));
  }

void TelmMutex::Unlock()
  {
  m_mutex.unlock();
  }

TelmMutexLock::TelmMutexLock(TelmMutex* mutex, int timeoutms)
  {
  m_mutex = mutex;
  m_locked = m_mutex->Lock(timeoutms);
  }

TelmMutexLock::~TelmMutexLock()
  {
  if (m_locked) m_mutex->Unlock();
  }

bool TelmMutexLock::IsLocked()
  {
  return m_locked;
  }
