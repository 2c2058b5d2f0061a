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
static const char *TAG = "semaphore";

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include "telm.h"
#include "telm_semaphore.h"

TelmSemaphore::TelmSemaphore(int initcount /*=0*/)
  {
  if (pipe2(m_pipe, O_NONBLOCK | O_CLOEXEC) != 0)
    {
    TELM_LOGE(TAG, "pipe2 failed: %s", strerror(errno));
    m_pipe[0] = m_pipe[1] = -1;
    }
  for (int k=0; k<initcount; k++)
    Give();
  }

TelmSemaphore::~TelmSemaphore()
  {
  if (m_pipe[0] >= 0) close(m_pipe[0]);
  if (m_pipe[1] >= 0) close(m_pipe[1]);
  }

bool TelmSemaphore::Wait(int timeoutms)
  {
  if (m_pipe[0] < 0) return false;
  int64_t deadline = telm_monotonic_ms() + timeoutms;
  while (true)
    {
    int remain = -1;
    if (timeoutms >= 0)
      {
      int64_t left = deadline - telm_monotonic_ms();
      remain = (left > 0) ? (int)left : 0;
      }
    struct pollfd pfd;
    pfd.fd = m_pipe[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int res = poll(&pfd, 1, remain);
    if (res > 0) return true;
    if (res == 0) return false;
    if (errno != EINTR) return false;
    }
  }

bool TelmSemaphore::Take(int timeoutms)
  {
  int64_t deadline = telm_monotonic_ms() + timeoutms;
  while (true)
    {
    int remain = -1;
    if (timeoutms >= 0)
      {
      int64_t left = deadline - telm_monotonic_ms();
      remain = (left > 0) ? (int)left : 0;
      }
    if (!Wait(remain)) return false;
    char token;
    if (read(m_pipe[0], &token, 1) == 1) return true;
    if (timeoutms >= 0 && remain == 0) return false;
    }
  }

void TelmSemaphore::Give()
  {
  if (m_pipe[1] < 0) return;
  char token = 1;
  ssize_t res = write(m_pipe[1], &token, 1);
  (void)res;  // a full pipe already signals availability
  }

bool TelmSemaphore::IsAvail()
  {
  return Wait(0);
  }

bool TelmDelay(int ms, TelmSemaphore* cancel /*=NULL*/)
  {
  if (cancel && cancel->GetFd() >= 0)
    return !cancel->Wait(ms);
  if (ms > 0)
    {
    struct timespec ts;
    ts.tv_sec = ms / 1000;
    ts.tv_nsec = (ms % 1000) * 1000000L;
    while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {}
    }
  return true;
  }
