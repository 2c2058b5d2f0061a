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
static const char *TAG = "buffer";

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>
#include <vector>
#include "telm_buffer.h"

TelmBuffer::TelmBuffer(size_t size, void* userdata)
  {
  m_buffer = new uint8_t[size];
  m_head = 0;
  m_tail = 0;
  m_size = size;
  m_used = 0;
  m_userdata = userdata;
  }

TelmBuffer::~TelmBuffer()
  {
  delete [] m_buffer;
  }

size_t TelmBuffer::FreeSpace()
  {
  return m_size - m_used;
  }

size_t TelmBuffer::UsedSpace()
  {
  return m_used;
  }

void TelmBuffer::EmptyAll()
  {
  m_head = 0;
  m_tail = 0;
  m_used = 0;
  }

bool TelmBuffer::Push(uint8_t byte)
  {
  if (m_used == m_size) return false;

  m_used++;
  m_buffer[m_head++] = byte;
  if (m_head >= m_size) m_head=0;

  return true;
  }

bool TelmBuffer::Push(const uint8_t *byte, size_t count)
  {
  if ((m_size-m_used)<count) return false;

  m_used += count;
  for (size_t k=0;k<count;k++)
    {
    m_buffer[m_head++] = byte[k];
    if (m_head >= m_size) m_head=0;
    }

  return true;
  }

uint8_t TelmBuffer::Pop()
  {
  if (m_used==0) return 0;

  m_used--;
  uint8_t result = m_buffer[m_tail++];
  if (m_tail >= m_size) m_tail=0;

  return result;
  }

size_t TelmBuffer::Pop(size_t count, uint8_t *dest)
  {
  size_t done = 0;

  while ((m_used>0)&&(done < count))
    {
    m_used--;
    uint8_t b = m_buffer[m_tail++];
    if (dest) dest[done] = b;
    done++;
    if (m_tail >= m_size) m_tail=0;
    }

  return done;
  }

uint8_t TelmBuffer::Peek()
  {
  if (m_used==0) return 0;

  return m_buffer[m_tail];
  }

size_t TelmBuffer::Peek(size_t count, uint8_t *dest)
  {
  size_t done = 0;

  size_t tail = m_tail;
  while ((done<m_used)&&(done<count))
    {
    dest[done++] = m_buffer[tail++];
    if (tail >= m_size) tail=0;
    }

  return done;
  }

int TelmBuffer::HasLine()
  {
  size_t tail = m_tail;

  if (m_used==0) return -1;

  for (size_t done=0;done<m_used;done++)
    {
    if ((m_buffer[tail]=='\r')||(m_buffer[tail]=='\n'))
      {
      return done;
      }
    tail++;
    if (tail >= m_size) tail=0;
    }

  return -1;
  }

std::string TelmBuffer::ReadLine()
  {
  int hl = HasLine();
  if (hl<0) return std::string("");

  std::vector<uint8_t> result(hl+1);
  Pop(hl, result.data());

  if (Peek() == '\r') Pop();
  if (Peek() == '\n') Pop();

  return std::string((char*)result.data(),hl);
  }

// Find: offset of the first occurrence of terminator, -1 if not buffered
int TelmBuffer::Find(const std::string& terminator)
  {
  size_t len = terminator.size();
  if (len == 0 || m_used < len) return -1;

  for (size_t start=0; start+len<=m_used; start++)
    {
    size_t k;
    for (k=0; k<len; k++)
      {
      if (m_buffer[(m_tail+start+k) % m_size] != (uint8_t)terminator[k])
        break;
      }
    if (k == len) return start;
    }
  return -1;
  }

/**
 * PollFd: wait up to timeoutms for data on fd and read what is available
 *  - returns the number of bytes read, TELM_POLL_TIMEOUT, TELM_POLL_ERROR
 *    (hangup, read error, end of file) or TELM_POLL_CANCELLED if cancelfd
 *    became readable first
 */
int TelmBuffer::PollFd(int fd, int cancelfd, long timeoutms)
  {
  if (fd < 0) return TELM_POLL_ERROR;

  struct pollfd fds[2];
  int nfds = 1;
  fds[0].fd = fd;
  fds[0].events = POLLIN;
  fds[0].revents = 0;
  if (cancelfd >= 0)
    {
    fds[1].fd = cancelfd;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    nfds = 2;
    }

  int result = poll(fds, nfds, (int)timeoutms);
  if (result < 0)
    {
    if (errno == EINTR) return TELM_POLL_TIMEOUT;
    TELM_LOGE(TAG, "PollFd: poll failed: %s", strerror(errno));
    return TELM_POLL_ERROR;
    }
  if (result == 0) return TELM_POLL_TIMEOUT;
  if (nfds > 1 && (fds[1].revents & POLLIN)) return TELM_POLL_CANCELLED;
  if (fds[0].revents & (POLLERR|POLLNVAL)) return TELM_POLL_ERROR;
  if (!(fds[0].revents & (POLLIN|POLLHUP))) return TELM_POLL_TIMEOUT;

  // We have some data ready to read
  size_t avail = FreeSpace();
  if (avail==0) return TELM_POLL_TIMEOUT;
  std::vector<uint8_t> buf(avail);
  ssize_t n = read(fd, buf.data(), avail);
  if (n < 0)
    {
    if (errno == EAGAIN || errno == EINTR) return TELM_POLL_TIMEOUT;
    TELM_LOGE(TAG, "PollFd: read failed: %s", strerror(errno));
    return TELM_POLL_ERROR;
    }
  if (n == 0)
    {
    // POLLIN/POLLHUP with nothing to read: the device went away
    return TELM_POLL_ERROR;
    }
  Push(buf.data(),n);
  return n;
  }
