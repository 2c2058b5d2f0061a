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
static const char *TAG = "serial";

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>
#include <vector>
#include "serial_transport.h"
#include "telm_semaphore.h"

SerialTransport::SerialTransport()
  : m_buffer(SERIAL_BUFFER_SIZE)
  {
  m_fd = -1;
  }

SerialTransport::~SerialTransport()
  {
  Close();
  }

speed_t SerialTransport::BaudToSpeed(int baud)
  {
  switch (baud)
    {
    case 9600:    return B9600;
    case 19200:   return B19200;
    case 38400:   return B38400;
    case 57600:   return B57600;
    case 115200:  return B115200;
    case 230400:  return B230400;
    case 460800:  return B460800;
    case 921600:  return B921600;
    default:      return B0;
    }
  }

bool SerialTransport::Configure(speed_t speed)
  {
  struct termios tty;
  memset(&tty, 0, sizeof(tty));
  if (tcgetattr(m_fd, &tty) != 0)
    {
    TELM_LOGE(TAG, "tcgetattr(%s): %s", m_path.c_str(), strerror(errno));
    return false;
    }

  cfsetospeed(&tty, speed);
  cfsetispeed(&tty, speed);

  // raw 8N1, no flow control
  tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tty.c_cflag |= CS8 | CREAD | CLOCAL;
  tty.c_lflag &= ~(ICANON | ECHO | ECHOE | ECHONL | ISIG | IEXTEN);
  tty.c_oflag &= ~OPOST;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY | ICRNL | INLCR | IGNCR | ISTRIP | BRKINT);
  tty.c_cc[VMIN]  = 0;
  tty.c_cc[VTIME] = 0;

  if (tcsetattr(m_fd, TCSANOW, &tty) != 0)
    {
    TELM_LOGE(TAG, "tcsetattr(%s): %s", m_path.c_str(), strerror(errno));
    return false;
    }
  tcflush(m_fd, TCIOFLUSH);
  return true;
  }

telm_err_t SerialTransport::Open(const std::string& path, int baud)
  {
  if (m_fd >= 0)
    Close();

  speed_t speed = BaudToSpeed(baud);
  if (speed == B0)
    {
    TELM_LOGE(TAG, "Open: unsupported baud rate %d", baud);
    return TELM_ERR_IO;
    }

  m_fd = open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (m_fd < 0)
    {
    TELM_LOGE(TAG, "Open: cannot open %s: %s", path.c_str(), strerror(errno));
    return TELM_ERR_IO;
    }
  m_path = path;
  m_baud = baud;

  if (!Configure(speed))
    {
    Close();
    return TELM_ERR_IO;
    }
  m_buffer.EmptyAll();
  TELM_LOGD(TAG, "Opened %s at %d baud", path.c_str(), baud);
  return TELM_OK;
  }

void SerialTransport::Close()
  {
  if (m_fd < 0) return;
  close(m_fd);
  m_fd = -1;
  m_buffer.EmptyAll();
  TELM_LOGD(TAG, "Closed %s", m_path.c_str());
  }

bool SerialTransport::IsOpen()
  {
  return (m_fd >= 0);
  }

telm_err_t SerialTransport::Send(const std::string& bytes)
  {
  if (m_fd < 0) return TELM_ERR_IO;

  size_t done = 0;
  while (done < bytes.size())
    {
    ssize_t n = write(m_fd, bytes.data()+done, bytes.size()-done);
    if (n > 0)
      {
      done += n;
      continue;
      }
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0 && errno == EAGAIN)
      {
      struct pollfd pfd;
      pfd.fd = m_fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      if (poll(&pfd, 1, 1000) > 0 && !(pfd.revents & (POLLERR|POLLHUP|POLLNVAL)))
        continue;
      TELM_LOGE(TAG, "Send: %s not writable", m_path.c_str());
      return TELM_ERR_IO;
      }
    TELM_LOGE(TAG, "Send: write to %s failed: %s", m_path.c_str(), strerror(errno));
    return TELM_ERR_IO;
    }
  return TELM_OK;
  }

telm_err_t SerialTransport::ReadUntil(const std::string& terminator, int timeoutms, std::string& result)
  {
  if (m_fd < 0) return TELM_ERR_IO;

  int64_t deadline = telm_monotonic_ms() + timeoutms;
  int cancelfd = m_cancel ? m_cancel->GetFd() : -1;
  while (true)
    {
    int pos = m_buffer.Find(terminator);
    if (pos >= 0)
      {
      std::vector<uint8_t> data(pos + terminator.size());
      m_buffer.Pop(data.size(), data.data());
      result.assign((const char*)data.data(), pos);
      return TELM_OK;
      }
    if (m_buffer.FreeSpace() == 0)
      {
      TELM_LOGW(TAG, "ReadUntil: %zu bytes without terminator, discarding", m_buffer.UsedSpace());
      m_buffer.EmptyAll();
      return TELM_ERR_PROTOCOL;
      }

    int64_t remain = deadline - telm_monotonic_ms();
    if (remain <= 0)
      return TELM_ERR_TIMEOUT;

    int n = m_buffer.PollFd(m_fd, cancelfd, remain);
    if (n == TELM_POLL_CANCELLED)
      return TELM_ERR_CANCELLED;
    if (n == TELM_POLL_ERROR)
      {
      TELM_LOGE(TAG, "ReadUntil: %s hung up or failed", m_path.c_str());
      return TELM_ERR_IO;
      }
    }
  }

void SerialTransport::Drain()
  {
  if (m_fd < 0) return;
  if (m_buffer.UsedSpace() > 0)
    TELM_LOGV(TAG, "Drain: discarding %zu buffered bytes", m_buffer.UsedSpace());
  m_buffer.EmptyAll();
  tcflush(m_fd, TCIFLUSH);
  }
