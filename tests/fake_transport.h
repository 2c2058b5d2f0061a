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


#ifndef __FAKE_TRANSPORT_H__
#define __FAKE_TRANSPORT_H__

#include <deque>
#include <map>
#include <string>
#include <vector>
#include "at_transport.h"

// Script entries standing for a transport failure instead of a line:
#define FAKE_IO       "<io>"
#define FAKE_TIMEOUT  "<timeout>"

/**
 * FakeTransport: scripted modem for driver tests
 *  - Reply() queues a one-shot response for a command, Always() sets the
 *    response used once the queue for that command is empty
 *  - commands without a script time out immediately
 *  - Inject() adds lines as if the modem sent them unprompted
 */
class FakeTransport : public AtTransport
  {
  public:
    FakeTransport()
      {
      m_open = false;
      m_opens = 0;
      m_closes = 0;
      m_open_result = TELM_OK;
      m_echo = false;
      }

  public:
    telm_err_t Open(const std::string& path, int baud)
      {
      m_path = path;
      m_baud = baud;
      m_opens++;
      if (m_open_result != TELM_OK)
        return m_open_result;
      m_open = true;
      return TELM_OK;
      }
    void Close()
      {
      if (!m_open) return;
      m_open = false;
      m_closes++;
      }
    bool IsOpen()
      {
      return m_open;
      }
    telm_err_t Send(const std::string& bytes)
      {
      if (!m_open) return TELM_ERR_IO;
      std::string cmd = bytes;
      while (!cmd.empty() && (cmd.back() == '\r' || cmd.back() == '\n'))
        cmd.pop_back();
      m_sent.push_back(cmd);
      if (m_echo)
        m_rx.push_back(cmd);

      auto q = m_queued.find(cmd);
      if (q != m_queued.end() && !q->second.empty())
        {
        Append(q->second.front());
        q->second.pop_front();
        }
      else
        {
        auto a = m_always.find(cmd);
        if (a != m_always.end())
          Append(a->second);
        }
      return TELM_OK;
      }
    telm_err_t ReadUntil(const std::string& terminator, int timeoutms, std::string& result)
      {
      if (!m_open) return TELM_ERR_IO;
      if (m_rx.empty()) return TELM_ERR_TIMEOUT;
      std::string line = m_rx.front();
      m_rx.pop_front();
      if (line == FAKE_IO) return TELM_ERR_IO;
      if (line == FAKE_TIMEOUT) return TELM_ERR_TIMEOUT;
      result = line + "\r";
      return TELM_OK;
      }
    void Drain()
      {
      m_rx.clear();
      }

  public:
    void Reply(const std::string& cmd, const std::vector<std::string>& lines)
      {
      m_queued[cmd].push_back(lines);
      }
    void Always(const std::string& cmd, const std::vector<std::string>& lines)
      {
      m_always[cmd] = lines;
      }
    void Inject(const std::string& line)
      {
      m_rx.push_back(line);
      }
    int Count(const std::string& cmd) const
      {
      int n = 0;
      for (auto& s : m_sent)
        if (s == cmd) n++;
      return n;
      }

  protected:
    void Append(const std::vector<std::string>& lines)
      {
      for (auto& l : lines)
        m_rx.push_back(l);
      }

  public:
    bool m_open;
    int m_opens;
    int m_closes;
    telm_err_t m_open_result;
    bool m_echo;
    std::vector<std::string> m_sent;
    std::deque<std::string> m_rx;
    std::map<std::string, std::deque<std::vector<std::string> > > m_queued;
    std::map<std::string, std::vector<std::string> > m_always;
  };

#endif //#ifndef __FAKE_TRANSPORT_H__
