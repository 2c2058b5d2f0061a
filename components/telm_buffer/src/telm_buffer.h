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


#ifndef __TELM_BUFFER_H__
#define __TELM_BUFFER_H__

#include <string>
#include <stdint.h>

// PollFd() results besides the byte count:
#define TELM_POLL_TIMEOUT      0
#define TELM_POLL_ERROR        -1
#define TELM_POLL_CANCELLED    -2

class TelmBuffer
  {
  public:
    TelmBuffer(size_t size, void* userdata = 0);
    virtual ~TelmBuffer();

  public:
    size_t FreeSpace();
    size_t UsedSpace();

  public:
    void EmptyAll();
    bool Push(uint8_t byte);
    bool Push(const uint8_t *byte, size_t count);
    uint8_t Pop();
    size_t Pop(size_t count, uint8_t *dest);
    uint8_t Peek();
    size_t Peek(size_t count, uint8_t *dest);

  public:
    int HasLine();
    std::string ReadLine();
    int Find(const std::string& terminator);

  public:
    int PollFd(int fd, int cancelfd, long timeoutms);

  public:
    void* m_userdata;

  protected:
    uint8_t *m_buffer;
    size_t m_head;
    size_t m_tail;
    size_t m_size;
    size_t m_used;
  };

#endif //#ifndef __TELM_BUFFER_H__
