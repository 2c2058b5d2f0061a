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


#ifndef __SERIAL_TRANSPORT_H__
#define __SERIAL_TRANSPORT_H__

#include <termios.h>
#include "at_transport.h"
#include "telm_buffer.h"

#define SERIAL_BUFFER_SIZE 4096

class SerialTransport : public AtTransport
  {
  public:
    SerialTransport();
    virtual ~SerialTransport();

  public:
    telm_err_t Open(const std::string& path, int baud);
    void Close();
    bool IsOpen();
    telm_err_t Send(const std::string& bytes);
    telm_err_t ReadUntil(const std::string& terminator, int timeoutms, std::string& result);
    void Drain();

  public:
    static speed_t BaudToSpeed(int baud);

  protected:
    bool Configure(speed_t speed);

  protected:
    int m_fd;
    TelmBuffer m_buffer;
  };

#endif //#ifndef __SERIAL_TRANSPORT_H__
