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


#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>
#include "gtest/gtest.h"
#include "serial_transport.h"
#include "telm_semaphore.h"

// A pseudo terminal pair stands in for the modem's USB serial port
class SerialTest : public ::testing::Test
  {
  protected:
    void SetUp()
      {
      m_master = posix_openpt(O_RDWR | O_NOCTTY);
      ASSERT_GE(m_master, 0);
      ASSERT_EQ(0, grantpt(m_master));
      ASSERT_EQ(0, unlockpt(m_master));
      m_slave = ptsname(m_master);
      ASSERT_EQ(TELM_OK, m_transport.Open(m_slave, 115200));
      }
    void TearDown()
      {
      m_transport.Close();
      if (m_master >= 0) close(m_master);
      }
    void ModemWrites(const std::string& text)
      {
      ASSERT_EQ((ssize_t)text.size(), write(m_master, text.data(), text.size()));
      }

  protected:
    int m_master;
    std::string m_slave;
    SerialTransport m_transport;
  };

TEST_F(SerialTest, SendAndReadLines)
  {
  EXPECT_EQ(TELM_OK, m_transport.Send("AT+CSQ\r"));
  char buf[32];
  ssize_t n = 0;
  for (int k=0; k<100 && n <= 0; k++)
    {
    n = read(m_master, buf, sizeof(buf));
    if (n <= 0) usleep(10000);
    }
  ASSERT_EQ(7, n);
  EXPECT_EQ("AT+CSQ\r", std::string(buf, n));

  ModemWrites("+CSQ: 17,99\r\n\r\nOK\r\n");
  std::string line;
  EXPECT_EQ(TELM_OK, m_transport.ReadUntil("\n", 1000, line));
  EXPECT_EQ("+CSQ: 17,99\r", line);
  EXPECT_EQ(TELM_OK, m_transport.ReadUntil("\n", 1000, line));
  EXPECT_EQ("\r", line);
  EXPECT_EQ(TELM_OK, m_transport.ReadUntil("\n", 1000, line));
  EXPECT_EQ("OK\r", line);
  }

TEST_F(SerialTest, ReadTimesOut)
  {
  std::string line = "unchanged";
  EXPECT_EQ(TELM_ERR_TIMEOUT, m_transport.ReadUntil("\n", 50, line));
  EXPECT_EQ("unchanged", line);
  }

TEST_F(SerialTest, ReadIsCancelled)
  {
  TelmSemaphore cancel;
  m_transport.SetCancel(&cancel);
  cancel.Give();
  std::string line;
  EXPECT_EQ(TELM_ERR_CANCELLED, m_transport.ReadUntil("\n", 5000, line));
  m_transport.SetCancel(NULL);
  }

TEST_F(SerialTest, HangupIsTransportError)
  {
  close(m_master);
  m_master = -1;
  std::string line;
  EXPECT_EQ(TELM_ERR_IO, m_transport.ReadUntil("\n", 1000, line));
  }

TEST_F(SerialTest, CloseIsIdempotent)
  {
  m_transport.Close();
  m_transport.Close();
  EXPECT_FALSE(m_transport.IsOpen());
  EXPECT_EQ(TELM_ERR_IO, m_transport.Send("AT\r"));
  EXPECT_EQ(TELM_OK, m_transport.Open(m_slave, 115200));
  EXPECT_TRUE(m_transport.IsOpen());
  }

TEST(SerialTransport, MissingDevice)
  {
  SerialTransport transport;
  EXPECT_EQ(TELM_ERR_IO, transport.Open("/dev/telm-does-not-exist", 115200));
  EXPECT_FALSE(transport.IsOpen());
  EXPECT_EQ(TELM_ERR_IO, transport.Open("/dev/null", 12345));
  }
