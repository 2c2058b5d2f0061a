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


#include <unistd.h>
#include "gtest/gtest.h"
#include "telm_buffer.h"
#include "telm_semaphore.h"

static void push(TelmBuffer& buffer, const std::string& text)
  {
  ASSERT_TRUE(buffer.Push((const uint8_t*)text.data(), text.size()));
  }

TEST(TelmBuffer, WrapAround)
  {
  TelmBuffer buffer(8);
  push(buffer, "abcdef");
  uint8_t out[8];
  EXPECT_EQ(4u, buffer.Pop(4, out));
  push(buffer, "ghijk");
  EXPECT_EQ(7u, buffer.UsedSpace());
  EXPECT_EQ(1u, buffer.FreeSpace());
  EXPECT_FALSE(buffer.Push((const uint8_t*)"xy", 2));
  EXPECT_EQ(7u, buffer.Pop(8, out));
  EXPECT_EQ("efghijk", std::string((char*)out, 7));
  }

TEST(TelmBuffer, Lines)
  {
  TelmBuffer buffer(64);
  push(buffer, "OK\r\n+CSQ: 1");
  EXPECT_EQ(2, buffer.HasLine());
  EXPECT_EQ("OK", buffer.ReadLine());
  EXPECT_EQ(-1, buffer.HasLine());
  EXPECT_EQ("", buffer.ReadLine());
  EXPECT_EQ(7u, buffer.UsedSpace());
  }

TEST(TelmBuffer, FindAcrossWrap)
  {
  TelmBuffer buffer(8);
  push(buffer, "123456");
  EXPECT_EQ(6u, buffer.Pop(6, NULL));
  push(buffer, "ab\r\ncd");
  EXPECT_EQ(2, buffer.Find("\r\n"));
  EXPECT_EQ(3, buffer.Find("\n"));
  EXPECT_EQ(-1, buffer.Find("x"));
  }

TEST(TelmBuffer, PollFd)
  {
  int fds[2];
  ASSERT_EQ(0, pipe(fds));
  TelmBuffer buffer(16);
  TelmSemaphore cancel;

  EXPECT_EQ(TELM_POLL_TIMEOUT, buffer.PollFd(fds[0], cancel.GetFd(), 20));
  ASSERT_EQ(3, write(fds[1], "OK\n", 3));
  EXPECT_EQ(3, buffer.PollFd(fds[0], cancel.GetFd(), 1000));
  EXPECT_EQ(2, buffer.Find("\n"));

  cancel.Give();
  EXPECT_EQ(TELM_POLL_CANCELLED, buffer.PollFd(fds[0], cancel.GetFd(), 1000));
  EXPECT_TRUE(cancel.Take(0));

  close(fds[1]);
  EXPECT_EQ(TELM_POLL_ERROR, buffer.PollFd(fds[0], cancel.GetFd(), 1000));
  close(fds[0]);
  }
