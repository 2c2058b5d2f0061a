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


#include "gtest/gtest.h"
#include "test_helpers.h"
#include "telm_modem.h"
#include "telm_command.h"
#include "string_writer.h"

class ExecuteTest : public ModemTest {};

TEST_F(ExecuteTest, OkWithInterleavedUnsolicitedLines)
  {
  m_transport.Reply("AT+CSQ", { "+CREG: 1", "+CSQ: 17,99", "RING", "OK" });
  CommandResponse response;
  EXPECT_EQ(TELM_OK, m_modem->Execute(CommandRequest("AT+CSQ", "+CSQ:"), response));
  EXPECT_EQ(AT_STATUS_OK, response.m_status);
  ASSERT_TRUE(response.HasPayload());
  EXPECT_EQ("17,99", response.Payload());
  ASSERT_EQ(2u, response.m_urcs.size());
  EXPECT_EQ("+CREG: 1", response.m_urcs[0]);
  EXPECT_EQ("RING", response.m_urcs[1]);
  }

TEST_F(ExecuteTest, ErrorWithInterleavedUnsolicitedLines)
  {
  m_transport.Reply("AT#ECM=1,0", { "+CEREG: 5", "ERROR" });
  CommandResponse response;
  EXPECT_EQ(TELM_ERR_DEVICE, m_modem->Execute(CommandRequest("AT#ECM=1,0"), response));
  EXPECT_EQ(AT_STATUS_ERROR, response.m_status);
  EXPECT_EQ(-1, response.m_cause);
  EXPECT_EQ(1u, response.m_urcs.size());
  }

TEST_F(ExecuteTest, CmeErrorCarriesCause)
  {
  m_transport.Reply("AT+ICCID", { "+CME ERROR: 10" });
  CommandResponse response;
  EXPECT_EQ(TELM_ERR_DEVICE, m_modem->Execute(CommandRequest("AT+ICCID", "+ICCID:"), response));
  EXPECT_EQ(AT_STATUS_ERROR, response.m_status);
  EXPECT_EQ(10, response.m_cause);
  EXPECT_FALSE(response.HasPayload());
  }

TEST_F(ExecuteTest, TimeoutLeavesNoPayload)
  {
  m_transport.Reply("AT+CSQ", { "+CSQ: 17,99" });
  CommandResponse response;
  EXPECT_EQ(TELM_ERR_TIMEOUT, m_modem->Execute(CommandRequest("AT+CSQ", "+CSQ:", 200), response));
  EXPECT_EQ(AT_STATUS_TIMEOUT, response.m_status);
  EXPECT_FALSE(response.HasPayload());
  }

TEST_F(ExecuteTest, SilentModemTimesOut)
  {
  CommandResponse response;
  int64_t start = telm_monotonic_ms();
  EXPECT_EQ(TELM_ERR_TIMEOUT, m_modem->Execute(CommandRequest("AT", "", 100), response));
  EXPECT_LT(telm_monotonic_ms() - start, 5000);
  }

TEST_F(ExecuteTest, EchoIsDropped)
  {
  m_transport.m_echo = true;
  m_transport.Reply("AT+CGSN", { "351234567890123", "OK" });
  CommandResponse response;
  EXPECT_EQ(TELM_OK, m_modem->Execute(CommandRequest("AT+CGSN"), response));
  ASSERT_EQ(1u, response.m_lines.size());
  EXPECT_EQ("351234567890123", response.m_lines[0]);
  }

TEST_F(ExecuteTest, OkWithoutExpectedLineIsProtocolError)
  {
  m_transport.Reply("AT+CSQ", { "OK" });
  CommandResponse response;
  EXPECT_EQ(TELM_ERR_PROTOCOL, m_modem->Execute(CommandRequest("AT+CSQ", "+CSQ:"), response));
  EXPECT_EQ(AT_STATUS_OK, response.m_status);
  }

TEST_F(ExecuteTest, ExpectedPrefixWinsOverUnsolicitedPattern)
  {
  m_transport.Reply("AT$GPSACP", { "$GPSACP: ,,,,,1,,,,,,", "OK" });
  CommandResponse response;
  EXPECT_EQ(TELM_OK, m_modem->Execute(CommandRequest("AT$GPSACP", "$GPSACP:"), response));
  EXPECT_EQ(",,,,,1,,,,,,", response.Payload());
  EXPECT_TRUE(response.m_urcs.empty());
  }

TEST_F(ExecuteTest, TransportFailure)
  {
  m_transport.Reply("AT", { FAKE_IO });
  CommandResponse response;
  EXPECT_EQ(TELM_ERR_IO, m_modem->Execute(CommandRequest("AT"), response));
  EXPECT_EQ(AT_STATUS_TIMEOUT, response.m_status);

  m_modem->Close();
  EXPECT_EQ(TELM_ERR_IO, m_modem->Execute(CommandRequest("AT"), response));
  }

TEST_F(ExecuteTest, CloseTwice)
  {
  m_modem->Close();
  m_modem->Close();
  EXPECT_FALSE(m_modem->IsOpen());
  EXPECT_EQ(1, m_transport.m_closes);
  EXPECT_EQ(TELM_OK, m_modem->Open());
  EXPECT_EQ(2, m_transport.m_opens);
  }

TEST_F(ExecuteTest, PollUnsolicited)
  {
  m_transport.Inject("+CREG: 1,\"00C3\",\"0000B1E5\",7");
  m_transport.Inject("#ECMEV: 1");
  CommandResponse response;
  EXPECT_EQ(TELM_OK, m_modem->PollUnsolicited(100, response));
  EXPECT_EQ(AT_STATUS_UNSOLICITED, response.m_status);
  EXPECT_EQ(2u, response.m_urcs.size());
  }

TEST_F(ExecuteTest, UrcCommandListsPendingCodes)
  {
  m_transport.Inject("+CEREG: 5");
  const char* argv[] = { "modem", "urc", "1" };
  StringWriter writer;
  MyCommandApp.Execute(COMMAND_RESULT_NORMAL, &writer, 3, argv);
  EXPECT_EQ(TELM_OK, writer.GetResult());
  EXPECT_EQ("+CEREG: 5\n[UNSOLICITED] 1 line(s) in 1 s\n", std::string(writer));
  }

TEST(AtResponsePrefix, CommandForms)
  {
  EXPECT_EQ("$GPSACP:", AtResponsePrefix("AT$GPSACP"));
  EXPECT_EQ("+CGPSINFO:", AtResponsePrefix("AT+CGPSINFO"));
  EXPECT_EQ("+CGDCONT:", AtResponsePrefix("AT+CGDCONT?"));
  EXPECT_EQ("#USBCFG:", AtResponsePrefix("AT#USBCFG=4"));
  }

TEST(AtIsUnsolicited, KnownCodes)
  {
  EXPECT_TRUE(AtIsUnsolicited("+CREG: 1"));
  EXPECT_TRUE(AtIsUnsolicited("NO CARRIER"));
  EXPECT_TRUE(AtIsUnsolicited("$GPGGA,123519,4807.038,N"));
  EXPECT_FALSE(AtIsUnsolicited("+CSQ: 17,99"));
  EXPECT_FALSE(AtIsUnsolicited("OK"));
  }
