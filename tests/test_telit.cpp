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
#include "gpsinfo.h"

class TelitTest : public ModemTest
  {
  protected:
    modemdriver* Driver() { return m_modem->GetDriver(); }
  };

TEST_F(TelitTest, DriverSelection)
  {
  EXPECT_STREQ("LE910C4", Driver()->GetModel());
  m_modem->SetCellularModemDriver("XYZ");
  EXPECT_STREQ("LE910C4", Driver()->GetModel());
  }

TEST_F(TelitTest, SyncRetriesUntilAnswered)
  {
  m_transport.Reply("AT", {});
  m_transport.Reply("AT", { "+CEREG: 1" });
  m_transport.Always("AT", { "OK" });
  EXPECT_EQ(TELM_OK, Driver()->Sync());
  EXPECT_EQ(3, m_transport.Count("AT"));
  EXPECT_EQ(2u, m_delays.size());
  }

TEST_F(TelitTest, SyncGivesUp)
  {
  MyConfig.SetParamValueInt("modem", "sync.tries", 3);
  EXPECT_EQ(TELM_ERR_TIMEOUT, Driver()->Sync());
  EXPECT_EQ(3, m_transport.Count("AT"));
  }

TEST_F(TelitTest, Identity)
  {
  m_transport.Always("AT+ICCID", { "+ICCID: 89882806660004909182", "OK" });
  m_transport.Always("AT+IMEISV", { "+IMEISV: 35123456789012301", "OK" });

  std::string value;
  EXPECT_EQ(TELM_OK, Driver()->GetIccid(value));
  EXPECT_EQ("89882806660004909182", value);
  EXPECT_EQ(TELM_OK, Driver()->GetImei(value));
  EXPECT_EQ("351234567890123", value);

  EXPECT_EQ(TELM_OK, Driver()->QueryIdentity(value));
  EXPECT_EQ("iccid:89882806660004909182", value);
  MyConfig.SetParamValue("ecm", "identity", "imei");
  EXPECT_EQ(TELM_OK, Driver()->QueryIdentity(value));
  EXPECT_EQ("imei:351234567890123", value);
  }

TEST_F(TelitTest, MalformedIccid)
  {
  m_transport.Reply("AT+ICCID", { "+ICCID: SIM BUSY", "OK" });
  std::string value = "unchanged";
  EXPECT_EQ(TELM_ERR_PROTOCOL, Driver()->GetIccid(value));
  EXPECT_EQ("unchanged", value);
  }

TEST_F(TelitTest, SignalQuality)
  {
  double quality = -1;
  m_transport.Reply("AT+CSQ", { "+CSQ: 31,99", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GetSignalQuality(quality));
  EXPECT_DOUBLE_EQ(1.0, quality);
  m_transport.Reply("AT+CSQ", { "+CSQ: 191,99", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GetSignalQuality(quality));
  EXPECT_DOUBLE_EQ(1.0, quality);
  m_transport.Reply("AT+CSQ", { "+CSQ: 99,99", "OK" });
  EXPECT_EQ(TELM_ERR_NOT_FOUND, Driver()->GetSignalQuality(quality));
  m_transport.Reply("AT+CSQ", { "+CSQ: 17", "OK" });
  EXPECT_EQ(TELM_ERR_PROTOCOL, Driver()->GetSignalQuality(quality));
  }

TEST_F(TelitTest, ClockZoneOffset)
  {
  int64_t utc = 0;
  m_transport.Reply("AT+CCLK?", { "+CCLK: \"21/03/04,10:20:30+08\"", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GetClock(utc));
  EXPECT_EQ(ymdhms_to_timestamp(2021, 3, 4, 8, 20, 30), utc);

  m_transport.Reply("AT+CCLK?", { "+CCLK: \"21/03/04,10:20:30-20\"", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GetClock(utc));
  EXPECT_EQ(ymdhms_to_timestamp(2021, 3, 4, 15, 20, 30), utc);

  m_transport.Reply("AT+CCLK?", { "+CCLK: \"21/03/04,10:20:30+22\"", "OK" });
  EXPECT_EQ(TELM_ERR_PROTOCOL, Driver()->GetClock(utc));
  }

TEST_F(TelitTest, SetClockVerifiesReadBack)
  {
  int64_t utc = ymdhms_to_timestamp(2026, 10, 19, 12, 0, 0);
  m_transport.Always("AT+CCLK=\"26/10/19,12:00:00+00\"", { "OK" });
  m_transport.Reply("AT+CCLK?", { "+CCLK: \"26/10/19,12:00:01+00\"", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->SetClock(utc));
  m_transport.Reply("AT+CCLK?", { "+CCLK: \"26/10/19,12:05:00+00\"", "OK" });
  EXPECT_EQ(TELM_ERR_PROTOCOL, Driver()->SetClock(utc));
  }

TEST_F(TelitTest, EcmStatus)
  {
  bool up = false;
  m_transport.Reply("AT#ECMC?", { "#ECMC: 1,1,\"10.0.0.2\",\"10.0.0.1\",\"8.8.8.8\",\"8.8.4.4\"", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GetEcmStatus(up));
  EXPECT_TRUE(up);
  m_transport.Reply("AT#ECMC?", { "#ECMC: 1,0,\"\",\"\",\"\"", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GetEcmStatus(up));
  EXPECT_FALSE(up);
  m_transport.Reply("AT#ECMC?", { "#ECMC: 1,0", "OK" });
  EXPECT_EQ(TELM_ERR_PROTOCOL, Driver()->GetEcmStatus(up));
  }

TEST_F(TelitTest, PdpContext)
  {
  std::string type, apn;
  m_transport.Reply("AT+CGDCONT?", {
    "+CGDCONT: 2,\"IPV4V6\",\"ims\",\"\",0,0",
    "+CGDCONT: 1,\"IP\",\"super\",\"\",0,0", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GetPdpContext(type, apn));
  EXPECT_EQ("IP", type);
  EXPECT_EQ("super", apn);
  m_transport.Reply("AT+CGDCONT?", { "OK" });
  EXPECT_EQ(TELM_ERR_NOT_FOUND, Driver()->GetPdpContext(type, apn));
  }

TEST_F(TelitTest, GpsPower)
  {
  bool on = true;
  m_transport.Reply("AT$GPSP?", { "$GPSP: 0", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GpsGetPower(on));
  EXPECT_FALSE(on);
  m_transport.Reply("AT$GPSP=1", { "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GpsSetPower(true));
  }

TEST_F(TelitTest, GpsQueryFormats)
  {
  GpsFix fix;
  m_transport.Reply("AT$GPSACP", { "$GPSACP: 120631.999,5433.6013N,01023.6946E,1.2,27.4,3,0.0,0.0,0.0,171120,07,03", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GpsQuery(fix));
  EXPECT_NEAR(54.56002, fix.m_latitude, 1e-5);
  EXPECT_EQ(GPS_FIX_3D, fix.m_fix);

  m_transport.Reply("AT$GPSACP", { "$GPSACP: ,,,,,1,,,,,,", "OK" });
  EXPECT_EQ(TELM_ERR_NOFIX, Driver()->GpsQuery(fix));

  MyConfig.SetParamValue("gps", "query", "AT+CGPSINFO");
  m_transport.Reply("AT+CGPSINFO", { "+CGPSINFO: 3113.343286,N,12121.234064,E,250311,072809.3,44.1,0.0,0", "OK" });
  EXPECT_EQ(TELM_OK, Driver()->GpsQuery(fix));
  EXPECT_NEAR(121.35390, fix.m_longitude, 1e-5);

  MyConfig.SetParamValueInt("gps", "fix.min", 3);
  m_transport.Reply("AT+CGPSINFO", { "+CGPSINFO: 3113.343286,N,12121.234064,E,250311,072809.3,,0.0,0", "OK" });
  EXPECT_EQ(TELM_ERR_NOFIX, Driver()->GpsQuery(fix));
  }

TEST_F(TelitTest, RebootReopensAndSyncs)
  {
  m_transport.Always("AT#REBOOT", { "OK" });
  m_transport.Always("AT", { "OK" });
  EXPECT_EQ(TELM_OK, Driver()->Reboot());
  EXPECT_EQ(1, m_transport.m_closes);
  EXPECT_EQ(2, m_transport.m_opens);
  ASSERT_EQ(1u, m_delays.size());
  EXPECT_EQ(30000, m_delays[0]);
  EXPECT_EQ(1, m_transport.Count("AT"));
  }
