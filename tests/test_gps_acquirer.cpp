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
#include "memory_store.h"
#include "gps_acquirer.h"
#include "telm_command.h"
#include "telm_location.h"
#include "telm_utils.h"
#include "string_writer.h"

#define GPSACP_FIX      "$GPSACP: 120631.999,5433.6013N,01023.6946E,1.2,27.4,3,0.0,0.0,0.0,171120,07,03"
#define GPSACP_NOFIX    "$GPSACP: ,,,,,1,,,,,,"
#define GPSACP_HDOP09   "$GPSACP: 120931.999,5433.6013N,01023.6946E,0.9,27.4,3,0.0,0.0,0.0,171120,07,03"
#define GPSACP_HDOP25   "$GPSACP: 120731.999,5433.7013N,01023.6946E,2.5,27.4,3,0.0,0.0,0.0,171120,07,03"
#define GPSACP_HDOP30   "$GPSACP: 120831.999,5500.0000N,01023.6946E,3.0,27.4,3,0.0,0.0,0.0,171120,07,03"
#define CGPSINFO_FIX    "+CGPSINFO: 3113.343286,N,12121.234064,E,250311,072809.3,44.1,0.0,0"
#define CGPSINFO_NOFIX  "+CGPSINFO: ,,,,,,,,"

class GpsAcquirerTest : public ModemTest
  {
  protected:
    void SetUp()
      {
      ModemTest::SetUp();
      m_file = new LocationFile(m_dir.File("location.json"));
      m_gps = new GpsAcquirer(m_modem->GetDriver(), &m_store, m_file);
      m_gps->SetDelayFunction([this](int ms) { m_gps_delays.push_back(ms); return m_delay_result; });
      m_delay_result = true;
      }
    void TearDown()
      {
      delete m_gps;
      delete m_file;
      ModemTest::TearDown();
      }

    GpsFix Fix(double lat, double lon, double hdop)
      {
      GpsFix fix;
      fix.m_latitude = lat;
      fix.m_longitude = lon;
      fix.m_fix = GPS_FIX_3D;
      fix.m_has_hdop = true;
      fix.m_hdop = hdop;
      fix.m_timestamp = 1700000000;
      return fix;
      }

  protected:
    MemoryStore m_store;
    LocationFile* m_file;
    GpsAcquirer* m_gps;
    std::vector<int> m_gps_delays;
    bool m_delay_result;
  };

TEST_F(GpsAcquirerTest, ReturnsFirstValidFix)
  {
  m_transport.Always("AT$GPSACP", { GPSACP_FIX, "OK" });
  GpsFix fix;
  EXPECT_EQ(TELM_OK, m_gps->Acquire(5, 1000, fix));
  EXPECT_EQ(GPS_FIX_3D, fix.m_fix);
  EXPECT_EQ(1, m_transport.Count("AT$GPSACP"));
  EXPECT_TRUE(m_gps_delays.empty());
  }

TEST_F(GpsAcquirerTest, ExhaustsBudgetWithExactDelays)
  {
  m_transport.Always("AT$GPSACP", { GPSACP_NOFIX, "OK" });
  GpsFix fix;
  fix.m_latitude = 1.5;
  EXPECT_EQ(TELM_ERR_ACQUISITION_TIMEOUT, m_gps->Acquire(4, 2500, fix));
  EXPECT_EQ(4, m_transport.Count("AT$GPSACP"));
  ASSERT_EQ(4u, m_gps_delays.size());
  for (int ms : m_gps_delays)
    EXPECT_EQ(2500, ms);
  EXPECT_DOUBLE_EQ(1.5, fix.m_latitude);
  }

TEST_F(GpsAcquirerTest, CgpsinfoFixOnFourthAttempt)
  {
  MyConfig.SetParamValue("gps", "query", "AT+CGPSINFO");
  m_transport.Reply("AT+CGPSINFO", { CGPSINFO_NOFIX, "OK" });
  m_transport.Reply("AT+CGPSINFO", { CGPSINFO_NOFIX, "OK" });
  m_transport.Reply("AT+CGPSINFO", { CGPSINFO_NOFIX, "OK" });
  m_transport.Always("AT+CGPSINFO", { CGPSINFO_FIX, "OK" });
  GpsFix fix;
  EXPECT_EQ(TELM_OK, m_gps->Acquire(6, 1000, fix));
  EXPECT_EQ(4, m_transport.Count("AT+CGPSINFO"));
  EXPECT_EQ(3u, m_gps_delays.size());
  EXPECT_NEAR(31.22239, fix.m_latitude, 1e-5);
  EXPECT_TRUE(fix.m_has_altitude);
  }

TEST_F(GpsAcquirerTest, TimeoutAndGarbageConsumeAttempts)
  {
  m_transport.Reply("AT$GPSACP", {});
  m_transport.Reply("AT$GPSACP", { "$GPSACP: 1,2,3", "OK" });
  m_transport.Always("AT$GPSACP", { GPSACP_FIX, "OK" });
  GpsFix fix;
  EXPECT_EQ(TELM_OK, m_gps->Acquire(3, 10, fix));
  EXPECT_EQ(3, m_transport.Count("AT$GPSACP"));
  EXPECT_EQ(2u, m_gps_delays.size());
  }

TEST_F(GpsAcquirerTest, DeviceErrorIsSurfaced)
  {
  m_transport.Always("AT$GPSACP", { "+CME ERROR: 3" });
  GpsFix fix;
  EXPECT_EQ(TELM_ERR_DEVICE, m_gps->Acquire(5, 10, fix));
  EXPECT_EQ(1, m_transport.Count("AT$GPSACP"));
  EXPECT_TRUE(m_gps_delays.empty());
  }

TEST_F(GpsAcquirerTest, TransportErrorAborts)
  {
  m_transport.Reply("AT$GPSACP", { FAKE_IO });
  GpsFix fix;
  EXPECT_EQ(TELM_ERR_IO, m_gps->Acquire(5, 10, fix));
  EXPECT_EQ(1, m_transport.Count("AT$GPSACP"));
  }

TEST_F(GpsAcquirerTest, CancelledDelay)
  {
  m_transport.Always("AT$GPSACP", { GPSACP_NOFIX, "OK" });
  m_delay_result = false;
  GpsFix fix;
  EXPECT_EQ(TELM_ERR_CANCELLED, m_gps->Acquire(5, 10, fix));
  EXPECT_EQ(1, m_transport.Count("AT$GPSACP"));
  }

TEST_F(GpsAcquirerTest, RecordWritesStoreAndFile)
  {
  bool recorded = false;
  EXPECT_EQ(TELM_OK, m_gps->Record(Fix(54.5600215, 10.3949100, 1.2), &recorded));
  EXPECT_TRUE(recorded);
  EXPECT_EQ("54.5600", m_store.Get(STATE_GPS_LATITUDE));
  EXPECT_EQ("10.3949", m_store.Get(STATE_GPS_LONGITUDE));
  EXPECT_EQ("3", m_store.Get(STATE_GPS_FIX));
  EXPECT_EQ("1.20", m_store.Get(STATE_GPS_HDOP));
  EXPECT_EQ("1700000000", m_store.Get(STATE_GPS_TIMESTAMP));
  EXPECT_FALSE(m_store.IsDefined(STATE_GPS_ALTITUDE));

  GpsFix back;
  ASSERT_EQ(TELM_OK, m_file->Read(back));
  EXPECT_DOUBLE_EQ(54.56, back.m_latitude);
  EXPECT_FALSE(back.m_has_altitude);
  EXPECT_FALSE(path_exists(save_file_temp(m_dir.File("location.json"))));
  }

TEST_F(GpsAcquirerTest, RecordReplacesFixRegardlessOfHdop)
  {
  bool recorded;
  ASSERT_EQ(TELM_OK, m_gps->Record(Fix(50, 8, 0.8), &recorded));
  EXPECT_EQ(TELM_OK, m_gps->Record(Fix(51, 8, 1.1), &recorded));
  EXPECT_TRUE(recorded);
  EXPECT_EQ("51.0000", m_store.Get(STATE_GPS_LATITUDE));
  EXPECT_EQ("1.10", m_store.Get(STATE_GPS_HDOP));
  }

TEST_F(GpsAcquirerTest, RecordKeepsBetterFixWhenImproving)
  {
  MyConfig.SetParamValueBool("location", "hdop.improve", true);
  bool recorded;
  ASSERT_EQ(TELM_OK, m_gps->Record(Fix(10, 20, 0.9), &recorded));
  EXPECT_EQ(TELM_OK, m_gps->Record(Fix(11, 21, 1.5), &recorded));
  EXPECT_FALSE(recorded);
  EXPECT_EQ("10.0000", m_store.Get(STATE_GPS_LATITUDE));
  EXPECT_EQ(TELM_OK, m_gps->Record(Fix(12, 22, 0.8), &recorded));
  EXPECT_TRUE(recorded);
  EXPECT_EQ("12.0000", m_store.Get(STATE_GPS_LATITUDE));
  }

TEST_F(GpsAcquirerTest, NoFixNeverOverwritesByDefault)
  {
  bool recorded;
  ASSERT_EQ(TELM_OK, m_gps->Record(Fix(10, 20, 0.9), &recorded));
  GpsFix nofix;
  EXPECT_EQ(TELM_OK, m_gps->Record(nofix, &recorded));
  EXPECT_FALSE(recorded);
  EXPECT_EQ("10.0000", m_store.Get(STATE_GPS_LATITUDE));

  MyConfig.SetParamValueBool("location", "overwrite.nofix", true);
  EXPECT_EQ(TELM_OK, m_gps->Record(nofix, &recorded));
  EXPECT_TRUE(recorded);
  EXPECT_EQ("0", m_store.Get(STATE_GPS_FIX));
  }

TEST_F(GpsAcquirerTest, SeedIsSuperseded)
  {
  ASSERT_EQ(0, save_file(m_dir.File("seed.json"), "{\"latitude\":45.5,\"longitude\":-122.6,\"elevation\":30}"));
  GpsFix seed;
  ASSERT_EQ(TELM_OK, LocationFile::LoadSeed(m_dir.File("seed.json"), seed));
  bool recorded;
  ASSERT_EQ(TELM_OK, m_gps->Record(seed, &recorded));
  EXPECT_TRUE(recorded);
  EXPECT_EQ(TELM_OK, m_gps->Record(Fix(45.52, -122.68, 4.0), &recorded));
  EXPECT_TRUE(recorded);
  EXPECT_EQ("45.5200", m_store.Get(STATE_GPS_LATITUDE));
  }

TEST_F(GpsAcquirerTest, RecordWritesFixAsOneBatch)
  {
  bool recorded;
  ASSERT_EQ(TELM_OK, m_gps->Record(Fix(1, 2, 1.0), &recorded));
  m_store.m_fail_after = m_store.m_writes + 1;

  // a second write within the record would fail, a batch needs only one
  EXPECT_EQ(TELM_OK, m_gps->Record(Fix(50, 8, 1.0), &recorded));
  EXPECT_TRUE(recorded);
  EXPECT_EQ("50.0000", m_store.Get(STATE_GPS_LATITUDE));
  EXPECT_EQ("8.0000", m_store.Get(STATE_GPS_LONGITUDE));

  EXPECT_EQ(TELM_ERR_IO, m_gps->Record(Fix(60, 9, 1.0), &recorded));
  EXPECT_FALSE(recorded);
  EXPECT_EQ("50.0000", m_store.Get(STATE_GPS_LATITUDE));
  EXPECT_EQ("8.0000", m_store.Get(STATE_GPS_LONGITUDE));
  GpsFix back;
  ASSERT_EQ(TELM_OK, m_file->Read(back));
  EXPECT_DOUBLE_EQ(50.0, back.m_latitude);
  EXPECT_DOUBLE_EQ(8.0, back.m_longitude);
  }

TEST_F(GpsAcquirerTest, FileFailureRestoresStoredFix)
  {
  GpsFix first = Fix(1, 2, 1.0);
  first.m_has_altitude = true;
  first.m_altitude = 30;
  bool recorded;
  ASSERT_EQ(TELM_OK, m_gps->Record(first, &recorded));

  // a directory in the way of the temp file makes the location write fail
  ASSERT_EQ(0, mkpath(save_file_temp(m_dir.File("location.json"))));
  EXPECT_NE(TELM_OK, m_gps->Record(Fix(50, 8, 1.0), &recorded));
  EXPECT_FALSE(recorded);
  EXPECT_EQ("1.0000", m_store.Get(STATE_GPS_LATITUDE));
  EXPECT_EQ("2.0000", m_store.Get(STATE_GPS_LONGITUDE));
  EXPECT_EQ("30.0", m_store.Get(STATE_GPS_ALTITUDE));
  GpsFix back;
  ASSERT_EQ(TELM_OK, m_file->Read(back));
  EXPECT_DOUBLE_EQ(1.0, back.m_latitude);
  }

TEST_F(GpsAcquirerTest, RecordFailsOnStoreError)
  {
  m_store.m_fail = true;
  bool recorded = true;
  EXPECT_EQ(TELM_ERR_IO, m_gps->Record(Fix(10, 20, 0.9), &recorded));
  EXPECT_FALSE(recorded);
  EXPECT_FALSE(path_exists(m_dir.File("location.json")));
  }

TEST_F(GpsAcquirerTest, SettledFixTossesEarlyReadings)
  {
  m_transport.Reply("AT$GPSACP", { GPSACP_HDOP30, "OK" });
  m_transport.Reply("AT$GPSACP", { GPSACP_NOFIX, "OK" });
  m_transport.Reply("AT$GPSACP", { GPSACP_HDOP25, "OK" });
  m_transport.Always("AT$GPSACP", { GPSACP_HDOP09, "OK" });
  GpsFix fix;
  EXPECT_EQ(TELM_OK, m_gps->AcquireSettled(2, 5000, 3, 10, fix));
  EXPECT_DOUBLE_EQ(0.9, fix.m_hdop);
  EXPECT_EQ(4, m_transport.Count("AT$GPSACP"));
  std::vector<int> expected = { 5000, 10, 5000 };
  EXPECT_EQ(expected, m_gps_delays);
  EXPECT_FALSE(m_store.IsDefined(STATE_GPS_LATITUDE));

  m_gps_delays.clear();
  EXPECT_EQ(TELM_OK, m_gps->AcquireSettled(0, 5000, 3, 10, fix));
  EXPECT_EQ(5, m_transport.Count("AT$GPSACP"));
  EXPECT_TRUE(m_gps_delays.empty());
  }

TEST_F(GpsAcquirerTest, SettledFixFailsWithoutReading)
  {
  m_transport.Reply("AT$GPSACP", { GPSACP_FIX, "OK" });
  m_transport.Always("AT$GPSACP", { GPSACP_NOFIX, "OK" });
  GpsFix fix;
  fix.m_latitude = 1.5;
  EXPECT_EQ(TELM_ERR_ACQUISITION_TIMEOUT, m_gps->AcquireSettled(1, 5000, 2, 10, fix));
  EXPECT_DOUBLE_EQ(1.5, fix.m_latitude);
  }

TEST_F(GpsAcquirerTest, UntilRecordsImprovingFixes)
  {
  m_transport.Reply("AT$GPSACP", { GPSACP_HDOP25, "OK" });
  m_transport.Reply("AT$GPSACP", { GPSACP_NOFIX, "OK" });
  m_transport.Reply("AT$GPSACP", { GPSACP_HDOP30, "OK" });
  m_transport.Always("AT$GPSACP", { GPSACP_HDOP09, "OK" });

  GpsFix fix;
  EXPECT_EQ(TELM_OK, m_gps->AcquireUntil(1.0, 5, 7000, 1, 10, fix));
  EXPECT_DOUBLE_EQ(0.9, fix.m_hdop);
  EXPECT_EQ(4, m_transport.Count("AT$GPSACP"));
  std::vector<int> expected = { 7000, 10, 7000, 7000 };
  EXPECT_EQ(expected, m_gps_delays);

  // 3.0 was never recorded, 2.5 then 0.9 were
  EXPECT_EQ("54.5600", m_store.Get(STATE_GPS_LATITUDE));
  EXPECT_EQ("0.90", m_store.Get(STATE_GPS_HDOP));
  int latitudes = 0;
  for (auto& h : m_store.m_history)
    {
    EXPECT_NE("gps_fix.latitude=55.0000", h);
    if (h.compare(0, 17, "gps_fix.latitude=") == 0)
      latitudes++;
    }
  EXPECT_EQ(2, latitudes);
  }

TEST_F(GpsAcquirerTest, UntilGivesUpKeepingBestFix)
  {
  m_transport.Reply("AT$GPSACP", { GPSACP_HDOP30, "OK" });
  m_transport.Always("AT$GPSACP", { GPSACP_HDOP25, "OK" });
  GpsFix fix;
  fix.m_latitude = 1.5;
  EXPECT_EQ(TELM_ERR_ACQUISITION_TIMEOUT, m_gps->AcquireUntil(1.0, 3, 7000, 1, 10, fix));
  EXPECT_DOUBLE_EQ(1.5, fix.m_latitude);
  EXPECT_EQ(3, m_transport.Count("AT$GPSACP"));
  EXPECT_EQ(2u, m_gps_delays.size());
  EXPECT_EQ("2.50", m_store.Get(STATE_GPS_HDOP));
  EXPECT_EQ("54.5617", m_store.Get(STATE_GPS_LATITUDE));
  }

TEST_F(GpsAcquirerTest, UntilStopsOnTransportError)
  {
  m_transport.Reply("AT$GPSACP", { GPSACP_HDOP25, "OK" });
  m_transport.Reply("AT$GPSACP", { FAKE_IO });
  GpsFix fix;
  EXPECT_EQ(TELM_ERR_IO, m_gps->AcquireUntil(1.0, 5, 7000, 1, 10, fix));
  EXPECT_EQ(2, m_transport.Count("AT$GPSACP"));
  }

class GpsCommandTest : public GpsAcquirerTest
  {
  protected:
    void SetUp()
      {
      GpsAcquirerTest::SetUp();
      MyStateStore = &m_store;
      MyConfig.SetParamValue("location", "file", m_dir.File("location.json"));
      m_transport.Always("AT$GPSP=1", { "OK" });
      m_transport.Always("AT$GPSP=0", { "OK" });
      }
    void TearDown()
      {
      MyStateStore = NULL;
      GpsAcquirerTest::TearDown();
      }
    std::string Run(std::vector<const char*> args, telm_err_t& result)
      {
      std::vector<const char*> argv = { "gps", "fix" };
      argv.insert(argv.end(), args.begin(), args.end());
      StringWriter writer;
      MyCommandApp.Execute(COMMAND_RESULT_NORMAL, &writer, (int)argv.size(), argv.data());
      result = writer.GetResult();
      return std::string(writer);
      }
  };

TEST_F(GpsCommandTest, FixOptionsAreValidated)
  {
  telm_err_t result;
  std::string usage = "Usage: gps fix [-u <hdop> | -t <toss>] [<retries> [<delay>]]\n";
  EXPECT_EQ(usage, Run({ "-u", "0" }, result));
  EXPECT_EQ(TELM_ERR_INVALID_STATE, result);
  EXPECT_EQ(usage, Run({ "-t", "-1" }, result));
  EXPECT_EQ(usage, Run({ "-u", "1.0", "-t", "2" }, result));
  EXPECT_EQ(usage, Run({ "-x" }, result));
  EXPECT_EQ(0, m_transport.Count("AT$GPSACP"));
  }

TEST_F(GpsCommandTest, FixUntilHdop)
  {
  MyConfig.SetParamValueInt("gps", "until.delay", 3);
  m_transport.Reply("AT$GPSACP", { GPSACP_HDOP25, "OK" });
  m_transport.Always("AT$GPSACP", { GPSACP_HDOP09, "OK" });
  telm_err_t result;
  std::string output = Run({ "-u", "1.0", "1", "0" }, result);
  EXPECT_EQ(TELM_OK, result);
  EXPECT_NE(std::string::npos, output.find("hdop=0.90"));
  EXPECT_EQ(2, m_transport.Count("AT$GPSACP"));
  EXPECT_EQ(1, m_transport.Count("AT$GPSP=0"));
  EXPECT_EQ("0.90", m_store.Get(STATE_GPS_HDOP));
  ASSERT_EQ(1u, m_delays.size());
  EXPECT_EQ(3000, m_delays[0]);
  }

TEST_F(GpsCommandTest, FixTossesReadings)
  {
  m_transport.Reply("AT$GPSACP", { GPSACP_HDOP30, "OK" });
  m_transport.Always("AT$GPSACP", { GPSACP_FIX, "OK" });
  telm_err_t result;
  std::string output = Run({ "-t", "1", "2" }, result);
  EXPECT_EQ(TELM_OK, result);
  EXPECT_EQ(0u, output.find("(54.5600,10.3949)"));
  EXPECT_EQ(2, m_transport.Count("AT$GPSACP"));
  EXPECT_EQ("1.20", m_store.Get(STATE_GPS_HDOP));
  ASSERT_EQ(1u, m_delays.size());
  EXPECT_EQ(5000, m_delays[0]);
  }
