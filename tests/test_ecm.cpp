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


#include <algorithm>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "gtest/gtest.h"
#include "test_helpers.h"
#include "memory_store.h"
#include "ecm_controller.h"
#include "string_writer.h"
#include "telm_command.h"
#include "telm_semaphore.h"

#define ECMC_UP     "#ECMC: 1,1,\"10.0.0.2\",\"10.0.0.1\",\"8.8.8.8\",\"8.8.4.4\""
#define ECMC_DOWN   "#ECMC: 1,0,\"\",\"\",\"\",\"\""

class EcmTest : public ModemTest
  {
  protected:
    void SetUp()
      {
      ModemTest::SetUp();
      m_ecm = new EcmController(m_modem->GetDriver(), &m_store);
      m_transport.Always("AT+ICCID", { "+ICCID: 89882806660004909182", "OK" });
      }
    void TearDown()
      {
      delete m_ecm;
      ModemTest::TearDown();
      }
    bool Persisted(const std::string& entry)
      {
      return std::find(m_store.m_history.begin(), m_store.m_history.end(), entry) != m_store.m_history.end();
      }

  protected:
    MemoryStore m_store;
    EcmController* m_ecm;
  };

TEST_F(EcmTest, StoredIdentityIsNeverReplaced)
  {
  m_store.Set(STATE_DEVICE_IDENTITY, "ABC123");
  m_transport.Always("AT+ICCID", { "+ICCID: 999", "OK" });
  std::string identity;
  EXPECT_EQ(TELM_OK, m_ecm->QueryIdentity(identity));
  EXPECT_EQ("ABC123", identity);
  EXPECT_EQ("ABC123", m_store.Get(STATE_DEVICE_IDENTITY));
  EXPECT_EQ(1, m_store.m_writes);
  }

TEST_F(EcmTest, FirstIdentityIsPersisted)
  {
  std::string identity;
  EXPECT_EQ(TELM_OK, m_ecm->QueryIdentity(identity));
  EXPECT_EQ("iccid:89882806660004909182", identity);
  EXPECT_EQ(identity, m_store.Get(STATE_DEVICE_IDENTITY));
  }

TEST_F(EcmTest, IdentityFailureWritesNothing)
  {
  m_transport.Always("AT+ICCID", { "+CME ERROR: 10" });
  std::string identity = "none";
  EXPECT_EQ(TELM_ERR_DEVICE, m_ecm->QueryIdentity(identity));
  EXPECT_EQ("none", identity);
  EXPECT_FALSE(m_store.IsDefined(STATE_DEVICE_IDENTITY));
  }

TEST_F(EcmTest, StoredIdentityWhileModemFails)
  {
  m_store.Set(STATE_DEVICE_IDENTITY, "ABC123");
  m_transport.Always("AT+ICCID", { "ERROR" });
  std::string identity;
  EXPECT_EQ(TELM_OK, m_ecm->QueryIdentity(identity));
  EXPECT_EQ("ABC123", identity);

  m_transport.Always("AT+ICCID", { FAKE_IO });
  EXPECT_EQ(TELM_ERR_IO, m_ecm->QueryIdentity(identity));
  }

TEST_F(EcmTest, EnableIsIdempotent)
  {
  m_transport.Always("AT#ECM=1,0", { "OK" });
  EXPECT_EQ(TELM_OK, m_ecm->Enable());
  EXPECT_EQ(EcmController::Enabled, m_ecm->GetState());
  EXPECT_EQ("Enabled", m_store.Get(STATE_ECM_STATE));
  EXPECT_EQ(TELM_OK, m_ecm->Enable());
  EXPECT_EQ(1, m_transport.Count("AT#ECM=1,0"));
  }

TEST_F(EcmTest, EnableFailureIsReported)
  {
  m_transport.Always("AT#ECM=1,0", { "+CME ERROR: 4" });
  m_transport.Always("AT#ECMC?", { ECMC_DOWN, "OK" });
  EXPECT_EQ(TELM_ERR_DEVICE, m_ecm->Enable());
  EXPECT_EQ(EcmController::Unknown, m_ecm->GetState());
  EXPECT_EQ(1, m_transport.Count("AT#ECM=1,0"));
  }

TEST_F(EcmTest, EnableWhileAlreadyUp)
  {
  m_transport.Always("AT#ECM=1,0", { "ERROR" });
  m_transport.Always("AT#ECMC?", { ECMC_UP, "OK" });
  EXPECT_EQ(TELM_OK, m_ecm->Enable());
  EXPECT_EQ(EcmController::Enabled, m_ecm->GetState());
  }

TEST_F(EcmTest, DisableAndVerify)
  {
  m_transport.Always("AT#ECM=1,0", { "OK" });
  m_transport.Always("AT#ECMD=0", { "OK" });
  ASSERT_EQ(TELM_OK, m_ecm->Enable());
  EXPECT_EQ(TELM_OK, m_ecm->Disable());
  EXPECT_EQ(EcmController::Disabled, m_ecm->GetState());
  EXPECT_EQ("Disabled", m_store.Get(STATE_ECM_STATE));

  m_transport.Always("AT#ECMC?", { ECMC_UP, "OK" });
  EXPECT_EQ(TELM_OK, m_ecm->Verify());
  EXPECT_EQ(EcmController::Enabled, m_ecm->GetState());
  m_transport.Always("AT#ECMC?", { ECMC_DOWN, "OK" });
  EXPECT_EQ(TELM_OK, m_ecm->Verify());
  EXPECT_EQ(EcmController::Disabled, m_ecm->GetState());
  }

TEST_F(EcmTest, DisableFailureRestoresState)
  {
  m_transport.Always("AT#ECM=1,0", { "OK" });
  m_transport.Always("AT#ECMD=0", { "ERROR" });
  ASSERT_EQ(TELM_OK, m_ecm->Enable());
  EXPECT_EQ(TELM_ERR_DEVICE, m_ecm->Disable());
  EXPECT_EQ(EcmController::Enabled, m_ecm->GetState());
  }

TEST_F(EcmTest, TransientStatesAreNeverPersisted)
  {
  m_transport.Reply("AT#ECM=1,0", { "ERROR" });
  m_transport.Always("AT#ECM=1,0", { "OK" });
  m_transport.Always("AT#ECMD=0", { "OK" });
  m_transport.Always("AT#ECMC?", { ECMC_DOWN, "OK" });
  m_ecm->Enable();
  m_ecm->Enable();
  m_ecm->Disable();
  m_ecm->Verify();
  EXPECT_FALSE(Persisted("ecm_state=Enabling"));
  EXPECT_FALSE(Persisted("ecm_state=DisableRequested"));
  EXPECT_TRUE(Persisted("ecm_state=Enabled"));
  EXPECT_TRUE(Persisted("ecm_state=Disabled"));
  }

TEST_F(EcmTest, CheckRestartsWhenHostUnreachable)
  {
  m_transport.Always("AT#ECM=1,0", { "OK" });
  m_transport.Always("AT#ECMD=0", { "OK" });
  m_transport.Always("AT#ECMC?", { ECMC_UP, "OK" });
  std::vector<std::string> hosts;
  telm_err_t link = TELM_ERR_NOT_FOUND;
  auto check = [&](const std::string& host) { hosts.push_back(host); return link; };

  bool restarted = false;
  EXPECT_EQ(TELM_OK, m_ecm->Check("sixfab.com", check, &restarted));
  EXPECT_TRUE(restarted);
  EXPECT_EQ(1, m_transport.Count("AT#ECMD=0"));
  EXPECT_EQ(1, m_transport.Count("AT#ECM=1,0"));
  EXPECT_EQ(EcmController::Enabled, m_ecm->GetState());

  link = TELM_OK;
  EXPECT_EQ(TELM_OK, m_ecm->Check("sixfab.com", check, &restarted));
  EXPECT_FALSE(restarted);
  EXPECT_EQ(1, m_transport.Count("AT#ECM=1,0"));
  EXPECT_EQ(2u, hosts.size());
  }

TEST_F(EcmTest, CheckWithoutHostOnlyVerifies)
  {
  m_transport.Always("AT#ECM=1,0", { "OK" });
  m_transport.Always("AT#ECMC?", { ECMC_UP, "OK" });
  int calls = 0;
  auto check = [&](const std::string& host) { calls++; return TELM_ERR_TIMEOUT; };
  EXPECT_EQ(TELM_OK, m_ecm->Check("", check));
  EXPECT_EQ(0, calls);
  EXPECT_EQ(0, m_transport.Count("AT#ECM=1,0"));

  m_transport.Always("AT#ECMC?", { ECMC_DOWN, "OK" });
  bool restarted = false;
  EXPECT_EQ(TELM_OK, m_ecm->Check("", check, &restarted));
  EXPECT_TRUE(restarted);
  EXPECT_EQ(1, m_transport.Count("AT#ECM=1,0"));
  }

TEST_F(EcmTest, CheckPassesCancellation)
  {
  m_transport.Always("AT#ECMC?", { ECMC_UP, "OK" });
  auto check = [](const std::string& host) { return TELM_ERR_CANCELLED; };
  EXPECT_EQ(TELM_ERR_CANCELLED, m_ecm->Check("sixfab.com", check));
  EXPECT_EQ(0, m_transport.Count("AT#ECMD=0"));
  }

TEST_F(EcmTest, CheckCommandReachesLocalHost)
  {
  int listener = socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(listener, 0);
  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  ASSERT_EQ(0, bind(listener, (struct sockaddr*)&addr, sizeof(addr)));
  ASSERT_EQ(0, listen(listener, 4));
  socklen_t len = sizeof(addr);
  ASSERT_EQ(0, getsockname(listener, (struct sockaddr*)&addr, &len));

  MyStateStore = &m_store;
  MyConfig.SetParamValueInt("ecm", "port", ntohs(addr.sin_port));
  m_transport.Always("AT#ECMC?", { ECMC_UP, "OK" });
  const char* argv[] = { "ecm", "check", "127.0.0.1" };
  StringWriter writer;
  MyCommandApp.Execute(COMMAND_RESULT_NORMAL, &writer, 3, argv);
  MyStateStore = NULL;
  close(listener);

  EXPECT_EQ(TELM_OK, writer.GetResult());
  EXPECT_EQ("ECM running, 127.0.0.1 reachable\n", std::string(writer));
  EXPECT_EQ(0, m_transport.Count("AT#ECMD=0"));
  }

TEST(EcmCheckLink, RefusedConnectionIsReachable)
  {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(sock, 0);
  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  ASSERT_EQ(0, bind(sock, (struct sockaddr*)&addr, sizeof(addr)));
  socklen_t len = sizeof(addr);
  ASSERT_EQ(0, getsockname(sock, (struct sockaddr*)&addr, &len));
  close(sock);

  EXPECT_EQ(TELM_OK, EcmCheckLink("127.0.0.1", std::to_string(ntohs(addr.sin_port)), 1, 1000));
  }

TEST(EcmCheckLink, UnreachableHost)
  {
  // TEST-NET-1, never routed
  EXPECT_EQ(TELM_ERR_TIMEOUT, EcmCheckLink("192.0.2.1", "80", 2, 100));
  }

TEST(EcmCheckLink, Cancelled)
  {
  TelmSemaphore cancel;
  cancel.Give();
  EXPECT_EQ(TELM_ERR_CANCELLED, EcmCheckLink("192.0.2.1", "80", 3, 100, &cancel));
  }

TEST(EcmStateName, Names)
  {
  EXPECT_STREQ("Unknown", EcmStateName(EcmController::Unknown));
  EXPECT_STREQ("DisableRequested", EcmStateName(EcmController::DisableRequested));
  }
