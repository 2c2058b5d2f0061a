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
static const char *TAG = "LE910";

#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include "telit_le910.h"
#include "telm_config.h"

const char model[] = "LE910C4";
const char name[] = "Telit LE910C4 (ECM, GNSS)";

class telitle910Init
  {
  public:
    telitle910Init();
} MyTelitle910Init  __attribute__ ((init_priority (4660)));

telitle910Init::telitle910Init()
  {
  TELM_LOGD(TAG, "Registering Telit LE910C4 modem driver (4660)");
  MyCellularModemFactory.RegisterCellularModemDriver<telitle910>(model,name);
  }

telitle910::telitle910()
  {
  }

telitle910::~telitle910()
  {
  }

const char* telitle910::GetModel()
  {
  return model;
  }

const char* telitle910::GetName()
  {
  return name;
  }

static bool is_number(const std::string& value)
  {
  if (value.empty()) return false;
  for (char c : value)
    if (!isdigit((unsigned char)c)) return false;
  return true;
  }

telm_err_t telitle910::GetIccid(std::string& iccid)
  {
  // +ICCID: 89882806660004909182
  std::string value;
  telm_err_t err = CommandValue("AT+ICCID", value);
  if (err != TELM_OK) return err;
  if (!is_number(value))
    {
    TELM_LOGD(TAG, "GetIccid: malformed '%s'", value.c_str());
    return TELM_ERR_PROTOCOL;
    }
  iccid = value;
  return TELM_OK;
  }

telm_err_t telitle910::GetImei(std::string& imei)
  {
  // +IMEISV: <IMEI><SVN>, the last two digits are the software version
  std::string value;
  telm_err_t err = CommandValue("AT+IMEISV", value);
  if (err != TELM_OK) return err;
  if (!is_number(value) || value.length() < 3)
    {
    TELM_LOGD(TAG, "GetImei: malformed '%s'", value.c_str());
    return TELM_ERR_PROTOCOL;
    }
  char buf[32];
  snprintf(buf, sizeof(buf), "%llu", strtoull(value.c_str(), NULL, 10) / 100);
  imei = buf;
  return TELM_OK;
  }

telm_err_t telitle910::EcmStart()
  {
  TELM_LOGI(TAG, "Starting ECM");
  return CommandOk("AT#ECM=1,0");
  }

telm_err_t telitle910::EcmStop()
  {
  TELM_LOGI(TAG, "Stopping ECM");
  return CommandOk("AT#ECMD=0");
  }

telm_err_t telitle910::GetEcmStatus(bool& up)
  {
  // #ECMC: <cid>,<state>,"<ip>","<gw>","<dns>"...
  std::string value;
  telm_err_t err = CommandValue("AT#ECMC?", value);
  if (err != TELM_OK) return err;
  std::vector<std::string> fields = split(value, ',');
  if (fields.size() < 5)
    {
    TELM_LOGD(TAG, "GetEcmStatus: expected at least 5 fields, got %zu", fields.size());
    return TELM_ERR_PROTOCOL;
    }
  up = (strip_quotes(trim(fields[1])) == "1");
  return TELM_OK;
  }

telm_err_t telitle910::GpsGetPower(bool& on)
  {
  std::string value;
  telm_err_t err = CommandValue("AT$GPSP?", value);
  if (err != TELM_OK) return err;
  if (!is_number(value))
    return TELM_ERR_PROTOCOL;
  on = (atoi(value.c_str()) != 0);
  return TELM_OK;
  }

telm_err_t telitle910::GpsSetPower(bool on)
  {
  TELM_LOGD(TAG, "Powering GPS %s", on ? "on" : "off");
  return CommandOk(on ? "AT$GPSP=1" : "AT$GPSP=0");
  }

telm_err_t telitle910::GetUsbConfig(int& config)
  {
  std::string value;
  telm_err_t err = CommandValue("AT#USBCFG?", value);
  if (err != TELM_OK) return err;
  if (!is_number(value))
    return TELM_ERR_PROTOCOL;
  config = atoi(value.c_str());
  return TELM_OK;
  }

telm_err_t telitle910::SetUsbConfig(int config)
  {
  // The modem reboots by itself to apply a new USB configuration
  char cmd[24];
  snprintf(cmd, sizeof(cmd), "AT#USBCFG=%d", config);
  telm_err_t err = CommandOk(cmd);
  if (err != TELM_OK) return err;
  return WaitReboot();
  }

telm_err_t telitle910::Reboot()
  {
  TELM_LOGI(TAG, "Sending AT#REBOOT");
  telm_err_t err = CommandOk("AT#REBOOT");
  if (err != TELM_OK) return err;
  return WaitReboot();
  }

telm_err_t telitle910::WaitReboot()
  {
  // The USB serial ports vanish while the modem restarts
  int wait = MyConfig.GetParamValueInt("modem", "reboot.wait", TELIT_REBOOT_WAIT);
  TELM_LOGI(TAG, "Waiting %d seconds for the modem to restart", wait);
  m_modem->Close();
  if (!m_modem->Delay(wait * 1000))
    return TELM_ERR_CANCELLED;
  telm_err_t err = m_modem->Open();
  if (err != TELM_OK)
    {
    TELM_LOGE(TAG, "Modem did not come back after reboot");
    return err;
    }
  return Sync();
  }
