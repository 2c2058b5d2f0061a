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
static const char *TAG = "modem-driver";

#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include "telm_modem.h"
#include "telm_config.h"

TelmCellularModemFactory MyCellularModemFactory __attribute__ ((init_priority (4400)));

TelmCellularModemFactory::TelmCellularModemFactory()
  {
  TELM_LOGD(TAG, "Initialising MODEM FACTORY (4400)");
  }

TelmCellularModemFactory::~TelmCellularModemFactory()
  {
  }

modemdriver* TelmCellularModemFactory::NewCellularModemDriver(const char* ModelType)
  {
  map_modemdriver_t::iterator iter = m_drivermap.find(ModelType);
  if (iter != m_drivermap.end())
    {
    return iter->second.construct();
    }
  return NULL;
  }

////////////////////////////////////////////////////////////////////////////////
// The virtual modem driver.
// This base implementation covers the 3GPP TS 27.007 commands every modem
// understands. Vendor specific functions (ECM, GPS power, USB configuration)
// are left to the model drivers.

modemdriver::modemdriver()
  {
  m_modem = MyModem;
  }

modemdriver::~modemdriver()
  {
  }

const char* modemdriver::GetModel()
  {
  return "generic";
  }

const char* modemdriver::GetName()
  {
  return "Generic 3GPP modem";
  }

telm_err_t modemdriver::Command(const std::string& command, const std::string& expect,
                                CommandResponse& response, int timeoutms /*=0*/)
  {
  if (m_modem == NULL) return TELM_ERR_INVALID_STATE;
  return m_modem->Execute(CommandRequest(command, expect, timeoutms), response);
  }

telm_err_t modemdriver::CommandOk(const std::string& command, int timeoutms /*=0*/)
  {
  CommandResponse response;
  return Command(command, "", response, timeoutms);
  }

telm_err_t modemdriver::CommandValue(const std::string& command, std::string& value, int timeoutms /*=0*/)
  {
  CommandResponse response;
  telm_err_t err = Command(command, AtResponsePrefix(command), response, timeoutms);
  if (err == TELM_OK)
    value = response.Payload();
  return err;
  }

telm_err_t modemdriver::NotSupported(const char* operation)
  {
  TELM_LOGW(TAG, "%s: not supported by the %s driver", operation, GetModel());
  return TELM_ERR_INVALID_STATE;
  }

telm_err_t modemdriver::Sync()
  {
  int tries = MyConfig.GetParamValueInt("modem", "sync.tries", 10);
  int delay = MyConfig.GetParamValueInt("modem", "sync.delay", 500);
  telm_err_t err = TELM_ERR_TIMEOUT;

  for (int k=0; k<tries; k++)
    {
    TELM_LOGV(TAG, "Sync: sending 'AT', try #%d", k+1);
    err = CommandOk("AT", 1000);
    if (err == TELM_OK)
      return TELM_OK;
    if (err == TELM_ERR_IO || err == TELM_ERR_CANCELLED)
      return err;
    if (!m_modem->Delay(delay))
      return TELM_ERR_CANCELLED;
    }
  TELM_LOGW(TAG, "Sync: no response to 'AT' after %d tries", tries);
  return err;
  }

// Digits at the start of value, used for numeric identities
static std::string leading_digits(const std::string& value)
  {
  size_t n = 0;
  while (n < value.length() && isdigit((unsigned char)value[n]))
    n++;
  return value.substr(0, n);
  }

telm_err_t modemdriver::GetIccid(std::string& iccid)
  {
  std::string value;
  telm_err_t err = CommandValue("AT+CCID", value);
  if (err != TELM_OK) return err;
  value = leading_digits(strip_quotes(value));
  if (value.empty()) return TELM_ERR_PROTOCOL;
  iccid = value;
  return TELM_OK;
  }

telm_err_t modemdriver::GetImei(std::string& imei)
  {
  // +CGSN answers with a bare serial number line
  CommandResponse response;
  telm_err_t err = Command("AT+CGSN", "", response);
  if (err != TELM_OK) return err;
  for (auto& line : response.m_lines)
    {
    std::string digits = leading_digits(line);
    if (digits.length() >= 14 && digits.length() == line.length())
      {
      imei = digits;
      return TELM_OK;
      }
    }
  return TELM_ERR_PROTOCOL;
  }

telm_err_t modemdriver::QueryIdentity(std::string& identity)
  {
  std::string source = MyConfig.GetParamValue("ecm", "identity", "iccid");
  std::string value;
  telm_err_t err;
  if (source == "imei")
    err = GetImei(value);
  else
    err = GetIccid(value);
  if (err != TELM_OK) return err;
  identity = (source == "imei" ? "imei:" : "iccid:") + value;
  return TELM_OK;
  }

telm_err_t modemdriver::GetSignalQuality(double& quality)
  {
  // +CSQ: <rssi>,<ber>  rssi 0..31, or 100..191 for TD-SCDMA/LTE extended range
  std::string value;
  telm_err_t err = CommandValue("AT+CSQ", value);
  if (err != TELM_OK) return err;
  std::vector<std::string> fields = split(value, ',');
  if (fields.size() != 2 || leading_digits(fields[0]).empty())
    return TELM_ERR_PROTOCOL;

  int rssi = atoi(fields[0].c_str());
  if (rssi <= 31)
    quality = rssi / 31.0;
  else if (rssi >= 100 && rssi <= 191)
    quality = (rssi - 100) / 91.0;
  else
    return TELM_ERR_NOT_FOUND;
  return TELM_OK;
  }

telm_err_t modemdriver::GetClock(int64_t& utc)
  {
  // +CCLK: "yy/MM/dd,hh:mm:ss±zz"  zz = zone offset in quarter hours
  std::string value;
  telm_err_t err = CommandValue("AT+CCLK?", value);
  if (err != TELM_OK) return err;
  value = strip_quotes(value);

  int year, month, day, hour, minute, second, zone;
  char sign;
  if (value.length() < 20
      || sscanf(value.c_str(), "%2d/%2d/%2d,%2d:%2d:%2d%c%d",
                &year, &month, &day, &hour, &minute, &second, &sign, &zone) != 8
      || (sign != '+' && sign != '-'))
    {
    TELM_LOGD(TAG, "GetClock: malformed '%s'", value.c_str());
    return TELM_ERR_PROTOCOL;
    }
  if (zone % 4 != 0)
    {
    TELM_LOGW(TAG, "GetClock: zone offset %c%d is not a whole hour", sign, zone);
    return TELM_ERR_PROTOCOL;
    }
  if (sign == '-') zone = -zone;
  utc = ymdhms_to_timestamp(2000+year, month, day, hour, minute, second) - (zone / 4) * 3600L;
  return TELM_OK;
  }

telm_err_t modemdriver::SetClock(int64_t utc)
  {
  time_t t = (time_t)utc;
  struct tm tm;
  char cmd[48];
  gmtime_r(&t, &tm);
  snprintf(cmd, sizeof(cmd), "AT+CCLK=\"%02d/%02d/%02d,%02d:%02d:%02d+00\"",
    tm.tm_year % 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  telm_err_t err = CommandOk(cmd);
  if (err != TELM_OK) return err;

  int64_t readback;
  if ((err = GetClock(readback)) != TELM_OK)
    return err;
  int64_t diff = readback - utc;
  if (diff < -2 || diff > 2)
    {
    TELM_LOGW(TAG, "SetClock: read back differs by %lld s", (long long)diff);
    return TELM_ERR_PROTOCOL;
    }
  return TELM_OK;
  }

telm_err_t modemdriver::GetPdpContext(std::string& type, std::string& apn)
  {
  // +CGDCONT: <cid>,"<type>","<apn>",... one line per context
  CommandResponse response;
  telm_err_t err = Command("AT+CGDCONT?", "+CGDCONT:", response);
  if (err == TELM_ERR_PROTOCOL) return TELM_ERR_NOT_FOUND;  // no contexts defined
  if (err != TELM_OK) return err;
  for (auto& ctx : response.m_payload)
    {
    std::vector<std::string> fields = split(ctx, ',');
    if (fields.size() >= 3 && trim(fields[0]) == "1")
      {
      type = strip_quotes(trim(fields[1]));
      apn = strip_quotes(trim(fields[2]));
      return TELM_OK;
      }
    }
  return TELM_ERR_NOT_FOUND;
  }

telm_err_t modemdriver::SetPdpContext(const std::string& type, const std::string& apn)
  {
  return CommandOk("AT+CGDCONT=1,\"" + type + "\",\"" + apn + "\"");
  }

telm_err_t modemdriver::GpsQuery(GpsFix& fix)
  {
  std::string query = MyConfig.GetParamValue("gps", "query", "AT$GPSACP");
  std::string prefix = AtResponsePrefix(query);
  CommandResponse response;
  telm_err_t err = Command(query, prefix, response);
  if (err != TELM_OK) return err;

  GpsFix result;
  if (prefix == "$GPSACP:")
    err = GpsParseGpsacp(response.Payload(), result);
  else if (prefix == "+CGPSINFO:")
    err = GpsParseCgpsinfo(response.Payload(), result);
  else
    {
    TELM_LOGE(TAG, "GpsQuery: no decoder for '%s'", query.c_str());
    return TELM_ERR_PROTOCOL;
    }
  if (err != TELM_OK) return err;

  int minfix = MyConfig.GetParamValueInt("gps", "fix.min", GPS_FIX_2D);
  if (!result.IsValid(minfix))
    {
    TELM_LOGD(TAG, "GpsQuery: fix %d below minimum %d", result.m_fix, minfix);
    return TELM_ERR_NOFIX;
    }
  fix = result;
  return TELM_OK;
  }

telm_err_t modemdriver::EcmStart()
  {
  return NotSupported("EcmStart");
  }

telm_err_t modemdriver::EcmStop()
  {
  return NotSupported("EcmStop");
  }

telm_err_t modemdriver::GetEcmStatus(bool& up)
  {
  return NotSupported("GetEcmStatus");
  }

telm_err_t modemdriver::GpsGetPower(bool& on)
  {
  return NotSupported("GpsGetPower");
  }

telm_err_t modemdriver::GpsSetPower(bool on)
  {
  return NotSupported("GpsSetPower");
  }

telm_err_t modemdriver::GetUsbConfig(int& config)
  {
  return NotSupported("GetUsbConfig");
  }

telm_err_t modemdriver::SetUsbConfig(int config)
  {
  return NotSupported("SetUsbConfig");
  }

telm_err_t modemdriver::Reboot()
  {
  return NotSupported("Reboot");
  }
