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
static const char *TAG = "modem";

#include <ctype.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include "telm_modem.h"
#include "telm_command.h"
#include "telm_config.h"
#include "telm_semaphore.h"
#include "telm_usb.h"

////////////////////////////////////////////////////////////////////////////////
// Global convenience variables

modem* MyModem = NULL;

static const char* const s_urc_prefixes[] =
  {
  "+CREG:", "+CGREG:", "+CEREG:", "RING", "NO CARRIER", "+CMTI:",
  "+CTZV:", "#ECMEV", "+CIEV:", "SRING", "$G",
  NULL
  };

////////////////////////////////////////////////////////////////////////////////
// General utility functions

const char* AtStatusName(at_status_t status)
  {
  switch (status)
    {
    case AT_STATUS_OK:            return "OK";
    case AT_STATUS_ERROR:         return "ERROR";
    case AT_STATUS_TIMEOUT:       return "TIMEOUT";
    case AT_STATUS_UNSOLICITED:   return "UNSOLICITED";
    default:                      return "Undefined";
    }
  }

bool AtIsUnsolicited(const std::string& line)
  {
  for (int k=0; s_urc_prefixes[k] != NULL; k++)
    {
    if (startsWith(line, std::string(s_urc_prefixes[k])))
      return true;
    }
  return false;
  }

std::string AtResponsePrefix(const std::string& command)
  {
  std::string prefix = command;
  if (prefix.length() >= 2 && toupper(prefix[0]) == 'A' && toupper(prefix[1]) == 'T')
    prefix = prefix.substr(2);
  size_t end = prefix.find_first_of("?=");
  if (end != std::string::npos)
    prefix = prefix.substr(0, end);
  if (prefix.empty())
    return prefix;
  return prefix + ":";
  }

static bool parse_cause(const std::string& line, int& cause)
  {
  static const char* const errors[] = { "+CME ERROR:", "+CMS ERROR:" };
  for (int k=0; k<2; k++)
    {
    if (startsWith(line, std::string(errors[k])))
      {
      std::string code = trim(line.substr(strlen(errors[k])));
      if (!code.empty() && isdigit((unsigned char)code[0]))
        cause = atoi(code.c_str());
      else
        cause = -1;
      return true;
      }
    }
  return false;
  }

CommandRequest::CommandRequest(const std::string& command, const std::string& expect /*=""*/, int timeoutms /*=0*/)
  : m_command(command), m_expect(expect), m_timeoutms(timeoutms)
  {
  }

CommandResponse::CommandResponse()
  {
  Clear();
  }

void CommandResponse::Clear()
  {
  m_status = AT_STATUS_TIMEOUT;
  m_cause = -1;
  m_lines.clear();
  m_urcs.clear();
  m_payload.clear();
  }

std::string CommandResponse::Payload(size_t index /*=0*/) const
  {
  if (index >= m_payload.size())
    return std::string();
  return m_payload[index];
  }

////////////////////////////////////////////////////////////////////////////////
// modem

modem::modem(AtTransport* transport)
  {
  m_transport = transport;
  m_driver = NULL;
  m_cancel = NULL;
  m_baud = 0;
  }

modem::~modem()
  {
  if (m_driver)
    {
    delete m_driver;
    m_driver = NULL;
    }
  if (MyModem == this)
    MyModem = NULL;
  }

void modem::SetDevice(const std::string& device, int baud /*=0*/)
  {
  m_device = device;
  m_baud = baud;
  }

std::string modem::GetDevice()
  {
  if (!m_device.empty())
    return m_device;
  return MyConfig.GetParamValue("modem", "device", MODEM_DEFAULT_DEVICE);
  }

int modem::GetBaud()
  {
  if (m_baud > 0)
    return m_baud;
  return MyConfig.GetParamValueInt("modem", "baud", MODEM_DEFAULT_BAUD);
  }

telm_err_t modem::Open()
  {
  if (m_transport->IsOpen())
    return TELM_OK;
  std::string device = GetDevice();
  int baud = GetBaud();
  TELM_LOGI(TAG, "Opening %s (%d baud)", device.c_str(), baud);
  return m_transport->Open(device, baud);
  }

void modem::Close()
  {
  m_transport->Close();
  }

bool modem::IsOpen()
  {
  return m_transport->IsOpen();
  }

void modem::SetCancel(TelmSemaphore* cancel)
  {
  m_cancel = cancel;
  m_transport->SetCancel(cancel);
  }

void modem::SetDelayFunction(TelmDelayFunc_t delay)
  {
  m_delay = delay;
  }

bool modem::Delay(int ms)
  {
  if (m_delay)
    return m_delay(ms);
  return TelmDelay(ms, m_cancel);
  }

void modem::SetCellularModemDriver(const char* ModelType)
  {
  if (m_driver)
    {
    TELM_LOGD(TAG, "Remove old '%s' modem driver", m_driver->GetModel());
    delete m_driver;
    m_driver = NULL;
    }

  m_driver = MyCellularModemFactory.NewCellularModemDriver(ModelType);
  if (m_driver == NULL)
    {
    TELM_LOGE(TAG, "Unknown modem driver '%s', using '%s'", ModelType, MODEM_DEFAULT_DRIVER);
    m_driver = MyCellularModemFactory.NewCellularModemDriver(MODEM_DEFAULT_DRIVER);
    }
  if (m_driver == NULL)
    {
    m_driver = new modemdriver();
    }
  TELM_LOGD(TAG, "Set modem driver to '%s'", m_driver->GetModel());
  m_driver->SetModem(this);
  m_model = std::string(m_driver->GetModel());
  }

telm_err_t modem::ReadLine(int64_t deadline, std::string& line)
  {
  int64_t remain = deadline - telm_monotonic_ms();
  if (remain <= 0)
    return TELM_ERR_TIMEOUT;
  std::string raw;
  telm_err_t err = m_transport->ReadUntil("\n", (int)remain, raw);
  if (err == TELM_OK)
    line = trim(raw);
  return err;
  }

telm_err_t modem::Execute(const CommandRequest& request, CommandResponse& response)
  {
  response.Clear();
  int timeoutms = (request.m_timeoutms > 0)
    ? request.m_timeoutms
    : MyConfig.GetParamValueInt("modem", "timeout.cmd", MODEM_DEFAULT_TIMEOUT);

  TelmMutexLock lock(&m_cmd_mutex, timeoutms);
  if (!lock.IsLocked())
    {
    TELM_LOGW(TAG, "Execute: command channel busy, '%s' not sent", request.m_command.c_str());
    return TELM_ERR_TIMEOUT;
    }
  if (!m_transport->IsOpen())
    return TELM_ERR_IO;

  m_transport->Drain();
  TELM_LOGD(TAG, "tx: %s", request.m_command.c_str());
  telm_err_t err = m_transport->Send(request.m_command + "\r");
  if (err != TELM_OK)
    {
    TELM_LOGE(TAG, "Execute: send '%s' failed: %s", request.m_command.c_str(), TelmErrName(err));
    return err;
    }

  int64_t deadline = telm_monotonic_ms() + timeoutms;
  bool echo = false;
  std::string line;
  while (true)
    {
    err = ReadLine(deadline, line);
    if (err != TELM_OK)
      {
      response.m_status = AT_STATUS_TIMEOUT;
      response.m_payload.clear();
      if (err == TELM_ERR_TIMEOUT)
        TELM_LOGD(TAG, "rx: %s -> timeout after %d ms", request.m_command.c_str(), timeoutms);
      else
        TELM_LOGD(TAG, "rx: %s -> %s", request.m_command.c_str(), TelmErrName(err));
      return err;
      }
    if (line.empty())
      continue;
    TELM_LOGV(TAG, "rx: %s", line.c_str());

    if (!echo && line == request.m_command)
      {
      echo = true;
      continue;
      }
    if (line == "OK")
      {
      response.m_status = AT_STATUS_OK;
      break;
      }
    if (line == "ERROR")
      {
      response.m_status = AT_STATUS_ERROR;
      break;
      }
    if (parse_cause(line, response.m_cause))
      {
      response.m_status = AT_STATUS_ERROR;
      break;
      }
    if (!request.m_expect.empty() && startsWith(line, request.m_expect))
      {
      response.m_payload.push_back(trim(line.substr(request.m_expect.length())));
      response.m_lines.push_back(line);
      }
    else if (AtIsUnsolicited(line))
      {
      TELM_LOGD(TAG, "urc: %s", line.c_str());
      response.m_urcs.push_back(line);
      }
    else
      {
      response.m_lines.push_back(line);
      }
    }

  if (response.m_status == AT_STATUS_ERROR)
    {
    TELM_LOGD(TAG, "rx: %s -> ERROR (cause %d)", request.m_command.c_str(), response.m_cause);
    return TELM_ERR_DEVICE;
    }
  if (!request.m_expect.empty() && response.m_payload.empty())
    {
    TELM_LOGD(TAG, "rx: %s -> OK without '%s' response", request.m_command.c_str(), request.m_expect.c_str());
    return TELM_ERR_PROTOCOL;
    }
  TELM_LOGD(TAG, "rx: %s -> OK", request.m_command.c_str());
  return TELM_OK;
  }

telm_err_t modem::PollUnsolicited(int timeoutms, CommandResponse& response)
  {
  response.Clear();
  TelmMutexLock lock(&m_cmd_mutex, timeoutms);
  if (!lock.IsLocked())
    return TELM_ERR_TIMEOUT;
  if (!m_transport->IsOpen())
    return TELM_ERR_IO;

  int64_t deadline = telm_monotonic_ms() + timeoutms;
  std::string line;
  while (true)
    {
    telm_err_t err = ReadLine(deadline, line);
    if (err == TELM_ERR_TIMEOUT)
      break;
    if (err != TELM_OK)
      return err;
    if (line.empty())
      continue;
    TELM_LOGD(TAG, "urc: %s", line.c_str());
    response.m_lines.push_back(line);
    response.m_urcs.push_back(line);
    }
  response.m_status = AT_STATUS_UNSOLICITED;
  return TELM_OK;
  }

////////////////////////////////////////////////////////////////////////////////
// Command helpers

bool ModemCommandReady(TelmWriter* writer)
  {
  if (MyModem == NULL)
    {
    writer->puts("ERROR: no modem configured");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return false;
    }
  if (MyModem->IsOpen())
    return true;

  telm_err_t err = MyModem->Open();
  if (err == TELM_OK)
    err = MyModem->GetDriver()->Sync();
  if (err != TELM_OK)
    {
    writer->printf("ERROR: modem %s not available (%s)\n", MyModem->GetDevice().c_str(), TelmErrName(err));
    writer->SetResult(err);
    MyModem->Close();
    return false;
    }
  return true;
  }

void CommandError(TelmWriter* writer, const char* what, telm_err_t err)
  {
  writer->printf("ERROR: %s failed (%s)\n", what, TelmErrName(err));
  writer->SetResult(err);
  }

std::string FormatUtc(int64_t utc)
  {
  time_t t = (time_t)utc;
  struct tm tm;
  char buf[32];
  gmtime_r(&t, &tm);
  strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
  return std::string(buf);
  }

////////////////////////////////////////////////////////////////////////////////
// Modem commands

void modem_cmd(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ModemCommandReady(writer)) return;

  std::string msg;
  for (int k=0; k<argc; k++)
    {
    if (k>0) msg.append(" ");
    msg.append(argv[k]);
    }

  CommandResponse response;
  telm_err_t err = MyModem->Execute(CommandRequest(msg), response);
  for (auto& line : response.m_lines)
    writer->puts(line.c_str());
  if (verbosity >= COMMAND_RESULT_NORMAL)
    {
    for (auto& urc : response.m_urcs)
      writer->printf("[URC] %s\n", urc.c_str());
    }
  switch (err)
    {
    case TELM_OK:
      writer->puts("OK");
      break;
    case TELM_ERR_DEVICE:
      if (response.m_cause >= 0)
        writer->printf("ERROR (cause %d)\n", response.m_cause);
      else
        writer->puts("ERROR");
      writer->SetResult(err);
      break;
    case TELM_ERR_TIMEOUT:
      writer->puts("[TIMEOUT]");
      writer->SetResult(err);
      break;
    default:
      CommandError(writer, "command", err);
      break;
    }
  }

void modem_urc(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  int seconds = (argc > 0) ? atoi(argv[0]) : 5;
  if (seconds < 1)
    {
    writer->puts("ERROR: listen time must be at least 1 second");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }
  if (!ModemCommandReady(writer)) return;

  CommandResponse response;
  telm_err_t err = MyModem->PollUnsolicited(seconds * 1000, response);
  if (err != TELM_OK)
    return CommandError(writer, "listening", err);
  for (auto& urc : response.m_urcs)
    writer->puts(urc.c_str());
  if (verbosity >= COMMAND_RESULT_NORMAL)
    writer->printf("[%s] %zu line(s) in %d s\n", AtStatusName(response.m_status),
      response.m_urcs.size(), seconds);
  }

void modem_info(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ModemCommandReady(writer)) return;
  modemdriver* driver = MyModem->GetDriver();
  telm_err_t err;

  writer->printf("Model:     %s (%s)\n", driver->GetModel(), driver->GetName());
  writer->printf("Device:    %s (%d baud)\n", MyModem->GetDevice().c_str(), MyModem->GetBaud());

  std::string value;
  if ((err = driver->GetIccid(value)) == TELM_OK)
    writer->printf("ICCID:     %s\n", value.c_str());
  else
    writer->printf("ICCID:     n/a (%s)\n", TelmErrName(err));
  if (err == TELM_ERR_IO) goto failed;

  if ((err = driver->GetImei(value)) == TELM_OK)
    writer->printf("IMEI:      %s\n", value.c_str());
  else
    writer->printf("IMEI:      n/a (%s)\n", TelmErrName(err));
  if (err == TELM_ERR_IO) goto failed;

  {
  double quality;
  if ((err = driver->GetSignalQuality(quality)) == TELM_OK)
    writer->printf("Signal:    %.2f\n", quality);
  else
    writer->printf("Signal:    unknown (%s)\n", TelmErrName(err));
  if (err == TELM_ERR_IO) goto failed;
  }

  {
  int64_t utc;
  if ((err = driver->GetClock(utc)) == TELM_OK)
    writer->printf("Clock:     %s\n", FormatUtc(utc).c_str());
  else
    writer->printf("Clock:     n/a (%s)\n", TelmErrName(err));
  if (err == TELM_ERR_IO) goto failed;
  }

  {
  int usbcfg;
  if ((err = driver->GetUsbConfig(usbcfg)) == TELM_OK)
    writer->printf("USB cfg:   %d\n", usbcfg);
  else
    writer->printf("USB cfg:   n/a (%s)\n", TelmErrName(err));
  if (err == TELM_ERR_IO) goto failed;
  }

  {
  std::string type, apn;
  if ((err = driver->GetPdpContext(type, apn)) == TELM_OK)
    writer->printf("PDP ctx:   %s \"%s\"\n", type.c_str(), apn.c_str());
  else
    writer->printf("PDP ctx:   n/a (%s)\n", TelmErrName(err));
  if (err == TELM_ERR_IO) goto failed;
  }

  {
  bool up;
  if ((err = driver->GetEcmStatus(up)) == TELM_OK)
    writer->printf("ECM:       %s\n", up ? "up" : "down");
  else
    writer->printf("ECM:       n/a (%s)\n", TelmErrName(err));
  if (err == TELM_ERR_IO) goto failed;
  }
  return;

failed:
  CommandError(writer, "modem info", err);
  }

void modem_setup(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ModemCommandReady(writer)) return;
  modemdriver* driver = MyModem->GetDriver();
  bool reboot = false;
  telm_err_t err;

  int usbcfg = MyConfig.GetParamValueInt("modem", "usbcfg", 4);
  int current;
  if ((err = driver->GetUsbConfig(current)) != TELM_OK)
    return CommandError(writer, "reading USB configuration", err);
  if (current != usbcfg)
    {
    writer->printf("Setting USB configuration %d (was %d), modem will reboot...\n", usbcfg, current);
    if ((err = driver->SetUsbConfig(usbcfg)) != TELM_OK)
      return CommandError(writer, "setting USB configuration", err);
    }
  else if (verbosity >= COMMAND_RESULT_NORMAL)
    {
    writer->printf("USB configuration %d ok\n", usbcfg);
    }

  std::string type = MyConfig.GetParamValue("modem", "apn.type", "IP");
  std::string apn = MyConfig.GetParamValue("modem", "apn", "super");
  std::string curtype, curapn;
  err = driver->GetPdpContext(curtype, curapn);
  if (err != TELM_OK && err != TELM_ERR_NOT_FOUND)
    return CommandError(writer, "reading PDP context", err);
  if (err == TELM_ERR_NOT_FOUND || curtype != type || curapn != apn)
    {
    writer->printf("Setting PDP context 1 to %s \"%s\"\n", type.c_str(), apn.c_str());
    if ((err = driver->SetPdpContext(type, apn)) != TELM_OK)
      return CommandError(writer, "setting PDP context", err);
    reboot = true;
    }
  else if (verbosity >= COMMAND_RESULT_NORMAL)
    {
    writer->printf("PDP context %s \"%s\" ok\n", type.c_str(), apn.c_str());
    }

  if (reboot)
    {
    writer->puts("Rebooting modem, expect a long pause...");
    if ((err = driver->Reboot()) != TELM_OK)
      return CommandError(writer, "modem reboot", err);
    }
  writer->puts("Modem setup complete");
  }

void modem_reboot(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!ModemCommandReady(writer)) return;
  writer->puts("Rebooting modem, expect a long pause...");
  telm_err_t err = MyModem->GetDriver()->Reboot();
  if (err != TELM_OK)
    return CommandError(writer, "modem reboot", err);
  writer->puts("Modem is back");
  }

void modem_detect(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  std::vector<UsbDevice> devices = UsbFindDevices();
  if (devices.empty())
    {
    writer->puts("No Telit modem found on USB");
    writer->SetResult(TELM_ERR_NOT_FOUND);
    return;
    }
  for (auto& dev : devices)
    {
    writer->printf("%s: %s:%s %s\n", dev.name.c_str(), dev.vendor.c_str(),
      dev.product.c_str(), dev.manufacturer.c_str());
    }
  }

void modem_drivers(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  writer->puts("Type       Name");
  for (TelmCellularModemFactory::map_modemdriver_t::iterator k=MyCellularModemFactory.m_drivermap.begin();
       k!=MyCellularModemFactory.m_drivermap.end();
       ++k)
    {
    writer->printf("%-10.10s %s\n",k->first,k->second.name);
    }
  }

////////////////////////////////////////////////////////////////////////////////
// Modem Initialisation and Registrations

class CellularModemInit
  {
  public: CellularModemInit();
} MyModemInit  __attribute__ ((init_priority (4600)));

CellularModemInit::CellularModemInit()
  {
  TELM_LOGD(TAG, "Initialising MODEM (4600)");

  TelmCommand* cmd_modem = MyCommandApp.RegisterCommand("modem","CELLULAR MODEM framework");
  cmd_modem->RegisterCommand("cmd","Send CELLULAR MODEM AT command",modem_cmd, "<command>", 1, INT_MAX);
  cmd_modem->RegisterCommand("urc","Listen for unsolicited result codes",modem_urc,"[<seconds>]",0,1);
  cmd_modem->RegisterCommand("info","Show CELLULAR MODEM identity and status",modem_info);
  cmd_modem->RegisterCommand("setup","Apply USB configuration and PDP context",modem_setup);
  cmd_modem->RegisterCommand("reboot","Reboot CELLULAR MODEM",modem_reboot);
  cmd_modem->RegisterCommand("detect","Look for the CELLULAR MODEM on USB",modem_detect);
  cmd_modem->RegisterCommand("drivers","Show supported CELLULAR MODEM drivers",modem_drivers);

  MyConfig.RegisterParam("modem", "Modem Configuration", true, true);
  // Our instances:
  //   'device': serial device of the AT command port (default: /dev/ttyUSB2)
  //   'baud': serial speed (default: 115200)
  //   'driver': Driver to use (default: LE910C4)
  //   'timeout.cmd': AT command response timeout in ms (default: 10000)
  //   'sync.tries': 'AT' attempts to find the command interpreter (default: 10)
  //   'sync.delay': ms between 'AT' attempts (default: 500)
  //   'reboot.wait': seconds to wait for the modem to come back (default: 30)
  //   'apn.type': PDP type for context 1 (default: IP)
  //   'apn': GSM APN for context 1 (default: super)
  //   'usbcfg': Telit USB configuration (default: 4)
  //   'usb.wait': seconds between USB presence checks of telmd --wait-usb (default: 10)
  }
