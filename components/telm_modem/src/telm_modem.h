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


#ifndef __TELM_MODEM_H__
#define __TELM_MODEM_H__

#include <stdint.h>
#include <string>
#include <vector>
#include <map>
#include <functional>
#include "telm.h"
#include "telm_mutex.h"
#include "telm_utils.h"
#include "at_transport.h"
#include "gpsinfo.h"

#define MODEM_DEFAULT_DEVICE   "/dev/ttyUSB2"
#define MODEM_DEFAULT_BAUD     115200
#define MODEM_DEFAULT_DRIVER   "LE910C4"
#define MODEM_DEFAULT_TIMEOUT  10000

class TelmSemaphore;
class modemdriver;  // Forward declaration

typedef enum
  {
  AT_STATUS_OK = 0,
  AT_STATUS_ERROR,
  AT_STATUS_TIMEOUT,
  AT_STATUS_UNSOLICITED
  } at_status_t;

const char* AtStatusName(at_status_t status);

// Known unsolicited result codes (URC), by line prefix
bool AtIsUnsolicited(const std::string& line);

// Response prefix for a command: "AT+CSQ" -> "+CSQ:", "AT#ECMC?" -> "#ECMC:"
std::string AtResponsePrefix(const std::string& command);

class CommandRequest
  {
  public:
    CommandRequest(const std::string& command, const std::string& expect = "", int timeoutms = 0);

  public:
    const std::string m_command;    // without line terminator
    const std::string m_expect;     // expected response prefix, "" = status only
    const int m_timeoutms;          // 0 = modem default
  };

class CommandResponse
  {
  public:
    CommandResponse();

  public:
    void Clear();
    bool HasPayload() const { return !m_payload.empty(); }
    std::string Payload(size_t index = 0) const;

  public:
    at_status_t m_status;
    int m_cause;                            // +CME/+CMS ERROR code, -1 = none
    std::vector<std::string> m_lines;       // response lines, terminal and echo excluded
    std::vector<std::string> m_urcs;        // unsolicited lines seen meanwhile
    std::vector<std::string> m_payload;     // expected lines, prefix stripped
  };

typedef std::function<bool(int)> TelmDelayFunc_t;

class modem
  {
  public:
    modem(AtTransport* transport);
    ~modem();

  public:
    void SetDevice(const std::string& device, int baud = 0);
    std::string GetDevice();
    int GetBaud();
    telm_err_t Open();
    void Close();
    bool IsOpen();
    void SetCancel(TelmSemaphore* cancel);
    void SetDelayFunction(TelmDelayFunc_t delay);
    bool Delay(int ms);

  public:
    telm_err_t Execute(const CommandRequest& request, CommandResponse& response);
    telm_err_t PollUnsolicited(int timeoutms, CommandResponse& response);

  public:
    void SetCellularModemDriver(const char* ModelType);
    modemdriver* GetDriver() { return m_driver; }

  protected:
    telm_err_t ReadLine(int64_t deadline, std::string& line);

  public:
    TelmMutex m_cmd_mutex;
    std::string m_model;
    modemdriver* m_driver;

  protected:
    AtTransport* m_transport;
    TelmSemaphore* m_cancel;
    TelmDelayFunc_t m_delay;
    std::string m_device;
    int m_baud;
  };

class modemdriver
  {
  public:
    modemdriver();
    virtual ~modemdriver();

  public:
    virtual const char* GetModel();
    virtual const char* GetName();
    void SetModem(modem* m) { m_modem = m; }

  public:
    // Generic 3GPP TS 27.007 commands:
    virtual telm_err_t Sync();
    virtual telm_err_t GetIccid(std::string& iccid);
    virtual telm_err_t GetImei(std::string& imei);
    virtual telm_err_t QueryIdentity(std::string& identity);
    virtual telm_err_t GetSignalQuality(double& quality);
    virtual telm_err_t GetClock(int64_t& utc);
    virtual telm_err_t SetClock(int64_t utc);
    virtual telm_err_t GetPdpContext(std::string& type, std::string& apn);
    virtual telm_err_t SetPdpContext(const std::string& type, const std::string& apn);
    virtual telm_err_t GpsQuery(GpsFix& fix);

  public:
    // Vendor specific, not supported by the generic driver:
    virtual telm_err_t EcmStart();
    virtual telm_err_t EcmStop();
    virtual telm_err_t GetEcmStatus(bool& up);
    virtual telm_err_t GpsGetPower(bool& on);
    virtual telm_err_t GpsSetPower(bool on);
    virtual telm_err_t GetUsbConfig(int& config);
    virtual telm_err_t SetUsbConfig(int config);
    virtual telm_err_t Reboot();

  protected:
    telm_err_t Command(const std::string& command, const std::string& expect,
                       CommandResponse& response, int timeoutms = 0);
    telm_err_t CommandOk(const std::string& command, int timeoutms = 0);
    telm_err_t CommandValue(const std::string& command, std::string& value, int timeoutms = 0);
    telm_err_t NotSupported(const char* operation);

  protected:
    modem* m_modem;
  };

template<typename Type> modemdriver* CreateCellularModemDriver()
  {
  return new Type;
  }

class TelmCellularModemFactory
  {
  public:
    TelmCellularModemFactory();
    ~TelmCellularModemFactory();

  public:
    typedef modemdriver* (*FactoryFuncPtr)();
    typedef struct
      {
      FactoryFuncPtr construct;
      const char* name;
      } modemdriver_t;
    typedef std::map<const char*, modemdriver_t, CmpStrOp> map_modemdriver_t;

    map_modemdriver_t m_drivermap;

  public:
    template<typename Type>
    short RegisterCellularModemDriver(const char* ModelType, const char* ModelName = "")
      {
      FactoryFuncPtr function = &CreateCellularModemDriver<Type>;
      m_drivermap.insert(std::make_pair(ModelType, (modemdriver_t){ function, ModelName }));
      return 0;
      };
    modemdriver* NewCellularModemDriver(const char* ModelType);
  };

class TelmWriter;

// Command helpers: open and sync MyModem on demand, report a failure
bool ModemCommandReady(TelmWriter* writer);
void CommandError(TelmWriter* writer, const char* what, telm_err_t err);
std::string FormatUtc(int64_t utc);

extern TelmCellularModemFactory MyCellularModemFactory;
extern modem* MyModem;

#endif //#ifndef __TELM_MODEM_H__
