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


#ifndef __TELM_CONFIG_H__
#define __TELM_CONFIG_H__

#include <string>
#include <map>
#include "telm.h"
#include "telm_mutex.h"

class TelmWriter;
typedef std::map<std::string, std::string> ConfigParamMap;

class TelmConfigParam
  {
  public:
    TelmConfigParam(std::string name, std::string title, bool writable, bool readable);
    ~TelmConfigParam();

  public:
    void SetValue(std::string instance, std::string value);
    void DeleteParam();
    bool DeleteInstance(std::string instance);
    std::string GetValue(std::string instance);
    bool IsDefined(std::string instance);
    bool Writable();
    bool Readable();
    void SetAccess(bool writable, bool readable);
    std::string GetName();
    const char* GetTitle() { return m_title.c_str(); }
    void SetTitle(std::string title) { m_title = title; }
    void Load();
    void Unload() { m_map.clear(); m_loaded = false; }
    const ConfigParamMap& GetMap() { return m_map; }

  protected:
    void RewriteConfig();
    void LoadConfig();

  protected:
    std::string m_name;
    std::string m_title;
    bool m_writable;
    bool m_readable;
    bool m_loaded;

  public:
    ConfigParamMap m_map;
  };

typedef std::map<std::string, TelmConfigParam*> ConfigMap;

class TelmConfig
  {
  public:
    TelmConfig();
    ~TelmConfig();

  public:
    void RegisterParam(std::string name, std::string title, bool writable=true, bool readable=true);
    void DeregisterParam(std::string name);

  public:
    void SetParamValue(std::string param, std::string instance, std::string value);
    void SetParamValueInt(std::string param, std::string instance, int value);
    void SetParamValueBool(std::string param, std::string instance, bool value);
    void DeleteInstance(std::string param, std::string instance);
    std::string GetParamValue(std::string param, std::string instance, std::string defvalue = "");
    int GetParamValueInt(std::string param, std::string instance, int defvalue = 0);
    bool GetParamValueBool(std::string param, std::string instance, bool defvalue = false);
    bool IsDefined(std::string param, std::string instance);
    TelmConfigParam* CachedParam(std::string param);

  public:
    telm_err_t mount(std::string path = TELM_CONFIGPATH);
    telm_err_t unmount();
    bool ismounted();
    std::string GetPath() { return m_path; }

  protected:
    bool m_mounted;
    std::string m_path;

  public:
    ConfigMap m_map;
    TelmMutex m_store_lock;
  };

extern TelmConfig MyConfig;

#endif //#ifndef __TELM_CONFIG_H__
