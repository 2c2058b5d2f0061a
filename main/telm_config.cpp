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
static const char *TAG = "config";

#include <errno.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <string.h>
#include <sstream>
#include <dirent.h>
#include "telm_config.h"
#include "telm_command.h"
#include "telm_utils.h"

#define TELM_MAXVALSIZE 2500

TelmConfig MyConfig __attribute__ ((init_priority (1400)));

void config_list(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  if (!MyConfig.ismounted())
    {
    writer->puts("Error: config store not mounted");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }

  if (argc == 0)
    {
    // Show all parameters
    for (ConfigMap::iterator it=MyConfig.m_map.begin(); it!=MyConfig.m_map.end(); ++it)
      {
      writer->printf("%-20s %s\n", it->first.c_str(), it->second->GetTitle());
      }
    }
  else
    {
    // Show all instances for a particular parameter
    TelmConfigParam *p = MyConfig.CachedParam(argv[0]);
    if (p)
      {
      writer->printf("%s (%s %s)\n",argv[0],
        (p->Readable()?"readable":"protected"),
        (p->Writable()?"writeable":"read-only"));
      for (ConfigParamMap::iterator it=p->m_map.begin(); it!=p->m_map.end(); ++it)
        {
        if (p->Readable())
          { writer->printf("  %s: %s\n",it->first.c_str(), it->second.c_str()); }
        else
          { writer->printf("  %s\n",it->first.c_str()); }
        }
      }
    else
      {
      writer->printf("%s not found\n", argv[0]);
      writer->SetResult(TELM_ERR_NOT_FOUND);
      }
    }
  }

void config_set(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  TelmConfigParam *p = MyConfig.CachedParam(argv[0]);
  if (p==NULL)
    {
    writer->puts("Error: parameter not found");
    writer->SetResult(TELM_ERR_NOT_FOUND);
    return;
    }

  if (!p->Writable())
    {
    writer->puts("Error: parameter is not writeable");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }

  p->SetValue(argv[1],argv[2]);
  writer->puts("Parameter has been set.");
  }

void config_rm(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  TelmConfigParam *p = MyConfig.CachedParam(argv[0]);
  if (p==NULL)
    {
    writer->puts("Error: parameter not found");
    writer->SetResult(TELM_ERR_NOT_FOUND);
    return;
    }

  if (!p->Writable())
    {
    writer->puts("Error: parameter is not writeable");
    writer->SetResult(TELM_ERR_INVALID_STATE);
    return;
    }

  if (p->DeleteInstance(argv[1]))
    writer->puts("Parameter has been removed.");
  else
    {
    writer->puts("Error: instance not found");
    writer->SetResult(TELM_ERR_NOT_FOUND);
    }
  }

TelmConfig::TelmConfig()
  {
  TELM_LOGD(TAG, "Initialising CONFIG (1400)");

  m_mounted = false;

  TelmCommand* cmd_config = MyCommandApp.RegisterCommand("config","CONFIG framework");
  cmd_config->RegisterCommand("list","Show configuration parameters/instances",config_list,"[<param>]",0,1);
  cmd_config->RegisterCommand("set","Set parameter:instance=value",config_set,"<param> <instance> <value>",3,3);
  cmd_config->RegisterCommand("rm","Remove parameter:instance",config_rm,"<param> <instance>",2,2);

  RegisterParam("log", "Logging configuration", true, true);
  // Our instances:
  //   'level': default logging level (default: info)
  //   'level.<tag>': logging level for a component tag
  //   'syslog': log to syslog as well as stderr? yes/no (default: no)
  }

TelmConfig::~TelmConfig()
  {
  for (ConfigMap::iterator it=m_map.begin(); it!=m_map.end(); ++it)
    delete it->second;
  m_map.clear();
  }

telm_err_t TelmConfig::mount(std::string path /*=TELM_CONFIGPATH*/)
  {
  if (m_mounted)
    unmount();

  if (!path_exists(path))
    {
    TELM_LOGI(TAG, "Initialising CONFIG store in %s", path.c_str());
    if (mkpath(path) != 0)
      {
      TELM_LOGE(TAG, "Cannot create config store directory %s: %s", path.c_str(), strerror(errno));
      return TELM_ERR_IO;
      }
    }

  DIR *dir;
  struct dirent *dp;
  if ((dir = opendir(path.c_str())) == NULL)
    {
    TELM_LOGE(TAG, "Error: Cannot open config store directory %s", path.c_str());
    return TELM_ERR_IO;
    }
  m_path = path;
  m_mounted = true;
  while ((dp = readdir(dir)) != NULL)
    {
    if (dp->d_name[0] == '.' || endsWith(std::string(dp->d_name), ".tmp"))
      continue;
    // Register the param in case this was not already done
    if (CachedParam(dp->d_name) == NULL)
      RegisterParam(dp->d_name, "", true, true);
    }
  closedir(dir);

  // load params:
  for (ConfigMap::iterator it=m_map.begin(); it!=m_map.end(); ++it)
    {
    it->second->Load();
    }
  return TELM_OK;
  }

telm_err_t TelmConfig::unmount()
  {
  if (m_mounted)
    {
    m_mounted = false;
    for (ConfigMap::iterator it=m_map.begin(); it!=m_map.end(); ++it)
      {
      it->second->Unload();
      }
    m_path.clear();
    }
  return TELM_OK;
  }

bool TelmConfig::ismounted()
  {
  return m_mounted;
  }

void TelmConfig::RegisterParam(std::string name, std::string title, bool writable, bool readable)
  {
  auto k = m_map.find(name);
  if (k == m_map.end())
    {
    TelmConfigParam* p = new TelmConfigParam(name, title, writable, readable);
    m_map[name] = p;
    }
  else
    {
    if (!title.empty()) k->second->SetTitle(title);
    k->second->SetAccess(writable, readable);
    }
  }

void TelmConfig::DeregisterParam(std::string name)
  {
  auto k = m_map.find(name);
  if (k != m_map.end())
    {
    k->second->DeleteParam();
    delete k->second;
    m_map.erase(k);
    }
  }

void TelmConfig::SetParamValue(std::string param, std::string instance, std::string value)
  {
  TelmConfigParam *p = CachedParam(param);
  if (p)
    {
    p->SetValue(instance,value);
    }
  }

void TelmConfig::SetParamValueInt(std::string param, std::string instance, int value)
  {
  std::ostringstream ss;
  ss << value;
  SetParamValue(param, instance, std::string(ss.str()));
  }

void TelmConfig::SetParamValueBool(std::string param, std::string instance, bool value)
  {
  SetParamValue(param, instance, std::string(value ? "yes" : "no"));
  }

void TelmConfig::DeleteInstance(std::string param, std::string instance)
  {
  TelmConfigParam *p = CachedParam(param);
  if (p)
    {
    p->DeleteInstance(instance);
    }
  }

std::string TelmConfig::GetParamValue(std::string param, std::string instance, std::string defvalue)
  {
  TelmConfigParam *p = CachedParam(param);
  if (p && p->IsDefined(instance))
    {
    return p->GetValue(instance);
    }
  else
    {
    return defvalue;
    }
  }

int TelmConfig::GetParamValueInt(std::string param, std::string instance, int defvalue)
  {
  std::string value = GetParamValue(param,instance);
  if (value.length() == 0) return defvalue;
  return atoi(value.c_str());
  }

bool TelmConfig::GetParamValueBool(std::string param, std::string instance, bool defvalue)
  {
  std::string value = GetParamValue(param,instance);
  if (value.length() == 0) return defvalue;
  return strtobool(value);
  }

bool TelmConfig::IsDefined(std::string param, std::string instance)
  {
  TelmConfigParam *p = CachedParam(param);
  if (p == NULL) return false;
  return p->IsDefined(instance);
  }

TelmConfigParam* TelmConfig::CachedParam(std::string param)
  {
  if (!m_mounted) return NULL;

  auto k = m_map.find(param);
  if (k == m_map.end())
    return NULL;
  else
    return k->second;
  }

TelmConfigParam::TelmConfigParam(std::string name, std::string title, bool writable, bool readable)
  {
  m_name = name;
  m_title = title;
  m_writable = writable;
  m_readable = readable;
  m_loaded = false;

  if (MyConfig.ismounted())
    {
    LoadConfig();
    }
  }

TelmConfigParam::~TelmConfigParam()
  {
  }

void TelmConfigParam::LoadConfig()
  {
  if (m_loaded) return;  // Protected against loading more than once

  TelmMutexLock store_lock(&MyConfig.m_store_lock);

  std::string path(MyConfig.GetPath());
  path.append("/");
  path.append(m_name);
  FILE* f = fopen(path.c_str(), "r");
  if (f)
    {
    char* buf = new char[TELM_MAXVALSIZE];
    while (fgets(buf, TELM_MAXVALSIZE, f))
      {
      size_t len = strlen(buf);
      if (len > 0 && buf[len-1] == '\n')
        buf[len-1] = 0; // Remove trailing newline
      // read instance:
      char *p = index(buf,char(9));
      if (p == NULL) p = index(buf,' ');
      if (p)
        {
        *p = 0; // Null terminate the key
        p++;    // and point to the value
        m_map[std::string(buf)] = std::string(p);
        }
      }
    delete[] buf;
    fclose(f);
    }
  m_loaded = true;
  }

void TelmConfigParam::SetValue(std::string instance, std::string value)
  {
  if (m_map.find(instance) == m_map.end() || m_map[instance] != value)
    {
    m_map[instance] = value;
    RewriteConfig();
    }
  }

void TelmConfigParam::DeleteParam()
  {
  if (!MyConfig.ismounted()) return;

  TelmMutexLock store_lock(&MyConfig.m_store_lock);

  std::string path(MyConfig.GetPath());
  path.append("/");
  path.append(m_name);
  unlink(path.c_str());
  }

bool TelmConfigParam::DeleteInstance(std::string instance)
  {
  auto k = m_map.find(instance);
  if (k != m_map.end())
    {
    m_map.erase(k);
    RewriteConfig();
    return true;
    }
  return false;
  }

std::string TelmConfigParam::GetValue(std::string instance)
  {
  auto k = m_map.find(instance);
  if (k == m_map.end())
    return std::string("");
  else
    return k->second;
  }

bool TelmConfigParam::IsDefined(std::string instance)
  {
  if (instance.empty())
    return !m_map.empty();
  auto k = m_map.find(instance);
  if (k == m_map.end())
    return false;
  else
    return true;
  }

bool TelmConfigParam::Writable()
  {
  return m_writable;
  }

bool TelmConfigParam::Readable()
  {
  return m_readable;
  }

void TelmConfigParam::SetAccess(bool writable, bool readable)
  {
  m_writable = writable;
  m_readable = readable;
  }

std::string TelmConfigParam::GetName()
  {
  return m_name;
  }

void TelmConfigParam::RewriteConfig()
  {
  if (!MyConfig.ismounted()) return;

  TelmMutexLock store_lock(&MyConfig.m_store_lock);

  std::string path(MyConfig.GetPath());
  path.append("/");
  path.append(m_name);

  std::string content;
  for (ConfigParamMap::iterator it=m_map.begin(); it!=m_map.end(); ++it)
    {
    content.append(it->first);
    content.append("\t");
    content.append(it->second);
    content.append("\n");
    }
  int err = save_file(path, content);
  if (err)
    TELM_LOGE(TAG, "RewriteConfig: error writing '%s': %s", path.c_str(), strerror(err));
  }

void TelmConfigParam::Load()
  {
  if (!m_loaded) LoadConfig();
  }
