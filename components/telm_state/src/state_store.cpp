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
static const char *TAG = "state";

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/file.h>
#include <sstream>
#include "state_store.h"
#include "telm_utils.h"
#include "telm_config.h"

StateStore* MyStateStore = NULL;

StateStore::StateStore()
  {
  }

StateStore::~StateStore()
  {
  }

double StateStore::GetDouble(const std::string& key, double defvalue /*=0*/)
  {
  std::string value = Get(key);
  if (value.empty()) return defvalue;
  return atof(value.c_str());
  }

telm_err_t StateStore::SetDouble(const std::string& key, double value, int precision /*=6*/)
  {
  return Set(key, FormatDouble(value, precision));
  }

std::string StateStore::FormatDouble(double value, int precision)
  {
  char buf[64];
  snprintf(buf, sizeof(buf), "%.*f", precision, value);
  return buf;
  }

FileStateStore::FileStateStore(const std::string& dir /*=STATE_DEFAULT_PATH*/)
  {
  m_file = dir + "/state";
  }

FileStateStore::~FileStateStore()
  {
  }

// Exclusive flock of <state>.lock for the lifetime of the object
class StateFileLock
  {
  public:
    StateFileLock(const std::string& file)
      {
      std::string path = file + ".lock";
      size_t slash = path.rfind('/');
      if (slash != std::string::npos && slash > 0)
        mkpath(path.substr(0, slash));
      m_fd = open(path.c_str(), O_RDWR|O_CREAT|O_CLOEXEC, 0644);
      if (m_fd < 0)
        {
        TELM_LOGE(TAG, "Cannot open %s: %s", path.c_str(), strerror(errno));
        return;
        }
      int err;
      do
        {
        err = flock(m_fd, LOCK_EX);
        } while (err != 0 && errno == EINTR);
      if (err != 0)
        {
        TELM_LOGE(TAG, "Cannot lock %s: %s", path.c_str(), strerror(errno));
        close(m_fd);
        m_fd = -1;
        }
      }
    ~StateFileLock()
      {
      if (m_fd >= 0)
        close(m_fd);
      }
    bool IsLocked() { return m_fd >= 0; }

  private:
    int m_fd;
  };

static bool valid_entry(const std::string& key, const std::string& value)
  {
  return !key.empty() && key.find_first_of("\t\n") == std::string::npos
    && value.find('\n') == std::string::npos;
  }

telm_err_t FileStateStore::Load()
  {
  TelmMutexLock lock(&m_lock);
  return LoadLocked();
  }

telm_err_t FileStateStore::LoadLocked()
  {
  std::string content;
  int err = load_file(m_file, content);
  if (err == ENOENT)
    {
    m_map.clear();
    return TELM_OK;
    }
  if (err != 0)
    {
    TELM_LOGE(TAG, "Cannot read %s: %s", m_file.c_str(), strerror(err));
    return TELM_ERR_IO;
    }

  m_map.clear();
  std::istringstream lines(content);
  std::string line;
  while (std::getline(lines, line))
    {
    size_t tab = line.find('\t');
    if (tab == std::string::npos || tab == 0)
      continue;
    m_map[line.substr(0, tab)] = line.substr(tab+1);
    }
  TELM_LOGV(TAG, "Loaded %zu keys from %s", m_map.size(), m_file.c_str());
  return TELM_OK;
  }

telm_err_t FileStateStore::Rewrite()
  {
  std::string content;
  for (StateMap::iterator it=m_map.begin(); it!=m_map.end(); ++it)
    {
    content.append(it->first);
    content.append("\t");
    content.append(it->second);
    content.append("\n");
    }
  int err = save_file(m_file, content);
  if (err != 0)
    {
    TELM_LOGE(TAG, "Cannot write %s: %s", m_file.c_str(), strerror(err));
    return TELM_ERR_IO;
    }
  return TELM_OK;
  }

std::string FileStateStore::Get(const std::string& key, const std::string& defvalue /*=""*/)
  {
  TelmMutexLock lock(&m_lock);
  auto k = m_map.find(key);
  if (k == m_map.end())
    return defvalue;
  return k->second;
  }

telm_err_t FileStateStore::Set(const std::string& key, const std::string& value)
  {
  StateMap values;
  values[key] = value;
  return SetMany(values);
  }

bool FileStateStore::IsDefined(const std::string& key)
  {
  TelmMutexLock lock(&m_lock);
  return (m_map.find(key) != m_map.end());
  }

telm_err_t FileStateStore::Delete(const std::string& key)
  {
  TelmMutexLock lock(&m_lock);
  StateFileLock filelock(m_file);
  if (!filelock.IsLocked())
    return TELM_ERR_IO;
  telm_err_t err = LoadLocked();
  if (err != TELM_OK)
    return err;

  auto k = m_map.find(key);
  if (k == m_map.end())
    return TELM_ERR_NOT_FOUND;
  std::string previous = k->second;
  m_map.erase(k);
  err = Rewrite();
  if (err != TELM_OK)
    m_map[key] = previous;
  return err;
  }

telm_err_t FileStateStore::SetMany(const StateMap& values, const std::vector<std::string>& removals)
  {
  for (auto& v : values)
    {
    if (!valid_entry(v.first, v.second))
      return TELM_ERR_INVALID_STATE;
    }

  TelmMutexLock lock(&m_lock);
  StateFileLock filelock(m_file);
  if (!filelock.IsLocked())
    return TELM_ERR_IO;
  telm_err_t err = LoadLocked();
  if (err != TELM_OK)
    return err;

  StateMap previous = m_map;
  for (auto& v : values)
    m_map[v.first] = v.second;
  for (auto& key : removals)
    m_map.erase(key);
  if (m_map == previous)
    return TELM_OK;

  err = Rewrite();
  if (err != TELM_OK)
    {
    // keep memory and disk in step
    m_map = previous;
    return err;
    }
  for (auto& v : values)
    TELM_LOGV(TAG, "%s = %s", v.first.c_str(), v.second.c_str());
  return TELM_OK;
  }

////////////////////////////////////////////////////////////////////////////////
// State Initialisation and Registrations

class StateStoreInit
  {
  public: StateStoreInit();
} MyStateStoreInit  __attribute__ ((init_priority (4500)));

StateStoreInit::StateStoreInit()
  {
  TELM_LOGD(TAG, "Initialising STATE (4500)");

  MyConfig.RegisterParam("store", "State store", true, true);
  // Our instances:
  //   'path': directory of the shared state file (default: /run/telm/state)
  }
