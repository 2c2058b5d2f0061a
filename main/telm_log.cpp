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

#include <stdarg.h>
#include <stdlib.h>
#include <string.h>
#include <syslog.h>
#include <time.h>
#include <map>
#include <mutex>

static std::mutex s_log_mutex;
static telm_log_level_t s_log_default = TELM_LOG_DEFAULT_LEVEL;
static bool s_log_syslog = false;

static uint64_t telm_log_monotonic_ms()
  {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint64_t)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
  }

// Function statics, as logging is used during static initialisation
static std::map<std::string, telm_log_level_t>& telm_log_levels()
  {
  static std::map<std::string, telm_log_level_t> levels;
  return levels;
  }

uint32_t telm_log_timestamp()
  {
  static const uint64_t start = telm_log_monotonic_ms();
  return (uint32_t)(telm_log_monotonic_ms() - start);
  }

void telm_log_level_set(const char* tag, telm_log_level_t level)
  {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  if (tag == NULL || strcmp(tag, "*") == 0)
    {
    s_log_default = level;
    telm_log_levels().clear();
    }
  else
    {
    telm_log_levels()[tag] = level;
    }
  }

telm_log_level_t telm_log_level_get(const char* tag)
  {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  std::map<std::string, telm_log_level_t>& levels = telm_log_levels();
  if (tag && !levels.empty())
    {
    auto it = levels.find(tag);
    if (it != levels.end())
      return it->second;
    }
  return s_log_default;
  }

void telm_log_syslog(bool enable, const char* ident)
  {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  if (enable && !s_log_syslog)
    openlog(ident, LOG_PID, LOG_DAEMON);
  else if (!enable && s_log_syslog)
    closelog();
  s_log_syslog = enable;
  }

telm_log_level_t telm_log_level_from_name(const std::string& name, telm_log_level_t defvalue)
  {
  if (name == "verbose")
    return TELM_LOG_VERBOSE;
  else if (name == "debug")
    return TELM_LOG_DEBUG;
  else if (name == "info")
    return TELM_LOG_INFO;
  else if (name == "warn")
    return TELM_LOG_WARN;
  else if (name == "error")
    return TELM_LOG_ERROR;
  else if (name == "none")
    return TELM_LOG_NONE;
  else
    return defvalue;
  }

const char* telm_log_level_name(telm_log_level_t level)
  {
  switch (level)
    {
    case TELM_LOG_NONE:    return "none";
    case TELM_LOG_ERROR:   return "error";
    case TELM_LOG_WARN:    return "warn";
    case TELM_LOG_INFO:    return "info";
    case TELM_LOG_DEBUG:   return "debug";
    case TELM_LOG_VERBOSE: return "verbose";
    default:               return "undefined";
    }
  }

void telm_log_write(telm_log_level_t level, const char* tag, const char* format, ...)
  {
  if (level == TELM_LOG_NONE || telm_log_level_get(tag) < level)
    return;

  char *buffer = NULL;
  va_list args;
  va_start(args, format);
  int len = vasprintf(&buffer, format, args);
  va_end(args);
  if (len < 0)
    return;

  std::lock_guard<std::mutex> lock(s_log_mutex);
  fputs(buffer, stderr);
  fflush(stderr);
  if (s_log_syslog)
    {
    int priority;
    switch (level)
      {
      case TELM_LOG_ERROR: priority = LOG_ERR; break;
      case TELM_LOG_WARN:  priority = LOG_WARNING; break;
      case TELM_LOG_INFO:  priority = LOG_INFO; break;
      default:             priority = LOG_DEBUG; break;
      }
    // syslog adds its own line framing
    if (len > 0 && buffer[len-1] == '\n')
      buffer[len-1] = 0;
    syslog(priority, "%s", buffer);
    }
  free(buffer);
  }
