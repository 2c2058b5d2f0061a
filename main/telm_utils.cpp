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
static const char *TAG = "utils";

#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <fstream>
#include <sstream>
#include "telm_utils.h"

std::string trim(const std::string& text)
  {
  size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return std::string();
  size_t last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
  }

std::string strip_quotes(const std::string& text)
  {
  if (text.length() >= 2 && text.front() == '"' && text.back() == '"')
    return text.substr(1, text.length() - 2);
  return text;
  }

bool parse_int(const char* text, int minvalue, int& value)
  {
  if (text == NULL || *text == 0)
    return false;
  char* end;
  errno = 0;
  long result = strtol(text, &end, 10);
  if (errno != 0 || *end != 0 || result < minvalue || result > INT_MAX)
    return false;
  value = (int)result;
  return true;
  }

std::vector<std::string> split(const std::string& text, char separator)
  {
  std::vector<std::string> fields;
  size_t pre = 0, pos;
  while ((pos = text.find(separator, pre)) != std::string::npos)
    {
    fields.push_back(text.substr(pre, pos - pre));
    pre = pos + 1;
    }
  fields.push_back(text.substr(pre));
  return fields;
  }

int mkpath(std::string path, mode_t mode /*=0755*/)
  {
  size_t pre = 0, pos;
  std::string dir;
  int mdret;

  if (!endsWith(path, '/'))
    {
    // force trailing / so we can handle everything in loop
    path.append("/");
    }

  while ((pos = path.find_first_of('/', pre)) != std::string::npos)
    {
    dir = path.substr(0, pos++);
    pre = pos;
    if (dir.size() == 0)
      continue; // if leading / first time is 0 length
    if ((mdret = mkdir(dir.c_str(), mode)) && errno != EEXIST)
      return mdret;
    }

  return 0;
  }

bool path_exists(const std::string path)
  {
  struct stat st;
  return (stat(path.c_str(), &st) == 0);
  }

int load_file(const std::string &path, std::string &content)
  {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open())
    return errno ? errno : ENOENT;
  std::ostringstream buf;
  buf << file.rdbuf();
  if (file.bad())
    return errno ? errno : EIO;
  content = buf.str();
  return 0;
  }

std::string save_file_temp(const std::string &path)
  {
  return path + "." + std::to_string((long)getpid()) + ".tmp";
  }

int save_file(const std::string &path, const std::string &content)
  {
  // create path:
  size_t n = path.rfind('/');
  if (n != 0 && n != std::string::npos)
    {
    std::string dir = path.substr(0, n);
    if (!path_exists(dir))
      {
      if (mkpath(dir) != 0)
        return errno;
      }
    }

  // write temp file:
  std::string tmp = save_file_temp(path);
  FILE* f = fopen(tmp.c_str(), "w");
  if (!f)
    {
    int err = errno;
    TELM_LOGE(TAG, "save_file: can't open '%s': %s", tmp.c_str(), strerror(err));
    return err;
    }
  size_t written = fwrite(content.data(), 1, content.size(), f);
  int err = 0;
  if (written != content.size())
    err = errno ? errno : EIO;
  if (fflush(f) != 0 && !err)
    err = errno;
  if (fsync(fileno(f)) != 0 && !err)
    err = errno;
  if (fclose(f) != 0 && !err)
    err = errno;
  if (err)
    {
    TELM_LOGE(TAG, "save_file: error writing '%s': %s", tmp.c_str(), strerror(err));
    unlink(tmp.c_str());
    return err;
    }

  // replace:
  if (rename(tmp.c_str(), path.c_str()) != 0)
    {
    err = errno;
    TELM_LOGE(TAG, "save_file: can't rename '%s' to '%s': %s", tmp.c_str(), path.c_str(), strerror(err));
    unlink(tmp.c_str());
    return err;
    }
  return 0;
  }

std::string host_identity(const std::string& cpuinfo /*="/proc/cpuinfo"*/)
  {
  std::ifstream file(cpuinfo);
  if (!file.is_open())
    return std::string();

  std::string line;
  bool have_serial = false, have_revision = false;
  unsigned long long serial = 0;
  unsigned long revision = 0;
  while (std::getline(file, line))
    {
    size_t colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    std::string key = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon+1));
    if (key == "Serial" && !value.empty())
      {
      serial = strtoull(value.c_str(), NULL, 16);
      have_serial = true;
      }
    else if (key == "Revision" && !value.empty())
      {
      revision = strtoul(value.c_str(), NULL, 16);
      have_revision = true;
      }
    }
  if (!have_serial)
    return std::string();

  // Board type field of the new-style revision code, 0x11 = Pi 4B
  bool pi4 = have_revision && (((revision & 0xff0) >> 4) >= 11);
  std::ostringstream id;
  id << (pi4 ? "pi4:" : "pi:") << serial;
  return id.str();
  }
