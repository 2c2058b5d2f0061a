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


#ifndef __TELM_UTILS_H__
#define __TELM_UTILS_H__

#include <sys/types.h>
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>
#include "telm.h"

// Math utils:
#define LIMIT_MIN(n,lim) ((n) < (lim) ? (lim) : (n))
#define LIMIT_MAX(n,lim) ((n) > (lim) ? (lim) : (n))

// Value precision utils:
#define ROUNDPREC(fval,prec) (round((fval) * pow(10,(prec))) / pow(10,(prec)))

// C string sorting for std::map et al:
struct CmpStrOp
  {
  bool operator()(char const *a, char const *b) const
    {
    return std::strcmp(a, b) < 0;
    }
  };

// Tolerant boolean string analyzer:
inline bool strtobool(const std::string& str)
  {
  return (str == "yes" || str == "1" || str == "true");
  }

/**
 * startsWith: std::string et al prefix check
 */
template <class string_t>
bool startsWith(const string_t& haystack, const std::string& needle)
  {
  return needle.length() <= haystack.length()
    && std::equal(needle.begin(), needle.end(), haystack.begin());
  }
template <class string_t>
bool startsWith(const string_t& haystack, const char needle)
  {
  return !haystack.empty() && haystack.front() == needle;
  }

/**
 * endsWith: std::string et al suffix check
 */
template <class string_t>
bool endsWith(const string_t& haystack, const std::string& needle)
  {
  return needle.length() <= haystack.length()
    && std::equal(needle.begin(), needle.end(), haystack.end() - needle.length());
  }
template <class string_t>
bool endsWith(const string_t& haystack, const char needle)
  {
  return !haystack.empty() && haystack.back() == needle;
  }

/**
 * parse_int: strict decimal integer of at least minvalue
 *  - false for trailing garbage, overflow or a smaller value
 *  - value is untouched on failure
 */
bool parse_int(const char* text, int minvalue, int& value);

/**
 * trim: remove leading and trailing white space (incl. CR/LF)
 */
std::string trim(const std::string& text);

/**
 * strip_quotes: remove one pair of enclosing double quotes
 */
std::string strip_quotes(const std::string& text);

/**
 * split: split text at every separator, empty fields are kept
 */
std::vector<std::string> split(const std::string& text, char separator);

/**
 * mkpath: mkdir -p
 */
int mkpath(std::string path, mode_t mode = 0755);

/**
 * path_exists: check if filesystem path exists
 */
bool path_exists(const std::string path);

/**
 * load file into string:
 *  - return value: 0 = ok / errno
 */
int load_file(const std::string &path, std::string &content);

/**
 * save file from string:
 *  - creates missing directories automatically
 *  - writes to save_file_temp(path) and renames, so readers never see a
 *    partial file and concurrent writers never share a temp file
 *  - return value: 0 = ok / errno
 */
int save_file(const std::string &path, const std::string &content);

/**
 * save_file_temp: temp file used by save_file in this process, <path>.<pid>.tmp
 */
std::string save_file_temp(const std::string &path);

/**
 * host_identity: derive the board identity from a cpuinfo file
 *  - "pi:<serial>" or "pi4:<serial>", serial converted to decimal
 *  - empty string if no serial number is present
 */
std::string host_identity(const std::string& cpuinfo = "/proc/cpuinfo");

#endif //#ifndef __TELM_UTILS_H__
