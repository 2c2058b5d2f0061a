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


#ifndef __TELM_LOG_H__
#define __TELM_LOG_H__

#include <stdio.h>
#include <stdint.h>
#include <string>

typedef enum
  {
  TELM_LOG_NONE = 0,
  TELM_LOG_ERROR,
  TELM_LOG_WARN,
  TELM_LOG_INFO,
  TELM_LOG_DEBUG,
  TELM_LOG_VERBOSE
  } telm_log_level_t;

#ifndef TELM_LOG_DEFAULT_LEVEL
#define TELM_LOG_DEFAULT_LEVEL TELM_LOG_INFO
#endif

#define TELM_LOG_FORMAT(letter, format)  #letter " (%u) %s: " format "\n"

void telm_log_write(telm_log_level_t level, const char* tag, const char* format, ...)
  __attribute__ ((format (printf, 3, 4)));
uint32_t telm_log_timestamp();
void telm_log_level_set(const char* tag, telm_log_level_t level);
telm_log_level_t telm_log_level_get(const char* tag);
void telm_log_syslog(bool enable, const char* ident = "telm");
telm_log_level_t telm_log_level_from_name(const std::string& name, telm_log_level_t defvalue = TELM_LOG_DEFAULT_LEVEL);
const char* telm_log_level_name(telm_log_level_t level);

#define TELM_LOGE( tag, format, ... ) telm_log_write(TELM_LOG_ERROR,   tag, TELM_LOG_FORMAT(E, format), telm_log_timestamp(), tag, ##__VA_ARGS__)
#define TELM_LOGW( tag, format, ... ) telm_log_write(TELM_LOG_WARN,    tag, TELM_LOG_FORMAT(W, format), telm_log_timestamp(), tag, ##__VA_ARGS__)
#define TELM_LOGI( tag, format, ... ) telm_log_write(TELM_LOG_INFO,    tag, TELM_LOG_FORMAT(I, format), telm_log_timestamp(), tag, ##__VA_ARGS__)
#define TELM_LOGD( tag, format, ... ) telm_log_write(TELM_LOG_DEBUG,   tag, TELM_LOG_FORMAT(D, format), telm_log_timestamp(), tag, ##__VA_ARGS__)
#define TELM_LOGV( tag, format, ... ) telm_log_write(TELM_LOG_VERBOSE, tag, TELM_LOG_FORMAT(V, format), telm_log_timestamp(), tag, ##__VA_ARGS__)

#endif //#ifndef __TELM_LOG_H__
