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


#ifndef __TELM_COMMAND_H__
#define __TELM_COMMAND_H__

#include <unistd.h>
#include <stdarg.h>
#include <string>
#include <map>
#include <functional>
#include <limits.h>
#include "telm.h"
#include "telm_utils.h"

#define COMMAND_RESULT_MINIMAL    140
#define COMMAND_RESULT_NORMAL     1024
#define COMMAND_RESULT_VERBOSE    65535

class TelmWriter;
class TelmCommand;

class TelmWriter
  {
  public:
    TelmWriter();
    virtual ~TelmWriter();

  public:
    virtual int puts(const char* s) { return 0; }
    virtual int printf(const char* fmt, ...) __attribute__ ((format (printf, 2, 3))) { return 0; }
    virtual ssize_t write(const void *buf, size_t nbyte) { return 0; }

  public:
    // Command outcome, used for the process exit status
    void SetResult(telm_err_t result) { m_result = result; }
    telm_err_t GetResult() { return m_result; }

  protected:
    telm_err_t m_result;
  };

class TelmStdioWriter : public TelmWriter
  {
  public:
    TelmStdioWriter(FILE* out = stdout);
    virtual ~TelmStdioWriter();

  public:
    int puts(const char* s);
    int printf(const char* fmt, ...) __attribute__ ((format (printf, 2, 3)));
    ssize_t write(const void *buf, size_t nbyte);

  protected:
    FILE* m_out;
  };

struct CompareCharPtr
  {
  bool operator()(const char* a, const char* b) const;
  };

class TelmCommandMap : public std::map<const char*, TelmCommand*, CompareCharPtr>
  {
  public:
    TelmCommand* FindUniquePrefix(const char* key);
    TelmCommand* FindCommand(const char* key);
  };

typedef std::function<void(int, TelmWriter*, TelmCommand*, int, const char* const*)> TelmCommandExecuteCallback_t;

class TelmCommand
  {
  public:
    TelmCommand();
    TelmCommand(const char* name, const char* title,
                TelmCommandExecuteCallback_t execute,
                const char *usage, int min, int max);
    virtual ~TelmCommand();

  public:
    TelmCommand* RegisterCommand(const char* name, const char* title,
                                 TelmCommandExecuteCallback_t execute = NULL,
                                 const char *usage = "", int min = 0, int max = 0);
    bool UnregisterCommand(const char* name = NULL);
    const char* GetName();
    const char* GetTitle();
    void Execute(int verbosity, TelmWriter* writer, int argc, const char * const * argv);
    TelmCommand* GetParent();
    TelmCommand* FindCommand(const char* name);

  private:
    void PutUsage(TelmWriter* writer);
    void ExpandUsage(const char* templ, TelmWriter* writer, std::string& result);

  protected:
    const char* m_name;
    const char* m_title;
    TelmCommandExecuteCallback_t m_execute;
    const char* m_usage_template;
    int m_min;
    int m_max;
    TelmCommandMap m_children;
    TelmCommand* m_parent;
  };

class TelmCommandApp
  {
  public:
    TelmCommandApp();
    virtual ~TelmCommandApp();

  public:
    TelmCommand* RegisterCommand(const char* name, const char* title,
                                 TelmCommandExecuteCallback_t execute = NULL,
                                 const char *usage = "", int min = 0, int max = 0);
    bool UnregisterCommand(const char* name);
    TelmCommand* FindCommand(const char* name);
    void Execute(int verbosity, TelmWriter* writer, int argc, const char * const * argv);
    void SetLoglevel(std::string tag, std::string level);
    void ReadConfig();

  private:
    TelmCommand m_root;
  };

extern TelmCommandApp MyCommandApp;

#endif //#ifndef __TELM_COMMAND_H__
