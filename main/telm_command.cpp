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
static const char *TAG = "command";

#include <stdio.h>
#include <stdarg.h>
#include <stdlib.h>
#include <string.h>
#include "telm_command.h"
#include "telm_config.h"
#include "telm_utils.h"

TelmCommandApp MyCommandApp __attribute__ ((init_priority (1010)));

bool CompareCharPtr::operator()(const char* a, const char* b) const
  {
  return strcmp(a, b) < 0;
  }

TelmWriter::TelmWriter()
  {
  m_result = TELM_OK;
  }

TelmWriter::~TelmWriter()
  {
  }

TelmStdioWriter::TelmStdioWriter(FILE* out /*=stdout*/)
  {
  m_out = out;
  }

TelmStdioWriter::~TelmStdioWriter()
  {
  fflush(m_out);
  }

int TelmStdioWriter::puts(const char* s)
  {
  return fprintf(m_out, "%s\n", s);
  }

int TelmStdioWriter::printf(const char* fmt, ...)
  {
  va_list args;
  va_start(args, fmt);
  int ret = vfprintf(m_out, fmt, args);
  va_end(args);
  return ret;
  }

ssize_t TelmStdioWriter::write(const void *buf, size_t nbyte)
  {
  return fwrite(buf, 1, nbyte, m_out);
  }

TelmCommand* TelmCommandMap::FindUniquePrefix(const char* key)
  {
  size_t len = strlen(key);
  TelmCommand* found = NULL;
  for (iterator it = begin(); it != end(); ++it)
    {
    if (strncmp(it->first, key, len) == 0)
      {
      if (len == strlen(it->first))
        {
        return it->second;
        }
      if (found)
        {
        return NULL;
        }
      else
        {
        found = it->second;
        }
      }
    }
  return found;
  }

TelmCommand* TelmCommandMap::FindCommand(const char* key)
  {
  iterator it = find(key);
  if (it == end())
    return NULL;
  else
    return it->second;
  }

TelmCommand::TelmCommand()
  {
  m_name = "";
  m_title = "";
  m_execute = NULL;
  m_usage_template = "";
  m_min = 0;
  m_max = 0;
  m_parent = NULL;
  }

TelmCommand::TelmCommand(const char* name, const char* title, TelmCommandExecuteCallback_t execute,
                         const char *usage, int min, int max)
  {
  m_name = name;
  m_title = title;
  m_execute = execute;
  m_usage_template = !usage ? "" : usage;
  m_min = min;
  m_max = max;
  m_parent = NULL;
  }

TelmCommand::~TelmCommand()
  {
  for (auto it = m_children.begin(); it != m_children.end(); ++it)
    {
    TelmCommand* cmd = it->second;
    delete cmd;
    }
  m_children.clear();
  }

const char* TelmCommand::GetName()
  {
  return m_name;
  }

const char* TelmCommand::GetTitle()
  {
  return m_title;
  }

// Dynamic generation of "Usage:" messages.  Syntax of the usage template string:
// - Prefix is "Usage: " followed by names from ancestors (if any) and name of self
// - "$C" expands to children as child1|child2|child3
// - "[$C]" expands to optional children as [child1|child2|child3]
// - Empty usage template "" defaults to "$C" for non-terminal TelmCommand
void TelmCommand::PutUsage(TelmWriter* writer)
  {
  std::string result ="Usage: ";
  size_t pos = result.size();
  for (TelmCommand* parent = m_parent; parent && parent->m_parent; parent = parent->m_parent)
    {
    result.insert(pos, " ");
    result.insert(pos, parent->m_name);
    }
  result += m_name;
  result += " ";
  ExpandUsage(m_usage_template, writer, result);
  writer->puts(result.c_str());
  }

void TelmCommand::ExpandUsage(const char* templ, TelmWriter* writer, std::string& result)
  {
  std::string usage = (*templ || m_children.empty()) ? templ : m_execute ? "[$C]" : "$C";
  size_t pos;
  if ((pos = usage.find("$C")) != std::string::npos)
    {
    result += usage.substr(0, pos);
    pos += 2;
    bool found = false;
    for (TelmCommandMap::iterator it = m_children.begin(); it != m_children.end(); ++it)
      {
      if (found)
        result += "|";
      result += it->first;
      found = true;
      }
    }
  else pos = 0;
  result += usage.substr(pos);
  }

TelmCommand* TelmCommand::RegisterCommand(const char* name, const char* title, TelmCommandExecuteCallback_t execute,
                                          const char *usage, int min, int max)
  {
  // Protect against duplicate registrations
  TelmCommand* cmd = FindCommand(name);
  if (cmd == NULL)
    {
    cmd = new TelmCommand(name, title, execute, usage, min, max);
    m_children[name] = cmd;
    cmd->m_parent = this;
    }
  return cmd;
  }

bool TelmCommand::UnregisterCommand(const char* name)
  {
  if (name == NULL)
    {
    // Unregister this command
    return m_parent ? m_parent->UnregisterCommand(m_name) : false;
    }

  // Unregister the specified child command
  auto pos = m_children.find(name);
  if (pos == m_children.end())
    {
    return false;
    }
  else
    {
    TelmCommand* cmd = pos->second;
    m_children.erase(pos);
    delete cmd;
    return true;
    }
  }

void TelmCommand::Execute(int verbosity, TelmWriter* writer, int argc, const char * const * argv)
  {
  if (m_execute && (m_children.empty() || argc == 0))
    {
    if (argc < m_min || argc > m_max || (argc > 0 && strcmp(argv[argc-1],"?")==0))
      {
      PutUsage(writer);
      writer->SetResult(TELM_ERR_INVALID_STATE);
      return;
      }
    m_execute(verbosity,writer,this,argc,argv);
    return;
    }
  else
    {
    if (argc <= 0)
      {
      writer->puts("Subcommand required");
      PutUsage(writer);
      writer->SetResult(TELM_ERR_INVALID_STATE);
      return;
      }
    if (strcmp(argv[0],"?")==0)
      {
      // Skip usage line if it's just the one-line list of children.
      if (*m_usage_template || m_execute)
        PutUsage(writer);
      // Show available commands
      for (TelmCommandMap::iterator it=m_children.begin(); it!=m_children.end(); ++it)
        {
        const char* k = it->first;
        const char* v = it->second->GetTitle();
        writer->printf("%-20.20s %s\n",k,v);
        }
      return;
      }
    TelmCommand* cmd = m_children.FindUniquePrefix(argv[0]);
    if (!cmd)
      {
      writer->puts("Unrecognised command");
      if (GetParent())    // No usage line for root command
        PutUsage(writer);
      writer->SetResult(TELM_ERR_NOT_FOUND);
      return;
      }
    cmd->Execute(verbosity,writer,argc-1,++argv);
    }
  }

TelmCommand* TelmCommand::GetParent()
  {
  return m_parent;
  }

TelmCommand* TelmCommand::FindCommand(const char* name)
  {
  return m_children.FindCommand(name);
  }

void log_level(int verbosity, TelmWriter* writer, TelmCommand* cmd, int argc, const char* const* argv)
  {
  const char* tag = (argc > 1) ? argv[1] : "*";
  MyCommandApp.SetLoglevel(tag, argv[0]);
  if (verbosity >= COMMAND_RESULT_MINIMAL)
    writer->printf("Logging level for %s set to %s\n", tag,
      telm_log_level_name(telm_log_level_get(tag)));
  }

TelmCommandApp::TelmCommandApp()
  {
  TELM_LOGD(TAG, "Initialising COMMAND (1010)");

  TelmCommand* cmd_log = RegisterCommand("log", "LOG framework");
  cmd_log->RegisterCommand("level", "Set logging level", log_level,
    "<level> [<tag>]\n<level> is one of none|error|warn|info|debug|verbose", 1, 2);
  }

TelmCommandApp::~TelmCommandApp()
  {
  }

TelmCommand* TelmCommandApp::RegisterCommand(const char* name, const char* title, TelmCommandExecuteCallback_t execute,
                                             const char *usage, int min, int max)
  {
  return m_root.RegisterCommand(name, title, execute, usage, min, max);
  }

bool TelmCommandApp::UnregisterCommand(const char* name)
  {
  return m_root.UnregisterCommand(name);
  }

TelmCommand* TelmCommandApp::FindCommand(const char* name)
  {
  return m_root.FindCommand(name);
  }

void TelmCommandApp::Execute(int verbosity, TelmWriter* writer, int argc, const char * const * argv)
  {
  if (argc == 0)
    {
    writer->puts("Error: Empty command unrecognised");
    writer->SetResult(TELM_ERR_NOT_FOUND);
    }
  else
    {
    m_root.Execute(verbosity, writer, argc, argv);
    }
  }

void TelmCommandApp::SetLoglevel(std::string tag, std::string level)
  {
  telm_log_level_t level_num = telm_log_level_from_name(level);
  if (tag.empty() || tag == "*")
    telm_log_level_set("*", level_num);
  else
    telm_log_level_set(tag.c_str(), level_num);
  }

void TelmCommandApp::ReadConfig()
  {
  TelmConfigParam* param = MyConfig.CachedParam("log");
  if (param == NULL) return;

  // configure log levels:
  std::string level = MyConfig.GetParamValue("log", "level");
  if (!level.empty())
    SetLoglevel("*", level);
  for (auto const& kv : param->GetMap())
    {
    if (startsWith(kv.first, "level.") && !kv.second.empty())
      SetLoglevel(kv.first.substr(6), kv.second);
    }

  if (MyConfig.GetParamValueBool("log", "syslog", false))
    telm_log_syslog(true);
  }
