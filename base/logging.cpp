// Copyright (C) 2020-2021 Sami Väisänen
// Copyright (C) 2020-2021 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "config.h"

#if defined(WINDOWS_OS)
#  include <Windows.h>
#endif

#include <iostream>
#include <cstdio>
#include <mutex>

#include "base/assert.h"
#include "base/logging.h"

namespace {
// a thread specific logger object.
thread_local base::Logger* threadLogger;

// global logger
base::Logger* globalLogger;
std::mutex globalLoggerMutex;

// flags to globally specify which log events
// are enabled or not.
bool isGlobalDebugLogEnabled   = false;
bool isGlobalWarnLogEnabled    = true;
bool isGlobalInfoLogEnabled    = true;
bool isGlobalErrorLogEnabled   = true;

} // namespace

namespace base
{

const char* ToString(base::LogEvent e)
{
    switch (e)
    {
        case LogEvent::Debug:
           return "Debug";
        case LogEvent::Info:
           return "Info";
        case LogEvent::Warning:
           return "Warning";
        case LogEvent::Error:
            return "Error";
    }
    BUG("Unknown log event.");
    return "";
}

OStreamLogger::OStreamLogger(std::ostream& out) : mOut(&out)
{}

void OStreamLogger::Write(LogEvent type, const char* msg)
{
    if (!mOut)
        return;

    if (!mTerminalColors)
    {
        (*mOut) << msg;
        return;
    }
    // Raw terminal escape sequences. If the stream is not connected
    // to a terminal the colors should be turned off with EnableTerminalColors.
#if defined(LINUX_OS)
    if (type == LogEvent::Error)
        *mOut << "\033[" << 31 << "m";
    else if (type == LogEvent::Warning)
        *mOut << "\033[" << 33 << "m";
    else if (type == LogEvent::Info)
        *mOut << "\033[" << 36 << "m";

    *mOut << msg;

    // reset terminal color.
    *mOut << "\033[m";
#elif defined(WINDOWS_OS)
    HANDLE out = GetStdHandle(STD_OUTPUT_HANDLE);
    CONSOLE_SCREEN_BUFFER_INFO console = {0};
    GetConsoleScreenBufferInfo(out, &console);
    if (type == LogEvent::Info)
        SetConsoleTextAttribute(out, FOREGROUND_GREEN | FOREGROUND_BLUE);
    else if (type == LogEvent::Error)
        SetConsoleTextAttribute(out, FOREGROUND_RED);
    else if (type == LogEvent::Warning)
        SetConsoleTextAttribute(out, FOREGROUND_RED | FOREGROUND_GREEN);

    *mOut << msg;
    SetConsoleTextAttribute(out, console.wAttributes);
#else
    *mOut << msg;
#endif
}

void OStreamLogger::Flush()
{
    if (mOut)
        mOut->flush();
}

Logger* SetGlobalLog(Logger* log)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    auto ret = globalLogger;
    globalLogger = log;
    return ret;
}

Logger* GetGlobalLog()
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);
    return globalLogger;
}

Logger* GetThreadLog()
{
    return threadLogger;
}

Logger* SetThreadLog(Logger* log)
{
    auto* ret = threadLogger;
    threadLogger = log;
    return ret;
}

void FlushThreadLog()
{
    auto* ret = threadLogger;
    if (!ret)
        return;
    ret->Flush();
}

void FlushGlobalLog()
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);
    if (globalLogger)
        globalLogger->Flush();
}

bool IsDebugLogEnabled()
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    return isGlobalDebugLogEnabled;
}

bool IsLogEventEnabled(LogEvent type)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    if (type == LogEvent::Debug)
        return isGlobalDebugLogEnabled;
    else if (type == LogEvent::Warning)
        return isGlobalWarnLogEnabled;
    else if (type == LogEvent::Error)
        return isGlobalErrorLogEnabled;
    else if (type == LogEvent::Info)
        return isGlobalInfoLogEnabled;
    else BUG("No such log event.");
    return false;
}

void EnableLogEvent(LogEvent type, bool on_off)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    if (type == LogEvent::Debug)
        isGlobalDebugLogEnabled = on_off;
    else if (type == LogEvent::Warning)
        isGlobalWarnLogEnabled = on_off;
    else if (type == LogEvent::Error)
        isGlobalErrorLogEnabled = on_off;
    else if (type == LogEvent::Info)
        isGlobalInfoLogEnabled = on_off;
    else BUG("No such log event.");
}

void EnableDebugLog(bool on_off)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    isGlobalDebugLogEnabled = on_off;
}

void WriteLogMessage(LogEvent type, const char* file, int line, const std::string& message)
{
    // strip the path from the file name.
    const char* p = file;
    while (*file) {
#if defined(WINDOWS_OS)
        if (*file == '\\')
            p = file + 1;
#else
        if (*file == '/')
            p = file + 1;
#endif
        ++file;
    }
    file = p;

    // the thread specific logger takes precedence.
    if (auto* thread_log = GetThreadLog())
    {
        if (thread_log->TestWriteMask(Logger::WriteType::WriteRaw))
            thread_log->Write(type, file, line, message.c_str());
        if (thread_log->TestWriteMask(Logger::WriteType::WriteFormatted))
        {
            const auto& formatted = FormatString("%1: %2:%3 \"%4\"\n", ToString(type), file, line, message);
            thread_log->Write(type, formatted.c_str());
        }
        return;
    }

    std::lock_guard<std::mutex> lock(globalLoggerMutex);
    if (!globalLogger)
        return;

    if (globalLogger->TestWriteMask(Logger::WriteType::WriteRaw))
        globalLogger->Write(type, file, line, message.c_str());
    if (globalLogger->TestWriteMask(Logger::WriteType::WriteFormatted))
    {
        const auto& formatted = FormatString("%1: %2:%3 \"%4\"\n", ToString(type), file, line, message);
        globalLogger->Write(type, formatted.c_str());
    }
}

} // base
