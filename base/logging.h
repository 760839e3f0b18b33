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

#pragma once

#include "config.h"

#include <iosfwd>
#include <string>
#include <mutex>
#include <vector>

#include "base/format.h"
#include "base/bitflag.h"

// wingdi.h defines ERROR. Pull it in first and drop the definition
// so that the logging macro below wins.
#ifdef _WIN32
#  include <Windows.h>
#  undef ERROR
#endif

#ifdef BASE_LOGGING_ENABLE_LOG
  #define DEBUG(fmt, ...) base::WriteLog(base::LogEvent::Debug,   __FILE__, __LINE__, fmt, ## __VA_ARGS__)
  #define INFO(fmt, ...)  base::WriteLog(base::LogEvent::Info,    __FILE__, __LINE__, fmt, ## __VA_ARGS__)
  #define WARN(fmt, ...)  base::WriteLog(base::LogEvent::Warning, __FILE__, __LINE__, fmt, ## __VA_ARGS__)
  #define ERROR(fmt, ...) base::WriteLog(base::LogEvent::Error,   __FILE__, __LINE__, fmt, ## __VA_ARGS__)
  #define ERROR_RETURN(ret, fmt, ...) \
      do { \
          base::WriteLog(base::LogEvent::Error, __FILE__, __LINE__, fmt, ## __VA_ARGS__); \
          return ret; \
      } while (0)
#else
  #define DEBUG(...) while(false)
  #define INFO(...)  while(false)
  #define WARN(...)  while(false)
  #define ERROR(...) while(false)
  #define ERROR_RETURN(...) while(false)
#endif

// Logging for diagnostics only. Failures are reported through exceptions
// and programmer errors through ASSERT/BUG.

namespace base
{
    enum class LogEvent
    {
        // Only relevant when debugging.
        Debug,
        // Something happened.
        Info,
        // Something couldn't be done, typically because some input
        // (shader source, uniform value) was rejected.
        Warning,
        // Something failed and the result is unusable, for example
        // a program that didn't link.
        Error
    };

    const char* ToString(LogEvent e);

    class Logger
    {
    public:
        enum class WriteType {
            // Unformatted message with the source file and line.
            WriteRaw,
            // Message formatted with the timestamp, file and line.
            WriteFormatted
        };
        virtual ~Logger() = default;

        virtual void Write(LogEvent type, const char* file, int line, const char* msg) = 0;
        virtual void Write(LogEvent type, const char* msg) = 0;
        virtual void Flush() = 0;

        // Which of the Write functions the logger wants to receive.
        virtual bitflag<WriteType> GetWriteMask() const
        { return bitflag<WriteType>({WriteType::WriteRaw, WriteType::WriteFormatted}); }

        inline bool TestWriteMask(WriteType type) const
        { return GetWriteMask().test(type); }
    };

    // Logger that drops everything.
    class NullLogger : public Logger
    {
    public:
        virtual void Write(LogEvent, const char*, int, const char*) override
        {}
        virtual void Write(LogEvent, const char*) override
        {}
        virtual void Flush() override
        {}
        virtual bitflag<WriteType> GetWriteMask() const override
        { return bitflag<WriteType>(); }
    };

    // Write formatted messages to a std::ostream, optionally colored
    // with ANSI terminal escapes.
    class OStreamLogger : public Logger
    {
    public:
        OStreamLogger() = default;
        explicit OStreamLogger(std::ostream& out);

        virtual void Write(LogEvent, const char*, int, const char*) override
        {}
        virtual void Write(LogEvent type, const char* msg) override;
        virtual void Flush() override;
        virtual bitflag<WriteType> GetWriteMask() const override
        { return bitflag<WriteType>(WriteType::WriteFormatted); }

        inline void EnableTerminalColors(bool on_off) noexcept
        { mTerminalColors = on_off; }
    private:
        std::ostream* mOut = nullptr;
        bool mTerminalColors = true;
    };

    // Serialize access to a logger that isn't thread safe.
    template<typename WrappedLogger>
    class LockedLogger : public Logger
    {
    public:
        LockedLogger() = default;
        explicit LockedLogger(WrappedLogger&& other)
          : mLogger(std::move(other))
        {}

        virtual void Write(LogEvent type, const char* file, int line, const char* msg) override
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mLogger.Write(type, file, line, msg);
        }
        virtual void Write(LogEvent type, const char* msg) override
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mLogger.Write(type, msg);
        }
        virtual void Flush() override
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mLogger.Flush();
        }
        virtual bitflag<WriteType> GetWriteMask() const override
        { return mWrites; }

        // Access to the wrapped logger that holds the lock
        // for as long as the object lives.
        class LoggerAccess
        {
        public:
            LoggerAccess(std::unique_lock<std::mutex> lock, WrappedLogger& logger)
              : mLock(std::move(lock))
              , mLogger(logger)
            {}
            WrappedLogger* operator->()
            { return &mLogger; }
            WrappedLogger& GetLogger()
            { return mLogger; }
        private:
            std::unique_lock<std::mutex> mLock;
            WrappedLogger& mLogger;
        };
        LoggerAccess GetLoggerSafe()
        { return LoggerAccess(std::unique_lock<std::mutex>(mMutex), mLogger); }
        WrappedLogger& GetLoggerUnsafe()
        { return mLogger; }

        void EnableWrite(WriteType type, bool on_off)
        { mWrites.set(type, on_off); }
    private:
        WrappedLogger mLogger;
        std::mutex mMutex;
        bitflag<WriteType> mWrites = bitflag<WriteType>({WriteType::WriteRaw, WriteType::WriteFormatted});
    };

    // Keep the log messages in a buffer until they're dispatched to the
    // wrapped logger. The tests use the buffer to check what was logged.
    template<typename WrappedLogger>
    class BufferLogger : public Logger
    {
    public:
        struct LogMessage {
            LogEvent type = LogEvent::Debug;
            std::string file;
            std::string msg;
            int line = 0;
        };
        BufferLogger() = default;
        explicit BufferLogger(WrappedLogger&& other)
          : mLogger(std::move(other))
        {}

        virtual void Write(LogEvent type, const char* file, int line, const char* msg) override
        {
            LogMessage log;
            log.type = type;
            log.file = file;
            log.line = line;
            log.msg  = msg;
            mBuffer.push_back(std::move(log));
        }
        virtual void Write(LogEvent type, const char* msg) override
        {
            LogMessage log;
            log.type = type;
            log.msg  = msg;
            mBuffer.push_back(std::move(log));
        }
        // Nothing to flush, see Dispatch.
        virtual void Flush() override
        {}
        virtual bitflag<WriteType> GetWriteMask() const override
        { return mWrites; }

        // Write the buffered messages to the wrapped logger and
        // clear the buffer.
        void Dispatch()
        {
            for (const auto& msg : mBuffer)
            {
                if (msg.file.empty())
                    mLogger.Write(msg.type, msg.msg.c_str());
                else mLogger.Write(msg.type, msg.file.c_str(), msg.line, msg.msg.c_str());
            }
            mBuffer.clear();
        }
        void ClearBuffer()
        { mBuffer.clear(); }

        inline std::size_t GetBufferMsgCount() const noexcept
        { return mBuffer.size(); }
        inline const LogMessage& GetMessage(std::size_t index) const
        { return mBuffer[index]; }
        inline const WrappedLogger& GetLogger() const noexcept
        { return mLogger; }
        inline WrappedLogger& GetLogger() noexcept
        { return mLogger; }

        void EnableWrite(WriteType type, bool on_off)
        { mWrites.set(type, on_off); }
    private:
        std::vector<LogMessage> mBuffer;
        WrappedLogger mLogger;
        bitflag<WriteType> mWrites = bitflag<WriteType>({WriteType::WriteRaw, WriteType::WriteFormatted});
    };

    // The global logger is used by every thread that doesn't have its own
    // logger. It must be thread safe if there are multiple logging threads.
    // Returns the previous logger.
    Logger* SetGlobalLog(Logger* log);
    Logger* GetGlobalLog();

    // The thread logger takes precedence over the global logger for the
    // calling thread. nullptr turns off the thread logger.
    Logger* SetThreadLog(Logger* log);
    Logger* GetThreadLog();

    void FlushThreadLog();
    void FlushGlobalLog();

    // Debug messages are filtered separately since they're the bulk of
    // the log. Off by default.
    bool IsDebugLogEnabled();
    void EnableDebugLog(bool on_off);

    bool IsLogEventEnabled(LogEvent type);
    void EnableLogEvent(LogEvent type, bool on_off);

    void WriteLogMessage(LogEvent type, const char* file, int line, const std::string& message);

    // Format the message and write it to the thread logger or
    // to the global logger.
    template<typename... Args>
    void WriteLog(LogEvent type, const char* file, int line, const std::string& fmt, const Args&... args)
    {
        if (!IsLogEventEnabled(type))
            return;
        WriteLogMessage(type, file, line, FormatString(fmt, args...));
    }

} // base
