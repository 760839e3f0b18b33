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

#include <thread>
#include <chrono>
#include <iostream>
#include <sstream>

#include "base/test_minimal.h"
#include "base/logging.h"

namespace {
void thread_entry(base::Logger* logger)
{
    base::SetThreadLog(logger);
    for (int i=0; i<100; ++i)
    {
        INFO("thread %1", i);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    base::SetThreadLog(nullptr);
}
} // namespace

void unit_test_global_log()
{
    TEST_CASE(test::Type::Feature)

    base::NullLogger null;
    base::SetGlobalLog(&null);
    TEST_REQUIRE(base::GetGlobalLog() == &null);
    base::SetGlobalLog(nullptr);
    TEST_REQUIRE(base::GetGlobalLog() == nullptr);
    base::EnableDebugLog(true);
    TEST_REQUIRE(base::IsDebugLogEnabled());
    base::EnableDebugLog(false);
    TEST_REQUIRE(base::IsDebugLogEnabled() == false);
}

void unit_test_buffer_log()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    logger.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    base::SetGlobalLog(&logger);
    base::EnableDebugLog(true);

    DEBUG("debug");
    INFO("information");
    WARN("warning %1", 123);
    ERROR("error %1 %2", "foo", 1.5f);

    TEST_REQUIRE(logger.GetBufferMsgCount() == 4);
    TEST_REQUIRE(logger.GetMessage(0).msg == "debug");
    TEST_REQUIRE(logger.GetMessage(0).line != 0);
    TEST_REQUIRE(logger.GetMessage(0).file == "unit_test_log.cpp");
    TEST_REQUIRE(logger.GetMessage(0).type == base::LogEvent::Debug);
    TEST_REQUIRE(logger.GetMessage(1).msg == "information");
    TEST_REQUIRE(logger.GetMessage(1).type == base::LogEvent::Info);
    TEST_REQUIRE(logger.GetMessage(2).msg == "warning 123");
    TEST_REQUIRE(logger.GetMessage(2).type == base::LogEvent::Warning);
    TEST_REQUIRE(logger.GetMessage(3).msg == "error foo 1.500000");
    TEST_REQUIRE(logger.GetMessage(3).type == base::LogEvent::Error);

    logger.Dispatch();
    TEST_REQUIRE(logger.GetBufferMsgCount() == 0);

    // debug logging is off by default and the events are dropped.
    base::EnableDebugLog(false);
    DEBUG("dropped");
    TEST_REQUIRE(logger.GetBufferMsgCount() == 0);

    base::EnableLogEvent(base::LogEvent::Warning, false);
    WARN("dropped");
    TEST_REQUIRE(logger.GetBufferMsgCount() == 0);
    base::EnableLogEvent(base::LogEvent::Warning, true);
    WARN("kept");
    TEST_REQUIRE(logger.GetBufferMsgCount() == 1);

    base::SetGlobalLog(nullptr);
}

void unit_test_thread_log()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> global;
    base::SetGlobalLog(&global);

    base::BufferLogger<base::NullLogger> one;
    base::BufferLogger<base::NullLogger> two;
    one.EnableWrite(base::Logger::WriteType::WriteFormatted, false);
    two.EnableWrite(base::Logger::WriteType::WriteFormatted, false);

    std::thread t0(thread_entry, &one);
    std::thread t1(thread_entry, &two);
    t0.join();
    t1.join();
    TEST_REQUIRE(one.GetBufferMsgCount() == 100);
    TEST_REQUIRE(two.GetBufferMsgCount() == 100);
    TEST_REQUIRE(one.GetMessage(99).msg == "thread 99");
    // thread logger takes precedence over the global one.
    TEST_REQUIRE(global.GetBufferMsgCount() == 0);

    base::SetGlobalLog(nullptr);
}

void unit_test_locked_log()
{
    TEST_CASE(test::Type::Feature)

    base::LockedLogger<base::BufferLogger<base::NullLogger>> log;
    log.EnableWrite(base::Logger::WriteType::WriteFormatted, false);

    std::thread t0(thread_entry, &log);
    std::thread t1(thread_entry, &log);
    thread_entry(&log);
    t0.join();
    t1.join();
    TEST_REQUIRE(log.GetLoggerUnsafe().GetBufferMsgCount() == 300);
}

void unit_test_ostream_log()
{
    TEST_CASE(test::Type::Feature)

    std::stringstream ss;
    base::OStreamLogger logger(ss);
    logger.EnableTerminalColors(false);
    base::SetGlobalLog(&logger);
    INFO("Hello %1", "world");
    WARN("Goodbye");
    base::SetGlobalLog(nullptr);

    const auto& str = ss.str();
    TEST_REQUIRE(str.find("Info: unit_test_log.cpp:") != std::string::npos);
    TEST_REQUIRE(str.find("\"Hello world\"") != std::string::npos);
    TEST_REQUIRE(str.find("Warning: unit_test_log.cpp:") != std::string::npos);
    TEST_REQUIRE(str.find("\033[") == std::string::npos);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_global_log();
    unit_test_buffer_log();
    unit_test_thread_log();
    unit_test_locked_log();
    unit_test_ostream_log();
    return 0;
}
) // TEST_MAIN
