//
// Copyright (C) 2024 Pablo Delgado Krämer
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
//

#include "rdx/rt/TestLogListener.h"

#include <rdx/rb/Log.h>

using namespace doctest;

namespace rdx
{
  RtTestLogListener::RtTestLogListener(const ContextOptions& options)
  {
    RbLogConfig config;
    if (options.quiet)
    {
      config.level = quill::LogLevel::Error;
    }

    rbLogInit(config);
  }

  void RtTestLogListener::report_query(const QueryData&) { rbLogFlush(); }

  void RtTestLogListener::test_run_start() { rbLogFlush(); }

  void RtTestLogListener::test_run_end(const TestRunStats&) { rbLogFlush(); }

  void RtTestLogListener::test_case_start(const TestCaseData& data)
  {
    RB_DEBUG("test case '{}' ({}:{})", data.m_name, data.m_file.c_str(), data.m_line);
    rbLogFlush();
  }

  void RtTestLogListener::test_case_reenter(const TestCaseData&) { rbLogFlush(); }

  void RtTestLogListener::test_case_end(const CurrentTestCaseStats&) { rbLogFlush(); }

  void RtTestLogListener::test_case_exception(const TestCaseException& exception)
  {
    RB_ERROR("test case threw: {}", exception.error_string.c_str());
    rbLogFlush();
  }

  void RtTestLogListener::subcase_start(const SubcaseSignature& signature)
  {
    RB_DEBUG("subcase '{}'", signature.m_name.c_str());
    rbLogFlush();
  }

  void RtTestLogListener::subcase_end() { rbLogFlush(); }

  void RtTestLogListener::log_assert(const AssertData&) { rbLogFlush(); }

  void RtTestLogListener::log_message(const MessageData&) { rbLogFlush(); }

  void RtTestLogListener::test_case_skipped(const TestCaseData& data)
  {
    RB_DEBUG("test case '{}' skipped", data.m_name);
    rbLogFlush();
  }
}
