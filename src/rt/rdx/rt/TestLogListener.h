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

#pragma once

#include <doctest/doctest.h>

namespace rdx
{
  // Initializes the rdx loggers for a test binary and keeps their output
  // ordered with doctest's reporter output. Each test case and subcase is
  // announced on the base channel at debug level, so RDX_LOG_LEVEL=debug
  // attributes device and renderer messages to the test that caused them.
  //
  // Register with REGISTER_LISTENER("TestLog", 1, rdx::RtTestLogListener).
  // Running doctest with --quiet restricts logging to errors.
  struct RtTestLogListener : doctest::IReporter
  {
    explicit RtTestLogListener(const doctest::ContextOptions& options);

    void report_query(const doctest::QueryData&) override;

    void test_run_start() override;

    void test_run_end(const doctest::TestRunStats&) override;

    void test_case_start(const doctest::TestCaseData& data) override;

    void test_case_reenter(const doctest::TestCaseData&) override;

    void test_case_end(const doctest::CurrentTestCaseStats&) override;

    void test_case_exception(const doctest::TestCaseException& exception) override;

    void subcase_start(const doctest::SubcaseSignature& signature) override;

    void subcase_end() override;

    void log_assert(const doctest::AssertData&) override;

    void log_message(const doctest::MessageData&) override;

    void test_case_skipped(const doctest::TestCaseData& data) override;
  };
}
