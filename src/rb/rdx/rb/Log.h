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

#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/bundled/fmt/format.h>
#include <quill/sinks/Sink.h>
#include <quill/std/Vector.h>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

// Each library target defines RB_LOG_CHANNEL to route its messages to its
// own logger. Code outside of them logs to the base channel.
#ifndef RB_LOG_CHANNEL
#define RB_LOG_CHANNEL rdx::RbLogChannel::Base
#endif

#define RB_ERROR(fmt, ...) QUILL_LOG_ERROR(rdx::rbGetLogger(RB_LOG_CHANNEL), fmt, ##__VA_ARGS__)
#define RB_WARN(fmt, ...) QUILL_LOG_WARNING(rdx::rbGetLogger(RB_LOG_CHANNEL), fmt, ##__VA_ARGS__)
#define RB_LOG(fmt, ...) QUILL_LOG_INFO(rdx::rbGetLogger(RB_LOG_CHANNEL), fmt, ##__VA_ARGS__)
#define RB_DEBUG(fmt, ...) QUILL_LOG_DEBUG(rdx::rbGetLogger(RB_LOG_CHANNEL), fmt, ##__VA_ARGS__)

#define RB_FMT(fmt, ...) fmtquill::format(fmt, __VA_ARGS__)

namespace rdx
{
  enum class RbLogChannel
  {
    Base,
    Gpu,
    Renderer,
    COUNT
  };

  struct RbLogConfig
  {
    // Takes precedence over the RDX_LOG_LEVEL environment variable.
    std::optional<quill::LogLevel> level;
    std::vector<std::shared_ptr<quill::Sink>> extraSinks;
  };

  // Creates one logger per channel. Calls after the first one have no effect.
  void rbLogInit(const RbLogConfig& config = {});

  quill::Logger* rbGetLogger(RbLogChannel channel);

  const char* rbLogChannelName(RbLogChannel channel);

  // Accepts "debug", "info", "warning" and "error", case-sensitive.
  std::optional<quill::LogLevel> rbParseLogLevel(std::string_view name);

  void rbLogFlush();
}
