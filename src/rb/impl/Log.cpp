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

#include "rdx/rb/Log.h"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>

#include <array>
#include <assert.h>
#include <stdlib.h>

namespace
{
  using namespace rdx;

  constexpr static size_t CHANNEL_COUNT = size_t(RbLogChannel::COUNT);

  std::array<quill::Logger*, CHANNEL_COUNT> s_loggers = {};

  quill::LogLevel rbResolveLogLevel(const RbLogConfig& config)
  {
    if (config.level)
    {
      return *config.level;
    }

    if (const char* envStr = getenv("RDX_LOG_LEVEL"); envStr)
    {
      if (std::optional<quill::LogLevel> level = rbParseLogLevel(envStr); level)
      {
        return *level;
      }
    }

#ifdef RDX_VERBOSE
    return quill::LogLevel::Debug;
#else
    return quill::LogLevel::Info;
#endif
  }
}

namespace rdx
{
  void rbLogInit(const RbLogConfig& config)
  {
    if (s_loggers[0])
    {
      return;
    }

    quill::ConsoleSinkConfig::Colours consoleColors;
    consoleColors.apply_default_colours();
    consoleColors.assign_colour_to_log_level(quill::LogLevel::Info, quill::ConsoleSinkConfig::Colours::white);

    quill::ConsoleSinkConfig consoleConfig;
    consoleConfig.set_colours(consoleColors);

    std::vector<std::shared_ptr<quill::Sink>> sinks = config.extraSinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("rdx_console", consoleConfig));

    quill::PatternFormatterOptions formatOptions("[%(time)] %(logger) (%(log_level)) %(message)", "%H:%M:%S.%Qms");

    quill::LogLevel level = rbResolveLogLevel(config);

    for (size_t i = 0; i < CHANNEL_COUNT; i++)
    {
      const char* name = rbLogChannelName(RbLogChannel(i));

      quill::Logger* logger = quill::Frontend::create_or_get_logger(name, sinks, formatOptions);
      logger->set_log_level(level);

      s_loggers[i] = logger;
    }

    quill::BackendOptions options;
    options.thread_name = "RdxLog";
    quill::Backend::start(options);

    if (const char* envStr = getenv("RDX_LOG_LEVEL"); envStr && !config.level && !rbParseLogLevel(envStr))
    {
      QUILL_LOG_WARNING(s_loggers[0], "ignoring unknown RDX_LOG_LEVEL '{}'", envStr);
    }
  }

  quill::Logger* rbGetLogger(RbLogChannel channel)
  {
    assert(channel < RbLogChannel::COUNT);
    return s_loggers[size_t(channel)];
  }

  const char* rbLogChannelName(RbLogChannel channel)
  {
    switch (channel)
    {
    case RbLogChannel::Base: return "rb";
    case RbLogChannel::Gpu: return "rgpu";
    case RbLogChannel::Renderer: return "rr";
    default: return "unknown";
    }
  }

  std::optional<quill::LogLevel> rbParseLogLevel(std::string_view name)
  {
    if (name == "debug") return quill::LogLevel::Debug;
    if (name == "info") return quill::LogLevel::Info;
    if (name == "warning") return quill::LogLevel::Warning;
    if (name == "error") return quill::LogLevel::Error;
    return std::nullopt;
  }

  void rbLogFlush()
  {
    for (quill::Logger* logger : s_loggers)
    {
      if (logger)
      {
        logger->flush_log();
      }
    }
  }
}
