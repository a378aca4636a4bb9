#include "cpp_relate/src/utils/Logger.hpp"

#include <vector>

namespace cpp_relate
{
Logger::Logger() : logger_{nullptr}
{
  // Default to a console-only logger so that construction never touches
  // the filesystem. configure() replaces it.
  try
  {
    configure("cpp_relate", "", spdlog::level::info);
  }
  catch (const std::runtime_error&)
  {
    logger_.reset();
  }
}

void Logger::configure(const std::string& loggerName,
                       const std::string& logFile,
                       spdlog::level::level_enum level)
{
  if (loggerName.empty())
  {
    throw std::invalid_argument("Logger name cannot be empty");
  }

  try
  {
    // Unregister existing logger if it exists
    if (logger_)
    {
      spdlog::drop(logger_->name());
      logger_.reset();
    }

    // Also drop any logger registered under the requested name elsewhere
    spdlog::drop(loggerName);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks = {console_sink};

    if (!logFile.empty())
    {
      auto file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
      file_sink->set_level(level);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(file_sink);
    }

    logger_ =
      std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());

    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger_);
  }
  catch (const spdlog::spdlog_ex& ex)
  {
    logger_.reset();
    throw std::runtime_error("Logger configuration failed: " +
                             std::string(ex.what()));
  }
}

void Logger::setLevel(spdlog::level::level_enum level)
{
  if (logger_)
  {
    logger_->set_level(level);
    for (auto& sink : logger_->sinks())
    {
      sink->set_level(level);
    }
  }
}

bool Logger::isConfigured() const
{
  return logger_ != nullptr;
}

std::shared_ptr<spdlog::logger> Logger::getLogger() const
{
  if (!logger_)
  {
    throw std::runtime_error("Logger not configured");
  }
  return logger_;
}
}  // namespace cpp_relate
