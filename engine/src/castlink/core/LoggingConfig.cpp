#include <castlink/core/LoggingConfig.hpp>

#include <castlink/core/Logger.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace castlink::core
{
namespace
{

// 파일 스트림 수명을 Logger 와 함께 묶어 둔다. (Logger 가 먼저 멈춘 뒤 스트림 해제)
class FileBackedLogger final : public ILogger
{
  public:
    FileBackedLogger(std::unique_ptr<std::ofstream> file, LogLevel lvl)
        : file_(std::move(file)), logger_(*file_, lvl)
    {
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void shutdown() noexcept override { logger_.stopAndJoin(); }

  private:
    std::unique_ptr<std::ofstream> file_;
    Logger logger_;
};

} // namespace

void applyLoggingConfig(const castlink::EngineConfig &cfg)
{
    if (cfg.logFilePath.empty())
    {
        setLogger(std::make_shared<Logger>(std::clog, cfg.logLevel));
        return;
    }

    auto file = std::make_unique<std::ofstream>(cfg.logFilePath, std::ios::app);
    if (!file->is_open())
        throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.logFilePath);

    setLogger(std::make_shared<FileBackedLogger>(std::move(file), cfg.logLevel));
}

} // namespace castlink::core
