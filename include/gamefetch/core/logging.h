#pragma once

#include <string>

namespace gamefetch {

/**
 * Install the default spdlog logger for an executable: a stderr color sink plus, when
 * logFile is non-empty, a rotating file sink (10 MiB x 3). Unknown levels fall back to info.
 * Throws spdlog::spdlog_ex if the file sink cannot be created.
 */
void setupLogging(const std::string& loggerName, const std::string& level,
                  const std::string& logFile = "");

} // namespace gamefetch
