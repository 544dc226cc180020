#pragma once

#include <coinchase/ServerConfig.hpp>

namespace coinchase::core
{

/// ServerConfig 의 logLevel/logFilePath 를 프로세스 전역 Logger 에 반영합니다.
void applyLoggingConfig(const coinchase::ServerConfig &cfg);

} // namespace coinchase::core
