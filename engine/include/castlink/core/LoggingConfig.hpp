#pragma once

#include <castlink/EngineConfig.hpp>

namespace castlink::core
{

/// EngineConfig 의 logLevel/logFilePath 를 프로세스 전역 Logger 에 반영합니다.
/// @throws std::runtime_error 로그 파일을 열 수 없을 때
void applyLoggingConfig(const castlink::EngineConfig &cfg);

} // namespace castlink::core
