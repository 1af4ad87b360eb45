#pragma once

#include <castlink/core/GlobalConfig.hpp>

#include <string>
#include <string_view>

namespace castlink::core
{

class ConfigLoader
{
  public:
    // 앱은 이 한 줄만 호출하면 됩니다. (--config <path.toml>, --help)
    static GlobalConfig load(int argc, char **argv);

    // 파일 경로를 직접 받는 버전 (테스트/임베딩용)
    static GlobalConfig loadFile(const std::string &path);

    // TOML 문자열을 직접 받는 버전
    static GlobalConfig loadString(std::string_view tomlText);
};

} // namespace castlink::core
