#pragma once

namespace castlink::util
{

/// 복사 금지 베이스 클래스입니다. 이동은 허용합니다.
class NonCopyable
{
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

/// 복사/이동 모두 금지합니다.
/// - 다른 스레드가 this 포인터를 캡처해 두는 객체(큐, 엔진, 세션 매니저)에 사용합니다.
class NonMovable
{
  protected:
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &) = delete;
    NonMovable &operator=(const NonMovable &) = delete;
    NonMovable(NonMovable &&) = delete;
    NonMovable &operator=(NonMovable &&) = delete;
};

} // namespace castlink::util
