#pragma once

#include <iostream>
#include <string_view>

namespace castlink::test
{

inline int &failures()
{
    static int count = 0;
    return count;
}

inline int finish(std::string_view suite)
{
    if (failures() == 0)
    {
        std::cout << "[OK] " << suite << "\n";
        return 0;
    }
    std::cerr << "[NG] " << suite << " failures=" << failures() << "\n";
    return 1;
}

} // namespace castlink::test

#define CHECK(expr)                                                                                \
    do                                                                                             \
    {                                                                                              \
        if (!(expr))                                                                               \
        {                                                                                          \
            ++::castlink::test::failures();                                                        \
            std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " :: " #expr << "\n";     \
        }                                                                                          \
    } while (0)
