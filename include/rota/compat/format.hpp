/**
 * @file format.hpp
 * @brief std::format with an fmt fallback
 *
 * Usage:
 *   #include <rota/compat/format.hpp>
 *   auto s = rota::compat::format("Week {} has {} gaps", week, gaps);
 */

#pragma once

#include <version>

// __cpp_lib_format is authoritative for libstdc++/libc++; Apple Clang 15+
// and MSVC 19.29+ ship std::format without always defining it.
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define ROTA_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define ROTA_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define ROTA_HAS_STD_FORMAT 1
#else
    #define ROTA_HAS_STD_FORMAT 0
#endif

#if ROTA_HAS_STD_FORMAT
    #include <format>
    namespace rota::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace rota::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
