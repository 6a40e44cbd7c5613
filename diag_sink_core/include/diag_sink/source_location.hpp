#pragma once
#include <cstdint>

#if __cplusplus >= 202002L && __has_include(<source_location>)
#include <source_location>
#define DIAG_SINK_HAS_STD_SOURCE_LOCATION 1
#endif

namespace diag_sink
{

struct SourceLocation
{
  const char* file_name;
  const char* function_name;
  uint32_t line;

  static constexpr const char* BaseName(const char* path)
  {
    const char* name = path;
    for (const char* p = path; *p != '\0'; ++p)
    {
      if (*p == '/' || *p == '\\') name = p + 1;
    }
    return name;
  }
};

#if defined(DIAG_SINK_HAS_STD_SOURCE_LOCATION)
#define DIAG_SINK_CURRENT_LOCATION()                                                  \
  ::diag_sink::SourceLocation                                                         \
  {                                                                                   \
    ::diag_sink::SourceLocation::BaseName(std::source_location::current().file_name()), \
        std::source_location::current().function_name(),                             \
        std::source_location::current().line()                                       \
  }
#else
#define DIAG_SINK_CURRENT_LOCATION()                                                  \
  ::diag_sink::SourceLocation                                                         \
  {                                                                                   \
    ::diag_sink::SourceLocation::BaseName(__FILE__), __func__,                        \
        static_cast<uint32_t>(__LINE__)                                               \
  }
#endif

}  // namespace diag_sink
