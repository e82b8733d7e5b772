#pragma once

#if defined(_WIN32)
#  if defined(LANTERN_BUILD_SHARED)
#    if defined(lantern_core_EXPORTS)
#      define LANTERN_API __declspec(dllexport)
#    else
#      define LANTERN_API __declspec(dllimport)
#    endif
#  else
#    define LANTERN_API
#  endif
#else
#  if defined(LANTERN_BUILD_SHARED)
#    define LANTERN_API __attribute__((visibility("default")))
#  else
#    define LANTERN_API
#  endif
#endif
