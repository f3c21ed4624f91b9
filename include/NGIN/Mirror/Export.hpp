#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_MIRROR_STATIC)
    #define NGIN_MIRROR_API
  #else
    #if defined(NGIN_MIRROR_EXPORTS)
      #define NGIN_MIRROR_API __declspec(dllexport)
    #else
      #define NGIN_MIRROR_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_MIRROR_API
#endif
