#pragma once
#ifndef CONFORM_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define CONFORM_PLATFORM_WINDOWS 1
#else
#define CONFORM_PLATFORM_WINDOWS 0
#endif
#if CONFORM_PLATFORM_WINDOWS
#if defined(CONFORM_BUILD_SHARED)
#define CONFORM_API __declspec(dllexport)
#elif defined(CONFORM_SHARED)
#define CONFORM_API __declspec(dllimport)
#else
#define CONFORM_API
#endif
#else
#if defined(CONFORM_BUILD_SHARED) || defined(CONFORM_SHARED)
#if __GNUC__ >= 4
#define CONFORM_API __attribute__((visibility("default")))
#else
#define CONFORM_API
#endif // __GNUC__
#else
#define CONFORM_API
#endif // CONFORM_BUILD_SHARED || CONFORM_SHARED
#endif // CONFORM_PLATFORM_WINDOWS
#endif // CONFORM_API
