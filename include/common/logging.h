// Copyright (C) 2024 by Brenton Bostick
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and
// associated documentation files (the "Software"), to deal in the Software without restriction,
// including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do
// so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all copies or substantial
// portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
// FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS
// OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
// WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
// CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

//
// Each including .cpp defines TAG before using these
//

#if defined(__ANDROID__)

#include <android/log.h>

#define LOG_PRINT(prio, fmt, ...) __android_log_print(prio, TAG, fmt __VA_OPT__(,) __VA_ARGS__)

#define LOGE(fmt, ...) LOG_PRINT(ANDROID_LOG_ERROR, fmt __VA_OPT__(,) __VA_ARGS__)
#define LOGW(fmt, ...) LOG_PRINT(ANDROID_LOG_WARN, fmt __VA_OPT__(,) __VA_ARGS__)
#define LOGI(fmt, ...) LOG_PRINT(ANDROID_LOG_INFO, fmt __VA_OPT__(,) __VA_ARGS__)

#ifdef NDEBUG
#define LOGD(fmt, ...)
#define LOGV(fmt, ...)
#else
#define LOGD(fmt, ...) LOG_PRINT(ANDROID_LOG_DEBUG, fmt __VA_OPT__(,) __VA_ARGS__)
#define LOGV(fmt, ...) LOG_PRINT(ANDROID_LOG_VERBOSE, fmt __VA_OPT__(,) __VA_ARGS__)
#endif // NDEBUG

#else // defined(__ANDROID__)

#include <cstdio> // for fprintf, fflush, stderr

#define LOG_PRINT(fmt, ...) \
   do { \
      fprintf(stderr, fmt "\n" __VA_OPT__(,) __VA_ARGS__); \
      fflush(stderr); \
   } while (0)

#define LOGE(fmt, ...) LOG_PRINT(fmt __VA_OPT__(,) __VA_ARGS__)
#define LOGW(fmt, ...) LOG_PRINT(fmt __VA_OPT__(,) __VA_ARGS__)
#define LOGI(fmt, ...) LOG_PRINT(fmt __VA_OPT__(,) __VA_ARGS__)

#ifdef NDEBUG
#define LOGD(fmt, ...)
#define LOGV(fmt, ...)
#else
#define LOGD(fmt, ...) LOG_PRINT(fmt __VA_OPT__(,) __VA_ARGS__)
#define LOGV(fmt, ...) LOG_PRINT(fmt __VA_OPT__(,) __VA_ARGS__)
#endif // NDEBUG

#endif // defined(__ANDROID__)
