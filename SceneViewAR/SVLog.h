//
//  SVLog.h
//  SceneViewAR
//
//  Copyright © 2025 Viro Media. All rights reserved.
//
//  Permission is hereby granted, free of charge, to any person obtaining
//  a copy of this software and associated documentation files (the
//  "Software"), to deal in the Software without restriction, including
//  without limitation the rights to use, copy, modify, merge, publish,
//  distribute, sublicense, and/or sell copies of the Software, and to
//  permit persons to whom the Software is furnished to do so, subject to
//  the following conditions:
//
//  The above copyright notice and this permission notice shall be included
//  in all copies or substantial portions of the Software.
//
//  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
//  EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
//  MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
//  IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY
//  CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
//  TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE
//  SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#ifndef SVLog_h
#define SVLog_h

#include <stdio.h>

#define SV_LOG_TAG "SceneViewAR"

#if defined(__ANDROID__)

#include <android/log.h>

#define pinfo(...)  __android_log_print(ANDROID_LOG_INFO,  SV_LOG_TAG, __VA_ARGS__)
#define pwarn(...)  __android_log_print(ANDROID_LOG_WARN,  SV_LOG_TAG, __VA_ARGS__)
#define perr(...)   __android_log_print(ANDROID_LOG_ERROR, SV_LOG_TAG, __VA_ARGS__)

#ifdef SV_DEBUG_LOGGING
#define pdebug(...) __android_log_print(ANDROID_LOG_DEBUG, SV_LOG_TAG, __VA_ARGS__)
#else
#define pdebug(...) ((void)0)
#endif

#else

#define SV_LOG_PRINT(stream, level, ...) \
    do { \
        fprintf(stream, "[" SV_LOG_TAG "] " level ": "); \
        fprintf(stream, __VA_ARGS__); \
        fprintf(stream, "\n"); \
    } while (0)

#define pinfo(...)  SV_LOG_PRINT(stdout, "I", __VA_ARGS__)
#define pwarn(...)  SV_LOG_PRINT(stderr, "W", __VA_ARGS__)
#define perr(...)   SV_LOG_PRINT(stderr, "E", __VA_ARGS__)

#ifdef SV_DEBUG_LOGGING
#define pdebug(...) SV_LOG_PRINT(stdout, "D", __VA_ARGS__)
#else
#define pdebug(...) ((void)0)
#endif

#endif

#endif /* SVLog_h */
