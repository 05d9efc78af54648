#pragma once

/// genko logging. Every line carries the "Genko" tag and a level letter
/// (D, I, W); arguments are printf-style. Android builds hand lines to
/// logcat, all others write them to stderr.

#ifdef __ANDROID__

#include <android/log.h>

#define GK_LOG_TAG "Genko"
#define GK_LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, GK_LOG_TAG, __VA_ARGS__)
#define GK_LOGI(...) __android_log_print(ANDROID_LOG_INFO,  GK_LOG_TAG, __VA_ARGS__)
#define GK_LOGW(...) __android_log_print(ANDROID_LOG_WARN,  GK_LOG_TAG, __VA_ARGS__)

#else

#include <cstdio>

#define GK_LOGD(fmt, ...) fprintf(stderr, "[Genko D] " fmt "\n", ##__VA_ARGS__)
#define GK_LOGI(fmt, ...) fprintf(stderr, "[Genko I] " fmt "\n", ##__VA_ARGS__)
#define GK_LOGW(fmt, ...) fprintf(stderr, "[Genko W] " fmt "\n", ##__VA_ARGS__)

#endif
