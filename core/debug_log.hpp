#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef RGCX_ENABLE_DEBUG_LOG
#define RGCX_DBG_LOG(...) std::fprintf(stderr, __VA_ARGS__)
#define RGCX_DBG_CODE(code) \
    do {                    \
        code;               \
    } while (0)
#else
#define RGCX_DBG_LOG(...) \
    do {                  \
    } while (0)
#define RGCX_DBG_CODE(code) \
    do {                    \
    } while (0)
#endif

#define RGCX_WARN_LOG(...) std::fprintf(stderr, __VA_ARGS__)

namespace rigcx::core {

// RGCX_TRACE_RECONCILE=1 prints every structural change made by update().
inline bool traceReconcileEnabled() {
    static int enabled = -1;
    if (enabled >= 0) return enabled != 0;
    const char* v = std::getenv("RGCX_TRACE_RECONCILE");
    if (!v) {
        enabled = 0;
        return false;
    }
    enabled = (std::strcmp(v, "1") == 0 || std::strcmp(v, "true") == 0 || std::strcmp(v, "TRUE") == 0) ? 1 : 0;
    return enabled != 0;
}

} // namespace rigcx::core

#define RGCX_TRACE_LOG(...)                          \
    do {                                             \
        if (::rigcx::core::traceReconcileEnabled()) { \
            std::fprintf(stderr, __VA_ARGS__);       \
        }                                            \
    } while (0)
