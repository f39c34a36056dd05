#pragma once

// GOSTREF_PROFILING_LEVEL comes from the CMake cache variable of the same name:
//   0 = macros compile to nothing
//   1 = scope timers written to plog instance kProfilingLogInstance

#ifndef GOSTREF_PROFILING_LEVEL
#define GOSTREF_PROFILING_LEVEL 0
#endif

#if GOSTREF_PROFILING_LEVEL >= 1

#include <chrono>
#include <string>
#include <plog/Log.h>

namespace profiling
{

constexpr int kProfilingLogInstance = 2;

// Logs the lifetime of a scope in microseconds. Owns a copy of the label so
// stage names built on the fly stay valid until the destructor runs.
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string label)
        : label_(std::move(label))
        , started_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                                              started_);
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << label_ << " " << us.count() << "us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string label_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace profiling

#define GOSTREF_PROFILE_CONCAT_(a, b) a##b
#define GOSTREF_PROFILE_CONCAT(a, b) GOSTREF_PROFILE_CONCAT_(a, b)
#define PROFILE_SCOPE_CUSTOM(label) \
    ::profiling::ScopeTimer GOSTREF_PROFILE_CONCAT(gostref_scope_timer_, __LINE__)(label)
#define PROFILE_SCOPE_FUNCTION() PROFILE_SCOPE_CUSTOM(__func__)

#else

#define PROFILE_SCOPE_CUSTOM(label) ((void)sizeof(label))
#define PROFILE_SCOPE_FUNCTION() ((void)0)

#endif
