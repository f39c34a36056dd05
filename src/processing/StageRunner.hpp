#pragma once

#include "CitationTypes.hpp"
#include "Diagnostics.hpp"
#include "../utils/Profile.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace processing {

// Runs one pipeline stage and wraps its value in a StageResult. A stage that
// throws (std::regex_error on pathological input, allocation failures) comes
// back as a failed result; the caller picks the fallback value.
template<typename T, typename Fn>
citation::StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [started]()
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    };

    try
    {
        T value = std::forward<Fn>(fn)();
        const auto took = elapsed();
        Diagnostics::StageSucceeded(stage_name, took);
        return citation::StageResult<T>::success(std::move(value), took, stage_name);
    }
    catch (const std::exception& ex)
    {
        const auto took = elapsed();
        Diagnostics::StageFailed(stage_name, ex.what(), took);
        return citation::StageResult<T>::failure(ex.what(), took, stage_name);
    }
}

} // namespace processing
