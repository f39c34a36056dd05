#include "Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <utf8proc.h>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };
std::mutex Diagnostics::failures_mutex_;
std::map<std::string, std::size_t> Diagnostics::failures_;

void Diagnostics::SetVerbose(bool enabled) noexcept { verbose_.store(enabled, std::memory_order_relaxed); }

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t chars) noexcept
{
    max_preview_.store(chars == 0 ? 1 : chars, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    const auto* bytes = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto total = static_cast<utf8proc_ssize_t>(text.size());

    std::string out;
    std::size_t shown = 0;
    utf8proc_ssize_t at = 0;
    for (; at < total && shown < limit; ++shown)
    {
        utf8proc_int32_t cp = -1;
        const utf8proc_ssize_t width = utf8proc_iterate(bytes + at, total - at, &cp);
        if (width <= 0)
        {
            // broken sequence: mark it and resync on the next byte
            out += '?';
            ++at;
            continue;
        }

        if (cp == '\n')
            out += "\\n";
        else if (cp == '\r')
            out += "\\r";
        else if (cp == '\t')
            out += "\\t";
        else if (cp < 0x20 || cp == 0x7F)
            out += '?';
        else
            out.append(text.data() + at, static_cast<std::size_t>(width));
        at += width;
    }

    if (at < total)
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

void Diagnostics::StageSucceeded(const std::string& stage, std::chrono::microseconds took)
{
    if (IsVerbose())
        PLOG_DEBUG_(kLogInstance) << "Stage '" << stage << "' succeeded in " << took.count() << "us";
}

void Diagnostics::StageFailed(const std::string& stage, const std::string& reason, std::chrono::microseconds took)
{
    {
        std::lock_guard<std::mutex> lock(failures_mutex_);
        ++failures_[stage];
    }
    PLOG_ERROR_(kLogInstance) << "Stage '" << stage << "' failed in " << took.count() << "us: " << reason;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Pipeline, "Citation pipeline stage failed",
                                        stage + ": " + reason);
}

std::map<std::string, std::size_t> Diagnostics::StageFailures()
{
    std::lock_guard<std::mutex> lock(failures_mutex_);
    return failures_;
}

void Diagnostics::ResetCounters()
{
    std::lock_guard<std::mutex> lock(failures_mutex_);
    failures_.clear();
}

} // namespace processing
