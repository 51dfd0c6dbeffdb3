#pragma once

#include "types.hpp"
#include "peak.hpp"
#include <string>

namespace trh {

/**
 * @brief One instrument run: sample identity plus its integrated peaks.
 *
 * The name and acquisition time are carried through to the output
 * records; the quantification engine only reads the peak list.
 */
class SampleRun {
public:
    SampleRun() = default;

    SampleRun(std::string name, PeakList peaks)
        : name_(std::move(name)), peaks_(std::move(peaks)) {}

    // Move/copy operations
    SampleRun(SampleRun&&) noexcept = default;
    SampleRun& operator=(SampleRun&&) noexcept = default;
    SampleRun(const SampleRun&) = default;
    SampleRun& operator=(const SampleRun&) = default;

    // =========================================================================
    // Identification
    // =========================================================================

    /// Get sample name
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    /// Get acquisition time as reported
    [[nodiscard]] const std::string& acquiredTime() const noexcept {
        return acquired_time_;
    }
    void setAcquiredTime(std::string t) { acquired_time_ = std::move(t); }

    /// Get source file path
    [[nodiscard]] const std::string& sourceFile() const noexcept {
        return source_file_;
    }
    void setSourceFile(std::string path) { source_file_ = std::move(path); }

    // =========================================================================
    // Peaks
    // =========================================================================

    /// Get integrated peaks
    [[nodiscard]] const PeakList& peaks() const noexcept { return peaks_; }
    PeakList& peaks() noexcept { return peaks_; }
    void setPeaks(PeakList peaks) { peaks_ = std::move(peaks); }

private:
    std::string name_;
    std::string acquired_time_;
    std::string source_file_;
    PeakList peaks_;
};

} // namespace trh
