#pragma once

#include "types.hpp"
#include <vector>
#include <cmath>
#include <string>

namespace trh {

/**
 * @brief One detected chromatographic peak from an integration report.
 *
 * Stores the peak number assigned by the integrator together with the
 * start, apex and end retention times and the integrated area.
 */
class Peak {
public:
    /// Default constructor
    Peak() = default;

    /// Construct with all report columns
    Peak(Index index, RetentionTime start_rt, RetentionTime rt,
         RetentionTime end_rt, Area area)
        : index_(index), start_rt_(start_rt), rt_(rt), end_rt_(end_rt),
          area_(area) {}

    // =========================================================================
    // Report Columns
    // =========================================================================

    /// Get peak number as reported (1-based)
    [[nodiscard]] Index index() const noexcept { return index_; }
    void setIndex(Index idx) noexcept { index_ = idx; }

    /// Get integration start retention time
    [[nodiscard]] RetentionTime startRt() const noexcept { return start_rt_; }
    void setStartRt(RetentionTime rt) noexcept { start_rt_ = rt; }

    /// Get apex retention time
    [[nodiscard]] RetentionTime rt() const noexcept { return rt_; }
    void setRt(RetentionTime rt) noexcept { rt_ = rt; }

    /// Get integration end retention time
    [[nodiscard]] RetentionTime endRt() const noexcept { return end_rt_; }
    void setEndRt(RetentionTime rt) noexcept { end_rt_ = rt; }

    /// Get integrated peak area
    [[nodiscard]] Area area() const noexcept { return area_; }
    void setArea(Area area) noexcept { area_ = area; }

    // =========================================================================
    // Utility Functions
    // =========================================================================

    /// Get RT width of the integration window
    [[nodiscard]] RetentionTime rtWidth() const noexcept {
        return end_rt_ - start_rt_;
    }

    /// Check if RT is within the integration window
    [[nodiscard]] bool containsRt(RetentionTime rt) const noexcept {
        return rt >= start_rt_ && rt <= end_rt_;
    }

    /// Check start <= apex <= end and a non-negative area
    [[nodiscard]] bool isConsistent() const noexcept {
        return start_rt_ <= rt_ && rt_ <= end_rt_ && area_ >= 0.0;
    }

private:
    Index index_ = 0;
    RetentionTime start_rt_ = 0.0;
    RetentionTime rt_ = 0.0;
    RetentionTime end_rt_ = 0.0;
    Area area_ = 0.0;
};

/**
 * @brief Ordered sequence of peaks for one instrument run.
 *
 * Peaks are kept in elution order. Algorithms address peaks by their
 * position in this sequence; the reported peak number is only validated.
 */
class PeakList {
public:
    using iterator = std::vector<Peak>::iterator;
    using const_iterator = std::vector<Peak>::const_iterator;

    PeakList() = default;

    /// Construct from a vector of peaks in elution order
    explicit PeakList(std::vector<Peak> peaks) : peaks_(std::move(peaks)) {}

    /// Get number of peaks
    [[nodiscard]] std::size_t size() const noexcept { return peaks_.size(); }

    /// Check if empty
    [[nodiscard]] bool empty() const noexcept { return peaks_.empty(); }

    /// Access peak by position
    [[nodiscard]] Peak& operator[](std::size_t i) { return peaks_[i]; }
    [[nodiscard]] const Peak& operator[](std::size_t i) const { return peaks_[i]; }

    /// Access peak by position with bounds checking
    [[nodiscard]] const Peak& at(std::size_t i) const { return peaks_.at(i); }

    /// Iterator access
    iterator begin() noexcept { return peaks_.begin(); }
    iterator end() noexcept { return peaks_.end(); }
    const_iterator begin() const noexcept { return peaks_.begin(); }
    const_iterator end() const noexcept { return peaks_.end(); }
    const_iterator cbegin() const noexcept { return peaks_.cbegin(); }
    const_iterator cend() const noexcept { return peaks_.cend(); }

    /// Add a peak
    void add(Peak peak) { peaks_.push_back(std::move(peak)); }

    /// Add peak with all report columns
    void add(Index index, RetentionTime start_rt, RetentionTime rt,
             RetentionTime end_rt, Area area) {
        peaks_.emplace_back(index, start_rt, rt, end_rt, area);
    }

    /// Reserve capacity
    void reserve(std::size_t n) { peaks_.reserve(n); }

    /// Clear all peaks
    void clear() { peaks_.clear(); }

    /**
     * @brief Sum peak areas over positions [low, high).
     *
     * @param low First position to include (0-based)
     * @param high One past the last position to include
     * @return Total area, 0 for an empty range
     * @throws std::invalid_argument if low > high or high > size()
     */
    [[nodiscard]] Area sumAreas(Index low, Index high) const;

    /// Sum of all peak areas
    [[nodiscard]] Area totalArea() const { return sumAreas(0, size()); }

    /// Find the peak carrying a reported peak number
    [[nodiscard]] const Peak* findByIndex(Index index) const;

    /// Find peaks with apex RT within range
    [[nodiscard]] PeakList findInRtRange(RetentionTime low,
                                         RetentionTime high) const;

    /// RT span covered by the integration windows
    [[nodiscard]] RTRange rtRange() const;

    /**
     * @brief Check elution order and per-peak consistency.
     *
     * Peak numbers must be strictly ascending, apex RTs non-decreasing,
     * and every peak must satisfy start <= apex <= end with a
     * non-negative area.
     *
     * @throws std::invalid_argument describing the first violation
     */
    void validate() const;

    /// Get underlying vector
    [[nodiscard]] const std::vector<Peak>& peaks() const noexcept {
        return peaks_;
    }
    std::vector<Peak>& peaks() noexcept { return peaks_; }

private:
    std::vector<Peak> peaks_;
};

} // namespace trh
