#pragma once

#include "core/types/CycleReport.hpp"

#include <cstddef>
#include <vector>

namespace netprobe::monitoring {

/**
 * @brief Append-only record of completed cycle reports.
 *
 * Reports are never modified once appended. Owned by the application and
 * written only by the monitor loop's control flow.
 */
class ResultHistory {
public:
    /**
     * @brief Appends a completed report.
     * @return Reference to the stored report.
     */
    const core::CycleReport& append(core::CycleReport report);

    const std::vector<core::CycleReport>& records() const { return records_; }
    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    /**
     * @brief Returns the most recently appended report.
     * @note The history must not be empty.
     */
    const core::CycleReport& latest() const { return records_.back(); }

private:
    std::vector<core::CycleReport> records_;
};

} // namespace netprobe::monitoring
