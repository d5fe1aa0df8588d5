// =============================================================================
// NeuroField - Snapshots
// =============================================================================
// Immutable copies of the field (and optionally its energy flow) handed to
// visualization, plus a bounded history of recent snapshots for time-stacked
// views.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "EnergyFlow.h"
#include <deque>
#include <utility>
#include <optional>
#include <vector>

namespace NeuroField {

struct Snapshot {
    f64 time = 0.0;
    u64 step = 0;
    Index3 dimensions{ 0, 0, 0 };
    Real3 extents{ 0.0, 0.0, 0.0 };

    std::vector<f64> activity;
    f64 activityMin = 0.0;
    f64 activityMax = 0.0;

    // Present only when requested
    std::optional<EnergyFlowField> energyFlow;

    bool hasEnergyFlow() const { return energyFlow.has_value(); }
};

class SnapshotHistory {
public:
    explicit SnapshotHistory(u32 capacity = 50) : m_capacity(capacity) {}

    void push(Snapshot snapshot) {
        if (m_capacity == 0) return;
        if (m_entries.size() == m_capacity) {
            m_entries.pop_front();
        }
        m_entries.push_back(std::move(snapshot));
    }

    void clear() { m_entries.clear(); }

    void setCapacity(u32 capacity) {
        m_capacity = capacity;
        while (m_entries.size() > m_capacity) {
            m_entries.pop_front();
        }
    }

    u32 getCapacity() const { return m_capacity; }
    usize size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // Oldest first
    const Snapshot& at(usize index) const { return m_entries.at(index); }
    const Snapshot& latest() const { return m_entries.back(); }

    auto begin() const { return m_entries.begin(); }
    auto end() const { return m_entries.end(); }

private:
    u32 m_capacity;
    std::deque<Snapshot> m_entries;
};

} // namespace NeuroField
