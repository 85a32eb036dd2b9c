#pragma once

#include <chrono>
#include <optional>
#include <ostream>

#include "catalog.hpp"
#include "event_reader.hpp"
#include "mapping.hpp"

// Pairs the readings of the two directions of one axis. Returns the
// inverted flag, or nullopt when the readings contradict each other
// (different axes, or the same extreme both ways).
std::optional<bool> judge_polarity(const AxisExtreme& first, const AxisExtreme& second);

// Cancel key used to skip an axis: the key bound to back, else to start
std::optional<int> axis_cancel_key(const ButtonMapping& buttons);

class AxismapWizard {
public:
    AxismapWizard(EventReader& reader, std::ostream& out, std::chrono::milliseconds debounce);

    AxisMapping collect(const ButtonMapping& buttons);

    // Number of axis passes thrown away because the readings disagreed
    int get_retries() const { return retries; }

private:
    enum class State { AwaitFirst, AwaitSecond, Confirmed, Mismatched, Cancelled };

    EventReader& reader;
    std::ostream& out;
    std::chrono::milliseconds debounce;
    std::optional<int> cancel_key;
    int retries;

    std::optional<AxisExtreme> query(const AxisSlot& slot, const char* direction);
    std::optional<AxisBinding> probe_bidirectional(const AxisSlot& slot);
    std::optional<AxisBinding> probe_unidirectional(const AxisSlot& slot);
};

AxisMapping collect_axis_mapping(EventReader& reader, const ButtonMapping& buttons,
                                 std::ostream& out, std::chrono::milliseconds debounce);
