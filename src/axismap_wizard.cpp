#include "axismap_wizard.hpp"
#include "event_names.hpp"
#include "log.hpp"
#include <thread>

std::optional<bool> judge_polarity(const AxisExtreme& first, const AxisExtreme& second) {
    if (first.code != second.code || first.extreme == second.extreme) {
        return std::nullopt;
    }
    return first.extreme == Extreme::Max;
}

std::optional<int> axis_cancel_key(const ButtonMapping& buttons) {
    if (auto code = buttons.code_for("back")) return code;
    return buttons.code_for("start");
}

AxismapWizard::AxismapWizard(EventReader& reader, std::ostream& out, std::chrono::milliseconds debounce)
    : reader(reader), out(out), debounce(debounce), retries(0) {
}

std::optional<AxisExtreme> AxismapWizard::query(const AxisSlot& slot, const char* direction) {
    if (slot.shape == AxisShape::Unidirectional) {
        out << "Press " << slot.label << " all the way";
    } else {
        out << "Move " << slot.label << " all the way " << direction;
    }
    out << ": ";
    out.flush();

    // Let the control settle, then forget whatever it sent meanwhile
    if (debounce.count() > 0) {
        std::this_thread::sleep_for(debounce);
    }
    reader.drain();

    auto hit = reader.next_extreme_axis(cancel_key);
    if (!hit) {
        out << "skipped\n";
        return std::nullopt;
    }

    out << hit->name << (hit->extreme == Extreme::Min ? " (min)" : " (max)") << "\n";
    return hit;
}

std::optional<AxisBinding> AxismapWizard::probe_bidirectional(const AxisSlot& slot) {
    State state = State::AwaitFirst;
    std::optional<AxisExtreme> first;
    std::optional<AxisExtreme> second;
    std::optional<bool> inverted;

    while (true) {
        switch (state) {
            case State::AwaitFirst:
                first = query(slot, slot.directions[0]);
                state = first ? State::AwaitSecond : State::Cancelled;
                break;

            case State::AwaitSecond:
                second = query(slot, slot.directions[1]);
                if (!second) {
                    state = State::Cancelled;
                    break;
                }
                inverted = judge_polarity(*first, *second);
                state = inverted ? State::Confirmed : State::Mismatched;
                break;

            case State::Mismatched:
                if (first->code != second->code) {
                    out << "  " << first->name << " and " << second->name
                        << " are different axes, let's try " << slot.label << " again\n";
                } else {
                    out << "  " << first->name << " hit the same end both ways, let's try "
                        << slot.label << " again\n";
                }
                retries++;
                first.reset();
                second.reset();
                state = State::AwaitFirst;
                break;

            case State::Confirmed:
                return AxisBinding{slot.name, first->code, first->name, *inverted};

            case State::Cancelled:
                return std::nullopt;
        }
    }
}

std::optional<AxisBinding> AxismapWizard::probe_unidirectional(const AxisSlot& slot) {
    auto hit = query(slot, slot.directions[0]);
    if (!hit) {
        return std::nullopt;
    }
    // Triggers are expected to max out under pressure
    return AxisBinding{slot.name, hit->code, hit->name, hit->extreme == Extreme::Min};
}

AxisMapping AxismapWizard::collect(const ButtonMapping& buttons) {
    AxisMapping mapping;
    cancel_key = axis_cancel_key(buttons);
    retries = 0;

    out << "\n=== Axes ===\n";
    if (cancel_key) {
        out << "Press " << key_name(*cancel_key) << " to skip an axis your controller does not have.\n\n";
    } else {
        out << "No Back or Start button mapped, axes cannot be skipped.\n\n";
    }

    for (const auto& slot : axis_catalog()) {
        std::optional<AxisBinding> binding = slot.shape == AxisShape::Bidirectional
            ? probe_bidirectional(slot)
            : probe_unidirectional(slot);

        if (!binding) {
            continue;
        }

        out << "  " << binding->axis_name << " -> " << binding->axis
            << (binding->inverted ? " (inverted)" : "") << "\n";
        mapping.bindings.push_back(*binding);
    }

    DEBUG_LOG("axis mapping complete: %zu bindings, %d retries\n", mapping.bindings.size(), retries);
    return mapping;
}

AxisMapping collect_axis_mapping(EventReader& reader, const ButtonMapping& buttons,
                                 std::ostream& out, std::chrono::milliseconds debounce) {
    AxismapWizard wizard(reader, out, debounce);
    return wizard.collect(buttons);
}
