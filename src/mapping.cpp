#include "mapping.hpp"

std::optional<int> ButtonMapping::code_for(const std::string& button) const {
    for (const auto& binding : bindings) {
        if (binding.button == button) {
            return binding.code;
        }
    }
    return std::nullopt;
}

const ButtonBinding* ButtonMapping::find_code(int code) const {
    for (const auto& binding : bindings) {
        if (binding.code == code) {
            return &binding;
        }
    }
    return nullptr;
}

const AxisBinding* AxisMapping::find(const std::string& axis) const {
    for (const auto& binding : bindings) {
        if (binding.axis == axis) {
            return &binding;
        }
    }
    return nullptr;
}
