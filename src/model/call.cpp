#include "expanse/model/call.h"

namespace expanse {
namespace model {

bool CallArgument::operator==(const CallArgument& other) const {
    if (label != other.label || isTrailingClosureForm != other.isTrailingClosureForm) {
        return false;
    }
    if (!value || !other.value) {
        return value == other.value;
    }
    return *value == *other.value;
}

std::string labelShape(const std::vector<std::string>& labels) {
    std::string shape = "(";
    for (const auto& label : labels) {
        shape += label.empty() ? "_" : label;
        shape += ":";
    }
    shape += ")";
    return shape;
}

std::string labelShape(const ArgumentList& args) {
    std::vector<std::string> labels;
    labels.reserve(args.size());
    for (const auto& arg : args) {
        labels.push_back(arg.label);
    }
    return labelShape(labels);
}

} // namespace model
} // namespace expanse
