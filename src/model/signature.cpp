#include "expanse/model/signature.h"
#include <sstream>

namespace expanse {
namespace model {

const ParameterDeclaration* Signature::getExpandedParameter() const {
    for (const auto& param : parameters_) {
        if (param.isExpanded) {
            return &param;
        }
    }
    return nullptr;
}

size_t Signature::countExpandedParameters() const {
    size_t count = 0;
    for (const auto& param : parameters_) {
        if (param.isExpanded) {
            ++count;
        }
    }
    return count;
}

const ParameterDeclaration* Signature::getParameterAt(size_t positionalIndex) const {
    for (const auto& param : parameters_) {
        if (param.positionalIndex == positionalIndex) {
            return &param;
        }
    }
    return nullptr;
}

std::string Signature::toString() const {
    std::ostringstream oss;
    oss << name_ << "(";
    for (size_t i = 0; i < parameters_.size(); ++i) {
        const auto& param = parameters_[i];
        if (i > 0) oss << ", ";
        oss << (param.label.empty() ? "_" : param.label) << ": ";
        if (param.isExpanded) oss << "@expanded ";
        if (param.isByReference) oss << "inout ";
        oss << param.declaredType.toString();
        if (param.hasDefaultValue) oss << " = ...";
    }
    oss << ")";
    return oss.str();
}

} // namespace model
} // namespace expanse
