#include "expanse/model/constructor.h"
#include <sstream>

namespace expanse {
namespace model {

std::string ConstructorCandidate::getDisplayName() const {
    std::ostringstream oss;
    oss << owningType.toString() << ".init(";
    for (const auto& label : parameterLabels) {
        oss << (label.empty() ? "_" : label) << ":";
    }
    oss << ")";
    return oss.str();
}

std::string ConstructorCandidate::getSignatureString() const {
    std::ostringstream oss;
    oss << "init(";
    for (size_t i = 0; i < parameterLabels.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << (parameterLabels[i].empty() ? "_" : parameterLabels[i]) << ": ";
        oss << (i < parameterTypes.size() ? parameterTypes[i].toString() : std::string("<error>"));
    }
    oss << ")";
    return oss.str();
}

bool ConstructorCandidate::operator==(const ConstructorCandidate& other) const {
    return owningType == other.owningType &&
           parameterLabels == other.parameterLabels &&
           parameterTypes == other.parameterTypes &&
           visibility == other.visibility &&
           declaringModule == other.declaringModule &&
           declaredAt == other.declaredAt;
}

} // namespace model
} // namespace expanse
