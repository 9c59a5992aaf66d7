#include "expanse/semantic/argument_segmenter.h"

namespace expanse {
namespace semantic {

Segmentation ArgumentSegmenter::segment(const model::Signature& signature,
                                        const model::ArgumentList& arguments) const {
    Segmentation result;

    const model::ParameterDeclaration* expanded = signature.getExpandedParameter();
    if (!expanded) {
        result.kind = Segmentation::Kind::NotApplicable;
        result.remainder = arguments;
        return result;
    }

    // For an unlabeled expanded parameter a leading unlabeled argument is the
    // value itself.
    if (!arguments.empty() && arguments.front().label == expanded->label) {
        result.kind = Segmentation::Kind::Direct;
        result.directArgument = arguments.front();
        result.remainder.assign(arguments.begin() + 1, arguments.end());
        return result;
    }

    const model::ParameterDeclaration* boundary = signature.getParameterAt(expanded->positionalIndex + 1);

    size_t end = arguments.size();
    if (boundary) {
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (arguments[i].label == boundary->label) {
                end = i;
                break;
            }
        }
    }

    result.expansionSpan.assign(arguments.begin(), arguments.begin() + end);
    result.remainder.assign(arguments.begin() + end, arguments.end());

    for (size_t i = 0; i < result.expansionSpan.size(); ++i) {
        if (result.expansionSpan[i].isTrailingClosureForm) {
            result.kind = Segmentation::Kind::Error;
            result.error = ResolutionError(ResolutionErrorKind::TrailingClosureNotAllowed);
            result.error.argumentIndices.push_back(i);
            result.error.parameterIndices.push_back(expanded->positionalIndex);
            result.error.ownerType = expanded->declaredType;
            return result;
        }
    }

    if (result.expansionSpan.empty() && expanded->hasDefaultValue) {
        result.kind = Segmentation::Kind::Defaulted;
        return result;
    }

    // An empty span without a default still reaches the resolver, which can
    // only pick a zero-parameter constructor.
    result.kind = Segmentation::Kind::Expanded;
    return result;
}

} // namespace semantic
} // namespace expanse
