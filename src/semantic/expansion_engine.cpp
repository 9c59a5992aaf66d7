#include "expanse/semantic/expansion_engine.h"

namespace expanse {
namespace semantic {

std::vector<ResolutionError> ExpansionEngine::validateSignature(const model::Signature& signature) const {
    return validator_.validate(signature);
}

ResolutionResult ExpansionEngine::resolveCall(const model::Signature& signature,
                                              const model::ArgumentList& arguments,
                                              const model::SiteContext& callSite) const {
    Segmentation segmentation = segmenter_.segment(signature, arguments);

    switch (segmentation.kind) {
        case Segmentation::Kind::NotApplicable:
            return ResolutionResult::notApplicable(segmentation.remainder);
        case Segmentation::Kind::Direct:
            return ResolutionResult::direct(segmentation.directArgument, segmentation.remainder);
        case Segmentation::Kind::Defaulted:
            return ResolutionResult::defaulted(segmentation.remainder);
        case Segmentation::Kind::Error:
            return ResolutionResult::failure(segmentation.error);
        case Segmentation::Kind::Expanded:
            break;
    }

    const model::ParameterDeclaration* expanded = signature.getExpandedParameter();
    CatalogPtr catalog = catalogs_.get(expanded->declaredType, signature.getDeclarationContext());

    ConstructorMatch match = resolver_.resolve(segmentation.expansionSpan, *catalog, callSite);
    if (!match.ok) {
        match.error.parameterIndices.push_back(expanded->positionalIndex);
        return ResolutionResult::failure(match.error);
    }
    return ResolutionResult::constructed(match.candidate, segmentation.expansionSpan, segmentation.remainder);
}

} // namespace semantic
} // namespace expanse
