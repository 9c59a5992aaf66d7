#pragma once

#include "expanse/model/call.h"
#include "expanse/model/context.h"
#include "expanse/model/signature.h"
#include "expanse/semantic/argument_segmenter.h"
#include "expanse/semantic/catalog_builder.h"
#include "expanse/semantic/constructor_resolver.h"
#include "expanse/semantic/resolution_result.h"
#include "expanse/semantic/signature_validator.h"
#include <vector>

namespace expanse {
namespace semantic {

class TypeCheckOracle;
class VisibilityOracle;

// Entry points used by the host: validate a signature once at declaration
// time, resolve each call expression against it. Both are pure functions of
// their inputs plus the (insert-only) catalog cache, so independent calls
// may run on different threads.
class ExpansionEngine {
public:
    ExpansionEngine(CatalogCache& catalogs,
                    const TypeCheckOracle& typeCheck,
                    const VisibilityOracle& visibility,
                    ValidatorOptions options = ValidatorOptions())
        : catalogs_(catalogs),
          validator_(options),
          resolver_(typeCheck, visibility) {}

    std::vector<ResolutionError> validateSignature(const model::Signature& signature) const;

    ResolutionResult resolveCall(const model::Signature& signature,
                                 const model::ArgumentList& arguments,
                                 const model::SiteContext& callSite) const;

    const ArgumentSegmenter& getSegmenter() const { return segmenter_; }
    const ConstructorResolver& getResolver() const { return resolver_; }

private:
    CatalogCache& catalogs_;
    SignatureValidator validator_;
    ArgumentSegmenter segmenter_;
    ConstructorResolver resolver_;
};

} // namespace semantic
} // namespace expanse
