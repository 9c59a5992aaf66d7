#pragma once

#include "expanse/model/call.h"
#include "expanse/model/signature.h"
#include "expanse/semantic/resolution_result.h"

namespace expanse {
namespace semantic {

// How a call's arguments split around the expanded parameter
struct Segmentation {
    enum class Kind {
        NotApplicable,  // no expanded parameter in the signature
        Direct,         // first argument carries the expanded parameter's label
        Expanded,       // expansionSpan feeds a constructor (may be empty)
        Defaulted,      // empty span, parameter default applies
        Error
    };

    Kind kind = Kind::NotApplicable;
    model::ArgumentList expansionSpan;
    model::ArgumentList remainder;
    model::CallArgument directArgument;
    ResolutionError error = ResolutionError(ResolutionErrorKind::TrailingClosureNotAllowed);
};

class ArgumentSegmenter {
public:
    Segmentation segment(const model::Signature& signature,
                         const model::ArgumentList& arguments) const;
};

} // namespace semantic
} // namespace expanse
