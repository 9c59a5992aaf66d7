#pragma once

#include "expanse/error_reporter.h"
#include "expanse/model/call.h"
#include "expanse/model/signature.h"
#include "expanse/semantic/resolution_result.h"
#include <vector>

namespace expanse {
namespace semantic {

// Error code for a resolution error kind (E200-E304)
ErrorCode errorCodeFor(ResolutionErrorKind kind);

// Render declaration-time errors, anchored at the offending parameters
void reportSignatureErrors(ErrorReporter& reporter,
                           const model::Signature& signature,
                           const std::vector<ResolutionError>& errors);

// Render a call-site error, anchored at the offending arguments (or at the
// call itself when no argument is involved)
void reportCallError(ErrorReporter& reporter,
                     const ResolutionError& error,
                     const model::Signature& signature,
                     const model::ArgumentList& arguments,
                     const SourceLocation& callLocation);

} // namespace semantic
} // namespace expanse
