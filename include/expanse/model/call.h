#pragma once

#include "expanse/model/expressions.h"
#include "expanse/source_location.h"
#include <string>
#include <vector>

namespace expanse {
namespace model {

// One argument as written at the call site. An empty label means unlabeled.
struct CallArgument {
    std::string label;
    ExprPtr value;
    bool isTrailingClosureForm = false;
    SourceLocation location;  // of the label if present, else of the value

    CallArgument() {}
    CallArgument(const std::string& l, ExprPtr v, bool trailing = false)
        : label(l), value(std::move(v)), isTrailingClosureForm(trailing) {
        if (value) {
            location = value->getLocation();
        }
    }

    bool operator==(const CallArgument& other) const;
    bool operator!=(const CallArgument& other) const { return !(*this == other); }
};

using ArgumentList = std::vector<CallArgument>;

// "(x:y:_:)" style rendering of the label shape
std::string labelShape(const ArgumentList& args);
std::string labelShape(const std::vector<std::string>& labels);

} // namespace model
} // namespace expanse
