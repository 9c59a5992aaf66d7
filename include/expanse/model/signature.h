#pragma once

#include "expanse/model/context.h"
#include "expanse/model/expressions.h"
#include "expanse/model/types.h"
#include "expanse/source_location.h"
#include <string>
#include <vector>

namespace expanse {
namespace model {

// One declared parameter. An empty label means the parameter is unlabeled.
struct ParameterDeclaration {
    std::string label;
    size_t positionalIndex = 0;
    TypeRef declaredType;
    bool isExpanded = false;
    bool hasDefaultValue = false;
    bool isByReference = false;

    ExprPtr defaultValue;  // null when hasDefaultValue is false or not known
    SourceLocation location;
};

// Parameter list of one callable plus what its overload set says about it
class Signature {
public:
    Signature() : hasSiblingOverloads_(false) {}
    Signature(const std::string& name,
              std::vector<ParameterDeclaration> parameters,
              bool hasSiblingOverloads,
              const SiteContext& declaredAt,
              const SourceLocation& location = SourceLocation())
        : name_(name), parameters_(std::move(parameters)),
          hasSiblingOverloads_(hasSiblingOverloads),
          declaredAt_(declaredAt), location_(location) {}

    const std::string& getName() const { return name_; }
    const std::vector<ParameterDeclaration>& getParameters() const { return parameters_; }
    size_t size() const { return parameters_.size(); }
    bool hasSiblingOverloads() const { return hasSiblingOverloads_; }

    // Declaration-site context: the catalog for the expanded type is locked here
    const SiteContext& getDeclarationContext() const { return declaredAt_; }
    const SourceLocation& getLocation() const { return location_; }

    // First parameter flagged expanded, or nullptr
    const ParameterDeclaration* getExpandedParameter() const;
    size_t countExpandedParameters() const;
    bool hasExpandedParameter() const { return getExpandedParameter() != nullptr; }

    // Parameter at the given positional index, or nullptr
    const ParameterDeclaration* getParameterAt(size_t positionalIndex) const;

    // e.g. "draw(at: @expanded Point, color: Int = ...)"
    std::string toString() const;

private:
    std::string name_;
    std::vector<ParameterDeclaration> parameters_;
    bool hasSiblingOverloads_;
    SiteContext declaredAt_;
    SourceLocation location_;
};

} // namespace model
} // namespace expanse
