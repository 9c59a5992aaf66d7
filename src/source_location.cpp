#include "expanse/source_location.h"
#include <antlr4-runtime.h>
#include <sstream>

namespace expanse {

std::string SourceLocation::toString() const {
    std::ostringstream oss;
    if (!file_.empty()) {
        oss << file_ << ":";
    }
    oss << line_ << ":" << column_;
    return oss.str();
}

bool SourceLocation::isBefore(const SourceLocation& other) const {
    if (file_ != other.file_) {
        return file_ < other.file_;
    }
    if (line_ != other.line_) {
        return line_ < other.line_;
    }
    return column_ < other.column_;
}

SourceLocation SourceLocation::fromToken(antlr4::Token* token, const std::string& file) {
    if (token) {
        return SourceLocation(
            static_cast<size_t>(token->getLine()),
            static_cast<size_t>(token->getCharPositionInLine() + 1),
            file
        );
    }
    return SourceLocation(1, 1, file);
}

} // namespace expanse
