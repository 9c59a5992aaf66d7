#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include <unordered_map>
#include "source_location.h"

namespace expanse {

enum class Severity {
    Error,
    Warning
};

namespace ErrorCodes {
    // Syntax errors (E001-E099)
    constexpr const char* SYNTAX_ERROR = "E001";
    constexpr const char* UNEXPECTED_TOKEN = "E002";
    constexpr const char* MISSING_TOKEN = "E003";
    constexpr const char* MISMATCHED_BRACKET = "E004";

    // Declaration errors (E100-E199)
    constexpr const char* UNDEFINED_TYPE = "E100";
    constexpr const char* UNDEFINED_VARIABLE = "E101";
    constexpr const char* UNDEFINED_FUNCTION = "E102";
    constexpr const char* REDEFINED_TYPE = "E103";
    constexpr const char* REDEFINED_VARIABLE = "E104";
    constexpr const char* INVALID_SUPERTYPE = "E105";

    // Expanded signature errors (E200-E299)
    constexpr const char* INVALID_EXPANDED_PLACEMENT = "E200";
    constexpr const char* MULTIPLE_EXPANDED_PARAMETERS = "E201";
    constexpr const char* OVERLOAD_CONFLICT_WITH_EXPANDED = "E202";
    constexpr const char* NON_NOMINAL_EXPANDED_TYPE = "E203";
    constexpr const char* ABSTRACT_TYPE_NOT_EXPANDABLE = "E204";
    constexpr const char* BY_REFERENCE_EXPANDED_CONFLICT = "E205";
    constexpr const char* DEFAULT_ARGUMENT_ADJACENCY = "E206";

    // Call resolution errors (E300-E399)
    constexpr const char* NO_MATCHING_INITIALIZER = "E300";
    constexpr const char* AMBIGUOUS_INITIALIZER = "E301";
    constexpr const char* INACCESSIBLE_INITIALIZER = "E302";
    constexpr const char* TRAILING_CLOSURE_NOT_ALLOWED = "E303";
    constexpr const char* ARGUMENT_TYPE_MISMATCH = "E304";
    constexpr const char* ARGUMENT_LABEL_MISMATCH = "E305";
    constexpr const char* MISSING_ARGUMENT = "E306";
    constexpr const char* EXTRA_ARGUMENT = "E307";
    constexpr const char* NO_MATCHING_OVERLOAD = "E308";

    // Warnings (W001-W099)
    constexpr const char* OPTIONAL_EXPANDED_TYPE = "W001";
}

// Error code structure: E001, E002, etc. for errors, W001, W002 for warnings
struct ErrorCode {
    std::string code;      // e.g., "E300", "W001"
    std::string category;  // e.g., "syntax", "declaration", "expansion"
    
    ErrorCode() : code(""), category("") {}
    ErrorCode(const std::string& c, const std::string& cat) : code(c), category(cat) {}
    
    bool empty() const { return code.empty(); }
};

// A run of source text to underline, usually one call argument
struct ArgumentMark {
    SourceLocation start;
    size_t width = 1;

    ArgumentMark() {}
    ArgumentMark(const SourceLocation& s, size_t w) : start(s), width(w) {}
};

// A quoted source line and the marker row printed beneath it. Both are
// already tab-expanded.
struct ExcerptLine {
    size_t line = 0;
    std::string text;
    std::string markers;
};

struct Diagnostic {
    Severity severity;
    SourceLocation location;
    std::string message;
    ErrorCode errorCode;
    std::vector<std::string> notes;
    std::vector<std::string> help;

    // One entry per source line touched by the marks, in source order
    std::vector<ExcerptLine> excerpt;

    Diagnostic(Severity sev, const SourceLocation& loc, const std::string& msg, const ErrorCode& code)
        : severity(sev), location(loc), message(msg), errorCode(code) {}
};

class ErrorReporter {
public:
    ErrorReporter();
    ~ErrorReporter();

    // Register the text of an input file so diagnostics can quote it
    void setSource(const std::string& file, const std::string& source);

    void setTabWidth(size_t width) { tabWidth_ = width == 0 ? 1 : width; }
    size_t getTabWidth() const { return tabWidth_; }

    // Error at a single token; `width` columns are underlined
    void error(const SourceLocation& location, const std::string& message,
               const ErrorCode& code = ErrorCode(), size_t width = 1);

    // Error about specific call arguments. Each mark is underlined on its
    // own line; the diagnostic is located at the first mark.
    void errorAtArguments(const std::vector<ArgumentMark>& marks, const std::string& message,
                          const ErrorCode& code);

    void warning(const SourceLocation& location, const std::string& message,
                 const ErrorCode& code = ErrorCode());

    // Attach to the most recent diagnostic
    void addNote(const std::string& note);
    void addHelp(const std::string& help);

    bool hasErrors() const { return errorCount_ > 0; }
    size_t getErrorCount() const { return errorCount_; }
    size_t getWarningCount() const { return warningCount_; }

    const std::vector<Diagnostic>& getDiagnostics() const { return diagnostics_; }

    // True if any recorded diagnostic carries the given code (e.g. "E300")
    bool hasErrorCode(const std::string& code) const;
    size_t countErrorCode(const std::string& code) const;

    void print(std::ostream& out) const;

    void clear();

private:
    std::vector<Diagnostic> diagnostics_;
    size_t errorCount_;
    size_t warningCount_;
    size_t tabWidth_;

    std::unordered_map<std::string, std::vector<std::string>> sources_;

    void record(Severity severity, const SourceLocation& location, const std::string& message,
                const ErrorCode& code, const std::vector<ArgumentMark>& marks);
    void buildExcerpt(Diagnostic& diagnostic, const std::vector<ArgumentMark>& marks) const;
    const std::string* lineAt(const SourceLocation& location) const;
    size_t visualColumn(const std::string& line, size_t column) const;
    std::string expandTabs(const std::string& line) const;
};

} // namespace expanse
