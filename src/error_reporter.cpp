#include "expanse/error_reporter.h"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace expanse {

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

const char* severityName(Severity severity) {
    return severity == Severity::Warning ? "warning" : "error";
}

} // namespace

ErrorReporter::ErrorReporter()
    : errorCount_(0), warningCount_(0), tabWidth_(4) {
}

ErrorReporter::~ErrorReporter() = default;

void ErrorReporter::setSource(const std::string& file, const std::string& source) {
    sources_[file] = splitLines(source);
}

const std::string* ErrorReporter::lineAt(const SourceLocation& location) const {
    auto it = sources_.find(location.getFile());
    if (it == sources_.end()) {
        return nullptr;
    }
    if (location.getLine() == 0 || location.getLine() > it->second.size()) {
        return nullptr;
    }
    return &it->second[location.getLine() - 1];
}

// Offset of the 1-based `column` in the tab-expanded line
size_t ErrorReporter::visualColumn(const std::string& line, size_t column) const {
    size_t visual = 0;
    for (size_t i = 0; i + 1 < column && i < line.size(); ++i) {
        visual = line[i] == '\t' ? (visual / tabWidth_ + 1) * tabWidth_ : visual + 1;
    }
    return visual;
}

std::string ErrorReporter::expandTabs(const std::string& line) const {
    std::string out;
    for (char ch : line) {
        if (ch == '\t') {
            out.append(tabWidth_ - out.size() % tabWidth_, ' ');
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

void ErrorReporter::buildExcerpt(Diagnostic& diagnostic, const std::vector<ArgumentMark>& marks) const {
    for (const auto& mark : marks) {
        const std::string* raw = lineAt(mark.start);
        if (!raw) {
            continue;
        }
        // Marks arrive in argument order, so marks on one line are adjacent
        if (diagnostic.excerpt.empty() || diagnostic.excerpt.back().line != mark.start.getLine()) {
            ExcerptLine entry;
            entry.line = mark.start.getLine();
            entry.text = expandTabs(*raw);
            diagnostic.excerpt.push_back(entry);
        }

        std::string& markers = diagnostic.excerpt.back().markers;
        const size_t from = visualColumn(*raw, mark.start.getColumn());
        const size_t width = std::max<size_t>(mark.width, 1);
        if (markers.size() < from + width) {
            markers.resize(from + width, ' ');
        }
        markers[from] = '^';
        for (size_t i = from + 1; i < from + width; ++i) {
            if (markers[i] == ' ') {
                markers[i] = '~';
            }
        }
    }
}

void ErrorReporter::record(Severity severity, const SourceLocation& location, const std::string& message,
                           const ErrorCode& code, const std::vector<ArgumentMark>& marks) {
    Diagnostic diagnostic(severity, location, message, code);
    buildExcerpt(diagnostic, marks);
    if (severity == Severity::Error) {
        ++errorCount_;
    } else {
        ++warningCount_;
    }
    diagnostics_.push_back(std::move(diagnostic));
}

void ErrorReporter::error(const SourceLocation& location, const std::string& message,
                          const ErrorCode& code, size_t width) {
    record(Severity::Error, location, message, code, {ArgumentMark(location, width)});
}

void ErrorReporter::errorAtArguments(const std::vector<ArgumentMark>& marks, const std::string& message,
                                     const ErrorCode& code) {
    SourceLocation location = marks.empty() ? SourceLocation() : marks.front().start;
    record(Severity::Error, location, message, code, marks);
}

void ErrorReporter::warning(const SourceLocation& location, const std::string& message,
                            const ErrorCode& code) {
    record(Severity::Warning, location, message, code, {ArgumentMark(location, 1)});
}

void ErrorReporter::addNote(const std::string& note) {
    if (!diagnostics_.empty()) {
        diagnostics_.back().notes.push_back(note);
    }
}

void ErrorReporter::addHelp(const std::string& help) {
    if (!diagnostics_.empty()) {
        diagnostics_.back().help.push_back(help);
    }
}

bool ErrorReporter::hasErrorCode(const std::string& code) const {
    return countErrorCode(code) > 0;
}

size_t ErrorReporter::countErrorCode(const std::string& code) const {
    return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
        [&code](const Diagnostic& d) { return d.errorCode.code == code; }));
}

void ErrorReporter::print(std::ostream& out) const {
    for (const auto& diagnostic : diagnostics_) {
        out << severityName(diagnostic.severity);
        if (!diagnostic.errorCode.empty()) {
            out << "[" << diagnostic.errorCode.code << "]";
        }
        out << ": " << diagnostic.location.toString() << ": " << diagnostic.message << "\n";

        // Gutter wide enough for the largest quoted line number
        size_t gutter = 1;
        for (const auto& line : diagnostic.excerpt) {
            gutter = std::max(gutter, std::to_string(line.line).size());
        }
        for (const auto& line : diagnostic.excerpt) {
            out << "  " << std::setw(static_cast<int>(gutter)) << line.line << " | " << line.text << "\n";
            out << "  " << std::string(gutter, ' ') << " | " << line.markers << "\n";
        }

        for (const auto& note : diagnostic.notes) {
            out << "  = note: " << note << "\n";
        }
        for (const auto& help : diagnostic.help) {
            out << "  = help: " << help << "\n";
        }
        out << "\n";
    }
}

void ErrorReporter::clear() {
    diagnostics_.clear();
    errorCount_ = 0;
    warningCount_ = 0;
    sources_.clear();
}

} // namespace expanse
