#include "expanse/checker.h"
#include "expanse/error_reporter.h"
#include "expanse/semantic/catalog_builder.h"
#include "test_framework.h"
#include <string>

using namespace expanse;

namespace {

bool checkSource(Checker& checker, const std::string& source) {
    return checker.checkFromString(source, "main.xp");
}

bool reports(Checker& checker, const char* code) {
    return checker.getErrorReporter().hasErrorCode(code);
}

const char* kPointPrelude =
    "struct Point { init(x: Int, y: Int); }\n"
    "func draw(_ p: @expanded Point, color: Int);\n";

} // namespace

TEST(checker_expands_call) {
    Checker checker;
    bool ok = checkSource(checker, std::string(kPointPrelude) + "draw(x: 1, y: 2, color: 3);\n");
    ASSERT(ok, "Expanded call checks");
    ASSERT_EQ(checker.getCallChecks().size(), 1, "One call");

    const CallCheck& call = checker.getCallChecks()[0];
    ASSERT(call.status == CallCheck::Status::Resolved, "Call resolved");
    ASSERT(call.result.isConstructed(), "Constructor synthesized");
    ASSERT_EQ(call.result.getConstructor().getDisplayName(), "Point.init(x:y:)", "Selected initializer");
    ASSERT(call.issues.empty(), "color matches");
}

TEST(checker_remainder_and_type_selection) {
    Checker checker;
    bool ok = checkSource(checker,
        "struct Pair { init(a: Int); init(b: Bool); }\n"
        "func make(_ p: @expanded Pair, y: Int);\n"
        "struct Value { init(a: Int); init(a: String); }\n"
        "func use(_ v: @expanded Value);\n"
        "make(a: 1, y: 2);\n"
        "use(a: \"text\");\n");
    ASSERT(ok, "Both calls check");
    ASSERT_EQ(checker.getCallChecks()[0].result.getRemainder().size(), 1, "y is the remainder");
    ASSERT(checker.getCallChecks()[1].result.getConstructor().parameterTypes[0].getName() == "String",
           "The String initializer is chosen");
}

TEST(checker_direct_and_defaulted) {
    Checker checker;
    bool ok = checkSource(checker,
        "struct Point { init(x: Int); }\n"
        "let origin: Point;\n"
        "func move(to p: @expanded Point);\n"
        "struct Style { init(bold: Bool); }\n"
        "let plain: Style;\n"
        "func render(_ s: @expanded Style = plain, text: String);\n"
        "move(to: origin);\n"
        "render(text: \"hi\");\n");
    ASSERT(ok, "Direct and defaulted calls check");
    ASSERT(checker.getCallChecks()[0].result.isDirect(), "Label match passes the value");
    ASSERT(checker.getCallChecks()[1].result.isDefaulted(), "Empty span uses the default");

    Checker unlabeled;
    ok = checkSource(unlabeled,
        "struct Point { init(x: Int); }\n"
        "let origin: Point;\n"
        "func draw(_ p: @expanded Point, color: Int);\n"
        "draw(origin, color: 1);\n");
    ASSERT(ok, "Point value passes to an unlabeled expanded parameter");
    ASSERT(unlabeled.getCallChecks()[0].result.isDirect(), "Unlabeled first argument is the value");

    Checker wrong;
    checkSource(wrong,
        "struct Point { init(x: Int); }\n"
        "func move(to p: @expanded Point);\n"
        "move(to: 5);\n");
    ASSERT(reports(wrong, ErrorCodes::ARGUMENT_TYPE_MISMATCH), "Direct value of the wrong type is E304");
}

TEST(checker_resolution_errors) {
    Checker none;
    checkSource(none, std::string(kPointPrelude) + "draw(z: 1, color: 3);\n");
    ASSERT(reports(none, ErrorCodes::NO_MATCHING_INITIALIZER), "No init(z:) is E300");

    Checker empty;
    checkSource(empty, std::string(kPointPrelude) + "draw(color: 3);\n");
    ASSERT(reports(empty, ErrorCodes::NO_MATCHING_INITIALIZER), "Empty span without init() is E300");

    Checker ambiguous;
    checkSource(ambiguous,
        "struct Value { init(a: Int); init(a: Float); }\n"
        "func use(_ v: @expanded Value);\n"
        "use(a: 1);\n");
    ASSERT(reports(ambiguous, ErrorCodes::AMBIGUOUS_INITIALIZER), "Two viable initializers is E301");

    Checker hidden;
    checkSource(hidden,
        "file \"a.xp\";\n"
        "struct Point { fileprivate init(x: Int); }\n"
        "func draw(_ p: @expanded Point);\n"
        "file \"b.xp\";\n"
        "draw(x: 1);\n");
    ASSERT(reports(hidden, ErrorCodes::INACCESSIBLE_INITIALIZER), "fileprivate init from another file is E302");

    Checker closure;
    checkSource(closure,
        "struct Handler { init(name: String, _ run: () -> ()); }\n"
        "func on(_ h: @expanded Handler);\n"
        "on(name: \"tap\") { go };\n");
    ASSERT(reports(closure, ErrorCodes::TRAILING_CLOSURE_NOT_ALLOWED), "Trailing closure in the span is E303");

    Checker mismatch;
    checkSource(mismatch, std::string(kPointPrelude) + "draw(x: 1, y: \"two\", color: 3);\n");
    ASSERT(reports(mismatch, ErrorCodes::ARGUMENT_TYPE_MISMATCH), "Span argument of the wrong type is E304");
}

TEST(checker_remainder_errors) {
    Checker missing;
    checkSource(missing, std::string(kPointPrelude) + "draw(x: 1, y: 2);\n");
    ASSERT(reports(missing, ErrorCodes::MISSING_ARGUMENT), "Missing color is E306");

    Checker extra;
    checkSource(extra, std::string(kPointPrelude) + "draw(x: 1, y: 2, color: 3, alpha: 4);\n");
    ASSERT(reports(extra, ErrorCodes::EXTRA_ARGUMENT), "alpha is E307");

    Checker label;
    checkSource(label, "func move(x: Int);\nmove(z: 1);\n");
    ASSERT(reports(label, ErrorCodes::ARGUMENT_LABEL_MISMATCH), "Wrong label is E305");
}

TEST(checker_declaration_site_lock) {
    Checker checker;
    checkSource(checker,
        "struct Point { init(x: Int); }\n"
        "func draw(_ p: @expanded Point);\n"
        "extension Point { init(y: Int); }\n"
        "draw(y: 1);\n"
        "draw(x: 1);\n");
    ASSERT_EQ(checker.getErrorReporter().countErrorCode(ErrorCodes::NO_MATCHING_INITIALIZER), 1,
              "Only the later initializer is out of reach");
    ASSERT(checker.getCallChecks()[1].result.isConstructed(), "init(x:) still works");
}

TEST(checker_signature_errors) {
    struct Case {
        const char* source;
        const char* code;
    };
    const Case cases[] = {
        {"func f(a: Int, _ p: @expanded Point);", ErrorCodes::INVALID_EXPANDED_PLACEMENT},
        {"func f(_ p: @expanded Point, q: @expanded Point);", ErrorCodes::MULTIPLE_EXPANDED_PARAMETERS},
        {"func f(_ p: @expanded Point); func f(a: Int);", ErrorCodes::OVERLOAD_CONFLICT_WITH_EXPANDED},
        {"func f(_ p: @expanded (Int, Int));", ErrorCodes::NON_NOMINAL_EXPANDED_TYPE},
        {"interface Shape {} func f(_ s: @expanded Shape);", ErrorCodes::ABSTRACT_TYPE_NOT_EXPANDABLE},
        {"func f(_ p: @expanded inout Point);", ErrorCodes::BY_REFERENCE_EXPANDED_CONFLICT},
        {"func f(_ p: @expanded Point, a: Int = 1, b: Int);", ErrorCodes::DEFAULT_ARGUMENT_ADJACENCY},
        {"struct Box { init(_ p: @expanded Point); }", ErrorCodes::INVALID_EXPANDED_PLACEMENT},
    };

    for (const Case& c : cases) {
        Checker checker;
        checkSource(checker, std::string("struct Point { init(x: Int); }\n") + c.source + "\n");
        ASSERT(reports(checker, c.code), "Expected " << c.code << " for: " << c.source);
    }

    Checker reordered;
    ASSERT(checkSource(reordered, "struct Point { init(x: Int); }\n"
                                  "func f(_ p: @expanded Point, b: Int, a: Int = 1);\n"),
           "Defaulted parameter last is legal");
}

TEST(checker_first_violation_option) {
    const std::string source =
        "struct Point { init(x: Int); }\n"
        "func f(a: Int, _ p: @expanded Point, q: @expanded inout Point);\n";

    Checker all;
    checkSource(all, source);
    ASSERT(reports(all, ErrorCodes::MULTIPLE_EXPANDED_PARAMETERS), "Every rule runs by default");
    ASSERT(reports(all, ErrorCodes::BY_REFERENCE_EXPANDED_CONFLICT), "inout is reported too");

    CheckerOptions options;
    options.stopAtFirstViolation = true;
    Checker first(options);
    checkSource(first, source);
    ASSERT(reports(first, ErrorCodes::INVALID_EXPANDED_PLACEMENT), "First rule reported");
    ASSERT(!reports(first, ErrorCodes::MULTIPLE_EXPANDED_PARAMETERS), "Later rules are skipped");
    ASSERT(!reports(first, ErrorCodes::BY_REFERENCE_EXPANDED_CONFLICT), "Later rules are skipped");
}

TEST(checker_skips_calls_to_invalid_signatures) {
    Checker checker;
    checkSource(checker,
        "struct Point { init(x: Int); }\n"
        "func f(a: Int, _ p: @expanded Point);\n"
        "f(a: 1, x: 2);\n");
    ASSERT(reports(checker, ErrorCodes::INVALID_EXPANDED_PLACEMENT), "Signature error reported");
    ASSERT(checker.getCallChecks()[0].status == CallCheck::Status::Skipped, "Call is not resolved");
    ASSERT(!checker.isSignatureValid(0), "Signature marked invalid");
    ASSERT_EQ(checker.getErrorReporter().getErrorCount(), 1, "No follow-up call errors");
}

TEST(checker_optional_expanded_warning) {
    Checker checker;
    bool ok = checkSource(checker,
        "struct Point { init(x: Int); }\n"
        "func f(_ p: @expanded Point?);\n");
    ASSERT(ok, "Optional expanded type is legal");
    ASSERT(reports(checker, ErrorCodes::OPTIONAL_EXPANDED_TYPE), "W001 is reported");
    ASSERT_EQ(checker.getErrorReporter().getWarningCount(), 1, "One warning");
}

TEST(checker_overloads) {
    Checker ok;
    ASSERT(checkSource(ok, "func g(a: Int);\nfunc g(b: Bool);\ng(b: true);\n"), "Unique overload selected");
    ASSERT_EQ(ok.getCallChecks()[0].signatureIndex, 1, "g(b:) chosen");

    Checker none;
    checkSource(none, "func g(a: Int);\nfunc g(b: Int);\ng(c: 1);\n");
    ASSERT(reports(none, ErrorCodes::NO_MATCHING_OVERLOAD), "No overload accepts c: is E308");

    Checker ambiguous;
    checkSource(ambiguous, "func h(a: Int);\nfunc h(a: Float);\nh(a: 1);\n");
    ASSERT(reports(ambiguous, ErrorCodes::NO_MATCHING_OVERLOAD), "Two viable overloads is E308");
    ASSERT_EQ(ambiguous.getCallChecks()[0].viableOverloads, 2, "Both counted");
}

TEST(checker_declaration_errors) {
    struct Case {
        const char* source;
        const char* code;
    };
    const Case cases[] = {
        {"func f(p: Missing);", ErrorCodes::UNDEFINED_TYPE},
        {"extension Ghost { init(x: Int); }", ErrorCodes::UNDEFINED_TYPE},
        {"func f(a: Int);\nf(a: ghost);", ErrorCodes::UNDEFINED_VARIABLE},
        {"nothing(a: 1);", ErrorCodes::UNDEFINED_FUNCTION},
        {"struct Point {}\nstruct Point {}", ErrorCodes::REDEFINED_TYPE},
        {"struct Int {}", ErrorCodes::REDEFINED_TYPE},
        {"let a: Int;\nlet a: Int;", ErrorCodes::REDEFINED_VARIABLE},
        {"let f: Int;\nfunc f();", ErrorCodes::REDEFINED_VARIABLE},
        {"struct A {}\nstruct B : A {}", ErrorCodes::INVALID_SUPERTYPE},
        {"struct A {}\nclass B : A {}", ErrorCodes::INVALID_SUPERTYPE},
        {"class B : Int {}", ErrorCodes::INVALID_SUPERTYPE},
        {"class A : B {}\nclass B : A {}", ErrorCodes::INVALID_SUPERTYPE},
        {"func f(a: Int = \"x\");", ErrorCodes::ARGUMENT_TYPE_MISMATCH},
    };

    for (const Case& c : cases) {
        Checker checker;
        checkSource(checker, std::string(c.source) + "\n");
        ASSERT(reports(checker, c.code), "Expected " << c.code << " for: " << c.source);
    }
}

TEST(checker_inherited_initializers_not_expanded) {
    Checker checker;
    checkSource(checker,
        "class Shape { init(name: String); }\n"
        "class Circle : Shape { init(radius: Float); }\n"
        "func paint(_ c: @expanded Circle);\n"
        "paint(name: \"c\");\n"
        "paint(radius: 1.5);\n");
    ASSERT_EQ(checker.getErrorReporter().countErrorCode(ErrorCodes::NO_MATCHING_INITIALIZER), 1,
              "Superclass initializer is not a candidate");
    ASSERT(checker.getCallChecks()[1].result.isConstructed(), "Own initializer works");
}

TEST(checker_parallel_matches_serial) {
    std::string source =
        "struct Point { init(x: Int, y: Int); init(r: Float); }\n"
        "func draw(_ p: @expanded Point, color: Int);\n";
    for (int i = 0; i < 40; ++i) {
        switch (i % 4) {
            case 0: source += "draw(x: 1, y: 2, color: 3);\n"; break;
            case 1: source += "draw(r: 2.5, color: 1);\n"; break;
            case 2: source += "draw(z: 1, color: 1);\n"; break;
            default: source += "draw(x: 1, y: 2);\n"; break;
        }
    }

    CheckerOptions serialOptions;
    serialOptions.jobs = 1;
    Checker serial(serialOptions);
    checkSource(serial, source);

    CheckerOptions parallelOptions;
    parallelOptions.jobs = 8;
    Checker parallel(parallelOptions);
    checkSource(parallel, source);

    ASSERT_EQ(serial.getCallChecks().size(), parallel.getCallChecks().size(), "Same number of calls");
    bool same = true;
    for (size_t i = 0; i < serial.getCallChecks().size(); ++i) {
        const CallCheck& a = serial.getCallChecks()[i];
        const CallCheck& b = parallel.getCallChecks()[i];
        if (a.result != b.result || a.issues.size() != b.issues.size()) {
            same = false;
        }
    }
    ASSERT(same, "Results do not depend on the thread count");
    ASSERT_EQ(serial.getErrorReporter().getErrorCount(), parallel.getErrorReporter().getErrorCount(),
              "Same diagnostics");
    ASSERT_EQ(serial.getErrorReporter().getErrorCount(), 20, "Ten E300 and ten E306");
    ASSERT_EQ(parallel.getCatalogCache().size(), 1, "One catalog shared by every call");
}

TEST(checker_missing_file) {
    Checker checker;
    ASSERT(!checker.check("/nonexistent/input.xp"), "Missing file fails");
    ASSERT(checker.getErrorReporter().hasErrors(), "Reported as an error");
}

TEST(checker_job_count) {
    unsigned jobs = 7;
    ASSERT(parseJobCount("4", jobs), "Plain count is accepted");
    ASSERT_EQ(jobs, 4u, "Count is stored");
    ASSERT(parseJobCount("0", jobs) && jobs == 0, "Zero picks the hardware default");

    jobs = 7;
    ASSERT(!parseJobCount("-3", jobs), "Negative count is rejected");
    ASSERT(!parseJobCount("", jobs), "Empty count is rejected");
    ASSERT(!parseJobCount("2x", jobs), "Trailing text is rejected");
    ASSERT(!parseJobCount("4294967296", jobs), "Count above UINT_MAX is rejected");
    ASSERT_EQ(jobs, 7u, "Rejected values leave the count unchanged");
}

void test_checker() {
    test_checker_expands_call();
    test_checker_remainder_and_type_selection();
    test_checker_direct_and_defaulted();
    test_checker_resolution_errors();
    test_checker_remainder_errors();
    test_checker_declaration_site_lock();
    test_checker_signature_errors();
    test_checker_first_violation_option();
    test_checker_skips_calls_to_invalid_signatures();
    test_checker_optional_expanded_warning();
    test_checker_overloads();
    test_checker_declaration_errors();
    test_checker_inherited_initializers_not_expanded();
    test_checker_parallel_matches_serial();
    test_checker_missing_file();
    test_checker_job_count();
}
