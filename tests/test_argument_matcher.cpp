#include "expanse/semantic/argument_matcher.h"
#include "expanse/semantic/oracles.h"
#include "expanse/semantic/type_environment.h"
#include "test_framework.h"
#include "test_helpers.h"

using namespace expanse;
using namespace testutil;

namespace {

struct MatcherFixture {
    semantic::TypeEnvironment env;
    semantic::LiteralTypeOracle typeCheck;
    semantic::ArgumentMatcher matcher;

    MatcherFixture() : typeCheck(env), matcher(typeCheck) {
        env.declareBuiltins();
    }
};

// move(x: Int, y: Int, speed: Float = 0)
model::Signature moveSignature() {
    return signature("move", {param("x", 0, named("Int")),
                              param("y", 1, named("Int")),
                              param("speed", 2, named("Float"), false, true)});
}

} // namespace

TEST(matcher_accepts_exact_call) {
    MatcherFixture f;
    ASSERT(f.matcher.match(moveSignature(), {arg("x", intLit()), arg("y", intLit())}).empty(),
           "Defaulted speed may be omitted");
    ASSERT(f.matcher.match(moveSignature(),
                           {arg("x", intLit()), arg("y", intLit()), arg("speed", floatLit())}).empty(),
           "All arguments supplied");
}

TEST(matcher_type_mismatch) {
    MatcherFixture f;
    std::vector<semantic::ArgumentIssue> issues =
        f.matcher.match(moveSignature(), {arg("x", intLit()), arg("y", stringLit())});
    ASSERT_EQ(issues.size(), 1, "One issue");
    ASSERT_SAME(issues[0].kind, semantic::ArgumentIssue::Kind::TypeMismatch, "Type mismatch");
    ASSERT_EQ(issues[0].parameter.label, "y", "On y");
}

TEST(matcher_missing_and_extra) {
    MatcherFixture f;
    std::vector<semantic::ArgumentIssue> missing = f.matcher.match(moveSignature(), {arg("y", intLit())});
    ASSERT_EQ(missing.size(), 1, "One issue");
    ASSERT_SAME(missing[0].kind, semantic::ArgumentIssue::Kind::MissingArgument, "x is missing");
    ASSERT_EQ(missing[0].parameter.label, "x", "Names x");

    std::vector<semantic::ArgumentIssue> extra =
        f.matcher.match(moveSignature(), {arg("x", intLit()), arg("y", intLit()), arg("z", intLit())});
    ASSERT_EQ(extra.size(), 1, "One issue");
    ASSERT_SAME(extra[0].kind, semantic::ArgumentIssue::Kind::ExtraArgument, "z is extra");
    ASSERT_EQ(extra[0].argument.label, "z", "Names z");
}

TEST(matcher_label_mismatch) {
    MatcherFixture f;
    std::vector<semantic::ArgumentIssue> issues =
        f.matcher.match(moveSignature(), {arg("left", intLit()), arg("y", intLit())});
    ASSERT_EQ(issues.size(), 1, "One issue");
    ASSERT_SAME(issues[0].kind, semantic::ArgumentIssue::Kind::LabelMismatch, "Wrong label");
    ASSERT_EQ(issues[0].argument.label, "left", "Names the argument");
}

TEST(matcher_trailing_closure_fills_parameter) {
    MatcherFixture f;
    model::TypeRef callback = model::TypeRef::function({}, model::TypeRef::tuple({}));
    model::Signature sig = signature("after", {param("delay", 0, named("Int")), param("then", 1, callback)});
    ASSERT(f.matcher.match(sig, {arg("delay", intLit()), trailing(closure())}).empty(),
           "Trailing closure binds to the next parameter");
}

TEST(matcher_result_skips_expanded) {
    MatcherFixture f;
    model::Signature sig = signature("draw", {param("at", 0, named("Point"), true), param("color", 1, named("Int"))});

    semantic::ResolutionResult defaulted = semantic::ResolutionResult::defaulted({arg("color", intLit())});
    ASSERT(f.matcher.matchResult(sig, defaulted).empty(), "Remainder matches color");

    semantic::ResolutionResult wrong = semantic::ResolutionResult::defaulted({arg("color", stringLit())});
    std::vector<semantic::ArgumentIssue> issues = f.matcher.matchResult(sig, wrong);
    ASSERT_EQ(issues.size(), 1, "color does not type-check");
    ASSERT_EQ(issues[0].parameter.label, "color", "On color");
}

TEST(matcher_result_checks_direct_argument) {
    MatcherFixture f;
    semantic::TypeDecl point;
    point.name = "Point";
    point.declaredAt = site(1);
    f.env.declareType(point);

    model::Signature sig = signature("draw", {param("at", 0, named("Point"), true), param("color", 1, named("Int"))});

    semantic::ResolutionResult good = semantic::ResolutionResult::direct(
        arg("at", ref("origin", named("Point"))), {arg("color", intLit())});
    ASSERT(f.matcher.matchResult(sig, good).empty(), "Point value passes through");

    semantic::ResolutionResult bad = semantic::ResolutionResult::direct(
        arg("at", intLit()), {arg("color", intLit())});
    std::vector<semantic::ArgumentIssue> issues = f.matcher.matchResult(sig, bad);
    ASSERT_EQ(issues.size(), 1, "Direct value has the wrong type");
    ASSERT_SAME(issues[0].kind, semantic::ArgumentIssue::Kind::TypeMismatch, "Type mismatch");
    ASSERT_EQ(issues[0].parameter.label, "at", "On the expanded parameter");
}

TEST(matcher_result_ignores_errors) {
    MatcherFixture f;
    model::Signature sig = signature("draw", {param("", 0, named("Point"), true)});
    semantic::ResolutionResult failed = semantic::ResolutionResult::failure(
        semantic::ResolutionError(semantic::ResolutionErrorKind::AmbiguousInitializer));
    ASSERT(f.matcher.matchResult(sig, failed).empty(), "Engine errors are reported elsewhere");
    ASSERT_EQ(std::string(semantic::issueKindToString(semantic::ArgumentIssue::Kind::ExtraArgument)),
              "ExtraArgument", "Kind name");
}

void test_argument_matcher() {
    test_matcher_accepts_exact_call();
    test_matcher_type_mismatch();
    test_matcher_missing_and_extra();
    test_matcher_label_mismatch();
    test_matcher_trailing_closure_fills_parameter();
    test_matcher_result_skips_expanded();
    test_matcher_result_checks_direct_argument();
    test_matcher_result_ignores_errors();
}
