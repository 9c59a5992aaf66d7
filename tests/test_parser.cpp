#include "expanse/checker.h"
#include "expanse/error_reporter.h"
#include "expanse/model/program.h"
#include "test_framework.h"

using namespace expanse;

namespace {

model::Program* parseOk(Checker& checker, const std::string& source) {
    checker.checkFromString(source, "main.xp");
    return checker.getProgram();
}

} // namespace

TEST(parser_type_declarations) {
    Checker checker;
    model::Program* program = parseOk(checker,
        "struct Point {\n"
        "    init(x: Int, y: Int);\n"
        "    private init(_ value: Int);\n"
        "}\n"
        "class Shape {}\n"
        "class Circle : Shape { public init(radius: Float); }\n"
        "interface Drawable {}\n");

    ASSERT_NE(program, nullptr, "Program should be parsed");
    ASSERT(!checker.getErrorReporter().hasErrors(), "No errors expected");
    ASSERT_EQ(program->getTypes().size(), 4, "Four type declarations");

    const model::TypeDeclaration& point = program->getTypes()[0];
    ASSERT_EQ(point.name, "Point", "First type is Point");
    ASSERT_EQ(point.initializers.size(), 2, "Point has two initializers");
    ASSERT_EQ(point.initializers[1].parameters[0].label, "", "'_' means unlabeled");
    ASSERT_EQ(point.initializers[1].parameters[0].name, "value", "Internal name kept");
    ASSERT(point.initializers[1].visibility == model::VisibilityLevel::Private, "private init");
    ASSERT_EQ(point.initializers[0].declaredAt.scope, "Point", "Initializers are scoped to their type");

    const model::TypeDeclaration& circle = program->getTypes()[2];
    ASSERT(circle.kind == model::TypeDeclaration::Kind::Class, "Circle is a class");
    ASSERT_EQ(circle.supertype, "Shape", "Supertype recorded");
    ASSERT(program->getTypes()[3].kind == model::TypeDeclaration::Kind::Interface, "Drawable is an interface");
}

TEST(parser_declaration_ordinals) {
    Checker checker;
    model::Program* program = parseOk(checker,
        "struct Point { init(x: Int); }\n"
        "func draw(_ p: @expanded Point);\n"
        "extension Point { init(y: Int); }\n"
        "draw(x: 1);\n");

    ASSERT_NE(program, nullptr, "Program should be parsed");
    size_t typeOrd = program->getTypes()[0].declaredAt.ordinal;
    size_t initOrd = program->getTypes()[0].initializers[0].declaredAt.ordinal;
    size_t funcOrd = program->getFunctions()[0].declaredAt.ordinal;
    size_t extInitOrd = program->getExtensions()[0].initializers[0].declaredAt.ordinal;
    size_t callOrd = program->getCalls()[0].site.ordinal;

    ASSERT(typeOrd < initOrd, "Type precedes its initializers");
    ASSERT(initOrd < funcOrd, "Initializer precedes the function");
    ASSERT(funcOrd < extInitOrd, "Extension initializer comes after the function");
    ASSERT(extInitOrd < callOrd, "Call comes last");
}

TEST(parser_parameters) {
    Checker checker;
    model::Program* program = parseOk(checker,
        "struct Point { init(x: Int); }\n"
        "func place(at p: @expanded Point, count: Int = 3, flag: inout Bool, name: String?);\n");

    ASSERT_NE(program, nullptr, "Program should be parsed");
    const model::FunctionDeclaration& place = program->getFunctions()[0];
    ASSERT_EQ(place.parameters.size(), 4, "Four parameters");

    ASSERT_EQ(place.parameters[0].label, "at", "Label");
    ASSERT_EQ(place.parameters[0].name, "p", "Internal name");
    ASSERT(place.parameters[0].isExpanded, "@expanded recorded");

    ASSERT(place.parameters[1].defaultValue != nullptr, "Default value parsed");
    ASSERT_EQ(place.parameters[1].defaultValue->getText(), "3", "Default text");
    ASSERT_EQ(place.parameters[1].name, "count", "Name defaults to the label");

    ASSERT(place.parameters[2].isInout, "inout recorded");
    ASSERT(place.parameters[3].type.isOptional(), "Optional type");
}

TEST(parser_function_types) {
    Checker checker;
    model::Program* program = parseOk(checker,
        "func after(delay: Int, then: (Int, Bool) -> String) -> Int;\n"
        "func pair(value: (Int, Int));\n");

    ASSERT_NE(program, nullptr, "Program should be parsed");
    const model::FunctionDeclaration& after = program->getFunctions()[0];
    ASSERT(after.parameters[1].type.isFunction(), "Function type");
    ASSERT_EQ(after.parameters[1].type.getArgs().size(), 3, "Two parameters and a result");
    ASSERT(!after.returnType.isTuple(), "Explicit return type");

    const model::FunctionDeclaration& pair = program->getFunctions()[1];
    ASSERT(pair.parameters[0].type.isTuple(), "Tuple type");
    ASSERT(pair.returnType.isTuple() && pair.returnType.getArgs().empty(), "Default return type is ()");
}

TEST(parser_call_arguments) {
    Checker checker;
    model::Program* program = parseOk(checker,
        "struct Handler { init(name: String, _ run: () -> ()); }\n"
        "let origin: Handler;\n"
        "func on(name: String, origin: Handler, flag: Bool, scale: Float, opt: Int?, run: () -> ());\n"
        "on(name: \"tap\", origin: origin, flag: true, scale: 2.5, opt: nil) { print done };\n");

    ASSERT_NE(program, nullptr, "Program should be parsed");
    const model::CallStatement& call = program->getCalls()[0];
    ASSERT_EQ(call.callee, "on", "Callee");
    ASSERT_EQ(call.arguments.size(), 6, "Five arguments and a trailing closure");

    ASSERT_EQ(call.arguments[0].value->getText(), "tap", "String literal is unquoted");
    ASSERT(call.arguments[1].value->getKind() == model::Expression::Kind::Reference, "Reference");
    ASSERT(call.arguments[2].value->getKind() == model::Expression::Kind::BoolLiteral, "Bool literal");
    ASSERT(call.arguments[3].value->getKind() == model::Expression::Kind::FloatLiteral, "Float literal");
    ASSERT(call.arguments[4].value->getKind() == model::Expression::Kind::NilLiteral, "nil literal");

    const model::CallArgument& closure = call.arguments[5];
    ASSERT(closure.isTrailingClosureForm, "Trailing closure flagged");
    ASSERT_EQ(closure.label, "", "Trailing closure is unlabeled");
    ASSERT_EQ(closure.value->getText(), "print done", "Closure body kept as text");
}

TEST(parser_module_and_file_directives) {
    Checker checker;
    model::Program* program = parseOk(checker,
        "module Geometry;\n"
        "file \"shapes.xp\";\n"
        "struct Point { init(x: Int); }\n"
        "module main;\n"
        "file \"main.xp\";\n"
        "func draw(_ p: Int);\n");

    ASSERT_NE(program, nullptr, "Program should be parsed");
    const model::InitDeclaration& init = program->getTypes()[0].initializers[0];
    ASSERT_EQ(init.declaredAt.module, "Geometry", "Module directive applies");
    ASSERT_EQ(init.declaredAt.file, "shapes.xp", "File directive applies");
    ASSERT_EQ(program->getFunctions()[0].declaredAt.module, "main", "Later directive switches back");
    ASSERT_EQ(program->getFunctions()[0].declaredAt.file, "main.xp", "File switches back");
}

TEST(parser_comments_are_ignored) {
    Checker checker;
    model::Program* program = parseOk(checker,
        "// a line comment\n"
        "struct Point { /* block */ init(x: Int); }\n");
    ASSERT_NE(program, nullptr, "Program should be parsed");
    ASSERT(!checker.getErrorReporter().hasErrors(), "Comments are trivia");
    ASSERT_EQ(program->getTypes().size(), 1, "One type");
}

TEST(parser_syntax_errors) {
    Checker missingSemi;
    missingSemi.checkFromString("func draw(x: Int)\nfunc other();\n", "main.xp");
    ASSERT(missingSemi.getErrorReporter().hasErrorCode(ErrorCodes::MISSING_TOKEN), "Missing ';' is E003");

    Checker stray;
    stray.checkFromString("}\n", "main.xp");
    ASSERT(stray.getErrorReporter().hasErrorCode(ErrorCodes::MISMATCHED_BRACKET), "Unmatched '}' is E004");

    Checker unexpected;
    unexpected.checkFromString("42;\n", "main.xp");
    ASSERT(unexpected.getErrorReporter().hasErrorCode(ErrorCodes::UNEXPECTED_TOKEN), "Literal at top level is E002");

    Checker attribute;
    attribute.checkFromString("func f(_ p: @spread Int);\n", "main.xp");
    ASSERT(attribute.getErrorReporter().hasErrorCode(ErrorCodes::SYNTAX_ERROR), "Unknown attribute is E001");

    Checker body;
    body.checkFromString("struct Point { func f(); }\n", "main.xp");
    ASSERT(body.getErrorReporter().hasErrorCode(ErrorCodes::SYNTAX_ERROR), "Only init in type bodies");

    Checker closure;
    closure.checkFromString("f(x: 1) { unterminated\n", "main.xp");
    ASSERT(closure.getErrorReporter().hasErrorCode(ErrorCodes::MISMATCHED_BRACKET), "Unterminated closure is E004");

    Checker lexer;
    lexer.checkFromString("let x: Int; #\n", "main.xp");
    ASSERT(lexer.getErrorReporter().hasErrorCode(ErrorCodes::UNEXPECTED_TOKEN), "Unknown character is E002");
}

TEST(parser_recovers_after_error) {
    Checker checker;
    checker.checkFromString("func broken(x Int);\nfunc ok(y: Int);\n", "main.xp");
    model::Program* program = checker.getProgram();
    ASSERT_NE(program, nullptr, "Program is still built");
    ASSERT(checker.getErrorReporter().hasErrors(), "The broken function is reported");
    ASSERT_EQ(program->getFunctions().size(), 1, "Parsing resumes after ';'");
    ASSERT_EQ(program->getFunctions()[0].name, "ok", "The valid function survives");
}

void test_parser() {
    test_parser_type_declarations();
    test_parser_declaration_ordinals();
    test_parser_parameters();
    test_parser_function_types();
    test_parser_call_arguments();
    test_parser_module_and_file_directives();
    test_parser_comments_are_ignored();
    test_parser_syntax_errors();
    test_parser_recovers_after_error();
}
