#include "expanse/model/types.h"
#include "expanse/model/call.h"
#include "expanse/model/constructor.h"
#include "test_framework.h"
#include "test_helpers.h"

using namespace expanse;

TEST(type_ref_equality) {
    model::TypeRef a = model::TypeRef::nominal("Point");
    model::TypeRef b = model::TypeRef::nominal("Point");
    model::TypeRef c = model::TypeRef::interfaceType("Point");

    ASSERT(a == b, "Same nominal types compare equal");
    ASSERT(a != c, "Nominal and interface with the same name differ");
    ASSERT(model::TypeRef::optional(a) == model::TypeRef::optional(b), "Optionals of equal types are equal");
    ASSERT(!(a < b) && !(b < a), "Equal types are not ordered");
}

TEST(type_ref_to_string) {
    model::TypeRef point = model::TypeRef::nominal("Point");
    model::TypeRef fn = model::TypeRef::function({model::TypeRef::nominal("Int")},
                                                 model::TypeRef::nominal("Bool"));

    ASSERT_EQ(model::TypeRef::optional(point).toString(), "Point?", "Optional rendering");
    ASSERT_EQ(fn.toString(), "(Int) -> Bool", "Function rendering");
    ASSERT_EQ(model::TypeRef::optional(fn).toString(), "((Int) -> Bool)?", "Optional function rendering");
    ASSERT_EQ(model::TypeRef::tuple({point, point}).toString(), "(Point, Point)", "Tuple rendering");
}

TEST(type_ref_decl_name) {
    ASSERT_EQ(model::TypeRef::nominal("Point").getDeclName(), "Point", "Nominal type names its declaration");
    ASSERT_EQ(model::TypeRef::optional(model::TypeRef::nominal("Point")).getDeclName(), "Optional",
              "Optional answers with the wrapper");
    ASSERT_EQ(model::TypeRef::tuple({}).getDeclName(), "", "Structural types have no declaration");
    ASSERT(model::TypeRef::tuple({}).isStructural(), "Tuple is structural");
    ASSERT(!model::TypeRef::nominal("Point").isStructural(), "Nominal is not structural");
}

TEST(type_ref_unresolved_and_error) {
    model::TypeRef pending = model::TypeRef::optional(model::TypeRef::unresolved("Point"));
    ASSERT(pending.containsUnresolved(), "Unresolved name inside an optional is found");
    ASSERT(!pending.containsError(), "No error component yet");

    model::TypeRef broken = model::TypeRef::function({model::TypeRef::error()}, model::TypeRef::nominal("Int"));
    ASSERT(broken.containsError(), "Error parameter is found");
    ASSERT(model::TypeRef().isError(), "Default TypeRef is the error type");
}

TEST(label_shape_and_display) {
    model::ArgumentList args;
    args.push_back(testutil::arg("x", testutil::intLit()));
    args.push_back(testutil::arg("", testutil::intLit()));
    ASSERT_EQ(model::labelShape(args), "(x:_:)", "Label shape marks unlabeled arguments");

    model::ConstructorCandidate c = testutil::ctor("Point", {"x", "y"},
        {testutil::named("Int"), testutil::named("Int")}, 1);
    ASSERT_EQ(c.getDisplayName(), "Point.init(x:y:)", "Display name");
    ASSERT_EQ(c.getSignatureString(), "init(x: Int, y: Int)", "Signature string");
    ASSERT_EQ(c.getArity(), 2, "Arity");
}

void test_types() {
    test_type_ref_equality();
    test_type_ref_to_string();
    test_type_ref_decl_name();
    test_type_ref_unresolved_and_error();
    test_label_shape_and_display();
}
