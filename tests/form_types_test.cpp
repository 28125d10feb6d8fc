#include <gtest/gtest.h>
#include "rlink/form.hpp"
#include "rlink/types.hpp"

using namespace rlink;

TEST(FormReader, ReadsNestedListsWithPositions){
    auto f = read_form("(fn :id roots\n  :params [(array f64) \"x\"])");
    auto* l = as_list(*f);
    ASSERT_NE(l, nullptr);
    ASSERT_EQ(l->elems.size(), 5u);
    EXPECT_TRUE(is_symbol(*l->elems[0]));
    EXPECT_TRUE(is_keyword(*l->elems[1]));
    EXPECT_EQ(text_of(l->elems[2]), "roots");
    auto* v = as_vector(*l->elems[4]);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->elems.size(), 2u);
    EXPECT_EQ(l->elems[3]->line, 2);
    EXPECT_EQ(to_string(v->elems[0]), "(array f64)");
}

TEST(FormReader, CommasAndCommentsAreWhitespace){
    auto f = read_form("; leading comment\n[1, 2.5, true]");
    auto* v = as_vector(*f);
    ASSERT_NE(v, nullptr);
    ASSERT_EQ(v->elems.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(v->elems[0]->data), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(v->elems[1]->data), 2.5);
    EXPECT_TRUE(std::get<bool>(v->elems[2]->data));
}

TEST(FormReader, RejectsTrailingInputAndUnterminatedForms){
    EXPECT_THROW(read_form("(a b) c"), decl_parse_error);
    EXPECT_THROW(read_form("(a b"), decl_parse_error);
    EXPECT_THROW(read_form("\"open"), decl_parse_error);
}

TEST(TypeContext, ParsesEveryTypeForm){
    TypeContext ctx;
    EXPECT_TRUE(ctx.is_void(ctx.parse_type("void")));
    EXPECT_EQ(ctx.parse_type("any"), ctx.get_any());
    EXPECT_EQ(ctx.parse_type("string"), ctx.get_string());
    EXPECT_EQ(ctx.parse_type("variable"), ctx.get_variable());
    EXPECT_TRUE(ctx.is_primitive(ctx.parse_type("i16")));
    EXPECT_EQ(ctx.to_string(ctx.parse_type("(scalar f32)")), "(scalar f32)");
    EXPECT_EQ(ctx.to_string(ctx.parse_type("(array (array char))")), "(array (array char))");
    EXPECT_EQ(ctx.to_string(ctx.parse_type("(tuple 3)")), "(tuple 3)");
    EXPECT_EQ(ctx.to_string(ctx.parse_type("(bridged point2d)")), "(bridged point2d)");
}

TEST(TypeContext, InternsTypes){
    TypeContext ctx;
    EXPECT_EQ(ctx.parse_type("(array f64)"), ctx.get_array(ctx.get_primitive(BaseType::F64)));
    EXPECT_EQ(ctx.get_scalar(BaseType::I8), ctx.get_scalar(BaseType::I8));
    EXPECT_NE(ctx.get_scalar(BaseType::I8), ctx.get_primitive(BaseType::I8));
}

TEST(TypeContext, BareUnknownSymbolIsBridged){
    TypeContext ctx;
    TypeId t = ctx.parse_type("matrix");
    EXPECT_EQ(ctx.at(t).kind, Type::Kind::Bridged);
    EXPECT_EQ(t, ctx.get_bridged("matrix"));
    EXPECT_TRUE(ctx.is_bridged(t));
    EXPECT_TRUE(ctx.is_bridged(ctx.get_variable()));
    EXPECT_FALSE(ctx.is_bridged(ctx.get_any()));
}

TEST(TypeContext, RejectsMalformedForms){
    TypeContext ctx;
    EXPECT_THROW(ctx.parse_type("(tuple 1)"), decl_parse_error);
    EXPECT_THROW(ctx.parse_type("(tuple x)"), decl_parse_error);
    EXPECT_THROW(ctx.parse_type("(array void)"), decl_parse_error);
    EXPECT_THROW(ctx.parse_type("(array (tuple 2))"), decl_parse_error);
    EXPECT_THROW(ctx.parse_type("(scalar string)"), decl_parse_error);
    EXPECT_THROW(ctx.parse_type("(vector f64)"), decl_parse_error);
    EXPECT_THROW(ctx.parse_type("42"), decl_parse_error);
}
