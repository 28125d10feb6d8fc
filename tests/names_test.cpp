#include <gtest/gtest.h>
#include "rlink/names.hpp"
#include "rlink/local/local_engine.hpp"

using namespace rlink;

TEST(GenerateNames, SkipsTakenNames){
    auto names = generate_names(std::set<std::string>{"v0", "v2", "other"}, "v", 3);
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "v1");
    EXPECT_EQ(names[1], "v3");
    EXPECT_EQ(names[2], "v4");
    EXPECT_TRUE(generate_names(std::set<std::string>{}, "v", 0).empty());
}

TEST(GenerateNames, ConsultsSessionOnlyWhenNeeded){
    LocalEngine engine;
    engine.set_variable("rlink_arg_0", v_f64(1));
    engine.clear_calls();

    EXPECT_TRUE(generate_names(engine, kArgPrefix, 0).empty());
    EXPECT_TRUE(engine.calls().empty());

    auto names = generate_names(engine, kArgPrefix, 2);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "rlink_arg_1");
    EXPECT_EQ(names[1], "rlink_arg_2");
    ASSERT_EQ(engine.calls().size(), 1u);
    EXPECT_EQ(engine.calls()[0].op, "who");
}

TEST(Statements, CallStatementShapes){
    EXPECT_EQ(build_call_statement("fn", {}, {}), "fn();");
    EXPECT_EQ(build_call_statement("fn", {"a0", "a1"}, {}), "fn(a0, a1);");
    EXPECT_EQ(build_call_statement("fn", {"a0"}, {"r0"}), "[r0] = fn(a0);");
    EXPECT_EQ(build_call_statement("fn", {"a0", "a1"}, {"r0", "r1"}), "[r0, r1] = fn(a0, a1);");
}

TEST(Statements, ClearStatement){
    EXPECT_EQ(build_clear_statement({"a"}), "clear a");
    EXPECT_EQ(build_clear_statement({"rlink_arg_0", "rlink_ret_0"}), "clear rlink_arg_0 rlink_ret_0");
}
