#include <gtest/gtest.h>
#include "test_support.hpp"

using namespace rlink;
using rlink_test::Point2D;

namespace {

const char* kBindings = R"((bindings
  (fn :id scale :name "scale" :nargout 1 :ret (array f64) :params [(array f64) f64] :throws [invocation-failure])
  (fn :id count :name "count" :nargout 1 :ret i32 :params [string] :throws [invocation-failure])
  (fn :id lookup :name "lookup" :nargout 1 :ret (scalar f64) :params [string] :throws [invocation-failure])
  (fn :id words :name "words" :nargout 1 :ret (array string) :params [string] :throws [invocation-failure])
  (fn :id stats :name "stats" :nargout 2 :ret (tuple 2) :returns [string (scalar f64)]
      :params [(array f64)] :throws [invocation-failure])
  (fn :id shift :name "shift" :nargout 1 :ret (bridged point2d) :params [point2d f64] :throws [invocation-failure])
  (fn :id show :name "show" :params [variable] :throws [invocation-failure])
  (fn :id raw :name "raw" :nargout 1 :ret any :params [any] :throws [invocation-failure]))
)";

struct TypedFixture : ::testing::Test {
    std::shared_ptr<LocalEngine> engine = std::make_shared<LocalEngine>();
    std::shared_ptr<Linker> linker;
    std::vector<std::string> shown;

    void SetUp() override {
        engine->define("scale", [](const std::vector<value_ptr>& a, int){
            auto xs = std::get<array_of<double>>(a.at(0)->data).elems;
            double k = std::get<double>(a.at(1)->data);
            for(auto &x: xs) x *= k;
            return std::vector<value_ptr>{v_array<double>(xs)};
        });
        engine->define("count", [](const std::vector<value_ptr>& a, int){
            return std::vector<value_ptr>{v_i32(static_cast<int32_t>(std::get<std::string>(a.at(0)->data).size()))};
        });
        engine->define("lookup", [](const std::vector<value_ptr>& a, int){
            if(std::get<std::string>(a.at(0)->data) == "pi") return std::vector<value_ptr>{v_f64(3.14)};
            return std::vector<value_ptr>{nullptr};
        });
        engine->define("words", [](const std::vector<value_ptr>&, int){
            return std::vector<value_ptr>{v_objects({v_str("a"), nullptr, v_str("c")})};
        });
        engine->define("stats", [](const std::vector<value_ptr>& a, int){
            auto& xs = std::get<array_of<double>>(a.at(0)->data).elems;
            return std::vector<value_ptr>{v_str("n"), v_f64(static_cast<double>(xs.size()))};
        });
        engine->define("shift", [](const std::vector<value_ptr>& a, int){
            auto xy = std::get<array_of<double>>(a.at(0)->data).elems;
            double d = std::get<double>(a.at(1)->data);
            return std::vector<value_ptr>{v_array<double>({xy[0] + d, xy[1] + d})};
        });
        engine->define("show", [this](const std::vector<value_ptr>& a, int){
            shown.push_back(to_string(a.at(0)));
            return std::vector<value_ptr>{};
        });
        engine->define("raw", [](const std::vector<value_ptr>& a, int){ return std::vector<value_ptr>{a.at(0)}; });

        linker = Linker::link(parse_bindings(kBindings), engine, {}, rlink_test::test_registry(), rlink_test::quiet_options());
    }
};

} // namespace

TEST_F(TypedFixture, CallsWithNativeTypes){
    auto scale = linker->bind<std::vector<double>(const std::vector<double>&, double)>("scale");
    EXPECT_EQ(scale({1, 2}, 3), (std::vector<double>{3, 6}));
    EXPECT_EQ(scale.id(), "scale");

    auto count = linker->bind<int32_t(std::string)>("count");
    EXPECT_EQ(count("four"), 4);

    auto lookup = linker->bind<std::optional<double>(std::string)>("lookup");
    EXPECT_EQ(lookup("pi"), std::optional<double>(3.14));
    EXPECT_FALSE(lookup("tau").has_value());

    auto words = linker->bind<std::vector<std::string>(std::string)>("words");
    EXPECT_EQ(words("x"), (std::vector<std::string>{"a", "", "c"}));
}

TEST_F(TypedFixture, TupleResults){
    auto stats = linker->bind<std::tuple<std::string, std::optional<double>>(std::vector<double>)>("stats");
    auto [label, n] = stats({1, 2, 3});
    EXPECT_EQ(label, "n");
    EXPECT_EQ(n, std::optional<double>(3));
}

TEST_F(TypedFixture, BridgedTypes){
    auto shift = linker->bind<std::shared_ptr<Point2D>(std::shared_ptr<Point2D>, double)>("shift");
    auto p = shift(std::make_shared<Point2D>(1, 2), 0.5);
    ASSERT_NE(p, nullptr);
    EXPECT_DOUBLE_EQ(p->x(), 1.5);
    EXPECT_DOUBLE_EQ(p->y(), 2.5);

    engine->set_variable("config", v_str("cfg"));
    auto show = linker->bind<void(std::shared_ptr<RemoteVariable>)>("show");
    show(std::make_shared<RemoteVariable>("config"));
    EXPECT_EQ(shown, (std::vector<std::string>{"\"cfg\""}));
}

TEST_F(TypedFixture, UntypedValuesBindToAnything){
    auto raw = linker->bind<value_ptr(value_ptr)>("raw");
    EXPECT_TRUE(equal(raw(v_str("x")), v_str("x")));
    auto rawScale = linker->bind<value_ptr(value_ptr, value_ptr)>("scale");
    EXPECT_TRUE(equal(rawScale(v_array<double>({2}), v_f64(2)), v_array<double>({4})));
}

TEST_F(TypedFixture, ArityMismatch){
    try {
        linker->bind<int32_t(std::string, std::string)>("count");
        FAIL() << "expected linking_error";
    } catch(const linking_error& e){
        EXPECT_EQ(rlink_test::codes(e.result()), (std::vector<std::string>{"E2060"}));
    }
}

TEST_F(TypedFixture, TypeMismatch){
    try {
        linker->bind<double(int32_t)>("count");
        FAIL() << "expected linking_error";
    } catch(const linking_error& e){
        // parameter and return both differ
        EXPECT_EQ(rlink_test::codes(e.result()), (std::vector<std::string>{"E2061", "E2061"}));
    }
    EXPECT_THROW(linker->bind<void(std::shared_ptr<Point2D>)>("show"), linking_error);
    EXPECT_THROW(linker->bind<std::vector<float>(std::vector<double>, double)>("scale"), linking_error);
    EXPECT_THROW(linker->bind<int32_t(std::string)>("missing"), linking_error);
}

TEST_F(TypedFixture, ReturnedValueOfWrongShape){
    engine->define("count", [](const std::vector<value_ptr>&, int){ return std::vector<value_ptr>{v_f64(1)}; });
    auto count = linker->bind<int32_t(std::string)>("count");
    EXPECT_THROW(count("x"), incompatible_return_error);
}
