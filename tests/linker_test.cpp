#include <gtest/gtest.h>
#include <cmath>
#include <thread>
#include "test_env.hpp"
#include "test_support.hpp"
#include "rlink/script_resolver.hpp"

using namespace rlink;
using rlink_test::Point2D;

namespace {

const char* kBindings = R"((bindings
  (fn :id mean :name "mean" :nargout 1 :ret f64 :params [(array f64)] :throws [invocation-failure])
  (fn :id split :name "split" :nargout 2 :ret (tuple 2) :returns [string (scalar f64)]
      :params [string] :throws [invocation-failure])
  (fn :id norm :name "norm" :nargout 1 :ret f64 :params [point2d] :throws [invocation-failure])
  (fn :id mirror :name "mirror" :nargout 1 :ret (bridged point2d) :params [point2d] :throws [invocation-failure])
  (fn :id echo :name "echo" :nargout 1 :ret any :params [any] :throws [invocation-failure])
  (fn :id reset :name "reset" :throws [invocation-failure])
  (fn :id pair :relative-path "scripts/pair.m" :nargout 2 :ret (array string) :throws [invocation-failure]))
)";

struct LinkerFixture : ::testing::Test {
    rlink_test::TempDir tmp;
    std::shared_ptr<LocalEngine> engine = std::make_shared<LocalEngine>("/home");
    std::shared_ptr<Linker> linker;

    void SetUp() override {
        tmp.mkdir("scripts");
        tmp.write("scripts/pair.m", "function [a, b] = pair()");

        engine->define("mean", [](const std::vector<value_ptr>& args, int){
            auto& xs = std::get<array_of<double>>(args.at(0)->data).elems;
            double sum = 0;
            for(double x: xs) sum += x;
            // a one element array, as the engine would answer
            return std::vector<value_ptr>{v_array<double>({xs.empty() ? 0 : sum / xs.size()})};
        });
        engine->define("split", [](const std::vector<value_ptr>& args, int){
            const std::string& s = std::get<std::string>(args.at(0)->data);
            return std::vector<value_ptr>{v_str(s.substr(0, 1)), v_f64(static_cast<double>(s.size()))};
        });
        engine->define("norm", [](const std::vector<value_ptr>& args, int){
            auto& xy = std::get<array_of<double>>(args.at(0)->data).elems;
            return std::vector<value_ptr>{v_f64(std::hypot(xy[0], xy[1]))};
        });
        engine->define("mirror", [](const std::vector<value_ptr>& args, int){
            auto& xy = std::get<array_of<double>>(args.at(0)->data).elems;
            return std::vector<value_ptr>{v_array<double>({xy[1], xy[0]})};
        });
        engine->define("echo", [](const std::vector<value_ptr>& args, int){ return std::vector<value_ptr>{args.at(0)}; });
        engine->define("reset", [](const std::vector<value_ptr>&, int){ return std::vector<value_ptr>{}; });
        engine->define_in(tmp.join("scripts"), "pair", [](const std::vector<value_ptr>&, int){
            return std::vector<value_ptr>{v_str("left"), v_str("right")};
        });

        linker = Linker::link(parse_bindings(kBindings), engine, ScriptOrigin::from_directory(tmp.path()),
                              rlink_test::test_registry(), rlink_test::quiet_options());
    }
};

} // namespace

TEST_F(LinkerFixture, LinksEveryDeclaration){
    EXPECT_EQ(linker->ids(), (std::vector<std::string>{"echo", "mean", "mirror", "norm", "pair", "reset", "split"}));
    EXPECT_TRUE(linker->contains("pair"));
    EXPECT_FALSE(linker->contains("missing"));
    const auto& pair = linker->descriptor("pair");
    EXPECT_EQ(pair.name, "pair");
    ASSERT_TRUE(pair.containing_directory.has_value());
    EXPECT_EQ(*pair.containing_directory, tmp.join("scripts"));
    EXPECT_TRUE(linker->diagnostics().success);
    EXPECT_EQ(describe(linker->descriptor("mean"), linker->types()), "mean: f64 <- [(array f64)] nargout=1");
    EXPECT_EQ(describe(linker->descriptor("norm"), linker->types()), "norm: f64 <- [(bridged point2d)] nargout=1 (custom)");
    EXPECT_EQ(engine->task_count(), 0u);
}

TEST_F(LinkerFixture, StandardCalls){
    EXPECT_TRUE(equal(linker->invoke("mean", {v_array<double>({1, 2, 3})}), v_f64(2)));

    auto r = linker->invoke("split", {v_str("hello")});
    auto* t = std::get_if<tuple_value>(&r->data);
    ASSERT_NE(t, nullptr);
    EXPECT_TRUE(equal(t->elems[0], v_str("h")));
    EXPECT_TRUE(equal(t->elems[1], v_f64(5)));

    auto none = linker->invoke("reset", {});
    EXPECT_TRUE(std::get<object_array>(none->data).elems.empty());
    EXPECT_TRUE(engine->statements().empty());
}

TEST_F(LinkerFixture, ScriptCallsChangeDirectory){
    auto r = linker->invoke("pair", {});
    EXPECT_TRUE(equal(r, v_strings({"left", "right"})));
    EXPECT_EQ(engine->cwd(), "/home");
}

TEST_F(LinkerFixture, BridgedArgumentsAndResults){
    EXPECT_TRUE(equal(linker->invoke("norm", {v_bridged(std::make_shared<Point2D>(3, 4))}), v_f64(5)));
    auto m = linker->invoke("mirror", {v_bridged(std::make_shared<Point2D>(1, 2))});
    EXPECT_TRUE(equal(m, v_bridged(std::make_shared<Point2D>(2, 1))));
    EXPECT_EQ(engine->variable_count(), 0u);
}

TEST_F(LinkerFixture, BridgedValueForAnyParameterUsesCustomPath){
    engine->set_variable("store", v_str("kept"));
    engine->clear_calls();
    auto r = linker->invoke("echo", {v_bridged(std::make_shared<RemoteVariable>("store"))});
    EXPECT_TRUE(equal(r, v_str("kept")));
    auto stmts = engine->statements();
    ASSERT_FALSE(stmts.empty());
    EXPECT_EQ(stmts[0], "rlink_arg_0 = store;");

    engine->clear_calls();
    EXPECT_TRUE(equal(linker->invoke("echo", {v_f64(3)}), v_f64(3)));
    EXPECT_TRUE(engine->statements().empty());
}

TEST_F(LinkerFixture, RejectsBadCalls){
    EXPECT_THROW(linker->invoke("missing", {}), linking_error);
    EXPECT_THROW(linker->descriptor("missing"), linking_error);
    EXPECT_THROW(linker->invoke("mean", {}), std::invalid_argument);
    EXPECT_THROW(linker->invoke("mean", {v_f64(1), v_f64(2)}), std::invalid_argument);
    EXPECT_THROW(linker->invoke("norm", {v_array<double>({3, 4})}), std::invalid_argument);
    EXPECT_THROW(linker->invoke("norm", {nullptr}), std::invalid_argument);
    EXPECT_THROW(linker->invoke("norm", {v_bridged(std::make_shared<RemoteVariable>("p"))}), std::invalid_argument);
    EXPECT_EQ(engine->task_count(), 0u);
}

TEST_F(LinkerFixture, PropagatesEngineAndReturnFailures){
    engine->define("mean", [](const std::vector<value_ptr>&, int) -> std::vector<value_ptr> {
        throw invocation_error("Index exceeds matrix dimensions.");
    });
    try {
        linker->invoke("mean", {v_array<double>({1})});
        FAIL() << "expected invocation_error";
    } catch(const invocation_error& e){
        EXPECT_STREQ(e.what(), "Index exceeds matrix dimensions.");
    }

    engine->define("mean", [](const std::vector<value_ptr>&, int){ return std::vector<value_ptr>{v_str("NaN")}; });
    EXPECT_THROW(linker->invoke("mean", {v_array<double>({1})}), incompatible_return_error);
}

TEST_F(LinkerFixture, ConcurrentCallsAreSerialized){
    std::vector<std::thread> threads;
    std::vector<int> failures(8, 0);
    for(int t=0;t<8; ++t){
        threads.emplace_back([&, t]{
            for(int i=0;i<25; ++i){
                double x = t + 1, y = i;
                auto r = linker->invoke("norm", {v_bridged(std::make_shared<Point2D>(x, y))});
                if(!equal(r, v_f64(std::hypot(x, y)))) ++failures[t];
            }
        });
    }
    for(auto &th: threads) th.join();
    for(int f: failures) EXPECT_EQ(f, 0);
    EXPECT_EQ(engine->task_count(), 200u);
    EXPECT_EQ(engine->variable_count(), 0u);
}

TEST(LinkOptions, ReadFromEnvironment){
    ScopedEnv ext("RLINK_SCRIPT_EXT", "py");
    ScopedEnv tmp("RLINK_TMPDIR", "/var/tmp");
    ScopedEnv json("RLINK_DIAG_JSON", "1");
    auto o = LinkOptions::from_env();
    EXPECT_EQ(o.scriptExtension, ".py");
    EXPECT_EQ(o.tempDir, "/var/tmp");
    EXPECT_TRUE(o.diagJson);
}

TEST(LinkOptions, Defaults){
    ScopedEnv ext("RLINK_SCRIPT_EXT", nullptr);
    ScopedEnv tmp("RLINK_TMPDIR", nullptr);
    ScopedEnv json("RLINK_DIAG_JSON", nullptr);
    auto o = LinkOptions::from_env();
    EXPECT_EQ(o.scriptExtension, ".m");
    EXPECT_TRUE(o.tempDir.empty());
    EXPECT_FALSE(o.diagJson);
}

TEST(Linker, CheckReportsWithoutThrowing){
    auto r = Linker::check(parse_bindings("(bindings (fn :id a :name \"a\" :nargout 1 :throws [invocation-failure]))"),
                           ScriptOrigin{}, BridgedTypeRegistry{}, rlink_test::quiet_options());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(rlink_test::codes(r), (std::vector<std::string>{"E2021"}));
}

TEST(Linker, RequiresEngine){
    EXPECT_THROW(Linker::link({}, nullptr, {}, {}, rlink_test::quiet_options()), linking_error);
}

TEST(Linker, LinksArchivedScripts){
    rlink_test::TempDir tmp;
    auto archive = std::make_shared<MemoryArchive>("bundle.zip");
    archive->add("tools/roll.m", "function r = roll()");
    auto engine = std::make_shared<LocalEngine>();
    auto options = rlink_test::quiet_options();
    options.tempDir = tmp.path();
    auto linker = Linker::link(parse_bindings(R"((bindings (fn :relative-path "tools/roll.m" :nargout 1 :ret f64
                                                      :throws [invocation-failure])))"),
                               engine, ScriptOrigin::from_archive(archive), {}, options);
    const auto& d = linker->descriptor("roll");
    ASSERT_TRUE(d.containing_directory.has_value());
    engine->define_in(*d.containing_directory, "roll", [](const std::vector<value_ptr>&, int){
        return std::vector<value_ptr>{v_f64(4)};
    });
    EXPECT_TRUE(equal(linker->invoke("roll", {}), v_f64(4)));
}

TEST(Linker, CheckStillExtractsArchivedScripts){
    rlink_test::TempDir tmp;
    auto archive = std::make_shared<MemoryArchive>("bundle.zip");
    archive->add("tools/roll.m", "function r = roll()");
    auto options = rlink_test::quiet_options();
    options.tempDir = tmp.path();
    remove_extracted_scripts();
    auto r = Linker::check(parse_bindings(R"((bindings (fn :relative-path "tools/roll.m" :nargout 1 :ret f64
                                                  :throws [invocation-failure])))"),
                           ScriptOrigin::from_archive(archive), {}, options);
    EXPECT_TRUE(r.success) << format_diagnostics(r);
    EXPECT_EQ(pending_extractions(), 1u);
    remove_extracted_scripts();
    EXPECT_EQ(pending_extractions(), 0u);
}
