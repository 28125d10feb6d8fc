// Local engine example: link a binding set, then call it untyped and typed.
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include "rlink/rlink.hpp"
#include "rlink/local/local_engine.hpp"

using namespace rlink;

// A complex number kept remotely as [re im].
class Complex : public BridgedValue {
public:
    static constexpr const char* kTypeName = "complex";
    Complex(double re, double im) : re_(re), im_(im) {}
    double re() const { return re_; }
    double im() const { return im_; }
    std::string type_name() const override { return kTypeName; }
    std::unique_ptr<SerializedSetter> serialized_setter() const override {
        struct Setter : SerializedSetter {
            double re, im;
            Setter(double r, double i) : re(r), im(i) {}
            void set_in(Session& s, const std::string& variable) override { s.set_variable(variable, v_array<double>({re, im})); }
        };
        return std::make_unique<Setter>(re_, im_);
    }
    static std::unique_ptr<SerializedGetter> create_getter(){
        struct Getter : SerializedGetter {
            std::vector<double> parts;
            void get_in(Session& s, const std::string& variable) override {
                auto v = s.get_variable(variable);
                auto* arr = v ? std::get_if<array_of<double>>(&v->data) : nullptr;
                if(!arr || arr->elems.size() != 2) throw invocation_error(variable + " is not a complex number");
                parts = arr->elems;
            }
            value_ptr deserialize() override { return v_bridged(std::make_shared<Complex>(parts[0], parts[1])); }
        };
        return std::make_unique<Getter>();
    }
private:
    double re_, im_;
};

int main(){
    const char* src = R"EDN(
        (bindings
          (fn :id mean :name "mean" :nargout 1 :ret f64 :params [ (array f64) ] :throws [ invocation-failure ])
          (fn :id minmax :name "minmax" :nargout 2 :ret (array f64) :params [ (array f64) ] :throws [ invocation-failure ])
          (fn :id conj :name "conj" :nargout 1 :ret (bridged complex) :params [ complex ] :throws [ invocation-failure ])
        )
    )EDN";

    auto engine = std::make_shared<LocalEngine>();
    engine->define("mean", [](const std::vector<value_ptr>& a, int){
        auto& xs = std::get<array_of<double>>(a.at(0)->data).elems;
        double s = 0; for(double x: xs) s += x;
        return std::vector<value_ptr>{v_f64(xs.empty() ? 0 : s / xs.size())};
    });
    engine->define("minmax", [](const std::vector<value_ptr>& a, int){
        auto& xs = std::get<array_of<double>>(a.at(0)->data).elems;
        double lo = INFINITY, hi = -INFINITY;
        for(double x: xs){ lo = std::min(lo, x); hi = std::max(hi, x); }
        return std::vector<value_ptr>{v_f64(lo), v_f64(hi)};
    });
    engine->define("conj", [](const std::vector<value_ptr>& a, int){
        auto& z = std::get<array_of<double>>(a.at(0)->data).elems;
        return std::vector<value_ptr>{v_array<double>({z[0], -z[1]})};
    });

    BridgedTypeRegistry registry;
    registry.register_type<Complex>();

    std::shared_ptr<Linker> linker;
    try {
        linker = Linker::link(parse_bindings(src), engine, {}, registry);
    } catch(const linking_error& e){
        std::cerr << e.what();
        return 1;
    }

    try {
        std::vector<double> data{4, 8, 15, 16, 23, 42};
        auto mean = linker->bind<double(const std::vector<double>&)>("mean");
        std::cout << "mean: " << mean(data) << "\n";

        value_ptr range = linker->invoke("minmax", {v_array<double>(data)});
        std::cout << "minmax: " << to_string(range) << "\n";

        auto conj = linker->bind<std::shared_ptr<Complex>(std::shared_ptr<Complex>)>("conj");
        auto z = conj(std::make_shared<Complex>(1, 2));
        std::cout << "conj: " << z->re() << (z->im() < 0 ? " - " : " + ") << std::abs(z->im()) << "i\n";
    } catch(const std::exception& e){
        std::cerr << "call failed: " << e.what() << "\n";
        return 2;
    }
    std::cout << "local engine example OK\n";
    return 0;
}
