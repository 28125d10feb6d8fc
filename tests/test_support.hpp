#pragma once
#include <memory>
#include <string>
#include <vector>
#include "rlink/rlink.hpp"
#include "rlink/local/local_engine.hpp"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

namespace rlink_test {

// Bridged point stored remotely as a two element f64 array.
class Point2D : public rlink::BridgedValue {
public:
    static constexpr const char* kTypeName = "point2d";

    Point2D(double x, double y) : x_(x), y_(y) {}
    double x() const { return x_; }
    double y() const { return y_; }

    std::string type_name() const override { return kTypeName; }

    std::unique_ptr<rlink::SerializedSetter> serialized_setter() const override {
        struct Setter : rlink::SerializedSetter {
            double x, y;
            Setter(double x, double y) : x(x), y(y) {}
            void set_in(rlink::Session& s, const std::string& variable) override {
                s.set_variable(variable, rlink::v_array<double>({x, y}));
            }
        };
        return std::make_unique<Setter>(x_, y_);
    }

    bool equals(const rlink::BridgedValue& other) const override {
        auto* p = dynamic_cast<const Point2D*>(&other);
        return p && p->x_ == x_ && p->y_ == y_;
    }

    static std::unique_ptr<rlink::SerializedGetter> create_getter(){
        struct Getter : rlink::SerializedGetter {
            std::vector<double> coords;
            void get_in(rlink::Session& s, const std::string& variable) override {
                auto v = s.get_variable(variable);
                auto* arr = v ? std::get_if<rlink::array_of<double>>(&v->data) : nullptr;
                if(!arr || arr->elems.size() != 2) throw rlink::invocation_error("not a point: " + variable);
                coords = arr->elems;
            }
            rlink::value_ptr deserialize() override {
                return rlink::v_bridged(std::make_shared<Point2D>(coords[0], coords[1]));
            }
        };
        return std::make_unique<Getter>();
    }

private:
    double x_, y_;
};

// Parameter-only bridged type: no getter.
class Tag : public rlink::BridgedValue {
public:
    static constexpr const char* kTypeName = "tag";
    explicit Tag(std::string text) : text_(std::move(text)) {}
    std::string type_name() const override { return kTypeName; }
    std::unique_ptr<rlink::SerializedSetter> serialized_setter() const override {
        struct Setter : rlink::SerializedSetter {
            std::string text;
            explicit Setter(std::string t) : text(std::move(t)) {}
            void set_in(rlink::Session& s, const std::string& variable) override { s.set_variable(variable, rlink::v_str(text)); }
        };
        return std::make_unique<Setter>(text_);
    }
private:
    std::string text_;
};

inline rlink::BridgedTypeRegistry test_registry(){
    rlink::BridgedTypeRegistry reg;
    reg.register_type<Point2D>();
    reg.register_type<Tag>();
    return reg;
}

inline rlink::FunctionDecl fn(std::string id, std::string name, int nargout, std::string ret,
                              std::vector<std::string> params = {}, std::vector<std::string> returns = {}){
    rlink::FunctionDecl d;
    d.id = std::move(id);
    d.name = std::move(name);
    d.nargout = nargout;
    d.ret = std::move(ret);
    d.params = std::move(params);
    d.returns = std::move(returns);
    d.throws = {rlink::kInvocationFailure};
    return d;
}

inline rlink::LinkOptions quiet_options(){
    rlink::LinkOptions o;
    o.diagJson = false;
    return o;
}

inline std::vector<std::string> codes(const rlink::LinkResult& r){
    std::vector<std::string> out;
    for(auto &e: r.errors) out.push_back(e.code);
    return out;
}

inline bool has_code(const rlink::LinkResult& r, const std::string& code){
    for(auto &e: r.errors) if(e.code == code) return true;
    return false;
}

// Unique scratch directory removed on destruction.
class TempDir {
public:
    TempDir(){
        llvm::SmallString<256> base;
        llvm::sys::path::system_temp_directory(/*ErasedOnReboot=*/true, base);
        llvm::sys::path::append(base, "rlink-test");
        llvm::SmallString<256> p;
        if(llvm::sys::fs::createUniqueDirectory(base, p)) throw std::runtime_error("cannot create temp dir");
        llvm::SmallString<256> real;
        if(llvm::sys::fs::real_path(p, real)) real = p;
        path_ = std::string(real.str());
    }
    ~TempDir(){ (void)llvm::sys::fs::remove_directories(path_); }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string join(const std::string& rel) const {
        llvm::SmallString<256> p(path_);
        llvm::sys::path::append(p, rel);
        return std::string(p.str());
    }
    void mkdir(const std::string& rel) const {
        if(llvm::sys::fs::create_directories(join(rel))) throw std::runtime_error("cannot create " + rel);
    }
    std::string write(const std::string& rel, const std::string& contents) const {
        std::string file = join(rel);
        std::error_code ec;
        llvm::raw_fd_ostream os(file, ec, llvm::sys::fs::OF_None);
        if(ec) throw std::runtime_error("cannot write " + file);
        os << contents;
        return file;
    }

private:
    std::string path_;
};

} // namespace rlink_test
