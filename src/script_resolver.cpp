#include "rlink/script_resolver.hpp"
#include "rlink/env.hpp"
#include <cstdio>
#include <mutex>
#include <vector>
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Signals.h"
#include "llvm/Support/raw_ostream.h"

namespace rlink {

namespace {

// Extracted script directories, removed best-effort when the process exits.
class ExtractedScripts {
public:
    static ExtractedScripts& instance(){ static ExtractedScripts s; return s; }
    ~ExtractedScripts(){ remove_all(); }

    void add(std::string dir, std::string file){
        llvm::sys::RemoveFileOnSignal(file);
        std::lock_guard<std::mutex> lk(mu_);
        dirs_.push_back(std::move(dir));
    }
    std::size_t size(){ std::lock_guard<std::mutex> lk(mu_); return dirs_.size(); }
    void remove_all(){
        std::vector<std::string> dirs;
        { std::lock_guard<std::mutex> lk(mu_); dirs.swap(dirs_); }
        for(auto &d: dirs){
            if(auto ec = llvm::sys::fs::remove_directories(d, /*IgnoreErrors=*/true); ec && trace_enabled())
                std::fprintf(stderr, "[rlink][extract] could not remove %s: %s\n", d.c_str(), ec.message().c_str());
        }
    }
private:
    std::mutex mu_;
    std::vector<std::string> dirs_;
};

std::string location_of(const FunctionDecl& d){
    return !d.absolutePath.empty() ? d.absolutePath : d.relativePath;
}

} // namespace

std::size_t pending_extractions(){ return ExtractedScripts::instance().size(); }
void remove_extracted_scripts(){ ExtractedScripts::instance().remove_all(); }

ScriptResolver::ScriptResolver(ScriptOrigin origin, std::string extension, std::string temp_base)
    : origin_(std::move(origin)), extension_(std::move(extension)), temp_base_(std::move(temp_base)) {}

std::optional<ResolvedScript> ScriptResolver::resolve(const FunctionDecl& d, ErrorReporter& r){
    if(!d.absolutePath.empty()) return resolve_file(d, d.absolutePath, r);

    if(origin_.archive){
        auto extracted = extract(d, r);
        if(!extracted) return std::nullopt;
        return resolve_file(d, *extracted, r);
    }
    if(origin_.directory.empty()){
        r.emit_error(r.make("E2010", d.id, "relative script path without an origin",
                            "link with ScriptOrigin::from_directory or from_archive", d.line, d.col));
        return std::nullopt;
    }
    llvm::SmallString<256> joined(origin_.directory);
    llvm::sys::path::append(joined, d.relativePath);
    return resolve_file(d, std::string(joined.str()), r);
}

std::optional<std::string> ScriptResolver::extract(const FunctionDecl& d, ErrorReporter& r){
    llvm::SmallString<128> entry(d.relativePath);
    llvm::sys::path::remove_dots(entry, /*remove_dot_dot=*/true, llvm::sys::path::Style::posix);
    std::string entryName(entry.str());

    std::optional<std::string> contents;
    try { contents = origin_.archive->read_entry(entryName); }
    catch(const std::exception& ex){
        auto e = r.make("E2012", d.id, "unable to extract script from archive", "", d.line, d.col);
        e.notes.push_back({"archive: " + origin_.archive->location(), -1, -1});
        e.notes.push_back({ex.what(), -1, -1});
        r.emit_error(e);
        return std::nullopt;
    }
    if(!contents){
        auto e = r.make("E2011", d.id, "script entry not found in archive: " + entryName, "", d.line, d.col);
        e.notes.push_back({"archive: " + origin_.archive->location(), -1, -1});
        r.emit_error(e);
        return std::nullopt;
    }
    if(llvm::sys::path::extension(entryName) != extension_){
        auto e = r.make("E2016", d.id, "script entry does not end in " + extension_ + ": " + entryName, "", d.line, d.col);
        e.notes.push_back({"archive: " + origin_.archive->location(), -1, -1});
        r.emit_error(e);
        return std::nullopt;
    }

    auto fail = [&](const std::string& what, std::error_code ec){
        auto e = r.make("E2012", d.id, "unable to extract script from archive", "", d.line, d.col);
        e.notes.push_back({"archive: " + origin_.archive->location(), -1, -1});
        e.notes.push_back({what + ": " + ec.message(), -1, -1});
        r.emit_error(e);
    };

    // One private directory per extraction so equally named scripts never collide
    llvm::SmallString<256> prefix;
    if(!temp_base_.empty()) prefix = temp_base_;
    else llvm::sys::path::system_temp_directory(/*ErasedOnReboot=*/true, prefix);
    llvm::sys::path::append(prefix, "rlink");
    llvm::SmallString<256> dir;
    if(auto ec = llvm::sys::fs::createUniqueDirectory(prefix, dir)){ fail("create directory", ec); return std::nullopt; }

    llvm::SmallString<256> file(dir);
    llvm::sys::path::append(file, std::string(llvm::sys::path::stem(entryName)) + extension_);
    ExtractedScripts::instance().add(std::string(dir.str()), std::string(file.str()));

    std::error_code ec;
    llvm::raw_fd_ostream os(file, ec, llvm::sys::fs::OF_None);
    if(ec){ fail("open " + std::string(file.str()), ec); return std::nullopt; }
    os << *contents;
    os.close();
    if(os.has_error()){
        auto werr = os.error();
        os.clear_error();
        fail("write " + std::string(file.str()), werr);
        return std::nullopt;
    }
    if(trace_enabled())
        std::fprintf(stderr, "[rlink][extract] %s -> %s\n", entryName.c_str(), file.c_str());
    return std::string(file.str());
}

std::optional<ResolvedScript> ScriptResolver::resolve_file(const FunctionDecl& d, const std::string& path, ErrorReporter& r){
    auto report = [&](const char* code, const std::string& msg, const std::string& resolved){
        auto e = r.make(code, d.id, msg, "", d.line, d.col);
        e.notes.push_back({"path: " + location_of(d), -1, -1});
        e.notes.push_back({"resolved as: " + resolved, -1, -1});
        r.emit_error(e);
    };

    llvm::SmallString<256> abs(path);
    if(auto ec = llvm::sys::fs::make_absolute(abs)){
        report("E2013", "unable to resolve canonical path of script: " + ec.message(), path);
        return std::nullopt;
    }
    llvm::sys::path::remove_dots(abs, /*remove_dot_dot=*/true);
    std::string absPath(abs.str());

    if(!llvm::sys::fs::exists(abs)){ report("E2014", "script file does not exist", absPath); return std::nullopt; }
    if(!llvm::sys::fs::is_regular_file(abs)){ report("E2015", "script path is not a regular file", absPath); return std::nullopt; }

    llvm::SmallString<256> canonical;
    if(auto ec = llvm::sys::fs::real_path(abs, canonical)){
        report("E2013", "unable to resolve canonical path of script: " + ec.message(), absPath);
        return std::nullopt;
    }
    if(llvm::sys::path::extension(canonical) != extension_){
        report("E2016", "script file does not end in " + extension_, std::string(canonical.str()));
        return std::nullopt;
    }
    ResolvedScript out;
    out.function_name = std::string(llvm::sys::path::stem(canonical));
    out.directory = std::string(llvm::sys::path::parent_path(canonical));
    return out;
}

} // namespace rlink
