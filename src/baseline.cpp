#include "sprig/baseline.hpp"
#include "sprig/env.hpp"
#include "sprig/node_writer.hpp"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <sstream>

namespace sprig {

baseline_context make_baseline_context(std::string file_name, std::string default_root){
    env_config env = detect_env();
    baseline_context ctx;
    ctx.file_name = std::move(file_name);
    ctx.generate_baselines = env.generate_baselines;
    ctx.root = env.baseline_root.empty() ? std::move(default_root) : env.baseline_root;
    return ctx;
}

static std::string baseline_path(const baseline_context& ctx, const char* extension){
    llvm::SmallString<256> p(ctx.root);
    llvm::sys::path::append(p, ctx.file_name);
    llvm::sys::path::replace_extension(p, extension);
    return std::string(p.str());
}

std::string syntax_tree_baseline_path(const baseline_context& ctx){ return baseline_path(ctx, ".syntaxtree.txt"); }
std::string diagnostics_baseline_path(const baseline_context& ctx){ return baseline_path(ctx, ".diagnostics.txt"); }

std::vector<std::string> split_baseline_lines(const std::string& text){
    std::vector<std::string> lines;
    std::string cur;
    for(char c : text){
        if(c == '\r' || c == '\n'){ if(!cur.empty()) lines.push_back(std::move(cur)); cur.clear(); }
        else cur += c;
    }
    if(!cur.empty()) lines.push_back(std::move(cur));
    return lines;
}

static void write_file(const std::string& path, const std::string& contents){
    llvm::SmallString<256> dir(path);
    llvm::sys::path::remove_filename(dir);
    if(!dir.empty()){
        if(auto ec = llvm::sys::fs::create_directories(dir))
            throw baseline_mismatch("cannot create " + std::string(dir.str()) + ": " + ec.message());
    }
    std::error_code ec;
    llvm::raw_fd_ostream out(path, ec, llvm::sys::fs::OF_Text);
    if(ec) throw baseline_mismatch("cannot write " + path + ": " + ec.message());
    out << contents;
}

static bool read_file(const std::string& path, std::string& out){
    auto buf = llvm::MemoryBuffer::getFile(path);
    if(!buf) return false;
    out = (*buf)->getBuffer().str();
    return true;
}

static void compare_lines(const std::string& what, const std::vector<std::string>& expected, const std::vector<std::string>& actual){
    size_t n = std::max(expected.size(), actual.size());
    for(size_t i = 0; i < n; ++i){
        const std::string* e = i < expected.size() ? &expected[i] : nullptr;
        const std::string* a = i < actual.size() ? &actual[i] : nullptr;
        if(e && a && *e == *a) continue;
        std::ostringstream os;
        os << "baseline mismatch in " << what << " at line " << (i + 1) << ":\n"
           << "  expected: " << (e ? *e : std::string("<end of baseline>")) << "\n"
           << "  actual:   " << (a ? *a : std::string("<end of output>"));
        throw baseline_mismatch(os.str());
    }
}

void assert_matches_baseline(const baseline_context& ctx, const node_ptr& root, const diagnostic_list& diagnostics){
    if(ctx.file_name.empty())
        throw std::logic_error("assert_matches_baseline should only be called from a parser test (file_name is empty).");
    if(ctx.is_theory)
        throw std::logic_error("assert_matches_baseline should not be called from a theory test.");

    const std::string tree_path = syntax_tree_baseline_path(ctx);
    const std::string diag_path = diagnostics_baseline_path(ctx);
    std::vector<std::string> diag_lines;
    for(auto& d : diagnostics) diag_lines.push_back(normalize_new_lines(serialize_diagnostic(d)));

    if(ctx.generate_baselines){
        write_file(tree_path, serialize_tree(root));
        if(!diag_lines.empty()){
            std::string text;
            for(auto& l : diag_lines) text += l + "\n";
            write_file(diag_path, text);
        } else if(llvm::sys::fs::exists(diag_path)){
            if(auto ec = llvm::sys::fs::remove(diag_path))
                throw baseline_mismatch("cannot remove " + diag_path + ": " + ec.message());
        }
        return;
    }

    std::string baseline;
    if(!read_file(tree_path, baseline))
        throw baseline_mismatch("The baseline " + tree_path + " was not found.");
    compare_lines(tree_path, split_baseline_lines(baseline), split_baseline_lines(serialize_tree(root)));

    // A missing diagnostics file means no diagnostics.
    std::string baseline_diags;
    if(!read_file(diag_path, baseline_diags)) baseline_diags.clear();
    compare_lines(diag_path, split_baseline_lines(baseline_diags), diag_lines);
}

} // namespace sprig
