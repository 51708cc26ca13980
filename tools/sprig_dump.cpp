#include "razorlite/razorlite.hpp"
#include "sprig/diagnostics_json.hpp"
#include "sprig/node_writer.hpp"
#include "sprig/verify.hpp"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

int main(int argc, char** argv){
    llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);
    if(argc < 2){ llvm::errs() << "usage: sprig-dump <file> [--design-time] [--verify]\n"; return 1; }
    std::string file = argv[1];
    bool design_time = false, verify = false;
    for(int i = 2; i < argc; ++i){
        std::string arg = argv[i];
        if(arg == "--design-time") design_time = true;
        else if(arg == "--verify") verify = true;
        else { llvm::errs() << "unknown option: " << arg << "\n"; return 1; }
    }

    auto buf = llvm::MemoryBuffer::getFile(file);
    if(!buf){ llvm::errs() << "failed to read " << file << ": " << buf.getError().message() << "\n"; return 1; }

    razorlite::parse_options popts;
    popts.design_time = design_time;
    auto tree = razorlite::parse_document((*buf)->getBuffer().str(), popts, file);

    if(verify){
        try {
            sprig::ensure_well_formed(tree.root);
        } catch (const sprig::tree_verification_error& e){
            llvm::errs() << "tree verification failed: " << e.what() << "\n";
            return 2;
        }
    }

    sprig::serialize_tree(tree.lowered, llvm::outs());

    for(auto& d : tree.diagnostics) llvm::errs() << sprig::serialize_diagnostic(d) << " " << d.message << "\n";
    sprig::maybe_print_json(tree.diagnostics);
    return tree.diagnostics.empty() ? 0 : 2;
}
