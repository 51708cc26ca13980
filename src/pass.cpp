#include "sprig/pass.hpp"
#include "sprig/design_time_pass.hpp"
#include "sprig/env.hpp"
#include "sprig/verify.hpp"

#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <stdexcept>

namespace sprig {

node_ptr IntermediatePass::execute(code_document& document, const node_ptr& tree){
    if(!tree) throw std::invalid_argument(name() + ": tree must not be null");
    return execute_core(document, tree);
}

PassPipeline& PassPipeline::add(std::unique_ptr<IntermediatePass> pass){
    if(!pass) throw std::invalid_argument("PassPipeline::add: pass must not be null");
    passes_.push_back(std::move(pass));
    return *this;
}

std::vector<IntermediatePass*> PassPipeline::sorted() const {
    std::vector<IntermediatePass*> out;
    out.reserve(passes_.size());
    for(auto& p : passes_) out.push_back(p.get());
    std::stable_sort(out.begin(), out.end(), [](const IntermediatePass* a, const IntermediatePass* b){ return a->order() < b->order(); });
    return out;
}

std::vector<const IntermediatePass*> PassPipeline::ordered_passes() const {
    auto s = sorted();
    return std::vector<const IntermediatePass*>(s.begin(), s.end());
}

node_ptr PassPipeline::run(code_document& document, node_ptr tree) const {
    env_config env = detect_env();
    if(env.verify_trees) ensure_well_formed(tree);
    for(auto* p : sorted()){
        if(env.trace) llvm::errs() << "[sprig][pass] " << p->name() << " (order " << p->order() << ")\n";
        tree = p->execute(document, tree);
    }
    if(env.trace) llvm::errs() << "[sprig][pass] pipeline done, " << document.diagnostics.size() << " diagnostic(s)\n";
    return tree;
}

PassPipeline default_pipeline(const document_options& options){
    PassPipeline pipeline;
    if(options.design_time) pipeline.add(std::make_unique<DesignTimeDirectivePass>());
    return pipeline;
}

} // namespace sprig
