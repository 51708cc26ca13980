#pragma once
#include "sprig/diagnostics.hpp"
#include "sprig/syntax.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sprig {

struct document_options {
    bool design_time = false;
};

// The document a pipeline runs for. Passes report problems into diagnostics.
struct code_document {
    std::string source;
    std::string file_path;
    document_options options;
    diagnostic_list diagnostics;
};

// A tree-to-tree transformation. Passes never mutate their input and must
// produce the same output for the same input.
class IntermediatePass {
public:
    virtual ~IntermediatePass() = default;

    // Lower runs first.
    virtual int order() const { return 0; }
    virtual std::string name() const = 0;

    // Throws std::invalid_argument for a null tree.
    node_ptr execute(code_document& document, const node_ptr& tree);

protected:
    virtual node_ptr execute_core(code_document& document, const node_ptr& tree) = 0;
};

class PassPipeline {
public:
    PassPipeline& add(std::unique_ptr<IntermediatePass> pass);

    // Runs every registered pass by ascending order; ties keep registration order.
    node_ptr run(code_document& document, node_ptr tree) const;

    std::vector<const IntermediatePass*> ordered_passes() const;
    size_t size() const { return passes_.size(); }

private:
    std::vector<std::unique_ptr<IntermediatePass>> passes_;
    std::vector<IntermediatePass*> sorted() const;
};

// Passes for the given options; the design-time pass only in design-time mode.
PassPipeline default_pipeline(const document_options& options);

} // namespace sprig
