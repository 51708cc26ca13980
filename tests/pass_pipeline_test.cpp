#include <gtest/gtest.h>
#include "sprig/design_time_pass.hpp"
#include "sprig/pass.hpp"
#include "sprig/verify.hpp"
#include "test_env.hpp"

using namespace sprig;

namespace {

// Appends a marker token to the root so the execution order is observable.
class MarkerPass : public IntermediatePass {
public:
    MarkerPass(std::string name, int order) : name_(std::move(name)), order_(order) {}
    int order() const override { return order_; }
    std::string name() const override { return name_; }

protected:
    node_ptr execute_core(code_document&, const node_ptr& tree) override {
        node_list kids = tree->children();
        kids.push_back(make_synthesized_token(syntax_kind::text, tree->end_position(), name_));
        return tree->with_children(std::move(kids));
    }

private:
    std::string name_;
    int order_;
};

std::vector<std::string> markers(const node_ptr& n){
    std::vector<std::string> out;
    for(auto& c : n->children()) if(auto t = as_token(c)) out.push_back(t->content());
    return out;
}

} // namespace

TEST(PassPipelineTest, RunsByAscendingOrderStableForTies){
    PassPipeline p;
    p.add(std::make_unique<MarkerPass>("b", 5))
     .add(std::make_unique<MarkerPass>("a", -1))
     .add(std::make_unique<MarkerPass>("c", 5))
     .add(std::make_unique<MarkerPass>("z", 0));
    code_document doc;
    auto out = p.run(doc, make_node(syntax_kind::document, 0, {}));
    EXPECT_EQ(markers(out), (std::vector<std::string>{"a", "z", "b", "c"}));
    EXPECT_EQ(p.size(), 4u);
}

TEST(PassPipelineTest, DesignTimePassRunsFirst){
    PassPipeline p;
    p.add(std::make_unique<MarkerPass>("default", 0));
    p.add(std::make_unique<DesignTimeDirectivePass>());
    auto ordered = p.ordered_passes();
    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_EQ(ordered[0]->name(), "design-time-directive");
    EXPECT_EQ(ordered[1]->name(), "default");
}

TEST(PassPipelineTest, DefaultPipelineDependsOnDesignTime){
    EXPECT_EQ(default_pipeline(document_options{false}).size(), 0u);
    auto p = default_pipeline(document_options{true});
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p.ordered_passes()[0]->order(), DesignTimeDirectivePass::pass_order);
}

TEST(PassPipelineTest, RejectsNullInputs){
    PassPipeline p;
    EXPECT_THROW(p.add(nullptr), std::invalid_argument);
    p.add(std::make_unique<MarkerPass>("a", 0));
    code_document doc;
    EXPECT_THROW(p.run(doc, nullptr), std::invalid_argument);
}

TEST(PassPipelineTest, VerifiesInputWhenRequested){
    // child starts at 3 under a parent at 0: a gap
    auto bad = make_node(syntax_kind::document, 0, { make_token(syntax_kind::text, 3, "x") });
    PassPipeline p;
    p.add(std::make_unique<MarkerPass>("a", 0));
    code_document doc;
    {
        sprig_test::scoped_env env("SPRIG_VERIFY_TREES", "1");
        EXPECT_THROW(p.run(doc, bad), tree_verification_error);
    }
    {
        sprig_test::scoped_env env("SPRIG_VERIFY_TREES", "");
        EXPECT_NO_THROW(p.run(doc, bad));
    }
}

TEST(PassPipelineTest, TraceLogsEachPass){
    sprig_test::scoped_env env("SPRIG_TRACE", "1");
    PassPipeline p;
    p.add(std::make_unique<MarkerPass>("marker", 3));
    code_document doc;
    testing::internal::CaptureStderr();
    p.run(doc, make_node(syntax_kind::document, 0, {}));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[sprig][pass] marker (order 3)"), std::string::npos);
}
