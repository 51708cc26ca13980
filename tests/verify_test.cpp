#include <gtest/gtest.h>
#include "sprig/verify.hpp"

using namespace sprig;

TEST(VerifyTest, WellFormedTreeHasNoProblems){
    auto tree = make_node(syntax_kind::document, 0, {
        make_node(syntax_kind::markup_text, 0, { make_token(syntax_kind::text, 0, "ab") }),
        make_node(syntax_kind::class_declaration, 2, {
            make_token(syntax_kind::keyword, 2, "class"),
            make_missing_token(syntax_kind::identifier, 7),
        }),
    });
    EXPECT_TRUE(verify_tree(tree).empty());
    EXPECT_NO_THROW(ensure_well_formed(tree));
}

TEST(VerifyTest, ReportsGap){
    auto tree = make_node(syntax_kind::code_literal, 0, {
        make_token(syntax_kind::text, 0, "a"),
        make_token(syntax_kind::text, 2, "b"),
    });
    auto problems = verify_tree(tree);
    ASSERT_FALSE(problems.empty());
    EXPECT_EQ(problems[0].rfind("gap before Text [2..3)", 0), 0u);
    EXPECT_THROW(ensure_well_formed(tree), tree_verification_error);
}

TEST(VerifyTest, ReportsOverlap){
    auto tree = make_node(syntax_kind::code_literal, 0, {
        make_token(syntax_kind::text, 0, "ab"),
        make_token(syntax_kind::text, 1, "c"),
    });
    auto problems = verify_tree(tree);
    ASSERT_FALSE(problems.empty());
    EXPECT_EQ(problems[0].rfind("overlap", 0), 0u);
}

TEST(VerifyTest, ReportsChildrenEndMismatch){
    // the first child starts late, so the last child ends past the parent's end
    auto tree = make_node(syntax_kind::code_literal, 0, { make_token(syntax_kind::text, 1, "a") });
    auto problems = verify_tree(tree);
    ASSERT_EQ(problems.size(), 2u);
    EXPECT_NE(problems[1].find("end at 2"), std::string::npos);
}
