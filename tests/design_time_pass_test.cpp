#include <gtest/gtest.h>
#include "sprig/design_time_pass.hpp"
#include "sprig/node_writer.hpp"

using namespace sprig;

namespace {

node_ptr dtok(size_t pos, const std::string& text){
    return make_node(syntax_kind::directive_token, pos, { make_token(syntax_kind::text, pos, text) });
}

// @inject <a> <b>; starting at pos
node_ptr inject(size_t pos, const std::string& a, const std::string& b){
    size_t p = pos;
    node_list kids;
    kids.push_back(make_token(syntax_kind::transition, p, "@")); p += 1;
    kids.push_back(make_token(syntax_kind::keyword, p, "inject")); p += 6;
    kids.push_back(make_token(syntax_kind::whitespace, p, " ")); p += 1;
    kids.push_back(dtok(p, a)); p += a.size();
    kids.push_back(make_token(syntax_kind::whitespace, p, " ")); p += 1;
    kids.push_back(dtok(p, b)); p += b.size();
    kids.push_back(make_token(syntax_kind::semicolon, p, ";"));
    return make_node(syntax_kind::directive, pos, std::move(kids));
}

node_ptr class_of(size_t pos, node_list members){
    node_list kids;
    kids.push_back(make_token(syntax_kind::keyword, pos, "class"));
    for(auto& m : members) kids.push_back(m);
    return make_node(syntax_kind::class_declaration, pos, std::move(kids));
}

node_ptr run(const node_ptr& tree){
    code_document doc;
    doc.options.design_time = true;
    DesignTimeDirectivePass pass;
    return pass.execute(doc, tree);
}

std::vector<std::string> texts(const node_ptr& holder){
    std::vector<std::string> out;
    for(auto& c : holder->children()) out.push_back(c->to_full_string());
    return out;
}

size_t count_directive_tokens(const node_ptr& n){
    if(!n || n->is_token()) return 0;
    size_t c = n->kind() == syntax_kind::directive_token ? 1 : 0;
    for(auto& ch : n->children()) c += count_directive_tokens(ch);
    return c;
}

} // namespace

TEST(DesignTimePassTest, HoistsDirectiveTokensInEncounterOrder){
    // class@inject Foo x;@inject Bar y;
    auto d1 = inject(5, "Foo", "x");
    auto d2 = inject(5 + d1->full_width(), "Bar", "y");
    auto cls = class_of(0, {d1, d2});
    auto out = run(make_node(syntax_kind::document, 0, {cls}));

    auto lowered = out->children()[0];
    ASSERT_EQ(lowered->kind(), syntax_kind::class_declaration);
    ASSERT_EQ(lowered->children().size(), cls->children().size() + 2);

    auto holder = lowered->children()[0];
    EXPECT_EQ(holder->kind(), syntax_kind::design_time_directive);
    EXPECT_EQ(texts(holder), (std::vector<std::string>{"Foo", "x", "Bar", "y"}));
    EXPECT_EQ(holder->position(), 13u);
    // nominal range: first hoisted token, summed widths
    EXPECT_EQ(holder->full_width(), 3u + 1u + 3u + 1u);

    auto field = lowered->children()[1];
    EXPECT_EQ(field->kind(), syntax_kind::field_declaration);
    auto code = as_token(field->children().at(0));
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->kind(), syntax_kind::code);
    EXPECT_TRUE(code->is_synthesized());
    EXPECT_EQ(code->content(), "private static System.Object __o = null;");

    // the remaining children are the original ones with the tokens removed
    EXPECT_EQ(lowered->children()[2].get(), cls->children()[0].get());
    EXPECT_EQ(lowered->children()[3]->kind(), syntax_kind::directive);
    EXPECT_EQ(lowered->children()[3]->children().size(), 5u);
    EXPECT_EQ(count_directive_tokens(lowered), 4u);
    EXPECT_EQ(count_directive_tokens(lowered->children()[3]), 0u);
    EXPECT_EQ(lowered->position(), cls->position());
    EXPECT_EQ(lowered->full_width(), cls->full_width());
}

TEST(DesignTimePassTest, EmptyHolderAndFieldAlwaysInserted){
    auto cls = class_of(0, {});
    auto out = run(cls);
    ASSERT_EQ(out->children().size(), 3u);
    EXPECT_EQ(out->children()[0]->kind(), syntax_kind::design_time_directive);
    EXPECT_TRUE(out->children()[0]->children().empty());
    EXPECT_EQ(out->children()[0]->position(), 0u);
    EXPECT_EQ(out->children()[1]->kind(), syntax_kind::field_declaration);
    EXPECT_EQ(out->children()[2].get(), cls->children()[0].get());
}

TEST(DesignTimePassTest, NestedClassesCollectTheirOwnTokens){
    auto a = inject(5, "A", "a");
    auto inner = class_of(5 + a->full_width(), { inject(10 + a->full_width(), "B", "b") });
    auto c = inject(inner->end_position(), "C", "c");
    auto outer = class_of(0, {a, inner, c});

    auto out = run(outer);
    EXPECT_EQ(texts(out->children()[0]), (std::vector<std::string>{"A", "a", "C", "c"}));

    auto lowered_inner = out->children()[4];
    ASSERT_EQ(lowered_inner->kind(), syntax_kind::class_declaration);
    EXPECT_EQ(lowered_inner->children()[0]->kind(), syntax_kind::design_time_directive);
    EXPECT_EQ(texts(lowered_inner->children()[0]), (std::vector<std::string>{"B", "b"}));
    EXPECT_EQ(lowered_inner->children()[1]->kind(), syntax_kind::field_declaration);
}

TEST(DesignTimePassTest, DirectivesOutsideClassesStay){
    auto doc = make_node(syntax_kind::document, 0, { inject(0, "Foo", "x") });
    auto out = run(doc);
    EXPECT_EQ(out.get(), doc.get());
}

TEST(DesignTimePassTest, InputTreeIsLeftIntact){
    auto d1 = inject(5, "Foo", "x");
    auto doc = make_node(syntax_kind::document, 0, { class_of(0, {d1}) });
    const std::string before = serialize_tree(doc);
    auto first = run(doc);
    EXPECT_EQ(serialize_tree(doc), before);
    EXPECT_EQ(count_directive_tokens(doc), 2u);
    // same input, same output
    EXPECT_EQ(serialize_tree(run(doc)), serialize_tree(first));
}

TEST(DesignTimePassTest, RunningTwiceChangesNothing){
    auto a = inject(5, "A", "a");
    auto inner = class_of(5 + a->full_width(), { inject(10 + a->full_width(), "B", "b") });
    auto doc = make_node(syntax_kind::document, 0, { class_of(0, {a, inner}) });

    auto once = run(doc);
    auto twice = run(once);
    EXPECT_EQ(serialize_tree(twice), serialize_tree(once));
    EXPECT_EQ(twice.get(), once.get());

    auto outer = twice->children()[0];
    ASSERT_EQ(outer->children().size(), 5u);
    EXPECT_EQ(outer->children()[0]->kind(), syntax_kind::design_time_directive);
    EXPECT_EQ(outer->children()[1]->kind(), syntax_kind::field_declaration);
    EXPECT_NE(outer->children()[2]->kind(), syntax_kind::design_time_directive);
}

TEST(DesignTimePassTest, LoweredClassGathersLeftoverTokensIntoExistingHolder){
    auto once = run(class_of(0, { inject(5, "A", "a") }));
    ASSERT_EQ(once->children().size(), 4u);

    // a directive added to an already lowered class
    node_list kids = once->children();
    kids.push_back(inject(once->end_position(), "C", "c"));
    auto again = run(once->with_children(std::move(kids)));

    ASSERT_EQ(again->children().size(), 5u);
    EXPECT_EQ(texts(again->children()[0]), (std::vector<std::string>{"A", "a", "C", "c"}));
    EXPECT_EQ(again->children()[0]->position(), once->children()[0]->position());
    EXPECT_EQ(again->children()[1].get(), once->children()[1].get());
    EXPECT_EQ(count_directive_tokens(again->children()[4]), 0u);
}

TEST(DesignTimePassTest, ContractDetails){
    DesignTimeDirectivePass pass;
    EXPECT_EQ(pass.order(), -10);
    EXPECT_EQ(pass.name(), "design-time-directive");
    EXPECT_STREQ(DesignTimeDirectivePass::design_time_variable, "__o");

    code_document doc;
    EXPECT_THROW(pass.execute(doc, nullptr), std::invalid_argument);
}
