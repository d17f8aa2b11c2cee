#include <gtest/gtest.h>
#include <ember/lexer.hpp>
#include <ember/parser.hpp>
#include <ember/printer.hpp>

#include <string>
#include <string_view>

namespace {

static std::string render_src(std::string_view src) {
    return ember::render(ember::parse(ember::scan(src).tokens));
}

TEST(Printer, Literals) {
    EXPECT_EQ(render_src("5"), "5");
    EXPECT_EQ(render_src("2.5"), "2.5");
    EXPECT_EQ(render_src("\"some text\""), "some text");
    EXPECT_EQ(render_src("true"), "true");
    EXPECT_EQ(render_src("false"), "false");
    EXPECT_EQ(render_src("nil"), "nil");
}

TEST(Printer, BinaryPadsOperator) {
    EXPECT_EQ(render_src("1+2*3"), "1 + 2 * 3");
    EXPECT_EQ(render_src("1 >= 2 != true"), "1 >= 2 != true");
    EXPECT_EQ(render_src("1,2"), "1 , 2");
}

TEST(Printer, UnaryHugsOperand) {
    EXPECT_EQ(render_src("- 5"), "-5");
    EXPECT_EQ(render_src("!!false"), "!!false");
}

TEST(Printer, GroupingShowsWhereSourceHadParens) {
    EXPECT_EQ(render_src("(1 + 2) * 3"), "( 1 + 2 ) * 3");
    EXPECT_EQ(render_src("-(4)"), "-( 4 )");
}

TEST(Printer, Condition) {
    EXPECT_EQ(render_src("1 ? \"a\" : nil"), "1 ? a : nil");
    EXPECT_EQ(render_src("1 ? 2 : 3 ? 4 : 5"), "1 ? 2 : 3 ? 4 : 5");
}

TEST(Printer, RendersSubtree) {
    auto ast = ember::parse(ember::scan("(1 + 2) * 3").tokens);
    const auto& mul = ast.root_expr().as<ember::Binary>();
    EXPECT_EQ(ember::render(ast.arena(), mul.left), "( 1 + 2 )");
    EXPECT_EQ(ember::render(ast.arena(), mul.right), "3");
}

} // namespace
