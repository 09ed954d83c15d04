/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <declscan/Macro/MacroClassifier.hpp>

using namespace declscan;
using namespace declscan::macro;

TEST(MacroClassifierTest, SimpleValue) {
    auto macro = MacroClassifier().classify_line("#define FOO 42");
    ASSERT_TRUE(macro.has_value());
    EXPECT_EQ(macro->name, "FOO");
    EXPECT_EQ(macro->raw_value, "42");
    ASSERT_TRUE(std::holds_alternative< SimpleValue >(macro->kind));
    EXPECT_EQ(std::get< SimpleValue >(macro->kind).value, "42");
}

TEST(MacroClassifierTest, ShiftExpression) {
    auto macro = MacroClassifier().classify_line("#define BAR (1 << 2)");
    ASSERT_TRUE(macro.has_value());
    EXPECT_EQ(macro->name, "BAR");
    ASSERT_TRUE(std::holds_alternative< Expression >(macro->kind));
    EXPECT_EQ(std::get< Expression >(macro->kind).text, "(1 << 2)");
}

TEST(MacroClassifierTest, FunctionLike) {
    auto macro = MacroClassifier().classify_line("#define BAZ(x,y) ((x)+(y))");
    ASSERT_TRUE(macro.has_value());
    EXPECT_EQ(macro->name, "BAZ");
    ASSERT_TRUE(std::holds_alternative< FunctionLike >(macro->kind));
    const auto &fn = std::get< FunctionLike >(macro->kind);
    EXPECT_EQ(fn.args, (std::vector< std::string >{ "x", "y" }));
    EXPECT_EQ(fn.body, "((x)+(y))");
    EXPECT_EQ(macro->raw_value, "((x)+(y))");
}

TEST(MacroClassifierTest, FunctionLikeTrimsArgumentsAndAllowsEmptyBody) {
    auto spaced = MacroClassifier().classify_line("#define MAX( a , b ) ((a) > (b) ? (a) : (b))");
    ASSERT_TRUE(spaced.has_value());
    const auto &max = std::get< FunctionLike >(spaced->kind);
    EXPECT_EQ(max.args, (std::vector< std::string >{ "a", "b" }));

    auto empty = MacroClassifier().classify_line("#define NOP()");
    ASSERT_TRUE(empty.has_value());
    const auto &nop = std::get< FunctionLike >(empty->kind);
    EXPECT_TRUE(nop.args.empty());
    EXPECT_TRUE(nop.body.empty());
}

TEST(MacroClassifierTest, SpaceBeforeParenthesisIsObjectLike) {
    auto macro = MacroClassifier().classify_line("#define WORD (4)");
    ASSERT_TRUE(macro.has_value());
    ASSERT_TRUE(std::holds_alternative< SimpleValue >(macro->kind));
    EXPECT_EQ(std::get< SimpleValue >(macro->kind).value, "(4)");
}

TEST(MacroClassifierTest, PointerCast) {
    auto macro = MacroClassifier().classify_line("#define PTR ((Foo*) 0x1000)");
    ASSERT_TRUE(macro.has_value());
    ASSERT_TRUE(std::holds_alternative< TypeCast >(macro->kind));
    const auto &cast = std::get< TypeCast >(macro->kind);
    EXPECT_EQ(cast.target_type, "Foo");
    EXPECT_EQ(cast.address, "0x1000");
}

TEST(MacroClassifierTest, PointerCastToPeripheralBase) {
    auto macro = MacroClassifier().classify_line("#define GPIOA ((GPIO_TypeDef *) GPIOA_BASE)");
    ASSERT_TRUE(macro.has_value());
    ASSERT_TRUE(std::holds_alternative< TypeCast >(macro->kind));
    const auto &cast = std::get< TypeCast >(macro->kind);
    EXPECT_EQ(cast.target_type, "GPIO_TypeDef");
    EXPECT_EQ(cast.address, "GPIOA_BASE");
}

TEST(MacroClassifierTest, BareName) {
    auto macro = MacroClassifier().classify_line("#define HAVE_UART");
    ASSERT_TRUE(macro.has_value());
    EXPECT_EQ(macro->name, "HAVE_UART");
    EXPECT_EQ(macro->raw_value, "");
    ASSERT_TRUE(std::holds_alternative< SimpleValue >(macro->kind));
    EXPECT_TRUE(std::get< SimpleValue >(macro->kind).value.empty());
}

TEST(MacroClassifierTest, OperatorsInsideLiteralsAreIgnored) {
    EXPECT_FALSE(has_operator("\"a-b\""));
    EXPECT_FALSE(has_operator("'+'"));
    EXPECT_FALSE(has_operator("0x10UL"));
    EXPECT_FALSE(has_operator("(a < b)"));
    EXPECT_TRUE(has_operator("(1U << 4)"));
    EXPECT_TRUE(has_operator("(A | B)"));
    EXPECT_TRUE(has_operator("~0"));

    auto macro = MacroClassifier().classify_line("#define VERSION \"1.0-rc1\"");
    ASSERT_TRUE(macro.has_value());
    EXPECT_TRUE(std::holds_alternative< SimpleValue >(macro->kind));
}

TEST(MacroClassifierTest, RejectsMalformedLines) {
    MacroClassifier classifier;
    EXPECT_FALSE(classifier.classify_line("#undef FOO").has_value());
    EXPECT_FALSE(classifier.classify_line("#defineFOO 1").has_value());
    EXPECT_FALSE(classifier.classify_line("#define").has_value());
    EXPECT_FALSE(classifier.classify_line("int x = 1;").has_value());
    EXPECT_FALSE(classifier.classify_line("#define 1FOO 2").has_value());
}

TEST(MacroClassifierTest, ReservedIdentifiers) {
    EXPECT_TRUE(is_reserved_identifier("__RESERVED__"));
    EXPECT_TRUE(is_reserved_identifier("_Bool"));
    EXPECT_TRUE(is_reserved_identifier("__x86_64__"));
    EXPECT_FALSE(is_reserved_identifier("_private"));
    EXPECT_FALSE(is_reserved_identifier("__cplusplus_like"));
    EXPECT_FALSE(is_reserved_identifier("GPIO_BASE"));
}

TEST(MacroClassifierTest, ReservedNamesIgnorePrefixFilter) {
    MacroClassifier classifier({ "__", "GPIO" });
    EXPECT_FALSE(classifier.is_user_macro("__RESERVED__"));
    EXPECT_TRUE(classifier.is_user_macro("GPIO_BASE"));
    EXPECT_FALSE(classifier.is_user_macro("RCC_BASE"));
}

TEST(MacroClassifierTest, ClassifiesDumpInOrder) {
    constexpr const char *dump = "#define __STDC__ 1\r\n"
                                 "#define _GNU_SOURCE 1\n"
                                 "#define FOO 42\n"
                                 "\n"
                                 "#define BAR (1 << 2)\n"
                                 "#define __RESERVED__ 7\n"
                                 "#define BAZ(x,y) ((x)+(y))\r\n"
                                 "#define PTR ((Foo*) 0x1000)\n";

    auto macros = MacroClassifier().classify(dump);
    ASSERT_EQ(macros.size(), 4U);
    EXPECT_EQ(macros[0].name, "FOO");
    EXPECT_EQ(macros[1].name, "BAR");
    EXPECT_EQ(macros[2].name, "BAZ");
    EXPECT_EQ(std::get< FunctionLike >(macros[2].kind).body, "((x)+(y))");
    EXPECT_EQ(macros[3].name, "PTR");
}

TEST(MacroClassifierTest, PrefixFilterKeepsMatchingMacros) {
    constexpr const char *dump = "#define GPIOA_BASE 0x48000000UL\n"
                                 "#define RCC_BASE 0x40021000UL\n"
                                 "#define GPIO_PIN_0 (1U << 0)\n";

    auto macros = MacroClassifier({ "GPIO" }).classify(dump);
    ASSERT_EQ(macros.size(), 2U);
    EXPECT_EQ(macros[0].name, "GPIOA_BASE");
    EXPECT_EQ(macros[1].name, "GPIO_PIN_0");
}
