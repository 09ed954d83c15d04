/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <declscan/Serialize/JsonWriter.hpp>

using namespace declscan;

namespace {

    std::vector< Declaration > sample_declarations() {
        StructDecl regs;
        regs.name   = "GPIO_TypeDef";
        regs.fields = {
            FieldDecl{ .name        = "MODER",
                       .type        = "uint32_t",
                       .is_volatile = true,
                       .is_const    = false,
                       .is_array    = false,
                       .array_size  = std::nullopt,
                       .bit_width   = std::nullopt },
            FieldDecl{ .name        = "AFR",
                       .type        = "uint32_t",
                       .is_volatile = true,
                       .is_const    = false,
                       .is_array    = true,
                       .array_size  = 2,
                       .bit_width   = std::nullopt },
        };

        EnumDecl level;
        level.name   = "Level";
        level.values = { EnumValue{ .name = "LOW", .value = -1, .documentation = std::nullopt } };

        FunctionDecl reset;
        reset.name        = "reset";
        reset.return_type = "void";
        reset.parameters  = { { "mask", "unsigned int" } };

        NamespaceDecl hw;
        hw.name = "hw";
        hw.declarations.emplace_back(reset);

        return {
            regs,
            level,
            hw,
            MacroDecl{ .name      = "GPIOA",
                       .kind      = TypeCast{ .target_type = "GPIO_TypeDef", .address = "GPIOA_BASE" },
                       .raw_value = "((GPIO_TypeDef *) GPIOA_BASE)" },
        };
    }

    llvm::json::Value round_trip(const std::vector< Declaration > &decls) {
        std::string text;
        llvm::raw_string_ostream os(text);
        serialize::write_json(os, decls);
        auto parsed = llvm::json::parse(os.str());
        if (!parsed) {
            ADD_FAILURE() << llvm::toString(parsed.takeError());
            return nullptr;
        }
        return std::move(*parsed);
    }

} // namespace

TEST(JsonWriterTest, WritesKindTaggedArray) {
    auto value = round_trip(sample_declarations());
    const auto *array = value.getAsArray();
    ASSERT_NE(array, nullptr);
    ASSERT_EQ(array->size(), 4U);

    std::vector< std::string > kinds;
    for (const auto &item : *array) {
        kinds.push_back(item.getAsObject()->getString("kind")->str());
    }
    EXPECT_EQ(kinds, (std::vector< std::string >{ "struct", "enum", "namespace", "macro" }));
}

TEST(JsonWriterTest, StructFieldsCarryQualifiersAndExtent) {
    auto value          = round_trip(sample_declarations());
    const auto *regs    = (*value.getAsArray())[0].getAsObject();
    const auto *fields  = regs->getArray("fields");
    ASSERT_NE(fields, nullptr);
    ASSERT_EQ(fields->size(), 2U);

    const auto *moder = (*fields)[0].getAsObject();
    EXPECT_EQ(moder->getString("name"), llvm::Optional< llvm::StringRef >("MODER"));
    EXPECT_EQ(moder->getBoolean("isVolatile"), llvm::Optional< bool >(true));
    EXPECT_EQ(moder->get("arraySize"), nullptr);

    const auto *afr = (*fields)[1].getAsObject();
    EXPECT_EQ(afr->getInteger("arraySize"), llvm::Optional< int64_t >(2));
    EXPECT_EQ(afr->getBoolean("isArray"), llvm::Optional< bool >(true));
}

TEST(JsonWriterTest, EnumValuesAreSigned) {
    auto value      = round_trip(sample_declarations());
    const auto *obj = (*value.getAsArray())[1].getAsObject();
    const auto *values = obj->getArray("values");
    ASSERT_NE(values, nullptr);
    ASSERT_EQ(values->size(), 1U);
    EXPECT_EQ((*values)[0].getAsObject()->getInteger("value"), llvm::Optional< int64_t >(-1));
}

TEST(JsonWriterTest, NamespacesNestDeclarations) {
    auto value      = round_trip(sample_declarations());
    const auto *ns  = (*value.getAsArray())[2].getAsObject();
    EXPECT_EQ(ns->getString("name"), llvm::Optional< llvm::StringRef >("hw"));

    const auto *members = ns->getArray("declarations");
    ASSERT_NE(members, nullptr);
    ASSERT_EQ(members->size(), 1U);

    const auto *reset = (*members)[0].getAsObject();
    EXPECT_EQ(reset->getString("kind"), llvm::Optional< llvm::StringRef >("function"));
    const auto *params = reset->getArray("parameters");
    ASSERT_NE(params, nullptr);
    ASSERT_EQ(params->size(), 1U);
    EXPECT_EQ(
        (*params)[0].getAsObject()->getString("type"),
        llvm::Optional< llvm::StringRef >("unsigned int")
    );
}

TEST(JsonWriterTest, MacroKindIsDescribed) {
    auto value          = round_trip(sample_declarations());
    const auto *macro   = (*value.getAsArray())[3].getAsObject();
    const auto *kind    = macro->getObject("macroKind");
    ASSERT_NE(kind, nullptr);
    EXPECT_EQ(kind->getString("kind"), llvm::Optional< llvm::StringRef >("typeCast"));
    EXPECT_EQ(kind->getString("targetType"), llvm::Optional< llvm::StringRef >("GPIO_TypeDef"));
    EXPECT_EQ(kind->getString("address"), llvm::Optional< llvm::StringRef >("GPIOA_BASE"));
    EXPECT_EQ(
        macro->getString("rawValue"),
        llvm::Optional< llvm::StringRef >("((GPIO_TypeDef *) GPIOA_BASE)")
    );
}

TEST(JsonWriterTest, EmptyListIsEmptyArray) {
    auto value = round_trip({});
    ASSERT_NE(value.getAsArray(), nullptr);
    EXPECT_TRUE(value.getAsArray()->empty());
}

TEST(JsonWriterTest, TextListingIndentsMembers) {
    std::string text;
    llvm::raw_string_ostream os(text);
    serialize::write_text(os, sample_declarations());

    EXPECT_EQ(
        os.str(),
        "struct GPIO_TypeDef\n"
        "  MODER: volatile uint32_t\n"
        "  AFR: volatile uint32_t[2]\n"
        "enum Level\n"
        "  LOW = -1\n"
        "namespace hw\n"
        "  function void reset(unsigned int mask)\n"
        "macro GPIOA ((GPIO_TypeDef *) GPIOA_BASE)\n"
    );
}
