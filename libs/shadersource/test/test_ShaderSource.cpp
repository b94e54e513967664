/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>

#include <shadersource/ShaderSource.h>

#include <utils/Panic.h>

#include <string>
#include <type_traits>

using namespace shadersource;

namespace {

size_t countOccurrences(std::string const& haystack, std::string const& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
            pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

} // anonymous namespace

TEST(ShaderSourceTest, BuilderDefaults) {
    ShaderSource const source = ShaderSource::Builder().build();
    EXPECT_TRUE(source.getDefines().empty());
    EXPECT_TRUE(source.getSources().empty());
    EXPECT_TRUE(source.includesBuiltIns());
}

TEST(ShaderSourceTest, OnlyTheBuilderCreatesShaderSources) {
    static_assert(!std::is_constructible_v<ShaderSource, ShaderSource::Builder const&>);
}

TEST(ShaderSourceTest, BuilderKeepsOrder) {
    ShaderSource const source = ShaderSource::Builder()
            .define("FLAT")
            .define("FACE_FORWARD")
            .source(std::string("a"))
            .source(std::nullopt)
            .source(std::string("b"))
            .includeBuiltIns(false)
            .build();

    ASSERT_EQ(source.getDefines().size(), 2u);
    EXPECT_EQ(source.getDefines()[0], "FLAT");
    EXPECT_EQ(source.getDefines()[1], "FACE_FORWARD");

    ASSERT_EQ(source.getSources().size(), 3u);
    EXPECT_EQ(source.getSources()[0], "a");
    EXPECT_FALSE(source.getSources()[1].has_value());
    EXPECT_EQ(source.getSources()[2], "b");
    EXPECT_FALSE(source.includesBuiltIns());
}

TEST(ShaderSourceTest, BuilderCopiesAreIndependent) {
    ShaderSource::Builder builder;
    builder.define("A");

    ShaderSource::Builder copy(builder);
    copy.define("B");

    EXPECT_EQ(builder.build().getDefines().size(), 1u);
    EXPECT_EQ(copy.build().getDefines().size(), 2u);
}

TEST(ShaderSourceTest, InvalidDefines) {
    EXPECT_THROW(ShaderSource::Builder().define(""), utils::PreconditionPanic);
    EXPECT_THROW(ShaderSource::Builder().define("   "), utils::PreconditionPanic);
    EXPECT_THROW(ShaderSource::Builder().define("A\nB"), utils::PreconditionPanic);
}

TEST(ShaderSourceTest, FragmentLayout) {
    std::string const glsl = ShaderSource::Builder()
            .define("FLAT")
            .source(std::string("vec4 color() { return vec4(1.0); }"))
            .source(std::string("void main() { gl_FragColor = color(); }"))
            .build()
            .getCombinedShader(ShaderSource::Stage::FRAGMENT);

    std::string const expected =
            "#ifdef GL_FRAGMENT_PRECISION_HIGH\n"
            "    precision highp float;\n"
            "#else\n"
            "    precision mediump float;\n"
            "#endif\n"
            "\n"
            "#define FLAT\n"
            "\n#line 0\n"
            "vec4 color() { return vec4(1.0); }"
            "\n#line 0\n"
            "void main() { gl_FragColor = color(); }";

    EXPECT_EQ(glsl, expected);
}

TEST(ShaderSourceTest, VertexHasNoPrecision) {
    std::string const glsl = ShaderSource::Builder()
            .source(std::string("void main() { gl_Position = vec4(0.0); }"))
            .build()
            .getCombinedShader(ShaderSource::Stage::VERTEX);

    EXPECT_EQ(glsl.find("precision"), std::string::npos);
    EXPECT_EQ(glsl, "\n#line 0\nvoid main() { gl_Position = vec4(0.0); }");
}

TEST(ShaderSourceTest, OneLineDirectivePerSource) {
    std::string const glsl = ShaderSource::Builder()
            .define("FLAT")
            .source(std::string("float a;"))
            .source(std::string("float b;"))
            .source(std::nullopt)
            .build()
            .getCombinedShader(ShaderSource::Stage::FRAGMENT);

    EXPECT_EQ(countOccurrences(glsl, "#line 0"), 3u);
    EXPECT_EQ(glsl.find("#line 0\n\n#line 0"), std::string::npos);
    EXPECT_NE(glsl.find("#define FLAT\n\n#line 0\nfloat a;"), std::string::npos);
}

TEST(ShaderSourceTest, NoSources) {
    EXPECT_EQ(ShaderSource::Builder().build().getCombinedShader(ShaderSource::Stage::VERTEX),
            "\n#line 0\n");
}

TEST(ShaderSourceTest, MissingSourceIsEmpty) {
    std::string const withMissing = ShaderSource::Builder()
            .source(std::string("float x;"))
            .source(std::nullopt)
            .build()
            .getCombinedShader(ShaderSource::Stage::VERTEX);

    std::string const withEmpty = ShaderSource::Builder()
            .source(std::string("float x;"))
            .source(std::string())
            .build()
            .getCombinedShader(ShaderSource::Stage::VERTEX);

    EXPECT_EQ(withMissing, withEmpty);
    EXPECT_EQ(withMissing.find("undefined"), std::string::npos);
}

TEST(ShaderSourceTest, CommentsAreRemoved) {
    std::string const glsl = ShaderSource::Builder()
            .source(std::string(
                    "// leading comment\n"
                    "float a; /* inline */ float b;\n"
                    "/* spans\n"
                    "   two lines */float c;"))
            .build()
            .getCombinedShader(ShaderSource::Stage::VERTEX);

    EXPECT_EQ(glsl.find("comment"), std::string::npos);
    EXPECT_EQ(glsl.find("inline"), std::string::npos);
    EXPECT_EQ(glsl.find("spans"), std::string::npos);
    EXPECT_NE(glsl.find("float a;  float b;\n\nfloat c;"), std::string::npos);
}

TEST(ShaderSourceTest, UnterminatedCommentDropsTheRest) {
    testing::internal::CaptureStderr();
    std::string const glsl = ShaderSource::Builder()
            .source(std::string("float a;\n/* never closed\nfloat b;"))
            .build()
            .getCombinedShader(ShaderSource::Stage::VERTEX);
    EXPECT_EQ(testing::internal::GetCapturedStderr(),
            "W/facet: unterminated block comment, the rest of the shader is ignored\n");

    EXPECT_NE(glsl.find("float a;"), std::string::npos);
    EXPECT_EQ(glsl.find("float b;"), std::string::npos);
}

TEST(ShaderSourceTest, VersionIsHoisted) {
    std::string const glsl = ShaderSource::Builder()
            .define("FLAT")
            .source(std::string("float a;\n#version 300 es\nfloat b;"))
            .source(std::string("  #  version 300 es  \nfloat c;"))
            .build()
            .getCombinedShader(ShaderSource::Stage::FRAGMENT);

    EXPECT_EQ(glsl.rfind("#version 300 es\n", 0), 0u);
    EXPECT_EQ(countOccurrences(glsl, "version"), 1u);
    EXPECT_NE(glsl.find("float a;\n\nfloat b;"), std::string::npos);
}

TEST(ShaderSourceTest, InconsistentVersions) {
    ShaderSource const source = ShaderSource::Builder()
            .source(std::string("#version 100\n"))
            .source(std::string("#version 300 es\n"))
            .build();

    EXPECT_THROW(source.getCombinedShader(ShaderSource::Stage::FRAGMENT),
            utils::PreconditionPanic);
}

TEST(ShaderSourceTest, ExtensionsAreHoistedOnce) {
    std::string const glsl = ShaderSource::Builder()
            .define("FLAT")
            .source(std::string("#extension GL_OES_standard_derivatives : enable\nfloat a;"))
            .source(std::string("#version 100\n#extension GL_OES_standard_derivatives : enable\n"
                                "#extension GL_EXT_frag_depth : enable\n"))
            .build()
            .getCombinedShader(ShaderSource::Stage::FRAGMENT);

    std::string const prolog =
            "#version 100\n"
            "#extension GL_OES_standard_derivatives : enable\n"
            "#extension GL_EXT_frag_depth : enable\n"
            "#ifdef GL_FRAGMENT_PRECISION_HIGH\n";

    EXPECT_EQ(glsl.rfind(prolog, 0), 0u);
    EXPECT_EQ(countOccurrences(glsl, "GL_OES_standard_derivatives"), 1u);

    size_t const define = glsl.find("#define FLAT");
    ASSERT_NE(define, std::string::npos);
    EXPECT_GT(define, glsl.find("#endif"));
}

TEST(ShaderSourceTest, BuiltInsAreIncludedWhenReferenced) {
    BuiltinRegistry builtins;
    builtins.add("facet_pi", "const float facet_pi = 3.14159265;");
    builtins.add("facet_unused", "const float facet_unused = 0.0;");

    ShaderSource::Builder builder;
    builder.source(std::string("float half_turn() { return facet_pi; }"));

    std::string const with = builder.build()
            .getCombinedShader(ShaderSource::Stage::VERTEX, builtins);
    EXPECT_NE(with.find("const float facet_pi = 3.14159265;"), std::string::npos);
    EXPECT_EQ(with.find("facet_unused"), std::string::npos);

    // the declarations come before the fragments
    EXPECT_LT(with.find("const float facet_pi"), with.find("float half_turn"));

    std::string const without = builder.includeBuiltIns(false).build()
            .getCombinedShader(ShaderSource::Stage::VERTEX, builtins);
    EXPECT_EQ(without.find("const float facet_pi"), std::string::npos);
}

TEST(ShaderSourceTest, CombiningIsDeterministic) {
    ShaderSource const source = ShaderSource::Builder()
            .define("FACE_FORWARD")
            .source(std::string("#version 100\nfloat a; // comment"))
            .source(std::nullopt)
            .build();

    EXPECT_EQ(source.getCombinedShader(ShaderSource::Stage::FRAGMENT),
            source.getCombinedShader(ShaderSource::Stage::FRAGMENT));
}
