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

#include <facet/BlendingState.h>
#include <facet/RenderState.h>

#include <sstream>
#include <string>

using namespace facet;

namespace {

template<typename T>
std::string toString(T const& value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // anonymous namespace

TEST(BlendingStateTest, DefaultIsDisabled) {
    BlendingState const state;
    EXPECT_FALSE(state.enabled);
    EXPECT_EQ(state, BlendingState::DISABLED);
    EXPECT_EQ(state.functionSrcRGB, BlendFunction::ONE);
    EXPECT_EQ(state.functionDstRGB, BlendFunction::ZERO);
}

TEST(BlendingStateTest, AlphaBlendIsStraightAlphaSourceOver) {
    BlendingState const& state = BlendingState::ALPHA_BLEND;
    EXPECT_TRUE(state.enabled);
    EXPECT_EQ(state.equationRGB, BlendEquation::ADD);
    EXPECT_EQ(state.equationAlpha, BlendEquation::ADD);
    EXPECT_EQ(state.functionSrcRGB, BlendFunction::SRC_ALPHA);
    EXPECT_EQ(state.functionSrcAlpha, BlendFunction::SRC_ALPHA);
    EXPECT_EQ(state.functionDstRGB, BlendFunction::ONE_MINUS_SRC_ALPHA);
    EXPECT_EQ(state.functionDstAlpha, BlendFunction::ONE_MINUS_SRC_ALPHA);
}

TEST(BlendingStateTest, PresetsAreDistinct) {
    EXPECT_NE(BlendingState::ALPHA_BLEND, BlendingState::DISABLED);
    EXPECT_NE(BlendingState::ALPHA_BLEND, BlendingState::PRE_MULTIPLIED_ALPHA_BLEND);
    EXPECT_NE(BlendingState::ALPHA_BLEND, BlendingState::ADDITIVE_BLEND);
    EXPECT_EQ(BlendingState::PRE_MULTIPLIED_ALPHA_BLEND.functionSrcRGB, BlendFunction::ONE);
    EXPECT_EQ(BlendingState::ADDITIVE_BLEND.functionDstRGB, BlendFunction::ONE);
}

TEST(BlendingStateTest, Print) {
    EXPECT_EQ(toString(BlendingState::DISABLED), "{ disabled }");
    EXPECT_EQ(toString(BlendingState::ALPHA_BLEND),
            "{ rgb: ADD(SRC_ALPHA, ONE_MINUS_SRC_ALPHA), alpha: ADD(SRC_ALPHA, ONE_MINUS_SRC_ALPHA) }");
}

TEST(RenderStateTest, DefaultIsUnspecified) {
    RenderState const rs;
    EXPECT_FALSE(rs.depthTest.has_value());
    EXPECT_FALSE(rs.depthMask.has_value());
    EXPECT_FALSE(rs.blending.has_value());
    EXPECT_FALSE(rs.cull.has_value());
    EXPECT_FALSE(rs.colorMask.has_value());
    EXPECT_FALSE(rs.frontFace.has_value());
    EXPECT_EQ(toString(rs), "RenderState { }");
}

TEST(RenderStateTest, SubStateDefaults) {
    RenderState::DepthTest const depthTest;
    EXPECT_FALSE(depthTest.enabled);
    EXPECT_EQ(depthTest.func, DepthFunction::LESS);

    RenderState::Cull const cull;
    EXPECT_FALSE(cull.enabled);
    EXPECT_EQ(cull.face, CullFace::BACK);

    RenderState::ColorMask const colorMask;
    EXPECT_TRUE(colorMask.red && colorMask.green && colorMask.blue && colorMask.alpha);
}

TEST(RenderStateTest, Equality) {
    RenderState a;
    RenderState b;
    EXPECT_EQ(a, b);

    // a specified field never equals an unspecified one
    a.depthMask = false;
    EXPECT_NE(a, b);
    b.depthMask = false;
    EXPECT_EQ(a, b);

    a.cull = Cull{ true, CullFace::BACK };
    b.cull = Cull{ true, CullFace::FRONT };
    EXPECT_NE(a, b);
    b.cull->face = CullFace::BACK;
    EXPECT_EQ(a, b);

    a.blending = BlendingState::DISABLED;
    EXPECT_NE(a, b);
}

TEST(RenderStateTest, CopiesAreDeep) {
    RenderState a;
    a.cull = Cull{ true, CullFace::BACK };
    a.blending = BlendingState::ALPHA_BLEND;

    RenderState b = a;
    b.cull->face = CullFace::FRONT_AND_BACK;
    b.blending->enabled = false;

    EXPECT_EQ(a.cull->face, CullFace::BACK);
    EXPECT_TRUE(a.blending->enabled);
}

TEST(RenderStateTest, PrintsSpecifiedFieldsOnly) {
    RenderState rs;
    rs.depthTest = DepthTest{ true, DepthFunction::LESS_OR_EQUAL };
    rs.depthMask = false;
    rs.cull = Cull{ true, CullFace::BACK };
    rs.frontFace = WindingOrder::COUNTER_CLOCKWISE;

    EXPECT_EQ(toString(rs),
            "RenderState {"
            " depthTest: { enabled: 1, func: LESS_OR_EQUAL }"
            " depthMask: 0"
            " cull: { enabled: 1, face: BACK }"
            " frontFace: COUNTER_CLOCKWISE }");
}
