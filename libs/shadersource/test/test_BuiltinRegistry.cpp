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

#include <shadersource/BuiltinRegistry.h>

#include <utils/Panic.h>

#include <string>
#include <vector>

using namespace shadersource;

class BuiltinRegistryTest : public testing::Test {
protected:
    void SetUp() override {
        registry.add("facet_pi", "const float facet_pi = 3.14159265;");
        registry.add("facet_twoPi", "const float facet_twoPi = 2.0 * facet_pi;", { "facet_pi" });
        registry.add("facet_luminance",
                "float facet_luminance(vec3 c) { return dot(c, vec3(0.2125, 0.7154, 0.0721)); }");
        registry.add("facet_angle", "float facet_angle(float t) { return t * facet_twoPi; }",
                { "facet_twoPi" });
    }

    BuiltinRegistry registry;
};

TEST_F(BuiltinRegistryTest, Registration) {
    EXPECT_EQ(registry.size(), 4u);
    EXPECT_FALSE(registry.empty());
    EXPECT_TRUE(registry.has("facet_pi"));
    EXPECT_FALSE(registry.has("facet_tau"));
}

TEST_F(BuiltinRegistryTest, InvalidRegistrations) {
    EXPECT_THROW(registry.add("", "float x;"), utils::PreconditionPanic);
    EXPECT_THROW(registry.add("facet_pi", "const float facet_pi = 3.0;"),
            utils::PreconditionPanic);
    EXPECT_THROW(registry.add("facet_tau", "float facet_tau;", { "facet_missing" }),
            utils::PreconditionPanic);

    // failed registrations leave the registry untouched
    EXPECT_EQ(registry.size(), 4u);
    EXPECT_FALSE(registry.has("facet_tau"));
}

TEST_F(BuiltinRegistryTest, NothingReferenced) {
    EXPECT_TRUE(registry.resolve("void main() { }").empty());
    EXPECT_TRUE(registry.getDeclarations("void main() { }").empty());
}

TEST_F(BuiltinRegistryTest, DependenciesComeFirst) {
    std::vector<std::string> const order =
            registry.resolve("float f(float t) { return facet_angle(t); }");
    std::vector<std::string> const expected = { "facet_pi", "facet_twoPi", "facet_angle" };
    EXPECT_EQ(order, expected);
}

TEST_F(BuiltinRegistryTest, EachBuiltInOnce) {
    std::vector<std::string> const order = registry.resolve(
            "float f(float t) { return facet_angle(t) + facet_twoPi + facet_pi; }");
    std::vector<std::string> const expected = { "facet_pi", "facet_twoPi", "facet_angle" };
    EXPECT_EQ(order, expected);
}

TEST_F(BuiltinRegistryTest, OnlyWholeIdentifiersMatch) {
    // "facet_pi2" and "my_facet_pi" are other identifiers
    EXPECT_TRUE(registry.resolve("float facet_pi2; float my_facet_pi;").empty());

    // numeric literals are not identifiers
    EXPECT_TRUE(registry.resolve("float x = 1.0e5;").empty());
}

TEST_F(BuiltinRegistryTest, Declarations) {
    std::string const declarations = registry.getDeclarations(
            "vec3 c; float l = facet_luminance(c) * facet_pi;");

    EXPECT_EQ(declarations,
            "float facet_luminance(vec3 c) { return dot(c, vec3(0.2125, 0.7154, 0.0721)); }\n"
            "const float facet_pi = 3.14159265;\n");
}

TEST_F(BuiltinRegistryTest, CopiesAreIndependent) {
    BuiltinRegistry copy(registry);
    copy.add("facet_e", "const float facet_e = 2.71828183;");
    EXPECT_EQ(copy.size(), 5u);
    EXPECT_EQ(registry.size(), 4u);
}
