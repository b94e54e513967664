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

#include <shadersource/ShaderSource.h>

#include "GlslText.h"

#include <utils/Panic.h>
#include <utils/PrivateImplementation-impl.h>

#include <algorithm>
#include <utility>

namespace shadersource {

// 着色器片段合并时使用的固定文本
static constexpr const char* LINE_DIRECTIVE = "\n#line 0\n";

static constexpr const char* FRAGMENT_PRECISION =
        "#ifdef GL_FRAGMENT_PRECISION_HIGH\n"
        "    precision highp float;\n"
        "#else\n"
        "    precision mediump float;\n"
        "#endif\n"
        "\n";

struct ShaderSource::BuilderDetails {
    DefineList mDefines;
    SourceList mSources;
    bool mIncludeBuiltIns = true;
};

using BuilderType = ShaderSource;
BuilderType::Builder::Builder() noexcept = default;
BuilderType::Builder::~Builder() noexcept = default;
BuilderType::Builder::Builder(Builder const& rhs) noexcept = default;
BuilderType::Builder::Builder(Builder&& rhs) noexcept = default;
BuilderType::Builder& BuilderType::Builder::operator=(Builder const& rhs) noexcept = default;
BuilderType::Builder& BuilderType::Builder::operator=(Builder&& rhs) noexcept = default;

ShaderSource::Builder& ShaderSource::Builder::define(std::string_view define) {
    FACET_CHECK_PRECONDITION(!glsl::trim(define).empty()) << "a define cannot be empty";
    FACET_CHECK_PRECONDITION(define.find('\n') == std::string_view::npos)
            << "define \"" << define << "\" spans several lines";
    mImpl->mDefines.emplace_back(glsl::trim(define));
    return *this;
}

ShaderSource::Builder& ShaderSource::Builder::defines(DefineList const& defines) {
    for (auto const& d : defines) {
        define(d);
    }
    return *this;
}

ShaderSource::Builder& ShaderSource::Builder::source(std::optional<std::string> source) {
    mImpl->mSources.push_back(std::move(source));
    return *this;
}

ShaderSource::Builder& ShaderSource::Builder::sources(SourceList const& sources) {
    mImpl->mSources.insert(mImpl->mSources.end(), sources.begin(), sources.end());
    return *this;
}

ShaderSource::Builder& ShaderSource::Builder::includeBuiltIns(bool includeBuiltIns) noexcept {
    mImpl->mIncludeBuiltIns = includeBuiltIns;
    return *this;
}

ShaderSource ShaderSource::Builder::build() const {
    return ShaderSource(*this);
}

// ------------------------------------------------------------------------------------------------

ShaderSource::ShaderSource(Builder const& builder)
        : mDefines(builder->mDefines),
          mSources(builder->mSources),
          mIncludeBuiltIns(builder->mIncludeBuiltIns) {
}

std::string ShaderSource::getCombinedShader(Stage stage, BuiltinRegistry const& builtins) const {
    // #line needs to be on its own line
    std::string combined;
    for (auto const& source : mSources) {
        combined += LINE_DIRECTIVE;
        if (source) {
            combined += *source;
        }
    }

    combined = glsl::removeComments(combined);

    // hoist #version, all fragments must agree on it
    std::string version;
    combined = glsl::extractDirectives(combined, "version",
            [&version](std::string_view argument) {
                FACET_CHECK_PRECONDITION(version.empty() || version == argument)
                        << "inconsistent versions found: " << version << " and " << argument;
                version = argument;
            });

    // hoist #extension, they must come before any non-preprocessor token
    std::vector<std::string> extensions;
    combined = glsl::extractDirectives(combined, "extension",
            [&extensions](std::string_view argument) {
                if (std::find(extensions.begin(), extensions.end(), argument) == extensions.end()) {
                    extensions.emplace_back(argument);
                }
            });

    std::string result;
    if (!version.empty()) {
        result += "#version " + version + "\n";
    }

    for (auto const& extension : extensions) {
        result += "#extension " + extension + "\n";
    }

    if (stage == Stage::FRAGMENT) {
        result += FRAGMENT_PRECISION;
    }

    for (auto const& define : mDefines) {
        result += "#define " + define + "\n";
    }

    if (mIncludeBuiltIns) {
        result += builtins.getDeclarations(combined);
    }

    // each source already starts with its own #line directive
    if (mSources.empty()) {
        result += LINE_DIRECTIVE;
    }
    result += combined;
    return result;
}

} // namespace shadersource
