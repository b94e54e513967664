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

#include <facet/Appearance.h>

#include <facet/BlendingState.h>
#include <facet/GlslShaderCombiner.h>
#include <facet/Material.h>

#include <utils/Log.h>
#include <utils/PrivateImplementation-impl.h>

#include <utility>

namespace facet {

using namespace utils;

struct Appearance::BuilderDetails {
    Material const* mMaterial = nullptr;
    ShaderCombiner const* mCombiner = nullptr;
    std::optional<std::string> mVertexShaderSource;
    std::optional<std::string> mFragmentShaderSource;
    std::optional<RenderState> mRenderState;
    std::string mName;
    bool mTranslucent = true;
    bool mClosed = false;
    bool mFlat = false;
    bool mFaceForward = false;
};

using BuilderType = Appearance;
BuilderType::Builder::Builder() noexcept = default;
BuilderType::Builder::~Builder() noexcept = default;
BuilderType::Builder::Builder(Builder const& rhs) noexcept = default;
BuilderType::Builder::Builder(Builder&& rhs) noexcept = default;
BuilderType::Builder& BuilderType::Builder::operator=(Builder const& rhs) noexcept = default;
BuilderType::Builder& BuilderType::Builder::operator=(Builder&& rhs) noexcept = default;

Appearance::Builder& Appearance::Builder::translucent(bool translucent) noexcept {
    mImpl->mTranslucent = translucent;
    return *this;
}

Appearance::Builder& Appearance::Builder::closed(bool closed) noexcept {
    mImpl->mClosed = closed;
    return *this;
}

Appearance::Builder& Appearance::Builder::material(Material const* material) noexcept {
    mImpl->mMaterial = material;
    return *this;
}

Appearance::Builder& Appearance::Builder::vertexShader(std::string_view source) {
    mImpl->mVertexShaderSource.emplace(source);
    return *this;
}

Appearance::Builder& Appearance::Builder::fragmentShader(std::string_view source) {
    mImpl->mFragmentShaderSource.emplace(source);
    return *this;
}

Appearance::Builder& Appearance::Builder::renderState(RenderState const& renderState) {
    mImpl->mRenderState = renderState;
    return *this;
}

Appearance::Builder& Appearance::Builder::flat(bool flat) noexcept {
    mImpl->mFlat = flat;
    return *this;
}

Appearance::Builder& Appearance::Builder::faceForward(bool faceForward) noexcept {
    mImpl->mFaceForward = faceForward;
    return *this;
}

Appearance::Builder& Appearance::Builder::name(std::string_view name) {
    mImpl->mName = name;
    return *this;
}

Appearance::Builder& Appearance::Builder::combiner(ShaderCombiner const* combiner) noexcept {
    mImpl->mCombiner = combiner;
    return *this;
}

Appearance Appearance::Builder::build() const {
    if (!mImpl->mFragmentShaderSource && !mImpl->mMaterial) {
        slog.w << "Appearance \"" << mImpl->mName
               << "\" has neither a material nor a fragment shader" << io::endl;
    }
    return Appearance(*this);
}

// ------------------------------------------------------------------------------------------------

Appearance::Appearance(Builder const& builder)
        : mMaterial(builder->mMaterial),
          mCombiner(builder->mCombiner),
          mVertexShaderSource(builder->mVertexShaderSource),
          mFragmentShaderSource(builder->mFragmentShaderSource),
          mRenderState(builder->mRenderState),
          mName(builder->mName),
          mTranslucent(builder->mTranslucent),
          mClosed(builder->mClosed),
          mFlat(builder->mFlat),
          mFaceForward(builder->mFaceForward) {
}

RenderState Appearance::getDefaultRenderState(bool translucent, bool closed) {
    RenderState rs;
    rs.depthTest = DepthTest{ true, DepthFunction::LESS };

    if (translucent) {
        rs.depthMask = false;
        rs.blending = BlendingState::ALPHA_BLEND;
    }

    if (closed) {
        rs.cull = Cull{ true, CullFace::BACK };
    }

    return rs;
}

ShaderCombiner const& Appearance::getCombiner() const noexcept {
    return mCombiner ? *mCombiner : GlslShaderCombiner::getDefault();
}

std::string Appearance::getFragmentShaderSource() const {
    ShaderCombiner::Description description;

    // FLAT comes first, the order of the defines is observable in the result
    if (mFlat) {
        description.defines.emplace_back("FLAT");
    }
    if (mFaceForward) {
        description.defines.emplace_back("FACE_FORWARD");
    }

    if (mMaterial) {
        description.sources.emplace_back(std::string(mMaterial->getShaderSource()));
    }
    description.sources.push_back(mFragmentShaderSource);

    // the program including this shader provides the built-ins
    description.includeBuiltIns = false;

    return getCombiner().combine(description, ShaderStage::FRAGMENT);
}

bool Appearance::isTranslucent() const noexcept {
    if (mMaterial) {
        return mMaterial->isTranslucent();
    }
    return mTranslucent;
}

RenderState Appearance::getRenderState() const {
    RenderState rs = mRenderState.value_or(RenderState{});

    if (isTranslucent()) {
        rs.depthMask = false;
        rs.blending = BlendingState::ALPHA_BLEND;
    } else {
        rs.depthMask = true;
    }

    return rs;
}

} // namespace facet
