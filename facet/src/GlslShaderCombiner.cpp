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

#include <facet/GlslShaderCombiner.h>

#include <shadersource/ShaderSource.h>

#include <utility>

namespace facet {

using namespace shadersource;

GlslShaderCombiner::GlslShaderCombiner() noexcept = default;

GlslShaderCombiner::GlslShaderCombiner(BuiltinRegistry builtins) noexcept
        : mBuiltins(std::move(builtins)) {
}

GlslShaderCombiner::~GlslShaderCombiner() noexcept = default;

GlslShaderCombiner const& GlslShaderCombiner::getDefault() noexcept {
    static const GlslShaderCombiner sDefault;
    return sDefault;
}

std::string GlslShaderCombiner::combine(Description const& description, ShaderStage stage) const {
    ShaderSource const source = ShaderSource::Builder()
            .defines(description.defines)
            .sources(description.sources)
            .includeBuiltIns(description.includeBuiltIns)
            .build();

    return source.getCombinedShader(stage == ShaderStage::FRAGMENT ?
            ShaderSource::Stage::FRAGMENT : ShaderSource::Stage::VERTEX, mBuiltins);
}

} // namespace facet
