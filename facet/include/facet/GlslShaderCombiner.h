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

#ifndef TNT_FACET_GLSLSHADERCOMBINER_H
#define TNT_FACET_GLSLSHADERCOMBINER_H

#include <facet/ShaderCombiner.h>

#include <shadersource/BuiltinRegistry.h>

#include <utils/compiler.h>

#include <string>

namespace facet {

/**
 * The default ShaderCombiner, backed by shadersource::ShaderSource.
 *
 * Comments are stripped, #version and #extension directives are hoisted, fragment shaders get
 * a default float precision, and each source is preceded by a "#line 0" directive. When a
 * Description asks for built-ins, the declarations referenced by the sources are taken from
 * this combiner's BuiltinRegistry.
 *
 * 默认的着色器合并器，基于 shadersource::ShaderSource 实现。
 */
class UTILS_PUBLIC GlslShaderCombiner : public ShaderCombiner {
public:
    GlslShaderCombiner() noexcept;
    explicit GlslShaderCombiner(shadersource::BuiltinRegistry builtins) noexcept;
    ~GlslShaderCombiner() noexcept override;

    /**
     * @return a process wide combiner with an empty built-in registry. It is used by
     *         appearances built without a combiner.
     */
    static GlslShaderCombiner const& getDefault() noexcept;

    /**
     * @exception utils::PreconditionPanic if a define is invalid or the sources declare
     *            different #version
     */
    std::string combine(Description const& description, ShaderStage stage) const override;

    shadersource::BuiltinRegistry const& getBuiltins() const noexcept { return mBuiltins; }

private:
    shadersource::BuiltinRegistry mBuiltins;
};

} // namespace facet

#endif // TNT_FACET_GLSLSHADERCOMBINER_H
