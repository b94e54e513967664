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

#ifndef TNT_SHADERSOURCE_SHADERSOURCE_H
#define TNT_SHADERSOURCE_SHADERSOURCE_H

#include <shadersource/BuiltinRegistry.h>

#include <utils/compiler.h>
#include <utils/PrivateImplementation.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <stdint.h>

namespace shadersource {

/**
 * ShaderSource combines several fragments of GLSL source and a list of preprocessor defines
 * into a single shader.
 *
 * The combined shader is laid out as follows:
 *  - the #version directive found in the fragments, if any
 *  - the #extension directives found in the fragments, in order of appearance
 *  - for fragment shaders, a default float precision
 *  - one #define per define
 *  - optionally, the declarations of the built-ins referenced by the fragments
 *  - the fragments, each one preceded by a "#line 0" directive
 *
 * Comments are removed from the fragments. A missing fragment is treated as empty.
 *
 * ShaderSource 将若干 GLSL 源码片段和一组预处理器定义合并为一个着色器。
 *
 * Usage example:
 *
 * ~~~~~{.cpp}
 * ShaderSource source = ShaderSource::Builder()
 *         .define("FLAT")
 *         .source(materialSource)
 *         .source(fragmentSource)
 *         .includeBuiltIns(false)
 *         .build();
 *
 * std::string glsl = source.getCombinedShader(ShaderSource::Stage::FRAGMENT);
 * ~~~~~
 */
class UTILS_PUBLIC ShaderSource {
    struct BuilderDetails;

public:
    enum class Stage : uint8_t {
        VERTEX,
        FRAGMENT
    };

    using SourceList = std::vector<std::optional<std::string>>;
    using DefineList = std::vector<std::string>;

    //! Use Builder to construct a ShaderSource object instance
    class Builder : public utils::PrivateImplementation<BuilderDetails> {
        friend class ShaderSource;
    public:
        Builder() noexcept;
        Builder(Builder const& rhs) noexcept;
        Builder(Builder&& rhs) noexcept;
        ~Builder() noexcept;
        Builder& operator=(Builder const& rhs) noexcept;
        Builder& operator=(Builder&& rhs) noexcept;

        /**
         * Adds a preprocessor define, emitted as "#define <define>". The define may carry a
         * value, e.g. "MAX_LIGHTS 4".
         *
         * @param define Name, and optionally value, of the define. Cannot be empty or span
         *               several lines.
         * @exception utils::PreconditionPanic if the define is empty or contains a new line
         */
        Builder& define(std::string_view define);

        //! Adds several defines, see define().
        Builder& defines(DefineList const& defines);

        //! Appends a source fragment. A missing fragment (std::nullopt) contributes nothing.
        Builder& source(std::optional<std::string> source);

        //! Appends several source fragments.
        Builder& sources(SourceList const& sources);

        /**
         * Whether the combined shader includes the declarations of the built-ins it references.
         * Defaults to true.
         */
        Builder& includeBuiltIns(bool includeBuiltIns) noexcept;

        /**
         * Creates the ShaderSource object.
         *
         * @return a ShaderSource holding a copy of the builder's state.
         */
        ShaderSource build() const;
    };

    DefineList const& getDefines() const noexcept { return mDefines; }

    SourceList const& getSources() const noexcept { return mSources; }

    bool includesBuiltIns() const noexcept { return mIncludeBuiltIns; }

    /**
     * Combines the defines and fragments into a single shader.
     *
     * @param stage     FRAGMENT adds a default float precision.
     * @param builtins  Built-ins available to the shader, used only if includesBuiltIns().
     * @return the combined GLSL source
     * @exception utils::PreconditionPanic if the fragments declare different #version
     */
    std::string getCombinedShader(Stage stage,
            BuiltinRegistry const& builtins = BuiltinRegistry{}) const;

private:
    explicit ShaderSource(Builder const& builder);

    DefineList mDefines;
    SourceList mSources;
    bool mIncludeBuiltIns = true;
};

} // namespace shadersource

#endif // TNT_SHADERSOURCE_SHADERSOURCE_H
