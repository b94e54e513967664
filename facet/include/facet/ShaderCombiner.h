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

#ifndef TNT_FACET_SHADERCOMBINER_H
#define TNT_FACET_SHADERCOMBINER_H

#include <utils/compiler.h>

#include <optional>
#include <string>
#include <vector>

#include <stdint.h>

namespace facet {

enum class ShaderStage : uint8_t {
    VERTEX,
    FRAGMENT
};

/**
 * A ShaderCombiner turns a set of defines and source fragments into a single shader.
 *
 * The combiner is the only place where shader text is assembled; an Appearance only
 * decides which defines and fragments go in.
 *
 * 着色器合并器：将一组宏定义和源码片段合并为一个着色器。
 */
class UTILS_PUBLIC ShaderCombiner {
public:
    struct Description {
        //! preprocessor defines, in order
        std::vector<std::string> defines;

        //! source fragments, in order; a missing fragment is treated as empty
        std::vector<std::optional<std::string>> sources;

        //! whether the declarations of the referenced built-ins must be added
        bool includeBuiltIns = true;
    };

    virtual ~ShaderCombiner() noexcept;

    /**
     * Combines the description into a single shader.
     *
     * @param description   defines and sources to combine
     * @param stage         the stage the shader is used for
     * @return the combined shader source
     */
    virtual std::string combine(Description const& description, ShaderStage stage) const = 0;

protected:
    ShaderCombiner() noexcept = default;
};

} // namespace facet

#endif // TNT_FACET_SHADERCOMBINER_H
