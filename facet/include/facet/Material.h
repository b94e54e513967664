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

#ifndef TNT_FACET_MATERIAL_H
#define TNT_FACET_MATERIAL_H

#include <utils/compiler.h>

#include <string_view>

namespace facet {

/**
 * A Material provides the fragment coloring logic of an Appearance.
 *
 * Concrete materials implement this interface. An Appearance never owns its material, the
 * material must outlive every Appearance it is set on.
 *
 * 材质提供外观的片段着色逻辑。外观不拥有材质，材质的生命周期必须长于使用它的外观。
 */
class UTILS_PUBLIC Material {
public:
    virtual ~Material() noexcept;

    /**
     * @return the GLSL source declaring the material's functions. It is inserted in the
     *         fragment shader before the appearance's own fragment source.
     */
    virtual std::string_view getShaderSource() const noexcept = 0;

    /**
     * @return true if the material produces partially transparent fragments, in which case
     *         the appearance enables alpha blending and disables depth writes.
     */
    virtual bool isTranslucent() const noexcept = 0;

protected:
    Material() noexcept = default;
    Material(Material const&) = default;
    Material& operator=(Material const&) = default;
};

} // namespace facet

#endif // TNT_FACET_MATERIAL_H
