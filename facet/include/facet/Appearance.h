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

#ifndef TNT_FACET_APPEARANCE_H
#define TNT_FACET_APPEARANCE_H

#include <facet/FacetAPI.h>
#include <facet/RenderState.h>
#include <facet/ShaderCombiner.h>

#include <utils/compiler.h>

#include <optional>
#include <string>
#include <string_view>

namespace facet {

class Material;

/**
 * An Appearance defines the shaders and the render state used to draw a geometry.
 *
 * It combines a Material, which provides the fragment coloring logic, with the appearance's
 * own shader sources and structural flags:
 *
 *  - translucent: the geometry is expected to be translucent, so the render state has alpha
 *    blending enabled and depth writes disabled.
 *  - closed: the geometry is expected to be closed, so back faces can be culled.
 *
 * Everything but the material is fixed when the Appearance is built; a different
 * configuration requires a new Appearance. The material can be swapped at any time with
 * setMaterial().
 *
 * 外观定义了绘制几何体所使用的着色器和渲染状态。
 * 除材质外，所有属性在构建时固定；材质可以随时通过 setMaterial() 替换。
 *
 * Usage example:
 *
 * ~~~~~{.cpp}
 * Appearance appearance = Appearance::Builder()
 *         .translucent(false)
 *         .closed(true)
 *         .material(&material)
 *         .fragmentShader(fragmentSource)
 *         .renderState(Appearance::getDefaultRenderState(false, true))
 *         .build();
 *
 * std::string fs = appearance.getFragmentShaderSource();
 * RenderState rs = appearance.getRenderState();
 * ~~~~~
 */
class UTILS_PUBLIC Appearance {
    struct BuilderDetails;

public:
    //! Use Builder to construct an Appearance object instance
    class Builder : public BuilderBase<BuilderDetails> {
        friend class Appearance;
    public:
        Builder() noexcept;
        Builder(Builder const& rhs) noexcept;
        Builder(Builder&& rhs) noexcept;
        ~Builder() noexcept;
        Builder& operator=(Builder const& rhs) noexcept;
        Builder& operator=(Builder&& rhs) noexcept;

        /**
         * Whether the geometry is expected to appear translucent. Only used when no
         * material is set, otherwise the material decides. Defaults to true.
         */
        Builder& translucent(bool translucent) noexcept;

        //! Whether the geometry is expected to be closed. Defaults to false.
        Builder& closed(bool closed) noexcept;

        /**
         * The material used to determine the fragment color. The Appearance does not take
         * ownership of the material. Defaults to nullptr (no material).
         */
        Builder& material(Material const* UTILS_NULLABLE material) noexcept;

        //! GLSL vertex shader source, usually provided by a concrete appearance.
        Builder& vertexShader(std::string_view source);

        /**
         * GLSL fragment shader source. The full fragment shader is built by combining the
         * material's source with this one, see Appearance::getFragmentShaderSource().
         */
        Builder& fragmentShader(std::string_view source);

        /**
         * Render state used as the base of Appearance::getRenderState(). The Appearance keeps
         * its own copy.
         */
        Builder& renderState(RenderState const& renderState);

        //! Adds the FLAT define to the fragment shader. Defaults to false.
        Builder& flat(bool flat) noexcept;

        //! Adds the FACE_FORWARD define to the fragment shader. Defaults to false.
        Builder& faceForward(bool faceForward) noexcept;

        //! Name of the appearance, for debugging.
        Builder& name(std::string_view name);

        /**
         * The combiner used to assemble the fragment shader. The Appearance does not take
         * ownership of the combiner. Defaults to nullptr, which selects
         * GlslShaderCombiner::getDefault().
         */
        Builder& combiner(ShaderCombiner const* UTILS_NULLABLE combiner) noexcept;

        /**
         * Creates the Appearance object.
         *
         * @return the new Appearance
         */
        Appearance build() const;
    };

    /**
     * Creates a render state with depth testing enabled, alpha blending and no depth writes
     * if `translucent`, and back face culling if `closed`.
     *
     * This is the default render state of concrete appearances.
     *
     * @param translucent   whether the geometry is translucent
     * @param closed        whether the geometry is closed
     * @return a new RenderState
     */
    static RenderState getDefaultRenderState(bool translucent, bool closed);

    /**
     * Procedurally creates the full fragment shader source, taking into account the
     * material's source, this appearance's fragment source, and the FLAT and FACE_FORWARD
     * flags.
     *
     * Built-in declarations are not included, the program that uses this source provides
     * them once.
     *
     * @return the combined fragment shader source
     */
    std::string getFragmentShaderSource() const;

    /**
     * Determines whether the geometry is translucent. A material, when set, is authoritative;
     * otherwise the appearance's translucent flag is used.
     *
     * @return true if the appearance is translucent
     */
    bool isTranslucent() const noexcept;

    /**
     * Creates the render state to draw the geometry with. This is a copy of the render state
     * this Appearance was built with (or an empty one), with depth writes and blending set
     * according to isTranslucent().
     *
     * The result is a new value, it can be modified freely.
     *
     * @return the render state
     */
    RenderState getRenderState() const;

    //! The material is the only property of an Appearance that can change after build().
    void setMaterial(Material const* UTILS_NULLABLE material) noexcept { mMaterial = material; }

    Material const* UTILS_NULLABLE getMaterial() const noexcept { return mMaterial; }

    //! The translucent flag the Appearance was built with, see isTranslucent().
    bool isTranslucentByDefault() const noexcept { return mTranslucent; }

    bool isClosed() const noexcept { return mClosed; }

    bool isFlat() const noexcept { return mFlat; }

    bool isFaceForward() const noexcept { return mFaceForward; }

    std::optional<std::string> const& getVertexShaderSource() const noexcept {
        return mVertexShaderSource;
    }

    //! The fragment source the Appearance was built with, see getFragmentShaderSource().
    std::optional<std::string> const& getFragmentShaderBody() const noexcept {
        return mFragmentShaderSource;
    }

    std::optional<RenderState> const& getRenderStateOverride() const noexcept {
        return mRenderState;
    }

    std::string const& getName() const noexcept { return mName; }

    //! @return the combiner used by getFragmentShaderSource()
    ShaderCombiner const& getCombiner() const noexcept;

private:
    explicit Appearance(Builder const& builder);

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

} // namespace facet

#endif // TNT_FACET_APPEARANCE_H
