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

#ifndef TNT_FACET_RENDERSTATE_H
#define TNT_FACET_RENDERSTATE_H

#include <facet/BlendingState.h>

#include <utils/compiler.h>

#include <iosfwd>
#include <optional>

#include <stdint.h>

namespace facet {

//! Which faces are culled when culling is enabled
enum class CullFace : uint8_t {
    FRONT,              //!< Front face culling, only back faces are visible
    BACK,               //!< Back face culling, only front faces are visible
    FRONT_AND_BACK      //!< Front and Back, geometry is not visible
};

//! Winding order of front facing triangles
enum class WindingOrder : uint8_t {
    CLOCKWISE,
    COUNTER_CLOCKWISE
};

//! Depth test function, the incoming fragment passes if "fragment <op> buffer" is true
enum class DepthFunction : uint8_t {
    NEVER,
    LESS,
    EQUAL,
    LESS_OR_EQUAL,
    GREATER,
    NOT_EQUAL,
    GREATER_OR_EQUAL,
    ALWAYS
};

//! Depth test state
struct UTILS_PUBLIC DepthTest {
    bool enabled = false;
    DepthFunction func = DepthFunction::LESS;

    bool operator==(DepthTest const& rhs) const noexcept {
        return enabled == rhs.enabled && func == rhs.func;
    }
    bool operator!=(DepthTest const& rhs) const noexcept { return !operator==(rhs); }
};

//! Face culling state
struct UTILS_PUBLIC Cull {
    bool enabled = false;
    CullFace face = CullFace::BACK;

    bool operator==(Cull const& rhs) const noexcept {
        return enabled == rhs.enabled && face == rhs.face;
    }
    bool operator!=(Cull const& rhs) const noexcept { return !operator==(rhs); }
};

//! Per channel color-buffer write mask
struct UTILS_PUBLIC ColorMask {
    bool red = true;
    bool green = true;
    bool blue = true;
    bool alpha = true;

    bool operator==(ColorMask const& rhs) const noexcept {
        return red == rhs.red && green == rhs.green && blue == rhs.blue && alpha == rhs.alpha;
    }
    bool operator!=(ColorMask const& rhs) const noexcept { return !operator==(rhs); }
};

/**
 * RenderState describes the fixed-function state used to draw a geometry.
 *
 * It is a partial description: a field left empty means "not specified", and the renderer
 * consuming the RenderState uses its own default for it. This lets an Appearance specify
 * only the state it cares about.
 *
 * RenderState 描述绘制几何体时使用的固定功能状态。
 * 这是部分描述：未设置的字段表示"未指定"，由使用它的渲染器采用默认值。
 */
struct UTILS_PUBLIC RenderState {
    using DepthTest = facet::DepthTest;
    using Cull = facet::Cull;
    using ColorMask = facet::ColorMask;

    //! depth test
    std::optional<DepthTest> depthTest;

    //! whether depth-buffer writes are enabled
    std::optional<bool> depthMask;

    //! blending, an empty value leaves blending to the renderer (usually disabled)
    std::optional<BlendingState> blending;

    //! face culling
    std::optional<Cull> cull;

    //! whether color-buffer writes are enabled, per channel
    std::optional<ColorMask> colorMask;

    //! winding order of front faces
    std::optional<WindingOrder> frontFace;

    bool operator==(RenderState const& rhs) const noexcept;
    bool operator!=(RenderState const& rhs) const noexcept { return !operator==(rhs); }
};

UTILS_PUBLIC std::ostream& operator<<(std::ostream& out, CullFace face);
UTILS_PUBLIC std::ostream& operator<<(std::ostream& out, WindingOrder order);
UTILS_PUBLIC std::ostream& operator<<(std::ostream& out, DepthFunction func);
UTILS_PUBLIC std::ostream& operator<<(std::ostream& out, RenderState const& rs);

} // namespace facet

#endif // TNT_FACET_RENDERSTATE_H
