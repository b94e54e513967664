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

#ifndef TNT_FACET_BLENDINGSTATE_H
#define TNT_FACET_BLENDINGSTATE_H

#include <utils/compiler.h>

#include <iosfwd>

#include <stdint.h>

namespace facet {

//! blending equation function
enum class BlendEquation : uint8_t {
    ADD,                    //!< the fragment is added to the color buffer
    SUBTRACT,               //!< the fragment is subtracted from the color buffer
    REVERSE_SUBTRACT,       //!< the color buffer is subtracted from the fragment
    MIN,                    //!< the min between the fragment and color buffer
    MAX                     //!< the max between the fragment and color buffer
};

//! blending function
enum class BlendFunction : uint8_t {
    ZERO,                   //!< f(src, dst) = 0
    ONE,                    //!< f(src, dst) = 1
    SRC_COLOR,              //!< f(src, dst) = src
    ONE_MINUS_SRC_COLOR,    //!< f(src, dst) = 1-src
    DST_COLOR,              //!< f(src, dst) = dst
    ONE_MINUS_DST_COLOR,    //!< f(src, dst) = 1-dst
    SRC_ALPHA,              //!< f(src, dst) = src.a
    ONE_MINUS_SRC_ALPHA,    //!< f(src, dst) = 1-src.a
    DST_ALPHA,              //!< f(src, dst) = dst.a
    ONE_MINUS_DST_ALPHA,    //!< f(src, dst) = 1-dst.a
    SRC_ALPHA_SATURATE      //!< f(src, dst) = (1,1,1) * min(src.a, 1 - dst.a), 1
};

/**
 * Fixed-function blending state. The default value is DISABLED.
 *
 * 固定功能混合状态，默认值等同于 DISABLED。
 */
struct UTILS_PUBLIC BlendingState {
    bool enabled = false;

    //! blend equation for the red, green and blue components
    BlendEquation equationRGB = BlendEquation::ADD;
    //! blend equation for the alpha component
    BlendEquation equationAlpha = BlendEquation::ADD;

    //! blending function for the source color
    BlendFunction functionSrcRGB = BlendFunction::ONE;
    //! blending function for the source alpha
    BlendFunction functionSrcAlpha = BlendFunction::ONE;
    //! blending function for the destination color
    BlendFunction functionDstRGB = BlendFunction::ZERO;
    //! blending function for the destination alpha
    BlendFunction functionDstAlpha = BlendFunction::ZERO;

    //! blending is disabled
    static const BlendingState DISABLED;

    /**
     * Straight (non pre-multiplied) alpha, source-over compositing:
     *      result = src * src.a + dst * (1 - src.a)
     * This is the preset used by translucent appearances.
     */
    static const BlendingState ALPHA_BLEND;

    //! source-over compositing of pre-multiplied colors: result = src + dst * (1 - src.a)
    static const BlendingState PRE_MULTIPLIED_ALPHA_BLEND;

    //! result = src * src.a + dst
    static const BlendingState ADDITIVE_BLEND;

    bool operator==(BlendingState const& rhs) const noexcept;
    bool operator!=(BlendingState const& rhs) const noexcept { return !operator==(rhs); }
};

UTILS_PUBLIC std::ostream& operator<<(std::ostream& out, BlendEquation equation);
UTILS_PUBLIC std::ostream& operator<<(std::ostream& out, BlendFunction function);
UTILS_PUBLIC std::ostream& operator<<(std::ostream& out, BlendingState const& state);

} // namespace facet

#endif // TNT_FACET_BLENDINGSTATE_H
