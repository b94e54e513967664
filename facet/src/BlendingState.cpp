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

#include <facet/BlendingState.h>

#include <ostream>

namespace facet {

const BlendingState BlendingState::DISABLED = {};

const BlendingState BlendingState::ALPHA_BLEND = {
        true,
        BlendEquation::ADD,
        BlendEquation::ADD,
        BlendFunction::SRC_ALPHA,
        BlendFunction::SRC_ALPHA,
        BlendFunction::ONE_MINUS_SRC_ALPHA,
        BlendFunction::ONE_MINUS_SRC_ALPHA
};

const BlendingState BlendingState::PRE_MULTIPLIED_ALPHA_BLEND = {
        true,
        BlendEquation::ADD,
        BlendEquation::ADD,
        BlendFunction::ONE,
        BlendFunction::ONE,
        BlendFunction::ONE_MINUS_SRC_ALPHA,
        BlendFunction::ONE_MINUS_SRC_ALPHA
};

const BlendingState BlendingState::ADDITIVE_BLEND = {
        true,
        BlendEquation::ADD,
        BlendEquation::ADD,
        BlendFunction::SRC_ALPHA,
        BlendFunction::SRC_ALPHA,
        BlendFunction::ONE,
        BlendFunction::ONE
};

bool BlendingState::operator==(BlendingState const& rhs) const noexcept {
    return enabled == rhs.enabled &&
           equationRGB == rhs.equationRGB &&
           equationAlpha == rhs.equationAlpha &&
           functionSrcRGB == rhs.functionSrcRGB &&
           functionSrcAlpha == rhs.functionSrcAlpha &&
           functionDstRGB == rhs.functionDstRGB &&
           functionDstAlpha == rhs.functionDstAlpha;
}

std::ostream& operator<<(std::ostream& out, BlendEquation equation) {
    switch (equation) {
        case BlendEquation::ADD:                return out << "ADD";
        case BlendEquation::SUBTRACT:           return out << "SUBTRACT";
        case BlendEquation::REVERSE_SUBTRACT:   return out << "REVERSE_SUBTRACT";
        case BlendEquation::MIN:                return out << "MIN";
        case BlendEquation::MAX:                return out << "MAX";
    }
    return out << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, BlendFunction function) {
    switch (function) {
        case BlendFunction::ZERO:                   return out << "ZERO";
        case BlendFunction::ONE:                    return out << "ONE";
        case BlendFunction::SRC_COLOR:              return out << "SRC_COLOR";
        case BlendFunction::ONE_MINUS_SRC_COLOR:    return out << "ONE_MINUS_SRC_COLOR";
        case BlendFunction::DST_COLOR:              return out << "DST_COLOR";
        case BlendFunction::ONE_MINUS_DST_COLOR:    return out << "ONE_MINUS_DST_COLOR";
        case BlendFunction::SRC_ALPHA:              return out << "SRC_ALPHA";
        case BlendFunction::ONE_MINUS_SRC_ALPHA:    return out << "ONE_MINUS_SRC_ALPHA";
        case BlendFunction::DST_ALPHA:              return out << "DST_ALPHA";
        case BlendFunction::ONE_MINUS_DST_ALPHA:    return out << "ONE_MINUS_DST_ALPHA";
        case BlendFunction::SRC_ALPHA_SATURATE:     return out << "SRC_ALPHA_SATURATE";
    }
    return out << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, BlendingState const& state) {
    if (!state.enabled) {
        return out << "{ disabled }";
    }
    return out << "{ rgb: " << state.equationRGB
               << "(" << state.functionSrcRGB << ", " << state.functionDstRGB << ")"
               << ", alpha: " << state.equationAlpha
               << "(" << state.functionSrcAlpha << ", " << state.functionDstAlpha << ") }";
}

} // namespace facet
