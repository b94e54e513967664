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

#include <facet/RenderState.h>

#include <ostream>

namespace facet {

bool RenderState::operator==(RenderState const& rhs) const noexcept {
    return depthTest == rhs.depthTest &&
           depthMask == rhs.depthMask &&
           blending == rhs.blending &&
           cull == rhs.cull &&
           colorMask == rhs.colorMask &&
           frontFace == rhs.frontFace;
}

std::ostream& operator<<(std::ostream& out, CullFace face) {
    switch (face) {
        case CullFace::FRONT:           return out << "FRONT";
        case CullFace::BACK:            return out << "BACK";
        case CullFace::FRONT_AND_BACK:  return out << "FRONT_AND_BACK";
    }
    return out << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, WindingOrder order) {
    switch (order) {
        case WindingOrder::CLOCKWISE:           return out << "CLOCKWISE";
        case WindingOrder::COUNTER_CLOCKWISE:   return out << "COUNTER_CLOCKWISE";
    }
    return out << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, DepthFunction func) {
    switch (func) {
        case DepthFunction::NEVER:              return out << "NEVER";
        case DepthFunction::LESS:               return out << "LESS";
        case DepthFunction::EQUAL:              return out << "EQUAL";
        case DepthFunction::LESS_OR_EQUAL:      return out << "LESS_OR_EQUAL";
        case DepthFunction::GREATER:            return out << "GREATER";
        case DepthFunction::NOT_EQUAL:          return out << "NOT_EQUAL";
        case DepthFunction::GREATER_OR_EQUAL:   return out << "GREATER_OR_EQUAL";
        case DepthFunction::ALWAYS:             return out << "ALWAYS";
    }
    return out << "UNKNOWN";
}

// only the specified fields are printed
std::ostream& operator<<(std::ostream& out, RenderState const& rs) {
    out << "RenderState {";
    if (rs.depthTest) {
        out << " depthTest: { enabled: " << rs.depthTest->enabled
            << ", func: " << rs.depthTest->func << " }";
    }
    if (rs.depthMask) {
        out << " depthMask: " << *rs.depthMask;
    }
    if (rs.blending) {
        out << " blending: " << *rs.blending;
    }
    if (rs.cull) {
        out << " cull: { enabled: " << rs.cull->enabled << ", face: " << rs.cull->face << " }";
    }
    if (rs.colorMask) {
        out << " colorMask: { "
            << rs.colorMask->red << ", " << rs.colorMask->green << ", "
            << rs.colorMask->blue << ", " << rs.colorMask->alpha << " }";
    }
    if (rs.frontFace) {
        out << " frontFace: " << *rs.frontFace;
    }
    return out << " }";
}

} // namespace facet
