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

// 外观组合示例：使用简单的颜色材质构建外观，运行时替换材质，
// 并输出合成后的片段着色器和渲染状态

#include <facet/Appearance.h>
#include <facet/GlslShaderCombiner.h>
#include <facet/Material.h>
#include <facet/RenderState.h>

#include <utils/Log.h>
#include <utils/Panic.h>

#include <sstream>
#include <string>
#include <string_view>
#include <utility>

using namespace facet;
using utils::slog;
namespace io = utils::io;

// 返回固定颜色的材质
class ColorMaterial : public Material {
public:
    ColorMaterial(std::string_view color, bool translucent)
            : mTranslucent(translucent) {
        mSource = "vec4 facet_getMaterialColor() {\n"
                  "    return " + std::string(color) + ";\n"
                  "}\n";
    }

    std::string_view getShaderSource() const noexcept override { return mSource; }

    bool isTranslucent() const noexcept override { return mTranslucent; }

private:
    std::string mSource;
    bool mTranslucent;
};

static constexpr const char* FRAGMENT_SHADER = R"GLSL(
#ifdef FLAT
varying vec4 v_color;
#endif

void main() {
    // 材质提供颜色
    gl_FragColor = facet_getMaterialColor();
}
)GLSL";

static constexpr const char* VERTEX_SHADER = R"GLSL(
attribute vec3 position;
void main() {
    gl_Position = vec4(position, 1.0);
}
)GLSL";

static void printAppearance(Appearance const& appearance) {
    std::ostringstream rs;
    rs << appearance.getRenderState();

    slog.i << "appearance \"" << appearance.getName() << "\""
           << " translucent: " << appearance.isTranslucent()
           << " closed: " << appearance.isClosed() << io::endl;
    slog.i << rs.str() << io::endl;
    slog.d << appearance.getFragmentShaderSource() << io::endl;
}

int main() {
    ColorMaterial const red("vec4(1.0, 0.0, 0.0, 1.0)", false);
    ColorMaterial const glass("vec4(0.5, 0.8, 1.0, 0.3)", true);

    try {
        // 不透明、封闭的几何体：启用背面剔除
        Appearance solid = Appearance::Builder()
                .name("solid")
                .translucent(false)
                .closed(true)
                .material(&red)
                .vertexShader(VERTEX_SHADER)
                .fragmentShader(FRAGMENT_SHADER)
                .renderState(Appearance::getDefaultRenderState(false, true))
                .build();
        printAppearance(solid);

        // 运行时替换为半透明材质：渲染状态随之启用混合并关闭深度写入
        solid.setMaterial(&glass);
        printAppearance(solid);

        // 平面着色、没有材质的外观，由 translucent 标志决定透明度
        Appearance const flat = Appearance::Builder()
                .name("flat")
                .flat(true)
                .faceForward(true)
                .fragmentShader(
                        "vec4 facet_getMaterialColor() { return vec4(1.0); }\n" +
                        std::string(FRAGMENT_SHADER))
                .build();
        printAppearance(flat);
    } catch (utils::Panic const& panic) {
        slog.e << "failed: " << panic.getReason() << io::endl;
        return 1;
    }

    return 0;
}
