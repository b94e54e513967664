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

#ifndef TNT_SHADERSOURCE_GLSLTEXT_H
#define TNT_SHADERSOURCE_GLSLTEXT_H

#include <utils/compiler.h>

#include <functional>
#include <string>
#include <string_view>

namespace shadersource::glsl {

// Text-level helpers working on GLSL source. None of these parse GLSL, they only
// understand comments, preprocessor lines and identifiers.
// GLSL 源码的文本级辅助函数，只理解注释、预处理行和标识符，不做语法分析。

// Replaces every comment with nothing, keeping the new lines a block comment spans so
// that line numbers are preserved.
UTILS_PRIVATE std::string removeComments(std::string_view source);

// Removes every "#<directive> <argument>" line from source and calls `found` with the
// trimmed argument, in order of appearance. Removed lines are left empty.
UTILS_PRIVATE std::string extractDirectives(std::string_view source, std::string_view directive,
        std::function<void(std::string_view argument)> const& found);

// Calls `found` for every identifier token ([A-Za-z_][A-Za-z0-9_]*) in source.
UTILS_PRIVATE void forEachIdentifier(std::string_view source,
        std::function<void(std::string_view identifier)> const& found);

// Trims spaces and tabs on both ends.
UTILS_PRIVATE std::string_view trim(std::string_view s) noexcept;

} // namespace shadersource::glsl

#endif // TNT_SHADERSOURCE_GLSLTEXT_H
