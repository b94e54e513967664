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

#include "GlslText.h"

#include <utils/Log.h>

#include <algorithm>

#include <ctype.h>

namespace shadersource::glsl {

using namespace utils;

namespace {

inline bool isIdentifierStart(char c) noexcept {
    return isalpha(static_cast<unsigned char>(c)) || c == '_';
}

inline bool isIdentifierPart(char c) noexcept {
    return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

inline bool isBlank(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r';
}

} // anonymous namespace

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && isBlank(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && isBlank(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::string removeComments(std::string_view source) {
    std::string out;
    out.reserve(source.size());

    size_t i = 0;
    size_t const n = source.size();
    while (i < n) {
        char const c = source[i];
        if (c == '/' && i + 1 < n && source[i + 1] == '/') {
            // line comment: drop everything up to (not including) the new line
            i += 2;
            while (i < n && source[i] != '\n') {
                i++;
            }
            continue;
        }
        if (c == '/' && i + 1 < n && source[i + 1] == '*') {
            size_t const end = source.find("*/", i + 2);
            std::string_view const body = (end == std::string_view::npos) ?
                    source.substr(i + 2) : source.substr(i + 2, end - (i + 2));
            // keep line numbers stable
            out.append(size_t(std::count(body.begin(), body.end(), '\n')), '\n');
            if (UTILS_UNLIKELY(end == std::string_view::npos)) {
                slog.w << "unterminated block comment, the rest of the shader is ignored"
                       << io::endl;
                break;
            }
            i = end + 2;
            continue;
        }
        out.push_back(c);
        i++;
    }
    return out;
}

std::string extractDirectives(std::string_view source, std::string_view directive,
        std::function<void(std::string_view argument)> const& found) {
    std::string out;
    out.reserve(source.size());

    size_t start = 0;
    while (true) {
        size_t const end = source.find('\n', start);
        std::string_view const line = (end == std::string_view::npos) ?
                source.substr(start) : source.substr(start, end - start);

        bool matched = false;
        std::string_view s = trim(line);
        if (!s.empty() && s.front() == '#') {
            // "#  version" is as valid as "#version"
            s = trim(s.substr(1));
            if (s.substr(0, directive.size()) == directive &&
                    (s.size() == directive.size() || isBlank(s[directive.size()]))) {
                found(trim(s.substr(directive.size())));
                matched = true;
            }
        }
        if (!matched) {
            out.append(line);
        }

        if (end == std::string_view::npos) {
            break;
        }
        out.push_back('\n');
        start = end + 1;
    }
    return out;
}

void forEachIdentifier(std::string_view source,
        std::function<void(std::string_view identifier)> const& found) {
    size_t i = 0;
    size_t const n = source.size();
    while (i < n) {
        char const c = source[i];
        if (isIdentifierStart(c)) {
            size_t const first = i;
            while (i < n && isIdentifierPart(source[i])) {
                i++;
            }
            found(source.substr(first, i - first));
        } else if (isdigit(static_cast<unsigned char>(c))) {
            // skip numeric literals entirely so that "1.0e5f" doesn't yield "e5f"
            while (i < n && (isIdentifierPart(source[i]) || source[i] == '.')) {
                i++;
            }
        } else {
            i++;
        }
    }
}

} // namespace shadersource::glsl
