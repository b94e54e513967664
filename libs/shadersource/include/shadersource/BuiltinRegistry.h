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

#ifndef TNT_SHADERSOURCE_BUILTINREGISTRY_H
#define TNT_SHADERSOURCE_BUILTINREGISTRY_H

#include <utils/compiler.h>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <stddef.h>

namespace shadersource {

/**
 * A set of named GLSL declarations (functions, constants, structs) that can be injected
 * into a combined shader when the shader references them.
 *
 * A built-in may depend on other built-ins, which must be registered first. This keeps the
 * dependency graph acyclic.
 *
 * 一组具名的 GLSL 声明（函数、常量、结构体）。当着色器引用它们时注入到合并后的着色器中。
 * 依赖项必须先注册，因此依赖图无环。
 */
class UTILS_PUBLIC BuiltinRegistry {
public:
    BuiltinRegistry() noexcept;
    ~BuiltinRegistry() noexcept;

    BuiltinRegistry(BuiltinRegistry const& rhs);
    BuiltinRegistry(BuiltinRegistry&& rhs) noexcept;
    BuiltinRegistry& operator=(BuiltinRegistry const& rhs);
    BuiltinRegistry& operator=(BuiltinRegistry&& rhs) noexcept;

    /**
     * Registers a built-in.
     *
     * @param name          identifier that, when found in a shader, pulls in the declaration.
     *                      Must not be empty or already registered.
     * @param source        the GLSL declaration
     * @param dependencies  names of already registered built-ins this declaration uses
     * @return This registry for chaining calls.
     * @exception utils::PreconditionPanic if a precondition is violated
     */
    BuiltinRegistry& add(std::string name, std::string source,
            std::vector<std::string> dependencies = {});

    bool has(std::string_view name) const noexcept;

    size_t size() const noexcept { return mEntries.size(); }

    bool empty() const noexcept { return mEntries.empty(); }

    /**
     * Returns the names of the built-ins referenced by `source`, including their
     * transitive dependencies. Each name appears once, after all of its dependencies.
     */
    std::vector<std::string> resolve(std::string_view source) const;

    /**
     * Returns the declarations of the built-ins referenced by `source`, in the order
     * given by resolve(), each followed by a new line.
     */
    std::string getDeclarations(std::string_view source) const;

private:
    struct Entry {
        std::string source;
        std::vector<std::string> dependencies;
    };

    void visit(std::string const& name, std::vector<std::string>& order,
            std::vector<std::string_view>& visited) const;

    // ordered so that the output doesn't depend on insertion order
    std::map<std::string, Entry, std::less<>> mEntries;
};

} // namespace shadersource

#endif // TNT_SHADERSOURCE_BUILTINREGISTRY_H
