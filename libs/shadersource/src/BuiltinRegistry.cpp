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

#include <shadersource/BuiltinRegistry.h>

#include "GlslText.h"

#include <utils/Panic.h>

#include <algorithm>
#include <set>
#include <utility>

namespace shadersource {

BuiltinRegistry::BuiltinRegistry() noexcept = default;
BuiltinRegistry::~BuiltinRegistry() noexcept = default;
BuiltinRegistry::BuiltinRegistry(BuiltinRegistry const& rhs) = default;
BuiltinRegistry::BuiltinRegistry(BuiltinRegistry&& rhs) noexcept = default;
BuiltinRegistry& BuiltinRegistry::operator=(BuiltinRegistry const& rhs) = default;
BuiltinRegistry& BuiltinRegistry::operator=(BuiltinRegistry&& rhs) noexcept = default;

BuiltinRegistry& BuiltinRegistry::add(std::string name, std::string source,
        std::vector<std::string> dependencies) {
    FACET_CHECK_PRECONDITION(!name.empty()) << "built-in name cannot be empty";

    FACET_CHECK_PRECONDITION(mEntries.find(name) == mEntries.end())
            << "built-in \"" << name << "\" is already registered";

    for (auto const& dependency : dependencies) {
        FACET_CHECK_PRECONDITION(mEntries.find(dependency) != mEntries.end())
                << "built-in \"" << name << "\" depends on \"" << dependency
                << "\" which is not registered";
    }

    mEntries.emplace(std::move(name), Entry{ std::move(source), std::move(dependencies) });
    return *this;
}

bool BuiltinRegistry::has(std::string_view name) const noexcept {
    return mEntries.find(name) != mEntries.end();
}

void BuiltinRegistry::visit(std::string const& name, std::vector<std::string>& order,
        std::vector<std::string_view>& visited) const {
    if (std::find(visited.begin(), visited.end(), name) != visited.end()) {
        return;
    }
    visited.emplace_back(name);

    // dependencies are known to be registered, add() checked it
    Entry const& entry = mEntries.find(name)->second;
    for (auto const& dependency : entry.dependencies) {
        visit(dependency, order, visited);
    }
    order.push_back(name);
}

std::vector<std::string> BuiltinRegistry::resolve(std::string_view source) const {
    std::vector<std::string> order;
    if (mEntries.empty()) {
        return order;
    }

    std::set<std::string_view> referenced;
    glsl::forEachIdentifier(source, [this, &referenced](std::string_view identifier) {
        if (has(identifier)) {
            referenced.insert(identifier);
        }
    });

    std::vector<std::string_view> visited;
    // iterate in name order so that the result is deterministic
    for (auto const& [name, entry] : mEntries) {
        if (referenced.count(name)) {
            visit(name, order, visited);
        }
    }
    return order;
}

std::string BuiltinRegistry::getDeclarations(std::string_view source) const {
    std::string declarations;
    for (auto const& name : resolve(source)) {
        declarations += mEntries.find(name)->second.source;
        declarations += '\n';
    }
    return declarations;
}

} // namespace shadersource
