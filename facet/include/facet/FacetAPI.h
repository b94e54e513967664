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

#ifndef TNT_FACET_FACETAPI_H
#define TNT_FACET_FACETAPI_H

#include <utils/compiler.h>
#include <utils/PrivateImplementation.h>

namespace facet {

/**
 * \privatesection
 * Base of all the facet Builders. The builder's members live in a private
 * structure, defined next to the Builder's implementation.
 *
 * 所有 Builder 的基类，成员保存在私有结构体中（PIMPL）。
 */
template<typename T>
using BuilderBase = utils::PrivateImplementation<T>;

} // namespace facet

#endif // TNT_FACET_FACETAPI_H
