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

#ifndef TNT_UTILS_COMPILER_H
#define TNT_UTILS_COMPILER_H

// 编译器相关的宏定义（可见性、分支预测提示等）

#if defined(__has_attribute)
#   define UTILS_HAS_ATTRIBUTE(x) __has_attribute(x)
#else
#   define UTILS_HAS_ATTRIBUTE(x) 0
#endif

#if UTILS_HAS_ATTRIBUTE(visibility)
#   define UTILS_PUBLIC  __attribute__((visibility("default")))
#   define UTILS_PRIVATE __attribute__((visibility("hidden")))
#else
#   define UTILS_PUBLIC
#   define UTILS_PRIVATE
#endif

#if UTILS_HAS_ATTRIBUTE(noinline)
#   define UTILS_NOINLINE __attribute__((noinline))
#else
#   define UTILS_NOINLINE
#endif

#if defined(__GNUC__) || defined(__clang__)
#   define UTILS_LIKELY(exp)    (__builtin_expect(!!(exp), true))
#   define UTILS_UNLIKELY(exp)  (__builtin_expect(!!(exp), false))
#else
#   define UTILS_LIKELY(exp)    (!!(exp))
#   define UTILS_UNLIKELY(exp)  (!!(exp))
#endif

// nullability annotations are only understood by clang
#if defined(__clang__)
#   define UTILS_NONNULL   _Nonnull
#   define UTILS_NULLABLE  _Nullable
#else
#   define UTILS_NONNULL
#   define UTILS_NULLABLE
#endif

#endif // TNT_UTILS_COMPILER_H
