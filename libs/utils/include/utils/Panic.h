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

#ifndef TNT_UTILS_PANIC_H
#define TNT_UTILS_PANIC_H

#include <utils/compiler.h>

#include <exception>
#include <sstream>
#include <string>

namespace utils {

/**
 * Base class of all the exceptions thrown by the FACET_CHECK_* macros.
 *
 * A Panic carries the failed condition, the reason given by the caller and the
 * location of the check. what() returns a single human readable description.
 *
 * 所有 FACET_CHECK_* 宏抛出的异常的基类。
 * 包含失败的条件、调用者给出的原因以及检查所在的位置。
 */
class UTILS_PUBLIC Panic : public std::exception {
public:
    Panic(std::string reason, const char* function, const char* file, int line,
            const char* condition);
    ~Panic() noexcept override;

    // returns the full description of this panic
    const char* what() const noexcept override;

    // the message passed to the FACET_CHECK_* macro
    std::string const& getReason() const noexcept { return mReason; }

    // the failed condition, as written in the source
    const char* getCondition() const noexcept { return mCondition; }

    const char* getFunction() const noexcept { return mFunction; }
    const char* getFile() const noexcept { return mFile; }
    int getLine() const noexcept { return mLine; }

    // "Precondition", "Postcondition"
    virtual const char* getType() const noexcept = 0;

protected:
    void buildDescription();

private:
    std::string mReason;
    const char* mFunction;
    const char* mFile;
    const char* mCondition;
    int mLine;
    std::string mDescription;
};

/**
 * Thrown when a function is called with arguments, or in a state, it does not accept.
 * 函数的调用参数或调用时的状态不被接受时抛出。
 */
class UTILS_PUBLIC PreconditionPanic : public Panic {
public:
    PreconditionPanic(std::string reason, const char* function, const char* file, int line,
            const char* condition);
    const char* getType() const noexcept override;
};

/**
 * Thrown when a function fails to produce the result it promises.
 * 函数未能产生其承诺的结果时抛出。
 */
class UTILS_PUBLIC PostconditionPanic : public Panic {
public:
    PostconditionPanic(std::string reason, const char* function, const char* file, int line,
            const char* condition);
    const char* getType() const noexcept override;
};

namespace details {

/**
 * \privatesection
 * Collects the message of a failed check and throws T when it goes out of scope,
 * that is at the end of the statement containing the FACET_CHECK_* macro.
 */
template<typename T>
class UTILS_PUBLIC PanicStream {
public:
    PanicStream(const char* function, const char* file, int line, const char* condition) noexcept;
    ~PanicStream() noexcept(false);

    PanicStream(PanicStream const&) = delete;
    PanicStream& operator=(PanicStream const&) = delete;

    template<typename V>
    PanicStream& operator<<(V const& value) {
        mStream << value;
        return *this;
    }

private:
    const char* mFunction;
    const char* mFile;
    const char* mCondition;
    int mLine;
    std::ostringstream mStream;
};

extern template class PanicStream<PreconditionPanic>;
extern template class PanicStream<PostconditionPanic>;

} // namespace details

} // namespace utils

#define FACET_CHECK_CONDITION_IMPL(TYPE, condition)                                     \
    if (UTILS_LIKELY(condition)) { } else                                               \
        ::utils::details::PanicStream<TYPE>(__func__, __FILE__, __LINE__, #condition)

/**
 * Checks that a function's arguments or state are valid, throws utils::PreconditionPanic
 * otherwise. A message can be streamed to the macro:
 *
 *      FACET_CHECK_PRECONDITION(name != nullptr) << "name cannot be null";
 */
#define FACET_CHECK_PRECONDITION(condition)                                             \
    FACET_CHECK_CONDITION_IMPL(::utils::PreconditionPanic, condition)

/**
 * Checks that a function's result is valid, throws utils::PostconditionPanic otherwise.
 */
#define FACET_CHECK_POSTCONDITION(condition)                                            \
    FACET_CHECK_CONDITION_IMPL(::utils::PostconditionPanic, condition)

#endif // TNT_UTILS_PANIC_H
