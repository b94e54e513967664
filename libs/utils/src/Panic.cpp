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

#include <utils/Panic.h>

#include <utils/Log.h>

#include <utility>

namespace utils {

Panic::Panic(std::string reason, const char* function, const char* file, int line,
        const char* condition)
        : mReason(std::move(reason)),
          mFunction(function),
          mFile(file),
          mCondition(condition),
          mLine(line) {
}

Panic::~Panic() noexcept = default;

const char* Panic::what() const noexcept {
    return mDescription.c_str();
}

// must be called by the most derived constructor, getType() is virtual
void Panic::buildDescription() {
    std::ostringstream out;
    out << getType() << " in " << mFunction << ":" << mLine << std::endl;
    out << "in file " << mFile << std::endl;
    out << "reason: " << mReason;
    if (mCondition && *mCondition) {
        out << " (" << mCondition << ")";
    }
    mDescription = out.str();
}

PreconditionPanic::PreconditionPanic(std::string reason, const char* function, const char* file,
        int line, const char* condition)
        : Panic(std::move(reason), function, file, line, condition) {
    buildDescription();
}

const char* PreconditionPanic::getType() const noexcept {
    return "Precondition";
}

PostconditionPanic::PostconditionPanic(std::string reason, const char* function, const char* file,
        int line, const char* condition)
        : Panic(std::move(reason), function, file, line, condition) {
    buildDescription();
}

const char* PostconditionPanic::getType() const noexcept {
    return "Postcondition";
}

// ------------------------------------------------------------------------------------------------

namespace details {

template<typename T>
PanicStream<T>::PanicStream(const char* function, const char* file, int line,
        const char* condition) noexcept
        : mFunction(function), mFile(file), mCondition(condition), mLine(line) {
}

template<typename T>
PanicStream<T>::~PanicStream() noexcept(false) {
    T panic(mStream.str(), mFunction, mFile, mLine, mCondition);
    slog.e << panic.what() << io::endl;
    throw panic;
}

template class PanicStream<PreconditionPanic>;
template class PanicStream<PostconditionPanic>;

} // namespace details

} // namespace utils
