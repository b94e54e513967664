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

#include <utils/Log.h>

#include <mutex>
#include <string>

#include <stdio.h>

namespace utils {
namespace io {

namespace {

// all streams share the same lock so that lines from different priorities never interleave
std::mutex& getOutputLock() noexcept {
    static std::mutex sLock;
    return sLock;
}

const char* getPrefix(LogStream::Priority priority) noexcept {
    switch (priority) {
        case LogStream::Priority::DEBUG:    return "D/facet: ";
        case LogStream::Priority::INFO:     return "I/facet: ";
        case LogStream::Priority::WARNING:  return "W/facet: ";
        case LogStream::Priority::ERROR:    return "E/facet: ";
    }
    return "";
}

} // anonymous namespace

LogStream::LogStream(Priority priority) noexcept
        : std::ostream(nullptr), mBuffer(priority) {
    rdbuf(&mBuffer);
}

LogStream::~LogStream() noexcept {
    // emit whatever is left without a terminating endl
    mBuffer.pubsync();
}

int LogStream::Buffer::sync() {
    std::string const line = str();
    if (line.empty()) {
        return 0;
    }
    str(std::string{});

    // errors and warnings go to stderr, the rest to stdout
    FILE* const out = (priority >= Priority::WARNING) ? stderr : stdout;

    std::lock_guard<std::mutex> const lock(getOutputLock());
    fputs(getPrefix(priority), out);
    fwrite(line.data(), 1, line.size(), out);
    fflush(out);
    return 0;
}

} // namespace io

namespace {
thread_local io::LogStream cout(io::LogStream::Priority::DEBUG);
thread_local io::LogStream cerr(io::LogStream::Priority::ERROR);
thread_local io::LogStream cwarn(io::LogStream::Priority::WARNING);
thread_local io::LogStream cinfo(io::LogStream::Priority::INFO);
} // anonymous namespace

thread_local Loggers const slog = {
        cout,   // debug
        cerr,   // error
        cwarn,  // warning
        cinfo   // info
};

} // namespace utils
