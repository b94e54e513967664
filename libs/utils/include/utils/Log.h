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

#ifndef TNT_UTILS_LOG_H
#define TNT_UTILS_LOG_H

#include <utils/compiler.h>

#include <ostream>
#include <sstream>

#include <stdint.h>

namespace utils {
namespace io {

/**
 * A line-buffered output stream. Text is accumulated until the stream is flushed
 * (typically with io::endl), at which point the whole line is emitted at once,
 * prefixed by the stream's priority.
 *
 * A LogStream is not thread-safe, each thread uses its own (see slog). Emitting a line is
 * serialized across all streams.
 *
 * 行缓冲的输出流。文本在刷新（通常通过 io::endl）时整行输出，并带有优先级前缀。
 */
class UTILS_PUBLIC LogStream : public std::ostream {
public:
    enum class Priority : uint8_t {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    explicit LogStream(Priority priority) noexcept;
    ~LogStream() noexcept override;

    LogStream(LogStream const&) = delete;
    LogStream& operator=(LogStream const&) = delete;

    Priority getPriority() const noexcept { return mBuffer.priority; }

private:
    struct Buffer : public std::stringbuf {
        explicit Buffer(Priority priority) noexcept : priority(priority) { }
        int sync() override;
        Priority priority;
    };
    Buffer mBuffer;
};

// terminates the current line and flushes it
inline std::ostream& endl(std::ostream& s) {
    s.put('\n');
    return s.flush();
}

inline std::ostream& flush(std::ostream& s) {
    return s.flush();
}

} // namespace io

struct UTILS_PUBLIC Loggers {
    // DEBUG level logging stream
    io::LogStream& d;

    // ERROR level logging stream
    io::LogStream& e;

    // WARNING level logging stream
    io::LogStream& w;

    // INFORMATION level logging stream
    io::LogStream& i;
};

// every thread has its own set of streams, lines written by different threads never mix
extern UTILS_PUBLIC thread_local Loggers const slog;

} // namespace utils

#endif // TNT_UTILS_LOG_H
