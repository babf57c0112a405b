// Repository: Retrovue-scribe
// Component: Writer Factory
// Purpose: FormattingWriter constructors for concrete destinations.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_WRITER_FACTORY_HPP_
#define SCRIBE_LOG_WRITER_FACTORY_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "scribe/log/FormattingWriter.hpp"
#include "scribe/log/WriterConfig.hpp"
#include "scribe/timing/TimestampCache.hpp"

namespace scribe::log {

// Appends to path (created 0644 if missing). Throws std::runtime_error if it
// cannot be opened.
std::shared_ptr<FormattingWriter> NewFileWriter(
    const std::string& path,
    std::shared_ptr<const timing::TimestampCache> timestamps,
    const WriterConfig& config = WriterConfig());

// Writes to the process's stdout, which the writer does not close.
std::shared_ptr<FormattingWriter> NewConsoleWriter(
    std::shared_ptr<const timing::TimestampCache> timestamps,
    const WriterConfig& config = WriterConfig());

// Streams lines over a TCP connection. Throws std::runtime_error if the
// connection cannot be established.
std::shared_ptr<FormattingWriter> NewSocketWriter(
    const std::string& host, uint16_t port,
    std::shared_ptr<const timing::TimestampCache> timestamps,
    const WriterConfig& config = WriterConfig());

}  // namespace scribe::log

#endif  // SCRIBE_LOG_WRITER_FACTORY_HPP_
