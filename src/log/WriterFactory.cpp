// Repository: Retrovue-scribe
// Component: Writer Factory
// Purpose: FormattingWriter constructors for concrete destinations.
// Copyright (c) 2025 RetroVue

#include "scribe/log/WriterFactory.hpp"

#include "scribe/output/FdSink.hpp"

namespace scribe::log {

std::shared_ptr<FormattingWriter> NewFileWriter(
    const std::string& path,
    std::shared_ptr<const timing::TimestampCache> timestamps,
    const WriterConfig& config) {
  return std::make_shared<FormattingWriter>(output::FdSink::OpenFile(path),
                                            std::move(timestamps), config);
}

std::shared_ptr<FormattingWriter> NewConsoleWriter(
    std::shared_ptr<const timing::TimestampCache> timestamps,
    const WriterConfig& config) {
  return std::make_shared<FormattingWriter>(output::FdSink::Stdout(),
                                            std::move(timestamps), config);
}

std::shared_ptr<FormattingWriter> NewSocketWriter(
    const std::string& host, uint16_t port,
    std::shared_ptr<const timing::TimestampCache> timestamps,
    const WriterConfig& config) {
  return std::make_shared<FormattingWriter>(output::FdSink::ConnectTcp(host, port),
                                            std::move(timestamps), config);
}

}  // namespace scribe::log
