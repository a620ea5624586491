// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "dirpush_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

namespace dirpush {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

std::string escape_json(const std::string& s) {
  static const char hex[] = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          out += "\\u00";
          out += hex[c >> 4];
          out += hex[c & 0x0F];
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

namespace {

// Attributes attached by DIRPUSH_LOG_SCOPED_CONTEXT on worker threads
struct TransferContext {
  boost::log::value_ref<int> worker;
  boost::log::value_ref<std::string> object_key;

  explicit TransferContext(boost::log::record_view const& rec)
      : worker(boost::log::extract<int>("WorkerID", rec))
      , object_key(boost::log::extract<std::string>("ObjectKey", rec)) {}

  bool empty() const {
    return !worker && !object_key;
  }
};

boost::log::value_ref<boost::posix_time::ptime> time_stamp_of(boost::log::record_view const& rec) {
  return boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
}

boost::log::value_ref<severity_level> severity_of(boost::log::record_view const& rec) {
  return boost::log::extract<severity_level>("Severity", rec);
}

// [2026-10-18 12:00:00.000000] [INFO] [upload] Uploading ... | worker=2 key=data/a.txt
void format_text(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  if (auto ts = time_stamp_of(rec)) {
    strm << "[" << *ts << "] ";
  }
  if (auto sev = severity_of(rec)) {
    strm << "[" << *sev << "] ";
  }
  strm << rec[boost::log::expressions::smessage];

  TransferContext context(rec);
  if (context.empty()) {
    return;
  }
  strm << " |";
  if (context.worker) {
    strm << " worker=" << *context.worker;
  }
  if (context.object_key) {
    strm << " key=" << *context.object_key;
  }
}

// One JSON object per line: ts, level, msg, thread_id, worker, object_key
void format_json(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  if (auto ts = time_stamp_of(rec)) {
    strm << *ts;
  }
  strm << "\",\"level\":\"";
  if (auto sev = severity_of(rec)) {
    strm << *sev;
  }
  strm << "\",\"msg\":\"";
  if (auto msg = rec[boost::log::expressions::smessage]) {
    strm << escape_json(*msg);
  }
  strm << "\"";

  using thread_id_t = boost::log::attributes::current_thread_id::value_type;
  if (auto tid = boost::log::extract<thread_id_t>("ThreadID", rec)) {
    strm << ",\"thread_id\":\"" << *tid << "\"";
  }

  TransferContext context(rec);
  if (context.worker) {
    strm << ",\"worker\":" << *context.worker;
  }
  if (context.object_key) {
    strm << ",\"object_key\":\"" << escape_json(*context.object_key) << "\"";
  }
  strm << "}";
}

// Directory the sink writes to: the configured one, or /tmp if it cannot be created
std::string usable_log_directory(const std::string& wanted) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(wanted, ec);
  if (!ec || boost::filesystem::is_directory(wanted)) {
    return wanted;
  }

  // The core has no sinks yet, so this goes to stderr
  std::cerr << "[dirpush_logging] Warning: cannot create log directory '" << wanted
            << "': " << ec.message() << ", writing logs to /tmp\n";
  return "/tmp";
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string directory = usable_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = directory, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&format_json);
  } else {
    sink->set_formatter(&format_text);
  }
  return sink;
}

}  // namespace logging
}  // namespace dirpush
