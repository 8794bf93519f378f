#ifndef LOG_STREAM_H_
#define LOG_STREAM_H_

#include <string>
#include <string_view>

struct DemuxedLogs {
  std::string stdout_text, stderr_text;
};

// Splits the container runtime's multiplexed log stream. Each frame is an
// 8-byte header (stream type, 3 reserved bytes, big-endian payload length)
// followed by the payload. Type 1 goes to stdout, 2 to stderr, anything else
// is skipped. A truncated trailing frame is dropped.
DemuxedLogs DemuxLogStream(std::string_view raw);

#endif  // LOG_STREAM_H_
