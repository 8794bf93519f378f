#include "log_stream.h"

#include <cstdint>

#include <spdlog/spdlog.h>

namespace {

constexpr size_t kFrameHeaderSize = 8;
constexpr uint8_t kStdoutStream = 1;
constexpr uint8_t kStderrStream = 2;

} // namespace

DemuxedLogs DemuxLogStream(std::string_view raw) {
  DemuxedLogs ret;
  size_t pos = 0;
  while (raw.size() - pos >= kFrameHeaderSize) {
    const auto* header = reinterpret_cast<const uint8_t*>(raw.data() + pos);
    uint32_t len = (uint32_t)header[4] << 24 | (uint32_t)header[5] << 16 |
                   (uint32_t)header[6] << 8 | (uint32_t)header[7];
    pos += kFrameHeaderSize;
    if (raw.size() - pos < len) {
      spdlog::debug("Dropping truncated log frame ({} of {} bytes)", raw.size() - pos, len);
      pos = raw.size();
      break;
    }
    auto payload = raw.substr(pos, len);
    if (header[0] == kStdoutStream) {
      ret.stdout_text.append(payload);
    } else if (header[0] == kStderrStream) {
      ret.stderr_text.append(payload);
    }
    pos += len;
  }
  if (pos != raw.size()) spdlog::debug("Ignoring {} trailing log bytes", raw.size() - pos);
  return ret;
}
