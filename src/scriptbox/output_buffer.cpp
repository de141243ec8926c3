#include "output_buffer.h"

#include <spdlog/spdlog.h>
#include "utils.h"

#define X(name, str) case OutputStream::name: return str;
const char* OutputStreamName(OutputStream stream) {
  switch (stream) {
    ENUM_OUTPUT_STREAM_
  }
  __builtin_unreachable();
}
#undef X

bool GetOutputStream(const std::string& str, OutputStream& stream) {
#define X(name, s) if (str == s) { stream = OutputStream::name; return true; }
  ENUM_OUTPUT_STREAM_
#undef X
  return false;
}

OutputBuffer::OutputBuffer(size_t max_bytes) :
    max_bytes_(max_bytes), head_bytes_(0), tail_bytes_(0), pinned_(0), markers_(0),
    head_closed_(false), truncated_(false), marked_{false, false} {}

void OutputBuffer::InsertMarker_(OutputStream stream) {
  bool& marked = marked_[static_cast<int>(stream)];
  if (marked) return;
  if (!truncated_) spdlog::debug("Output exceeded {} bytes; evicting oldest chunks", max_bytes_);
  marked = truncated_ = true;
  chunks_.insert(chunks_.begin() + (pinned_ + markers_), Chunk{stream, kTruncationMarker, true});
  markers_++;
}

bool OutputBuffer::Append(OutputStream stream, std::string data) {
  if (data.empty()) return true;
  if (!head_closed_) {
    if (head_bytes_ + data.size() <= max_bytes_ / 2) {
      head_bytes_ += data.size();
      chunks_.push_back({stream, std::move(data), false});
      pinned_++;
      return true;
    }
    head_closed_ = true;
  }
  bool dropped = false;
  size_t tail_budget = max_bytes_ - head_bytes_;
  if (data.size() > tail_budget) {
    data = Utf8Suffix(data, tail_budget);
    InsertMarker_(stream);
    dropped = true;
  }
  // evict from the front of the unpinned region, right after the markers
  while (tail_bytes_ + data.size() > tail_budget) {
    size_t idx = pinned_ + markers_;
    OutputStream evicted = chunks_[idx].stream;
    tail_bytes_ -= chunks_[idx].data.size();
    chunks_.erase(chunks_.begin() + idx);
    InsertMarker_(evicted);
    dropped = true;
  }
  if (data.empty()) return false;
  tail_bytes_ += data.size();
  chunks_.push_back({stream, std::move(data), false});
  return !dropped;
}

std::string OutputBuffer::Text(OutputStream stream) const {
  std::string ret;
  for (auto& i : chunks_) {
    if (i.stream == stream) ret += i.data;
  }
  return ret;
}
