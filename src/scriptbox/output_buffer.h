#ifndef SCRIPTBOX_OUTPUT_BUFFER_H_
#define SCRIPTBOX_OUTPUT_BUFFER_H_

#include <deque>
#include <string>

#define ENUM_OUTPUT_STREAM_ \
  X(STDOUT, "stdout") \
  X(STDERR, "stderr")
enum class OutputStream {
#define X(name, str) name,
  ENUM_OUTPUT_STREAM_
#undef X
};

const char* OutputStreamName(OutputStream);
// return false if the name is unknown
bool GetOutputStream(const std::string&, OutputStream&);

inline constexpr char kTruncationMarker[] = "[...output truncated...]\n";

// Captured output bounded by max_bytes.
// Chunks appended while the buffer is less than half full are pinned and never evicted;
// after that, the oldest unpinned chunks are evicted first. Each stream that loses data gets
// one marker chunk where the eviction happened. Marker bytes are not counted against max_bytes.
class OutputBuffer {
 public:
  struct Chunk {
    OutputStream stream;
    std::string data;
    bool marker;
  };

  explicit OutputBuffer(size_t max_bytes);

  // return false if anything had to be dropped to stay within the bound
  bool Append(OutputStream stream, std::string data);

  const std::deque<Chunk>& Chunks() const { return chunks_; }
  size_t Size() const { return head_bytes_ + tail_bytes_; }
  size_t MaxBytes() const { return max_bytes_; }
  bool Truncated() const { return truncated_; }

  // concatenation of one stream, including its marker if it lost data
  std::string Text(OutputStream stream) const;

 private:
  void InsertMarker_(OutputStream stream);

  size_t max_bytes_;
  size_t head_bytes_, tail_bytes_;
  size_t pinned_; // number of leading chunks that are never evicted
  size_t markers_; // marker chunks, placed right after the pinned ones
  bool head_closed_;
  bool truncated_;
  bool marked_[2];
  std::deque<Chunk> chunks_;
};

#endif  // SCRIPTBOX_OUTPUT_BUFFER_H_
