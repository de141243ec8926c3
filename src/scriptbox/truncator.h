#ifndef SCRIPTBOX_TRUNCATOR_H_
#define SCRIPTBOX_TRUNCATOR_H_

#include <string>
#include <filesystem>

extern const char kPreviewMarker[];

struct PreviewOptions {
  long lines;     // lines kept from each end; <= 0 for no line limit
  long max_bytes; // total budget of both ends; <= 0 for no byte limit
};

struct TruncatedOutput {
  std::string stdout_preview, stderr_preview;
  std::filesystem::path full_path; // empty if the full output could not be written
  bool truncated;
};

// Head + marker + tail. Both ends are always kept; the head keeps the beginning of an
// over-long line and the tail keeps the end of one.
std::string MakePreview(const std::string& text, const PreviewOptions&, bool* truncated = nullptr);

// Layout of the full output artifact: stdout, then a separator line and stderr if there is any
std::string FullOutputText(const std::string& stdout_text, const std::string& stderr_text);

// Write the full output to full_path first, then build both previews
TruncatedOutput TruncateOutput(const std::string& stdout_text, const std::string& stderr_text,
                               const std::filesystem::path& full_path, const PreviewOptions&);

#endif  // SCRIPTBOX_TRUNCATOR_H_
