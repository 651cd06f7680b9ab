// kaleido/basic/source_file.hpp - Source text, byte ranges and line lookup
//
// Every token and AST node carries a SourceRange: a half-open byte range
// tagged with the FileId of the text it came from. Lines and columns are
// only computed when a diagnostic or the token listing needs them.
//
#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace kaleido
{

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

/**
 * Half-open byte range [begin, end) in one source text.
 *
 * A default-constructed range is invalid and stands for "no location".
 * An empty range (begin == end) is a position, e.g. end of input.
 */
class SourceRange
{
public:
  static constexpr uint32_t k_npos = UINT32_MAX;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : file_(file), begin_(begin), end_(end)
  {
  }

  /// Empty range at `offset`.
  [[nodiscard]] static constexpr SourceRange at(FileId file, uint32_t offset) noexcept
  {
    return {file, offset, offset};
  }

  [[nodiscard]] constexpr FileId file() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_ != k_npos && end_ != k_npos;
  }
  [[nodiscard]] constexpr uint32_t length() const noexcept
  {
    return is_valid() ? end_ - begin_ : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return file_ == other.file_ && begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  FileId file_;
  uint32_t begin_ = k_npos;
  uint32_t end_ = k_npos;
};

/// From the start of `first` to the end of `last`; an invalid side yields the other.
[[nodiscard]] constexpr SourceRange cover(SourceRange first, SourceRange last) noexcept
{
  if (!first.is_valid()) return last;
  if (!last.is_valid()) return first;
  return {first.file(), first.begin(), last.end()};
}

/// 1-based line and column; a column counts bytes. {0, 0} means unknown.
struct LineCol
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line != 0; }
};

/**
 * One named source text and the byte offsets where its lines start.
 *
 * The name is for display only ("demo.kl", "<command-line>").
 */
class SourceFile
{
public:
  SourceFile(std::string name, std::string text);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] uint32_t line_count() const noexcept
  {
    return static_cast<uint32_t>(line_starts_.size());
  }

  /// Line and column of a byte offset; offsets past the end clamp to the end.
  [[nodiscard]] LineCol locate(uint32_t offset) const noexcept;

  /// Text of 1-based line `number` without its `\n` or `\r\n`; empty when out of range.
  [[nodiscard]] std::string_view line(uint32_t number) const noexcept;

  /// Text covered by `range`, clipped to the file.
  [[nodiscard]] std::string_view text(SourceRange range) const noexcept;

private:
  std::string name_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

/**
 * The source texts of one run, addressed by FileId.
 *
 * Files never move once added, so token and diagnostic views into their text
 * stay valid as long as the table.
 */
class SourceFiles
{
public:
  /// Add a text under a display name. Throws std::length_error when no FileId is left.
  FileId add(std::string name, std::string text);

  /// nullptr for an invalid or unknown id.
  [[nodiscard]] const SourceFile * find(FileId id) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::deque<SourceFile> files_;
};

}  // namespace kaleido
