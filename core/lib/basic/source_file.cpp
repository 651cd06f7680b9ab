// kaleido/basic/source_file.cpp - Line table and file table
#include "kaleido/basic/source_file.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace kaleido
{

SourceFile::SourceFile(std::string name, std::string text)
: name_(std::move(name)), text_(std::move(text))
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineCol SourceFile::locate(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));

  // line_starts_[0] == 0, so the match is never before the first line.
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index = static_cast<uint32_t>(next - line_starts_.begin()) - 1;
  return {line_index + 1, offset - line_starts_[line_index] + 1};
}

std::string_view SourceFile::line(uint32_t number) const noexcept
{
  if (number == 0 || number > line_count()) {
    return {};
  }

  const uint32_t begin = line_starts_[number - 1];
  uint32_t end =
    number < line_count() ? line_starts_[number] - 1 : static_cast<uint32_t>(text_.size());
  if (end > begin && text_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(text_).substr(begin, end - begin);
}

std::string_view SourceFile::text(SourceRange range) const noexcept
{
  if (!range.is_valid() || range.begin() > text_.size()) {
    return {};
  }
  const uint32_t end = std::min(range.end(), static_cast<uint32_t>(text_.size()));
  return std::string_view(text_).substr(range.begin(), end - range.begin());
}

FileId SourceFiles::add(std::string name, std::string text)
{
  if (files_.size() >= FileId::k_invalid) {
    throw std::length_error("too many source files");
  }
  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.emplace_back(std::move(name), std::move(text));
  return id;
}

const SourceFile * SourceFiles::find(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return &files_[id.value];
}

}  // namespace kaleido
