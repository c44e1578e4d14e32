#include "util.h"

#include <stdexcept>

namespace depconf {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::string buffer(static_cast<size_t>(file_size), '\0');
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::vector<std::string_view> util_split(std::string_view text, char delimiter) {
  std::vector<std::string_view> fields;
  for (;;) {
    auto const pos{ text.find(delimiter) };
    fields.push_back(text.substr(0, pos));
    if (pos == std::string_view::npos) { break; }
    text.remove_prefix(pos + 1);
  }
  return fields;
}

std::string util_join(std::vector<std::string> const &parts, std::string_view separator) {
  std::string result;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i > 0) { result.append(separator); }
    result.append(parts[i]);
  }
  return result;
}

}  // namespace depconf
