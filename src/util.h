#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace depconf {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as a string.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_file(std::filesystem::path const &path);

// Split on every occurrence of `delimiter`; empty fields are kept.
// "a::b" -> {"a", "", "b"}
std::vector<std::string_view> util_split(std::string_view text, char delimiter);

// Join with `separator` between elements: {"a","b"}, ", " -> "a, b"
std::string util_join(std::vector<std::string> const &parts, std::string_view separator);

}  // namespace depconf
