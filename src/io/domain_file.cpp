#include "krazedb/io/domain_file.h"

#include <filesystem>
#include <fstream>

namespace krazedb::io {

core::Result<std::vector<std::string>, std::string> read_domain_lines(const std::string& path) {
  using R = core::Result<std::vector<std::string>, std::string>;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return R::err("File " + path + " does not exist");
  }

  std::ifstream in(path);
  if (!in) {
    return R::err("Failed to read file " + path);
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    line.clear();
  }

  if (in.bad()) {
    return R::err("Failed to read file " + path);
  }
  return R::ok(std::move(lines));
}

core::Result<bool, std::string> write_text_file(const std::string& path,
                                                const std::string& content) {
  std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out) {
    return core::Result<bool, std::string>::err("Failed to open " + path + " for writing");
  }

  out << content;
  out.flush();
  if (!out) {
    return core::Result<bool, std::string>::err("Failed to write " + path);
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace krazedb::io
