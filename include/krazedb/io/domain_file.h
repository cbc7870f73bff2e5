#pragma once

#include "krazedb/core/result.h"

#include <string>
#include <vector>

namespace krazedb::io {

// read_domain_lines loads a newline-delimited domain list.
// Lines are returned untrimmed and in file order (blank lines included) so that line numbers
// in reports match the file; a trailing '\r' from CRLF files is stripped.
// Error: missing or unreadable file, with a message naming the path.
[[nodiscard]] core::Result<std::vector<std::string>, std::string> read_domain_lines(
    const std::string& path);

// write_text_file replaces the file at path with content.
[[nodiscard]] core::Result<bool, std::string> write_text_file(const std::string& path,
                                                              const std::string& content);

}  // namespace krazedb::io
