#pragma once
#include <string>
#include <vector>

namespace peq {

void ensure_dir(const std::string& path);
bool is_http_url(const std::string& s);
// Local file name for a download: last path segment of `url` without
// query or fragment, `fallback` when there is none, ".h5" appended when
// the name has no extension.
std::string local_filename_for(const std::string& url, const std::string& fallback = "input.h5");
std::string to_lower(std::string s);
// "3,-1.5,0" -> {3, -1.5, 0}. Throws std::invalid_argument on a bad item.
std::vector<double> parse_double_list(const std::string& s);

} // namespace peq
