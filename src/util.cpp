#include "peq/util.hpp"
#include <sys/stat.h>
#ifdef _WIN32
  #include <direct.h>
#endif
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <string>

namespace peq {

void ensure_dir(const std::string& path) {
#ifdef _WIN32
    const int rc = _mkdir(path.c_str());
#else
    const int rc = ::mkdir(path.c_str(), 0755);
#endif
    if (rc != 0 && errno != EEXIST) {
        throw std::runtime_error("cannot create directory: " + path);
    }
}

bool is_http_url(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

std::string local_filename_for(const std::string& url, const std::string& fallback) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    const auto scheme = path.find("://");
    if (scheme != std::string::npos) path.erase(0, scheme + 3);
    const auto slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? std::string() : path.substr(slash + 1);
    if (name.empty()) name = fallback;
    if (name.find('.') == std::string::npos) name += ".h5";
    return name;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<double> parse_double_list(const std::string& s) {
    std::vector<double> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::size_t used = 0;
        const double v = std::stod(item, &used);
        if (item.find_first_not_of(" \t", used) != std::string::npos) {
            throw std::invalid_argument("not a number: " + item);
        }
        out.push_back(v);
    }
    return out;
}

} // namespace peq
