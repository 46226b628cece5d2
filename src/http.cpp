#include "peq/http.hpp"
#include "peq/util.hpp"

#include <curl/curl.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace peq {

namespace {

struct CurlGlobal {
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl global init failed");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

class CurlHandle: public std::unique_ptr<CURL, void(*)(CURL*)>
{
protected:
    typedef std::unique_ptr<CURL, void(*)(CURL*)> Base;
public:
    CurlHandle(): Base(curl_easy_init(), [](CURL* c) { if (c) curl_easy_cleanup(c); }) {}
};

size_t write_to_stream(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto& os = *static_cast<std::ofstream*>(userdata);
    const size_t n = size * nmemb;
    os.write(ptr, static_cast<std::streamsize>(n));
    return os ? n : 0;
}

} // namespace

std::string HttpClient::download_to(const std::string& url, const std::string& outdir) const {
    ensure_dir(outdir);
    const std::string outpath = outdir + "/" + local_filename_for(url);
    const std::string partpath = outpath + ".part";

    CurlGlobal global;
    CurlHandle curl;
    if (!curl) throw std::runtime_error("curl init failed");

    CURLcode res;
    long code = 0;
    char errbuf[CURL_ERROR_SIZE] = {0};
    {
        std::ofstream sink(partpath, std::ios::binary | std::ios::trunc);
        if (!sink) throw std::runtime_error("cannot open output file: " + partpath);

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "peq-render/1.0");

        res = curl_easy_perform(curl.get());
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    }

    if (res != CURLE_OK || code >= 400) {
        std::remove(partpath.c_str());
        const std::string why = errbuf[0] ? errbuf : curl_easy_strerror(res);
        throw std::runtime_error("download failed (" + url + ", HTTP " + std::to_string(code) + "): " + why);
    }
    std::remove(outpath.c_str());
    if (std::rename(partpath.c_str(), outpath.c_str()) != 0) {
        std::remove(partpath.c_str());
        throw std::runtime_error("cannot move download into place: " + outpath);
    }

    std::cout << "✓ Downloaded: " << outpath << "\n";
    return outpath;
}

} // namespace peq
