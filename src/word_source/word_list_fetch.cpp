#include "word_list_fetch.hpp"

#include <curl/curl.h>

#include <fstream>
#include <stdexcept>
#include <system_error>

// --------------------
// libcurl: write callback
// --------------------
static size_t write_to_file(void *ptr, size_t size, size_t nmemb, void *stream)
{
    std::ofstream *out = static_cast<std::ofstream *>(stream);
    const size_t bytes = size * nmemb;
    out->write(static_cast<const char *>(ptr), static_cast<std::streamsize>(bytes));
    return out->good() ? bytes : 0;
}

static std::filesystem::path partial_path(const std::filesystem::path &out_path)
{
    std::filesystem::path p = out_path;
    p += ".part";
    return p;
}

static void discard_partial(const std::filesystem::path &p)
{
    std::error_code ec;
    std::filesystem::remove(p, ec);
}

// The body lands in "<out_path>.part" and is renamed over out_path only once
// the transfer and status check succeed, so a failed fetch never leaves a
// file that later looks like a finished word list.
void downloadWordList(const std::string &url, const std::filesystem::path &out_path)
{
    CURL *curl = curl_easy_init();
    if (!curl)
        throw std::runtime_error("curl_easy_init failed");

    if (out_path.has_parent_path())
        std::filesystem::create_directories(out_path.parent_path());

    const std::filesystem::path tmp_path = partial_path(out_path);
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        curl_easy_cleanup(curl);
        throw std::runtime_error("Failed to open output file: " + tmp_path.string());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);

    const CURLcode res = curl_easy_perform(curl);

    // stays 0 for protocols without a status line (file://)
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_easy_cleanup(curl);
    out.close();

    if (res != CURLE_OK)
    {
        discard_partial(tmp_path);
        throw std::runtime_error(std::string("Download failed: ") + curl_easy_strerror(res));
    }
    if (http_code != 0 && (http_code < 200 || http_code >= 300))
    {
        discard_partial(tmp_path);
        throw std::runtime_error("HTTP error " + std::to_string(http_code) + ": " + url);
    }
    if (!out)
    {
        discard_partial(tmp_path);
        throw std::runtime_error("Failed to write output file: " + tmp_path.string());
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, out_path, ec);
    if (ec)
    {
        discard_partial(tmp_path);
        throw std::runtime_error("Failed to move " + tmp_path.string() + " to " +
                                 out_path.string() + ": " + ec.message());
    }
}

bool fileExistsNonEmpty(const std::filesystem::path &p)
{
    if (!std::filesystem::exists(p))
        return false;
    std::error_code ec;
    const auto sz = std::filesystem::file_size(p, ec);
    return (!ec && sz > 0);
}
