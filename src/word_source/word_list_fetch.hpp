#pragma once
#include <filesystem>
#include <string>

// Downloads url into out_path with libcurl, creating parent directories.
// Throws std::runtime_error on transfer failure or a non-2xx HTTP status;
// out_path is then left as it was before the call.
void downloadWordList(const std::string &url, const std::filesystem::path &out_path);

bool fileExistsNonEmpty(const std::filesystem::path &p);
