#include "scadhost/assets/asset_resolver.h"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace scadhost {
namespace assets {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); i++) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hexValue(input[i + 1]);
            int lo = hexValue(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += input[i];
    }
    return out;
}

// "scheme://rest" -> "rest"; plain paths are returned unchanged
std::string stripScheme(const std::string& request) {
    size_t sep = request.find("://");
    if (sep == std::string::npos || sep == 0) {
        return request;
    }
    for (size_t i = 0; i < sep; i++) {
        char c = request[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return request;
        }
    }
    return request.substr(sep + 3);
}

bool readWholeFile(const fs::path& path, std::vector<uint8_t>& out, std::string& error) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        error = "Failed to open " + path.string() + ": " + std::strerror(errno);
        return false;
    }

    std::streamoff size = file.tellg();
    if (size < 0) {
        error = "Failed to size " + path.string();
        return false;
    }
    file.seekg(0, std::ios::beg);

    out.resize(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(out.data()), size)) {
        error = "Failed to read " + path.string();
        out.clear();
        return false;
    }
    return true;
}

} // anonymous namespace

AssetResolver::AssetResolver(std::vector<std::string> searchDirs)
    : searchDirs_(std::move(searchDirs)) {}

std::string AssetResolver::resourceName(const std::string& request) {
    std::string path = stripScheme(request);

    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }

    for (auto& c : path) {
        if (c == '\\') c = '/';
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    size_t slash = path.find_last_of('/');
    std::string name = percentDecode(slash == std::string::npos ? path : path.substr(slash + 1));

    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
        name.find('\0') != std::string::npos) {
        return "";
    }
    return name;
}

AssetLookup AssetResolver::lookup(const std::string& request) const {
    AssetLookup result;
    result.request = request;
    result.name = resourceName(request);

    if (result.name.empty()) {
        std::cerr << "[Assets] Unservable request: \"" << request << "\"" << std::endl;
        return result;
    }

    for (const auto& dir : searchDirs_) {
        fs::path candidate = fs::path(dir) / result.name;
        result.candidates.push_back(candidate.string());

        std::error_code ec;
        fs::file_status status = fs::status(candidate, ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
                continue;
            }
            result.status = LookupStatus::IoError;
            result.path = candidate.string();
            result.error = "Cannot stat " + candidate.string() + ": " + ec.message();
            std::cerr << "[Assets] " << result.error << std::endl;
            return result;
        }
        if (!fs::is_regular_file(status)) {
            continue;
        }

        result.path = candidate.string();
        if (!readWholeFile(candidate, result.bytes, result.error)) {
            result.status = LookupStatus::IoError;
            std::cerr << "[Assets] " << result.error << std::endl;
            return result;
        }

        result.status = LookupStatus::Found;
        if (verbose_) {
            std::cout << "[Assets] " << request << " -> " << result.path
                      << " (" << result.bytes.size() << " bytes)" << std::endl;
        }
        return result;
    }

    std::cerr << "[Assets] Not found: " << result.name << " (tried:";
    for (const auto& candidate : result.candidates) {
        std::cerr << " " << candidate;
    }
    std::cerr << ")" << std::endl;
    return result;
}

} // namespace assets
} // namespace scadhost
