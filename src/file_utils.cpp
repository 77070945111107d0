#include "file_utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include "errors.hpp"

namespace gitport {

// Input chunk for EVP_EncodeBlock: a multiple of 3 so only the final chunk pads.
static constexpr size_t kEncodeChunk = 3 * 1024 * 1024;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_visible_yaml(const std::string& name) {
    if (name.empty() || name[0] == '.')
        return false;
    return ends_with(name, ".yaml") || ends_with(name, ".yml");
}

std::vector<std::string> list_files(const fs::path& root,
                                    const std::optional<std::string>& subpath) {
    fs::path dir = root;
    if (subpath && !subpath->empty())
        dir /= *subpath;

    std::error_code ec;
    if (!fs::exists(dir, ec))
        throw Error::file_not_found(dir.string());
    if (!fs::is_directory(dir, ec))
        throw Error::io("not a directory: " + dir.string());

    std::vector<std::string> files;
    fs::directory_iterator it(dir, ec);
    if (ec)
        throw Error::io(dir.string() + ": " + ec.message());
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec)
            throw Error::io(dir.string() + ": " + ec.message());
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;
        std::string name = it->path().filename().string();
        if (is_visible_yaml(name))
            files.push_back(std::move(name));
    }
    if (ec)
        throw Error::io(dir.string() + ": " + ec.message());
    std::sort(files.begin(), files.end());
    return files;
}

std::string read_file(const fs::path& root, const std::string& file) {
    const fs::path path = root / file;
    std::error_code ec;
    if (!fs::exists(path, ec))
        throw Error::file_not_found(path.string());
    if (!fs::is_regular_file(path, ec))
        throw Error::io("not a regular file: " + path.string());

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        throw Error::io(path.string() + ": " + std::strerror(errno));
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        throw Error::io(path.string() + ": read failed");
    return base64_encode(content);
}

std::string base64_encode(const std::string& bytes) {
    std::string out;
    out.reserve(4 * ((bytes.size() + 2) / 3));
    std::vector<unsigned char> buf(4 * (kEncodeChunk / 3) + 1);
    const auto* src = reinterpret_cast<const unsigned char*>(bytes.data());
    for (size_t off = 0; off < bytes.size(); off += kEncodeChunk) {
        size_t n = std::min(kEncodeChunk, bytes.size() - off);
        int written = EVP_EncodeBlock(buf.data(), src + off, static_cast<int>(n));
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(written));
    }
    return out;
}

std::optional<std::string> base64_decode(const std::string& text) {
    if (text.empty())
        return std::string();
    if (text.size() % 4 != 0 || text.size() > static_cast<size_t>(INT32_MAX))
        return std::nullopt;
    std::vector<unsigned char> buf(3 * (text.size() / 4) + 1);
    int n = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0)
        return std::nullopt;
    // EVP_DecodeBlock counts padding as zero bytes.
    size_t pad = 0;
    if (text[text.size() - 1] == '=')
        ++pad;
    if (text[text.size() - 2] == '=')
        ++pad;
    return std::string(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n) - pad);
}

} // namespace gitport
