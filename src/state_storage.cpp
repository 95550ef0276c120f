#include "state_storage.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace sr {

FileStateStorage::FileStateStorage(std::string path) : path_(std::move(path)) {
    if (path_.empty()) {
        throw std::invalid_argument("state storage path must not be empty");
    }
}

std::optional<std::string> FileStateStorage::load() const {
    errno = 0;
    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs) {
        // Only a missing file means "no state yet"; anything else must not invite a re-init.
        if (errno == ENOENT) {
            return std::nullopt;
        }
        std::string reason = errno != 0 ? std::strerror(errno) : "unknown error";
        throw std::runtime_error("Unable to open state file " + path_ + ": " + reason);
    }
    std::string blob((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw std::runtime_error("Unable to read state file: " + path_);
    }
    return blob;
}

void FileStateStorage::save(const std::string& blob) {
    const std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream ofs(tmpPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Unable to open state file for writing: " + tmpPath);
        }
        ofs.write(blob.data(), static_cast<std::streamsize>(blob.size()));
        ofs.close();
        if (!ofs) {
            std::remove(tmpPath.c_str());
            throw std::runtime_error("Unable to write state file: " + tmpPath);
        }
    }
    if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        std::remove(tmpPath.c_str());
        throw std::runtime_error("Unable to replace state file " + path_ + ": " + reason);
    }
}

} // namespace sr
