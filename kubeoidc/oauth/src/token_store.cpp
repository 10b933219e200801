#include "token_store.h"
#include "oauth_errors.h"
#include "pkce_helper.h"
#include <uuid/uuid.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

namespace kubeoidc {
namespace oauth {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

std::string hex_encode(const std::string& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        hex += digits[c >> 4];
        hex += digits[c & 0x0F];
    }
    return hex;
}

std::string unique_suffix() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

/**
 * Advisory flock held for the lifetime of the object
 */
class DirectoryLock {
public:
    DirectoryLock(const std::string& directory, int operation)
        : path_(directory + "/.lock") {
        fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            throw CacheError("cannot open lock file: " + errno_text(), path_);
        }
        while (flock(fd_, operation) != 0) {
            if (errno != EINTR) {
                std::string reason = errno_text();
                ::close(fd_);
                throw CacheError("cannot lock: " + reason, path_);
            }
        }
    }

    ~DirectoryLock() {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    DirectoryLock(const DirectoryLock&) = delete;
    DirectoryLock& operator=(const DirectoryLock&) = delete;

private:
    std::string path_;
    int fd_ = -1;
};

std::optional<json> read_record(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw CacheError("cannot open for reading", path);
    }

    json record = json::parse(file, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        throw CacheError("corrupt record", path);
    }
    return record;
}

void write_fully(int fd, const std::string& data, const std::string& path) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw CacheError("write failed: " + errno_text(), path);
        }
        written += static_cast<size_t>(n);
    }
}

} // namespace

FileTokenBackend::FileTokenBackend(const std::string& directory) : directory_(directory) {
}

std::string FileTokenBackend::path_for(const std::string& key) const {
    return directory_ + "/" + hex_encode(PKCEHelper::sha256(key)) + ".json";
}

void FileTokenBackend::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw CacheError("cannot create directory: " + ec.message(), directory_);
    }
    if (::chmod(directory_.c_str(), 0700) != 0) {
        throw CacheError("cannot restrict directory permissions: " + errno_text(), directory_);
    }
}

std::optional<json> FileTokenBackend::read(const std::string& key) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return std::nullopt;
    }

    DirectoryLock lock(directory_, LOCK_SH);
    return read_record(path_for(key));
}

void FileTokenBackend::write(const std::string& key, const json& record) {
    ensure_directory();

    json stored = record;
    stored["key"] = key;
    const std::string data = stored.dump(2);

    const std::string target = path_for(key);
    const std::string temp = target + "." + unique_suffix() + ".tmp";

    DirectoryLock lock(directory_, LOCK_EX);

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw CacheError("cannot create temporary file: " + errno_text(), temp);
    }

    try {
        write_fully(fd, data, temp);
        if (::fsync(fd) != 0) {
            throw CacheError("fsync failed: " + errno_text(), temp);
        }
    } catch (const CacheError&) {
        ::close(fd);
        ::unlink(temp.c_str());
        throw;
    }

    if (::close(fd) != 0) {
        std::string reason = errno_text();
        ::unlink(temp.c_str());
        throw CacheError("close failed: " + reason, temp);
    }

    if (::rename(temp.c_str(), target.c_str()) != 0) {
        std::string reason = errno_text();
        ::unlink(temp.c_str());
        throw CacheError("rename failed: " + reason, target);
    }
}

void FileTokenBackend::remove(const std::string& key) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return;
    }

    DirectoryLock lock(directory_, LOCK_EX);
    const std::string path = path_for(key);
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        throw CacheError("cannot delete: " + errno_text(), path);
    }
}

std::vector<std::string> FileTokenBackend::keys() {
    std::vector<std::string> result;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return result;
    }

    DirectoryLock lock(directory_, LOCK_SH);
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        try {
            auto record = read_record(entry.path().string());
            if (record && record->contains("key") && (*record)["key"].is_string()) {
                result.push_back((*record)["key"].get<std::string>());
            }
        } catch (const CacheError& e) {
            std::cerr << "Skipping unreadable cache file: " << e.what() << std::endl;
        }
    }
    if (ec) {
        throw CacheError("cannot list directory: " + ec.message(), directory_);
    }

    return result;
}

} // namespace oauth
} // namespace kubeoidc
