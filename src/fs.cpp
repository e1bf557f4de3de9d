#include "fs.h"
#include "logger.h"
#include <cstdio>
#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

namespace peerwire {

bool file_exists(const std::string& path) {
    return access(path.c_str(), F_OK) == 0;
}

int64_t get_file_size(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return st.st_size;
    }
    return -1;
}

bool read_file_text(const std::string& path, std::string& out) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_ERROR("FS", "Failed to open file: " << path << " (" << strerror(errno) << ")");
        return false;
    }

    out.clear();
    char chunk[8192];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        out.append(chunk, n);
    }

    bool ok = ferror(file) == 0;
    fclose(file);

    if (!ok) {
        LOG_ERROR("FS", "Failed to read file: " << path);
    }
    return ok;
}

bool write_file_text(const std::string& path, const std::string& content) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("FS", "Failed to create file: " << path << " (" << strerror(errno) << ")");
        return false;
    }

    size_t written = fwrite(content.data(), 1, content.size(), file);
    fclose(file);

    if (written != content.size()) {
        LOG_ERROR("FS", "Failed to write complete content to file: " << path);
        return false;
    }
    return true;
}

bool read_file_binary(const std::string& path, std::vector<uint8_t>& out) {
    int64_t size = get_file_size(path);
    if (size < 0) {
        LOG_ERROR("FS", "Cannot stat file: " << path);
        return false;
    }

    out.resize(static_cast<size_t>(size));
    if (size == 0) {
        return true;
    }
    return read_file_chunk(path, 0, out.data(), out.size());
}

bool read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        LOG_ERROR("FS", "Failed to open file for reading: " << path << " (" << strerror(errno) << ")");
        return false;
    }

    uint8_t* dst = static_cast<uint8_t*>(buffer);
    size_t done = 0;
    while (done < size) {
        ssize_t n = pread(fd, dst + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            LOG_ERROR("FS", "Short read from " << path << " at offset " << (offset + done));
            close(fd);
            return false;
        }
        done += static_cast<size_t>(n);
    }

    close(fd);
    return true;
}

bool write_file_chunk(const std::string& path, uint64_t offset, const void* data, size_t size) {
    int fd = open(path.c_str(), O_WRONLY);
    if (fd < 0) {
        LOG_ERROR("FS", "Failed to open file for writing: " << path << " (" << strerror(errno) << ")");
        return false;
    }

    const uint8_t* src = static_cast<const uint8_t*>(data);
    size_t done = 0;
    while (done < size) {
        ssize_t n = pwrite(fd, src + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            LOG_ERROR("FS", "Short write to " << path << " at offset " << (offset + done));
            close(fd);
            return false;
        }
        done += static_cast<size_t>(n);
    }

    bool ok = fsync(fd) == 0;
    close(fd);

    if (!ok) {
        LOG_ERROR("FS", "fsync failed for " << path);
    }
    return ok;
}

bool create_file_with_size(const std::string& path, uint64_t size) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        LOG_ERROR("FS", "Failed to create file: " << path << " (" << strerror(errno) << ")");
        return false;
    }

    bool ok = ftruncate(fd, static_cast<off_t>(size)) == 0;
    close(fd);

    if (!ok) {
        LOG_ERROR("FS", "Failed to size file " << path << " to " << size << " bytes");
    }
    return ok;
}

bool delete_file(const std::string& path) {
    return unlink(path.c_str()) == 0;
}

} // namespace peerwire
