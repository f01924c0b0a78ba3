#include "relay/pcm_endpoints.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace middle_server {
namespace relay {

FdPcmSource::FdPcmSource(int fd, bool ownsFd) : fd_(fd), ownsFd_(ownsFd) {}

FdPcmSource::~FdPcmSource() {
    if (ownsFd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<FdPcmSource> FdPcmSource::open(const std::string &path, std::string &error) {
    if (path == "-") {
        return std::make_unique<FdPcmSource>(STDIN_FILENO, false);
    }
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        error = "open(" + path + "): " + std::strerror(errno);
        return nullptr;
    }
    return std::make_unique<FdPcmSource>(fd, true);
}

ssize_t FdPcmSource::read(std::uint8_t *dst, std::size_t maxBytes) {
    while (true) {
        ssize_t n = ::read(fd_, dst, maxBytes);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            LOG_ERROR("[FdPcmSource] read: {}", std::strerror(errno));
            return -1;
        }
        return n;
    }
}

FdChunkSink::FdChunkSink(int fd, bool ownsFd) : fd_(fd), ownsFd_(ownsFd) {}

FdChunkSink::~FdChunkSink() {
    close();
}

std::unique_ptr<FdChunkSink> FdChunkSink::open(const std::string &path, std::string &error) {
    if (path == "-") {
        return std::make_unique<FdChunkSink>(STDOUT_FILENO, false);
    }
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "open(" + path + "): " + std::strerror(errno);
        return nullptr;
    }
    return std::make_unique<FdChunkSink>(fd, true);
}

bool FdChunkSink::writeAll(const std::uint8_t *data, std::size_t size) {
    if (fd_ < 0) {
        LOG_ONCE(WARN, "[FdChunkSink] write after close ignored");
        return false;
    }
    std::size_t offset = 0;
    while (offset < size) {
        ssize_t n = ::write(fd_, data + offset, size - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[FdChunkSink] write: {}", std::strerror(errno));
            return false;
        }
        offset += static_cast<std::size_t>(n);
    }
    return true;
}

bool FdChunkSink::sendText(const std::string &line) {
    std::string framed = line;
    framed.push_back('\n');
    return writeAll(reinterpret_cast<const std::uint8_t *>(framed.data()), framed.size());
}

bool FdChunkSink::sendChunk(const std::uint8_t *data, std::size_t size) {
    return writeAll(data, size);
}

void FdChunkSink::close() {
    if (fd_ < 0) {
        return;
    }
    if (ownsFd_) {
        if (::close(fd_) < 0) {
            LOG_WARN("[FdChunkSink] close: {}", std::strerror(errno));
        }
    }
    fd_ = -1;
}

std::unique_ptr<PcmChunkSink> makeChunkSink(const std::string &target, std::string &error) {
    if (target == "null") {
        return std::make_unique<NullChunkSink>();
    }
    return FdChunkSink::open(target, error);
}

}  // namespace relay
}  // namespace middle_server
