#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>

namespace middle_server {
namespace relay {

// Producer of raw PCM bytes for a relay session.
class PcmSource {
   public:
    virtual ~PcmSource() = default;

    // Reads up to @p maxBytes. Returns bytes read, 0 at end of stream, -1 on error.
    virtual ssize_t read(std::uint8_t *dst, std::size_t maxBytes) = 0;
};

// Outbound endpoint of a relay session. The transport behind it is not the
// session's concern; it only needs to know whether a send went through.
class PcmChunkSink {
   public:
    virtual ~PcmChunkSink() = default;

    virtual bool sendText(const std::string &line) = 0;
    virtual bool sendChunk(const std::uint8_t *data, std::size_t size) = 0;
    virtual void close() {}
};

// Reads from a file descriptor ("-" opens stdin).
class FdPcmSource : public PcmSource {
   public:
    explicit FdPcmSource(int fd, bool ownsFd);
    ~FdPcmSource() override;

    FdPcmSource(const FdPcmSource &) = delete;
    FdPcmSource &operator=(const FdPcmSource &) = delete;

    static std::unique_ptr<FdPcmSource> open(const std::string &path, std::string &error);

    ssize_t read(std::uint8_t *dst, std::size_t maxBytes) override;

   private:
    int fd_{-1};
    bool ownsFd_{false};
};

// Writes the announcement line (newline terminated) and raw chunks to a file
// descriptor ("-" is stdout).
class FdChunkSink : public PcmChunkSink {
   public:
    explicit FdChunkSink(int fd, bool ownsFd);
    ~FdChunkSink() override;

    FdChunkSink(const FdChunkSink &) = delete;
    FdChunkSink &operator=(const FdChunkSink &) = delete;

    static std::unique_ptr<FdChunkSink> open(const std::string &path, std::string &error);

    bool sendText(const std::string &line) override;
    bool sendChunk(const std::uint8_t *data, std::size_t size) override;
    void close() override;

   private:
    bool writeAll(const std::uint8_t *data, std::size_t size);

    int fd_{-1};
    bool ownsFd_{false};
};

// Discards everything. Used to measure the relay without an output.
class NullChunkSink : public PcmChunkSink {
   public:
    bool sendText(const std::string & /*line*/) override {
        return true;
    }
    bool sendChunk(const std::uint8_t * /*data*/, std::size_t /*size*/) override {
        return true;
    }
};

// "-" -> stdout, "null" -> NullChunkSink, anything else -> file (truncated).
std::unique_ptr<PcmChunkSink> makeChunkSink(const std::string &target, std::string &error);

}  // namespace relay
}  // namespace middle_server
