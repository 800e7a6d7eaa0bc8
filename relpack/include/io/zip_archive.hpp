#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace relpack::io {

struct ZipEntryInfo {
    std::string name;
    std::uint64_t size = 0;
    std::uint32_t crc32 = 0;
    bool compressed = false;
};

std::uint32_t crc32Of(const std::string &data);

// Owns a miniz writer; an archive that is never finalized is closed and left
// for the caller to delete.
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter &) = delete;
    ZipWriter &operator=(const ZipWriter &) = delete;

    bool open(const std::filesystem::path &path, std::string &error);
    // level 0 stores the entry uncompressed.
    bool addEntry(
        const std::string &name,
        const std::string &data,
        int level,
        std::time_t modified,
        std::string &error
    );
    bool finalize(std::string &error);
    void close();

    bool isOpen() const { return open_; }

private:
    struct State;
    std::unique_ptr<State> state_;
    bool open_ = false;
};

bool listZipEntries(const std::filesystem::path &archive, std::vector<ZipEntryInfo> &entries, std::string &error);
bool readZipEntry(
    const std::filesystem::path &archive,
    const std::string &name,
    std::string &data,
    std::string &error
);

} // namespace relpack::io
