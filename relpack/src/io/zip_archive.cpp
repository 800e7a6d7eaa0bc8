#include "io/zip_archive.hpp"

#include <cstring>

#include "miniz.h"

namespace fs = std::filesystem;

namespace relpack::io
{
    namespace
    {

        std::string zipError(mz_zip_archive &zip)
        {
            return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
        }

        // Closes the reader on every exit path.
        class ZipReader
        {
        public:
            ZipReader()
            {
                std::memset(&zip_, 0, sizeof(zip_));
            }

            ~ZipReader()
            {
                if (open_)
                {
                    mz_zip_reader_end(&zip_);
                }
            }

            ZipReader(const ZipReader &) = delete;
            ZipReader &operator=(const ZipReader &) = delete;

            bool open(const fs::path &archive, std::string &error)
            {
                if (!mz_zip_reader_init_file(&zip_, archive.string().c_str(), 0))
                {
                    error = "cannot open archive " + archive.string() + ": " + zipError(zip_);
                    return false;
                }
                open_ = true;
                return true;
            }

            mz_zip_archive &get() { return zip_; }

        private:
            mz_zip_archive zip_;
            bool open_ = false;
        };

    } // namespace

    std::uint32_t crc32Of(const std::string &data)
    {
        return static_cast<std::uint32_t>(
            mz_crc32(MZ_CRC32_INIT, reinterpret_cast<const unsigned char *>(data.data()), data.size()));
    }

    struct ZipWriter::State
    {
        mz_zip_archive zip;
        fs::path path;
    };

    ZipWriter::ZipWriter() : state_(std::make_unique<State>())
    {
        std::memset(&state_->zip, 0, sizeof(state_->zip));
    }

    ZipWriter::~ZipWriter()
    {
        close();
    }

    bool ZipWriter::open(const fs::path &path, std::string &error)
    {
        close();
        std::memset(&state_->zip, 0, sizeof(state_->zip));
        state_->path = path;
        if (!mz_zip_writer_init_file(&state_->zip, path.string().c_str(), 0))
        {
            error = "cannot create archive " + path.string() + ": " + zipError(state_->zip);
            return false;
        }
        open_ = true;
        return true;
    }

    bool ZipWriter::addEntry(
        const std::string &name,
        const std::string &data,
        int level,
        std::time_t modified,
        std::string &error)
    {
        if (!open_)
        {
            error = "archive is not open";
            return false;
        }

        MZ_TIME_T stamp = modified;
        const mz_bool ok = mz_zip_writer_add_mem_ex_v2(
            &state_->zip,
            name.c_str(),
            data.data(),
            data.size(),
            nullptr,
            0,
            static_cast<mz_uint>(level),
            0,
            0,
            &stamp,
            nullptr,
            0,
            nullptr,
            0);
        if (!ok)
        {
            error = "cannot add " + name + " to " + state_->path.string() + ": " + zipError(state_->zip);
            return false;
        }
        return true;
    }

    bool ZipWriter::finalize(std::string &error)
    {
        if (!open_)
        {
            error = "archive is not open";
            return false;
        }

        const bool finalized = mz_zip_writer_finalize_archive(&state_->zip) != 0;
        if (!finalized)
        {
            error = "cannot finalize " + state_->path.string() + ": " + zipError(state_->zip);
        }
        const bool ended = mz_zip_writer_end(&state_->zip) != 0;
        open_ = false;
        if (finalized && !ended)
        {
            error = "cannot close " + state_->path.string();
        }
        return finalized && ended;
    }

    void ZipWriter::close()
    {
        if (!open_)
        {
            return;
        }
        mz_zip_writer_end(&state_->zip);
        open_ = false;
    }

    bool listZipEntries(const fs::path &archive, std::vector<ZipEntryInfo> &entries, std::string &error)
    {
        ZipReader reader;
        if (!reader.open(archive, error))
        {
            return false;
        }

        entries.clear();
        const mz_uint count = mz_zip_reader_get_num_files(&reader.get());
        entries.reserve(count);
        for (mz_uint i = 0; i < count; ++i)
        {
            mz_zip_archive_file_stat st;
            if (!mz_zip_reader_file_stat(&reader.get(), i, &st))
            {
                error = "cannot stat entry " + std::to_string(i) + " of " + archive.string();
                return false;
            }

            ZipEntryInfo info;
            info.name = st.m_filename;
            info.size = st.m_uncomp_size;
            info.crc32 = st.m_crc32;
            info.compressed = st.m_method != 0;
            entries.push_back(info);
        }
        return true;
    }

    bool readZipEntry(const fs::path &archive, const std::string &name, std::string &data, std::string &error)
    {
        ZipReader reader;
        if (!reader.open(archive, error))
        {
            return false;
        }

        size_t size = 0;
        void *heap = mz_zip_reader_extract_file_to_heap(&reader.get(), name.c_str(), &size, 0);
        if (heap == nullptr)
        {
            error = "cannot extract " + name + " from " + archive.string() + ": " + zipError(reader.get());
            return false;
        }
        data.assign(static_cast<const char *>(heap), size);
        mz_free(heap);
        return true;
    }

} // namespace relpack::io
