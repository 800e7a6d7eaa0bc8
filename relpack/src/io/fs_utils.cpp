#include "io/fs_utils.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace relpack::io
{

    bool ensureDir(const fs::path &path)
    {
        if (path.empty())
        {
            return true;
        }
        std::error_code ec;
        if (fs::exists(path, ec))
        {
            return fs::is_directory(path, ec);
        }
        return fs::create_directories(path, ec) && !ec;
    }

    bool removePath(const fs::path &path, bool dryRun, const relpack::Context &ctx)
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            return false;
        }

        if (dryRun)
        {
            ctx.log("Would remove: ", path.string());
            return true;
        }

        ctx.log("Remove: ", path.string());
        if (fs::is_directory(path, ec))
        {
            fs::remove_all(path, ec);
            if (ec)
            {
                ctx.error("Failed remove ", path.string(), " : ", ec.message());
                return false;
            }
            return true;
        }

        bool ok = fs::remove(path, ec);
        if (!ok || ec)
        {
            ctx.error("Failed remove ", path.string(), " : ", ec.message());
            return false;
        }
        return true;
    }

    bool readBinaryFile(const fs::path &path, std::string &out, std::string &error)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            error = "cannot open " + path.string();
            return false;
        }

        out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            error = "read failed for " + path.string();
            return false;
        }
        return true;
    }

    fs::path partialPathFor(const fs::path &output)
    {
        fs::path staged = output;
        staged += ".partial";
        return staged;
    }

    bool publishFile(const fs::path &staged, const fs::path &target, std::string &error)
    {
        std::error_code ec;
        fs::rename(staged, target, ec);
        if (ec)
        {
            error = "cannot move " + staged.string() + " to " + target.string() + ": " + ec.message();
            return false;
        }
        return true;
    }

} // namespace relpack::io
