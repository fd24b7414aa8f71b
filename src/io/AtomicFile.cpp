// src/io/AtomicFile.cpp
#include "eldritch/io/AtomicFile.h"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace eldritch::io {

namespace {

void set_err(std::string* err, std::string msg)
{
    if (err)
        *err = std::move(msg);
}

fs::path temp_sibling(const fs::path& final_path)
{
    fs::path tmp = final_path;
    tmp += ".tmp";
    return tmp;
}

} // namespace

bool write_atomic(const fs::path& final_path, const std::string& bytes, std::string* err, bool make_backup)
{
    std::error_code ec;

    if (final_path.has_parent_path())
    {
        fs::create_directories(final_path.parent_path(), ec);
        if (ec)
        {
            set_err(err, "create_directories failed for '" + final_path.parent_path().string() + "': " + ec.message());
            return false;
        }
    }

    const fs::path tmp = temp_sibling(final_path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            set_err(err, "cannot open temp file '" + tmp.string() + "'");
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            set_err(err, "write failed for '" + tmp.string() + "'");
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    if (make_backup && fs::exists(final_path, ec))
    {
        fs::path bak = final_path;
        bak += ".bak";
        fs::copy_file(final_path, bak, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            set_err(err, "backup failed for '" + final_path.string() + "': " + ec.message());
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, final_path, ec);
    if (ec)
    {
        set_err(err, "rename '" + tmp.string() + "' -> '" + final_path.string() + "' failed: " + ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

bool read_all(const fs::path& path, std::string& out, std::string* err)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        set_err(err, "cannot open '" + path.string() + "'");
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
    {
        set_err(err, "read failed for '" + path.string() + "'");
        return false;
    }
    out = ss.str();
    return true;
}

} // namespace eldritch::io
