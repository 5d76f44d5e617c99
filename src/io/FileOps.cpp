#include "io/FileOps.h"

#include <system_error>

namespace gw2util::io {

using core::ErrorKind;
using core::Status;

bool Exists(const fs::path& p) noexcept
{
    std::error_code ec;
    const bool exists = fs::exists(p, ec);
    if (ec)
        return true;
    return exists;
}

Status Copy(const fs::path& src, const fs::path& dst)
{
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec)
        return Status::Fail(ErrorKind::IOError, "copy " + src.string() + " -> " + dst.string(), ec);
    return Status::Ok();
}

Status Rename(const fs::path& from, const fs::path& to)
{
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec)
        return Status::Fail(ErrorKind::IOError, "rename " + from.string() + " -> " + to.string(), ec);
    return Status::Ok();
}

Status Remove(const fs::path& p)
{
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec)
        return Status::Fail(ErrorKind::IOError, "remove " + p.string(), ec);
    return Status::Ok();
}

Status EnsureDirectory(const fs::path& dir)
{
    if (dir.empty())
        return Status::Ok();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        return Status::Fail(ErrorKind::IOError, "create directory " + dir.string(), ec);
    return Status::Ok();
}

} // namespace gw2util::io
