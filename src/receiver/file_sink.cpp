#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "receiver/file_sink.hpp"
#include "util/log.hpp"

namespace receiver
{

std::string safe_file_name(const std::string &name)
{
    // last path component only, either separator style
    const auto  slash = name.find_last_of("/\\");
    std::string base  = slash == std::string::npos ? name : name.substr(slash + 1);
    if (base.find('\0') != std::string::npos)
        return {};
    if (base == "." || base == "..")
        return {};
    return base;
}

bool DirectorySink::write_file(const std::string               &name,
                               const std::vector<std::uint8_t> &bytes,
                               std::string                     &err)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec)
    {
        err = "create_directories(" + dir_ + "): " + ec.message();
        return false;
    }

    const fs::path final_path = fs::path(dir_) / name;
    const fs::path tmp_path   = fs::path(dir_) / ("." + name + ".part");
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            err = "open " + tmp_path.string() + ": " + std::strerror(errno);
            return false;
        }
        if (!bytes.empty())
            out.write(reinterpret_cast<const char *>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out)
        {
            err = "write " + tmp_path.string() + " failed";
            fs::remove(tmp_path, ec);
            return false;
        }
    }

    fs::rename(tmp_path, final_path, ec);
    if (ec)
    {
        err = "rename to " + final_path.string() + ": " + ec.message();
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return false;
    }
    LOG_DEBUG("wrote %zu bytes to %s", bytes.size(), final_path.c_str());
    return true;
}

}  // namespace receiver
