#include "Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace lanwatch::config
{
    std::string ResolveDataDirectory()
    {
        std::filesystem::path dir;

        if (const char *explicit_dir = std::getenv(DATA_DIR_ENV); explicit_dir && *explicit_dir)
            dir = explicit_dir;
        else if (const char *xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
            dir = std::filesystem::path(xdg) / "lanwatch";
        else if (const char *home = std::getenv("HOME"); home && *home)
            dir = std::filesystem::path(home) / DATA_DIR_NAME;
        else
            dir = DATA_DIR_NAME;

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            std::cerr << "[Config] Cannot create data directory " << dir << ": " << ec.message() << "\n";

        return dir.string();
    }
}
