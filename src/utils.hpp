#pragma once

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

#include <ryml.hpp>
#include <ryml_std.hpp>

template<class T>
using E = std::expected<T, std::string>;

template<class T>
inline bool getYamlValue(ryml::ConstNodeRef node, T& result)
{
    auto value = node.val();
    auto status = std::from_chars(value.begin(), value.end(), result);
    return status.ec == std::errc();
}

inline E<std::vector<char>> readFile(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    std::vector<char> content;
    content.assign(std::istreambuf_iterator<char>(f),
                   std::istreambuf_iterator<char>());
    if(f.bad() || !f.is_open())
    {
        return std::unexpected(std::format("Failed to read file {}", path.string()));
    }

    return content;
}

// Write the whole content to a sibling temporary file, then rename it
// over the target. Every call gets its own temporary file, so concurrent
// writers never interleave and the target always holds one complete
// content.
inline E<void> replaceFile(const std::filesystem::path& path,
                           std::string_view content)
{
    std::string tmpl = path.string() + ".XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');
    int fd = ::mkstemp(name.data());
    if(fd < 0)
    {
        return std::unexpected(
            std::format("Failed to create temporary file for {}",
                        path.string()));
    }
    ::close(fd);
    std::filesystem::path tmp(name.data());
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if(f)
        {
            f << content;
            f.flush();
        }
        if(!f)
        {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return std::unexpected(
                std::format("Failed to write {}", tmp.string()));
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if(ec)
    {
        std::filesystem::remove(tmp, ec);
        return std::unexpected(
            std::format("Failed to replace {}", path.string()));
    }
    return {};
}

// Convert a string to lower case, assuming ASCII.
inline std::string asciiLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

// Expand a leading "~/" to $HOME.
inline std::filesystem::path expandHome(std::string_view p)
{
    if(p.starts_with("~/"))
    {
        const char* home = std::getenv("HOME");
        if(home != nullptr)
        {
            return std::filesystem::path(home) / p.substr(2);
        }
    }
    return std::filesystem::path(p);
}
