#include <expected>
#include <string>
#include <utility>

#include <ryml.hpp>
#include <ryml_std.hpp>

#include "config.hpp"
#include "utils.hpp"

static std::string nodeStr(ryml::ConstNodeRef node)
{
    auto value = node.val();
    return std::string(value.begin(), value.end());
}

E<Configuration> Configuration::fromYaml(const std::filesystem::path& path)
{
    auto buffer = readFile(path);
    if(!buffer.has_value())
    {
        return std::unexpected(buffer.error());
    }

    ryml::Tree tree = ryml::parse_in_place(ryml::to_substr(*buffer));
    ryml::ConstNodeRef root = tree.crootref();
    Configuration config;
    if(!root.is_map())
    {
        // Empty file.
        return config;
    }
    if(root.has_child("cache-file"))
    {
        config.cache_file = expandHome(nodeStr(root["cache-file"]));
    }
    if(root.has_child("lock-file"))
    {
        config.lock_file = expandHome(nodeStr(root["lock-file"]));
    }
    if(root.has_child("credentials-file"))
    {
        config.credentials_file = expandHome(nodeStr(root["credentials-file"]));
    }
    if(root.has_child("api-url"))
    {
        config.api_url = nodeStr(root["api-url"]);
    }
    if(root.has_child("api-beta"))
    {
        config.api_beta = nodeStr(root["api-beta"]);
    }
    if(root.has_child("fetch-timeout"))
    {
        if(!getYamlValue(root["fetch-timeout"], config.fetch_timeout)
           || config.fetch_timeout == 0)
        {
            return std::unexpected("Invalid fetch timeout");
        }
    }
    if(root.has_child("ttl"))
    {
        if(!getYamlValue(root["ttl"], config.ttl))
        {
            return std::unexpected("Invalid ttl");
        }
    }
    if(root.has_child("active-ttl"))
    {
        if(!getYamlValue(root["active-ttl"], config.active_ttl))
        {
            return std::unexpected("Invalid active ttl");
        }
    }
    if(root.has_child("idle-ttl"))
    {
        if(!getYamlValue(root["idle-ttl"], config.idle_ttl))
        {
            return std::unexpected("Invalid idle ttl");
        }
    }
    if(root.has_child("activity-window"))
    {
        if(!getYamlValue(root["activity-window"], config.activity_window))
        {
            return std::unexpected("Invalid activity window");
        }
    }
    if(root.has_child("status-template"))
    {
        config.status_template = nodeStr(root["status-template"]);
    }
    if(root.has_child("log-level"))
    {
        config.log_level = asciiLower(nodeStr(root["log-level"]));
    }
    if(root.has_child("log-file"))
    {
        config.log_file = expandHome(nodeStr(root["log-file"])).string();
    }
    return std::expected<Configuration, std::string>
        {std::in_place, std::move(config)};
}
