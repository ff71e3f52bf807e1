#include <charconv>
#include <format>
#include <string>

#include <inja.hpp>
#include <nlohmann/json.hpp>

#include "status_renderer.hpp"

std::string_view quotaColor(std::string_view pct)
{
    double value = 0.0;
    auto status = std::from_chars(pct.data(), pct.data() + pct.size(), value);
    if(pct.empty() || status.ec != std::errc())
    {
        return {};
    }
    if(value > 75.0)
    {
        return "\033[31m";
    }
    else if(value > 50.0)
    {
        return "\033[33m";
    }
    else
    {
        return "\033[32m";
    }
}

StatusRenderer::StatusRenderer()
{
    env.add_callback("quota_color", 1, [](const inja::Arguments& args)
    {
        if(!args.at(0)->is_string())
        {
            return std::string();
        }
        return std::string(
            quotaColor(args.at(0)->get_ref<const std::string&>()));
    });
    env.add_callback("color_reset", 0, [](const inja::Arguments&)
    {
        return std::string(COLOR_RESET);
    });
}

E<std::string> StatusRenderer::render(std::string_view tmpl,
                                      const ProjectedResult& result)
{
    nlohmann::json data = result.json();
    data["color_reset"] = std::string(COLOR_RESET);
    try
    {
        return env.render(tmpl, data);
    }
    catch(const inja::InjaError& e)
    {
        return std::unexpected(std::format("Invalid status template: {}",
                                           e.what()));
    }
}
