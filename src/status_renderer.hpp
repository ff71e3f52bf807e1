#pragma once

#include <string>
#include <string_view>

#include <inja.hpp>

#include "result_projector.hpp"
#include "utils.hpp"

// ANSI colour for a usage percentage: red above 75, yellow above 50,
// green otherwise. Empty for an unknown percentage.
std::string_view quotaColor(std::string_view pct);

constexpr std::string_view COLOR_RESET = "\033[0m";

// Renders a projected result through an inja template. The template sees
// the six result fields plus color_reset, and can call quota_color(pct)
// and color_reset().
class StatusRenderer
{
public:
    StatusRenderer();

    E<std::string> render(std::string_view tmpl,
                          const ProjectedResult& result);

private:
    inja::Environment env;
};
