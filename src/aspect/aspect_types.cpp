/// @file aspect_types.cpp
/// @brief Names and strengths for aspect modes and orb categories.

#include "aspect/aspect_types.hpp"

#include "core/text.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace jyotish::aspect
{

AspectMode aspect_mode_from_name(std::string_view name)
{
    const std::string key = core::fold_identifier(name);
    if (key == "rasi" || key == "sign")
    {
        return AspectMode::Rasi;
    }
    if (key == "degree" || key == "orb")
    {
        return AspectMode::Degree;
    }
    throw std::invalid_argument(fmt::format("unknown aspect mode: '{}'", name));
}

std::string_view aspect_mode_name(AspectMode mode)
{
    switch (mode)
    {
        case AspectMode::Rasi:   return "rasi";
        case AspectMode::Degree: return "degree";
    }
    return "rasi";
}

std::string_view orb_category_name(OrbCategory category)
{
    switch (category)
    {
        case OrbCategory::Exact:    return "exact";
        case OrbCategory::Close:    return "close";
        case OrbCategory::Wide:     return "wide";
        case OrbCategory::VeryWide: return "very_wide";
        case OrbCategory::None:     return "none";
    }
    return "none";
}

f64 orb_strength(OrbCategory category)
{
    switch (category)
    {
        case OrbCategory::Exact:    return 1.0;
        case OrbCategory::Close:    return 0.75;
        case OrbCategory::Wide:     return 0.5;
        case OrbCategory::VeryWide: return 0.25;
        case OrbCategory::None:     return 0.0;
    }
    return 0.0;
}

} // namespace jyotish::aspect
