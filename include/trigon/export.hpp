#pragma once

#include <cstdint>
#include <string>

namespace trigon
{

class SceneModel;

class SvgExporter
{
   public:
    // Write the scene's current frame to an SVG file, bypassing the GPU.
    static bool write_svg(const std::string& path,
                          const SceneModel&  scene,
                          uint32_t           width  = 800,
                          uint32_t           height = 800);

    // Write SVG to a string instead of a file.
    static std::string to_string(const SceneModel& scene, uint32_t width = 800, uint32_t height = 800);
};

}   // namespace trigon
