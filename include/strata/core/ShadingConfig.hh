#pragma once

#include "strata/core/BlockPalette.hh"
#include "strata/core/ChunkMaterial.hh"
#include "strata/core/ChunkShader.hh"
#include "strata/core/DataLoader.hh"
#include "strata/core/Lighting.hh"
#include "strata/core/Log.hh"
#include "strata/utils/ErrorHandling.hh"

#include <filesystem>
#include <string_view>

namespace strata {

// Everything a renderer needs to specialize and feed a chunk pipeline.
//
// TOML layout (every key optional, defaults as in the structs):
//
//   [pipeline]
//   pass = "forward"              # "deferred_prepass", "default_prepass"
//   load_prepass_normals = false
//   normal_prepass = false
//   depth_clamp_ortho = false
//
//   [material]
//   reflectance = 0.5
//   perceptual_roughness = 1.0
//   metallic = 0.01
//   alpha_mode = "opaque"         # "premultiplied"
//
//   [lighting]
//   ambient_color = [1.0, 1.0, 1.0]
//   ambient_brightness = 0.1
//   exposure = 1.0
//   tonemap = true
//
//   [[lighting.directional]]
//   direction = [0.3, 1.0, 0.2]   # toward the light, normalized on load
//   color = [1.0, 0.95, 0.9]
//   intensity = 3.0
//
//   [log]
//   level = "info"                # root logger; see log::levelFromName
//   render = "info"
//   terrain = "info"
struct ShadingConfig {
    PipelineKey pipeline;
    ChunkMaterial material;
    LightingEnvironment lighting;
    log::LogLevels logLevels;
};

Result<ShadingConfig> parseShadingConfig(const DataLoader& loader);
Result<ShadingConfig> loadShadingConfig(const std::filesystem::path& path);
Result<ShadingConfig> parseShadingConfigString(std::string_view content, std::string_view sourceName = "string");

// Registers every [[block]] entry in order:
//
//   [[block]]
//   id = "stone"
//   color = [0.5, 0.5, 0.5]       # sRGB, optional 4th component alpha
//   emissive = [0.0, 0.0, 0.0]    # optional
//   visibility = "solid"          # "transparent", "invisible"
//   collision = true              # optional, defaults to true
//
// Stops at the first bad entry; blocks registered before it stay registered.
Result<void> loadBlockDefinitions(const DataLoader& loader, BlockRegistry& registry);

} // namespace strata
