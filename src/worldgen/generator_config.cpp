#include "voxelforge/worldgen/generator_config.hpp"
#include "voxelforge/core/config_parser.hpp"
#include "voxelforge/core/log.hpp"
#include "voxelforge/core/position.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace voxelforge::worldgen {

namespace {

const Logger& configLog() {
    static const Logger log("config");
    return log;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("GeneratorConfig: " + message);
    }
}

void validateFractal(const FractalParams& p, const std::string& what) {
    require(p.octaves >= 1 && p.octaves <= MAX_OCTAVES,
            what + " octaves must be between 1 and " + std::to_string(MAX_OCTAVES));
    require(std::isfinite(p.persistence) && p.persistence > 0.0,
            what + " persistence must be positive");
    require(std::isfinite(p.lacunarity) && p.lacunarity > 0.0,
            what + " lacunarity must be positive");
    require(std::isfinite(p.scale) && p.scale > 0.0, what + " scale must be positive");
}

bool fitsInt32(int64_t value) {
    return value >= std::numeric_limits<int32_t>::min() &&
           value <= std::numeric_limits<int32_t>::max();
}

bool isInt32Value(double value) {
    return std::isfinite(value) && std::floor(value) == value &&
           value >= std::numeric_limits<int32_t>::min() &&
           value <= std::numeric_limits<int32_t>::max();
}

// Terrain row: base amplitude octaves persistence lacunarity scale
bool applyTerrainRow(const std::vector<double>& row, TerrainShape& shape) {
    if (row.size() != 6 || !isInt32Value(row[2])) {
        return false;
    }
    shape.base = row[0];
    shape.amplitude = row[1];
    shape.fractal.octaves = static_cast<int32_t>(row[2]);
    shape.fractal.persistence = row[3];
    shape.fractal.lacunarity = row[4];
    shape.fractal.scale = row[5];
    return true;
}

using Setter = std::function<bool(const ConfigValue&, GeneratorConfig&)>;

template <typename Accessor>
Setter doubleField(Accessor accessor) {
    return [accessor](const ConfigValue& value, GeneratorConfig& config) {
        auto parsed = value.asDouble();
        if (!parsed) {
            return false;
        }
        accessor(config) = *parsed;
        return true;
    };
}

template <typename Accessor>
Setter intField(Accessor accessor) {
    return [accessor](const ConfigValue& value, GeneratorConfig& config) {
        auto parsed = value.asInt();
        if (!parsed || !fitsInt32(*parsed)) {
            return false;
        }
        accessor(config) = static_cast<int32_t>(*parsed);
        return true;
    };
}

const std::unordered_map<std::string, Setter>& scalarSetters() {
    static const std::unordered_map<std::string, Setter> setters = {
        {"biome.seed_offset", doubleField([](GeneratorConfig& c) -> double& { return c.biomes.seedOffset; })},
        {"biome.octaves", intField([](GeneratorConfig& c) -> int32_t& { return c.biomes.fractal.octaves; })},
        {"biome.persistence", doubleField([](GeneratorConfig& c) -> double& { return c.biomes.fractal.persistence; })},
        {"biome.lacunarity", doubleField([](GeneratorConfig& c) -> double& { return c.biomes.fractal.lacunarity; })},
        {"biome.scale", doubleField([](GeneratorConfig& c) -> double& { return c.biomes.fractal.scale; })},
        {"biome.desert_below", doubleField([](GeneratorConfig& c) -> double& { return c.biomes.desertBelow; })},
        {"biome.forest_from", doubleField([](GeneratorConfig& c) -> double& { return c.biomes.forestFrom; })},

        {"terrain.topsoil_depth", intField([](GeneratorConfig& c) -> int32_t& { return c.topsoilDepth; })},

        {"cave.seed_offset", doubleField([](GeneratorConfig& c) -> double& { return c.caves.seedOffset; })},
        {"cave.scale", doubleField([](GeneratorConfig& c) -> double& { return c.caves.scale; })},
        {"cave.threshold", doubleField([](GeneratorConfig& c) -> double& { return c.caves.threshold; })},

        {"feature.seed_offset", doubleField([](GeneratorConfig& c) -> double& { return c.features.seedOffset; })},
        {"feature.height_seed_offset", doubleField([](GeneratorConfig& c) -> double& { return c.features.heightSeedOffset; })},

        {"tree.chance", doubleField([](GeneratorConfig& c) -> double& { return c.features.tree.chance; })},
        {"tree.edge_margin", intField([](GeneratorConfig& c) -> int32_t& { return c.features.tree.edgeMargin; })},
        {"tree.trunk_base", intField([](GeneratorConfig& c) -> int32_t& { return c.features.tree.trunkBase; })},
        {"tree.trunk_variation", intField([](GeneratorConfig& c) -> int32_t& { return c.features.tree.trunkVariation; })},
        {"tree.canopy_radius", intField([](GeneratorConfig& c) -> int32_t& { return c.features.tree.canopyRadius; })},

        {"cactus.chance", doubleField([](GeneratorConfig& c) -> double& { return c.features.cactus.chance; })},
        {"cactus.height_base", intField([](GeneratorConfig& c) -> int32_t& { return c.features.cactus.heightBase; })},
        {"cactus.height_variation", intField([](GeneratorConfig& c) -> int32_t& { return c.features.cactus.heightVariation; })},

        {"debug.logging", [](const ConfigValue& value, GeneratorConfig& c) {
            auto parsed = value.asBool();
            if (!parsed) {
                return false;
            }
            c.debugLogging = *parsed;
            return true;
        }},
    };
    return setters;
}

/// Numbers written either inline after the key or on indented data lines
std::vector<double> entryNumbers(const ConfigEntry& entry) {
    if (entry.hasData()) {
        return entry.dataLines.front();
    }
    if (entry.value.hasNumbers()) {
        return entry.value.asNumbers();
    }

    std::vector<double> numbers;
    std::string text(entry.value.asString());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t consumed = 0;
        try {
            numbers.push_back(std::stod(text.substr(pos), &consumed));
        } catch (const std::exception&) {
            return {};
        }
        pos += consumed;
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
            ++pos;
        }
    }
    return numbers;
}

void warnBadValue(const ConfigEntry& entry) {
    configLog().warn("line " + std::to_string(entry.lineNumber) + ": ignoring bad value for '" +
                     entry.fullKey() + "'");
}

}  // namespace

// ============================================================================
// GeneratorConfig
// ============================================================================

std::array<TerrainShape, BIOME_COUNT> GeneratorConfig::defaultTerrain() {
    std::array<TerrainShape, BIOME_COUNT> shapes{};
    shapes[static_cast<size_t>(Biome::Plains)] = TerrainShape{64.0, 15.0, {5, 0.5, 2.0, 0.02}};
    shapes[static_cast<size_t>(Biome::Desert)] = TerrainShape{60.0, 10.0, {4, 0.5, 2.0, 0.02}};
    shapes[static_cast<size_t>(Biome::Forest)] = TerrainShape{70.0, 30.0, {6, 0.5, 2.0, 0.015}};
    return shapes;
}

void GeneratorConfig::validate() const {
    require(std::isfinite(noise.cx) && std::isfinite(noise.cy) && std::isfinite(noise.cz) &&
            std::isfinite(noise.cseed) && std::isfinite(noise.amplitude),
            "noise coefficients must be finite");
    require(noise.amplitude != 0.0, "noise amplitude must be non-zero");

    validateFractal(biomes.fractal, "biome");
    require(biomes.desertBelow >= 0.0 && biomes.forestFrom <= 1.0,
            "biome thresholds must lie in [0, 1]");
    require(biomes.desertBelow <= biomes.forestFrom,
            "biome.desert_below must not exceed biome.forest_from");

    for (Biome biome : ALL_BIOMES) {
        const TerrainShape& shape = terrainFor(biome);
        std::string name = "terrain:" + std::string(biomeName(biome));
        require(std::isfinite(shape.base) && std::isfinite(shape.amplitude),
                name + " base and amplitude must be finite");
        validateFractal(shape.fractal, name);
    }

    require(topsoilDepth >= 0, "terrain.topsoil_depth must not be negative");
    require(std::isfinite(caves.scale) && caves.scale > 0.0, "cave.scale must be positive");
    require(std::isfinite(caves.threshold), "cave.threshold must be finite");

    const TreeParams& tree = features.tree;
    require(tree.edgeMargin >= 0 && tree.edgeMargin * 2 <= CHUNK_WIDTH,
            "tree.edge_margin must be between 0 and half the chunk width");
    require(tree.trunkBase >= 1, "tree.trunk_base must be at least 1");
    require(tree.trunkVariation >= 0, "tree.trunk_variation must not be negative");
    require(tree.canopyRadius >= 0, "tree.canopy_radius must not be negative");

    const CactusParams& cactus = features.cactus;
    require(cactus.heightBase >= 1, "cactus.height_base must be at least 1");
    require(cactus.heightVariation >= 0, "cactus.height_variation must not be negative");
}

// ============================================================================
// Loading
// ============================================================================

GeneratorConfig applyConfigDocument(const ConfigDocument& doc, GeneratorConfig base) {
    const auto& setters = scalarSetters();

    for (const ConfigEntry& entry : doc) {
        if (entry.key == "terrain" && entry.hasSuffix()) {
            auto biome = biomeFromName(entry.suffix);
            if (!biome) {
                configLog().warn("line " + std::to_string(entry.lineNumber) +
                                 ": unknown biome '" + entry.suffix + "'");
                continue;
            }
            if (!applyTerrainRow(entryNumbers(entry), base.terrain[static_cast<size_t>(*biome)])) {
                warnBadValue(entry);
            }
            continue;
        }

        if (entry.key == "material" && entry.hasSuffix()) {
            auto type = blockTypeFromName(entry.suffix);
            if (!type || *type == BlockType::Air) {
                configLog().warn("line " + std::to_string(entry.lineNumber) +
                                 ": no material slot for '" + entry.suffix + "'");
                continue;
            }
            auto rgb = entry.value.asHexColor();
            if (!rgb) {
                warnBadValue(entry);
                continue;
            }
            base.materials.set(*type, Material::fromHex(*rgb));
            continue;
        }

        if (entry.key == "noise.coefficients" && !entry.hasSuffix()) {
            auto numbers = entryNumbers(entry);
            if (numbers.size() != 5) {
                warnBadValue(entry);
                continue;
            }
            base.noise = NoiseCoefficients{numbers[0], numbers[1], numbers[2], numbers[3], numbers[4]};
            continue;
        }

        auto it = entry.hasSuffix() ? setters.end() : setters.find(entry.key);
        if (it == setters.end()) {
            configLog().warn("line " + std::to_string(entry.lineNumber) +
                             ": unknown key '" + entry.fullKey() + "'");
            continue;
        }
        if (!it->second(entry.value, base)) {
            warnBadValue(entry);
        }
    }

    base.validate();
    return base;
}

std::optional<GeneratorConfig> loadGeneratorConfig(const std::filesystem::path& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path.string());
    if (!doc) {
        configLog().error("cannot read " + path.string());
        return std::nullopt;
    }
    return applyConfigDocument(*doc);
}

}  // namespace voxelforge::worldgen
