#pragma once

#include "canopy/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace canopy {

    // The seven canonical tree silhouettes.
    //
    //   BroadleafRound     rounded crown (oak, maple, beech, elm)
    //   ColumnarDeciduous  tall and narrow (poplar, sweetgum, birch)
    //   Spreading          wide, low crown (walnut, sycamore)
    //   Conical            classic spire (spruce, fir)
    //   IrregularConifer   flat-topped or asymmetric (pines)
    //   ColumnarConifer    narrow spire (cedar, cypress, redwood)
    //   Palm               fan top
    enum class ModelType { BroadleafRound, ColumnarDeciduous, Spreading, Conical, IrregularConifer, ColumnarConifer, Palm };

    enum class CrownShape { Sphere, Ellipse, Cone, Cylinder, Fan };

    inline constexpr ModelType kDefaultModelType = ModelType::BroadleafRound;

    const std::array<ModelType, 7> &allModelTypes();

    std::string toString(ModelType type);
    std::string toString(CrownShape shape);
    std::optional<ModelType> parseModelType(const std::string &name);

    struct ModelTypeDefinition {
        double trunkHeightRatio; // share of total height that is bare trunk
        double crownWidthRatio;  // crown width / total height
        double crownTopRatio;    // top width as a fraction of max width (0 pointed, 1 flat)
        double trunkWidthRatio;  // trunk width / total height
        CrownShape crownShape;
    };

    const ModelTypeDefinition &definition(ModelType type);

    // Produced by the species catalog. Either field may be missing.
    struct SpeciesDescriptor {
        std::optional<std::string> speciesGroup;
        std::optional<std::string> canopyShape;
    };

    std::optional<ModelType> modelForSpeciesGroup(const std::string &group);
    std::optional<ModelType> modelForCanopyShape(const std::string &shape);

    // Species group wins over canopy shape; anything unmapped falls through to the default.
    ModelType resolveModelType(const std::optional<SpeciesDescriptor> &species);

    struct RenderParams {
        std::string modelType; // as requested, even when the definition fell back to the default
        double trunkHeight = 0.0;
        double crownHeight = 0.0;
        double trunkWidth = 0.0;
        double crownWidth = 0.0;
        CrownShape crownShape = CrownShape::Sphere;
        double crownTopRatio = 0.0;
        double totalHeight = 0.0;
    };

    // An unknown model name uses the broadleaf-round definition. A crown width that is missing or not
    // positive is derived from the height, since a zero-width crown means "unknown" rather than "none".
    RenderParams parameterize(const std::string &modelType, double heightM,
                              std::optional<double> crownWidthM = std::nullopt);
    RenderParams parameterize(ModelType type, double heightM, std::optional<double> crownWidthM = std::nullopt);

    using SpeciesCatalog = std::unordered_map<std::string, SpeciesDescriptor>;

    // Adds modelType, crownShape and the shape ratios to each feature's properties, looked up through
    // its "speciesId" property. Geometry and existing properties are left alone. A feature with no
    // speciesId (or an unknown one) gets the default model.
    std::vector<Feature> enrichWithModelType(std::vector<Feature> features, const SpeciesCatalog &species);

    // Ground footprints for fill-extrusion rendering: the trunk ring is extruded from 0 to trunkTop,
    // the crown ring from crownBase to crownTop (metres above ground).
    struct TreeFootprint {
        Polygon trunk;
        Polygon crown;
        double trunkTop = 0.0;
        double crownBase = 0.0;
        double crownTop = 0.0;
    };

    TreeFootprint treeFootprint(const GeoPoint &center, const RenderParams &params, int steps = 32);

} // namespace canopy
