#include "canopy/tree_model.hpp"
#include "canopy/geometry.hpp"

#include <fmt/format.h>

#include <cmath>

namespace canopy {

    namespace {
        const ModelTypeDefinition kBroadleafRound{0.35, 0.9, 0.6, 0.06, CrownShape::Sphere};
        const ModelTypeDefinition kColumnarDeciduous{0.40, 0.35, 0.5, 0.05, CrownShape::Ellipse};
        const ModelTypeDefinition kSpreading{0.30, 1.3, 0.7, 0.08, CrownShape::Sphere};
        const ModelTypeDefinition kConical{0.15, 0.55, 0.05, 0.04, CrownShape::Cone};
        const ModelTypeDefinition kIrregularConifer{0.35, 0.65, 0.15, 0.05, CrownShape::Cone};
        const ModelTypeDefinition kColumnarConifer{0.20, 0.25, 0.6, 0.04, CrownShape::Cylinder};
        const ModelTypeDefinition kPalm{0.80, 0.7, 0.3, 0.04, CrownShape::Fan};

        const std::unordered_map<std::string, ModelType> &speciesGroupTable() {
            static const std::unordered_map<std::string, ModelType> table = {
                {"oak", ModelType::BroadleafRound},
                {"maple", ModelType::BroadleafRound},
                {"elm", ModelType::BroadleafRound},
                {"beech", ModelType::BroadleafRound},
                {"ash", ModelType::BroadleafRound},
                {"birch", ModelType::ColumnarDeciduous},
                {"poplar", ModelType::ColumnarDeciduous},
                {"sweetgum", ModelType::ColumnarDeciduous},
                {"walnut", ModelType::Spreading},
                {"hickory", ModelType::BroadleafRound},
                {"sycamore", ModelType::Spreading},
                {"pine-hard", ModelType::IrregularConifer},
                {"pine-soft", ModelType::IrregularConifer},
                {"spruce", ModelType::Conical},
                {"fir", ModelType::Conical},
                {"cedar", ModelType::ColumnarConifer},
                {"cypress", ModelType::ColumnarConifer},
                {"redwood", ModelType::ColumnarConifer},
                {"palm", ModelType::Palm},
                {"small-deciduous", ModelType::BroadleafRound},
                {"fruit", ModelType::BroadleafRound},
                {"default", ModelType::BroadleafRound},
            };
            return table;
        }

        const std::unordered_map<std::string, ModelType> &canopyShapeTable() {
            static const std::unordered_map<std::string, ModelType> table = {
                {"round", ModelType::BroadleafRound},  {"oval", ModelType::ColumnarDeciduous},
                {"conical", ModelType::Conical},       {"columnar", ModelType::ColumnarConifer},
                {"vase", ModelType::ColumnarDeciduous}, {"weeping", ModelType::Spreading},
                {"spreading", ModelType::Spreading},   {"fan", ModelType::Palm},
            };
            return table;
        }

        std::optional<ModelType> lookup(const std::unordered_map<std::string, ModelType> &table,
                                        const std::string &key) {
            auto it = table.find(key);
            if (it == table.end())
                return std::nullopt;
            return it->second;
        }
    } // namespace

    const std::array<ModelType, 7> &allModelTypes() {
        static const std::array<ModelType, 7> types = {
            ModelType::BroadleafRound,   ModelType::ColumnarDeciduous, ModelType::Spreading, ModelType::Conical,
            ModelType::IrregularConifer, ModelType::ColumnarConifer,   ModelType::Palm};
        return types;
    }

    std::string toString(ModelType type) {
        switch (type) {
        case ModelType::BroadleafRound:
            return "broadleaf-round";
        case ModelType::ColumnarDeciduous:
            return "columnar-deciduous";
        case ModelType::Spreading:
            return "spreading";
        case ModelType::Conical:
            return "conical";
        case ModelType::IrregularConifer:
            return "irregular-conifer";
        case ModelType::ColumnarConifer:
            return "columnar-conifer";
        case ModelType::Palm:
            return "palm";
        }
        return "broadleaf-round";
    }

    std::string toString(CrownShape shape) {
        switch (shape) {
        case CrownShape::Sphere:
            return "sphere";
        case CrownShape::Ellipse:
            return "ellipse";
        case CrownShape::Cone:
            return "cone";
        case CrownShape::Cylinder:
            return "cylinder";
        case CrownShape::Fan:
            return "fan";
        }
        return "sphere";
    }

    std::optional<ModelType> parseModelType(const std::string &name) {
        for (auto type : allModelTypes()) {
            if (toString(type) == name)
                return type;
        }
        return std::nullopt;
    }

    const ModelTypeDefinition &definition(ModelType type) {
        switch (type) {
        case ModelType::BroadleafRound:
            return kBroadleafRound;
        case ModelType::ColumnarDeciduous:
            return kColumnarDeciduous;
        case ModelType::Spreading:
            return kSpreading;
        case ModelType::Conical:
            return kConical;
        case ModelType::IrregularConifer:
            return kIrregularConifer;
        case ModelType::ColumnarConifer:
            return kColumnarConifer;
        case ModelType::Palm:
            return kPalm;
        }
        return kBroadleafRound;
    }

    std::optional<ModelType> modelForSpeciesGroup(const std::string &group) {
        return lookup(speciesGroupTable(), group);
    }

    std::optional<ModelType> modelForCanopyShape(const std::string &shape) { return lookup(canopyShapeTable(), shape); }

    ModelType resolveModelType(const std::optional<SpeciesDescriptor> &species) {
        if (!species)
            return kDefaultModelType;

        if (species->speciesGroup) {
            if (auto type = modelForSpeciesGroup(*species->speciesGroup))
                return *type;
        }

        if (species->canopyShape) {
            if (auto type = modelForCanopyShape(*species->canopyShape))
                return *type;
        }

        return kDefaultModelType;
    }

    RenderParams parameterize(const std::string &modelType, double heightM, std::optional<double> crownWidthM) {
        const auto &def = definition(parseModelType(modelType).value_or(kDefaultModelType));
        const double height = std::isfinite(heightM) && heightM > 0.0 ? heightM : 0.0;

        RenderParams params;
        params.modelType = modelType;
        params.trunkHeight = height * def.trunkHeightRatio;
        params.crownHeight = height - params.trunkHeight;
        params.trunkWidth = height * def.trunkWidthRatio;
        params.crownWidth = crownWidthM && std::isfinite(*crownWidthM) && *crownWidthM > 0.0
                                ? *crownWidthM
                                : height * def.crownWidthRatio;
        params.crownShape = def.crownShape;
        params.crownTopRatio = def.crownTopRatio;
        params.totalHeight = height;
        return params;
    }

    RenderParams parameterize(ModelType type, double heightM, std::optional<double> crownWidthM) {
        return parameterize(toString(type), heightM, crownWidthM);
    }

    std::vector<Feature> enrichWithModelType(std::vector<Feature> features, const SpeciesCatalog &species) {
        for (auto &feature : features) {
            std::optional<SpeciesDescriptor> descriptor;
            auto idIt = feature.properties.find("speciesId");
            if (idIt != feature.properties.end()) {
                auto speciesIt = species.find(idIt->second);
                if (speciesIt != species.end())
                    descriptor = speciesIt->second;
            }

            const auto type = resolveModelType(descriptor);
            const auto &def = definition(type);
            feature.properties["modelType"] = toString(type);
            feature.properties["crownShape"] = toString(def.crownShape);
            feature.properties["trunkHeightRatio"] = fmt::format("{}", def.trunkHeightRatio);
            feature.properties["crownWidthRatio"] = fmt::format("{}", def.crownWidthRatio);
            feature.properties["trunkWidthRatio"] = fmt::format("{}", def.trunkWidthRatio);
        }
        return features;
    }

    TreeFootprint treeFootprint(const GeoPoint &center, const RenderParams &params, int steps) {
        TreeFootprint footprint;
        footprint.trunk.rings.push_back(circlePolygon(center, params.trunkWidth / 2.0, steps));
        footprint.crown.rings.push_back(circlePolygon(center, params.crownWidth / 2.0, steps));
        footprint.trunkTop = params.trunkHeight;
        footprint.crownBase = params.trunkHeight;
        footprint.crownTop = params.totalHeight;
        return footprint;
    }

} // namespace canopy
