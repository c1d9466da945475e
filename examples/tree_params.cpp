#include "canopy/tree_model.hpp"

#include <iostream>
#include <optional>
#include <string>

// usage: tree_params <speciesGroup|-> <canopyShape|-> <heightM> [crownWidthM]
int main(int argc, char **argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <speciesGroup|-> <canopyShape|-> <heightM> [crownWidthM]\n";
        return 2;
    }

    try {
        canopy::SpeciesDescriptor species;
        if (std::string(argv[1]) != "-")
            species.speciesGroup = argv[1];
        if (std::string(argv[2]) != "-")
            species.canopyShape = argv[2];

        double height = std::stod(argv[3]);
        std::optional<double> crownWidth;
        if (argc > 4)
            crownWidth = std::stod(argv[4]);

        auto type = canopy::resolveModelType(species);
        auto params = canopy::parameterize(type, height, crownWidth);

        std::cout << "model:        " << params.modelType << "\n"
                  << "crown shape:  " << canopy::toString(params.crownShape) << "\n"
                  << "total height: " << params.totalHeight << " m\n"
                  << "trunk:        " << params.trunkHeight << " m tall, " << params.trunkWidth << " m wide\n"
                  << "crown:        " << params.crownHeight << " m tall, " << params.crownWidth << " m wide\n"
                  << "crown top:    " << params.crownTopRatio << "\n";
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
