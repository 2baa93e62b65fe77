#pragma once

#include "truth.hpp"

namespace drugsim {

// U(center - halfWidth, center + halfWidth); zero width is a point mass
class UniformTruth: public Truth {
    const double center;
    const double halfWidth;

public:
    UniformTruth(double center, double halfWidth)
            :center(center), halfWidth(halfWidth)
    {
        checkTruthParameter("center", center, false);
        checkTruthParameter("half-width", halfWidth, true);
    }

    double getMean() override
    {
        return center;
    }

    double draw(RandomEngine& rng) override
    {
        if (halfWidth==0.0) {
            return center;
        }
        return std::uniform_real_distribution<double>(center-halfWidth, center+halfWidth)(rng);
    }

    std::string printInfo() override
    {
        return "uniform\t"+dtos(center)+"\t"+dtos(halfWidth);
    }

    TruthType getType() override
    {
        return TruthType::UNIFORM;
    }
};

} //namespace
