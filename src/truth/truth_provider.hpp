#pragma once

#include "truth.hpp"

namespace drugsim {

// Holds one ground-truth distribution per alternative, in alternative order.
class TruthProvider {
    std::vector<TruthPtr> truths;

public:
    explicit TruthProvider(const std::vector<TruthPtr>& truths)
            :truths(truths)
    {
        for (uint i = 0; i<truths.size(); ++i) {
            if (!truths[i]) {
                throw ConfigurationError("alternative "+itos(i)+" has no truth distribution");
            }
        }
    }

    double draw(uint alternative, RandomEngine& rng)
    {
        return truths.at(alternative)->draw(rng);
    }

    // one draw per alternative, in alternative order
    std::vector<double> drawAll(RandomEngine& rng)
    {
        std::vector<double> values;
        values.reserve(truths.size());
        for (const auto& truth : truths) {
            values.push_back(truth->draw(rng));
        }
        return values;
    }

    uint size() const
    {
        return truths.size();
    }

    const TruthPtr& get(uint alternative) const
    {
        return truths.at(alternative);
    }
};

} //namespace
