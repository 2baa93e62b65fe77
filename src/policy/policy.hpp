#pragma once

#include "../bandit/bandit_util.hpp"
#include "../bandit/model.hpp"

namespace drugsim {

enum PolicyType {
    UCB,
    INTERVAL_ESTIMATION
};

/*
 * Selection rule plus the replication/trial loop shared by every rule.
 * Subclasses only provide the score of each alternative; the selected
 * alternative is the arg-max, ties broken by configured order.
 */
class Policy {
protected:
    SimulationModel& model;
    const double theta;

    static double checkTheta(double theta)
    {
        if (!(std::isfinite(theta) && theta>=0.0)) {
            throw ConfigurationError("theta must be non-negative, got "+dtos(theta));
        }
        return theta;
    }

public:
    Policy(SimulationModel& model, double theta)
            :model(model), theta(checkTheta(theta))
    {
    }

    virtual ~Policy() {}

    // t is the 1-based trial number within the replication
    virtual std::vector<double> scores(const std::vector<BeliefState>& beliefs, uint t) const = 0;

    virtual std::string name() = 0;

    virtual std::string info() = 0;

    virtual PolicyType getType() = 0;

    uint selectNext(const std::vector<BeliefState>& beliefs, uint t) const
    {
        return vectorMaxIndex(scores(beliefs, t));
    }

    double getTheta() const
    {
        return theta;
    }

    Results run(int nReplications)
    {
        if (nReplications<=0) {
            throw ConfigurationError("number of replications must be positive, got "+itos(nReplications));
        }
        const uint T = model.horizon();
        model.clear();
        Results results;
        results.reserve(static_cast<size_t>(nReplications)*T);
        for (int r = 0; r<nReplications; ++r) {
            model.reset();
            for (uint t = 0; t<T; ++t) {
                uint x = selectNext(model.getBeliefs(), t+1);
                results.push_back(model.observe(x));
#if DRUGSIM_DEBUG
                std::cout << results.back() << std::endl;
#endif
            }
        }
        return results;
    }
};

typedef std::shared_ptr<Policy> PolicyPtr;

} //namespace
