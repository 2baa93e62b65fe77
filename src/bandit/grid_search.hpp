#pragma once

#include "bandit_util.hpp"
#include "model.hpp"
#include "roundwiselog.hpp"
#include "init_util.hpp"

namespace drugsim {

struct GridPoint {
    double theta;
    double objective;
};

// Sweeps theta for one policy. Every candidate gets a fresh model and an
// engine seeded with the same seed, so all of them see the same draws.
class GridSearch {
    const std::vector<Alternative> alternatives;
    const double sigmaW;
    const int T;
    const int nReplications;
    const std::string policyName;
    const uint seed;

public:
    GridSearch(const std::vector<Alternative>& alternatives, double sigmaW, int T, int nReplications,
            const std::string& policyName, uint seed)
            :alternatives(alternatives), sigmaW(sigmaW), T(T), nReplications(nReplications),
             policyName(policyName), seed(seed)
    {
        if (nReplications<=0) {
            throw ConfigurationError("number of replications must be positive, got "+itos(nReplications));
        }
        // surface model and policy errors now rather than at the first evaluate()
        RandomEngine rng(seed);
        SimulationModel model(alternatives, sigmaW, T, rng);
        initPolicy(policyName, model, 0.0);
    }

    double evaluate(double theta) const
    {
        RandomEngine rng(seed);
        SimulationModel model(alternatives, sigmaW, T, rng);
        PolicyPtr policy = initPolicy(policyName, model, theta);
        RoundwiseLog log(model.numAlternatives(), model.horizon());
        log.addResults(policy->run(nReplications));
        return log.averageObjective();
    }

    std::vector<GridPoint> run(const std::vector<double>& thetas) const
    {
        if (thetas.empty()) {
            throw ConfigurationError("theta grid is empty");
        }
        for (double theta : thetas) {
            if (!(std::isfinite(theta) && theta>=0.0)) {
                throw ConfigurationError("theta must be non-negative, got "+dtos(theta));
            }
        }
        std::vector<GridPoint> points;
        for (double theta : thetas) {
            printMsg("# Evaluating "+policyName+" with theta="+dtos(theta));
            GridPoint p;
            p.theta = theta;
            p.objective = evaluate(theta);
            printVar("theta", theta);
            printVar("objective", p.objective);
            points.push_back(p);
        }
        return points;
    }

    // first point with the largest objective
    static GridPoint best(const std::vector<GridPoint>& points)
    {
        if (points.empty()) {
            throw UsageError("no grid points to choose from");
        }
        std::vector<double> objectives;
        for (const auto& p : points) {
            objectives.push_back(p.objective);
        }
        return points[vectorMaxIndex(objectives)];
    }

    static void write(const std::vector<GridPoint>& points, const std::string& policyName, std::ostream& os)
    {
        os << "#grid search " << policyName << std::endl;
        os << "#theta objective" << std::endl;
        for (const auto& p : points) {
            os << p.theta << " " << p.objective << std::endl;
        }
        GridPoint b = best(points);
        os << "#best theta=" << b.theta << " objective=" << b.objective << std::endl;
    }
};

} //namespace
