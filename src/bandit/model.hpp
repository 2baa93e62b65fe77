#pragma once

#include "macro_util.h"
#include "bandit_util.hpp"
#include "belief.hpp"
#include "observation.hpp"
#include "trial_record.hpp"
#include "../truth/truth.hpp"
#include "../truth/truth_provider.hpp"

#include <map>

namespace drugsim {

// One drug under evaluation: its label, prior belief and ground-truth distribution
struct Alternative {
    std::string label;
    double priorMean;
    double priorStd;
    TruthPtr truth;

    Alternative(const std::string& label, double priorMean, double priorStd, TruthPtr truth)
            :label(label), priorMean(priorMean), priorStd(priorStd), truth(truth)
    {
    }
};

/*
 * Owns the beliefs and the hidden ground truths of every alternative for the
 * current replication.
 *
 *   Idle --reset()--> InReplication --reset()--> InReplication ...
 *
 * observe() is valid only in InReplication and at most T times between two
 * resets. The random engine is owned by the caller and must outlive the model.
 */
class SimulationModel {
public:
    enum State {
        IDLE,
        IN_REPLICATION
    };

private:
    std::vector<std::string> labels;
    std::map<std::string, uint> labelIndex;
    std::vector<BeliefState> priors;
    TruthProvider truthProvider;

    const double sigmaW;
    const double betaW;
    const uint T;
    RandomEngine& rng;

    State state;
    uint replicationIdx;
    uint trialIdx;
    std::vector<double> groundTruth;
    std::vector<BeliefState> beliefs;

    static std::vector<TruthPtr> collectTruths(const std::vector<Alternative>& alternatives)
    {
        std::vector<TruthPtr> truths;
        for (const auto& alt : alternatives) {
            truths.push_back(alt.truth);
        }
        return truths;
    }

    static double checkSigmaW(double sigmaW)
    {
        if (!(std::isfinite(sigmaW) && sigmaW>0.0)) {
            throw ConfigurationError("sigma_W must be positive, got "+dtos(sigmaW));
        }
        return sigmaW;
    }

    static uint checkHorizon(int T)
    {
        if (T<=0) {
            throw ConfigurationError("number of trials T must be positive, got "+itos(T));
        }
        return static_cast<uint>(T);
    }

public:
    SimulationModel(const std::vector<Alternative>& alternatives, double sigmaW, int T, RandomEngine& rng)
            :truthProvider(collectTruths(alternatives)),
             sigmaW(checkSigmaW(sigmaW)), betaW(1.0/(sigmaW*sigmaW)), T(checkHorizon(T)),
             rng(rng), state(IDLE), replicationIdx(0), trialIdx(0)
    {
        if (alternatives.empty()) {
            throw ConfigurationError("the set of alternatives is empty");
        }
        for (uint i = 0; i<alternatives.size(); ++i) {
            const Alternative& alt = alternatives[i];
            if (labelIndex.count(alt.label)) {
                throw ConfigurationError("duplicate alternative "+alt.label);
            }
            if (!std::isfinite(alt.priorMean)) {
                throw ConfigurationError("prior mean of "+alt.label+" must be finite");
            }
            if (!(std::isfinite(alt.priorStd) && alt.priorStd>0.0)) {
                throw ConfigurationError("prior std of "+alt.label+" must be positive, got "+dtos(alt.priorStd));
            }
            labelIndex[alt.label] = i;
            labels.push_back(alt.label);
            priors.push_back(BeliefState::fromPrior(alt.priorMean, alt.priorStd));
        }
        beliefs = priors;
        printVar("K", labels.size());
        printVar("betaW", betaW);
    }

    // back to Idle; the next reset() starts replication 0
    void clear()
    {
        state = IDLE;
        replicationIdx = 0;
        trialIdx = 0;
        groundTruth.clear();
        beliefs = priors;
    }

    // start a new replication: fresh truths, beliefs back to the prior
    void reset()
    {
        if (state==IN_REPLICATION) {
            replicationIdx += 1;
        }
        groundTruth = truthProvider.drawAll(rng);
        beliefs = priors;
        trialIdx = 0;
        state = IN_REPLICATION;
        printVec("truth", groundTruth);
    }

    TrialRecord observe(uint chosen)
    {
        if (state!=IN_REPLICATION) {
            throw UsageError("observe() called before reset()");
        }
        if (trialIdx>=T) {
            throw UsageError("replication "+itos(replicationIdx)+" already played all "+itos(T)+" trials");
        }
        if (chosen>=beliefs.size()) {
            throw UsageError("alternative index "+itos(chosen)+" out of range");
        }
        double W = ObservationModel::sample(groundTruth[chosen], sigmaW, rng);
        beliefs[chosen] = beliefs[chosen].update(W, betaW);
        TrialRecord rec(replicationIdx, trialIdx, chosen, W, beliefs);
        trialIdx += 1;
        return rec;
    }

    TrialRecord observe(const std::string& label)
    {
        auto it = labelIndex.find(label);
        if (it==labelIndex.end()) {
            throw UsageError("unknown alternative "+label);
        }
        return observe(it->second);
    }

    const std::vector<BeliefState>& getBeliefs() const
    {
        return beliefs;
    }

    const std::vector<std::string>& getLabels() const
    {
        return labels;
    }

    uint indexOf(const std::string& label) const
    {
        auto it = labelIndex.find(label);
        if (it==labelIndex.end()) {
            throw UsageError("unknown alternative "+label);
        }
        return it->second;
    }

    State getState() const { return state; }

    uint getTrial() const { return trialIdx; }

    uint getReplication() const { return replicationIdx; }

    uint numAlternatives() const { return labels.size(); }

    uint horizon() const { return T; }

    double getSigmaW() const { return sigmaW; }

    double getBetaW() const { return betaW; }

    std::string info() const
    {
        std::string str = "K="+itos(labels.size())+" T="+itos(T)+" sigmaW="+dtos(sigmaW);
        for (uint i = 0; i<labels.size(); ++i) {
            str += "\n#  "+labels[i]+"\tprior "+dtos(priors[i].mu)+"\t"+dtos(priors[i].stdDev())
                    +"\ttruth "+truthProvider.get(i)->printInfo();
        }
        return str;
    }
};

} //namespace
