#pragma once

#include "macro_util.h"
#include "bandit_util.hpp"
#include "trial_record.hpp"

#define NUM_PRECISION 4

namespace drugsim {

// Averages of a results sequence over its replications, trial by trial.
class RoundwiseLog {
public:

    uint K, T, simulationTimes;

    // how often alternative k was chosen at trial t
    vec2Double roundwiseSelections;

    // posterior mean of alternative k after trial t
    vec2Double roundwiseMeans;

    // observed outcome at trial t
    std::vector<double> roundwiseObservations;

    // replications whose final posterior mean of k is the largest
    std::vector<double> bestIdentified;

    // sum of observed outcomes per replication
    std::vector<double> cumulativeObjective;

    RoundwiseLog(uint K, uint T)
            :K(K), T(T)
    {
        roundwiseSelections = vec2Double(T, std::vector<double>(K, 0.0));
        roundwiseMeans = vec2Double(T, std::vector<double>(K, 0.0));
        roundwiseObservations = std::vector<double>(T, 0.0);
        bestIdentified = std::vector<double>(K, 0.0);
        simulationTimes = 0;
    }

    // records must be in (replication, trial) order with T records per replication;
    // the whole sequence is checked before anything is added
    void addResults(const Results& results)
    {
        if (results.size()%T!=0) {
            throw UsageError("results hold "+itos(results.size())+" records, not a multiple of T="+itos(T));
        }
        for (uint idx = 0; idx<results.size(); ++idx) {
            const TrialRecord& rec = results[idx];
            if (rec.beliefs.size()!=K || rec.chosen>=K) {
                throw UsageError("record "+itos(idx)+" does not match a log of "+itos(K)+" alternatives");
            }
            if (rec.trial!=idx%T) {
                throw UsageError("record "+itos(idx)+" has trial "+itos(rec.trial)+", expected "+itos(idx%T));
            }
            if (rec.trial>0 && rec.replication!=results[idx-1].replication) {
                throw UsageError("record "+itos(idx)+" switches replication inside a block of T trials");
            }
        }

        double objective = 0.0;
        for (const auto& rec : results) {
            roundwiseSelections[rec.trial][rec.chosen] += 1.0;
            roundwiseObservations[rec.trial] += rec.observation;
            for (uint k = 0; k<K; ++k) {
                roundwiseMeans[rec.trial][k] += rec.beliefs[k].mu;
            }
            objective += rec.observation;
            if (rec.trial==T-1) {
                std::vector<double> finalMeans;
                for (const auto& b : rec.beliefs) {
                    finalMeans.push_back(b.mu);
                }
                bestIdentified[vectorMaxIndex(finalMeans)] += 1.0;
                cumulativeObjective.push_back(objective);
                objective = 0.0;
                simulationTimes += 1;
            }
        }
    }

    double selectionRate(uint t, uint k) const
    {
        return simulationTimes ? roundwiseSelections[t][k]/simulationTimes : 0.0;
    }

    double averageMean(uint t, uint k) const
    {
        return simulationTimes ? roundwiseMeans[t][k]/simulationTimes : 0.0;
    }

    double averageObservation(uint t) const
    {
        return simulationTimes ? roundwiseObservations[t]/simulationTimes : 0.0;
    }

    double bestRate(uint k) const
    {
        return simulationTimes ? bestIdentified[k]/simulationTimes : 0.0;
    }

    // the objective: average cumulative observed outcome per replication
    double averageObjective() const
    {
        return cumulativeObjective.empty() ? 0.0 : vectorSum(cumulativeObjective)/cumulativeObjective.size();
    }
};

class RoundwiseLogWriter {
public:
    static void logWrite(const RoundwiseLog& log, const std::vector<std::string>& labels,
            const std::string& policyName, std::ostream& os)
    {
        const uint K = labels.size();
        std::ios::fmtflags flags = os.flags();
        std::streamsize precision = os.precision();

        os << "#averaged result over " << log.simulationTimes
           << " replications." << std::endl;
        os << "#policy " << policyName << std::endl;
        os.setf(std::ios::fixed, std::ios::floatfield);
        os.precision(NUM_PRECISION);

        // write the header
        os << "#results:" << std::endl;
        os << "#T";
        for (uint k = 0; k<K; ++k) {
            os << " selection(" << labels[k] << ")";
        }
        for (uint k = 0; k<K; ++k) {
            os << " mu(" << labels[k] << ")";
        }
        os << " W" << std::endl;

        for (uint t = 0; t<log.T; ++t) {
            os << (t+1);
            for (uint k = 0; k<K; ++k) {
                os << " " << log.selectionRate(t, k);
            }
            for (uint k = 0; k<K; ++k) {
                os << " " << log.averageMean(t, k);
            }
            os << " " << log.averageObservation(t) << std::endl;
        }

        os << "#best identified:";
        for (uint k = 0; k<K; ++k) {
            os << " " << labels[k] << "=" << log.bestRate(k);
        }
        os << std::endl;
        os << "#objective: " << log.averageObjective() << std::endl;

        os.flags(flags);
        os.precision(precision);
    }
};

} //namespace
