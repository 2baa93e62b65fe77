#include <gtest/gtest.h>

#include "policy/policy_ucb.hpp"
#include "policy/policy_ie.hpp"
#include "truth/truth_fixvalue.hpp"

using namespace drugsim;

namespace {

class PolicyTest: public ::testing::Test {
protected:
    RandomEngine rng;
    SimulationModel model;

    static std::vector<Alternative> threeDrugs()
    {
        std::vector<Alternative> alts;
        alts.emplace_back("A", 0.3, 0.1, TruthPtr(new FixValueTruth(0.3)));
        alts.emplace_back("B", 0.2, 0.1, TruthPtr(new FixValueTruth(0.2)));
        alts.emplace_back("C", 0.25, 0.1, TruthPtr(new FixValueTruth(0.25)));
        return alts;
    }

    PolicyTest()
            :rng(1), model(threeDrugs(), 0.05, 10, rng)
    {
    }
};

} // namespace

TEST_F(PolicyTest, NegativeThetaRejected)
{
    EXPECT_THROW(UCBPolicy p(model, -1.0), ConfigurationError);
    EXPECT_THROW(IEPolicy p(model, -0.5), ConfigurationError);
    EXPECT_THROW(UCBPolicy p(model, std::nan("")), ConfigurationError);
    EXPECT_NO_THROW(UCBPolicy p(model, 0.0));
}

TEST_F(PolicyTest, GreedyUCBPicksHighestMean)
{
    UCBPolicy policy(model, 0.0);
    std::vector<BeliefState> beliefs = {BeliefState(0.1, 100, 2), BeliefState(0.5, 100, 1),
                                        BeliefState(0.3, 100, 4)};
    EXPECT_EQ(policy.selectNext(beliefs, 8), 1u);
}

TEST_F(PolicyTest, TiesGoToFirstAlternative)
{
    UCBPolicy greedy(model, 0.0);
    std::vector<BeliefState> beliefs = {BeliefState(0.1, 100, 1), BeliefState(0.5, 100, 1),
                                        BeliefState(0.5, 100, 1)};
    EXPECT_EQ(greedy.selectNext(beliefs, 4), 1u);

    IEPolicy ie(model, 1.0);
    std::vector<BeliefState> same = {BeliefState(0.2, 25, 0), BeliefState(0.2, 25, 3),
                                     BeliefState(0.1, 25, 0)};
    EXPECT_EQ(ie.selectNext(same, 4), 0u);
}

TEST_F(PolicyTest, UntriedAlternativeScoresInfinity)
{
    UCBPolicy policy(model, 0.0);
    std::vector<BeliefState> beliefs = {BeliefState(0.9, 100, 3), BeliefState(0.0, 100, 0),
                                        BeliefState(0.1, 100, 0)};
    std::vector<double> s = policy.scores(beliefs, 4);
    EXPECT_EQ(s[1], infinity);
    EXPECT_EQ(s[2], infinity);
    EXPECT_EQ(policy.selectNext(beliefs, 4), 1u);
}

TEST_F(PolicyTest, UCBBonusShrinksWithCount)
{
    UCBPolicy policy(model, 2.0);
    std::vector<BeliefState> beliefs = {BeliefState(0.3, 100, 4), BeliefState(0.2, 100, 1)};
    std::vector<double> s = policy.scores(beliefs, 5);
    EXPECT_DOUBLE_EQ(s[0], 0.3+2.0*std::sqrt(std::log(5.0)/4));
    EXPECT_DOUBLE_EQ(s[1], 0.2+2.0*std::sqrt(std::log(5.0)/1));
    EXPECT_EQ(policy.selectNext(beliefs, 5), 1u);

    // ln(1) = 0: no bonus on the first trial
    std::vector<double> first = policy.scores(beliefs, 1);
    EXPECT_DOUBLE_EQ(first[0], 0.3);
}

TEST_F(PolicyTest, IEAddsPosteriorStd)
{
    IEPolicy policy(model, 1.0);
    std::vector<BeliefState> beliefs = {BeliefState(0.3, 100, 5), BeliefState(0.28, 25, 1)};
    std::vector<double> s = policy.scores(beliefs, 7);
    EXPECT_DOUBLE_EQ(s[0], 0.3+1.0/std::sqrt(100.0));
    EXPECT_DOUBLE_EQ(s[1], 0.28+1.0/std::sqrt(25.0));
    EXPECT_EQ(policy.selectNext(beliefs, 7), 1u);

    IEPolicy greedy(model, 0.0);
    EXPECT_EQ(greedy.selectNext(beliefs, 7), 0u);
}

TEST_F(PolicyTest, NamesAndTypes)
{
    UCBPolicy ucb(model, 1.5);
    IEPolicy ie(model, 2.0);
    EXPECT_EQ(ucb.name(), "UCB");
    EXPECT_EQ(ucb.getType(), PolicyType::UCB);
    EXPECT_EQ(ucb.info(), "UCB with theta=1.5");
    EXPECT_EQ(ie.name(), "IE");
    EXPECT_EQ(ie.getType(), PolicyType::INTERVAL_ESTIMATION);
    EXPECT_DOUBLE_EQ(ie.getTheta(), 2.0);
}
