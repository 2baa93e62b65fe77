#include <gtest/gtest.h>

#include "bandit/init_util.hpp"

using namespace drugsim;

TEST(ParseAlternatives, ReadsEveryTruthType)
{
    std::vector<std::string> lines = {
            "# label prior_mean prior_std truth_type params",
            "A 0.30 0.10 fixed 0.3",
            "",
            "B\t0.20 0.10 uniform 0.2 0.05",
            "C 0.25 0.20 normal 0.25 0.01",
    };
    std::vector<Alternative> alts = parseAlternatives(lines);
    ASSERT_EQ(alts.size(), 3u);
    EXPECT_EQ(alts[0].label, "A");
    EXPECT_DOUBLE_EQ(alts[0].priorMean, 0.30);
    EXPECT_DOUBLE_EQ(alts[0].priorStd, 0.10);
    EXPECT_EQ(alts[0].truth->getType(), TruthType::FIXVALUE);
    EXPECT_EQ(alts[1].truth->getType(), TruthType::UNIFORM);
    EXPECT_EQ(alts[2].truth->getType(), TruthType::NORMAL);
    EXPECT_DOUBLE_EQ(alts[2].truth->getMean(), 0.25);
}

TEST(ParseAlternatives, BadLinesNameTheLine)
{
    try {
        parseAlternatives({"A 0.3 0.1 fixed 0.3", "B 0.2 0.1 uniform 0.2 -0.1"}, "drugs.txt");
        FAIL() << "negative width accepted";
    }
    catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("drugs.txt:2"), std::string::npos);
    }
    EXPECT_THROW(parseAlternatives({"A 0.3 0.1 fixed"}), ConfigurationError);
    EXPECT_THROW(parseAlternatives({"A 0.3 x fixed 0.3"}), ConfigurationError);
    EXPECT_THROW(parseAlternatives({"A 0.3 0.1 beta 0.3 0.1"}), ConfigurationError);
    EXPECT_THROW(parseAlternatives({"A 0.3 0.1 fixed 0.3 0.1"}), ConfigurationError);
}

TEST(InitAlternatives, MissingFileIsConfigurationError)
{
    EXPECT_THROW(initAlternatives("./drugdata/no_such_file.txt"), ConfigurationError);
}

TEST(InitAlternatives, ReadsBundledParameterFile)
{
    std::vector<Alternative> alts = initAlternatives("./drugdata/drugParams.txt");
    ASSERT_EQ(alts.size(), 4u);
    EXPECT_EQ(alts[0].label, "M");
    EXPECT_EQ(alts[3].label, "AGI");
}

TEST(InitPolicy, BuildsByName)
{
    RandomEngine rng(1);
    SimulationModel model(parseAlternatives({"A 0.3 0.1 fixed 0.3"}), 0.05, 3, rng);
    EXPECT_EQ(initPolicy("ucb", model, 1.0)->getType(), PolicyType::UCB);
    EXPECT_EQ(initPolicy("ie", model, 1.0)->getType(), PolicyType::INTERVAL_ESTIMATION);
    EXPECT_THROW(initPolicy("kg", model, 1.0), ConfigurationError);
    EXPECT_THROW(initPolicy("ie", model, -1.0), ConfigurationError);
}

TEST(ParseThetaList, CommaSeparated)
{
    std::vector<double> thetas = parseThetaList("0, 0.5,2");
    ASSERT_EQ(thetas.size(), 3u);
    EXPECT_DOUBLE_EQ(thetas[1], 0.5);
    EXPECT_DOUBLE_EQ(thetas[2], 2.0);
    EXPECT_THROW(parseThetaList("1,,2"), ConfigurationError);
    EXPECT_THROW(parseThetaList("a"), ConfigurationError);
}

TEST(StartSimulation, PrintsSummary)
{
    RandomEngine rng(12);
    SimulationModel model(parseAlternatives({"A 0.3 0.1 fixed 0.3", "B 0.2 0.1 fixed 0.2"}), 0.05, 5, rng);
    UCBPolicy policy(model, 1.0);
    std::ostringstream os;
    Results results = startSimulation(3, model, policy, os, true);

    EXPECT_EQ(results.size(), 15u);
    const std::string out = os.str();
    EXPECT_NE(out.find("#replication trial chosen W mu(A) std(A) n(A)"), std::string::npos);
    EXPECT_NE(out.find("#averaged result over 3 replications."), std::string::npos);
    EXPECT_NE(out.find("#objective: "), std::string::npos);
}
