#define BOOST_TEST_DYN_LINK

#include "../src/conductivity.hpp"
#include "../src/errors.hpp"
#include "testData.hpp"
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>

using namespace MSDiff;

namespace
{
    TimeSeries quadratic(const std::string &name)
    {
        TimeSeries s(name);
        for(size_t i=0; i<1001; ++i)
            s.push_back(Sample(0.5*i, 0.25*i*i));
        return s;
    }
}

BOOST_AUTO_TEST_SUITE( conductivity )
    BOOST_AUTO_TEST_CASE( named_columns )
    {
        const std::vector<TimeSeries> series = contributionSeries(DataTable(dataFile("conductivity.csv")));
        BOOST_REQUIRE_EQUAL(series.size(), nbContributions);
        for(size_t c=0; c<nbContributions; ++c)
            BOOST_CHECK_EQUAL(series[c].name, contributionNames[c]);
        BOOST_CHECK_EQUAL(series[0].size(), 1001u);
    }
    BOOST_AUTO_TEST_CASE( positional_columns )
    {
        std::istringstream seven("time;a;b;c;d;e;f;g\n0;1;2;3;4;5;6;7\n1;1;2;3;4;5;6;7\n");
        std::vector<TimeSeries> series = contributionSeries(DataTable(seven, "seven"));
        BOOST_REQUIRE_EQUAL(series.size(), 7u);
        BOOST_CHECK_EQUAL(series[0].name, "total_eh");
        BOOST_CHECK_EQUAL(series[6].name, "anion_cation");
        BOOST_CHECK_CLOSE(series[3][0].value, 4.0, 1e-12);

        std::istringstream three("time;a;b;c\n0;1;2;3\n");
        series = contributionSeries(DataTable(three, "three"));
        BOOST_REQUIRE_EQUAL(series.size(), 3u);
        BOOST_CHECK_EQUAL(series[1].name, "b");

        std::istringstream timeOnly("time\n0\n");
        BOOST_CHECK_THROW(contributionSeries(DataTable(timeOnly, "timeOnly")), std::invalid_argument);
    }
    BOOST_AUTO_TEST_CASE( negative_cross_term )
    {
        const DataTable table(dataFile("conductivity.csv"));
        const TimeSeries cross = table.series(7, "anion_cation");
        BOOST_CHECK(!findLinearRegion(cross, RegionOptions(0.05)).found());
        BOOST_CHECK_EQUAL(findLinearRegion(cross, RegionOptions::conductivity(0.05)), Window(31, 950));
    }
    BOOST_AUTO_TEST_CASE( contributions )
    {
        const ConductivityResults res = ConductivityAnalysis(0.05, conductiveExponent, true).run(
            contributionSeries(DataTable(dataFile("conductivity.csv")))
        );
        BOOST_REQUIRE_EQUAL(res.contributions.size(), nbContributions);
        for(size_t c=0; c<nbContributions; ++c)
            BOOST_CHECK(res.contributions[c].succeeded());

        BOOST_CHECK_EQUAL(res.contributions[0].window, Window(31, 1000));
        BOOST_CHECK_EQUAL(res.contributions[0].fit.nbPoints, 970u);
        BOOST_CHECK_CLOSE(res.sigma[0].value, 1.0000232339895032, 1e-8);
        BOOST_CHECK_CLOSE(res.sigma[0].error, 0.00014175809458602534, 1e-5);
        BOOST_CHECK_CLOSE(res.contributions[0].fit.rsquared, 0.99998054897628308, 1e-8);
        BOOST_CHECK_EQUAL(res.contributions[1].window, Window(31, 1000));
        BOOST_CHECK_CLOSE(res.sigma[1].value, 2.0000622518689184, 1e-8);
        BOOST_CHECK_CLOSE(res.sigma[1].error, 0.00028362477145301232, 1e-5);
        BOOST_CHECK_EQUAL(res.contributions[2].window, Window(31, 950));
        BOOST_CHECK_EQUAL(res.contributions[2].fit.nbPoints, 920u);
        BOOST_CHECK_CLOSE(res.sigma[2].value, 0.50001021479400576, 1e-8);
        BOOST_CHECK_CLOSE(res.sigma[2].error, 7.2991268045826332e-05, 1e-5);
        BOOST_CHECK_CLOSE(res.sigma[3].value, 0.89997423238430097, 1e-8);
        BOOST_CHECK_CLOSE(res.sigma[3].error, 0.00012804828199461331, 1e-5);
        BOOST_CHECK_CLOSE(res.sigma[4].value, 0.59999254710511429, 1e-8);
        BOOST_CHECK_CLOSE(res.sigma[4].error, 8.5122519882533469e-05, 1e-5);
        BOOST_CHECK_CLOSE(res.sigma[5].value, 1.099892650609934, 1e-8);
        BOOST_CHECK_CLOSE(res.sigma[5].error, 0.00015691477675395786, 1e-5);
        BOOST_CHECK_EQUAL(res.contributions[6].window, Window(31, 950));
        BOOST_CHECK_CLOSE(res.sigma[6].value, -0.10000054141895219, 1e-8);
        BOOST_CHECK_CLOSE(res.sigma[6].error, 1.4605606529893135e-05, 1e-5);
    }
    BOOST_AUTO_TEST_CASE( a_posteriori )
    {
        const ConductivityResults res = ConductivityAnalysis(0.05, conductiveExponent, true).run(
            contributionSeries(DataTable(dataFile("conductivity.csv")))
        );
        BOOST_REQUIRE(res.hasTransportNumbers);
        const TransportNumbers &t = res.numbers;
        BOOST_CHECK(t.ideal);
        BOOST_CHECK_CLOSE(t.ionicity.value, 0.49999605415034026, 1e-8);
        BOOST_CHECK_CLOSE(t.ionicity.error, 0.00010025379038026862, 1e-5);
        BOOST_CHECK_CLOSE(t.anionIdeal.value, 0.44997311035860904, 1e-8);
        BOOST_CHECK_CLOSE(t.anionIdeal.error, 9.0390943926221359e-05, 1e-5);
        BOOST_CHECK_CLOSE(t.cationIdeal.value, 0.549929208244474, 1e-8);
        BOOST_CHECK_CLOSE(t.cationIdeal.error, 0.00011061978477011613, 1e-5);
        BOOST_CHECK_CLOSE(t.anionCation.value, -0.09999821806140341, 1e-8);
        BOOST_CHECK_CLOSE(t.anionCation.error, 2.0353154659952007e-05, 1e-5);
        BOOST_CHECK_CLOSE(t.anion.value, 0.44999948880113039, 1e-8);
        BOOST_CHECK_CLOSE(t.anion.error, 0.00010224782690606692, 1e-5);
        BOOST_CHECK_CLOSE(t.cation.value, 0.5499794981777506, 1e-8);
        BOOST_CHECK_CLOSE(t.cation.error, 0.0001207582133508062, 1e-5);
    }
    BOOST_AUTO_TEST_CASE( incomplete )
    {
        std::vector<TimeSeries> series = contributionSeries(DataTable(dataFile("conductivity.csv")));
        series.pop_back();
        const ConductivityResults res = ConductivityAnalysis(0.05, conductiveExponent, true).run(series);
        BOOST_CHECK_EQUAL(res.contributions.size(), 6u);
        BOOST_CHECK(!res.hasTransportNumbers);
        BOOST_CHECK_EQUAL(res.succeeded().size(), 6u);
    }
    BOOST_AUTO_TEST_CASE( primary_failure )
    {
        std::vector<TimeSeries> series;
        for(size_t c=0; c<nbContributions; ++c)
            series.push_back(quadratic(contributionNames[c]));
        BOOST_CHECK_EQUAL(primaryContribution(series), 0u);
        BOOST_CHECK_THROW(ConductivityAnalysis(0.05, conductiveExponent, true).run(series), NoLinearRegion);

        //the Einstein-Helfand total is the primary column wherever it is
        std::vector<TimeSeries> fitted = contributionSeries(DataTable(dataFile("conductivity.csv")));
        std::swap(fitted[0], fitted[2]);
        BOOST_CHECK_EQUAL(primaryContribution(fitted), 2u);
        fitted[2] = quadratic("total_eh");
        BOOST_CHECK_THROW(ConductivityAnalysis(0.05, conductiveExponent, true).run(fitted), NoLinearRegion);

        //without it, the first column is the primary one
        std::vector<TimeSeries> unnamed;
        unnamed.push_back(quadratic("a"));
        unnamed.push_back(fitted[1]);
        BOOST_CHECK_EQUAL(primaryContribution(unnamed), 0u);
        BOOST_CHECK_THROW(ConductivityAnalysis(0.05, conductiveExponent, true).run(unnamed), NoLinearRegion);
        std::swap(unnamed[0], unnamed[1]);
        const ConductivityResults res = ConductivityAnalysis(0.05, conductiveExponent, true).run(unnamed);
        BOOST_CHECK(res.contributions[0].succeeded());
        BOOST_CHECK(!res.contributions[1].succeeded());
        BOOST_CHECK(!res.hasTransportNumbers);
    }
    BOOST_AUTO_TEST_CASE( export_tables )
    {
        const ConductivityResults res = ConductivityAnalysis(0.05, conductiveExponent, true).run(
            contributionSeries(DataTable(dataFile("conductivity.csv")))
        );
        exportResults(res, "msdiff_test_conductivity");
        std::ifstream cond("msdiff_test_conductivity_cond.csv");
        std::string line;
        size_t n = 0;
        while(std::getline(cond, line))
            ++n;
        BOOST_CHECK_EQUAL(n, 1u+nbContributions);
        std::ifstream post("msdiff_test_conductivity_post.csv");
        BOOST_CHECK(post.good());
    }
BOOST_AUTO_TEST_SUITE_END()
