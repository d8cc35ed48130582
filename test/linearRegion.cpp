#define BOOST_TEST_DYN_LINK

#include "../src/linearRegion.hpp"
#include "../src/dataTable.hpp"
#include "../src/errors.hpp"
#include "testData.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>

using namespace MSDiff;

namespace
{
    TimeSeries linearSeries(const size_t &n, const double &slope)
    {
        TimeSeries s("linear");
        for(size_t i=0; i<n; ++i)
            s.push_back(Sample(i, slope*i));
        return s;
    }
}

BOOST_AUTO_TEST_SUITE( linearRegion )
    BOOST_AUTO_TEST_CASE( window )
    {
        Window w;
        BOOST_CHECK(!w.found());
        BOOST_CHECK_EQUAL(w.first, -1);
        BOOST_CHECK_EQUAL(w.last, -1);
        BOOST_CHECK(Window(3,7).found());
        BOOST_CHECK(Window(3,7) != Window(3,8));
    }
    BOOST_AUTO_TEST_CASE( options )
    {
        RegionOptions opt;
        BOOST_CHECK_CLOSE(opt.tolerance, 0.05, 1e-12);
        BOOST_CHECK_CLOSE(opt.exponent, diffusiveExponent, 1e-12);
        BOOST_CHECK_EQUAL(opt.nbSlices, 10u);
        BOOST_CHECK(!opt.absolute);
        BOOST_CHECK(RegionOptions::conductivity(0.05).absolute);
        opt.tolerance = 0.0;
        BOOST_CHECK_THROW(opt.check(), std::invalid_argument);
        opt.tolerance = 1.0;
        BOOST_CHECK_THROW(opt.check(), std::invalid_argument);
        opt.tolerance = 0.05;
        opt.nbSlices = 0;
        BOOST_CHECK_THROW(opt.check(), std::invalid_argument);
        opt.nbSlices = 10;
        opt.increment = 0.0;
        BOOST_CHECK_THROW(opt.check(), std::invalid_argument);
    }
    BOOST_AUTO_TEST_CASE( diffusive_msd )
    {
        const TimeSeries msd = DataTable(dataFile("msd_single.csv")).series(1, "msd");
        BOOST_REQUIRE_EQUAL(msd.size(), 1001u);
        BOOST_CHECK_EQUAL(findLinearRegion(msd, RegionOptions(0.05)), Window(61, 1000));
        BOOST_CHECK_EQUAL(findLinearRegion(msd, RegionOptions(0.02)), Window(251, 500));
        BOOST_CHECK_EQUAL(findLinearRegion(msd, RegionOptions(0.01)), Window(291, 500));
        BOOST_CHECK_EQUAL(findLinearRegion(msd, RegionOptions(0.1)), Window(31, 1000));
        BOOST_CHECK_EQUAL(findLinearRegion(msd, RegionOptions(0.3)), Window(11, 1000));
    }
    BOOST_AUTO_TEST_CASE( window_bounds )
    {
        const TimeSeries msd = DataTable(dataFile("msd_single.csv")).series(1, "msd");
        const std::vector<Candidate> candidates = scanCandidates(msd, RegionOptions(0.05));
        BOOST_REQUIRE(!candidates.empty());
        for(size_t c=0; c<candidates.size(); ++c)
        {
            BOOST_CHECK_GE(candidates[c].first, 1);
            BOOST_CHECK_LT(candidates[c].first, candidates[c].last);
            BOOST_CHECK_LE(candidates[c].last, 1000);
            BOOST_CHECK_LE(candidates[c].deviation, 0.05);
        }
    }
    BOOST_AUTO_TEST_CASE( deterministic )
    {
        const TimeSeries msd = DataTable(dataFile("msd_single.csv")).series(1, "msd");
        const RegionOptions opt(0.05);
        BOOST_CHECK_EQUAL(findLinearRegion(msd, opt), findLinearRegion(msd, opt));
    }
    BOOST_AUTO_TEST_CASE( tie_break )
    {
        std::vector<Candidate> candidates;
        candidates.push_back(Candidate(10, 20, 0.03));
        candidates.push_back(Candidate(5, 15, 0.01));
        candidates.push_back(Candidate(30, 40, 0.04));
        candidates.push_back(Candidate(50, 55, 0.0));
        BOOST_CHECK_EQUAL(selectWindow(candidates, RegionOptions::smallestDeviation), Window(5, 15));
        BOOST_CHECK_EQUAL(selectWindow(candidates, RegionOptions::largestDeviation), Window(30, 40));
        //complete tie: first recorded wins
        candidates.push_back(Candidate(60, 70, 0.01));
        BOOST_CHECK_EQUAL(selectWindow(candidates), Window(5, 15));
        //more points always wins
        candidates.push_back(Candidate(0, 11, 0.049));
        BOOST_CHECK_EQUAL(selectWindow(candidates), Window(0, 11));
        BOOST_CHECK(!selectWindow(std::vector<Candidate>()).found());

        const TimeSeries msd = DataTable(dataFile("msd_single.csv")).series(1, "msd");
        RegionOptions opt(0.05);
        opt.tieBreak = RegionOptions::largestDeviation;
        BOOST_CHECK_EQUAL(findLinearRegion(msd, opt), Window(61, 1000));
    }
    BOOST_AUTO_TEST_CASE( not_diffusive )
    {
        TimeSeries quadratic("quadratic");
        for(size_t t=1; t<100; ++t)
            quadratic.push_back(Sample(t, t*t));
        BOOST_CHECK(!findLinearRegion(quadratic, RegionOptions(0.1)).found());

        TimeSeries longQuadratic("quadratic");
        for(size_t t=10; t<10000; t+=10)
            longQuadratic.push_back(Sample(t, double(t)*t));
        BOOST_CHECK(!findLinearRegion(longQuadratic, RegionOptions::conductivity(0.1)).found());
    }
    BOOST_AUTO_TEST_CASE( exactly_linear )
    {
        BOOST_CHECK_EQUAL(findLinearRegion(linearSeries(201, 3.0), RegionOptions(0.05)), Window(1, 200));
        //fewer points than slices
        BOOST_CHECK(!findLinearRegion(linearSeries(11, 3.0), RegionOptions(0.05)).found());
        BOOST_CHECK(!findLinearRegion(linearSeries(3, 3.0), RegionOptions(0.05)).found());
    }
    BOOST_AUTO_TEST_CASE( too_short )
    {
        BOOST_CHECK_THROW(findLinearRegion(linearSeries(2, 3.0), RegionOptions(0.05)), InsufficientData);
        BOOST_CHECK_THROW(findLinearRegion(TimeSeries(), RegionOptions(0.05)), InsufficientData);
    }
    BOOST_AUTO_TEST_CASE( negative_values )
    {
        TimeSeries negative("anion_cation");
        for(size_t i=0; i<201; ++i)
            negative.push_back(Sample(i, -0.1*i));
        //logarithm of negative values is not a number
        BOOST_CHECK(!findLinearRegion(negative, RegionOptions(0.05)).found());
        BOOST_CHECK_EQUAL(findLinearRegion(negative, RegionOptions::conductivity(0.05)), Window(1, 200));
    }
BOOST_AUTO_TEST_SUITE_END()
