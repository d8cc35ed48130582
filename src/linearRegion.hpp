/**
    Copyright 2008,2009 Mathieu Leocmach

    This file is part of MSDiff.

    MSDiff is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    MSDiff is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with MSDiff.  If not, see <http://www.gnu.org/licenses/>.


 * \file linearRegion.hpp
 * \brief Defines the search for the diffusive regime of a time series
 * \author Mathieu Leocmach
 *
 * The diffusive regime is the late time window where the series grows linearly with time,
 * i.e. where its log-log slope is close to one.
 *
 */

#ifndef linear_region_H
#define linear_region_H

#include "timeSeries.hpp"

namespace MSDiff
{
    /** \brief log-log slope of a mean square displacement in the diffusive regime */
    const double diffusiveExponent = 1.0;
    /** \brief log-log slope of a cumulative conductivity integral in the linear regime */
    const double conductiveExponent = 1.0;

    /**
        \brief A window of positions [first, last] inside a time series.
        (-1,-1) means that no window was found.
    */
    struct Window
    {
        long first, last;

        explicit Window(const long &first=-1, const long &last=-1) : first(first), last(last){};

        bool found() const {return first>=0 && last>=0;}
        bool operator==(const Window &w) const {return first==w.first && last==w.last;}
        bool operator!=(const Window &w) const {return !(*this==w);}
    };
    std::ostream& operator<< (std::ostream& os, const Window &w);

    /** \brief An interval of the series whose log-log slope is within tolerance */
    struct Candidate
    {
        long first, last;
        size_t nbPoints;
        double deviation;

        Candidate(const long &first, const long &last, const double &deviation) :
            first(first), last(last), nbPoints(last-first), deviation(deviation){};
    };

    /** \brief Parameters of the linear region search */
    struct RegionOptions
    {
        /** \brief which candidate wins among the ones having the same number of points */
        enum TieBreak {smallestDeviation, largestDeviation};

        /** \brief admissible absolute deviation of the log-log slope from the exponent */
        double tolerance;
        /** \brief expected log-log slope */
        double exponent;
        /** \brief fraction of the series by which a candidate window is grown */
        double increment;
        /** \brief number of coarse slices. 2*nbSlices-1 overlapping probes are scanned */
        size_t nbSlices;
        /** \brief take the logarithm of the absolute value (the series may be negative) */
        bool absolute;
        TieBreak tieBreak;

        explicit RegionOptions(const double &tolerance=0.05, const double &exponent=diffusiveExponent) :
            tolerance(tolerance), exponent(exponent), increment(0.01), nbSlices(10),
            absolute(false), tieBreak(smallestDeviation){};

        static RegionOptions conductivity(const double &tolerance, const double &exponent=conductiveExponent);
        void check() const;
    };

    std::vector<Candidate> scanCandidates(const TimeSeries &series, const RegionOptions &options);
    Window selectWindow(const std::vector<Candidate> &candidates, const RegionOptions::TieBreak &tieBreak=RegionOptions::smallestDeviation);
    Window findLinearRegion(const TimeSeries &series, const RegionOptions &options);
};
#endif
