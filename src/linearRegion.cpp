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
**/

#include "linearRegion.hpp"
#include "errors.hpp"
#include <cmath>
#include <stdexcept>
#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

using namespace std;
using namespace MSDiff;

std::ostream& MSDiff::operator<< (std::ostream& os, const Window &w)
{
    os<<"["<<w.first<<","<<w.last<<"]";
    return os;
}

/** @brief Options for cumulative conductivity integrals, which may be negative */
RegionOptions RegionOptions::conductivity(const double &tolerance, const double &exponent)
{
    RegionOptions opt(tolerance, exponent);
    opt.absolute = true;
    return opt;
}

/** @brief throws if the options cannot drive a search */
void RegionOptions::check() const
{
    if(!(tolerance>0.0 && tolerance<1.0))
        throw invalid_argument((boost::format("RegionOptions: tolerance %1% not in (0,1)") % tolerance).str());
    if(nbSlices==0)
        throw invalid_argument("RegionOptions: at least one slice is needed");
    if(!(increment>0.0))
        throw invalid_argument((boost::format("RegionOptions: increment %1% should be positive") % increment).str());
}

/**
    @brief Scan the log-log representation of the series for intervals of slope close to the exponent.

    The position 0 (usually zero time) is dropped. The remaining ndata points are covered
    by 2*nbSlices-1 overlapping probes, from the largest times backward.
    Each probe is grown toward small times as long as the slope between its two ends stays within tolerance,
    every accepted interval being recorded as a candidate.
    Returned positions are positions in the input series.
*/
std::vector<Candidate> MSDiff::scanCandidates(const TimeSeries &series, const RegionOptions &options)
{
    options.check();
    if(series.size()<3)
        throw InsufficientData(
            (boost::format("Linear region of %1%: %2% samples, at least 3 are needed") % series.name % series.size()).str()
        );

    const long ndata = series.size()-1;
    //logarithms, position 0 is never read
    vector<double> lnTime(series.size(), 0.0), lnValue(series.size(), 0.0);
    for(long i=1; i<=ndata; ++i)
    {
        lnTime[i] = log(series[i].time);
        lnValue[i] = log(options.absolute ? fabs(series[i].value) : series[i].value);
    }

    //the growth step never vanishes, even for short series
    const long step = max(1L, (long)(ndata * options.increment));
    const double slices = options.nbSlices;

    vector<Candidate> candidates;
    for(size_t n=0; n<2*options.nbSlices-1; ++n)
    {
        long t1 = ndata - (long)((n+2)/2.0 * ndata / slices) + 1;
        const long t2 = ndata - (long)(n/2.0 * ndata / slices);
        if(t1<1 || t1>=t2)
            continue;

        while(true)
        {
            const double slope = (lnValue[t1] - lnValue[t2]) / (lnTime[t1] - lnTime[t2]);
            if((boost::math::isnan)(slope))
                break;
            const double deviation = fabs(slope - options.exponent);
            if(deviation > options.tolerance)
                break;
            candidates.push_back(Candidate(t1, t2, deviation));
            t1 -= step;
            if(t1<1)
                break;
        }
    }
    return candidates;
}

/**
    @brief Choose the candidate with the most points.
    Equal sizes are separated by their deviation from the exponent, according to tieBreak.
    The first recorded candidate wins complete ties.
*/
Window MSDiff::selectWindow(const std::vector<Candidate> &candidates, const RegionOptions::TieBreak &tieBreak)
{
    if(candidates.empty())
        return Window();
    vector<Candidate>::const_iterator best = candidates.begin();
    for(vector<Candidate>::const_iterator c = candidates.begin()+1; c!=candidates.end(); ++c)
    {
        if(c->nbPoints > best->nbPoints)
            best = c;
        else if(c->nbPoints == best->nbPoints)
        {
            const bool better = (tieBreak==RegionOptions::smallestDeviation) ?
                c->deviation < best->deviation :
                c->deviation > best->deviation;
            if(better)
                best = c;
        }
    }
    return Window(best->first, best->last);
}

/** @brief Positions of the first and last point of the linear region, (-1,-1) if none */
Window MSDiff::findLinearRegion(const TimeSeries &series, const RegionOptions &options)
{
    return selectWindow(scanCandidates(series, options), options.tieBreak);
}
