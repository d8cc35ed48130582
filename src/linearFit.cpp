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

#include "linearFit.hpp"
#include "errors.hpp"
#include <cmath>
#include <stdexcept>
#include <boost/format.hpp>

using namespace std;
using namespace MSDiff;

namespace
{
    /** coefficient of determination of the line a*x+b over the samples [first,last] */
    double rSquared(const TimeSeries &series, const size_t &first, const size_t &last, const double &a, const double &b)
    {
        const double n = last-first+1;
        double sy = 0.0;
        for(size_t i=first; i<=last; ++i)
            sy += series[i].value;
        const double mean = sy/n;
        double ssRes = 0.0, ssTot = 0.0;
        for(size_t i=first; i<=last; ++i)
        {
            ssRes += pow(series[i].value - a*series[i].time - b, 2);
            ssTot += pow(series[i].value - mean, 2);
        }
        //a constant series is perfectly described by a flat line
        if(ssTot==0.0)
            return (ssRes==0.0)?1.0:0.0;
        return 1.0 - ssRes/ssTot;
    }
}

/** @brief Unweighted least squares over the samples [first,last] */
LinearFit MSDiff::ordinaryLeastSquares(const TimeSeries &series, const size_t &first, const size_t &last)
{
    if(last>=series.size() || last<first+1)
        throw InsufficientData("Not enough data points for linear regression.");

    const size_t nb = last-first+1;
    const double n = nb;
    double sx=0.0, sy=0.0, sxx=0.0, sxy=0.0;
    for(size_t i=first; i<=last; ++i)
    {
        const double &x = series[i].time, &y = series[i].value;
        sx += x;
        sy += y;
        sxx += x*x;
        sxy += x*y;
    }
    const double denominator = n*sxx - sx*sx;

    LinearFit fit;
    fit.nbPoints = nb;
    fit.weighted = false;
    fit.slope = (n*sxy - sx*sy) / denominator;
    fit.intercept = (sxx*sy - sx*sxy) / denominator;

    double ssRes = 0.0;
    for(size_t i=first; i<=last; ++i)
        ssRes += pow(series[i].value - fit.slope*series[i].time - fit.intercept, 2);
    //two points define the line exactly
    const double variance = (nb>2) ? ssRes/(n-2.0) : 0.0;
    fit.slopeError = sqrt(n/denominator) * sqrt(variance);
    fit.rsquared = rSquared(series, first, last, fit.slope, fit.intercept);
    return fit;
}

/** @brief Least squares over the samples [first,last] weighted by the inverse variance of each sample */
LinearFit MSDiff::weightedLeastSquares(const TimeSeries &series, const size_t &first, const size_t &last)
{
    if(last>=series.size() || last<first+1)
        throw InsufficientData("Not enough data points for linear regression.");

    double sw=0.0, sxw=0.0, syw=0.0, sxyw=0.0, sxxw=0.0;
    for(size_t i=first; i<=last; ++i)
    {
        if(series[i].error==0.0)
            throw invalid_argument(
                (boost::format("Weighted regression of %1%: zero uncertainty at time %2%") % series.name % series[i].time).str()
            );
        const double &x = series[i].time, &y = series[i].value;
        const double w = 1.0/(series[i].error*series[i].error);
        sw += w;
        sxw += x*w;
        syw += y*w;
        sxyw += x*y*w;
        sxxw += x*x*w;
    }

    LinearFit fit;
    fit.nbPoints = last-first+1;
    fit.weighted = true;
    fit.slope = (sxw*syw - sxyw*sw) / (sxw*sxw - sxxw*sw);
    fit.intercept = (sxyw - fit.slope*sxxw) / sxw;
    fit.slopeError = sqrt(sw / (sxxw*sw - sxw*sxw));
    fit.rsquared = rSquared(series, first, last, fit.slope, fit.intercept);
    return fit;
}

/**
    @brief Linear fit of the series restricted to a window.
    The fit is weighted if any sample of the window has a non zero error.
*/
LinearFit MSDiff::fitWindow(const TimeSeries &series, const Window &window)
{
    if(!window.found())
        throw NoLinearRegion(
            "No linear region found in "+(series.name.empty()?string("the data"):series.name)
            +". Please check the input file and the tolerance."
        );
    if(window.last >= (long)series.size())
        throw invalid_argument(
            (boost::format("Window %1% not included in [0,%2%]") % window % (series.size()-1)).str()
        );
    if(window.last < window.first+1)
        throw InsufficientData("Not enough data points for linear regression.");

    if(series.hasErrors(window.first, window.last))
        return weightedLeastSquares(series, window.first, window.last);
    return ordinaryLeastSquares(series, window.first, window.last);
}
