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


 * \file linearFit.hpp
 * \brief Defines the least squares fit of value = slope * time + intercept
 * \author Mathieu Leocmach
 *
 */

#ifndef linear_fit_H
#define linear_fit_H

#include "linearRegion.hpp"

namespace MSDiff
{
    /** \brief below this number of points a fit is statistically thin */
    const size_t thinFitThreshold = 100;

    /** \brief Result of a linear fit */
    struct LinearFit
    {
        double slope, slopeError, intercept, rsquared;
        size_t nbPoints;
        bool weighted;

        LinearFit() : slope(0.0), slopeError(0.0), intercept(0.0), rsquared(0.0), nbPoints(0), weighted(false){};

        bool isThin() const {return nbPoints < thinFitThreshold;}
        double operator()(const double &t) const {return slope*t + intercept;}
    };

    LinearFit ordinaryLeastSquares(const TimeSeries &series, const size_t &first, const size_t &last);
    LinearFit weightedLeastSquares(const TimeSeries &series, const size_t &first, const size_t &last);
    LinearFit fitWindow(const TimeSeries &series, const Window &window);
};
#endif
