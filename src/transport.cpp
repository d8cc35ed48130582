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

#include "transport.hpp"
#include "errors.hpp"
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <boost/math/constants/constants.hpp>

using namespace std;
using namespace MSDiff;

Estimate MSDiff::operator+(const Estimate &a, const Estimate &b)
{
    return Estimate(a.value + b.value, sqrt(a.error*a.error + b.error*b.error));
}

Estimate MSDiff::operator-(const Estimate &a, const Estimate &b)
{
    return Estimate(a.value - b.value, sqrt(a.error*a.error + b.error*b.error));
}

Estimate MSDiff::operator/(const Estimate &f, const Estimate &g)
{
    return Estimate(
        f.value / g.value,
        sqrt(pow(f.error/g.value, 2) + pow(f.value*g.error/(g.value*g.value), 2))
    );
}

Estimate MSDiff::operator*(const Estimate &a, const double &s)
{
    return Estimate(a.value*s, a.error*fabs(s));
}

Estimate MSDiff::operator/(const Estimate &a, const double &s)
{
    return Estimate(a.value/s, a.error/fabs(s));
}

/** @brief Diffusion coefficient from the slope of a mean square displacement in the given number of dimensions */
Estimate MSDiff::diffusionCoefficient(const LinearFit &fit, const size_t &dimensions)
{
    if(dimensions<1 || dimensions>3)
        throw invalid_argument("diffusionCoefficient: dimensions should be 1, 2 or 3");
    return Estimate(fit.slope, fit.slopeError) / (2.0*dimensions);
}

/**
    @brief Hummer correction term to extrapolate the diffusion coefficient to infinite box size.

    \param temperature in K
    \param viscosity dynamic viscosity in Pa s
    \param boxLength in pm
    \param deltaViscosity uncertainty of the viscosity in Pa s
    \param zeta dimensionless constant of the box geometry
    \return correction term and its uncertainty in 10^-12 m^2/s
*/
Estimate MSDiff::hummerCorrection(const double &temperature, const double &viscosity, const double &boxLength, const double &deltaViscosity, const double &zeta)
{
    const double pi = boost::math::constants::pi<double>();
    const double k = kBoltzmann * zeta * temperature * 1e24;
    return Estimate(
        k / (6.0 * pi * viscosity * boxLength),
        k * deltaViscosity / (6.0 * pi * viscosity*viscosity * boxLength)
    );
}

/**
    @brief Shear viscosity from the anisotropy of diffusion in a tetragonal box (OrthoBoXY).

    \param diffusionXY diffusion coefficient in the xy plane, 10^-12 m^2/s
    \param diffusionZ diffusion coefficient along z, 10^-12 m^2/s
    \param boxLengthZ box length along z in pm
    \return viscosity and its uncertainty in mPa s
*/
Estimate MSDiff::orthoboxyViscosity(const Estimate &diffusionXY, const Estimate &diffusionZ, const double &temperature, const double &boxLengthZ)
{
    const double pi = boost::math::constants::pi<double>();
    const Estimate difference = diffusionXY - diffusionZ;
    const double k = kBoltzmann * zetaZZ * temperature * 1e24;
    return Estimate(
        k / (6.0 * pi * boxLengthZ * difference.value) * 1e3,
        k / (6.0 * pi * boxLengthZ * difference.value*difference.value) * difference.error * 1e3
    );
}

/** @brief Mean of the replicates and standard error of the mean (population standard deviation over sqrt(n)) */
Estimate MSDiff::meanAndSEM(const std::vector<double> &replicates)
{
    if(replicates.empty())
        throw InsufficientData("meanAndSEM: no replicate to average");
    const double n = replicates.size();
    const double mean = accumulate(replicates.begin(), replicates.end(), 0.0) / n;
    double sq = 0.0;
    for(size_t i=0; i<replicates.size(); ++i)
        sq += pow(replicates[i]-mean, 2);
    return Estimate(mean, sqrt(sq/n)/sqrt(n));
}
