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


 * \file transport.hpp
 * \brief Defines the transport coefficients and their corrections
 * \author Mathieu Leocmach
 *
 * Units: lengths in pm, times in ps, diffusion coefficients in 10^-12 m^2/s,
 * viscosities in Pa s on input and mPa s on output, temperatures in K.
 *
 * Finite size constants from Busch, Paschek, J. Phys. Chem. B 2023, https://doi.org/10.1021/acs.jpcb.3c04492
 *
 */

#ifndef transport_H
#define transport_H

#include "linearFit.hpp"

namespace MSDiff
{
    /** \brief Boltzmann constant in J/K */
    const double kBoltzmann = 1.38064852e-23;
    /** \brief dimensionless finite size constant of a cubic box */
    const double zetaHummer = 2.8372974795;
    /** \brief dimensionless finite size constant along z of an OrthoBoXY tetragonal box */
    const double zetaZZ = 8.1711245653;

    /** \brief A value and its standard deviation */
    struct Estimate
    {
        double value, error;

        explicit Estimate(const double &value=0.0, const double &error=0.0) : value(value), error(error){};
    };

    //first order error propagation for independent quantities
    Estimate operator+(const Estimate &a, const Estimate &b);
    Estimate operator-(const Estimate &a, const Estimate &b);
    Estimate operator/(const Estimate &f, const Estimate &g);
    Estimate operator*(const Estimate &a, const double &s);
    Estimate operator/(const Estimate &a, const double &s);

    Estimate diffusionCoefficient(const LinearFit &fit, const size_t &dimensions);
    Estimate hummerCorrection(const double &temperature, const double &viscosity, const double &boxLength, const double &deltaViscosity, const double &zeta=zetaHummer);
    Estimate orthoboxyViscosity(const Estimate &diffusionXY, const Estimate &diffusionZ, const double &temperature, const double &boxLengthZ);
    Estimate meanAndSEM(const std::vector<double> &replicates);
};
#endif
