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


 * \file diffusion.hpp
 * \brief Defines the self-diffusion analysis of mean square displacements
 * \author Mathieu Leocmach
 *
 */

#ifndef diffusion_H
#define diffusion_H

#include "analysis.hpp"
#include "dataTable.hpp"
#include "transport.hpp"

namespace MSDiff
{
    /** \brief Edges of an orthorhombic simulation box in pm */
    struct Box
    {
        double x, y, z;

        explicit Box(const double &x=0.0, const double &y=0.0, const double &z=0.0) : x(x), y(y), z(z){};
        bool isCubic() const {return x==y && y==z;}
    };
    Box boxFromLengths(const std::vector<double> &lengths);

    /** \brief Physical parameters of a diffusion analysis */
    struct DiffusionParameters
    {
        /** \brief in K */
        double temperature;
        /** \brief in Pa s */
        double viscosity, deltaViscosity;
        Box box;
        size_t dimensions;
        RegionOptions region;

        DiffusionParameters() :
            temperature(353.15), viscosity(0.00787), deltaViscosity(0.0), box(),
            dimensions(3), region(0.05, diffusiveExponent){};
    };

    /**
        \brief Mean square displacements read from a table.
        The primary series is the single MSD or the total over all molecules.
    */
    struct MSDInput
    {
        TimeSeries primary;
        std::vector<TimeSeries> molecules;

        static MSDInput fromTable(const DataTable &table, const bool &average=false);
        size_t nbMolecules() const {return molecules.empty()?1:molecules.size();}
    };

    /** \brief Outcome of a diffusion analysis */
    struct DiffusionResults
    {
        size_t dimensions;
        ColumnResult primary;
        Estimate diffusion;
        /** \brief finite size correction, zero for a non cubic box */
        Estimate hummer;

        std::vector<ColumnResult> molecules;
        std::vector<Estimate> moleculeDiffusion;
        /** \brief mean and standard error of the mean over the successful molecules */
        Estimate moleculeMean;
        size_t nbSucceeded;

        bool orthoboxy;
        ColumnResult zColumn;
        Estimate diffusionZ;
        /** \brief in mPa s */
        Estimate viscosity;

        DiffusionResults() : dimensions(3), nbSucceeded(0), orthoboxy(false){};
    };

    /** \brief Self-diffusion coefficients from mean square displacements */
    class DiffusionAnalysis
    {
        public:
            DiffusionParameters parameters;
            bool quiet;

            explicit DiffusionAnalysis(const DiffusionParameters &parameters, const bool &quiet=false);

            DiffusionResults run(const MSDInput &input) const;
            DiffusionResults run(const MSDInput &input, const MSDInput &zInput) const;

        private:
            void warnIfThin(const ColumnResult &column) const;
    };

    void printResults(std::ostream &os, const DiffusionResults &results);
    void exportResults(const DiffusionResults &results, const std::string &prefix);
};
#endif
