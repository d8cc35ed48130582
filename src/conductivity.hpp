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


 * \file conductivity.hpp
 * \brief Defines the ionic conductivity analysis
 * \author Mathieu Leocmach
 *
 * Each contribution is a cumulative integral of collective displacements,
 * its slope in the linear regime is the contribution to the conductivity.
 * EH stands for Einstein-Helfand (all terms), NE for Nernst-Einstein (self terms only).
 *
 */

#ifndef conductivity_H
#define conductivity_H

#include "analysis.hpp"
#include "dataTable.hpp"
#include "transport.hpp"
#include <map>

namespace MSDiff
{
    const size_t nbContributions = 7;
    /** \brief canonical contribution names, in the column order of a headerless table */
    extern const char* const contributionNames[nbContributions];

    /** \brief Transport numbers and ionicity derived from the seven contributions */
    struct TransportNumbers
    {
        Estimate ionicity, anionIdeal, cationIdeal;
        Estimate anionCation, anion, cation;
        /** \brief false if the Nernst-Einstein conductivity is zero, ionicity and ideal numbers are then zero */
        bool ideal;

        TransportNumbers() : ideal(false){};
    };
    TransportNumbers transportNumbers(const std::map<std::string, Estimate> &sigma);

    /** \brief Outcome of a conductivity analysis */
    struct ConductivityResults
    {
        std::vector<ColumnResult> contributions;
        std::vector<Estimate> sigma;
        /** \brief only if all the canonical contributions were fitted */
        bool hasTransportNumbers;
        TransportNumbers numbers;

        ConductivityResults() : hasTransportNumbers(false){};
        std::map<std::string, Estimate> succeeded() const;
    };

    std::vector<TimeSeries> contributionSeries(const DataTable &table);
    size_t primaryContribution(const std::vector<TimeSeries> &contributions);

    /** \brief Conductivity contributions from cumulative integrals */
    class ConductivityAnalysis
    {
        public:
            RegionOptions region;
            bool quiet;

            explicit ConductivityAnalysis(const double &tolerance=0.05, const double &exponent=conductiveExponent, const bool &quiet=false);

            ConductivityResults run(const std::vector<TimeSeries> &contributions) const;
    };

    void printResults(std::ostream &os, const ConductivityResults &results);
    void exportResults(const ConductivityResults &results, const std::string &prefix);
};
#endif
