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


 * \file options.hpp
 * \brief Defines the command line configuration of the tools
 * \author Mathieu Leocmach
 *
 */

#ifndef options_H
#define options_H

#include "diffusion.hpp"
#include <boost/program_options.hpp>

namespace MSDiff
{
    /** \brief version of the tools, set at build time */
    std::string versionString();

    /** \brief Configuration of the self-diffusion tool */
    struct DiffusionConfig
    {
        std::string filename, orthoboxyFile, output;
        /** \brief box lengths in pm */
        std::vector<double> lengths;
        bool fromTravis, average, plot, quiet, help, version;
        double temperature, viscosity, deltaViscosity, tolerance;
        int dimensions;

        DiffusionConfig();

        bool orthoboxy() const {return !orthoboxyFile.empty();}
        void validate() const;
        Box resolveBox() const;
        DiffusionParameters parameters() const;
    };
    void addDiffusionOptions(boost::program_options::options_description &desc, DiffusionConfig &cfg);
    DiffusionConfig parseDiffusionCommandLine(int argc, const char* const argv[]);

    /** \brief Configuration of the conductivity tool */
    struct ConductivityConfig
    {
        std::string filename, output;
        double tolerance, exponent;
        bool plot, quiet, help, version;

        ConductivityConfig();
        void validate() const;
    };
    void addConductivityOptions(boost::program_options::options_description &desc, ConductivityConfig &cfg);
    ConductivityConfig parseConductivityCommandLine(int argc, const char* const argv[]);

    std::string travisLogPath(const std::string &inputFile);
    Box readTravisBox(const std::string &logFile);
};
#endif
