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


 * \file errors.hpp
 * \brief Defines the exceptions raised by the analysis
 * \author Mathieu Leocmach
 *
 */

#ifndef errors_H
#define errors_H

#include <stdexcept>
#include <string>

namespace MSDiff
{
    /** \brief No time window of the series behaves diffusively within tolerance */
    class NoLinearRegion : public std::runtime_error
    {
        public:
            explicit NoLinearRegion(const std::string &what) : std::runtime_error(what){};
    };

    /** \brief Not enough data points to perform the requested operation */
    class InsufficientData : public std::runtime_error
    {
        public:
            explicit InsufficientData(const std::string &what) : std::runtime_error(what){};
    };

    /** \brief A companion file needed by the analysis does not exist */
    class MissingAuxiliaryFile : public std::runtime_error
    {
        public:
            explicit MissingAuxiliaryFile(const std::string &what) : std::runtime_error(what){};
    };
};
#endif
