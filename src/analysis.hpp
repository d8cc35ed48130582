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


 * \file analysis.hpp
 * \brief Defines the linear analysis of one data column
 * \author Mathieu Leocmach
 *
 */

#ifndef analysis_H
#define analysis_H

#include "linearFit.hpp"

namespace MSDiff
{
    /** \brief Linear region and fit of one column, or the reason why it failed */
    struct ColumnResult
    {
        std::string name;
        Window window;
        LinearFit fit;
        /** \brief times at the ends of the window */
        double tStart, tEnd;
        /** \brief empty if the column was fitted */
        std::string failure;

        explicit ColumnResult(const std::string &name="") : name(name), window(), fit(), tStart(0.0), tEnd(0.0){};

        bool succeeded() const {return failure.empty();}
    };

    ColumnResult fitColumn(const TimeSeries &series, const RegionOptions &options);
    ColumnResult fitColumn(const TimeSeries &series, const Window &window);
    ColumnResult tryFitColumn(const TimeSeries &series, const RegionOptions &options);
    void exportFit(const TimeSeries &series, const ColumnResult &result, const std::string &filename);
};
#endif
