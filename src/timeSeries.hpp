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


 * \file timeSeries.hpp
 * \brief Defines the time series consumed by the linear region finder and the fits
 * \author Mathieu Leocmach
 *
 * A time series is an ordered list of (time, value, standard error) samples,
 * typically a mean square displacement or a cumulative conductivity integral.
 *
 */

#ifndef time_series_H
#define time_series_H

#include <string>
#include <vector>
#include <iostream>

namespace MSDiff
{
    /** \brief One row of a time series */
    struct Sample
    {
        double time, value, error;

        explicit Sample(const double &t=0.0, const double &v=0.0, const double &e=0.0) :
            time(t), value(v), error(e){};
    };

    /**
        \brief Samples strictly increasing in time, indexed by position.
        Position 0 is usually the zero time point.
    */
    class TimeSeries : public std::vector<Sample>
    {
        public:
            /** \brief name of the data column the series comes from */
            std::string name;

            explicit TimeSeries(const std::string &name="") : std::vector<Sample>(), name(name){};
            TimeSeries(const std::vector<double> &times, const std::vector<double> &values, const std::string &name="");
            TimeSeries(const std::vector<double> &times, const std::vector<double> &values, const std::vector<double> &errors, const std::string &name="");

            bool hasErrors() const;
            bool hasErrors(const size_t &first, const size_t &last) const;
            void clearErrors();
            TimeSeries slice(const size_t &first, const size_t &last) const;
            void checkOrdering() const;

            std::vector<double> times() const;
            std::vector<double> values() const;
    };

    std::ostream& operator<< (std::ostream& os, const TimeSeries &s);
};
#endif
