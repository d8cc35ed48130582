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

#include "timeSeries.hpp"
#include <stdexcept>
#include <boost/format.hpp>

using namespace std;
using namespace MSDiff;

/** @brief Constructor from time and value columns, with zero errors  */
TimeSeries::TimeSeries(const std::vector<double> &times, const std::vector<double> &values, const std::string &name) :
    std::vector<Sample>(), name(name)
{
    if(times.size()!=values.size())
        throw invalid_argument("TimeSeries: time and value columns have different lengths");
    this->reserve(times.size());
    for(size_t i=0; i<times.size(); ++i)
        this->push_back(Sample(times[i], values[i]));
}

/** @brief Constructor from time, value and error columns  */
TimeSeries::TimeSeries(const std::vector<double> &times, const std::vector<double> &values, const std::vector<double> &errors, const std::string &name) :
    std::vector<Sample>(), name(name)
{
    if(times.size()!=values.size() || times.size()!=errors.size())
        throw invalid_argument("TimeSeries: time, value and error columns have different lengths");
    this->reserve(times.size());
    for(size_t i=0; i<times.size(); ++i)
        this->push_back(Sample(times[i], values[i], errors[i]));
}

/** @brief true if any sample carries a non zero error */
bool TimeSeries::hasErrors() const
{
    return !empty() && hasErrors(0, size()-1);
}

/** @brief true if any sample between first and last (inclusive) carries a non zero error */
bool TimeSeries::hasErrors(const size_t &first, const size_t &last) const
{
    for(size_t i=first; i<=last && i<size(); ++i)
        if((*this)[i].error != 0.0)
            return true;
    return false;
}

/** @brief set all errors to zero */
void TimeSeries::clearErrors()
{
    for(iterator s=begin(); s!=end(); ++s)
        s->error = 0.0;
}

/** @brief copy of the samples between first and last (inclusive) */
TimeSeries TimeSeries::slice(const size_t &first, const size_t &last) const
{
    if(first>last || last>=size())
        throw invalid_argument(
            (boost::format("TimeSeries::slice: [%1%,%2%] not included in [0,%3%]") % first % last % (size()-1)).str()
        );
    TimeSeries s(name);
    s.assign(begin()+first, begin()+last+1);
    return s;
}

/** @brief throws if the times are not strictly increasing */
void TimeSeries::checkOrdering() const
{
    for(size_t i=1; i<size(); ++i)
        if(!((*this)[i-1].time < (*this)[i].time))
            throw invalid_argument(
                (boost::format("TimeSeries %1%: time is not strictly increasing at position %2%") % name % i).str()
            );
}

std::vector<double> TimeSeries::times() const
{
    vector<double> t(size());
    for(size_t i=0; i<size(); ++i)
        t[i] = (*this)[i].time;
    return t;
}

std::vector<double> TimeSeries::values() const
{
    vector<double> v(size());
    for(size_t i=0; i<size(); ++i)
        v[i] = (*this)[i].value;
    return v;
}

std::ostream& MSDiff::operator<< (std::ostream& os, const TimeSeries &s)
{
    os<<"#t\t"<<(s.name.empty()?"value":s.name)<<"\terror\n";
    for(TimeSeries::const_iterator it=s.begin(); it!=s.end(); ++it)
        os<<it->time<<"\t"<<it->value<<"\t"<<it->error<<"\n";
    return os;
}
