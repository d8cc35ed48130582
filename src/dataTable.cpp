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

#include "dataTable.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/format.hpp>
#include <boost/tokenizer.hpp>

using namespace std;
using namespace MSDiff;

typedef boost::tokenizer<boost::char_separator<char> > Tokenizer;

/** @brief remove leading and trailing blanks */
std::string MSDiff::trim(const std::string &s)
{
    const string blanks(" \t\r\n");
    const size_t b = s.find_first_not_of(blanks);
    if(b==string::npos)
        return "";
    return s.substr(b, s.find_last_not_of(blanks)-b+1);
}

/** @brief Constructor from file  */
DataTable::DataTable(const std::string &filename) : source(filename)
{
    ifstream input(filename.c_str(), ios::in);
    if(!input)
        throw invalid_argument("No such file as "+filename);
    read(input);
}

/** @brief Constructor from an already opened stream  */
DataTable::DataTable(std::istream &input, const std::string &source) : source(source)
{
    read(input);
}

void DataTable::read(std::istream &input)
{
    //keep empty tokens to detect missing fields
    boost::char_separator<char> sep(";", "", boost::keep_empty_tokens);
    string line;
    if(!getline(input, line))
        throw invalid_argument(source+" is empty");
    {
        Tokenizer tok(line, sep);
        for(Tokenizer::iterator it=tok.begin(); it!=tok.end(); ++it)
            header.push_back(trim(*it));
    }
    if(!header.empty() && !header.front().empty() && header.front()[0]=='#')
        header.front() = trim(header.front().substr(1));
    columns.assign(header.size(), vector<double>());

    size_t lineNumber = 1;
    while(getline(input, line))
    {
        ++lineNumber;
        if(trim(line).empty())
            continue;
        Tokenizer tok(line, sep);
        size_t c = 0;
        for(Tokenizer::iterator it=tok.begin(); it!=tok.end(); ++it, ++c)
        {
            if(c>=header.size())
                throw invalid_argument(
                    (boost::format("%1%:%2%: more than %3% columns") % source % lineNumber % header.size()).str()
                );
            istringstream field(trim(*it));
            double v;
            field >> v;
            if(field.fail() || !field.eof())
                throw invalid_argument(
                    (boost::format("%1%:%2%: \"%3%\" is not a number") % source % lineNumber % trim(*it)).str()
                );
            columns[c].push_back(v);
        }
        if(c!=header.size())
            throw invalid_argument(
                (boost::format("%1%:%2%: %3% columns instead of %4%") % source % lineNumber % c % header.size()).str()
            );
    }
}

void DataTable::checkColumn(const size_t &c) const
{
    if(c>=nbColumns())
        throw invalid_argument(
            (boost::format("%1%: no column %2%, the table has %3% columns") % source % c % nbColumns()).str()
        );
}

/** @brief Time series made of the first column (time) and the given value column */
TimeSeries DataTable::series(const size_t &valueColumn, const std::string &name) const
{
    checkColumn(valueColumn);
    TimeSeries s(columns.front(), columns[valueColumn], name);
    s.checkOrdering();
    return s;
}

/** @brief Time series made of the first column (time), the given value column and error column */
TimeSeries DataTable::series(const size_t &valueColumn, const size_t &errorColumn, const std::string &name) const
{
    checkColumn(valueColumn);
    checkColumn(errorColumn);
    TimeSeries s(columns.front(), columns[valueColumn], columns[errorColumn], name);
    s.checkOrdering();
    return s;
}
