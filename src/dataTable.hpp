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


 * \file dataTable.hpp
 * \brief Defines the reader of semicolon separated tables
 * \author Mathieu Leocmach
 *
 * The first line is a header naming the columns, it sets the number of columns.
 * A leading '#' of the header is ignored.
 *
 */

#ifndef data_table_H
#define data_table_H

#include "timeSeries.hpp"

namespace MSDiff
{
    /** \brief Numeric columns of a semicolon separated file */
    class DataTable
    {
        public:
            /** \brief name of the file (or stream) the table comes from */
            std::string source;
            std::vector<std::string> header;
            std::vector<std::vector<double> > columns;

            explicit DataTable(const std::string &filename);
            DataTable(std::istream &input, const std::string &source);

            size_t nbColumns() const {return header.size();}
            size_t nbRows() const {return columns.empty()?0:columns.front().size();}

            TimeSeries series(const size_t &valueColumn, const std::string &name) const;
            TimeSeries series(const size_t &valueColumn, const size_t &errorColumn, const std::string &name) const;

        private:
            void read(std::istream &input);
            void checkColumn(const size_t &c) const;
    };

    std::string trim(const std::string &s);
};
#endif
