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


 * \file saveTable.hpp
 * \brief Defines utility function to save table
 * \author Mathieu Leocmach
 *
 */

#ifndef save_table_H
#define save_table_H

#include <string>
#include <iostream>
#include <fstream>
#include <stdexcept>

namespace MSDiff
{
    /**
        \brief saving a range of columns of equal length into a single tab separated file.
        The header line is prefixed by '#'.
    */
    template <class InputIterator>
    void saveTable(InputIterator first, InputIterator last, const std::string &filename, const std::string &header)
    {
        std::ofstream output(filename.c_str(), std::ios::out | std::ios::trunc);
        if(!output)
            throw std::invalid_argument("Cannot write to "+filename);
        output << "#" << header << std::endl;
        if(first==last)
            return;
        for(size_t r=0; r<(*first).size(); ++r)
        {
            InputIterator it = first;
            output << (*it)[r];
            while(++it != last)
                output << "\t" << (*it)[r];
            output << std::endl;
        }
    }
};
#endif
