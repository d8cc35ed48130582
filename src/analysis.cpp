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

#include "analysis.hpp"
#include "errors.hpp"
#include "saveTable.hpp"

using namespace std;
using namespace MSDiff;

/** @brief Fit the series over a given window. Throws if the window is not usable. */
ColumnResult MSDiff::fitColumn(const TimeSeries &series, const Window &window)
{
    ColumnResult res(series.name);
    res.window = window;
    res.fit = fitWindow(series, window);
    res.tStart = series[window.first].time;
    res.tEnd = series[window.last].time;
    return res;
}

/** @brief Find the linear region of the series and fit it. Throws NoLinearRegion or InsufficientData. */
ColumnResult MSDiff::fitColumn(const TimeSeries &series, const RegionOptions &options)
{
    return fitColumn(series, findLinearRegion(series, options));
}

/** @brief As fitColumn, but the failure is recorded in the result instead of thrown */
ColumnResult MSDiff::tryFitColumn(const TimeSeries &series, const RegionOptions &options)
{
    try
    {
        return fitColumn(series, options);
    }
    catch(const NoLinearRegion &e)
    {
        ColumnResult res(series.name);
        res.failure = e.what();
        return res;
    }
    catch(const InsufficientData &e)
    {
        ColumnResult res(series.name);
        res.failure = e.what();
        return res;
    }
}

/**
    @brief Export the series, the fitted line and the window membership for plotting.
    Columns: time, value, fitted value, 1 inside the window 0 outside.
*/
void MSDiff::exportFit(const TimeSeries &series, const ColumnResult &result, const std::string &filename)
{
    vector< vector<double> > columns(4, vector<double>(series.size(), 0.0));
    for(size_t i=0; i<series.size(); ++i)
    {
        columns[0][i] = series[i].time;
        columns[1][i] = series[i].value;
        if(result.succeeded())
        {
            columns[2][i] = result.fit(series[i].time);
            columns[3][i] = ((long)i>=result.window.first && (long)i<=result.window.last)?1.0:0.0;
        }
    }
    saveTable(columns.begin(), columns.end(), filename, "t\t"+series.name+"\tfit\tinWindow");
}
