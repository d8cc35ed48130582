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

#include "options.hpp"
#include "conductivity.hpp"
#include <boost/program_options.hpp>

namespace po = boost::program_options;
using namespace std;
using namespace MSDiff;

int main(int argc, char ** argv)
{
    try
    {
        const ConductivityConfig cfg = parseConductivityCommandLine(argc, argv);
        if(cfg.version)
        {
            cout << "msdiff_conductivity " << versionString() << endl;
            return EXIT_SUCCESS;
        }
        if(cfg.help)
        {
            ConductivityConfig dummy;
            po::options_description desc("Options");
            addConductivityOptions(desc, dummy);
            cout << "msdiff_conductivity input [options]\n";
            cout << "Ionic conductivity contributions and transport numbers from cumulative integrals\n";
            cout << desc << "\n";
            return EXIT_SUCCESS;
        }

        const ConductivityAnalysis analysis(cfg.tolerance, cfg.exponent, cfg.quiet);
        const vector<TimeSeries> contributions = contributionSeries(DataTable(cfg.filename));
        if(!cfg.quiet)
            cout << contributions.size() << " contribution(s) in " << cfg.filename << endl;

        const ConductivityResults results = analysis.run(contributions);
        printResults(cout, results);
        exportResults(results, cfg.output);
        if(!cfg.quiet)
            cout << "Results written to " << cfg.output << "_cond.csv" << endl;
        if(cfg.plot)
            for(size_t c=0; c<contributions.size(); ++c)
                exportFit(contributions[c], results.contributions[c], cfg.output+"_"+contributions[c].name+"_fit.dat");
    }
    catch(const exception &e)
    {
        cerr<< e.what()<<endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
