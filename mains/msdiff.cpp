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
#include "diffusion.hpp"
#include <boost/program_options.hpp>

namespace po = boost::program_options;
using namespace std;
using namespace MSDiff;

int main(int argc, char ** argv)
{
    try
    {
        const DiffusionConfig cfg = parseDiffusionCommandLine(argc, argv);
        if(cfg.version)
        {
            cout << "msdiff " << versionString() << endl;
            return EXIT_SUCCESS;
        }
        if(cfg.help)
        {
            DiffusionConfig dummy;
            po::options_description desc("Options");
            addDiffusionOptions(desc, dummy);
            cout << "msdiff input -l length [options]\n";
            cout << "the input file goes before -l, or is given with -f\n";
            cout << "Self-diffusion coefficient from the linear regime of a mean square displacement\n";
            cout << desc << "\n";
            return EXIT_SUCCESS;
        }

        const DiffusionAnalysis analysis(cfg.parameters(), cfg.quiet);
        const MSDInput input = MSDInput::fromTable(DataTable(cfg.filename), cfg.average);
        if(!cfg.quiet)
            cout << input.nbMolecules() << " molecule(s) in " << cfg.filename << endl;

        DiffusionResults results;
        if(cfg.orthoboxy())
            results = analysis.run(input, MSDInput::fromTable(DataTable(cfg.orthoboxyFile), cfg.average));
        else
            results = analysis.run(input);

        printResults(cout, results);
        exportResults(results, cfg.output);
        if(!cfg.quiet)
            cout << "Results written to " << cfg.output << "_out.csv" << endl;
        if(cfg.plot)
            exportFit(input.primary, results.primary, cfg.output+"_fit.dat");
    }
    catch(const exception &e)
    {
        cerr<< e.what()<<endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
