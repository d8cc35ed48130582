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
#include "errors.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/format.hpp>
#include <boost/tokenizer.hpp>

namespace po = boost::program_options;
using namespace std;
using namespace MSDiff;

namespace
{
    const double minTolerance = 0.001, maxTolerance = 0.3;
    const double minBoxLength = 500.0;
    const double minTemperature = 200.0;

    void checkTolerance(const double &tolerance)
    {
        if(tolerance<minTolerance || tolerance>maxTolerance)
            throw invalid_argument(
                (boost::format("Tolerance %1% not in [%2%,%3%]") % tolerance % minTolerance % maxTolerance).str()
            );
    }

    void checkBox(const Box &box)
    {
        if(box.x<minBoxLength || box.y<minBoxLength || box.z<minBoxLength)
            throw invalid_argument(
                (boost::format("Box lengths (%1%, %2%, %3%) pm: each should be at least %4% pm") % box.x % box.y % box.z % minBoxLength).str()
            );
    }
}

std::string MSDiff::versionString()
{
    return MSDIFF_VERSION;
}

DiffusionConfig::DiffusionConfig() :
    output("msdiff"), fromTravis(false), average(false), plot(false), quiet(false), help(false), version(false),
    temperature(353.15), viscosity(0.00787), deltaViscosity(0.0), tolerance(0.05), dimensions(3)
{
}

/** @brief throws invalid_argument if the configuration cannot drive an analysis */
void DiffusionConfig::validate() const
{
    if(filename.empty())
        throw invalid_argument("No input file given");
    checkTolerance(tolerance);
    if(temperature<minTemperature)
        throw invalid_argument((boost::format("Temperature %1% K below %2% K") % temperature % minTemperature).str());
    if(!(viscosity>0.0))
        throw invalid_argument((boost::format("Viscosity %1% Pa s should be positive") % viscosity).str());
    if(deltaViscosity<0.0)
        throw invalid_argument((boost::format("Viscosity uncertainty %1% Pa s should not be negative") % deltaViscosity).str());
    if(dimensions<1 || dimensions>3)
        throw invalid_argument((boost::format("Dimensions %1% not in {1, 2, 3}") % dimensions).str());
    if(!fromTravis)
    {
        if(lengths.empty())
            throw invalid_argument("Box length not given, use --len or --from-travis");
        if(lengths.size()>3)
            throw invalid_argument("Too many box lengths given");
        checkBox(boxFromLengths(lengths));
    }
}

/** @brief Box read from travis.log next to the input file, or built from the given lengths */
Box DiffusionConfig::resolveBox() const
{
    const Box box = fromTravis ? readTravisBox(travisLogPath(filename)) : boxFromLengths(lengths);
    checkBox(box);
    if(orthoboxy() && box.isCubic())
        throw invalid_argument("Cubic box does not make sense for OrthoBoXY");
    return box;
}

/** @brief Physical parameters of the analysis. OrthoBoXY forces 2 dimensions. */
DiffusionParameters DiffusionConfig::parameters() const
{
    validate();
    DiffusionParameters p;
    p.temperature = temperature;
    p.viscosity = viscosity;
    p.deltaViscosity = deltaViscosity;
    p.box = resolveBox();
    p.dimensions = orthoboxy() ? 2 : dimensions;
    p.region = RegionOptions(tolerance, diffusiveExponent);
    return p;
}

void MSDiff::addDiffusionOptions(po::options_description &desc, DiffusionConfig &cfg)
{
    desc.add_options()
        ("help,h", "produce help message")
        ("version", "print version")
        ("file,f", po::value<string>(&cfg.filename), "input file of mean square displacements, semicolon separated")
        ("len,l", po::value< vector<double> >(&cfg.lengths)->multitoken(), "box length(s) in pm: L for a cubic box, a b for (a,a,b), a b c; give the input file before -l or with -f")
        ("from-travis", "read the box lengths from travis.log in the directory of the input file")
        ("temp,t", po::value<double>(&cfg.temperature)->default_value(353.15), "temperature in K")
        ("visco,v", po::value<double>(&cfg.viscosity)->default_value(0.00787), "viscosity in Pa s")
        ("d_visco", po::value<double>(&cfg.deltaViscosity)->default_value(0.0), "uncertainty of the viscosity in Pa s")
        ("tol", po::value<double>(&cfg.tolerance)->default_value(0.05), "tolerance on the log-log slope")
        ("dim,d", po::value<int>(&cfg.dimensions)->default_value(3), "number of dimensions of the MSD")
        ("avg", "the third column is the standard error of an averaged MSD")
        ("orthoboxy", po::value<string>(&cfg.orthoboxyFile), "file of the MSD along z, the input being the MSD in the xy plane")
        ("output,o", po::value<string>(&cfg.output)->default_value("msdiff"), "output prefix")
        ("plot,p", "export the fitted data")
        ("quiet,q", "no informative output")
        ;
}

/** @brief Parse and validate the command line of the self-diffusion tool */
DiffusionConfig MSDiff::parseDiffusionCommandLine(int argc, const char* const argv[])
{
    DiffusionConfig cfg;
    po::options_description desc("Options");
    addDiffusionOptions(desc, cfg);
    po::positional_options_description pd;
    pd.add("file", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(pd).run(), vm);
    po::notify(vm);
    cfg.help = vm.count("help");
    cfg.version = vm.count("version");
    cfg.fromTravis = vm.count("from-travis");
    cfg.average = vm.count("avg");
    cfg.plot = vm.count("plot");
    cfg.quiet = vm.count("quiet");
    if(!cfg.help && !cfg.version)
        cfg.validate();
    return cfg;
}

ConductivityConfig::ConductivityConfig() :
    output("msdiff"), tolerance(0.05), exponent(conductiveExponent), plot(false), quiet(false), help(false), version(false)
{
}

void ConductivityConfig::validate() const
{
    if(filename.empty())
        throw invalid_argument("No input file given");
    checkTolerance(tolerance);
    if(!(exponent>0.0))
        throw invalid_argument((boost::format("Exponent %1% should be positive") % exponent).str());
}

void MSDiff::addConductivityOptions(po::options_description &desc, ConductivityConfig &cfg)
{
    desc.add_options()
        ("help,h", "produce help message")
        ("version", "print version")
        ("file,f", po::value<string>(&cfg.filename), "input file of cumulative conductivity integrals, semicolon separated")
        ("tol", po::value<double>(&cfg.tolerance)->default_value(0.05), "tolerance on the log-log slope")
        ("exponent", po::value<double>(&cfg.exponent)->default_value(conductiveExponent), "expected log-log slope in the linear regime")
        ("output,o", po::value<string>(&cfg.output)->default_value("msdiff"), "output prefix")
        ("plot,p", "export the fitted data")
        ("quiet,q", "no informative output")
        ;
}

/** @brief Parse and validate the command line of the conductivity tool */
ConductivityConfig MSDiff::parseConductivityCommandLine(int argc, const char* const argv[])
{
    ConductivityConfig cfg;
    po::options_description desc("Options");
    addConductivityOptions(desc, cfg);
    po::positional_options_description pd;
    pd.add("file", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(pd).run(), vm);
    po::notify(vm);
    cfg.help = vm.count("help");
    cfg.version = vm.count("version");
    cfg.plot = vm.count("plot");
    cfg.quiet = vm.count("quiet");
    if(!cfg.help && !cfg.version)
        cfg.validate();
    return cfg;
}

/** @brief travis.log in the directory of the input file */
std::string MSDiff::travisLogPath(const std::string &inputFile)
{
    const size_t slash = inputFile.find_last_of("/");
    if(slash==string::npos)
        return "travis.log";
    return inputFile.substr(0, slash+1)+"travis.log";
}

/**
    @brief Box lengths from a TRAVIS log.
    They are the 3rd, 7th and 11th words of the second line after "Found cell geometry data in trajectory file".
    When the log reports several geometries, the last one is used.
*/
Box MSDiff::readTravisBox(const std::string &logFile)
{
    ifstream log(logFile.c_str(), ios::in);
    if(!log)
        throw MissingAuxiliaryFile(logFile+" not found");
    string line;
    Box box;
    bool found = false;
    while(getline(log, line))
        if(line.find("Found cell geometry data in trajectory file")!=string::npos)
        {
            if(!getline(log, line) || !getline(log, line))
                break;
            boost::char_separator<char> sep(" \t\r");
            boost::tokenizer<boost::char_separator<char> > tok(line, sep);
            vector<string> words(tok.begin(), tok.end());
            if(words.size()<11)
                throw invalid_argument(logFile+": cannot read the box lengths in \""+line+"\"");
            double l[3];
            const size_t positions[3] = {2, 6, 10};
            for(size_t d=0; d<3; ++d)
            {
                istringstream word(words[positions[d]]);
                word >> l[d];
                if(word.fail())
                    throw invalid_argument(logFile+": \""+words[positions[d]]+"\" is not a box length");
            }
            box = Box(l[0], l[1], l[2]);
            found = true;
        }
    if(!found)
        throw invalid_argument(logFile+": no cell geometry found");
    return box;
}
