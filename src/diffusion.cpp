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

#include "diffusion.hpp"
#include "errors.hpp"
#include <fstream>
#include <stdexcept>
#include <boost/format.hpp>

using namespace std;
using namespace MSDiff;

/**
    @brief Box from the lengths given by the user.
    One length: cubic box. Two lengths (a,b): (a,a,b). Three lengths: (a,b,c).
*/
Box MSDiff::boxFromLengths(const std::vector<double> &lengths)
{
    switch(lengths.size())
    {
        case 1: return Box(lengths[0], lengths[0], lengths[0]);
        case 2: return Box(lengths[0], lengths[0], lengths[1]);
        case 3: return Box(lengths[0], lengths[1], lengths[2]);
    }
    throw invalid_argument((boost::format("Box: %1% lengths given, 1 to 3 expected") % lengths.size()).str());
}

/**
    @brief Interpret the columns of a table of mean square displacements.

    2 columns: time and MSD.
    3 columns: time, MSD and either its derivative (ignored) or, if average, its standard error.
    More columns: time, total MSD and one MSD per molecule.
*/
MSDInput MSDiff::MSDInput::fromTable(const DataTable &table, const bool &average)
{
    const size_t ncols = table.nbColumns();
    if(ncols<2)
        throw invalid_argument(
            (boost::format("%1%: %2% column(s), at least time and MSD are needed") % table.source % ncols).str()
        );
    MSDInput input;
    const string primaryName = table.header[1].empty()?string("msd"):table.header[1];
    if(ncols==3 && average)
        input.primary = table.series(1, 2, primaryName);
    else
        input.primary = table.series(1, primaryName);

    if(ncols>3)
        for(size_t c=2; c<ncols; ++c)
            input.molecules.push_back(table.series(
                c,
                table.header[c].empty() ? (boost::format("msd_%1%") % (c-1)).str() : table.header[c]
            ));
    return input;
}

DiffusionAnalysis::DiffusionAnalysis(const DiffusionParameters &parameters, const bool &quiet) :
    parameters(parameters), quiet(quiet)
{
    this->parameters.region.check();
}

void DiffusionAnalysis::warnIfThin(const ColumnResult &column) const
{
    if(column.succeeded() && column.fit.isThin())
        cerr<<"Warning: only "<<column.fit.nbPoints<<" points in the linear fit of "<<column.name
            <<", the diffusion coefficient may be unreliable"<<endl;
}

/** @brief Diffusion coefficient of the primary series, of each molecule and finite size correction */
DiffusionResults DiffusionAnalysis::run(const MSDInput &input) const
{
    DiffusionResults res;
    res.dimensions = parameters.dimensions;

    //failure on the primary series aborts the analysis
    res.primary = fitColumn(input.primary, parameters.region);
    warnIfThin(res.primary);
    res.diffusion = diffusionCoefficient(res.primary.fit, res.dimensions);
    if(!quiet)
        cout<<"Linear region of "<<res.primary.name<<": "<<res.primary.window
            <<" from "<<res.primary.tStart<<" to "<<res.primary.tEnd<<" ps"<<endl;

    if(parameters.box.isCubic())
        res.hummer = hummerCorrection(parameters.temperature, parameters.viscosity, parameters.box.x, parameters.deltaViscosity);

    vector<double> replicates;
    for(size_t m=0; m<input.molecules.size(); ++m)
    {
        res.molecules.push_back(tryFitColumn(input.molecules[m], parameters.region));
        const ColumnResult &col = res.molecules.back();
        if(col.succeeded())
        {
            warnIfThin(col);
            res.moleculeDiffusion.push_back(diffusionCoefficient(col.fit, res.dimensions));
            replicates.push_back(res.moleculeDiffusion.back().value);
        }
        else
        {
            res.moleculeDiffusion.push_back(Estimate());
            cerr<<col.failure<<endl;
        }
    }
    res.nbSucceeded = replicates.size();
    if(!replicates.empty())
        res.moleculeMean = meanAndSEM(replicates);
    else if(!input.molecules.empty())
        cerr<<"Warning: no molecule could be fitted"<<endl;
    return res;
}

/**
    @brief OrthoBoXY analysis: input is the MSD in the xy plane, zInput the MSD along z.
    The z series is fitted over the linear region of the xy series.
*/
DiffusionResults DiffusionAnalysis::run(const MSDInput &input, const MSDInput &zInput) const
{
    if(parameters.box.isCubic())
        throw invalid_argument("OrthoBoXY needs a tetragonal box, not a cubic one");
    DiffusionAnalysis xy(*this);
    xy.parameters.dimensions = 2;
    if(!quiet && parameters.dimensions!=2)
        cout<<"OrthoBoXY: MSD in the xy plane, dimensions set to 2"<<endl;

    DiffusionResults res = xy.run(input);
    res.orthoboxy = true;
    res.zColumn = fitColumn(zInput.primary, res.primary.window);
    warnIfThin(res.zColumn);
    res.diffusionZ = diffusionCoefficient(res.zColumn.fit, 1);
    res.viscosity = orthoboxyViscosity(res.diffusion, res.diffusionZ, parameters.temperature, parameters.box.z);
    return res;
}

/** @brief Console summary */
void MSDiff::printResults(std::ostream &os, const DiffusionResults &results)
{
    os<<"  MSDiff Diffusion\n";
    os<<"  ================\n";
    os<<boost::format("Diffusion coefficient:      D_0 = (%15.6f +- %15.6f) * 10^-12 m^2/s\n")
        % results.diffusion.value % results.diffusion.error;
    if(results.orthoboxy)
        os<<boost::format("Diffusion coefficient (z):  D_z = (%15.6f +- %15.6f) * 10^-12 m^2/s\n")
            % results.diffusionZ.value % results.diffusionZ.error;
    os<<boost::format("Hummer correction term:     K   = (%15.6f +- %15.6f) * 10^-12 m^2/s\n")
        % results.hummer.value % results.hummer.error;
    if(results.orthoboxy)
        os<<boost::format("Viscosity:                  eta = (%15.6f +- %15.6f) * 10^-3 Pa s\n")
            % results.viscosity.value % results.viscosity.error;
    os<<boost::format("Fit: R^2 = %.6f, %d points from %g to %g ps\n")
        % results.primary.fit.rsquared % results.primary.fit.nbPoints % results.primary.tStart % results.primary.tEnd;

    if(!results.molecules.empty())
    {
        os<<boost::format("%15s %15s %15s %10s\n") % "molecule" % "D" % "delta_D" % "n_data";
        for(size_t m=0; m<results.molecules.size(); ++m)
            if(results.molecules[m].succeeded())
                os<<boost::format("%15s %15.6f %15.6f %10d\n") % results.molecules[m].name
                    % results.moleculeDiffusion[m].value % results.moleculeDiffusion[m].error
                    % results.molecules[m].fit.nbPoints;
            else
                os<<boost::format("%15s %15s\n") % results.molecules[m].name % "failed";
        if(results.nbSucceeded>0)
            os<<boost::format("Mean over %d molecules:     D   = (%15.6f +- %15.6f) * 10^-12 m^2/s\n")
                % results.nbSucceeded % results.moleculeMean.value % results.moleculeMean.error;
    }
    os.flush();
}

/**
    @brief Write prefix_out.csv and, if there are several molecules, prefix_molecules.csv.
*/
void MSDiff::exportResults(const DiffusionResults &results, const std::string &prefix)
{
    const string outName = prefix+"_out.csv";
    ofstream out(outName.c_str(), ios::out | ios::trunc);
    if(!out)
        throw invalid_argument("Cannot write to "+outName);
    out<<boost::format("%19s,%15s,%17s,%15s,%15s,%15s,%15s,%10s")
        % "D_0 / 10^-12 m^2/s" % "delta_D" % "K / 10^-12 m^2/s" % "delta_K" % "r2" % "t_start / ps" % "t_end / ps" % "n_data";
    if(results.orthoboxy)
        out<<boost::format(",%19s,%15s,%17s,%15s") % "D_z / 10^-12 m^2/s" % "delta_D_z" % "eta / 10^-3 Pa s" % "delta_eta";
    out<<"\n";
    out<<boost::format("%19.6f,%15.6f,%17.6f,%15.6f,%15.6f,%15.6f,%15.6f,%10d")
        % results.diffusion.value % results.diffusion.error % results.hummer.value % results.hummer.error
        % results.primary.fit.rsquared % results.primary.tStart % results.primary.tEnd % results.primary.fit.nbPoints;
    if(results.orthoboxy)
        out<<boost::format(",%19.6f,%15.6f,%17.6f,%15.6f")
            % results.diffusionZ.value % results.diffusionZ.error % results.viscosity.value % results.viscosity.error;
    out<<"\n";
    out.close();

    if(results.molecules.empty())
        return;
    const string molName = prefix+"_molecules.csv";
    ofstream mol(molName.c_str(), ios::out | ios::trunc);
    if(!mol)
        throw invalid_argument("Cannot write to "+molName);
    mol<<boost::format("%15s,%19s,%15s,%17s,%15s,%15s,%15s,%15s,%10s\n")
        % "molecule" % "D_0 / 10^-12 m^2/s" % "delta_D" % "K / 10^-12 m^2/s" % "delta_K" % "r2" % "t_start / ps" % "t_end / ps" % "n_data";
    for(size_t m=0; m<results.molecules.size(); ++m)
    {
        const ColumnResult &col = results.molecules[m];
        if(col.succeeded())
            mol<<boost::format("%15s,%19.6f,%15.6f,%17.6f,%15.6f,%15.6f,%15.6f,%15.6f,%10d\n")
                % col.name % results.moleculeDiffusion[m].value % results.moleculeDiffusion[m].error
                % results.hummer.value % results.hummer.error
                % col.fit.rsquared % col.tStart % col.tEnd % col.fit.nbPoints;
        else
            mol<<boost::format("%15s,%19s,%15s,%17s,%15s,%15s,%15s,%15s,%10s\n")
                % col.name % "nan" % "nan" % "nan" % "nan" % "nan" % "nan" % "nan" % 0;
    }
    if(results.nbSucceeded>0)
        mol<<boost::format("%15s,%19.6f,%15.6f,%17.6f,%15.6f,%15s,%15s,%15s,%10d\n")
            % "mean" % results.moleculeMean.value % results.moleculeMean.error
            % results.hummer.value % results.hummer.error % "" % "" % "" % results.nbSucceeded;
}
