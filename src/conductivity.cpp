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

#include "conductivity.hpp"
#include "errors.hpp"
#include <fstream>
#include <stdexcept>
#include <boost/format.hpp>

using namespace std;
using namespace MSDiff;

const char* const MSDiff::contributionNames[nbContributions] = {
    "total_eh", "total_ne", "anion_tot", "anion_self", "cation_tot", "cation_self", "anion_cation"
};

namespace
{
    const Estimate& contribution(const std::map<std::string, Estimate> &sigma, const size_t &c)
    {
        std::map<std::string, Estimate>::const_iterator it = sigma.find(contributionNames[c]);
        if(it==sigma.end())
            throw invalid_argument(string("Transport numbers: missing contribution ")+contributionNames[c]);
        return it->second;
    }

    bool isCanonical(const std::string &name)
    {
        for(size_t c=0; c<nbContributions; ++c)
            if(name==contributionNames[c])
                return true;
        return false;
    }
}

/**
    @brief A posteriori quantities.

    ionicity = EH / NE, ideal transport numbers = self / NE,
    t_{+-} = cross / EH is attributed half to each ion: t_- = anion_tot / EH + t_{+-}/2.
*/
TransportNumbers MSDiff::transportNumbers(const std::map<std::string, Estimate> &sigma)
{
    const Estimate &eh = contribution(sigma, 0), &ne = contribution(sigma, 1),
        &anionTot = contribution(sigma, 2), &anionSelf = contribution(sigma, 3),
        &cationTot = contribution(sigma, 4), &cationSelf = contribution(sigma, 5),
        &cross = contribution(sigma, 6);
    if(eh.value==0.0)
        throw invalid_argument("Transport numbers: the Einstein-Helfand conductivity is zero");

    TransportNumbers t;
    t.ideal = (ne.value!=0.0);
    if(t.ideal)
    {
        t.ionicity = eh / ne;
        t.anionIdeal = anionSelf / ne;
        t.cationIdeal = cationSelf / ne;
    }
    else
        cerr<<"Warning: Nernst-Einstein conductivity is zero, ionicity and ideal transport numbers are not calculated"<<endl;

    t.anionCation = cross / eh;
    t.anion = anionTot / eh + t.anionCation * 0.5;
    t.cation = cationTot / eh + t.anionCation * 0.5;
    return t;
}

/** @brief conductivity of the contributions that could be fitted, by name */
std::map<std::string, Estimate> ConductivityResults::succeeded() const
{
    map<string, Estimate> s;
    for(size_t c=0; c<contributions.size(); ++c)
        if(contributions[c].succeeded())
            s.insert(make_pair(contributions[c].name, sigma[c]));
    return s;
}

/**
    @brief One series per value column of the table, named after the header.
    A table of exactly seven value columns not using the canonical names is read in the canonical order.
*/
std::vector<TimeSeries> MSDiff::contributionSeries(const DataTable &table)
{
    if(table.nbColumns()<2)
        throw invalid_argument(
            (boost::format("%1%: %2% column(s), at least time and one contribution are needed") % table.source % table.nbColumns()).str()
        );
    bool positional = (table.nbColumns()==nbContributions+1);
    for(size_t c=1; c<table.nbColumns() && positional; ++c)
        positional = !isCanonical(table.header[c]);

    vector<TimeSeries> series;
    for(size_t c=1; c<table.nbColumns(); ++c)
    {
        string name = positional ? string(contributionNames[c-1]) : table.header[c];
        if(name.empty())
            name = (boost::format("contribution_%1%") % c).str();
        series.push_back(table.series(c, name));
    }
    return series;
}

ConductivityAnalysis::ConductivityAnalysis(const double &tolerance, const double &exponent, const bool &quiet) :
    region(RegionOptions::conductivity(tolerance, exponent)), quiet(quiet)
{
    region.check();
}

/** @brief Position of the Einstein-Helfand total, or of the first contribution if there is none */
size_t MSDiff::primaryContribution(const std::vector<TimeSeries> &contributions)
{
    for(size_t c=0; c<contributions.size(); ++c)
        if(contributions[c].name==contributionNames[0])
            return c;
    return 0;
}

/**
    @brief Fit each contribution, then the transport numbers if all the canonical contributions are there.
    Throws if the Einstein-Helfand total (or the first contribution) cannot be fitted.
*/
ConductivityResults ConductivityAnalysis::run(const std::vector<TimeSeries> &contributions) const
{
    ConductivityResults res;
    if(contributions.empty())
        throw InsufficientData("No conductivity contribution to analyse");
    const size_t primary = primaryContribution(contributions);
    for(size_t c=0; c<contributions.size(); ++c)
    {
        //failure on the Einstein-Helfand total aborts the analysis
        if(c==primary)
            res.contributions.push_back(fitColumn(contributions[c], region));
        else
            res.contributions.push_back(tryFitColumn(contributions[c], region));
        const ColumnResult &col = res.contributions.back();
        if(col.succeeded())
        {
            if(col.fit.isThin())
                cerr<<"Warning: only "<<col.fit.nbPoints<<" points in the linear fit of "<<col.name<<endl;
            res.sigma.push_back(Estimate(col.fit.slope, col.fit.slopeError));
            if(!quiet)
                cout<<"Linear region of "<<col.name<<": "<<col.window
                    <<" from "<<col.tStart<<" to "<<col.tEnd<<" ps"<<endl;
        }
        else
        {
            res.sigma.push_back(Estimate());
            cerr<<col.failure<<endl;
        }
    }

    const map<string, Estimate> fitted = res.succeeded();
    res.hasTransportNumbers = true;
    for(size_t c=0; c<nbContributions; ++c)
        if(fitted.find(contributionNames[c])==fitted.end())
            res.hasTransportNumbers = false;
    if(res.hasTransportNumbers)
        res.numbers = transportNumbers(fitted);
    else if(!quiet)
        cout<<"Not all contributions could be fitted, no transport numbers"<<endl;
    return res;
}

/** @brief Console summary */
void MSDiff::printResults(std::ostream &os, const ConductivityResults &results)
{
    os<<"  MSDiff Conductivity\n";
    os<<"  ===================\n";
    os<<"\nContributions\n";
    for(size_t c=0; c<results.contributions.size(); ++c)
        if(results.contributions[c].succeeded())
            os<<boost::format("%-15s:  %.4f +- %.4f S/m\n")
                % results.contributions[c].name % results.sigma[c].value % results.sigma[c].error;
        else
            os<<boost::format("%-15s:  failed\n") % results.contributions[c].name;
    if(!results.hasTransportNumbers)
    {
        os.flush();
        return;
    }
    const TransportNumbers &t = results.numbers;
    os<<"\nA posteriori quantities\n";
    os<<boost::format("%-15s:  %.4f +- %.4f\n") % "ionicity" % t.ionicity.value % t.ionicity.error;
    os<<boost::format("%-15s:  %.4f +- %.4f\n") % "t_mm_ideal" % t.anionIdeal.value % t.anionIdeal.error;
    os<<boost::format("%-15s:  %.4f +- %.4f\n") % "t_pp_ideal" % t.cationIdeal.value % t.cationIdeal.error;
    os<<boost::format("%-15s:  %.4f +- %.4f\n") % "t_pm" % t.anionCation.value % t.anionCation.error;
    os<<boost::format("%-15s:  %.4f +- %.4f\n") % "t_mm" % t.anion.value % t.anion.error;
    os<<boost::format("%-15s:  %.4f +- %.4f\n") % "t_pp" % t.cation.value % t.cation.error;
    os.flush();
}

/** @brief Write prefix_cond.csv and, when available, prefix_post.csv */
void MSDiff::exportResults(const ConductivityResults &results, const std::string &prefix)
{
    const string condName = prefix+"_cond.csv";
    ofstream cond(condName.c_str(), ios::out | ios::trunc);
    if(!cond)
        throw invalid_argument("Cannot write to "+condName);
    cond<<"contribution,sigma,delta_sigma,r2,t_start,t_end,n_data\n";
    for(size_t c=0; c<results.contributions.size(); ++c)
    {
        const ColumnResult &col = results.contributions[c];
        if(col.succeeded())
            cond<<boost::format("%s,%.6f,%.6f,%.6f,%.6f,%.6f,%d\n")
                % col.name % results.sigma[c].value % results.sigma[c].error
                % col.fit.rsquared % col.tStart % col.tEnd % col.fit.nbPoints;
        else
            cond<<col.name<<",nan,nan,nan,nan,nan,0\n";
    }
    cond.close();

    if(!results.hasTransportNumbers)
        return;
    const string postName = prefix+"_post.csv";
    ofstream post(postName.c_str(), ios::out | ios::trunc);
    if(!post)
        throw invalid_argument("Cannot write to "+postName);
    const TransportNumbers &t = results.numbers;
    post<<"ionicity,ionicity_err,t_mm_ideal,t_mm_ideal_err,t_pp_ideal,t_pp_ideal_err,t_pm,t_pm_err,t_mm,t_mm_err,t_pp,t_pp_err\n";
    post<<boost::format("%.6f,%.6f,%.6f,%.6f,%.6f,%.6f,%.6f,%.6f,%.6f,%.6f,%.6f,%.6f\n")
        % t.ionicity.value % t.ionicity.error % t.anionIdeal.value % t.anionIdeal.error
        % t.cationIdeal.value % t.cationIdeal.error % t.anionCation.value % t.anionCation.error
        % t.anion.value % t.anion.error % t.cation.value % t.cation.error;
}
