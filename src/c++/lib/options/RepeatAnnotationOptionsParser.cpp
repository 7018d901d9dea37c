//
// TRanno - Tandem Repeat Annotation
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#include "options/optionsUtil.hh"
#include "options/RepeatAnnotationOptionsParser.hh"



boost::program_options::options_description
getOptionsDescription(RepeatAnnotationOptions& opt)
{
    namespace po = boost::program_options;
    po::options_description desc("repeat-annotation");
    desc.add_options()
    ("read-search-radius", po::value(&opt.readSearchRadius)->default_value(opt.readSearchRadius),
     "Reads are fetched from the repeat region extended by this many bases on each side. Must be at least as large as the flanks retained on reads by the repeat caller.")
    ("ref", po::value<std::string>(),
     "fasta reference sequence, required for CRAM alignment files")
    ;
    return desc;
}



void
parseOptions(
    const boost::program_options::variables_map& vm,
    RepeatAnnotationOptions& opt)
{
    if (vm.count("ref"))
    {
        opt.referenceFilename = vm["ref"].as<std::string>();
    }
}



bool
checkOptions(
    RepeatAnnotationOptions& opt,
    std::string& errorMsg)
{
    errorMsg.clear();

    if (opt.readSearchRadius == 0)
    {
        errorMsg = "read-search-radius must be greater than zero";
    }
    else if (! opt.referenceFilename.empty())
    {
        // the reference is optional, but must exist if given
        if (checkAndStandardizeRequiredInputFilePath(opt.referenceFilename, "reference fasta", errorMsg)) return true;
    }

    return (! errorMsg.empty());
}
