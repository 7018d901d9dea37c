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

/// \file
///

#include "options/optionsUtil.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/filesystem.hpp"

#include "blt_util/thirdparty_pop.h"

#include <sstream>



bool
checkAndStandardizeRequiredInputFilePath(
    std::string& filename,
    const char* fileLabel,
    std::string& errorMsg)
{
    namespace bfs = boost::filesystem;

    errorMsg.clear();
    if (filename.empty())
    {
        std::ostringstream oss;
        oss << "Must specify " << fileLabel << " file";
        errorMsg = oss.str();
    }
    else if (! bfs::exists(filename))
    {
        std::ostringstream oss;
        oss << "Can't find " << fileLabel << " file: '" << filename << "'";
        errorMsg = oss.str();
    }
    else
    {
        filename = bfs::absolute(filename).string();
    }

    return (! errorMsg.empty());
}
