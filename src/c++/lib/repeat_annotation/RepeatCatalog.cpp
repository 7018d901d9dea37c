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

#include "RepeatCatalog.hh"

#include "common/Exceptions.hh"

#include <cerrno>

#include <iostream>
#include <sstream>



std::string
findCatalogLine(
    std::istream& catalogStream,
    const std::string& locusId)
{
    using namespace tranno::common;

    const std::string query("ID=" + locusId + ";");

    std::string line;
    while (std::getline(catalogStream, line))
    {
        if (line.find(query) != std::string::npos) return line;
    }

    if (catalogStream.bad())
    {
        std::ostringstream oss;
        oss << "Failed to read repeat catalog while searching for locus '" << locusId << "'";
        BOOST_THROW_EXCEPTION(IoException(EIO, oss.str()));
    }

    std::ostringstream oss;
    oss << "Unable to find locus " << locusId;
    BOOST_THROW_EXCEPTION(LocusNotFoundException(locusId, oss.str()));
}
