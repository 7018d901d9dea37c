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
/// \author Chris Saunders
///

#pragma once

#include <string>


namespace tranno
{
namespace blt_util
{

/// parse TYPE from char* with several error checks, and advance
/// pointer to end of TYPE input
///
/// parse_unsigned rejects a leading sign, strtoul would otherwise
/// silently wrap negative input
///
unsigned
parse_unsigned(const char*& s);

int
parse_int(const char*& s);

long
parse_long(const char*& s);



/// std::string version of above, no ptr advance obviously. explicit rename
/// of functions guards against unexpected std::string temporaries
///
/// the full string must be consumed by the parse
///
unsigned
parse_unsigned_str(const std::string& s);

int
parse_int_str(const std::string& s);

}
}
