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

#pragma once

#include <string>


/// check that a required input file exists and convert its path to an absolute path
///
/// \param[in,out] filename path to check, replaced by the absolute path on success
/// \param[in] fileLabel description of the file used in the error message
/// \param[out] errorMsg set to an error description if the check fails
///
/// \return true if an error was found
bool
checkAndStandardizeRequiredInputFilePath(
    std::string& filename,
    const char* fileLabel,
    std::string& errorMsg);
