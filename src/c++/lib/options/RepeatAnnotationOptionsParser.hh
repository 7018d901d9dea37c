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

#include "repeat_annotation/RepeatAnnotationOptions.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/program_options.hpp"

#include "blt_util/thirdparty_pop.h"

#include <string>


boost::program_options::options_description
getOptionsDescription(RepeatAnnotationOptions& opt);

/// transfer options which are not bound directly to an option value
void
parseOptions(
    const boost::program_options::variables_map& vm,
    RepeatAnnotationOptions& opt);

/// check and standardize option values
///
/// \return true if an error was found, with the error described in errorMsg
bool
checkOptions(
    RepeatAnnotationOptions& opt,
    std::string& errorMsg);
