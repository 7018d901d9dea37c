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

/**
 ** \file
 ** \brief Declaration of the common exception mechanism.
 **
 ** All exceptions must carry the same data (independently of the
 ** exception type) to homogenize the reporting and processing of
 ** errors.
 **
 ** \author Come Raczy
 **/

#pragma once


#include "blt_util/thirdparty_push.h"

#include "boost/cerrno.hpp"
#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include "blt_util/thirdparty_pop.h"

#include <ios>
#include <stdexcept>
#include <string>

namespace tranno
{
namespace common
{

/**
 ** \brief Virtual base class to all the exception classes
 **
 ** Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
 ** at the throw site.
 **/
class ExceptionData : public boost::exception
{
public:
    ExceptionData(int errorNumber=0, const std::string& message="");
    ExceptionData(const ExceptionData&) = default;
    ExceptionData& operator=(const ExceptionData&) = delete;

    int getErrorNumber() const
    {
        return errorNumber_;
    }
    const std::string& getMessage() const
    {
        return message_;
    }
    std::string getContext() const;
private:
    const int errorNumber_;
    const std::string message_;
};

/**
 * \brief Exception thrown when there are problems with the IO operations
 */
class IoException: public std::ios_base::failure, public ExceptionData
{
public:
    IoException(int errorNumber, const std::string& message);
};

/// General purpose exception for all other cases:
///
class GeneralException: public std::logic_error, public ExceptionData
{
public:
    explicit
    GeneralException(const std::string& message);
};

/**
 ** \brief Exception thrown when a repeat locus id can't be found in a catalog or call set
 **/
class LocusNotFoundException: public GeneralException
{
public:
    LocusNotFoundException(
        const std::string& locusId,
        const std::string& message);

    const std::string&
    getLocusId() const
    {
        return locusId_;
    }
private:
    const std::string locusId_;
};

/**
 ** \brief Exception thrown when a call set record has a missing allele call for the requested locus
 **/
class IncompleteGenotypeException: public GeneralException
{
public:
    IncompleteGenotypeException(
        const std::string& locusId,
        const std::string& message);

    const std::string&
    getLocusId() const
    {
        return locusId_;
    }
private:
    const std::string locusId_;
};

/**
 ** \brief Exception thrown when an alignment record is missing a required custom tag,
 ** or carries a tag with an unexpected type or shape.
 **/
class MalformedReadTagException: public GeneralException
{
public:
    MalformedReadTagException(
        const std::string& readName,
        const std::string& tagName,
        const std::string& message);

    const std::string&
    getReadName() const
    {
        return readName_;
    }
    const std::string&
    getTagName() const
    {
        return tagName_;
    }
private:
    const std::string readName_;
    const std::string tagName_;
};

/// Exception thrown for unparsable input values and for annotations which
/// can't be reconciled with the allele they describe
///
class InputFormatException: public GeneralException
{
public:
    explicit
    InputFormatException(const std::string& message);
};

}
}
