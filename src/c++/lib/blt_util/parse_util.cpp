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

#include "blt_util/parse_util.hh"
#include "common/Exceptions.hh"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstdlib>

#include <limits>
#include <sstream>



static
void
parse_exception(
    const char* type_label,
    const char* parse_str)
{
    std::ostringstream oss;
    oss << "Can't parse " << type_label << " from string: '" << parse_str << "'";
    BOOST_THROW_EXCEPTION(tranno::common::InputFormatException(oss.str()));
}



static
void
check_full_parse(
    const char* type_label,
    const std::string& s,
    const char* endptr)
{
    if ((endptr-s.c_str()) != static_cast<std::ptrdiff_t>(s.length()))
    {
        parse_exception(type_label,s.c_str());
    }
}



namespace tranno
{
namespace blt_util
{

unsigned
parse_unsigned(const char*& s)
{
    static const int base(10);

    const char* p(s);
    while (isspace(static_cast<unsigned char>(*p))) ++p;
    if ((*p == '-') || (*p == '+'))
    {
        parse_exception("unsigned",s);
    }

    errno = 0;

    char* endptr;
    const unsigned long val(strtoul(s, &endptr, base));
    if ((errno == ERANGE && (val == ULONG_MAX || val == 0))
        || (errno != 0 && val == 0) || (endptr == s))
    {
        parse_exception("unsigned long",s);
    }

    if (val > std::numeric_limits<unsigned>::max())
    {
        parse_exception("unsigned",s);
    }

    s = endptr;

    return static_cast<unsigned>(val);
}



int
parse_int(const char*& s)
{
    const char* const start(s);
    const long val(parse_long(s));
    if ((val > std::numeric_limits<int>::max()) ||
        (val < std::numeric_limits<int>::min()))
    {
        parse_exception("int",start);
    }
    return static_cast<int>(val);
}



long
parse_long(const char*& s)
{
    static const int base(10);

    errno = 0;

    char* endptr;
    const long val(strtol(s, &endptr, base));
    if ((errno == ERANGE && (val == LONG_MIN || val == LONG_MAX))
        || (errno != 0 && val == 0) || (endptr == s))
    {
        parse_exception("long int",s);
    }

    s = endptr;

    return val;
}



unsigned
parse_unsigned_str(const std::string& s)
{
    const char* s2(s.c_str());
    const unsigned val(parse_unsigned(s2));
    check_full_parse("unsigned",s,s2);
    return val;
}



int
parse_int_str(const std::string& s)
{
    const char* s2(s.c_str());
    const int val(parse_int(s2));
    check_full_parse("int",s,s2);
    return val;
}

}
}
