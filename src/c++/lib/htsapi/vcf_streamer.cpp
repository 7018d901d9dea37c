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

#include "htsapi/vcf_streamer.hh"

#include "common/Exceptions.hh"

#include <cassert>
#include <cerrno>
#include <cstdlib>

#include <iostream>
#include <sstream>



vcf_streamer::
vcf_streamer(const char* filename)
    : _is_record_set(false),
      _is_stream_end(false),
      _record_no(0),
      _stream_name(filename),
      _kstr{0,0,nullptr}
{
    assert(nullptr != filename);

    using namespace tranno::common;

    if ('\0' == *filename)
    {
        BOOST_THROW_EXCEPTION(GeneralException("Can't initialize vcf_streamer with empty filename"));
    }

    _hfp.reset(hts_open(filename, "r"));
    if (nullptr == _hfp)
    {
        std::ostringstream oss;
        oss << "Failed to open VCF file for reading: '" << name() << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
    }
}



vcf_streamer::
~vcf_streamer()
{
    close_hts_file(_hfp.release(), name());
    free(_kstr.s);
}



bool
vcf_streamer::
next()
{
    if (_is_stream_end || (nullptr == _hfp)) return false;

    using namespace tranno::common;

    while (true)
    {
        const int ret(hts_getline(_hfp.get(), KS_SEP_LINE, &_kstr));

        if (ret < -1)
        {
            std::ostringstream oss;
            oss << "Failed to read line from VCF file:\n";
            report_state(oss);
            BOOST_THROW_EXCEPTION(IoException(EIO, oss.str()));
        }

        if (ret < 0)
        {
            _is_stream_end = true;
            break;
        }

        // skip header and empty lines:
        if ((_kstr.l == 0) || (_kstr.s[0] == '#')) continue;

        _record_no++;
        _is_record_set = true;

        if (! _vcfrec.set(_kstr.s))
        {
            std::ostringstream oss;
            oss << "Can't parse VCF record:\n";
            report_state(oss);
            oss << "\tvcf line: '" << _kstr.s << "'\n";
            BOOST_THROW_EXCEPTION(InputFormatException(oss.str()));
        }
        return true;
    }

    _is_record_set = false;
    return false;
}



void
vcf_streamer::
report_state(std::ostream& os) const
{
    const vcf_record* vcfp(get_record_ptr());

    os << "\tvcf_stream_label: " << name() << "\n";
    if (nullptr != vcfp)
    {
        os << "\tvcf_stream_record_no: " << record_no() << "\n"
           << "\tvcf_record: " << *vcfp;
    }
    else
    {
        os << "\tno vcf record currently set\n";
    }
}
