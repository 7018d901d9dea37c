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

#include "htsapi/bam_streamer.hh"
#include "common/Exceptions.hh"

#include <cassert>
#include <cerrno>

#include <iostream>
#include <sstream>



bam_streamer::
bam_streamer(
    const char* filename,
    const char* referenceFilename)
    : _is_record_set(false),
      _record_no(0),
      _stream_name(filename),
      _is_region(false)
{
    assert(nullptr != filename);

    using namespace tranno::common;

    if ('\0' == *filename)
    {
        BOOST_THROW_EXCEPTION(GeneralException("Can't initialize bam_streamer with empty filename"));
    }

    _hfp.reset(hts_open(filename, "r"));

    if (nullptr == _hfp)
    {
        std::ostringstream oss;
        oss << "Failed to open SAM/BAM/CRAM file for reading: '" << name() << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
    }

    if (nullptr != referenceFilename)
    {
        const std::string referenceFilenameIndex(std::string(referenceFilename) + ".fai");
        if (0 != hts_set_fai_filename(_hfp.get(), referenceFilenameIndex.c_str()))
        {
            std::ostringstream oss;
            oss << "Failed to use reference index: '" << referenceFilenameIndex << "' for alignment file: '" << name() << "'";
            BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
        }
    }

    _hdr.reset(sam_hdr_read(_hfp.get()));

    if (nullptr == _hdr)
    {
        std::ostringstream oss;
        oss << "Failed to parse header from SAM/BAM/CRAM file: '" << name() << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
    }
}



bam_streamer::
~bam_streamer()
{
    _hitr.reset();
    _hidx.reset();
    _hdr.reset();
    close_hts_file(_hfp.release(), name());
}



void
bam_streamer::
_load_index()
{
    if (nullptr != _hidx) return;

    // use the BAM index to read a region of the BAM file
    if (! (_hfp->format.category == sequence_data))
    {
        std::ostringstream oss;
        oss << "File does not contain sequence data: '" << name() << "'";
        BOOST_THROW_EXCEPTION(tranno::common::GeneralException(oss.str()));
    }

    // TODO: Find out whether _hidx can be destroyed after the HTS
    // iterator is created, in which case this could be a local
    // variable. Until we know, _hidx should persist for the lifetime
    // of _hitr
    _hidx.reset(sam_index_load(_hfp.get(), name()));
    if (nullptr == _hidx)
    {
        std::ostringstream oss;
        oss << "BAM/CRAM index is not available for file: '" << name() << "'";
        BOOST_THROW_EXCEPTION(tranno::common::IoException(errno, oss.str()));
    }
}



void
bam_streamer::
resetRegion(
    const int referenceContigId,
    const int64_t beginPos,
    const int64_t endPos)
{
    if ((referenceContigId < 0) || (referenceContigId >= _hdr->n_targets))
    {
        std::ostringstream oss;
        oss << "Invalid contig index '" << referenceContigId << "' specified for BAM/CRAM file: '" << name() << "'";
        BOOST_THROW_EXCEPTION(tranno::common::GeneralException(oss.str()));
    }

    _load_index();

    _hitr.reset(sam_itr_queryi(_hidx.get(), referenceContigId, beginPos, endPos));
    if (nullptr == _hitr)
    {
        std::ostringstream oss;
        oss << "Failed to fetch region: '" << target_id_to_name(referenceContigId) << ":" << (beginPos+1) << "-" << endPos
            << "' specified for BAM/CRAM file: '" << name() << "'";
        BOOST_THROW_EXCEPTION(tranno::common::GeneralException(oss.str()));
    }

    {
        std::ostringstream oss;
        oss << target_id_to_name(referenceContigId) << ":" << (beginPos+1) << "-" << endPos;
        _region = oss.str();
    }
    _is_region = true;
    _is_record_set = false;
    _record_no = 0;
}



bool
bam_streamer::
next()
{
    if (nullptr == _hitr) return false;

    const int ret(sam_itr_next(_hfp.get(), _hitr.get(), _brec._bp));

    if (ret < -1)
    {
        std::ostringstream oss;
        oss << "Failed to read record from BAM/CRAM file:\n";
        report_state(oss);
        BOOST_THROW_EXCEPTION(tranno::common::IoException(EIO, oss.str()));
    }

    _is_record_set=(ret >= 0);
    if (_is_record_set) _record_no++;

    return _is_record_set;
}



const char*
bam_streamer::
target_id_to_name(const int32_t tid) const
{
    if (tid<0)
    {
        static const char unmapped[] = "*";
        return unmapped;
    }
    assert(tid < _hdr->n_targets);
    return _hdr->target_name[tid];
}



int32_t
bam_streamer::
target_name_to_id(const char* seq_name) const
{
    return bam_name2id(_hdr.get(),seq_name);
}



void
bam_streamer::
report_state(std::ostream& os) const
{
    const bam_record* bamp(get_record_ptr());

    os << "\tbam_stream_label: " << name() << "\n";
    if (_is_region)
    {
        os << "\tbam_stream_selected_region: " << _region << "\n";
    }
    if (nullptr != bamp)
    {
        os << "\tbam_stream_record_no: " << record_no() << "\n";
        os << "\tbam_record QNAME: " << bamp->qname() << "\n";
        const char* chrom_name(target_id_to_name(bamp->target_id()));
        os << "\tbam record RNAME: " << chrom_name << "\n";
        os << "\tbam record POS: " << bamp->pos() << "\n";
    }
    else
    {
        os << "\tno bam record currently set\n";
    }
}
