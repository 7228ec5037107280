#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <zlib.h>
#include <htslib/kseq.h>

#include "DemultiplexedLine.hpp"
#include "helper.hpp"

KSEQ_INIT(gzFile, gzread)

/** @brief skips leading whitespace of an opened (gz)file and checks that the first record starts with marker
 * @details returns true for files without any record. The checked character is pushed back,
 * kseq_read therefore still sees the complete first record.
**/
bool starts_with_record_marker(gzFile fp, char marker);

/** @brief kseq based parser for fastq(.gz) files
 * @details blank lines between records (e.g. the trailing empty line of fastp output) are skipped.
 * A truncated record, a file whose first record does not start with '@', a record without
 * quality string or a sequence whose length differs from its quality string throws a FatalInputError.
**/
class FastqReader
{
    public:
        FastqReader() = default;
        FastqReader(const FastqReader&) = delete;
        FastqReader& operator=(const FastqReader&) = delete;
        ~FastqReader()
        {
            close_file();
        }

        void init_file(const std::string& file);
        bool get_next_line(fastqLine& line);
        void close_file();

        //records read so far
        unsigned long long get_read_number() const
        {
            return readCount;
        }

    private:
        gzFile fp = Z_NULL;
        kseq_t* ks = nullptr;
        std::string fileName;
        unsigned long long readCount = 0;
};

//reads all records of a fastq(.gz) file into memory
std::vector<fastqLine> read_fastq_file(const std::string& file);

//number of records of a fastq(.gz) file, used for startup checks
unsigned long long count_fastq_records(const std::string& file);

//writes the record back as 4 fastq lines (header, sequence, separator, quality)
inline void write_fastq_line(std::ostream& out, const fastqLine& record)
{
    out << '@' << record.name << '\n' << record.line << "\n+\n" << record.quality << '\n';
}
