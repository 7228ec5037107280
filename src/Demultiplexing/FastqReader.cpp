#include "FastqReader.hpp"

#include <filesystem>
#include <cctype>

bool starts_with_record_marker(gzFile fp, char marker)
{
    int c = gzgetc(fp);
    while(c != -1 && std::isspace(c))
    {
        c = gzgetc(fp);
    }
    if(c == -1)
    {
        return true;
    }
    gzungetc(c, fp);
    return c == marker;
}

void FastqReader::init_file(const std::string& file)
{
    close_file();

    // check if file exists
    if (!std::filesystem::exists(file))
    {
        throw FatalInputError("File does not exist: " + file);
    }
    // check it's a regular file, e.g., not a directory
    if (!std::filesystem::is_regular_file(file))
    {
        throw FatalInputError("Path is not a regular file: " + file + ". Did you by accident provide a directory?");
    }

    fp = gzopen(file.c_str(), "r");
    if (fp == Z_NULL)
    {
        throw FatalInputError("Unable to open fastq file: " + file);
    }
    gzbuffer(fp, 1 << 17);
    fileName = file;
    readCount = 0;

    if(!starts_with_record_marker(fp, '@'))
    {
        close_file();
        throw FatalInputError("Malformed fastq file " + file + ": first record does not start with '@'");
    }
    ks = kseq_init(fp);
}

bool FastqReader::get_next_line(fastqLine& line)
{
    if(ks == nullptr)
    {
        throw FatalInputError("Fastq file was not initialized before reading");
    }

    int length = kseq_read(ks);
    if(length == -1)
    {
        int errnum = 0;
        gzerror(fp, &errnum);
        if(errnum != Z_OK && errnum != Z_STREAM_END)
        {
            throw FatalInputError("Invalid gz file: " + fileName);
        }
        return false;
    }
    const std::string record = std::to_string(readCount + 1);
    if(length == -2)
    {
        throw FatalInputError("Base quality and read are of different length in " + fileName + " for record " + record);
    }
    if(length < -2)
    {
        throw FatalInputError("Error while reading " + fileName + " at record " + record);
    }
    if(ks->qual.l == 0 && ks->seq.l != 0)
    {
        throw FatalInputError("Malformed fastq record " + record + " in " + fileName + ": missing '+' separator or quality");
    }

    line.name.assign(ks->name.s, ks->name.l);
    if(ks->comment.l > 0)
    {
        line.name += ' ';
        line.name.append(ks->comment.s, ks->comment.l);
    }
    line.line.assign(ks->seq.s, ks->seq.l);
    line.quality.assign(ks->qual.l > 0 ? ks->qual.s : "", ks->qual.l);
    ++readCount;
    return true;
}

void FastqReader::close_file()
{
    if(ks != nullptr)
    {
        kseq_destroy(ks);
        ks = nullptr;
    }
    if(fp != Z_NULL)
    {
        gzclose(fp);
        fp = Z_NULL;
    }
}

std::vector<fastqLine> read_fastq_file(const std::string& file)
{
    FastqReader reader;
    reader.init_file(file);

    std::vector<fastqLine> records;
    fastqLine line;
    while(reader.get_next_line(line))
    {
        records.push_back(std::move(line));
        line = fastqLine();
    }
    reader.close_file();
    return records;
}

unsigned long long count_fastq_records(const std::string& file)
{
    FastqReader reader;
    reader.init_file(file);
    fastqLine line;
    while(reader.get_next_line(line)) {}
    return reader.get_read_number();
}
