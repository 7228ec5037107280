#include "HomologySearch.hpp"

#include <fstream>
#include <filesystem>

#include "ExternalCommand.hpp"
#include "FastqReader.hpp"

namespace
{

double parse_blast_double(const std::string& value, const std::string& column, unsigned long long lineNo)
{
    try
    {
        size_t idx = 0;
        double val = std::stod(value, &idx);
        if(idx != value.size()){throw std::invalid_argument(value);}
        return val;
    }
    catch(const std::exception&)
    {
        throw StageError("Invalid value for column " + column + " in blast line " + std::to_string(lineNo) + ": '" + value + "'");
    }
}

unsigned long long parse_blast_count(const std::string& value, const std::string& column, unsigned long long lineNo)
{
    try
    {
        size_t idx = 0;
        unsigned long long val = std::stoull(value, &idx);
        if(idx != value.size() || value.front() == '-'){throw std::invalid_argument(value);}
        return val;
    }
    catch(const std::exception&)
    {
        throw StageError("Invalid value for column " + column + " in blast line " + std::to_string(lineNo) + ": '" + value + "'");
    }
}

}

std::vector<FastaRecord> read_fasta_file(const std::string& path)
{
    if(!std::filesystem::is_regular_file(path))
    {
        throw StageError("Could not open fasta file: " + path);
    }
    gzFile fp = gzopen(path.c_str(), "r");
    if(fp == Z_NULL)
    {
        throw StageError("Could not open fasta file: " + path);
    }
    if(!starts_with_record_marker(fp, '>'))
    {
        gzclose(fp);
        throw StageError("Sequence without a header in fasta file: " + path);
    }

    std::vector<FastaRecord> records;
    kseq_t* ks = kseq_init(fp);
    int length = 0;
    while((length = kseq_read(ks)) >= 0)
    {
        std::string name(ks->name.s, ks->name.l);
        if(ks->comment.l > 0)
        {
            name += ' ';
            name.append(ks->comment.s, ks->comment.l);
        }
        records.emplace_back(name, std::string(ks->seq.s, ks->seq.l));
    }
    kseq_destroy(ks);
    gzclose(fp);
    if(length < -1)
    {
        throw StageError("Error while reading fasta file " + path + " after record " + std::to_string(records.size()));
    }
    return records;
}

void write_fasta_file(const std::string& path, const std::vector<FastaRecord>& records)
{
    std::ofstream out(path);
    if(!out)
    {
        throw StageError("Could not open fasta file for writing: " + path);
    }
    for(const FastaRecord& record : records)
    {
        out << '>' << record.first << '\n' << record.second << '\n';
    }
    if(!out)
    {
        throw StageError("Writing fasta file failed: " + path);
    }
}

HomologyHit parse_blast_line(const std::string& line, unsigned long long lineNo)
{
    std::vector<std::string> columns = splitByDelimiter(line, ",");
    if(columns.size() != BLAST_HEADER.size())
    {
        throw StageError("Blast line " + std::to_string(lineNo) + " has " + std::to_string(columns.size()) +
                         " columns instead of " + std::to_string(BLAST_HEADER.size()) + ": " + line);
    }
    for(std::string& column : columns){column = trim(column);}

    HomologyHit hit;
    hit.queryAccession = columns.at(0);
    hit.subjectAccession = columns.at(1);
    hit.percentIdentity = parse_blast_double(columns.at(2), BLAST_HEADER.at(2), lineNo);
    hit.length = parse_blast_count(columns.at(3), BLAST_HEADER.at(3), lineNo);
    hit.mismatches = parse_blast_count(columns.at(4), BLAST_HEADER.at(4), lineNo);
    hit.gapOpens = parse_blast_count(columns.at(5), BLAST_HEADER.at(5), lineNo);
    hit.queryStart = parse_blast_count(columns.at(6), BLAST_HEADER.at(6), lineNo);
    hit.queryEnd = parse_blast_count(columns.at(7), BLAST_HEADER.at(7), lineNo);
    hit.subjectStart = parse_blast_count(columns.at(8), BLAST_HEADER.at(8), lineNo);
    hit.subjectEnd = parse_blast_count(columns.at(9), BLAST_HEADER.at(9), lineNo);
    hit.evalue = parse_blast_double(columns.at(10), BLAST_HEADER.at(10), lineNo);
    hit.bitscore = parse_blast_double(columns.at(11), BLAST_HEADER.at(11), lineNo);

    if(hit.subjectAccession.empty())
    {
        throw StageError("Blast line " + std::to_string(lineNo) + " has no subject accession");
    }
    return hit;
}

std::vector<HomologyHit> parse_blast_csv(std::istream& in)
{
    std::vector<HomologyHit> hits;
    std::string line;
    unsigned long long lineNo = 0;
    while(std::getline(in, line))
    {
        ++lineNo;
        if(trim(line).empty()){continue;}
        hits.push_back(parse_blast_line(line, lineNo));
    }
    return hits;
}

HomologyResultSet BlastnSearch::search(const std::string& queryFasta)
{
    HomologyResultSet resultSet;
    resultSet.queryFile = queryFasta;

    std::vector<FastaRecord> contigs = read_fasta_file(queryFasta);
    for(size_t i = 0; i < contigs.size(); ++i)
    {
        const FastaRecord& contig = contigs.at(i);
        const std::string contigFasta = queryFasta + "." + std::to_string(i) + ".fa";
        const std::string resultCsv = queryFasta + "." + std::to_string(i) + ".csv";
        write_fasta_file(contigFasta, {contig});

        std::vector<std::string> args = {executable, "-query", contigFasta, "-outfmt", "10", "-out", resultCsv};
        args.insert(args.end(), params.begin(), params.end());
        run_command(args, logFile);

        std::ifstream csv(resultCsv);
        if(!csv)
        {
            throw StageError("blastn finished without writing its result file: " + resultCsv);
        }

        QueryHits query;
        query.queryFile = queryFasta;
        query.queryName = contig.first;
        query.querySeq = contig.second;
        query.hits = parse_blast_csv(csv);
        for(HomologyHit& hit : query.hits)
        {
            hit.queryFile = query.queryFile;
            hit.queryName = query.queryName;
            hit.querySeq = query.querySeq;
        }
        resultSet.queries.push_back(std::move(query));
    }

    return resultSet;
}
