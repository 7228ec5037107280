#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "HomologySearch.hpp"
#include "ExternalCommand.hpp"
#include "TestHelper.hpp"

namespace
{

//stand-in for blastn: writes one hit named after the query file into the -out file
std::string write_fake_blastn(const TmpDir& dir)
{
    const std::string script = dir.file("fake_blastn.sh");
    write_text(script,
               "#!/bin/sh\n"
               "query=\"$2\"\n"
               "out=\"$6\"\n"
               "echo \"searching $query\"\n"
               "case \"$query\" in\n"
               "  *.1.fa) : > \"$out\" ;;\n"
               "  *) echo \"k141_1,REF$7,99.1,12,0,0,1,12,5,16,1e-20,40.5\" > \"$out\" ;;\n"
               "esac\n");
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);
    return script;
}

}

TEST(HomologySearch, parse_blast_csv)
{
    std::ifstream in(test_data("blast_hits.csv"));
    ASSERT_TRUE(in.good());
    std::vector<HomologyHit> hits = parse_blast_csv(in);
    ASSERT_EQ(hits.size(), 3u);

    const HomologyHit& first = hits.front();
    EXPECT_EQ(first.queryAccession, "contig_1");
    EXPECT_EQ(first.subjectAccession, "KX000001.1");
    EXPECT_DOUBLE_EQ(first.percentIdentity, 99.5);
    EXPECT_EQ(first.length, 420u);
    EXPECT_EQ(first.mismatches, 2u);
    EXPECT_EQ(first.gapOpens, 0u);
    EXPECT_EQ(first.queryStart, 1u);
    EXPECT_EQ(first.queryEnd, 420u);
    EXPECT_EQ(first.subjectStart, 15u);
    EXPECT_EQ(first.subjectEnd, 434u);
    EXPECT_DOUBLE_EQ(first.evalue, 1e-150);
    EXPECT_DOUBLE_EQ(first.bitscore, 760.0);

    EXPECT_EQ(hits.at(2).subjectAccession, "KX000003.1");
    EXPECT_EQ(hits.at(2).gapOpens, 1u);
}

TEST(HomologySearch, empty_blast_output)
{
    std::istringstream in("");
    EXPECT_TRUE(parse_blast_csv(in).empty());
}

TEST(HomologySearch, malformed_blast_lines)
{
    EXPECT_THROW(parse_blast_line("contig_1,KX1,99.5,420", 1), StageError);
    EXPECT_THROW(parse_blast_line("contig_1,KX1,high,420,2,0,1,420,15,434,1e-150,760", 1), StageError);
    EXPECT_THROW(parse_blast_line("contig_1,KX1,99.5,-4,2,0,1,420,15,434,1e-150,760", 1), StageError);
    EXPECT_THROW(parse_blast_line("contig_1,,99.5,420,2,0,1,420,15,434,1e-150,760", 1), StageError);

    std::istringstream in("contig_1,KX1,99.5,420,2,0,1,420,15,434,1e-150,760\nbroken line\n");
    EXPECT_THROW(parse_blast_csv(in), StageError);
}

TEST(HomologySearch, read_fasta_file)
{
    std::vector<FastaRecord> records = read_fasta_file(test_data("contigs.fasta"));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records.at(0).first, "k141_1 flag=1 multi=3.0000 len=12");
    EXPECT_EQ(records.at(0).second, "ACGTACGTACGT");
    EXPECT_EQ(records.at(1).second, "TTTTCCCC");

    EXPECT_THROW(read_fasta_file(test_data("does_not_exist.fasta")), StageError);

    TmpDir dir("fasta");
    write_text(dir.file("headless.fasta"), "ACGT\n>k1\nAC\n");
    EXPECT_THROW(read_fasta_file(dir.file("headless.fasta")), StageError);

    write_fasta_file(dir.file("out.fasta"), records);
    EXPECT_EQ(read_text(dir.file("out.fasta")),
              ">k141_1 flag=1 multi=3.0000 len=12\nACGTACGTACGT\n>k141_2 flag=1 multi=2.0000 len=8\nTTTTCCCC\n");
}

TEST(ExternalCommand, shell_quote)
{
    EXPECT_EQ(shell_quote("reads_R1.fastq"), "reads_R1.fastq");
    EXPECT_EQ(shell_quote("my reads.fastq"), "'my reads.fastq'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(build_command_line({"cutadapt", "-y", " {name}"}), "cutadapt -y ' {name}'");
}

TEST(ExternalCommand, exit_codes)
{
    TmpDir dir("command");
    EXPECT_NO_THROW(run_command({"sh", "-c", "echo done"}, dir.file("logs/tool.log")));
    EXPECT_EQ(read_text(dir.file("logs/tool.log")), "done\n");

    try
    {
        run_command({"sh", "-c", "echo failing >&2; exit 3"}, dir.file("logs/tool.log"));
        FAIL() << "expected an ExternalToolError";
    }
    catch(const ExternalToolError& e)
    {
        EXPECT_EQ(e.exitCode, 3);
    }
    EXPECT_EQ(read_text(dir.file("logs/tool.log")), "done\nfailing\n");
    EXPECT_THROW(run_command({}, ""), StageError);
}

TEST(BlastnSearch, searches_every_contig)
{
    TmpDir dir("blastn");
    const std::string blastn = write_fake_blastn(dir);
    const std::string contigs = dir.file("contigs.fasta");
    write_fasta_file(contigs, {FastaRecord("k141_1", "ACGTACGTACGT"), FastaRecord("k141_2", "TTTT")});

    BlastnSearch search(blastn, "A1  -db  nt", dir.file("blastn.log"));
    HomologyResultSet result = search.search(contigs);

    EXPECT_EQ(result.queryFile, contigs);
    ASSERT_EQ(result.query_count(), 2u);
    ASSERT_EQ(result.queries.at(0).hits.size(), 1u);
    const HomologyHit& hit = result.queries.at(0).hits.front();
    //the first extra parameter lands in $7
    EXPECT_EQ(hit.subjectAccession, "REFA1");
    EXPECT_EQ(hit.queryName, "k141_1");
    EXPECT_EQ(hit.querySeq, "ACGTACGTACGT");
    EXPECT_EQ(hit.queryFile, contigs);
    EXPECT_DOUBLE_EQ(hit.bitscore, 40.5);

    //second contig has no hits
    EXPECT_EQ(result.queries.at(1).queryName, "k141_2");
    EXPECT_TRUE(result.queries.at(1).hits.empty());
    EXPECT_NE(read_text(dir.file("blastn.log")).find("searching " + contigs + ".0.fa"), std::string::npos);
}

TEST(BlastnSearch, failing_tool)
{
    TmpDir dir("blastn_fail");
    const std::string contigs = dir.file("contigs.fasta");
    write_fasta_file(contigs, {FastaRecord("k141_1", "ACGT")});

    BlastnSearch search(dir.file("missing_blastn"), "", dir.file("blastn.log"));
    EXPECT_THROW(search.search(contigs), ExternalToolError);

    //an empty contig file is searched without calling the tool
    write_fasta_file(dir.file("empty.fasta"), {});
    EXPECT_EQ(search.search(dir.file("empty.fasta")).query_count(), 0u);
}
